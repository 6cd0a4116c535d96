/**
 * @file MetricsSnapshot.hpp
 * @brief Evaluation results recorded after every training run.
 */

#pragma once
#include <string>
#include <utility>
#include <vector>

namespace ledgerlens::domain {

/** @brief Label used in the confusion matrix for samples with no prediction. */
inline constexpr const char* kUnknownLabel = "Unknown";

enum class TrainingType {
    Full,
    Incremental ///< Full run triggered from the incremental path.
};

inline const char* TrainingTypeToString(TrainingType t) {
    return t == TrainingType::Incremental ? "incremental" : "full";
}

inline TrainingType TrainingTypeFromString(const std::string& s) {
    return s == "incremental" ? TrainingType::Incremental : TrainingType::Full;
}

/**
 * @struct CategoryMetrics
 * @brief Per-category diagnostics derived from the out-of-fold confusion matrix.
 */
struct CategoryMetrics {
    std::string category;
    double precision = 0.0;
    double recall = 0.0;
    double f1 = 0.0;
    double accuracy = 0.0;       ///< One-vs-rest accuracy.
    double meanConfidence = 0.0; ///< Mean classifier confidence over this category's test samples.
    int support = 0;             ///< Number of test samples whose true label is this category.
};

/**
 * @struct ConfusedPair
 * @brief A (true, predicted) miscategorization and how often it happened.
 */
struct ConfusedPair {
    std::string trueCategory;
    std::string predictedCategory;
    int count = 0;
};

/**
 * @struct MetricsSnapshot
 * @brief Immutable record of one training run's evaluation.
 */
struct MetricsSnapshot {
    std::string timestamp; ///< UTC, ISO-8601.
    TrainingType trainingType = TrainingType::Full;
    double accuracy = 0.0;
    int sampleCount = 0;
    int categoryCount = 0;
    std::vector<double> foldAccuracies;
    std::vector<std::string> confusionLabels; ///< Eligible categories followed by kUnknownLabel.
    std::vector<std::vector<int>> confusionMatrix; ///< rows: true label, cols: predicted label.
    std::vector<CategoryMetrics> perCategory;
    std::string bestCategory;
    std::string worstCategory;
    std::vector<std::string> topCategories;
    std::vector<ConfusedPair> confusedPairs;
    std::string notes;
};

} // namespace ledgerlens::domain
