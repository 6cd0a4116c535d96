/**
 * @file CrossValidationEvaluator.hpp
 * @brief K-fold evaluation of the voting classifier on ephemeral index partitions.
 */

#pragma once
#include <functional>
#include <string>
#include <vector>
#include "application/CancellationToken.hpp"
#include "application/ConfusionMatrix.hpp"
#include "application/EngineConfig.hpp"
#include "domain/SimilarityIndex.hpp"
#include "domain/VectorPoint.hpp"

namespace ledgerlens::application {

/**
 * @struct LabeledSample
 * @brief An embedded expense with its (corrected) training label.
 */
struct LabeledSample {
    domain::ExpenseId id = 0;
    std::vector<float> vector;
    std::string category;
};

/**
 * @struct EvaluationReport
 * @brief Aggregates over the folds that completed.
 */
struct EvaluationReport {
    std::vector<double> foldAccuracies;
    double meanAccuracy = 0.0;
    int completedFolds = 0;
    int failedFolds = 0;
    int sampleCount = 0;
    ConfusionMatrix confusion;

    explicit EvaluationReport(const std::vector<std::string>& categories) : confusion(categories) {}
};

/**
 * @class CrossValidationEvaluator
 * @brief Shuffled k-fold cross-validation against the similarity index.
 *
 * Each fold gets its own uniquely named partition, held by ScopedPartition so
 * it is deleted on every exit path. A fold that hits TransientInfraError is
 * logged and left out of every aggregate; cancellation aborts the run.
 */
class CrossValidationEvaluator {
public:
    using PartitionNamer = std::function<std::string()>;

    CrossValidationEvaluator(domain::SimilarityIndex& index,
                             ClassifierConfig classifier,
                             TrainingConfig training,
                             PartitionNamer namer);

    /**
     * @brief Runs the evaluation.
     * @param samples Samples of eligible categories only.
     * @param categories The eligible categories (confusion labels, in order).
     * @throws domain::InsufficientDataError if there are fewer than 2 samples.
     * @throws domain::TransientInfraError if every fold failed.
     * @throws domain::OperationCancelled when the token fires.
     */
    EvaluationReport evaluate(const std::vector<LabeledSample>& samples,
                              const std::vector<std::string>& categories,
                              const CancellationToken& token) const;

    /** @brief Shuffled fold assignment: fold sizes differ by at most one. */
    static std::vector<std::vector<std::size_t>> splitFolds(std::size_t sampleCount,
                                                            int folds,
                                                            unsigned int seed);

private:
    domain::SimilarityIndex& m_index;
    ClassifierConfig m_classifier;
    TrainingConfig m_training;
    PartitionNamer m_namer;
};

} // namespace ledgerlens::application
