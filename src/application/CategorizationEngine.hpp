/**
 * @file CategorizationEngine.hpp
 * @brief Facade wiring normalization, correction, k-NN voting, decision, evaluation and learning.
 */

#pragma once
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "application/CancellationToken.hpp"
#include "application/CrossValidationEvaluator.hpp"
#include "application/DecisionPolicy.hpp"
#include "application/EngineConfig.hpp"
#include "application/IncrementalUpdater.hpp"
#include "application/RuleBasedCorrector.hpp"
#include "application/VotingClassifier.hpp"
#include "domain/Categorization.hpp"
#include "domain/EmbeddingGenerator.hpp"
#include "domain/ExpenseRepository.hpp"
#include "domain/MetricsSnapshot.hpp"
#include "domain/SimilarityIndex.hpp"

namespace ledgerlens::application {

/**
 * @struct TrainingOutcome
 * @brief Explicit result of a training run; train() never throws for data or infra problems.
 */
struct TrainingOutcome {
    bool success = false;
    std::string message;
    std::optional<domain::MetricsSnapshot> snapshot;
};

/**
 * @class CategorizationEngine
 * @brief Entry point of the categorization subsystem.
 *
 * Inference (classify, categorize) is synchronous and never throws for an
 * unreachable model or index; it degrades to the suggested category with
 * confidence 0.0. Training and evaluation are long-running and are meant to
 * run through TrainingTaskManager. Only one training run is active at a time.
 */
class CategorizationEngine {
public:
    using ProgressCallback = std::function<void(float, const std::string&)>;

    CategorizationEngine(std::shared_ptr<domain::EmbeddingGenerator> embedder,
                         std::shared_ptr<domain::SimilarityIndex> index,
                         std::shared_ptr<domain::ExpenseRepository> expenses,
                         std::shared_ptr<domain::MetricsRepository> metrics,
                         EngineConfig config,
                         CrossValidationEvaluator::PartitionNamer partitionNamer);

    /**
     * @brief k-NN prediction for a canonical text against the main partition.
     *
     * A TransientInfraError is retried once; a second failure yields a
     * prediction with `available == false`.
     */
    domain::Prediction classify(const std::string& text);

    /** @brief The decision table. Pure and total. */
    domain::Decision decide(const std::optional<std::string>& mlPrediction,
                            double mlConfidence,
                            const std::string& llmCategory) const;

    /** @brief Corrects vendor and suggestion, classifies and decides for one candidate. */
    domain::Categorization categorize(const domain::CandidateExpense& candidate);

    /**
     * @brief Overwrites one expense's point with a confirmed category.
     *
     * Runs a training of type "incremental" first when the main partition is
     * still empty.
     */
    bool incrementalUpdate(domain::ExpenseId expenseId, const std::string& confirmedCategory);

    /** @brief Stores a user-confirmed category, then applies the incremental update. */
    bool confirmCategory(domain::ExpenseId expenseId, const std::string& category);

    /** @brief Full training: correct, embed, cross-validate, publish, record metrics. */
    TrainingOutcome train(domain::TrainingType type,
                          const CancellationToken& token,
                          ProgressCallback onProgress = nullptr);

    /** @brief Cross-validation only: no index writes, nothing recorded. */
    std::optional<domain::MetricsSnapshot> evaluate(const CancellationToken& token);

    std::optional<domain::MetricsSnapshot> latestMetrics() const;
    std::vector<domain::MetricsSnapshot> recentMetrics(std::size_t limit) const;

    /** @brief Current category taxonomy, sorted, without blanks. */
    std::vector<std::string> knownCategories();

    const EngineConfig& config() const { return m_config; }

private:
    struct TrainingSample {
        LabeledSample labeled;
        std::string text;
        double amount = 0.0;
        std::string date;
    };

    struct TrainingData {
        std::vector<TrainingSample> samples; ///< Eligible categories only.
        std::vector<std::string> categories; ///< Eligible categories, sorted.
        int validRecords = 0;
        int skippedRecords = 0;
        int correctedLabels = 0;
    };

    TrainingData prepareTrainingData(const CancellationToken& token, const ProgressCallback& onProgress);
    void embedSamples(std::vector<TrainingSample>& samples,
                      const CancellationToken& token,
                      const ProgressCallback& onProgress);
    void publish(const std::vector<TrainingSample>& samples, const CancellationToken& token);
    domain::MetricsSnapshot buildSnapshot(const EvaluationReport& report,
                                          const TrainingData& data,
                                          domain::TrainingType type) const;
    std::vector<std::string> knownVendors();

    static void validateRecord(const domain::ExpenseRecord& record, const std::string& text);
    static std::string utcTimestamp();

    std::shared_ptr<domain::EmbeddingGenerator> m_embedder;
    std::shared_ptr<domain::SimilarityIndex> m_index;
    std::shared_ptr<domain::ExpenseRepository> m_expenses;
    std::shared_ptr<domain::MetricsRepository> m_metrics;
    EngineConfig m_config;

    RuleBasedCorrector m_corrector;
    DecisionPolicy m_policy;
    VotingClassifier m_classifier;
    CrossValidationEvaluator m_evaluator;
    IncrementalUpdater m_updater;

    std::mutex m_trainingMutex;
};

} // namespace ledgerlens::application
