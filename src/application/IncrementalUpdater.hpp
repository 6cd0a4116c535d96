/**
 * @file IncrementalUpdater.hpp
 * @brief Single-sample online correction of the main index partition.
 */

#pragma once
#include <string>
#include "application/EngineConfig.hpp"
#include "application/RuleBasedCorrector.hpp"
#include "domain/EmbeddingGenerator.hpp"
#include "domain/ExpenseRepository.hpp"
#include "domain/SimilarityIndex.hpp"

namespace ledgerlens::application {

/**
 * @class IncrementalUpdater
 * @brief Re-embeds one expense and overwrites its point with a confirmed category.
 *
 * No retraining and no re-evaluation happen here; the next classify() query
 * simply sees the updated neighbor.
 */
class IncrementalUpdater {
public:
    IncrementalUpdater(domain::EmbeddingGenerator& embedder,
                       domain::SimilarityIndex& index,
                       domain::ExpenseRepository& expenses,
                       const RuleBasedCorrector& corrector,
                       TrainingConfig config);

    /**
     * @brief Upserts the expense into the main partition under `confirmedCategory`.
     * @return False (with a warning) for an unknown id or an empty category.
     * @throws domain::TransientInfraError if the model or index is unavailable.
     */
    bool apply(domain::ExpenseId expenseId, const std::string& confirmedCategory);

private:
    domain::EmbeddingGenerator& m_embedder;
    domain::SimilarityIndex& m_index;
    domain::ExpenseRepository& m_expenses;
    const RuleBasedCorrector& m_corrector;
    TrainingConfig m_config;
};

} // namespace ledgerlens::application
