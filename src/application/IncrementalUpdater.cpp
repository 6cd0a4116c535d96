/**
 * @file IncrementalUpdater.cpp
 * @brief Implementation of IncrementalUpdater.
 */

#include "application/IncrementalUpdater.hpp"
#include "application/TextNormalizer.hpp"
#include <iostream>
#include <utility>

namespace ledgerlens::application {

IncrementalUpdater::IncrementalUpdater(domain::EmbeddingGenerator& embedder,
                                       domain::SimilarityIndex& index,
                                       domain::ExpenseRepository& expenses,
                                       const RuleBasedCorrector& corrector,
                                       TrainingConfig config)
    : m_embedder(embedder),
      m_index(index),
      m_expenses(expenses),
      m_corrector(corrector),
      m_config(std::move(config)) {}

bool IncrementalUpdater::apply(domain::ExpenseId expenseId, const std::string& confirmedCategory) {
    std::string category = TextNormalizer::trim(confirmedCategory);
    if (category.empty()) {
        std::cerr << "[IncrementalUpdater] Empty category for expense " << expenseId << ", skipped." << std::endl;
        return false;
    }

    auto expense = m_expenses.findExpense(expenseId);
    if (!expense) {
        std::cerr << "[IncrementalUpdater] Expense " << expenseId << " not found." << std::endl;
        return false;
    }

    domain::ExpenseRecord record = *expense;
    record.vendor = m_corrector.normalizeVendor(record.vendor, m_expenses.fetchKnownVendors());

    std::string text = TextNormalizer::canonicalText(record);
    if (text.empty()) {
        std::cerr << "[IncrementalUpdater] Expense " << expenseId << " has no text to embed." << std::endl;
        return false;
    }

    domain::VectorPoint point;
    point.id = record.id;
    point.vector = m_embedder.embed(text);
    point.payload.category = category;
    point.payload.amount = record.amount;
    if (!record.date.empty()) point.payload.date = record.date;

    m_index.createPartition(m_config.mainPartition);
    m_index.upsert(m_config.mainPartition, {point});

    std::cout << "[IncrementalUpdater] Expense " << expenseId << " now votes for '" << category << "'." << std::endl;
    return true;
}

} // namespace ledgerlens::application
