/**
 * @file Expense.hpp
 * @brief Domain entities for recorded and candidate expenses.
 */

#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace ledgerlens::domain {

using ExpenseId = std::int64_t;

/**
 * @struct ExpenseRecord
 * @brief A persisted expense as produced by the extraction pipeline.
 *
 * `category`, `confidenceScore` and `needsConfirmation` change only through
 * category confirmation or the incremental update path.
 */
struct ExpenseRecord {
    ExpenseId id = 0;
    std::string date;           ///< ISO date (YYYY-MM-DD).
    double amount = 0.0;
    std::string vendor;
    std::string category;
    std::string description;
    std::string transcription;
    double confidenceScore = 0.0;
    std::optional<std::string> mlPrediction;
    std::string llmCategory;
    bool needsConfirmation = false;
};

/**
 * @struct CandidateExpense
 * @brief One expense line coming out of the extraction pipeline, before it is stored.
 */
struct CandidateExpense {
    std::string transcription;
    std::string vendor;
    std::string description;
    double amount = 0.0;
    std::string date;
    std::string llmCategory; ///< Category proposed by the generative-text service.
};

} // namespace ledgerlens::domain
