/**
 * @file TextNormalizer.hpp
 * @brief Builds the canonical text that is embedded for each expense.
 */

#pragma once
#include <string>
#include "domain/Expense.hpp"

namespace ledgerlens::application {

class TextNormalizer {
public:
    /**
     * @brief Joins transcription, vendor and description into one canonical string.
     *
     * Each part is trimmed, runs of whitespace collapse to one space and empty
     * parts are skipped, so training and inference produce identical text for
     * identical fields.
     */
    static std::string canonicalText(const std::string& transcription,
                                     const std::string& vendor,
                                     const std::string& description);

    static std::string canonicalText(const domain::ExpenseRecord& expense);
    static std::string canonicalText(const domain::CandidateExpense& candidate);

    /** @brief Lowercased, trimmed, whitespace-collapsed form used for term lookups. */
    static std::string canonicalTerm(const std::string& value);

    static std::string toLower(const std::string& value);
    static std::string trim(const std::string& value);
};

} // namespace ledgerlens::application
