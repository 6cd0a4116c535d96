/**
 * @file ExpenseRepository.hpp
 * @brief Interface for the persistence contracts the engine depends on.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "Expense.hpp"
#include "MetricsSnapshot.hpp"

namespace ledgerlens::domain {

/**
 * @class ExpenseRepository
 * @brief Read access to historical expenses and the dynamic reference lists.
 */
class ExpenseRepository {
public:
    virtual ~ExpenseRepository() = default;

    /** @brief All expenses usable for training (records that carry a transcription). */
    virtual std::vector<ExpenseRecord> fetchTrainingExpenses() = 0;

    /** @brief Looks up one expense by id. */
    virtual std::optional<ExpenseRecord> findExpense(ExpenseId id) = 0;

    /**
     * @brief Stores a user-confirmed category.
     * @return False if the expense does not exist.
     */
    virtual bool updateCategory(ExpenseId id, const std::string& category, double confidence) = 0;

    /** @brief Known vendor spellings, refreshed per training run. */
    virtual std::vector<std::string> fetchKnownVendors() = 0;

    /** @brief Category taxonomy (owned externally, may grow). */
    virtual std::vector<std::string> fetchCategories() = 0;
};

/**
 * @class MetricsRepository
 * @brief Append-only storage of evaluation snapshots.
 */
class MetricsRepository {
public:
    virtual ~MetricsRepository() = default;

    /** @brief Appends a snapshot. Existing snapshots are never modified. */
    virtual void append(const MetricsSnapshot& snapshot) = 0;

    /** @brief Up to `limit` snapshots, newest first. */
    virtual std::vector<MetricsSnapshot> recent(std::size_t limit) const = 0;

    /** @brief The most recent snapshot, carrying the latest confusion data. */
    virtual std::optional<MetricsSnapshot> latest() const = 0;
};

} // namespace ledgerlens::domain
