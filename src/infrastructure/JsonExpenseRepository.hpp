/**
 * @file JsonExpenseRepository.hpp
 * @brief ExpenseRepository persisted as a single JSON document.
 */

#pragma once
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "domain/ExpenseRepository.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace ledgerlens::infrastructure {

/**
 * @class JsonExpenseRepository
 * @brief Expenses, known vendors and categories in `expenses.json`.
 *
 * Layout: `{"expenses": [...], "vendors": [...], "categories": [...]}`. The
 * file is read once on construction; every change rewrites it atomically
 * through the PersistenceService.
 */
class JsonExpenseRepository : public domain::ExpenseRepository {
public:
    JsonExpenseRepository(std::filesystem::path file, std::shared_ptr<PersistenceService> persistence);

    std::vector<domain::ExpenseRecord> fetchTrainingExpenses() override;
    std::optional<domain::ExpenseRecord> findExpense(domain::ExpenseId id) override;
    bool updateCategory(domain::ExpenseId id, const std::string& category, double confidence) override;
    std::vector<std::string> fetchKnownVendors() override;
    std::vector<std::string> fetchCategories() override;

    /**
     * @brief Stores a newly categorized expense.
     * @return The id assigned to it (one above the largest id in use).
     */
    domain::ExpenseId addExpense(domain::ExpenseRecord expense);

    std::size_t size() const;

private:
    void load();
    void persistLocked();

    std::filesystem::path m_file;
    std::shared_ptr<PersistenceService> m_persistence;

    std::map<domain::ExpenseId, domain::ExpenseRecord> m_expenses;
    std::vector<std::string> m_vendors;
    std::vector<std::string> m_categories;
    mutable std::mutex m_mutex;
};

} // namespace ledgerlens::infrastructure
