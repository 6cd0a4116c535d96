/**
 * @file JsonExpenseRepository.cpp
 * @brief Implementation of JsonExpenseRepository.
 */

#include "infrastructure/JsonExpenseRepository.hpp"
#include "infrastructure/JsonCodec.hpp"
#include <fstream>
#include <iostream>
#include <set>
#include <utility>
#include <nlohmann/json.hpp>

namespace ledgerlens::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

void AddUnique(std::vector<std::string>& out, std::set<std::string>& seen, const std::string& value) {
    if (value.empty() || !seen.insert(value).second) return;
    out.push_back(value);
}

} // namespace

JsonExpenseRepository::JsonExpenseRepository(fs::path file, std::shared_ptr<PersistenceService> persistence)
    : m_file(std::move(file)), m_persistence(std::move(persistence)) {
    load();
}

void JsonExpenseRepository::load() {
    if (!fs::exists(m_file)) {
        std::cout << "[ExpenseRepository] No expense file at " << m_file << ", starting empty." << std::endl;
        return;
    }

    std::ifstream f(m_file);
    json j;
    try {
        j = json::parse(f);
    } catch (const json::exception& e) {
        std::cerr << "[ExpenseRepository] Error reading " << m_file << ": " << e.what() << std::endl;
        return;
    }

    if (j.contains("expenses") && j["expenses"].is_array()) {
        for (const auto& item : j["expenses"]) {
            try {
                auto expense = JsonCodec::ExpenseFromJson(item);
                m_expenses[expense.id] = std::move(expense);
            } catch (const json::exception& e) {
                std::cerr << "[ExpenseRepository] Skipping malformed expense: " << e.what() << std::endl;
            }
        }
    }
    m_vendors = j.value("vendors", std::vector<std::string>{});
    m_categories = j.value("categories", std::vector<std::string>{});
}

void JsonExpenseRepository::persistLocked() {
    if (!m_persistence) return;

    json expenses = json::array();
    for (const auto& [id, expense] : m_expenses) {
        expenses.push_back(JsonCodec::ExpenseToJson(expense));
    }
    json j = {
        {"expenses", expenses},
        {"vendors", m_vendors},
        {"categories", m_categories}
    };
    m_persistence->enqueueWrite(m_file, j.dump(4));
}

std::vector<domain::ExpenseRecord> JsonExpenseRepository::fetchTrainingExpenses() {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<domain::ExpenseRecord> out;
    for (const auto& [id, expense] : m_expenses) {
        if (!expense.transcription.empty()) out.push_back(expense);
    }
    return out;
}

std::optional<domain::ExpenseRecord> JsonExpenseRepository::findExpense(domain::ExpenseId id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_expenses.find(id);
    if (it == m_expenses.end()) return std::nullopt;
    return it->second;
}

bool JsonExpenseRepository::updateCategory(domain::ExpenseId id, const std::string& category, double confidence) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_expenses.find(id);
    if (it == m_expenses.end()) return false;

    it->second.category = category;
    it->second.confidenceScore = confidence;
    it->second.needsConfirmation = false;
    persistLocked();
    return true;
}

std::vector<std::string> JsonExpenseRepository::fetchKnownVendors() {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> out;
    std::set<std::string> seen;
    for (const auto& v : m_vendors) AddUnique(out, seen, v);
    for (const auto& [id, expense] : m_expenses) AddUnique(out, seen, expense.vendor);
    return out;
}

std::vector<std::string> JsonExpenseRepository::fetchCategories() {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> out;
    std::set<std::string> seen;
    for (const auto& c : m_categories) AddUnique(out, seen, c);
    for (const auto& [id, expense] : m_expenses) AddUnique(out, seen, expense.category);
    return out;
}

domain::ExpenseId JsonExpenseRepository::addExpense(domain::ExpenseRecord expense) {
    std::lock_guard<std::mutex> lock(m_mutex);
    expense.id = m_expenses.empty() ? 1 : m_expenses.rbegin()->first + 1;
    domain::ExpenseId id = expense.id;
    m_expenses.emplace(id, std::move(expense));
    persistLocked();
    return id;
}

std::size_t JsonExpenseRepository::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_expenses.size();
}

} // namespace ledgerlens::infrastructure
