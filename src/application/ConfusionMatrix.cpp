/**
 * @file ConfusionMatrix.cpp
 * @brief Implementation of ConfusionMatrix.
 */

#include "application/ConfusionMatrix.hpp"
#include <algorithm>
#include <stdexcept>

namespace ledgerlens::application {

ConfusionMatrix::ConfusionMatrix(const std::vector<std::string>& categories) {
    for (const auto& c : categories) {
        if (c == domain::kUnknownLabel || m_positions.count(c)) continue;
        m_positions[c] = m_labels.size();
        m_labels.push_back(c);
    }
    m_positions[domain::kUnknownLabel] = m_labels.size();
    m_labels.push_back(domain::kUnknownLabel);

    m_counts.assign(m_labels.size(), std::vector<int>(m_labels.size(), 0));
    m_confidenceSums.assign(m_labels.size(), 0.0);
}

std::size_t ConfusionMatrix::indexOf(const std::string& label) const {
    auto it = m_positions.find(label);
    return it == m_positions.end() ? m_positions.at(domain::kUnknownLabel) : it->second;
}

void ConfusionMatrix::record(const std::string& trueCategory,
                             const std::optional<std::string>& predicted,
                             double confidence) {
    auto row = m_positions.find(trueCategory);
    if (row == m_positions.end() || trueCategory == domain::kUnknownLabel) return;

    std::size_t col = predicted ? indexOf(*predicted) : indexOf(domain::kUnknownLabel);
    m_counts[row->second][col] += 1;
    m_confidenceSums[row->second] += confidence;
}

void ConfusionMatrix::merge(const ConfusionMatrix& other) {
    if (other.m_labels != m_labels) {
        throw std::invalid_argument("Cannot merge confusion matrices with different labels");
    }
    for (std::size_t r = 0; r < m_labels.size(); ++r) {
        for (std::size_t c = 0; c < m_labels.size(); ++c) {
            m_counts[r][c] += other.m_counts[r][c];
        }
        m_confidenceSums[r] += other.m_confidenceSums[r];
    }
}

int ConfusionMatrix::rowSum(std::size_t row) const {
    int sum = 0;
    for (int v : m_counts.at(row)) sum += v;
    return sum;
}

int ConfusionMatrix::columnSum(std::size_t column) const {
    int sum = 0;
    for (const auto& row : m_counts) sum += row.at(column);
    return sum;
}

int ConfusionMatrix::total() const {
    int sum = 0;
    for (std::size_t r = 0; r < m_labels.size(); ++r) sum += rowSum(r);
    return sum;
}

int ConfusionMatrix::correct() const {
    int sum = 0;
    for (std::size_t i = 0; i < m_labels.size(); ++i) sum += m_counts[i][i];
    return sum;
}

std::vector<domain::CategoryMetrics> ConfusionMatrix::categoryMetrics() const {
    std::vector<domain::CategoryMetrics> out;
    const int all = total();

    // The Unknown row is always empty; only real categories are reported.
    for (std::size_t i = 0; i + 1 < m_labels.size(); ++i) {
        const int tp = m_counts[i][i];
        const int actual = rowSum(i);
        const int predicted = columnSum(i);
        const int fp = predicted - tp;
        const int fn = actual - tp;
        const int tn = all - tp - fp - fn;

        domain::CategoryMetrics m;
        m.category = m_labels[i];
        m.support = actual;
        m.precision = predicted > 0 ? static_cast<double>(tp) / predicted : 0.0;
        m.recall = actual > 0 ? static_cast<double>(tp) / actual : 0.0;
        m.f1 = (m.precision + m.recall) > 0.0 ? 2.0 * m.precision * m.recall / (m.precision + m.recall) : 0.0;
        m.accuracy = all > 0 ? static_cast<double>(tp + tn) / all : 0.0;
        m.meanConfidence = actual > 0 ? m_confidenceSums[i] / actual : 0.0;
        out.push_back(m);
    }
    return out;
}

std::vector<domain::ConfusedPair> ConfusionMatrix::topConfusedPairs(std::size_t limit) const {
    std::vector<domain::ConfusedPair> pairs;
    for (std::size_t r = 0; r < m_labels.size(); ++r) {
        for (std::size_t c = 0; c < m_labels.size(); ++c) {
            if (r == c || m_counts[r][c] == 0) continue;
            pairs.push_back({m_labels[r], m_labels[c], m_counts[r][c]});
        }
    }

    std::sort(pairs.begin(), pairs.end(), [](const auto& a, const auto& b) {
        if (a.count != b.count) return a.count > b.count;
        if (a.trueCategory != b.trueCategory) return a.trueCategory < b.trueCategory;
        return a.predictedCategory < b.predictedCategory;
    });

    if (pairs.size() > limit) pairs.resize(limit);
    return pairs;
}

void ConfusionMatrix::fillSnapshot(domain::MetricsSnapshot& snapshot) const {
    snapshot.confusionLabels = m_labels;
    snapshot.confusionMatrix = m_counts;
    snapshot.perCategory = categoryMetrics();
    snapshot.confusedPairs = topConfusedPairs(5);

    std::vector<domain::CategoryMetrics> ranked = snapshot.perCategory;
    std::stable_sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
        if (a.f1 != b.f1) return a.f1 > b.f1;
        return a.category < b.category;
    });

    snapshot.topCategories.clear();
    if (!ranked.empty()) {
        snapshot.bestCategory = ranked.front().category;
        snapshot.worstCategory = ranked.back().category;
        for (std::size_t i = 0; i < ranked.size() && i < 3; ++i) {
            snapshot.topCategories.push_back(ranked[i].category);
        }
    }
}

} // namespace ledgerlens::application
