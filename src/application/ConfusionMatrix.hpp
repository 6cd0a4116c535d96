/**
 * @file ConfusionMatrix.hpp
 * @brief Out-of-fold confusion counts and the diagnostics derived from them.
 */

#pragma once
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "domain/MetricsSnapshot.hpp"

namespace ledgerlens::application {

/**
 * @class ConfusionMatrix
 * @brief true-label x predicted-label counts over a fixed label set.
 *
 * The label set is the eligible categories plus domain::kUnknownLabel, which
 * receives empty predictions and predictions outside the label set, so every
 * recorded sample lands in exactly one cell of its true row.
 */
class ConfusionMatrix {
public:
    explicit ConfusionMatrix(const std::vector<std::string>& categories);

    /** @brief Records one held-out sample. Unknown true labels are ignored. */
    void record(const std::string& trueCategory,
                const std::optional<std::string>& predicted,
                double confidence);

    /** @brief Adds all counts of another matrix with the same labels. */
    void merge(const ConfusionMatrix& other);

    const std::vector<std::string>& labels() const { return m_labels; }
    const std::vector<std::vector<int>>& counts() const { return m_counts; }

    int rowSum(std::size_t row) const;
    int columnSum(std::size_t column) const;
    int total() const;
    int correct() const;

    /** @brief Precision, recall, F1, one-vs-rest accuracy and mean confidence per category. */
    std::vector<domain::CategoryMetrics> categoryMetrics() const;

    /** @brief Off-diagonal cells ordered by count (descending), at most `limit`. */
    std::vector<domain::ConfusedPair> topConfusedPairs(std::size_t limit) const;

    /**
     * @brief Writes the confusion data and every derived diagnostic into a snapshot:
     *        labels, matrix, per-category metrics, best/worst/top-3 by F1, top-5 confused pairs.
     */
    void fillSnapshot(domain::MetricsSnapshot& snapshot) const;

private:
    std::size_t indexOf(const std::string& label) const;

    std::vector<std::string> m_labels;
    std::map<std::string, std::size_t> m_positions;
    std::vector<std::vector<int>> m_counts;
    std::vector<double> m_confidenceSums; ///< Per true label.
};

} // namespace ledgerlens::application
