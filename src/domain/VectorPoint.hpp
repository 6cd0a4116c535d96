/**
 * @file VectorPoint.hpp
 * @brief Points stored in and returned by the similarity index.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "Expense.hpp"

namespace ledgerlens::domain {

/**
 * @struct PointPayload
 * @brief Metadata attached to every indexed vector.
 */
struct PointPayload {
    std::optional<std::string> category;
    std::optional<double> amount;
    std::optional<std::string> date;
};

/**
 * @struct VectorPoint
 * @brief One point per expense; the id is the expense id.
 */
struct VectorPoint {
    ExpenseId id = 0;
    std::vector<float> vector;
    PointPayload payload;
};

/**
 * @struct Neighbor
 * @brief A k-NN query hit.
 */
struct Neighbor {
    ExpenseId id = 0;
    float similarity = 0.0f; ///< Cosine similarity.
    PointPayload payload;
};

} // namespace ledgerlens::domain
