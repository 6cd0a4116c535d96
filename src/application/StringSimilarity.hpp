/**
 * @file StringSimilarity.hpp
 * @brief Edit-distance based similarity used for vendor spelling correction.
 */

#pragma once
#include <cstddef>
#include <string>

namespace ledgerlens::application {

class StringSimilarity {
public:
    /** @brief Levenshtein distance (insert/delete/substitute, unit cost) between byte strings. */
    static std::size_t levenshtein(const std::string& a, const std::string& b);

    /**
     * @brief Normalized similarity in [0,1]: 1 - distance / max(len(a), len(b)).
     *
     * Both inputs are compared case-insensitively. Two empty strings score 1.
     */
    static double ratio(const std::string& a, const std::string& b);
};

} // namespace ledgerlens::application
