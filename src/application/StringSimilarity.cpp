/**
 * @file StringSimilarity.cpp
 * @brief Implementation of StringSimilarity.
 */

#include "application/StringSimilarity.hpp"
#include "application/TextNormalizer.hpp"
#include <algorithm>
#include <vector>

namespace ledgerlens::application {

std::size_t StringSimilarity::levenshtein(const std::string& a, const std::string& b) {
    if (a.empty()) return b.size();
    if (b.empty()) return a.size();

    // Two-row DP over b.
    std::vector<std::size_t> prev(b.size() + 1);
    std::vector<std::size_t> cur(b.size() + 1);
    for (std::size_t j = 0; j <= b.size(); ++j) prev[j] = j;

    for (std::size_t i = 1; i <= a.size(); ++i) {
        cur[0] = i;
        for (std::size_t j = 1; j <= b.size(); ++j) {
            std::size_t cost = (a[i - 1] == b[j - 1]) ? 0 : 1;
            cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, prev[j - 1] + cost});
        }
        std::swap(prev, cur);
    }
    return prev[b.size()];
}

double StringSimilarity::ratio(const std::string& a, const std::string& b) {
    std::string la = TextNormalizer::toLower(a);
    std::string lb = TextNormalizer::toLower(b);
    std::size_t longest = std::max(la.size(), lb.size());
    if (longest == 0) return 1.0;
    return 1.0 - static_cast<double>(levenshtein(la, lb)) / static_cast<double>(longest);
}

} // namespace ledgerlens::application
