/**
 * @file RuleBasedCorrector.cpp
 * @brief Implementation of RuleBasedCorrector.
 */

#include "application/RuleBasedCorrector.hpp"
#include "application/StringSimilarity.hpp"
#include "application/TextNormalizer.hpp"
#include <iostream>
#include <utility>

namespace ledgerlens::application {

RuleBasedCorrector::RuleBasedCorrector(CorrectorConfig config, TermRules rules)
    : m_config(config) {
    for (const auto& [category, terms] : rules) {
        for (const auto& term : terms) {
            std::string key = TextNormalizer::canonicalTerm(term);
            if (key.empty()) continue;
            auto [it, inserted] = m_termToCategory.emplace(key, category);
            if (!inserted && it->second != category) {
                std::cerr << "[RuleBasedCorrector] Term '" << key << "' listed under both '"
                          << it->second << "' and '" << category << "', keeping '" << it->second << "'"
                          << std::endl;
            }
        }
    }
}

std::optional<std::string> RuleBasedCorrector::correctCategory(const std::string& description) const {
    std::string key = TextNormalizer::canonicalTerm(description);
    if (key.empty()) return std::nullopt;

    auto it = m_termToCategory.find(key);
    if (it == m_termToCategory.end()) return std::nullopt;
    return it->second;
}

std::optional<std::string> RuleBasedCorrector::correctVendor(const std::string& vendor,
                                                             const std::vector<std::string>& knownVendors) const {
    std::string query = TextNormalizer::canonicalTerm(vendor);
    if (query.empty() || knownVendors.empty()) return std::nullopt;

    for (const auto& known : knownVendors) {
        if (TextNormalizer::canonicalTerm(known) == query) {
            return known;
        }
    }

    const std::string* best = nullptr;
    double bestRatio = 0.0;
    for (const auto& known : knownVendors) {
        double r = StringSimilarity::ratio(query, TextNormalizer::canonicalTerm(known));
        if (r > bestRatio) {
            bestRatio = r;
            best = &known;
        }
    }

    if (best && bestRatio >= m_config.vendorCutoff) {
        return *best;
    }
    return std::nullopt;
}

std::string RuleBasedCorrector::normalizeVendor(const std::string& vendor,
                                                const std::vector<std::string>& knownVendors) const {
    auto corrected = correctVendor(vendor, knownVendors);
    return corrected ? *corrected : TextNormalizer::trim(vendor);
}

RuleBasedCorrector::TermRules RuleBasedCorrector::DefaultRules() {
    return {
        {"Groceries", {
            "milk", "bread", "butter", "eggs", "cheese", "yogurt", "yoghurt", "cucumber", "cucumbers",
            "tomato", "tomatoes", "potato", "potatoes", "onion", "onions", "carrot", "carrots",
            "apple", "apples", "banana", "bananas", "lettuce", "pepper", "peppers", "rice", "pasta",
            "flour", "sugar", "salt", "chicken", "ham", "sausage", "sausages", "fish", "meat",
            "vegetables", "fruit", "cereal", "coffee", "tea", "juice", "water", "groceries"
        }},
        {"Household Chemicals", {
            "detergent", "washing powder", "washing liquid", "dish soap", "washing up liquid",
            "fabric softener", "bleach", "toilet cleaner", "cleaning spray", "floor cleaner",
            "glass cleaner", "dishwasher tablets", "cleaning products"
        }},
        {"Alcohol", {
            "beer", "beers", "wine", "red wine", "white wine", "vodka", "whisky", "whiskey", "gin",
            "rum", "cider", "prosecco", "champagne", "lager", "ale", "brandy"
        }},
        {"Fuel", {
            "petrol", "diesel", "fuel", "gasoline", "lpg"
        }}
    };
}

} // namespace ledgerlens::application
