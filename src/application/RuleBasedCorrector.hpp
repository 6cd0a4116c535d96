/**
 * @file RuleBasedCorrector.hpp
 * @brief Deterministic category and vendor corrections applied before scoring.
 */

#pragma once
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "application/EngineConfig.hpp"

namespace ledgerlens::application {

/**
 * @class RuleBasedCorrector
 * @brief Fixes obvious mislabels from curated term sets and snaps vendors to known spellings.
 */
class RuleBasedCorrector {
public:
    /** category -> canonical item terms */
    using TermRules = std::map<std::string, std::set<std::string>>;

    explicit RuleBasedCorrector(CorrectorConfig config, TermRules rules = DefaultRules());

    /**
     * @brief Category forced by the item description, if any.
     *
     * The description is canonicalized (trimmed, lowercased, whitespace
     * collapsed) and matched exactly against each term set.
     */
    std::optional<std::string> correctCategory(const std::string& description) const;

    /**
     * @brief Known vendor spelling for a (possibly misspelled) vendor.
     *
     * A case-insensitive exact match wins. Otherwise the closest known vendor
     * with a similarity ratio at or above the cutoff is returned.
     */
    std::optional<std::string> correctVendor(const std::string& vendor,
                                             const std::vector<std::string>& knownVendors) const;

    /** @brief correctVendor() or the trimmed input when nothing matches. */
    std::string normalizeVendor(const std::string& vendor,
                                const std::vector<std::string>& knownVendors) const;

    /** @brief Groceries, household chemicals, alcohol and fuel term sets. */
    static TermRules DefaultRules();

private:
    CorrectorConfig m_config;
    std::map<std::string, std::string> m_termToCategory;
};

} // namespace ledgerlens::application
