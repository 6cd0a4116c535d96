#include <cassert>
#include <iostream>

#include "application/RuleBasedCorrector.hpp"
#include "application/StringSimilarity.hpp"
#include "application/TextNormalizer.hpp"

using namespace ledgerlens::application;

namespace {

void TestCategoryRules() {
    RuleBasedCorrector corrector{CorrectorConfig{}};

    auto cucumber = corrector.correctCategory("cucumber");
    assert(cucumber && *cucumber == "Groceries");

    auto spaced = corrector.correctCategory("  Washing   Powder ");
    assert(spaced && *spaced == "Household Chemicals");

    assert(!corrector.correctCategory("cucumber salad bowl"));
    assert(!corrector.correctCategory(""));
    std::cout << "[PASS] Curated terms match canonical descriptions exactly" << std::endl;
}

void TestCustomRulesAndConflicts() {
    RuleBasedCorrector::TermRules rules = {
        {"Alpha", {"widget"}},
        {"Beta", {"widget", "gizmo"}}
    };
    RuleBasedCorrector corrector(CorrectorConfig{}, rules);
    assert(*corrector.correctCategory("widget") == "Alpha");
    assert(*corrector.correctCategory("GIZMO") == "Beta");
    std::cout << "[PASS] Conflicting terms keep the first category" << std::endl;
}

void TestVendorCorrection() {
    RuleBasedCorrector corrector{CorrectorConfig{}};
    std::vector<std::string> known = {"Biedronka", "Lidl", "Orlen"};

    assert(*corrector.correctVendor("LIDL", known) == "Lidl");
    assert(*corrector.correctVendor("Biedronk", known) == "Biedronka");
    assert(*corrector.correctVendor("Orlenn", known) == "Orlen");
    assert(!corrector.correctVendor("Zabka", known));
    assert(!corrector.correctVendor("Lidl", {}));

    assert(corrector.normalizeVendor("  Unknown Shop ", known) == "Unknown Shop");
    assert(corrector.normalizeVendor("biedronka", known) == "Biedronka");

    CorrectorConfig strict;
    strict.vendorCutoff = 0.95;
    RuleBasedCorrector strictCorrector(strict);
    assert(!strictCorrector.correctVendor("Biedronk", known));
    std::cout << "[PASS] Vendors snap to known spellings above the cutoff" << std::endl;
}

void TestStringSimilarity() {
    assert(StringSimilarity::levenshtein("kitten", "sitting") == 3);
    assert(StringSimilarity::levenshtein("", "abc") == 3);
    assert(StringSimilarity::ratio("", "") == 1.0);
    assert(StringSimilarity::ratio("Lidl", "lidl") == 1.0);
    double r = StringSimilarity::ratio("biedronk", "biedronka");
    assert(r > 0.88 && r < 0.89);
    std::cout << "[PASS] Levenshtein distance and ratio" << std::endl;
}

void TestCanonicalText() {
    assert(TextNormalizer::canonicalText("  bought   milk ", "Lidl", "") == "bought milk Lidl");
    assert(TextNormalizer::canonicalText("", "", "") == "");
    assert(TextNormalizer::canonicalTerm(" Red\tWine ") == "red wine");
    std::cout << "[PASS] Canonical text is stable across whitespace" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting RuleBasedCorrector Test..." << std::endl;
    TestCategoryRules();
    TestCustomRulesAndConflicts();
    TestVendorCorrection();
    TestStringSimilarity();
    TestCanonicalText();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
