#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

#include "application/DecisionPolicy.hpp"

using namespace ledgerlens;
using application::DecisionPolicy;
using domain::DecisionSource;

namespace {

void TestModelWinsAboveHighThreshold() {
    DecisionPolicy policy{application::PolicyConfig{}};
    auto d = policy.decide(std::string("Groceries"), 0.9, "Household Chemicals");
    assert(d.finalCategory == "Groceries");
    assert(d.confidence == 0.9);
    assert(d.source == DecisionSource::Model);
    assert(!d.needsConfirmation);

    auto boundary = policy.decide(std::string("Fuel"), 0.85, "Other");
    assert(boundary.finalCategory == "Fuel");
    std::cout << "[PASS] Confidence >= 0.85 keeps the model's category" << std::endl;
}

void TestSuggestionWinsInMiddleBand() {
    DecisionPolicy policy{application::PolicyConfig{}};
    auto d = policy.decide(std::string("Alcohol"), 0.6, "Groceries");
    assert(d.finalCategory == "Groceries");
    assert(d.confidence == 0.6);
    assert(d.mlPrediction && *d.mlPrediction == "Alcohol");
    assert(d.source == DecisionSource::Suggestion);
    assert(d.needsConfirmation);

    auto boundary = policy.decide(std::string("Alcohol"), 0.3, "Groceries");
    assert(boundary.finalCategory == "Groceries" && boundary.confidence == 0.3);
    std::cout << "[PASS] Confidence in [0.3, 0.85) uses the suggestion and keeps ML confidence" << std::endl;
}

void TestLowConfidenceIsForcedToZero() {
    DecisionPolicy policy{application::PolicyConfig{}};
    auto d = policy.decide(std::string("Alcohol"), 0.29, "Groceries");
    assert(d.finalCategory == "Groceries");
    assert(d.confidence == 0.0);
    assert(d.source == DecisionSource::LowConfidence);

    auto none = policy.decide(std::nullopt, 0.95, "Fuel");
    assert(none.finalCategory == "Fuel" && none.confidence == 0.0);
    std::cout << "[PASS] Confidence < 0.3 or no prediction reports 0.0" << std::endl;
}

void TestDegradedMode() {
    DecisionPolicy policy{application::PolicyConfig{}};
    domain::Prediction unavailable;
    unavailable.available = false;
    auto d = policy.decide(unavailable, "Groceries");
    assert(d.finalCategory == "Groceries");
    assert(d.confidence == 0.0);
    assert(d.source == DecisionSource::Degraded);
    assert(!d.mlPrediction);
    std::cout << "[PASS] Unavailable model falls back to the suggestion at 0.0" << std::endl;
}

void TestInputsAreSanitized() {
    DecisionPolicy policy{application::PolicyConfig{}};
    auto nan = policy.decide(std::string("Fuel"), std::numeric_limits<double>::quiet_NaN(), "Other");
    assert(nan.confidence == 0.0 && nan.finalCategory == "Other");

    auto high = policy.decide(std::string("Fuel"), 1.7, "Other");
    assert(high.confidence == 1.0 && high.finalCategory == "Fuel");

    auto empty = policy.decide(std::nullopt, 0.0, "   ");
    assert(empty.finalCategory == "Other");

    application::PolicyConfig custom;
    custom.highThreshold = 0.7;
    custom.lowThreshold = 0.5;
    custom.defaultCategory = "Uncategorized";
    DecisionPolicy tuned(custom);
    assert(tuned.decide(std::string("Fuel"), 0.72, "").finalCategory == "Fuel");
    assert(tuned.decide(std::string("Fuel"), 0.45, "").finalCategory == "Uncategorized");
    std::cout << "[PASS] NaN, out-of-range and empty inputs yield defined results" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting DecisionPolicy Test..." << std::endl;
    TestModelWinsAboveHighThreshold();
    TestSuggestionWinsInMiddleBand();
    TestLowConfidenceIsForcedToZero();
    TestDegradedMode();
    TestInputsAreSanitized();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
