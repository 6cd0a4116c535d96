/**
 * @file Categorization.hpp
 * @brief Results produced by the classifier, the decision policy and the full inference flow.
 */

#pragma once
#include <optional>
#include <string>

namespace ledgerlens::domain {

/**
 * @struct Prediction
 * @brief Output of the voting classifier.
 */
struct Prediction {
    std::optional<std::string> category; ///< Empty when no neighbor voted.
    double confidence = 0.0;             ///< Always in [0,1].
    bool available = true;               ///< False when the model or index could not be reached.
};

/**
 * @enum DecisionSource
 * @brief Which row of the decision table produced the final category.
 */
enum class DecisionSource {
    Model,          ///< ML confidence above the high threshold.
    Suggestion,     ///< Suggestion wins, ML confidence kept for observability.
    LowConfidence,  ///< Suggestion wins, confidence forced to 0.
    Degraded        ///< Model or index unavailable.
};

inline const char* DecisionSourceToString(DecisionSource s) {
    switch (s) {
        case DecisionSource::Model: return "model";
        case DecisionSource::Suggestion: return "suggestion";
        case DecisionSource::LowConfidence: return "low_confidence";
        case DecisionSource::Degraded: return "degraded";
    }
    return "suggestion";
}

/**
 * @struct Decision
 * @brief Final (category, confidence) after reconciling the model with the suggestion.
 */
struct Decision {
    std::string finalCategory;
    double confidence = 0.0;
    std::optional<std::string> mlPrediction;
    std::string llmCategory;
    DecisionSource source = DecisionSource::LowConfidence;
    bool needsConfirmation = true;
};

/**
 * @struct Categorization
 * @brief Result of categorizing one candidate expense end to end.
 */
struct Categorization {
    Decision decision;
    double mlConfidence = 0.0;
    std::string vendor;                  ///< Vendor after correction.
    std::string canonicalText;
    std::optional<std::string> ruleCategory; ///< Set when a curated term rewrote the suggestion.
};

} // namespace ledgerlens::domain
