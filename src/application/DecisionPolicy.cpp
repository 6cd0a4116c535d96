/**
 * @file DecisionPolicy.cpp
 * @brief Implementation of DecisionPolicy.
 */

#include "application/DecisionPolicy.hpp"
#include "application/TextNormalizer.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

namespace ledgerlens::application {

DecisionPolicy::DecisionPolicy(PolicyConfig config) : m_config(std::move(config)) {}

std::string DecisionPolicy::suggestionOrDefault(const std::string& llmCategory) const {
    std::string trimmed = TextNormalizer::trim(llmCategory);
    return trimmed.empty() ? m_config.defaultCategory : trimmed;
}

domain::Decision DecisionPolicy::decide(const std::optional<std::string>& mlPrediction,
                                        double mlConfidence,
                                        const std::string& llmCategory) const {
    double confidence = std::isnan(mlConfidence) ? 0.0 : std::clamp(mlConfidence, 0.0, 1.0);
    bool hasPrediction = mlPrediction && !mlPrediction->empty();

    domain::Decision decision;
    decision.mlPrediction = hasPrediction ? mlPrediction : std::nullopt;
    decision.llmCategory = llmCategory;

    if (hasPrediction && confidence >= m_config.highThreshold) {
        decision.finalCategory = *mlPrediction;
        decision.confidence = confidence;
        decision.source = domain::DecisionSource::Model;
        decision.needsConfirmation = false;
    } else if (hasPrediction && confidence >= m_config.lowThreshold) {
        decision.finalCategory = suggestionOrDefault(llmCategory);
        decision.confidence = confidence;
        decision.source = domain::DecisionSource::Suggestion;
        decision.needsConfirmation = true;
    } else {
        decision.finalCategory = suggestionOrDefault(llmCategory);
        decision.confidence = 0.0;
        decision.source = domain::DecisionSource::LowConfidence;
        decision.needsConfirmation = true;
    }
    return decision;
}

domain::Decision DecisionPolicy::decideDegraded(const std::string& llmCategory) const {
    std::cerr << "[DecisionPolicy] Degraded mode: model or index unavailable, using suggested category '"
              << llmCategory << "' with confidence 0.0" << std::endl;

    domain::Decision decision;
    decision.finalCategory = suggestionOrDefault(llmCategory);
    decision.confidence = 0.0;
    decision.llmCategory = llmCategory;
    decision.source = domain::DecisionSource::Degraded;
    decision.needsConfirmation = true;
    return decision;
}

domain::Decision DecisionPolicy::decide(const domain::Prediction& prediction,
                                        const std::string& llmCategory) const {
    if (!prediction.available) {
        return decideDegraded(llmCategory);
    }
    return decide(prediction.category, prediction.confidence, llmCategory);
}

} // namespace ledgerlens::application
