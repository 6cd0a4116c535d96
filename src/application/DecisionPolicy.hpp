/**
 * @file DecisionPolicy.hpp
 * @brief Reconciles the classifier output with the generative suggestion.
 */

#pragma once
#include <optional>
#include <string>
#include "application/EngineConfig.hpp"
#include "domain/Categorization.hpp"

namespace ledgerlens::application {

/**
 * @class DecisionPolicy
 * @brief Total, deterministic mapping (ml_prediction, ml_confidence, llm_category) -> Decision.
 *
 * | confidence              | category       | confidence reported |
 * |-------------------------|----------------|---------------------|
 * | >= high                 | ml_prediction  | ml_confidence       |
 * | [low, high)             | llm_category   | ml_confidence       |
 * | < low or no prediction  | llm_category   | 0.0                 |
 * | model/index unavailable | llm_category   | 0.0                 |
 */
class DecisionPolicy {
public:
    explicit DecisionPolicy(PolicyConfig config);

    domain::Decision decide(const std::optional<std::string>& mlPrediction,
                            double mlConfidence,
                            const std::string& llmCategory) const;

    /** @brief Decision when the model or index could not be consulted. Logs a warning. */
    domain::Decision decideDegraded(const std::string& llmCategory) const;

    /** @brief Routes an unavailable prediction to decideDegraded, everything else to decide. */
    domain::Decision decide(const domain::Prediction& prediction, const std::string& llmCategory) const;

    const PolicyConfig& config() const { return m_config; }

private:
    std::string suggestionOrDefault(const std::string& llmCategory) const;

    PolicyConfig m_config;
};

} // namespace ledgerlens::application
