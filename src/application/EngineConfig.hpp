/**
 * @file EngineConfig.hpp
 * @brief Tunables of the categorization engine.
 */

#pragma once
#include <cstddef>
#include <string>

namespace ledgerlens::application {

struct ClassifierConfig {
    std::size_t neighbors = 5; ///< k for the voting classifier (5 to 7).
};

struct PolicyConfig {
    double highThreshold = 0.85;            ///< At or above: the model decides.
    double lowThreshold = 0.3;              ///< Below: confidence is forced to 0.
    std::string defaultCategory = "Other";  ///< Used when the suggestion is empty.
};

struct TrainingConfig {
    int minSamplesPerCategory = 3;
    int minTrainingSamples = 10;
    int folds = 5;
    unsigned int seed = 42;
    std::size_t embeddingBatchSize = 32;
    std::string mainPartition = "expenses";
};

struct CorrectorConfig {
    double vendorCutoff = 0.75;
};

/**
 * @struct EngineConfig
 * @brief Aggregates every engine section of settings.json.
 */
struct EngineConfig {
    ClassifierConfig classifier;
    PolicyConfig policy;
    TrainingConfig training;
    CorrectorConfig corrector;
};

} // namespace ledgerlens::application
