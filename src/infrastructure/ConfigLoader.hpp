/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading the engine configuration (settings.json).
 *
 * Provides a unified way to access model, index, storage and engine settings
 * without scattering JSON parsing logic throughout the codebase.
 */

#pragma once

#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include "application/EngineConfig.hpp"

namespace ledgerlens::infrastructure {

struct EmbeddingSettings {
    std::string host = "localhost";
    int port = 11434;
    std::string model;
    std::size_t dimension = 0;
    int timeoutSeconds = 30;
};

struct IndexSettings {
    std::string backend = "local"; ///< "local" or "qdrant".
    std::string url;
    std::string apiKey;
    int timeoutSeconds = 10;       ///< inference_timeout_seconds
};

struct StorageSettings {
    std::filesystem::path dataDir;
    std::string expensesFile = "expenses.json";
    std::string metricsFile = "metrics.ndjson";
    std::string vectorsFile = "vectors.json";
};

/**
 * @struct AppSettings
 * @brief Everything read from settings.json, after environment overrides.
 */
struct AppSettings {
    EmbeddingSettings embedding;
    IndexSettings index;
    StorageSettings storage;
    application::EngineConfig engine;
};

class ConfigLoader {
public:
    /**
     * @brief Reads and validates a settings file.
     * @throws domain::ConfigurationError if the file is missing, malformed or incomplete.
     */
    static AppSettings Load(const std::filesystem::path& settingsPath);

    /**
     * @brief Builds settings from an already parsed document and applies the
     *        LEDGERLENS_OLLAMA_HOST, LEDGERLENS_OLLAMA_PORT, QDRANT_URL and
     *        QDRANT_API_KEY environment overrides.
     * @throws domain::ConfigurationError on missing model or index settings.
     */
    static AppSettings FromJson(const nlohmann::json& j);
};

} // namespace ledgerlens::infrastructure
