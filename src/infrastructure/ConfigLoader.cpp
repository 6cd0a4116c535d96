/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>

namespace ledgerlens::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

const json& Section(const json& root, const char* name) {
    static const json kEmpty = json::object();
    if (!root.contains(name)) return kEmpty;
    if (!root[name].is_object()) {
        throw domain::ConfigurationError(std::string("settings: '") + name + "' must be an object");
    }
    return root[name];
}

std::string EnvOr(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return (value && *value) ? std::string(value) : fallback;
}

void Validate(const AppSettings& s) {
    if (s.embedding.model.empty()) {
        throw domain::ConfigurationError("settings: embedding.model is required");
    }
    if (s.embedding.dimension == 0) {
        throw domain::ConfigurationError("settings: embedding.dimension must be positive");
    }
    if (s.embedding.port <= 0 || s.embedding.port > 65535) {
        throw domain::ConfigurationError("settings: embedding.port is out of range");
    }
    if (s.index.backend != "local" && s.index.backend != "qdrant") {
        throw domain::ConfigurationError("settings: index.backend must be 'local' or 'qdrant', got '" +
                                         s.index.backend + "'");
    }
    if (s.index.backend == "qdrant" && s.index.url.empty()) {
        throw domain::ConfigurationError("settings: index.url (or QDRANT_URL) is required for the qdrant backend");
    }

    const auto& policy = s.engine.policy;
    if (!(policy.lowThreshold >= 0.0 && policy.lowThreshold <= policy.highThreshold && policy.highThreshold <= 1.0)) {
        throw domain::ConfigurationError("settings: policy thresholds must satisfy 0 <= low <= high <= 1");
    }
    if (s.engine.classifier.neighbors < 5 || s.engine.classifier.neighbors > 7) {
        throw domain::ConfigurationError("settings: classifier.neighbors must be between 5 and 7, got " +
                                         std::to_string(s.engine.classifier.neighbors));
    }
    if (s.engine.training.folds < 2) {
        throw domain::ConfigurationError("settings: training.folds must be at least 2");
    }
    if (s.engine.training.minSamplesPerCategory < 1) {
        throw domain::ConfigurationError("settings: training.min_samples_per_category must be positive");
    }
}

} // namespace

AppSettings ConfigLoader::FromJson(const json& j) {
    if (!j.is_object()) {
        throw domain::ConfigurationError("settings: top level must be an object");
    }

    AppSettings s;
    try {
        const json& embedding = Section(j, "embedding");
        s.embedding.host = embedding.value("host", s.embedding.host);
        s.embedding.port = embedding.value("port", s.embedding.port);
        s.embedding.model = embedding.value("model", s.embedding.model);
        s.embedding.dimension = embedding.value("dimension", s.embedding.dimension);
        s.embedding.timeoutSeconds = embedding.value("timeout_seconds", s.embedding.timeoutSeconds);

        const json& index = Section(j, "index");
        s.index.backend = index.value("backend", s.index.backend);
        s.index.url = index.value("url", s.index.url);
        s.index.apiKey = index.value("api_key", s.index.apiKey);
        s.index.timeoutSeconds = index.value("inference_timeout_seconds", s.index.timeoutSeconds);

        const json& storage = Section(j, "storage");
        std::string dataDir = storage.value("data_dir", std::string());
        s.storage.dataDir = dataDir.empty() ? PathUtils::GetAppDataDir() : fs::path(dataDir);
        s.storage.expensesFile = storage.value("expenses_file", s.storage.expensesFile);
        s.storage.metricsFile = storage.value("metrics_file", s.storage.metricsFile);
        s.storage.vectorsFile = storage.value("vectors_file", s.storage.vectorsFile);

        auto& engine = s.engine;
        const json& classifier = Section(j, "classifier");
        engine.classifier.neighbors = classifier.value("neighbors", engine.classifier.neighbors);

        const json& policy = Section(j, "policy");
        engine.policy.highThreshold = policy.value("high_threshold", engine.policy.highThreshold);
        engine.policy.lowThreshold = policy.value("low_threshold", engine.policy.lowThreshold);
        engine.policy.defaultCategory = policy.value("default_category", engine.policy.defaultCategory);

        const json& training = Section(j, "training");
        engine.training.minSamplesPerCategory =
            training.value("min_samples_per_category", engine.training.minSamplesPerCategory);
        engine.training.minTrainingSamples = training.value("min_training_samples", engine.training.minTrainingSamples);
        engine.training.folds = training.value("folds", engine.training.folds);
        engine.training.seed = training.value("seed", engine.training.seed);
        engine.training.embeddingBatchSize = training.value("embedding_batch_size", engine.training.embeddingBatchSize);
        engine.training.mainPartition = training.value("main_partition", engine.training.mainPartition);

        const json& corrector = Section(j, "corrector");
        engine.corrector.vendorCutoff = corrector.value("vendor_cutoff", engine.corrector.vendorCutoff);
    } catch (const json::exception& e) {
        throw domain::ConfigurationError(std::string("settings: ") + e.what());
    }

    s.embedding.host = EnvOr("LEDGERLENS_OLLAMA_HOST", s.embedding.host);
    std::string port = EnvOr("LEDGERLENS_OLLAMA_PORT", "");
    if (!port.empty()) {
        try {
            s.embedding.port = std::stoi(port);
        } catch (const std::exception&) {
            throw domain::ConfigurationError("LEDGERLENS_OLLAMA_PORT is not a number: " + port);
        }
    }
    s.index.url = EnvOr("QDRANT_URL", s.index.url);
    s.index.apiKey = EnvOr("QDRANT_API_KEY", s.index.apiKey);

    Validate(s);
    return s;
}

AppSettings ConfigLoader::Load(const fs::path& settingsPath) {
    if (!fs::exists(settingsPath)) {
        throw domain::ConfigurationError("settings file not found: " + settingsPath.string());
    }

    json j;
    try {
        std::ifstream f(settingsPath);
        j = json::parse(f);
    } catch (const json::exception& e) {
        throw domain::ConfigurationError("Error reading " + settingsPath.string() + ": " + e.what());
    }

    AppSettings settings = FromJson(j);
    std::cout << "[ConfigLoader] Loaded " << settingsPath << " (model " << settings.embedding.model << ", index "
              << settings.index.backend << ")" << std::endl;
    return settings;
}

} // namespace ledgerlens::infrastructure
