#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "domain/Errors.hpp"
#include "infrastructure/ConfigLoader.hpp"

using namespace ledgerlens;
using infrastructure::ConfigLoader;
using json = nlohmann::json;

namespace {

json Minimal() {
    return {
        {"embedding", {{"model", "nomic-embed-text"}, {"dimension", 768}}},
        {"storage", {{"data_dir", "test_config_data"}}}
    };
}

bool Rejects(const json& j) {
    try {
        ConfigLoader::FromJson(j);
    } catch (const domain::ConfigurationError& e) {
        std::cout << "[Test] Rejected as expected: " << e.what() << std::endl;
        return true;
    }
    return false;
}

void TestDefaults() {
    auto s = ConfigLoader::FromJson(Minimal());
    assert(s.embedding.host == "localhost" && s.embedding.port == 11434);
    assert(s.embedding.dimension == 768);
    assert(s.index.backend == "local");
    assert(s.engine.classifier.neighbors == 5);
    assert(s.engine.policy.highThreshold == 0.85 && s.engine.policy.lowThreshold == 0.3);
    assert(s.engine.policy.defaultCategory == "Other");
    assert(s.engine.training.minSamplesPerCategory == 3);
    assert(s.engine.training.minTrainingSamples == 10);
    assert(s.engine.training.folds == 5 && s.engine.training.seed == 42);
    assert(s.engine.training.mainPartition == "expenses");
    assert(s.engine.corrector.vendorCutoff == 0.75);
    assert(s.storage.dataDir == "test_config_data");
    std::cout << "[PASS] Defaults applied to a minimal file" << std::endl;
}

void TestOverridesFromFile() {
    json j = Minimal();
    j["classifier"] = {{"neighbors", 7}};
    j["policy"] = {{"high_threshold", 0.9}, {"low_threshold", 0.4}, {"default_category", "Misc"}};
    j["training"] = {{"folds", 3}, {"min_samples_per_category", 4}, {"embedding_batch_size", 8}};
    j["index"] = {{"backend", "qdrant"}, {"url", "http://qdrant:6333"}, {"inference_timeout_seconds", 3}};

    auto s = ConfigLoader::FromJson(j);
    assert(s.engine.classifier.neighbors == 7);
    assert(s.engine.policy.defaultCategory == "Misc");
    assert(s.engine.training.folds == 3 && s.engine.training.embeddingBatchSize == 8);
    assert(s.index.backend == "qdrant" && s.index.url == "http://qdrant:6333");
    assert(s.index.timeoutSeconds == 3);
    std::cout << "[PASS] Sections override defaults" << std::endl;
}

void TestMissingSettingsAreErrors() {
    json noModel = Minimal();
    noModel["embedding"].erase("model");
    assert(Rejects(noModel));

    json noDimension = Minimal();
    noDimension["embedding"]["dimension"] = 0;
    assert(Rejects(noDimension));

    json qdrantWithoutUrl = Minimal();
    qdrantWithoutUrl["index"] = {{"backend", "qdrant"}};
    assert(Rejects(qdrantWithoutUrl));

    json unknownBackend = Minimal();
    unknownBackend["index"] = {{"backend", "faiss"}};
    assert(Rejects(unknownBackend));

    json badThresholds = Minimal();
    badThresholds["policy"] = {{"high_threshold", 0.2}, {"low_threshold", 0.5}};
    assert(Rejects(badThresholds));

    for (int k : {0, 4, 8}) {
        json badNeighbors = Minimal();
        badNeighbors["classifier"] = {{"neighbors", k}};
        assert(Rejects(badNeighbors));
    }
    json sixNeighbors = Minimal();
    sixNeighbors["classifier"] = {{"neighbors", 6}};
    assert(!Rejects(sixNeighbors));

    json wrongType = Minimal();
    wrongType["embedding"]["dimension"] = "large";
    assert(Rejects(wrongType));

    bool threw = false;
    try {
        ConfigLoader::Load("does_not_exist/settings.json");
    } catch (const domain::ConfigurationError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Missing model or index settings raise ConfigurationError" << std::endl;
}

void TestEnvironmentOverrides() {
    setenv("LEDGERLENS_OLLAMA_HOST", "ollama.internal", 1);
    setenv("LEDGERLENS_OLLAMA_PORT", "9999", 1);
    setenv("QDRANT_URL", "http://env-qdrant:6333", 1);
    setenv("QDRANT_API_KEY", "secret", 1);

    json j = Minimal();
    j["index"] = {{"backend", "qdrant"}};
    auto s = ConfigLoader::FromJson(j);
    assert(s.embedding.host == "ollama.internal" && s.embedding.port == 9999);
    assert(s.index.url == "http://env-qdrant:6333" && s.index.apiKey == "secret");

    setenv("LEDGERLENS_OLLAMA_PORT", "not-a-port", 1);
    assert(Rejects(j));

    unsetenv("LEDGERLENS_OLLAMA_HOST");
    unsetenv("LEDGERLENS_OLLAMA_PORT");
    unsetenv("QDRANT_URL");
    unsetenv("QDRANT_API_KEY");
    std::cout << "[PASS] Environment overrides take precedence" << std::endl;
}

void TestLoadFromFile() {
    std::filesystem::path file = "test_settings.json";
    {
        std::ofstream out(file);
        out << Minimal().dump(2);
    }
    auto s = ConfigLoader::Load(file);
    assert(s.embedding.model == "nomic-embed-text");

    {
        std::ofstream out(file);
        out << "{ broken";
    }
    bool threw = false;
    try {
        ConfigLoader::Load(file);
    } catch (const domain::ConfigurationError&) {
        threw = true;
    }
    assert(threw);
    std::filesystem::remove(file);
    std::cout << "[PASS] settings.json is read from disk" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;
    unsetenv("LEDGERLENS_OLLAMA_HOST");
    unsetenv("LEDGERLENS_OLLAMA_PORT");
    unsetenv("QDRANT_URL");
    unsetenv("QDRANT_API_KEY");

    TestDefaults();
    TestOverridesFromFile();
    TestMissingSettingsAreErrors();
    TestEnvironmentOverrides();
    TestLoadFromFile();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
