/**
 * @file OllamaEmbeddingGenerator.cpp
 * @brief Implementation of OllamaEmbeddingGenerator.
 */

#include "infrastructure/OllamaEmbeddingGenerator.hpp"
#include "domain/Errors.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

namespace ledgerlens::infrastructure {

OllamaEmbeddingGenerator::OllamaEmbeddingGenerator(std::shared_ptr<OllamaClient> client,
                                                   std::string model,
                                                   std::size_t dimension)
    : m_client(std::move(client)), m_model(std::move(model)), m_dimension(dimension) {
    if (!m_client || m_model.empty() || m_dimension == 0) {
        throw domain::ConfigurationError("Embedding generator needs a client, a model name and a dimension");
    }
}

std::vector<float> OllamaEmbeddingGenerator::embed(const std::string& text) {
    std::vector<float> vector = m_client->getEmbedding(m_model, text);
    if (vector.empty()) {
        throw domain::TransientInfraError("Embedding model '" + m_model + "' unavailable at " +
                                          m_client->host() + ":" + std::to_string(m_client->port()));
    }
    if (vector.size() != m_dimension) {
        throw domain::TransientInfraError("Embedding model '" + m_model + "' returned " +
                                          std::to_string(vector.size()) + " dimensions, expected " +
                                          std::to_string(m_dimension));
    }

    double norm = 0.0;
    for (float v : vector) norm += static_cast<double>(v) * v;
    norm = std::sqrt(norm);
    if (norm > 0.0) {
        for (auto& v : vector) v = static_cast<float>(v / norm);
    }
    return vector;
}

bool OllamaEmbeddingGenerator::modelInstalled() const {
    auto models = m_client->getAvailableModels();
    return std::any_of(models.begin(), models.end(), [this](const std::string& name) {
        return name == m_model || name == m_model + ":latest";
    });
}

} // namespace ledgerlens::infrastructure
