/**
 * @file OllamaEmbeddingGenerator.hpp
 * @brief EmbeddingGenerator backed by a local Ollama embedding model.
 */

#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include "domain/EmbeddingGenerator.hpp"
#include "infrastructure/OllamaClient.hpp"

namespace ledgerlens::infrastructure {

/**
 * @class OllamaEmbeddingGenerator
 * @brief Calls /api/embeddings and L2-normalizes the reply.
 *
 * Any failure (unreachable server, bad reply, unexpected dimension) surfaces
 * as domain::TransientInfraError.
 */
class OllamaEmbeddingGenerator : public domain::EmbeddingGenerator {
public:
    OllamaEmbeddingGenerator(std::shared_ptr<OllamaClient> client, std::string model, std::size_t dimension);

    std::vector<float> embed(const std::string& text) override;
    std::size_t dimension() const override { return m_dimension; }
    std::string modelVersion() const override { return m_model; }

    /** @brief True if the server lists the model, with or without the ":latest" tag. */
    bool modelInstalled() const;

private:
    std::shared_ptr<OllamaClient> m_client;
    std::string m_model;
    std::size_t m_dimension;
};

} // namespace ledgerlens::infrastructure
