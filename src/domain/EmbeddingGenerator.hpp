/**
 * @file EmbeddingGenerator.hpp
 * @brief Interface for turning canonical expense text into vectors.
 */

#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace ledgerlens::domain {

/**
 * @class EmbeddingGenerator
 * @brief Maps text to a fixed-dimension vector, deterministic for a given model version.
 */
class EmbeddingGenerator {
public:
    virtual ~EmbeddingGenerator() = default;

    /**
     * @brief Generates the embedding of a text.
     * @param text Canonical expense text.
     * @return A vector of exactly dimension() floats.
     * @throws TransientInfraError when the model cannot be reached.
     */
    virtual std::vector<float> embed(const std::string& text) = 0;

    /** @brief Dimension of every produced vector. */
    virtual std::size_t dimension() const = 0;

    /** @brief Identifier of the model producing the vectors. */
    virtual std::string modelVersion() const = 0;
};

} // namespace ledgerlens::domain
