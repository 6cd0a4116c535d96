/**
 * @file OllamaClient.hpp
 * @brief Low-level HTTP client for the Ollama REST API.
 */

#pragma once

#include <string>
#include <vector>

namespace ledgerlens::infrastructure {

class OllamaClient {
public:
    OllamaClient(const std::string& host = "localhost", int port = 11434, int timeoutSeconds = 30);

    /** @brief Sends a POST request to /api/embeddings. Returns an empty vector on failure. */
    std::vector<float> getEmbedding(const std::string& model, const std::string& text);

    /** @brief Fetches available models from /api/tags. */
    std::vector<std::string> getAvailableModels();

    const std::string& host() const { return m_host; }
    int port() const { return m_port; }

private:
    std::string m_host;
    int m_port;
    int m_timeoutSeconds;
};

} // namespace ledgerlens::infrastructure
