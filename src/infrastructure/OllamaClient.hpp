/**
 * @file OllamaClient.hpp
 * @brief Low-level HTTP client for the Ollama REST API.
 */

#pragma once

#include <string>
#include <vector>
#include <optional>

namespace docweave::infrastructure {

class OllamaClient {
public:
    OllamaClient(const std::string& host = "localhost", int port = 11434);

    /**
     * @brief Sends a POST request to /api/embeddings.
     * @return The embedding, or nullopt on an HTTP error or malformed reply.
     * @throws std::runtime_error when the server cannot be reached.
     */
    std::optional<std::vector<float>> getEmbedding(const std::string& model, const std::string& text);

    /** @brief Fetches available models from /api/tags. */
    std::vector<std::string> getAvailableModels();

    const std::string& host() const { return m_host; }
    int port() const { return m_port; }

private:
    std::string m_host;
    int m_port;
};

} // namespace docweave::infrastructure
