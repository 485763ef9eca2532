/**
 * @file OllamaEmbeddingProvider.hpp
 * @brief EmbeddingProvider backed by a local Ollama server.
 */

#pragma once
#include "domain/EmbeddingProvider.hpp"
#include "infrastructure/OllamaClient.hpp"
#include <string>

namespace docweave::infrastructure {

/**
 * @class OllamaEmbeddingProvider
 * @brief Implements EmbeddingProvider using the Ollama embeddings endpoint.
 *
 * Images are embedded through their caption or alt text in the same text
 * space, so image and text vectors stay comparable.
 */
class OllamaEmbeddingProvider : public domain::EmbeddingProvider {
public:
    /**
     * @param host Server hostname or IP.
     * @param port Server port.
     * @param model Embedding model name.
     */
    OllamaEmbeddingProvider(const std::string& host, int port, const std::string& model);

    /** @see domain::EmbeddingProvider::embedText */
    std::optional<std::vector<float>> embedText(const std::string& text) override;

    /** @brief Embeds "image: <caption or alt>"; nullopt for images without text. */
    std::optional<std::vector<float>> embedImage(const domain::ImageAsset& image) override;

    std::string modelName() const override { return m_model; }

    /** @brief True when the configured model is listed by the server. */
    bool isModelAvailable();

private:
    OllamaClient m_client;
    std::string m_model;
};

} // namespace docweave::infrastructure
