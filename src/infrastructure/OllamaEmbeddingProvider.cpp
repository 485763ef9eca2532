/**
 * @file OllamaEmbeddingProvider.cpp
 * @brief Implementation of OllamaEmbeddingProvider.
 */

#include "infrastructure/OllamaEmbeddingProvider.hpp"
#include <algorithm>
#include <iostream>

namespace docweave::infrastructure {

OllamaEmbeddingProvider::OllamaEmbeddingProvider(const std::string& host, int port, const std::string& model)
    : m_client(host, port), m_model(model) {}

std::optional<std::vector<float>> OllamaEmbeddingProvider::embedText(const std::string& text) {
    if (text.empty()) return std::nullopt;
    return m_client.getEmbedding(m_model, text);
}

std::optional<std::vector<float>> OllamaEmbeddingProvider::embedImage(const domain::ImageAsset& image) {
    std::string description = image.describingText();
    if (description.empty()) return std::nullopt;
    return m_client.getEmbedding(m_model, "image: " + description);
}

bool OllamaEmbeddingProvider::isModelAvailable() {
    auto models = m_client.getAvailableModels();
    // Ollama reports tagged names ("nomic-embed-text:latest").
    bool found = std::any_of(models.begin(), models.end(), [this](const std::string& name) {
        return name == m_model || name.rfind(m_model + ":", 0) == 0;
    });
    if (!found) {
        std::cerr << "[OllamaEmbeddingProvider] Model '" << m_model << "' not found on "
                  << m_client.host() << ":" << m_client.port() << std::endl;
    }
    return found;
}

} // namespace docweave::infrastructure
