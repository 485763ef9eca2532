/**
 * @file EmbeddingProvider.hpp
 * @brief Interface to the external embedding collaborator.
 */

#pragma once
#include <string>
#include <vector>
#include <optional>
#include "ImageAsset.hpp"

namespace docweave::domain {

/**
 * @class EmbeddingProvider
 * @brief Produces embedding vectors for text and images.
 *
 * std::nullopt means "no embedding available". Implementations may also throw;
 * callers treat both the same way and fall back.
 */
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    /**
     * @brief Generates a semantic embedding vector for the given text.
     * @param text The text to embed.
     */
    virtual std::optional<std::vector<float>> embedText(const std::string& text) = 0;

    /**
     * @brief Generates an embedding for an image, in the same space as embedText.
     * @param image Image metadata (source, caption, alt text).
     */
    virtual std::optional<std::vector<float>> embedImage(const ImageAsset& image) = 0;

    /** @brief Identifier of the model, used as part of cache keys. */
    virtual std::string modelName() const = 0;
};

} // namespace docweave::domain
