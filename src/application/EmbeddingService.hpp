/**
 * @file EmbeddingService.hpp
 * @brief Parallel, cached embedding lookups for text units, chunks and images.
 */

#pragma once
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <atomic>
#include "domain/EmbeddingProvider.hpp"
#include "domain/TextUnit.hpp"
#include "domain/Chunk.hpp"
#include "domain/ImageAsset.hpp"
#include "application/TaskPool.hpp"
#include "infrastructure/EmbeddingCache.hpp"

namespace docweave::application {

/**
 * @class EmbeddingService
 * @brief Fans embedding requests out over its own worker pool and joins them.
 *
 * Every embed* call returns only after all of its lookups finished, so the
 * caller can run sequential scoring on the filled-in items right away. A
 * provider exception or empty answer leaves the item without an embedding.
 */
class EmbeddingService {
public:
    /**
     * @param provider Embedding backend; must be safe to call from several threads.
     * @param cache Caller-owned cache, may be nullptr.
     * @param workers Size of the lookup pool.
     */
    EmbeddingService(std::shared_ptr<domain::EmbeddingProvider> provider,
                     infrastructure::EmbeddingCache* cache,
                     size_t workers);

    /** @brief Fills missing unit embeddings; returns how many were added. */
    size_t embedUnits(std::vector<domain::TextUnit>& units);
    size_t embedChunks(std::vector<domain::Chunk>& chunks);
    size_t embedImages(std::vector<domain::ImageAsset>& images);

    /** @brief Single cached lookup on the calling thread. */
    std::optional<std::vector<float>> embedText(const std::string& text);
    std::optional<std::vector<float>> embedImage(const domain::ImageAsset& image);

    size_t failureCount() const { return m_failures.load(); }
    size_t cacheHits() const { return m_cacheHits.load(); }
    size_t providerCalls() const { return m_providerCalls.load(); }

private:
    template<typename Item, typename Lookup>
    size_t fanOut(std::vector<Item>& items, Lookup lookup);

    std::shared_ptr<domain::EmbeddingProvider> m_provider;
    infrastructure::EmbeddingCache* m_cache;

    std::atomic<size_t> m_failures{0};
    std::atomic<size_t> m_cacheHits{0};
    std::atomic<size_t> m_providerCalls{0};

    TaskPool m_pool;
};

} // namespace docweave::application
