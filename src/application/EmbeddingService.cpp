/**
 * @file EmbeddingService.cpp
 * @brief Implementation of EmbeddingService.
 */

#include "application/EmbeddingService.hpp"
#include <iostream>
#include <future>

namespace docweave::application {

EmbeddingService::EmbeddingService(std::shared_ptr<domain::EmbeddingProvider> provider,
                                   infrastructure::EmbeddingCache* cache,
                                   size_t workers)
    : m_provider(std::move(provider)), m_cache(cache), m_pool(workers) {}

std::optional<std::vector<float>> EmbeddingService::embedText(const std::string& text) {
    if (!m_provider || text.empty()) return std::nullopt;

    const std::string hash = infrastructure::EmbeddingCache::computeHash(text);
    const std::string key = m_provider->modelName() + ":text:" + hash;
    if (m_cache) {
        if (auto cached = m_cache->get(key, hash)) {
            m_cacheHits++;
            return cached;
        }
    }

    std::optional<std::vector<float>> vec;
    try {
        m_providerCalls++;
        vec = m_provider->embedText(text);
    } catch (const std::exception& e) {
        m_failures++;
        std::cerr << "[EmbeddingService] Text embedding failed: " << e.what() << std::endl;
        return std::nullopt;
    }

    if (!vec || vec->empty()) return std::nullopt;
    if (m_cache) m_cache->update(key, hash, *vec);
    return vec;
}

std::optional<std::vector<float>> EmbeddingService::embedImage(const domain::ImageAsset& image) {
    if (!m_provider) return std::nullopt;

    const std::string identity = image.source + "|" + image.describingText();
    const std::string hash = infrastructure::EmbeddingCache::computeHash(identity);
    const std::string key = m_provider->modelName() + ":image:" + hash;
    if (m_cache) {
        if (auto cached = m_cache->get(key, hash)) {
            m_cacheHits++;
            return cached;
        }
    }

    std::optional<std::vector<float>> vec;
    try {
        m_providerCalls++;
        vec = m_provider->embedImage(image);
    } catch (const std::exception& e) {
        m_failures++;
        std::cerr << "[EmbeddingService] Image embedding failed for " << image.id << ": " << e.what() << std::endl;
        return std::nullopt;
    }

    if (!vec || vec->empty()) return std::nullopt;
    if (m_cache) m_cache->update(key, hash, *vec);
    return vec;
}

template<typename Item, typename Lookup>
size_t EmbeddingService::fanOut(std::vector<Item>& items, Lookup lookup) {
    std::vector<std::pair<size_t, std::future<std::optional<std::vector<float>>>>> pending;
    for (size_t i = 0; i < items.size(); ++i) {
        if (!items[i].embedding.empty()) continue;
        const Item* item = &items[i];
        auto submitted = m_pool.Submit(TaskType::Embedding, "embed " + item->id, [this, item, lookup]() {
            return lookup(*this, *item);
        });
        pending.emplace_back(i, std::move(submitted.first));
    }

    // Join barrier: every lookup finishes before the items are touched again.
    size_t filled = 0;
    for (auto& [index, future] : pending) {
        try {
            auto vec = future.get();
            if (vec) {
                items[index].embedding = std::move(*vec);
                ++filled;
            }
        } catch (const std::exception& e) {
            m_failures++;
            std::cerr << "[EmbeddingService] Lookup task failed: " << e.what() << std::endl;
        }
    }
    return filled;
}

size_t EmbeddingService::embedUnits(std::vector<domain::TextUnit>& units) {
    return fanOut(units, [](EmbeddingService& self, const domain::TextUnit& unit) {
        return self.embedText(unit.text);
    });
}

size_t EmbeddingService::embedChunks(std::vector<domain::Chunk>& chunks) {
    return fanOut(chunks, [](EmbeddingService& self, const domain::Chunk& chunk) {
        return self.embedText(chunk.text);
    });
}

size_t EmbeddingService::embedImages(std::vector<domain::ImageAsset>& images) {
    return fanOut(images, [](EmbeddingService& self, const domain::ImageAsset& image) {
        return self.embedImage(image);
    });
}

} // namespace docweave::application
