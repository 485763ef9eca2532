/**
 * @file EmbeddingCache.hpp
 * @brief Thread-safe, TTL-bounded cache of embeddings with optional disk persistence.
 */

#pragma once
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <mutex>
#include <chrono>
#include <functional>

namespace docweave::infrastructure {

/**
 * @class EmbeddingCache
 * @brief Avoids recomputing embeddings for unchanged text.
 *
 * Owned by the caller and shared with pipelines by reference. All methods are
 * safe to call from several worker threads.
 */
class EmbeddingCache {
public:
    using Clock = std::chrono::system_clock;
    using ClockFn = std::function<Clock::time_point()>;

    /**
     * @param cacheDir Directory for .embeddings.json; empty disables persistence.
     * @param ttl Entries older than this are treated as missing and evicted.
     * @param clock Time source, replaceable in tests.
     */
    EmbeddingCache(const std::string& cacheDir, std::chrono::seconds ttl, ClockFn clock = {});

    /** @brief Updates or adds an embedding to the cache. */
    void update(const std::string& key, const std::string& contentHash, const std::vector<float>& embedding);

    /** @brief Retrieves an embedding if the hash matches and the entry has not expired. */
    std::optional<std::vector<float>> get(const std::string& key, const std::string& contentHash) const;

    /** @brief Drops expired entries; returns how many were removed. */
    size_t evictExpired();

    size_t size() const;

    /** @brief Saves cache to .embeddings.json in the cache directory. */
    bool persist() const;

    /** @brief Loads cache from disk, skipping entries that already expired. */
    void load();

    static std::string computeHash(const std::string& text);

private:
    struct CacheEntry {
        std::string hash;
        std::vector<float> vector;
        Clock::time_point storedAt;
    };

    bool expired(const CacheEntry& entry, Clock::time_point now) const;

    std::string m_cacheDir;
    std::chrono::seconds m_ttl;
    ClockFn m_clock;
    std::map<std::string, CacheEntry> m_entries;
    mutable std::mutex m_mutex;
};

} // namespace docweave::infrastructure
