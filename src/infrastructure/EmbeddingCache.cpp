/**
 * @file EmbeddingCache.cpp
 * @brief Implementation of EmbeddingCache.
 */

#include "infrastructure/EmbeddingCache.hpp"
#include <fstream>
#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace docweave::infrastructure {

EmbeddingCache::EmbeddingCache(const std::string& cacheDir, std::chrono::seconds ttl, ClockFn clock)
    : m_cacheDir(cacheDir), m_ttl(ttl), m_clock(std::move(clock)) {
    if (!m_clock) m_clock = []() { return Clock::now(); };
}

bool EmbeddingCache::expired(const CacheEntry& entry, Clock::time_point now) const {
    return now - entry.storedAt > m_ttl;
}

void EmbeddingCache::update(const std::string& key, const std::string& contentHash, const std::vector<float>& embedding) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries[key] = {contentHash, embedding, m_clock()};
}

std::optional<std::vector<float>> EmbeddingCache::get(const std::string& key, const std::string& contentHash) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(key);
    if (it != m_entries.end() && it->second.hash == contentHash && !expired(it->second, m_clock())) {
        return it->second.vector;
    }
    return std::nullopt;
}

size_t EmbeddingCache::evictExpired() {
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto now = m_clock();
    size_t removed = 0;
    for (auto it = m_entries.begin(); it != m_entries.end();) {
        if (expired(it->second, now)) {
            it = m_entries.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t EmbeddingCache::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

bool EmbeddingCache::persist() const {
    if (m_cacheDir.empty()) return false;
    fs::path p = fs::path(m_cacheDir) / ".embeddings.json";

    json j = json::object();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [key, entry] : m_entries) {
            auto seconds = std::chrono::duration_cast<std::chrono::seconds>(entry.storedAt.time_since_epoch()).count();
            j[key] = { {"hash", entry.hash}, {"vector", entry.vector}, {"storedAt", seconds} };
        }
    }

    std::error_code ec;
    fs::create_directories(m_cacheDir, ec);
    std::ofstream ofs(p);
    if (!ofs.is_open()) {
        std::cerr << "[EmbeddingCache] Could not write " << p << std::endl;
        return false;
    }
    ofs << j.dump(4);
    return true;
}

void EmbeddingCache::load() {
    if (m_cacheDir.empty()) return;
    fs::path p = fs::path(m_cacheDir) / ".embeddings.json";
    if (!fs::exists(p)) return;

    try {
        std::ifstream f(p);
        if (!f.is_open()) return;

        json j = json::parse(f);
        std::lock_guard<std::mutex> lock(m_mutex);
        const auto now = m_clock();
        m_entries.clear();
        for (auto it = j.begin(); it != j.end(); ++it) {
            const auto& value = it.value();
            if (!value.contains("hash") || !value.contains("vector")) continue;

            CacheEntry entry;
            entry.hash = value["hash"].get<std::string>();
            entry.vector = value["vector"].get<std::vector<float>>();
            entry.storedAt = Clock::time_point(std::chrono::seconds(value.value("storedAt", static_cast<long long>(0))));
            if (expired(entry, now)) continue;
            m_entries[it.key()] = std::move(entry);
        }
    } catch (const std::exception& e) {
        std::cerr << "[EmbeddingCache] Error reading " << p << ": " << e.what() << std::endl;
    }
}

std::string EmbeddingCache::computeHash(const std::string& text) {
    return std::to_string(std::hash<std::string>{}(text));
}

} // namespace docweave::infrastructure
