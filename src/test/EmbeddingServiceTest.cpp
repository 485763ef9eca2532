#include <iostream>
#include <string>
#include <vector>
#include <atomic>
#include <filesystem>
#include <stdexcept>
#include <cassert>
#include "application/EmbeddingService.hpp"
#include "infrastructure/EmbeddingCache.hpp"

using namespace docweave;

// Mock provider: embeds text as [length, 1] and counts calls.
class CountingProvider : public domain::EmbeddingProvider {
public:
    std::atomic<int> textCalls{0};
    std::atomic<int> imageCalls{0};

    std::optional<std::vector<float>> embedText(const std::string& text) override {
        textCalls++;
        return std::vector<float>{static_cast<float>(text.size()), 1.0f};
    }

    std::optional<std::vector<float>> embedImage(const domain::ImageAsset& image) override {
        imageCalls++;
        if (image.describingText().empty()) return std::nullopt;
        return std::vector<float>{0.0f, 1.0f};
    }

    std::string modelName() const override { return "mock-model"; }
};

class FailingProvider : public domain::EmbeddingProvider {
public:
    std::optional<std::vector<float>> embedText(const std::string&) override {
        throw std::runtime_error("connection refused");
    }
    std::optional<std::vector<float>> embedImage(const domain::ImageAsset&) override {
        throw std::runtime_error("connection refused");
    }
    std::string modelName() const override { return "failing-model"; }
};

int main() {
    using Clock = infrastructure::EmbeddingCache::Clock;
    Clock::time_point now = Clock::time_point(std::chrono::seconds(1000000));
    auto clock = [&now]() { return now; };

    std::cout << "[Test] Cache honours hash and TTL..." << std::endl;
    {
        infrastructure::EmbeddingCache cache("", std::chrono::seconds(3600), clock);
        cache.update("k", "h1", {1.0f, 2.0f});
        auto hit = cache.get("k", "h1");
        assert(hit && hit->size() == 2 && (*hit)[1] == 2.0f);
        assert(!cache.get("k", "h2"));
        assert(!cache.get("missing", "h1"));

        now += std::chrono::seconds(3600);
        assert(cache.get("k", "h1"));
        now += std::chrono::seconds(1);
        assert(!cache.get("k", "h1"));
        assert(cache.size() == 1);
        assert(cache.evictExpired() == 1);
        assert(cache.size() == 0);
        assert(!cache.persist());
    }
    std::cout << "[PASS] TTL." << std::endl;

    std::cout << "[Test] Cache persists and drops stale entries on load..." << std::endl;
    {
        const std::string dir = "test_embedding_cache";
        std::filesystem::remove_all(dir);
        now = Clock::time_point(std::chrono::seconds(2000000));
        infrastructure::EmbeddingCache writer(dir, std::chrono::seconds(3600), clock);
        writer.update("old", "h", {1.0f});
        now += std::chrono::seconds(100);
        writer.update("fresh", "h", {2.0f});
        assert(writer.persist());
        assert(std::filesystem::exists(std::filesystem::path(dir) / ".embeddings.json"));

        now += std::chrono::seconds(3550);
        infrastructure::EmbeddingCache reader(dir, std::chrono::seconds(3600), clock);
        reader.load();
        assert(reader.size() == 1);
        assert(!reader.get("old", "h"));
        auto fresh = reader.get("fresh", "h");
        assert(fresh && (*fresh)[0] == 2.0f);
        std::filesystem::remove_all(dir);
    }
    assert(infrastructure::EmbeddingCache::computeHash("abc") == infrastructure::EmbeddingCache::computeHash("abc"));
    assert(infrastructure::EmbeddingCache::computeHash("abc") != infrastructure::EmbeddingCache::computeHash("abd"));
    std::cout << "[PASS] Persistence." << std::endl;

    std::cout << "[Test] Service reuses cached embeddings..." << std::endl;
    {
        now = Clock::time_point(std::chrono::seconds(3000000));
        infrastructure::EmbeddingCache cache("", std::chrono::seconds(3600), clock);
        auto provider = std::make_shared<CountingProvider>();
        application::EmbeddingService service(provider, &cache, 4);

        auto first = service.embedText("oak chair");
        auto second = service.embedText("oak chair");
        assert(first && second && *first == *second);
        assert(provider->textCalls == 1);
        assert(service.cacheHits() == 1 && service.providerCalls() == 1);
        assert(!service.embedText(""));
    }
    std::cout << "[PASS] Cache reuse." << std::endl;

    std::cout << "[Test] Parallel fan-out fills missing embeddings only..." << std::endl;
    {
        auto provider = std::make_shared<CountingProvider>();
        application::EmbeddingService service(provider, nullptr, 4);

        std::vector<domain::TextUnit> units(20);
        for (size_t i = 0; i < units.size(); ++i) {
            units[i].id = "tu_" + std::to_string(i);
            units[i].text = std::string(i + 1, 'a');
        }
        units[3].embedding = {9.0f, 9.0f};

        assert(service.embedUnits(units) == 19);
        assert(provider->textCalls == 19);
        for (size_t i = 0; i < units.size(); ++i) {
            assert(units[i].hasEmbedding());
            if (i != 3) assert(units[i].embedding[0] == static_cast<float>(i + 1));
        }
        assert(units[3].embedding[0] == 9.0f);

        std::vector<domain::ImageAsset> images(2);
        images[0].id = "img_0";
        images[0].caption = "Oak chair";
        images[1].id = "img_1";
        assert(service.embedImages(images) == 1);
        assert(!images[0].embedding.empty() && images[1].embedding.empty());
    }
    std::cout << "[PASS] Fan-out." << std::endl;

    std::cout << "[Test] Provider failures degrade to missing embeddings..." << std::endl;
    {
        application::EmbeddingService service(std::make_shared<FailingProvider>(), nullptr, 2);
        assert(!service.embedText("anything"));
        std::vector<domain::Chunk> chunks(3);
        for (auto& c : chunks) c.text = "chunk text";
        assert(service.embedChunks(chunks) == 0);
        for (const auto& c : chunks) assert(c.embedding.empty());
        assert(service.failureCount() == 4);
    }
    std::cout << "[PASS] Failures." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
