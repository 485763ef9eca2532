#include <iostream>
#include <string>
#include <vector>
#include <atomic>
#include <memory>
#include <stdexcept>
#include <cassert>
#include "application/DocumentPipeline.hpp"
#include "domain/TextNormalizer.hpp"

using namespace docweave;

namespace {

domain::ParsedNode Node(const std::string& tag, const std::string& text,
                        std::map<std::string, std::string> attrs = {}) {
    domain::ParsedNode n;
    n.tag = tag;
    n.text = text;
    n.attributes = std::move(attrs);
    return n;
}

domain::ParsedNode CatalogTree() {
    domain::ParsedNode root;
    root.tag = "body";
    root.attributes["data-page"] = "1";
    root.children = {
        Node("h1", "Lounge Collection"),
        Node("p", "LOUNGE CHAIR 80 x 75 cm designed by Anna Berg, a generous seat in white oak wood "
                  "with a soft texture finish, part of the Nordic collection."),
        Node("img", "", {{"src", "lounge.jpg"}, {"data-caption", "Lounge chair in oak"}}),
        Node("p", "Care instructions: wipe with a damp cloth and avoid harsh detergents on the surface."),
    };
    return root;
}

} // namespace

// Mock tree provider returning a fixed tree.
class StaticTreeProvider : public domain::ParsedTreeProvider {
public:
    explicit StaticTreeProvider(domain::ParsedNode tree) : m_tree(std::move(tree)) {}
    int loads = 0;
    domain::ParsedNode loadTree() override {
        loads++;
        return m_tree;
    }
private:
    domain::ParsedNode m_tree;
};

class ThrowingTreeProvider : public domain::ParsedTreeProvider {
public:
    domain::ParsedNode loadTree() override {
        throw std::runtime_error("tree unavailable");
    }
};

// Mock repository recording what it was given.
class RecordingRepository : public domain::ResultRepository {
public:
    explicit RecordingRepository(bool accept) : m_accept(accept) {}
    int saves = 0;
    size_t lastChunkCount = 0;
    bool saveResult(const domain::DocumentResult& result) override {
        saves++;
        lastChunkCount = result.chunks.size();
        return m_accept;
    }
private:
    bool m_accept;
};

// Repository that only queues writes.
class QueueingRepository : public RecordingRepository {
public:
    QueueingRepository() : RecordingRepository(true) {}
    bool writesDeferred() const override { return true; }
};

// Two-dimensional embeddings: chair-related text on one axis, everything else on the other.
class TopicEmbeddingProvider : public domain::EmbeddingProvider {
public:
    std::optional<std::vector<float>> embedText(const std::string& text) override {
        if (domain::containsIgnoreCase(text, "chair")) return std::vector<float>{1.0f, 0.1f};
        return std::vector<float>{0.1f, 1.0f};
    }
    std::optional<std::vector<float>> embedImage(const domain::ImageAsset&) override {
        return std::vector<float>{1.0f, 0.0f};
    }
    std::string modelName() const override { return "topic"; }
};

class FailingEmbeddingProvider : public domain::EmbeddingProvider {
public:
    std::optional<std::vector<float>> embedText(const std::string&) override {
        throw std::runtime_error("embedding backend down");
    }
    std::optional<std::vector<float>> embedImage(const domain::ImageAsset&) override {
        throw std::runtime_error("embedding backend down");
    }
    std::string modelName() const override { return "down"; }
};

int main() {
    using application::DocumentPipeline;

    std::cout << "[Test] Full run stores the result..." << std::endl;
    {
        auto repository = std::make_shared<RecordingRepository>(true);
        DocumentPipeline pipeline(application::PipelineConfig{}, nullptr, repository);
        StaticTreeProvider provider(CatalogTree());
        auto result = pipeline.run("doc", provider);

        assert(result.stages.size() == 6);
        assert(result.complete());
        assert(result.elementCount == 4 && result.imageCount == 1 && result.pageCount == 1);
        assert(!result.chunks.empty() && result.chunks[0].id == "doc_chunk_0");
        assert(repository->saves == 1 && repository->lastChunkCount == result.chunks.size());

        bool foundCatalog = false;
        for (const auto& c : result.candidates) {
            if (c.contentType() == domain::ContentType::CatalogEntry) foundCatalog = true;
        }
        assert(foundCatalog);
        assert(result.associations.size() == 1);
        assert(result.associations[0].imageId == "img_0");
        assert(result.associations[0].targetKind == domain::TargetKind::Entity);
        assert(result.quality.layoutConfidence && result.quality.chunkingQuality && result.quality.associationConfidence);
        assert(result.quality.overall > 0.0 && result.quality.overall <= 1.0);
        assert(pipeline.layout().title() == "Lounge Collection");
        assert(result.stage(DocumentPipeline::kStagePersistence)->message == "saved");
        assert(result.clusters.empty());
    }
    std::cout << "[PASS] Full run." << std::endl;

    std::cout << "[Test] Queued writes are reported as queued..." << std::endl;
    {
        auto repository = std::make_shared<QueueingRepository>();
        DocumentPipeline pipeline(application::PipelineConfig{}, nullptr, repository);
        StaticTreeProvider provider(CatalogTree());
        auto result = pipeline.run("doc", provider);
        const auto* persistence = result.stage(DocumentPipeline::kStagePersistence);
        assert(persistence && persistence->state == domain::StageState::Succeeded);
        assert(persistence->message == "queued");
        assert(repository->saves == 1);
    }
    std::cout << "[PASS] Queued writes." << std::endl;

    std::cout << "[Test] Embedded units are clustered..." << std::endl;
    {
        application::EmbeddingService embeddings(std::make_shared<TopicEmbeddingProvider>(), nullptr, 2);
        DocumentPipeline pipeline(application::PipelineConfig{}, &embeddings);
        StaticTreeProvider provider(CatalogTree());
        auto result = pipeline.run("doc", provider);

        assert(result.stage(DocumentPipeline::kStageBoundaries)->state == domain::StageState::Succeeded);
        assert(result.clusters.size() == 2);
        size_t members = 0;
        for (const auto& c : result.clusters) {
            assert(c.size == c.unitIds.size());
            assert(c.coherence > 0.0 && c.coherence <= 1.0 + 1e-6);
            assert(!c.entityCluster);
            members += c.size;
        }
        assert(members == 3);
    }
    std::cout << "[PASS] Clustering." << std::endl;

    std::cout << "[Test] Layout failure skips the rest..." << std::endl;
    {
        auto repository = std::make_shared<RecordingRepository>(true);
        DocumentPipeline pipeline(application::PipelineConfig{}, nullptr, repository);
        ThrowingTreeProvider provider;
        auto result = pipeline.run("broken", provider);

        assert(!result.complete());
        const auto* layout = result.stage(DocumentPipeline::kStageLayout);
        assert(layout && layout->state == domain::StageState::Failed && layout->message == "tree unavailable");
        const auto* chunking = result.stage(DocumentPipeline::kStageChunking);
        assert(chunking && chunking->state == domain::StageState::Skipped);
        assert(repository->saves == 0);
        assert(!result.quality.layoutConfidence && result.quality.overall == 0.0);
        assert(result.chunks.empty() && result.associations.empty());
    }
    std::cout << "[PASS] Layout failure." << std::endl;

    std::cout << "[Test] Persistence failure keeps computed outputs..." << std::endl;
    {
        auto repository = std::make_shared<RecordingRepository>(false);
        DocumentPipeline pipeline(application::PipelineConfig{}, nullptr, repository);
        StaticTreeProvider provider(CatalogTree());
        auto result = pipeline.run("doc", provider);

        assert(!result.complete());
        assert(result.stage(DocumentPipeline::kStagePersistence)->state == domain::StageState::Failed);
        assert(result.stage(DocumentPipeline::kStageChunking)->state == domain::StageState::Succeeded);
        assert(!result.chunks.empty() && !result.associations.empty());
    }
    std::cout << "[PASS] Persistence failure." << std::endl;

    std::cout << "[Test] Embedding outage degrades to estimates..." << std::endl;
    {
        application::EmbeddingService embeddings(std::make_shared<FailingEmbeddingProvider>(), nullptr, 2);
        DocumentPipeline pipeline(application::PipelineConfig{}, &embeddings);
        StaticTreeProvider provider(CatalogTree());
        auto result = pipeline.run("doc", provider);

        assert(result.complete());
        assert(result.stages.size() == 5);
        assert(!result.stage(DocumentPipeline::kStagePersistence));
        assert(embeddings.failureCount() > 0);
        assert(!result.boundaries.empty());
        for (const auto& b : result.boundaries) assert(b.similarityEstimated);
        assert(result.clusters.empty());
        assert(result.associations.size() == 1);
    }
    std::cout << "[PASS] Embedding outage." << std::endl;

    std::cout << "[Test] Chunk targets when requested..." << std::endl;
    {
        application::PipelineConfig config;
        config.association.target = application::AssociationTargetMode::Chunks;
        config.association.overallThreshold = 0.4;
        DocumentPipeline pipeline(config);
        StaticTreeProvider provider(CatalogTree());
        auto result = pipeline.run("doc", provider);
        assert(!result.associations.empty());
        for (const auto& a : result.associations) assert(a.targetKind == domain::TargetKind::Chunk);
    }
    std::cout << "[PASS] Chunk targets." << std::endl;

    std::cout << "[Test] Cancellation skips every stage..." << std::endl;
    {
        std::atomic<bool> cancel{true};
        DocumentPipeline pipeline(application::PipelineConfig{});
        StaticTreeProvider provider(CatalogTree());
        auto result = pipeline.run("doc", provider, &cancel);
        assert(provider.loads == 0);
        assert(result.stages.size() == 6);
        for (const auto& s : result.stages) {
            assert(s.state == domain::StageState::Skipped && s.message == "cancelled");
        }
        assert(!result.complete());
    }
    std::cout << "[PASS] Cancellation." << std::endl;

    std::cout << "[Test] Empty tree gives an empty valid result..." << std::endl;
    {
        DocumentPipeline pipeline(application::PipelineConfig{});
        StaticTreeProvider provider{domain::ParsedNode{}};
        auto result = pipeline.run("empty", provider);
        assert(result.complete());
        assert(result.elementCount == 0 && result.chunks.empty() && result.associations.empty());
        assert(result.quality.chunkingQuality && *result.quality.chunkingQuality == 0.0);
        assert(result.quality.associationConfidence && *result.quality.associationConfidence == 0.8);
    }
    assert(DocumentPipeline::chunkSizeQuality({}) == 0.0);
    std::cout << "[PASS] Empty tree." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
