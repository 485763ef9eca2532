#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <filesystem>
#include <stdexcept>
#include <cassert>
#include <nlohmann/json.hpp>
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/FileSystemArtifactScanner.hpp"
#include "infrastructure/JsonResultRepository.hpp"
#include "infrastructure/JsonTreeProvider.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace docweave;

namespace {

void WriteFile(const fs::path& path, const std::string& content) {
    std::ofstream f(path);
    f << content;
}

std::string ReadFile(const fs::path& path) {
    std::ifstream f(path);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

} // namespace

int main() {
    const fs::path root = "test_infrastructure_root";
    fs::remove_all(root);
    fs::create_directories(root / "inbox");
    fs::create_directories(root / "out");

    std::cout << "[Test] Config loading..." << std::endl;
    {
        auto defaults = infrastructure::ConfigLoader::Load((root / "absent.json").string());
        assert(defaults.chunking.targetSize == 1000 && defaults.association.maxPerImage == 3);

        WriteFile(root / "settings.json", R"({
            "chunking": {"targetSize": 500, "overlap": 0},
            "association": {"target": "chunks", "maxPerImage": 2},
            "embedding": {"enabled": true, "model": "mxbai-embed-large"},
            "batch": {"workers": 4},
            "ui": {"theme": "dark"}
        })");
        auto loaded = infrastructure::ConfigLoader::Load((root / "settings.json").string());
        assert(loaded.chunking.targetSize == 500 && loaded.chunking.overlap == 0);
        assert(loaded.chunking.maxSize == 2000);
        assert(loaded.association.target == application::AssociationTargetMode::Chunks);
        assert(loaded.association.maxPerImage == 2);
        assert(loaded.embedding.enabled && loaded.embedding.model == "mxbai-embed-large");
        assert(loaded.embedding.port == 11434);
        assert(loaded.batch.workers == 4);

        loaded.classifier.qualityFloor = 0.4;
        assert(infrastructure::ConfigLoader::Save((root / "settings.json").string(), loaded));
        auto saved = json::parse(ReadFile(root / "settings.json"));
        assert(saved["ui"]["theme"] == "dark");
        auto reloaded = infrastructure::ConfigLoader::Load((root / "settings.json").string());
        assert(reloaded.classifier.qualityFloor == 0.4 && reloaded.chunking.targetSize == 500);

        WriteFile(root / "broken.json", "{ not json");
        auto fallback = infrastructure::ConfigLoader::Load((root / "broken.json").string());
        assert(fallback.chunking.targetSize == 1000 && !fallback.embedding.enabled);
    }
    std::cout << "[PASS] Config." << std::endl;

    std::cout << "[Test] Tree parsing..." << std::endl;
    {
        auto tree = infrastructure::JsonTreeProvider::parseTree(R"({
            "tag": "body",
            "children": [
                {"tag": "h1", "text": "Catalog", "attributes": {"data-page": 1}},
                {"tag": "img", "class": "image photo", "attributes": {"src": "a.jpg"}, "embedding": [0.5, 0.25]}
            ]
        })");
        assert(tree.tag == "body" && tree.children.size() == 2);
        assert(tree.children[0].attribute("data-page") == std::optional<std::string>("1"));
        assert(tree.children[1].className == "image photo");
        assert(tree.children[1].embedding.size() == 2 && tree.children[1].embedding[1] == 0.25f);

        bool threw = false;
        try {
            infrastructure::JsonTreeProvider::parseTree("[1, 2");
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);

        threw = false;
        try {
            infrastructure::JsonTreeProvider((root / "missing.json").string()).loadTree();
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);

        WriteFile(root / "inbox" / "catalog.json", R"({"tag": "p", "text": "Hello"})");
        auto fromFile = infrastructure::JsonTreeProvider((root / "inbox" / "catalog.json").string()).loadTree();
        assert(fromFile.text == "Hello");
    }
    std::cout << "[PASS] Tree parsing." << std::endl;

    std::cout << "[Test] Inbox scanning..." << std::endl;
    {
        WriteFile(root / "inbox" / "brochure.json", "{}");
        WriteFile(root / "inbox" / "settings.json", "{}");
        WriteFile(root / "inbox" / "old.result.json", "{}");
        WriteFile(root / "inbox" / ".hidden.json", "{}");
        WriteFile(root / "inbox" / "notes.txt", "text");

        infrastructure::FileSystemArtifactScanner scanner((root / "inbox").string());
        auto artifacts = scanner.scan();
        assert(artifacts.size() == 2);
        assert(artifacts[0].filename == "brochure.json" && artifacts[1].documentId == "catalog");
        assert(artifacts[0].format == domain::SourceFormat::ParsedTreeJson);
        assert(!artifacts[0].contentHash.empty() && artifacts[0].sizeBytes == 2);

        infrastructure::FileSystemArtifactScanner nowhere((root / "nope").string());
        assert(nowhere.scan().empty());
    }
    std::cout << "[PASS] Scanning." << std::endl;

    std::cout << "[Test] Result repository writes through persistence..." << std::endl;
    {
        infrastructure::PersistenceService persistence;
        infrastructure::JsonResultRepository repository((root / "out").string(), persistence);

        domain::DocumentResult result;
        result.documentId = "catalog";
        result.pageCount = 2;
        result.stages.push_back({"layout", domain::StageState::Succeeded, ""});
        result.stages.push_back({"association", domain::StageState::Failed, "boom"});
        result.quality.layoutConfidence = 0.8;
        result.quality.overall = 0.4;

        domain::Chunk chunk;
        chunk.id = "catalog_chunk_0";
        chunk.text = "Hello";
        chunk.semanticTags = {"paragraph"};
        result.chunks.push_back(chunk);

        domain::EntityCandidate candidate;
        candidate.id = "ent_tu_0";
        domain::CatalogEntryData data;
        data.name = "ATLAS";
        candidate.payload = data;
        result.candidates.push_back(candidate);

        domain::UnitCluster cluster;
        cluster.id = 0;
        cluster.unitIds = {"tu_0", "tu_1", "tu_2"};
        cluster.size = 3;
        cluster.coherence = 0.9;
        cluster.entityCluster = true;
        result.clusters.push_back(cluster);

        assert(repository.writesDeferred());
        assert(repository.saveResult(result));
        persistence.flush();
        assert(persistence.writtenCount() == 1 && persistence.failedCount() == 0);

        const fs::path written = repository.resultPath("catalog");
        assert(written == root / "out" / "catalog.result.json");
        auto j = json::parse(ReadFile(written));
        assert(j["documentId"] == "catalog" && j["complete"] == false);
        assert(j["stages"].size() == 2 && j["stages"][1]["state"] == "failed");
        assert(j["quality"]["chunkingQuality"].is_null());
        assert(j["chunks"][0]["id"] == "catalog_chunk_0");
        assert(j["candidates"][0]["contentType"] == "catalog_entry");
        assert(j["candidates"][0]["fields"]["name"] == "ATLAS");
        assert(j["clusters"].size() == 1);
        assert(j["clusters"][0]["unitIds"].size() == 3 && j["clusters"][0]["entityCluster"] == true);
        assert(j["clusters"][0]["size"] == 3);

        domain::DocumentResult anonymous;
        assert(!repository.saveResult(anonymous));

        persistence.stop();
        assert(!persistence.saveTextAsync((root / "out" / "late.txt").string(), "late"));
    }
    std::cout << "[PASS] Result repository." << std::endl;

    fs::remove_all(root);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
