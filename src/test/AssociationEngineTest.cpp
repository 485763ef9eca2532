#include <iostream>
#include <string>
#include <vector>
#include <map>
#include <algorithm>
#include <utility>
#include <cmath>
#include <cassert>
#include "application/AssociationEngine.hpp"

using namespace docweave;

namespace {

bool near(double a, double b, double eps = 1e-6) {
    return std::fabs(a - b) < eps;
}

domain::ImageAsset Image(const std::string& id, int page, std::vector<float> embedding = {}) {
    domain::ImageAsset img;
    img.id = id;
    img.pageNumber = page;
    img.embedding = std::move(embedding);
    return img;
}

domain::AssociationTarget Target(const std::string& id, int page, std::vector<float> embedding = {}) {
    domain::AssociationTarget t;
    t.id = id;
    t.pageNumber = page;
    t.embedding = std::move(embedding);
    return t;
}

std::vector<std::pair<std::string, std::string>> Pairs(const application::AssociationOutcome& outcome) {
    std::vector<std::pair<std::string, std::string>> out;
    for (const auto& a : outcome.associations) out.emplace_back(a.imageId, a.targetId);
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace

int main() {
    std::cout << "[Test] Spatial score bands..." << std::endl;
    assert(application::AssociationEngine::spatialScore(0) == 1.0);
    assert(application::AssociationEngine::spatialScore(1) == 0.8);
    assert(application::AssociationEngine::spatialScore(-2) == 0.6);
    assert(application::AssociationEngine::spatialScore(3) == 0.4);
    assert(near(application::AssociationEngine::spatialScore(4), 0.5));
    assert(near(application::AssociationEngine::spatialScore(30), 0.1));
    std::cout << "[PASS] Spatial." << std::endl;

    std::cout << "[Test] Lexical and visual scores..." << std::endl;
    domain::AssociationTarget chair = Target("ent_tu_1", 2);
    chair.name = "LOUNGE CHAIR";
    chair.description = "LOUNGE CHAIR in solid oak with woven seat";
    double lexical = application::AssociationEngine::lexicalScore("Lounge chair in oak", chair);
    assert(near(lexical, 3.0 / 7.0 + 0.3));
    assert(application::AssociationEngine::lexicalScore("", chair) == 0.0);

    domain::ImageAsset captioned = Image("img_0", 2);
    captioned.caption = "Lounge chair in oak";
    assert(near(application::AssociationEngine::visualScore(captioned, chair, lexical), lexical));
    assert(application::AssociationEngine::visualScore(Image("img_1", 2), Target("t", 2), 0.0) == 0.5);
    assert(application::AssociationEngine::visualScore(Image("img_1", 2, {1, 0}), Target("t", 2, {-1, 0}), 0.0) == 0.0);
    std::cout << "[PASS] Lexical and visual." << std::endl;

    std::cout << "[Test] Pair scoring..." << std::endl;
    application::AssociationEngine engine;
    auto pair = engine.scorePair(Image("img_0", 1, {1, 0}), Target("t0", 1, {1, 0}));
    assert(near(pair.overallScore, 0.7));
    assert(near(pair.confidence, 0.7 + (0.3 - 6.0 / 27.0)));
    assert(pair.pageDifference == 0);
    assert(pair.reasoning == "Good association (same/adjacent page, high visual-text similarity)");
    std::cout << "[PASS] Pair scoring." << std::endl;

    std::cout << "[Test] Fan-out caps..." << std::endl;
    application::AssociationConfig capped;
    capped.maxPerImage = 3;
    capped.maxPerEntity = 2;
    application::AssociationEngine cappedEngine(capped);

    std::vector<domain::ImageAsset> images;
    for (int i = 0; i < 5; ++i) images.push_back(Image("img_" + std::to_string(i), 1, {1, 0}));
    std::vector<domain::AssociationTarget> targets;
    for (int i = 0; i < 6; ++i) targets.push_back(Target("t" + std::to_string(i), 1, {1, 0}));

    auto outcome = cappedEngine.associate(images, targets);
    std::map<std::string, int> perImage, perTarget;
    for (const auto& a : outcome.associations) {
        perImage[a.imageId]++;
        perTarget[a.targetId]++;
    }
    for (const auto& [id, n] : perImage) assert(n <= 3);
    for (const auto& [id, n] : perTarget) assert(n <= 2);
    assert(outcome.associations.size() == 12);
    assert(outcome.stats.pairsEvaluated == 30);
    assert(outcome.stats.pairsAboveThreshold == 30);
    assert(outcome.stats.associationsAssigned == 12);
    assert(outcome.stats.good == 12 && outcome.stats.high == 0);
    assert(near(outcome.stats.averageConfidence, pair.confidence));
    std::cout << "[PASS] Fan-out caps." << std::endl;

    std::cout << "[Test] Assignment is independent of input order..." << std::endl;
    auto reversedImages = images;
    auto reversedTargets = targets;
    std::reverse(reversedImages.begin(), reversedImages.end());
    std::reverse(reversedTargets.begin(), reversedTargets.end());
    auto again = cappedEngine.associate(reversedImages, reversedTargets);
    assert(Pairs(again) == Pairs(outcome));
    assert(Pairs(cappedEngine.associate(images, targets)) == Pairs(outcome));
    std::cout << "[PASS] Determinism." << std::endl;

    std::cout << "[Test] Thresholds filter weak pairs..." << std::endl;
    auto distant = engine.associate({Image("img_far", 10)}, {Target("t_near", 1)});
    assert(distant.associations.empty());
    assert(distant.stats.pairsEvaluated == 1 && distant.stats.pairsAboveThreshold == 0);
    assert(distant.stats.averageConfidence == 0.0);

    application::AssociationConfig strict;
    strict.minLexical = 0.1;
    application::AssociationEngine strictEngine(strict);
    assert(strictEngine.associate(images, targets).associations.empty());
    assert(engine.associate({}, targets).associations.empty());
    std::cout << "[PASS] Thresholds." << std::endl;

    std::cout << "[Test] Target conversion..." << std::endl;
    domain::EntityCandidate candidate;
    candidate.id = "ent_tu_4";
    candidate.text = "ATLAS table 120 x 80 cm";
    candidate.pageNumber = 5;
    domain::CatalogEntryData data;
    data.name = "ATLAS";
    candidate.payload = data;
    auto entityTarget = application::AssociationEngine::toTarget(candidate, {0.5f, 0.5f});
    assert(entityTarget.kind == domain::TargetKind::Entity && entityTarget.name == "ATLAS");
    assert(entityTarget.pageNumber == 5 && entityTarget.embedding.size() == 2);

    domain::Chunk chunk;
    chunk.id = "doc_chunk_3";
    chunk.text = "Some chunk text";
    chunk.pageNumber = 4;
    auto chunkTarget = application::AssociationEngine::toTarget(chunk);
    assert(chunkTarget.kind == domain::TargetKind::Chunk && chunkTarget.name.empty());
    assert(chunkTarget.description == "Some chunk text");
    std::cout << "[PASS] Target conversion." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
