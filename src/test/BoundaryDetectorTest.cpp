#include <iostream>
#include <string>
#include <vector>
#include <cmath>
#include <cassert>
#include "application/BoundaryDetector.hpp"

using namespace docweave;

namespace {

domain::TextUnit Unit(const std::string& id, const std::string& text, std::vector<float> embedding = {}) {
    domain::TextUnit u;
    u.id = id;
    u.elementId = "el_" + id;
    u.text = text;
    u.embedding = std::move(embedding);
    return u;
}

bool near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

} // namespace

int main() {
    application::BoundaryDetector detector;

    std::cout << "[Test] Reference boundary examples..." << std::endl;
    double sentence = detector.strength("This is a complete sentence.");
    assert(near(sentence, 0.7) && sentence > 0.6);
    assert(detector.classify("This is a complete sentence.", sentence, 1.0) == domain::BoundaryType::Sentence);

    double heading = detector.strength("## Section Title");
    assert(heading > 0.2);
    assert(detector.classify("## Section Title", heading, 1.0) == domain::BoundaryType::Section);

    double fragment = detector.strength("an incomplete wor");
    assert(fragment < 0.3);
    assert(detector.classify("an incomplete wor", fragment, 1.0) == domain::BoundaryType::Weak);
    std::cout << "[PASS] Reference examples." << std::endl;

    std::cout << "[Test] Markers add up..." << std::endl;
    assert(detector.strengthHundredths("First paragraph ends here.\n") == 90);
    assert(detector.classify("First paragraph ends here.\n", 0.9, 1.0) == domain::BoundaryType::Paragraph);
    assert(detector.strengthHundredths("Colors, finishes;") == 45);
    assert(detector.strengthHundredths("MATERIALS") == 30);
    assert(detector.isHeadingLine("MATERIALS AND FINISHES"));
    assert(!detector.isHeadingLine("Materials and finishes"));
    assert(!detector.isHeadingLine(std::string(80, 'A')));
    assert(detector.strengthHundredths("   ") == 0);
    assert(detector.classify("Closing words", 0.45, 0.2) == domain::BoundaryType::Semantic);
    std::cout << "[PASS] Markers." << std::endl;

    std::cout << "[Test] Entity boundaries need a strong marker and a topic change..." << std::endl;
    auto change = detector.scorePair(Unit("tu_0", "This is a complete sentence.", {1, 0}), Unit("tu_1", "Next", {0, 1}));
    assert(change.entityBoundary && !change.similarityEstimated);
    assert(change.unitId == "tu_0" && change.nextUnitId == "tu_1" && change.elementId == "el_tu_0");
    assert(change.reasoning == "Moderate boundary marker; Low semantic similarity to next unit");

    auto same = detector.scorePair(Unit("tu_0", "This is a complete sentence.", {1, 0}), Unit("tu_1", "Next", {1, 0}));
    assert(!same.entityBoundary);
    assert(same.reasoning == "Moderate boundary marker; High semantic similarity to next unit");
    std::cout << "[PASS] Entity boundaries." << std::endl;

    std::cout << "[Test] Missing embeddings fall back to an estimate..." << std::endl;
    auto sim = application::BoundaryDetector::similarity(Unit("a", "Oak chair."), Unit("b", "Oak table."));
    assert(sim.estimated && near(sim.value, 1.0));
    auto mixed = application::BoundaryDetector::similarity(Unit("a", "Oak chair.", {1, 0}), Unit("b", "Glass lamp shade"));
    assert(mixed.estimated && near(mixed.value, 0.5 * 10.0 / 16.0));
    auto estimated = detector.scorePair(Unit("a", "Oak chair."), Unit("b", "Oak table."));
    assert(estimated.similarityEstimated);
    assert(estimated.reasoning.find("(estimated)") != std::string::npos);
    std::cout << "[PASS] Fallback similarity." << std::endl;

    std::cout << "[Test] Score invariants over a mixed document..." << std::endl;
    std::vector<domain::TextUnit> units{
        Unit("tu_0", "CATALOG 2024\n"),
        Unit("tu_1", "The collection, in short:", {0.2f, 0.9f}),
        Unit("tu_2", "Porcelain tiles for floors and walls.", {0.9f, 0.1f}),
        Unit("tu_3", "## Dimensions"),
        Unit("tu_4", "60 x 60 cm, 120 x 60 cm", {0.5f, 0.5f}),
        Unit("tu_5", "and also wor"),
    };
    auto scores = detector.score(units);
    assert(scores.size() == units.size() - 1);
    for (const auto& s : scores) {
        assert(s.strength >= 0.0 && s.strength <= 1.0);
        if (s.entityBoundary) assert(s.strength > 0.6 && s.semanticSimilarity < 0.6);
    }
    assert(detector.score({}).empty());
    assert(detector.score({units[0]}).empty());
    std::cout << "[PASS] Invariants." << std::endl;

    std::cout << "[Test] Clustering groups related units..." << std::endl;
    std::vector<domain::TextUnit> clustered{
        Unit("a1", "x", {1.0f, 0.0f}),
        Unit("a2", "x", {0.9f, 0.1f}),
        Unit("a3", "x", {1.0f, 0.05f}),
        Unit("b1", "x", {0.0f, 1.0f}),
        Unit("b2", "x", {0.1f, 0.9f}),
        Unit("b3", "x", {0.05f, 1.0f}),
        Unit("none", "x"),
    };
    auto groups = detector.cluster(clustered, 2);
    assert(groups.size() == 2);
    for (const auto& g : groups) {
        assert(g.size == 3 && g.entityCluster);
        assert(g.coherence > 0.9);
        char family = g.unitIds.front()[0];
        for (const auto& id : g.unitIds) assert(id[0] == family);
    }
    assert(detector.cluster(clustered, 2).front().unitIds == groups.front().unitIds);
    assert(detector.cluster({Unit("solo", "x", {1, 0})}).empty());
    std::cout << "[PASS] Clustering." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
