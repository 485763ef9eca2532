/**
 * @file AssociationEngine.cpp
 * @brief Implementation of AssociationEngine.
 */

#include "application/AssociationEngine.hpp"
#include "domain/TextNormalizer.hpp"
#include "domain/VectorMath.hpp"
#include <algorithm>
#include <cstdlib>
#include <map>

namespace docweave::application {

AssociationEngine::AssociationEngine(AssociationConfig config)
    : m_config(config) {}

double AssociationEngine::spatialScore(int pageDifference) {
    const int d = std::abs(pageDifference);
    if (d == 0) return 1.0;
    if (d == 1) return 0.8;
    if (d <= 2) return 0.6;
    if (d <= 3) return 0.4;
    return std::max(0.1, 1.0 / (d * 0.5));
}

double AssociationEngine::lexicalScore(const std::string& imageText, const domain::AssociationTarget& target) {
    const std::string& targetText = target.description.empty() ? target.name : target.description;
    if (domain::trim(imageText).empty() || domain::trim(targetText).empty()) return 0.0;

    double score = domain::jaccard(domain::wordSet(imageText), domain::wordSet(targetText));
    if (!target.name.empty() && domain::containsIgnoreCase(imageText, target.name)) {
        score = std::min(1.0, score + 0.3);
    }
    return score;
}

double AssociationEngine::visualScore(const domain::ImageAsset& image, const domain::AssociationTarget& target, double lexical) {
    if (!image.embedding.empty() && !target.embedding.empty()) {
        return std::max(0.0, static_cast<double>(domain::cosineSimilarity(image.embedding, target.embedding)));
    }
    const bool imageHasText = !domain::trim(image.describingText()).empty();
    const bool targetHasText = !domain::trim(target.description).empty() || !domain::trim(target.name).empty();
    if (imageHasText && targetHasText) return lexical;
    return 0.5;
}

std::string AssociationEngine::reasoning(double spatial, double lexical, double visual, double overall) {
    std::vector<std::string> reasons;
    if (spatial >= 0.8) {
        reasons.push_back("same/adjacent page");
    } else if (spatial >= 0.6) {
        reasons.push_back("nearby pages");
    } else if (spatial >= 0.4) {
        reasons.push_back("moderate spatial proximity");
    }

    if (lexical >= 0.7) {
        reasons.push_back("strong text similarity");
    } else if (lexical >= 0.5) {
        reasons.push_back("moderate text similarity");
    } else if (lexical >= 0.3) {
        reasons.push_back("some text overlap");
    }

    if (visual >= 0.7) {
        reasons.push_back("high visual-text similarity");
    } else if (visual >= 0.5) {
        reasons.push_back("moderate visual relevance");
    }

    std::string out;
    if (overall >= 0.8) {
        out = "Strong association";
    } else if (overall >= 0.6) {
        out = "Good association";
    } else if (overall >= 0.4) {
        out = "Moderate association";
    } else {
        out = "Weak association";
    }

    if (!reasons.empty()) {
        out += " (";
        for (size_t i = 0; i < reasons.size(); ++i) {
            if (i > 0) out += ", ";
            out += reasons[i];
        }
        out += ")";
    }
    return out;
}

domain::Association AssociationEngine::scorePair(const domain::ImageAsset& image, const domain::AssociationTarget& target) const {
    domain::Association a;
    a.imageId = image.id;
    a.targetId = target.id;
    a.targetKind = target.kind;
    a.pageDifference = std::abs(image.pageNumber - target.pageNumber);

    a.spatialScore = spatialScore(a.pageDifference);
    a.lexicalScore = lexicalScore(image.describingText(), target);
    a.visualScore = visualScore(image, target, a.lexicalScore);
    a.overallScore = m_config.spatialWeight * a.spatialScore +
                     m_config.lexicalWeight * a.lexicalScore +
                     m_config.visualWeight * a.visualScore;

    const double spread = domain::variance({a.spatialScore, a.lexicalScore, a.visualScore});
    a.confidence = std::min(1.0, a.overallScore + std::max(0.0, 0.3 - spread));
    a.reasoning = reasoning(a.spatialScore, a.lexicalScore, a.visualScore, a.overallScore);
    return a;
}

bool AssociationEngine::passesFactorMinimums(const domain::Association& a) const {
    if (m_config.minSpatial > 0 && a.spatialScore < m_config.minSpatial) return false;
    if (m_config.minLexical > 0 && a.lexicalScore < m_config.minLexical) return false;
    if (m_config.minVisual > 0 && a.visualScore < m_config.minVisual) return false;
    return true;
}

AssociationOutcome AssociationEngine::associate(const std::vector<domain::ImageAsset>& images,
                                                const std::vector<domain::AssociationTarget>& targets) const {
    AssociationOutcome outcome;
    std::vector<domain::Association> candidates;

    for (const auto& image : images) {
        for (const auto& target : targets) {
            auto a = scorePair(image, target);
            ++outcome.stats.pairsEvaluated;
            if (a.overallScore < m_config.overallThreshold || !passesFactorMinimums(a)) continue;
            candidates.push_back(std::move(a));
        }
    }
    outcome.stats.pairsAboveThreshold = candidates.size();

    std::sort(candidates.begin(), candidates.end(), [](const auto& a, const auto& b) {
        if (a.overallScore != b.overallScore) return a.overallScore > b.overallScore;
        if (a.imageId != b.imageId) return a.imageId < b.imageId;
        return a.targetId < b.targetId;
    });

    std::map<std::string, int> perImage;
    std::map<std::string, int> perTarget;
    for (auto& a : candidates) {
        if (perImage[a.imageId] >= m_config.maxPerImage) continue;
        if (perTarget[a.targetId] >= m_config.maxPerEntity) continue;
        perImage[a.imageId]++;
        perTarget[a.targetId]++;
        outcome.associations.push_back(std::move(a));
    }

    auto& stats = outcome.stats;
    stats.associationsAssigned = outcome.associations.size();
    double confidenceSum = 0.0;
    for (const auto& a : outcome.associations) {
        confidenceSum += a.confidence;
        if (a.overallScore >= 0.8) {
            ++stats.high;
        } else if (a.overallScore >= 0.6) {
            ++stats.good;
        } else if (a.overallScore >= 0.4) {
            ++stats.moderate;
        } else {
            ++stats.low;
        }
    }
    if (!outcome.associations.empty()) {
        stats.averageConfidence = confidenceSum / static_cast<double>(outcome.associations.size());
    }
    return outcome;
}

domain::AssociationTarget AssociationEngine::toTarget(const domain::EntityCandidate& candidate, const std::vector<float>& embedding) {
    domain::AssociationTarget t;
    t.id = candidate.id;
    t.kind = domain::TargetKind::Entity;
    t.name = candidate.displayName();
    t.description = candidate.text;
    t.pageNumber = candidate.pageNumber;
    t.embedding = embedding;
    return t;
}

domain::AssociationTarget AssociationEngine::toTarget(const domain::Chunk& chunk) {
    domain::AssociationTarget t;
    t.id = chunk.id;
    t.kind = domain::TargetKind::Chunk;
    t.description = chunk.text;
    t.pageNumber = chunk.pageNumber;
    t.embedding = chunk.embedding;
    return t;
}

} // namespace docweave::application
