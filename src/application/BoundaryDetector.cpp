/**
 * @file BoundaryDetector.cpp
 * @brief Implementation of BoundaryDetector.
 */

#include "application/BoundaryDetector.hpp"
#include "domain/TextNormalizer.hpp"
#include "domain/VectorMath.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

namespace docweave::application {

namespace {

bool endsWithLineBreak(const std::string& text) {
    for (auto it = text.rbegin(); it != text.rend(); ++it) {
        if (*it == '\n') return true;
        if (*it != ' ' && *it != '\t' && *it != '\r') return false;
    }
    return false;
}

std::string lastLine(const std::string& trimmed) {
    auto pos = trimmed.find_last_of('\n');
    if (pos == std::string::npos) return trimmed;
    return trimmed.substr(pos + 1);
}

bool isSentenceTerminal(char c) {
    return c == '.' || c == '!' || c == '?';
}

bool isClauseTerminal(char c) {
    return c == ',' || c == ';' || c == ':';
}

float squaredDistance(const std::vector<float>& a, const std::vector<float>& b) {
    float sum = 0.0f;
    for (size_t i = 0; i < a.size() && i < b.size(); ++i) {
        float d = a[i] - b[i];
        sum += d * d;
    }
    return sum;
}

} // namespace

BoundaryDetector::BoundaryDetector(BoundaryConfig config)
    : m_config(config) {}

bool BoundaryDetector::isHeadingLine(const std::string& line) const {
    const std::string l = domain::trim(line);
    if (l.empty()) return false;

    size_t hashes = 0;
    while (hashes < l.size() && l[hashes] == '#') ++hashes;
    if (hashes > 0 && hashes < l.size() && std::isspace(static_cast<unsigned char>(l[hashes]))) return true;

    if (l.size() > m_config.headingMaxLength) return false;
    if (!std::isupper(static_cast<unsigned char>(l[0]))) return false;
    for (char c : l) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (!std::isupper(uc) && !std::isspace(uc)) return false;
    }
    return l.size() > 1;
}

int BoundaryDetector::strengthHundredths(const std::string& text) const {
    const std::string trimmed = domain::trim(text);
    if (trimmed.empty()) return 0;

    int score = 30;
    const char last = trimmed.back();
    if (isSentenceTerminal(last)) {
        score += 40;
    } else if (isClauseTerminal(last)) {
        score += 15;
    }

    if (endsWithLineBreak(text)) score += 20;
    if (isHeadingLine(lastLine(trimmed))) score += 15;

    unsigned char ul = static_cast<unsigned char>(last);
    if ((std::isalnum(ul) || last == '_') && !isSentenceTerminal(last) && !isClauseTerminal(last)) {
        score -= 15;
    }
    return std::clamp(score, 0, 100);
}

double BoundaryDetector::strength(const std::string& text) const {
    return strengthHundredths(text) / 100.0;
}

domain::BoundaryType BoundaryDetector::classify(const std::string& text, double strength, double similarity) const {
    const std::string trimmed = domain::trim(text);
    if (strength < 0.3) return domain::BoundaryType::Weak;
    if (isHeadingLine(lastLine(trimmed))) return domain::BoundaryType::Section;
    if (endsWithLineBreak(text)) return domain::BoundaryType::Paragraph;
    if (!trimmed.empty() && isSentenceTerminal(trimmed.back())) return domain::BoundaryType::Sentence;
    if (similarity < 0.5) return domain::BoundaryType::Semantic;
    return domain::BoundaryType::Weak;
}

bool BoundaryDetector::isEntityBoundary(double strength, double similarity) const {
    return strength > m_config.entityStrengthThreshold && similarity < m_config.entitySimilarityThreshold;
}

Similarity BoundaryDetector::similarity(const domain::TextUnit& a, const domain::TextUnit& b) {
    Similarity out;
    if (a.hasEmbedding() && b.hasEmbedding()) {
        out.value = domain::cosineSimilarity(a.embedding, b.embedding);
        return out;
    }

    out.estimated = true;
    const std::string ta = domain::trim(a.text);
    const std::string tb = domain::trim(b.text);
    const size_t longer = std::max(ta.size(), tb.size());
    if (longer == 0) return out;

    double lengthRatio = static_cast<double>(std::min(ta.size(), tb.size())) / static_cast<double>(longer);
    auto wa = domain::splitWords(domain::toLower(ta));
    auto wb = domain::splitWords(domain::toLower(tb));
    double firstTokenMatch = (!wa.empty() && !wb.empty() && wa.front() == wb.front()) ? 1.0 : 0.0;
    out.value = 0.5 * lengthRatio + 0.5 * firstTokenMatch;
    return out;
}

std::string BoundaryDetector::reasoning(double strength, const Similarity& similarity) {
    std::string out;
    if (strength > 0.7) {
        out = "Strong boundary marker";
    } else if (strength > 0.4) {
        out = "Moderate boundary marker";
    } else {
        out = "Weak boundary marker";
    }

    if (similarity.value < 0.5) {
        out += "; Low semantic similarity to next unit";
    } else if (similarity.value > 0.8) {
        out += "; High semantic similarity to next unit";
    }
    if (similarity.estimated) out += " (estimated)";
    return out;
}

domain::BoundaryScore BoundaryDetector::scorePair(const domain::TextUnit& current, const domain::TextUnit& next) const {
    domain::BoundaryScore score;
    score.unitId = current.id;
    score.nextUnitId = next.id;
    score.elementId = current.elementId;
    score.strength = strength(current.text);

    Similarity sim = similarity(current, next);
    score.semanticSimilarity = sim.value;
    score.similarityEstimated = sim.estimated;
    score.type = classify(current.text, score.strength, sim.value);
    score.entityBoundary = isEntityBoundary(score.strength, sim.value);
    score.reasoning = reasoning(score.strength, sim);
    return score;
}

std::vector<domain::BoundaryScore> BoundaryDetector::score(const std::vector<domain::TextUnit>& units) const {
    std::vector<domain::BoundaryScore> scores;
    if (units.size() < 2) return scores;
    scores.reserve(units.size() - 1);
    for (size_t i = 0; i + 1 < units.size(); ++i) {
        scores.push_back(scorePair(units[i], units[i + 1]));
    }
    return scores;
}

std::vector<UnitCluster> BoundaryDetector::cluster(const std::vector<domain::TextUnit>& units, std::optional<int> k) const {
    std::vector<const domain::TextUnit*> members;
    for (const auto& u : units) {
        if (!u.hasEmbedding()) continue;
        if (!members.empty() && u.embedding.size() != members.front()->embedding.size()) continue;
        members.push_back(&u);
    }
    const size_t n = members.size();
    if (n < 2) return {};

    size_t clusters = k ? static_cast<size_t>(std::max(1, *k))
                        : std::min<size_t>(5, static_cast<size_t>(std::ceil(std::sqrt(static_cast<double>(n)))));
    clusters = std::min(clusters, n);

    std::vector<std::vector<float>> centroids;
    for (size_t c = 0; c < clusters; ++c) {
        centroids.push_back(members[c * n / clusters]->embedding);
    }

    std::vector<size_t> assignment(n, 0);
    for (int iter = 0; iter < std::max(1, m_config.kmeansIterations); ++iter) {
        bool changed = false;
        for (size_t i = 0; i < n; ++i) {
            float best = std::numeric_limits<float>::max();
            size_t bestCluster = 0;
            for (size_t c = 0; c < clusters; ++c) {
                float d = squaredDistance(members[i]->embedding, centroids[c]);
                if (d < best) {
                    best = d;
                    bestCluster = c;
                }
            }
            if (assignment[i] != bestCluster) {
                changed = true;
                assignment[i] = bestCluster;
            }
        }

        for (size_t c = 0; c < clusters; ++c) {
            std::vector<std::vector<float>> group;
            for (size_t i = 0; i < n; ++i) {
                if (assignment[i] == c) group.push_back(members[i]->embedding);
            }
            if (!group.empty()) centroids[c] = domain::centroid(group);
        }
        if (!changed && iter > 0) break;
    }

    std::vector<UnitCluster> out;
    for (size_t c = 0; c < clusters; ++c) {
        UnitCluster uc;
        uc.id = static_cast<int>(c);
        std::vector<std::vector<float>> group;
        for (size_t i = 0; i < n; ++i) {
            if (assignment[i] != c) continue;
            uc.unitIds.push_back(members[i]->id);
            group.push_back(members[i]->embedding);
        }
        if (group.empty()) continue;
        uc.centroid = centroids[c];
        uc.coherence = domain::clusterCoherence(group, uc.centroid);
        uc.size = group.size();
        uc.entityCluster = uc.size > 2;
        out.push_back(std::move(uc));
    }
    return out;
}

} // namespace docweave::application
