/**
 * @file ContentClassifier.cpp
 * @brief Implementation of ContentClassifier.
 */

#include "application/ContentClassifier.hpp"
#include "domain/TextNormalizer.hpp"
#include <regex>
#include <algorithm>
#include <cctype>

namespace docweave::application {

namespace {

const std::vector<std::string> kColorVocabulary = {
    "white", "black", "grey", "gray", "beige", "taupe", "sand", "clay", "anthracite",
    "cream", "ivory", "brown", "blue", "green", "red", "yellow", "orange", "purple", "pink"
};

const std::vector<std::string> kMaterialVocabulary = {
    "ceramic", "porcelain", "stone", "marble", "granite", "wood",
    "metal", "glass", "concrete", "tile", "vinyl", "laminate"
};

const std::vector<std::string> kDescriptionCues = {
    "material", "texture", "finish", "color", "collection"
};

const std::vector<std::string> kSustainabilityCues = {
    "sustainability", "certification", "environmental", "eco-friendly",
    "carbon footprint", "recycled", "leed", "greenguard"
};

const std::vector<std::string> kMoodboardCues = {
    "moodboard", "mood board", "inspiration", "collection overview"
};

const std::regex& dimensionPattern() {
    static const std::regex re(
        R"((\d+(?:[.,]\d+)?\s*(?:x|X|×)\s*\d+(?:[.,]\d+)?(?:\s*(?:x|X|×)\s*\d+(?:[.,]\d+)?)?(?:\s*(?:mm|cm))?|\d+(?:[.,]\d+)?\s*(?:mm|cm)\b))");
    return re;
}

const std::regex& attributionPattern() {
    static const std::regex re(
        R"(\b(?:[Dd]esigned\s+[Bb]y|[Bb]y)\s+([A-Z][A-Za-z&.'\-]*(?:\s+[A-Z][A-Za-z&.'\-]*){0,3}))");
    return re;
}

const std::regex& studioPattern() {
    static const std::regex re(R"(\b((?:[Ee]studi[o]?|[Ss]tudio)\s+[A-Za-z&.'\-]+(?:\s+[A-Z][A-Za-z&.'\-]*){0,2}))");
    return re;
}

const std::regex& pageReferencePattern() {
    static const std::regex re(R"((?:page\s*|\.{3,}\s*)(\d+))");
    return re;
}

const std::regex& measurementPattern() {
    static const std::regex re(R"(\d+(?:[.,]\d+)?\s*(?:kg/m2|kg/m²|mm|cm|kg|m2|m²|%))");
    return re;
}

bool contains(const std::string& lower, const std::string& cue) {
    return lower.find(cue) != std::string::npos;
}

size_t countCues(const std::string& lower, const std::vector<std::string>& cues) {
    size_t n = 0;
    for (const auto& cue : cues) {
        if (contains(lower, cue)) ++n;
    }
    return n;
}

double categoryConfidence(size_t matchedCues) {
    if (matchedCues == 0) return 0.2;
    return std::min(0.95, 0.6 + 0.1 * static_cast<double>(matchedCues - 1));
}

std::string stripPunctuation(const std::string& token) {
    size_t start = 0;
    size_t end = token.size();
    while (start < end && std::ispunct(static_cast<unsigned char>(token[start]))) ++start;
    while (end > start && std::ispunct(static_cast<unsigned char>(token[end - 1]))) --end;
    return token.substr(start, end - start);
}

bool isUppercaseToken(const std::string& token) {
    int upper = 0;
    for (char c : token) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::islower(uc)) return false;
        if (std::isupper(uc)) ++upper;
    }
    return upper >= 2;
}

std::set<std::string> vocabularyMatches(const std::set<std::string>& words, const std::vector<std::string>& vocabulary) {
    std::set<std::string> found;
    for (const auto& term : vocabulary) {
        if (words.count(term)) found.insert(term);
    }
    return found;
}

size_t indexCueCount(const std::string& lower) {
    static const std::regex indexWord(R"(\bindex\b)");
    static const std::regex pageNumber(R"(\bpage\s*\d+)");
    size_t n = 0;
    if (contains(lower, "table of contents")) ++n;
    if (std::regex_search(lower, indexWord)) ++n;
    if (contains(lower, "contents")) ++n;
    if (std::regex_search(lower, pageNumber)) ++n;
    if (contains(lower, "...")) ++n;
    return n;
}

size_t technicalCueCount(const std::string& lower) {
    size_t n = 0;
    if (contains(lower, "technical characteristics")) ++n;
    if (contains(lower, "specifications")) ++n;
    if (contains(lower, "technical data")) ++n;
    if (contains(lower, "properties")) ++n;
    if (contains(lower, "mm") && contains(lower, "thickness")) ++n;
    if (contains(lower, "weight per")) ++n;
    if (contains(lower, "fire rating")) ++n;
    return n;
}

} // namespace

ContentClassifier::ContentClassifier(ClassifierConfig config)
    : m_config(config) {}

domain::CatalogEntryData ContentClassifier::extractCatalogEntry(const std::string& text) {
    domain::CatalogEntryData data;

    std::vector<std::string> nameTokens;
    for (const auto& raw : domain::splitWords(text)) {
        std::string token = stripPunctuation(raw);
        if (isUppercaseToken(token)) {
            nameTokens.push_back(token);
        } else if (!nameTokens.empty()) {
            break;
        }
    }
    if (!nameTokens.empty()) {
        std::string name;
        for (const auto& t : nameTokens) {
            if (!name.empty()) name += ' ';
            name += t;
        }
        data.name = name;
    }

    for (auto it = std::sregex_iterator(text.begin(), text.end(), dimensionPattern()); it != std::sregex_iterator(); ++it) {
        data.dimensions.push_back(domain::trim(it->str()));
    }

    std::smatch match;
    if (std::regex_search(text, match, attributionPattern())) {
        data.attribution = domain::trim(match[1].str());
    } else if (std::regex_search(text, match, studioPattern())) {
        data.attribution = domain::trim(match[1].str());
    }

    const std::string lower = domain::toLower(text);
    const auto words = domain::wordSet(lower);
    data.colors = vocabularyMatches(words, kColorVocabulary);
    data.materials = vocabularyMatches(words, kMaterialVocabulary);
    data.hasDescription = text.size() > 100 && countCues(lower, kDescriptionCues) > 0;
    return data;
}

double ContentClassifier::qualityScore(const domain::CatalogEntryData& data, size_t textLength) {
    double score = 0.0;
    if (data.name) score += 0.3;
    if (!data.dimensions.empty()) score += 0.25;
    if (data.attribution) score += 0.2;
    if (data.hasDescription) score += 0.15;
    if (!data.colors.empty()) score += 0.05;
    if (!data.materials.empty()) score += 0.05;
    if (textLength < 100) score *= 0.5;
    return std::min(1.0, score);
}

double ContentClassifier::catalogConfidence(const domain::CatalogEntryData& data) {
    double confidence = 0.0;
    if (data.name) confidence += 0.4;
    if (!data.dimensions.empty()) confidence += 0.3;
    if (data.attribution) confidence += 0.2;
    if (data.hasDescription) confidence += 0.1;
    return std::min(1.0, confidence);
}

std::optional<domain::EntityCandidate> ContentClassifier::classify(const domain::TextUnit& unit) const {
    const std::string text = domain::trim(unit.text);
    if (text.size() < m_config.minLength) return std::nullopt;

    domain::EntityCandidate candidate;
    candidate.id = "ent_" + unit.id;
    candidate.unitId = unit.id;
    candidate.elementId = unit.elementId;
    candidate.pageNumber = unit.pageNumber;
    candidate.bbox = unit.bbox;
    candidate.text = text;

    const std::string lower = domain::toLower(text);

    if (size_t cues = indexCueCount(lower); cues > 0) {
        domain::IndexData data;
        for (auto it = std::sregex_iterator(lower.begin(), lower.end(), pageReferencePattern()); it != std::sregex_iterator(); ++it) {
            const std::string digits = (*it)[1].str();
            if (digits.size() <= 6) data.pageReferences.push_back(std::stoi(digits));
        }
        candidate.payload = data;
        candidate.confidence = categoryConfidence(cues);
        return candidate;
    }

    if (size_t cues = countCues(lower, kSustainabilityCues); cues > 0) {
        domain::SustainabilityData data;
        for (const auto& cue : kSustainabilityCues) {
            if (contains(lower, cue)) data.certifications.insert(cue);
        }
        candidate.payload = data;
        candidate.confidence = categoryConfidence(cues);
        return candidate;
    }

    if (size_t cues = technicalCueCount(lower); cues > 0) {
        domain::TechnicalData data;
        for (auto it = std::sregex_iterator(text.begin(), text.end(), measurementPattern()); it != std::sregex_iterator(); ++it) {
            data.measurements.push_back(it->str());
        }
        candidate.payload = data;
        candidate.confidence = categoryConfidence(cues);
        return candidate;
    }

    if (size_t cues = countCues(lower, kMoodboardCues); cues > 0) {
        domain::MoodboardData data;
        data.colors = vocabularyMatches(domain::wordSet(lower), kColorVocabulary);
        candidate.payload = data;
        candidate.confidence = categoryConfidence(cues);
        return candidate;
    }

    bool hasUppercase = false;
    for (const auto& raw : domain::splitWords(text)) {
        if (isUppercaseToken(stripPunctuation(raw))) {
            hasUppercase = true;
            break;
        }
    }
    if (hasUppercase && std::regex_search(text, dimensionPattern())) {
        auto data = extractCatalogEntry(text);
        candidate.qualityScore = qualityScore(data, text.size());
        candidate.confidence = catalogConfidence(data);
        candidate.payload = std::move(data);
        return candidate;
    }

    candidate.payload = domain::UnknownData{};
    candidate.confidence = 0.2;
    return candidate;
}

std::vector<domain::EntityCandidate> ContentClassifier::classifyAll(const std::vector<domain::TextUnit>& units) const {
    std::vector<domain::EntityCandidate> out;
    for (const auto& unit : units) {
        if (auto candidate = classify(unit)) out.push_back(std::move(*candidate));
    }
    return out;
}

bool ContentClassifier::isAssociable(const domain::EntityCandidate& candidate) const {
    return candidate.contentType() == domain::ContentType::CatalogEntry &&
           candidate.qualityScore > m_config.qualityFloor;
}

} // namespace docweave::application
