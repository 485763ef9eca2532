/**
 * @file ContentClassifier.hpp
 * @brief Lexical content-category classifier with structured field extraction.
 */

#pragma once
#include <string>
#include <vector>
#include <optional>
#include "domain/TextUnit.hpp"
#include "domain/EntityCandidate.hpp"
#include "application/PipelineConfig.hpp"

namespace docweave::application {

/**
 * @class ContentClassifier
 * @brief Labels text units by ordered, mutually exclusive pattern checks.
 *
 * Order: index, sustainability, technical, moodboard, catalog entry. The first
 * category whose cues match wins; text matching none is reported as unknown.
 */
class ContentClassifier {
public:
    explicit ContentClassifier(ClassifierConfig config = {});

    /**
     * @brief Classifies one unit.
     * @return std::nullopt when the unit is shorter than the configured minimum.
     */
    std::optional<domain::EntityCandidate> classify(const domain::TextUnit& unit) const;

    std::vector<domain::EntityCandidate> classifyAll(const std::vector<domain::TextUnit>& units) const;

    /** @brief True for catalog entries whose quality clears the configured floor. */
    bool isAssociable(const domain::EntityCandidate& candidate) const;

    /** @brief Extracts name, dimensions, attribution, colors, materials and the description flag. */
    static domain::CatalogEntryData extractCatalogEntry(const std::string& text);

    /**
     * @brief Weighted completeness of a catalog entry; halved for text under 100 characters.
     */
    static double qualityScore(const domain::CatalogEntryData& data, size_t textLength);

    static double catalogConfidence(const domain::CatalogEntryData& data);

private:
    ClassifierConfig m_config;
};

} // namespace docweave::application
