/**
 * @file EntityCandidate.hpp
 * @brief Classifier output: a content-type label with a category-specific payload.
 */

#pragma once
#include <string>
#include <vector>
#include <set>
#include <optional>
#include <variant>
#include "LayoutElement.hpp"

namespace docweave::domain {

/**
 * @enum ContentType
 * @brief Closed set of content categories recognised by the classifier.
 */
enum class ContentType {
    CatalogEntry,
    Index,
    Sustainability,
    Technical,
    Moodboard,
    Unknown
};

inline std::string ContentTypeToString(ContentType type) {
    switch (type) {
        case ContentType::CatalogEntry: return "catalog_entry";
        case ContentType::Index: return "index";
        case ContentType::Sustainability: return "sustainability";
        case ContentType::Technical: return "technical";
        case ContentType::Moodboard: return "moodboard";
        case ContentType::Unknown: return "unknown";
    }
    return "unknown";
}

/** @brief Fields extracted from a catalog (product) entry. */
struct CatalogEntryData {
    static constexpr ContentType Type = ContentType::CatalogEntry;
    std::optional<std::string> name;
    std::vector<std::string> dimensions;
    std::optional<std::string> attribution;
    std::set<std::string> colors;
    std::set<std::string> materials;
    bool hasDescription = false;
};

/** @brief Page references found in an index or table of contents. */
struct IndexData {
    static constexpr ContentType Type = ContentType::Index;
    std::vector<int> pageReferences;
};

/** @brief Certification and environmental terms. */
struct SustainabilityData {
    static constexpr ContentType Type = ContentType::Sustainability;
    std::set<std::string> certifications;
};

/** @brief Measurement tokens from a specification block. */
struct TechnicalData {
    static constexpr ContentType Type = ContentType::Technical;
    std::vector<std::string> measurements;
};

/** @brief Palette mentioned on an inspiration page. */
struct MoodboardData {
    static constexpr ContentType Type = ContentType::Moodboard;
    std::set<std::string> colors;
};

struct UnknownData {
    static constexpr ContentType Type = ContentType::Unknown;
};

using EntityPayload = std::variant<
    CatalogEntryData,
    IndexData,
    SustainabilityData,
    TechnicalData,
    MoodboardData,
    UnknownData
>;

/**
 * @struct EntityCandidate
 * @brief Immutable classification result for one TextUnit.
 */
struct EntityCandidate {
    std::string id;
    std::string unitId;
    std::string elementId;
    EntityPayload payload;
    double confidence = 0.0;     ///< Pattern confidence in [0,1].
    double qualityScore = 0.0;   ///< Extraction quality in [0,1].
    int pageNumber = 1;
    BoundingBox bbox;
    std::string text;

    ContentType contentType() const {
        return std::visit([](const auto& data) {
            return std::decay_t<decltype(data)>::Type;
        }, payload);
    }

    const CatalogEntryData* catalogEntry() const {
        return std::get_if<CatalogEntryData>(&payload);
    }

    /** @brief Display name: the extracted product name when there is one. */
    std::string displayName() const {
        if (const auto* entry = catalogEntry()) {
            if (entry->name) return *entry->name;
        }
        return {};
    }
};

} // namespace docweave::domain
