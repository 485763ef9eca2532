/**
 * @file ImageAsset.hpp
 * @brief Domain entity for an image extracted from the layout.
 */

#pragma once
#include <string>
#include <vector>
#include <optional>
#include "LayoutElement.hpp"

namespace docweave::domain {

/**
 * @enum ImageType
 * @brief Coarse category of an image, derived from class/alt/src cues.
 */
enum class ImageType {
    MaterialSample,
    Diagram,
    Chart,
    Photo,
    Illustration
};

inline std::string ImageTypeToString(ImageType type) {
    switch (type) {
        case ImageType::MaterialSample: return "material_sample";
        case ImageType::Diagram: return "diagram";
        case ImageType::Chart: return "chart";
        case ImageType::Photo: return "photo";
        case ImageType::Illustration: return "illustration";
    }
    return "illustration";
}

/**
 * @struct ImageAsset
 * @brief An image with its position and optional descriptive text.
 */
struct ImageAsset {
    std::string id;
    std::string source;                    ///< src attribute, may be empty.
    int pageNumber = 1;
    BoundingBox bbox;
    std::optional<std::string> caption;
    std::optional<std::string> altText;
    ImageType type = ImageType::Illustration;
    std::vector<float> embedding;          ///< Empty when no embedding is available.

    /** @brief Caption if present, else alt text, else empty. */
    std::string describingText() const {
        if (caption && !caption->empty()) return *caption;
        if (altText) return *altText;
        return {};
    }
};

} // namespace docweave::domain
