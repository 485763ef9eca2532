/**
 * @file TextUnit.hpp
 * @brief Normalized span of text produced once per text-bearing element.
 */

#pragma once
#include <string>
#include <vector>
#include "LayoutElement.hpp"

namespace docweave::domain {

/**
 * @struct TextUnit
 * @brief Text span used by classification and boundary detection.
 */
struct TextUnit {
    std::string id;
    std::string elementId;          ///< Source element.
    ElementKind kind = ElementKind::Paragraph;
    std::string text;               ///< Normalized; a trailing line break marks a paragraph break.
    int pageNumber = 1;
    BoundingBox bbox;
    std::vector<float> embedding;   ///< Empty when no embedding is available.

    bool hasEmbedding() const { return !embedding.empty(); }
};

} // namespace docweave::domain
