/**
 * @file LayoutElement.hpp
 * @brief Domain entities for typed layout elements and their geometry.
 */

#pragma once
#include <string>
#include <vector>
#include <map>
#include <algorithm>

namespace docweave::domain {

/**
 * @struct BoundingBox
 * @brief Axis-aligned box in page coordinates (origin top-left).
 */
struct BoundingBox {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;

    double right() const { return x + width; }
    double bottom() const { return y + height; }

    /** @brief Smallest box containing both boxes. */
    BoundingBox merged(const BoundingBox& other) const {
        BoundingBox out;
        out.x = std::min(x, other.x);
        out.y = std::min(y, other.y);
        out.width = std::max(right(), other.right()) - out.x;
        out.height = std::max(bottom(), other.bottom()) - out.y;
        return out;
    }
};

/**
 * @enum ElementKind
 * @brief Semantic kind of a parsed element.
 */
enum class ElementKind {
    Heading,
    Paragraph,
    Table,
    List,
    Image,
    Span,
    Container
};

inline std::string ElementKindToString(ElementKind kind) {
    switch (kind) {
        case ElementKind::Heading: return "heading";
        case ElementKind::Paragraph: return "paragraph";
        case ElementKind::Table: return "table";
        case ElementKind::List: return "list";
        case ElementKind::Image: return "image";
        case ElementKind::Span: return "span";
        case ElementKind::Container: return "div";
    }
    return "div";
}

/**
 * @struct Element
 * @brief One typed node of the layout model.
 *
 * Owned by the LayoutModel. Later stages keep only the id.
 */
struct Element {
    std::string id;
    std::string tagName;
    std::string className;
    ElementKind kind = ElementKind::Container;
    std::string text;                          ///< Raw text content.
    std::map<std::string, std::string> attributes;
    BoundingBox bbox;
    bool hasExplicitBox = false;               ///< False when bbox was estimated.
    int pageNumber = 1;
    int hierarchy = 1;                         ///< Heading level, or enclosing level + 1.
    int headingLevel = 0;                      ///< 1-6 for headings, 0 otherwise.
    double confidence = 0.8;
    std::vector<std::string> semanticTags;
    std::vector<float> embedding;              ///< Caller-supplied, empty when absent.

    bool isHeading() const { return kind == ElementKind::Heading; }
};

} // namespace docweave::domain
