/**
 * @file Chunk.hpp
 * @brief Size-bounded run of elements within one section.
 */

#pragma once
#include <string>
#include <vector>
#include <set>
#include "LayoutElement.hpp"

namespace docweave::domain {

enum class ChunkType {
    Heading,
    Paragraph,
    Table,
    List,
    Mixed
};

inline std::string ChunkTypeToString(ChunkType type) {
    switch (type) {
        case ChunkType::Heading: return "heading";
        case ChunkType::Paragraph: return "paragraph";
        case ChunkType::Table: return "table";
        case ChunkType::List: return "list";
        case ChunkType::Mixed: return "mixed";
    }
    return "mixed";
}

enum class SizeFlag {
    Ok,
    Undersized,
    Oversized
};

inline std::string SizeFlagToString(SizeFlag flag) {
    switch (flag) {
        case SizeFlag::Ok: return "ok";
        case SizeFlag::Undersized: return "undersized";
        case SizeFlag::Oversized: return "oversized";
    }
    return "ok";
}

/**
 * @struct Chunk
 * @brief Aggregated text of contiguous elements plus derived metadata.
 */
struct Chunk {
    std::string id;
    std::string documentId;
    int index = 0;
    std::string sectionId;
    std::vector<std::string> elementIds;   ///< May repeat an id when an element was split.
    std::string text;
    ChunkType type = ChunkType::Paragraph;
    int hierarchyLevel = 1;
    int pageNumber = 1;
    BoundingBox bbox;
    std::set<std::string> semanticTags;
    double confidence = 0.0;               ///< Running average over constituent elements.
    size_t characterCount = 0;             ///< Always text.size().
    size_t overlapLength = 0;              ///< Prefix carried over from the previous chunk.
    int wordCount = 0;
    int readingTimeSeconds = 0;
    int complexity = 1;                    ///< 1-10
    bool finalInSection = false;
    SizeFlag sizeFlag = SizeFlag::Ok;
    std::vector<float> embedding;
};

} // namespace docweave::domain
