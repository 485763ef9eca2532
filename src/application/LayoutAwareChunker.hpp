/**
 * @file LayoutAwareChunker.hpp
 * @brief Groups layout elements into size-bounded chunks that follow the section tree.
 */

#pragma once
#include <string>
#include <vector>
#include <set>
#include "domain/LayoutModel.hpp"
#include "domain/BoundaryScore.hpp"
#include "domain/Chunk.hpp"
#include "application/PipelineConfig.hpp"

namespace docweave::application {

/**
 * @class LayoutAwareChunker
 * @brief Sequential chunker driven by layout structure and the boundary signal.
 *
 * Sections are chunked independently in pre-order. Undersized chunks are merged
 * with a neighbour only across size-driven breaks; page, table, hierarchy and
 * entity breaks always hold. Chunks that cannot be repaired are flagged, never dropped.
 */
class LayoutAwareChunker {
public:
    explicit LayoutAwareChunker(ChunkingConfig config = {});

    /**
     * @brief Chunks the whole document.
     * @param boundaries Optional boundary signal; nullptr chunks on layout alone.
     */
    std::vector<domain::Chunk> chunk(const domain::LayoutModel& model,
                                     const std::vector<domain::BoundaryScore>* boundaries,
                                     const std::string& documentId) const;

    /** @brief maxSize minus the room the overlap prefix will take. */
    size_t effectiveMaxSize() const;

    /** @brief Splits text into pieces of at most `limit` bytes, preferring sentence ends, then whitespace. */
    static std::vector<std::string> splitText(const std::string& text, size_t limit);

    const ChunkingConfig& config() const { return m_config; }

private:
    struct Piece {
        const domain::Element* element;
        std::string text;
    };

    std::vector<domain::Chunk> chunkSection(const domain::Section& section,
                                            const domain::LayoutModel& model,
                                            const std::set<std::string>& entityBreaks) const;
    void mergeUndersized(std::vector<domain::Chunk>& chunks, std::vector<bool>& softBreaks) const;
    void applyOverlap(std::vector<domain::Chunk>& chunks) const;
    void validate(std::vector<domain::Chunk>& chunks) const;

    static void startChunk(domain::Chunk& chunk, const Piece& piece);
    static void appendPiece(domain::Chunk& chunk, const Piece& piece);
    static void absorb(domain::Chunk& into, const domain::Chunk& other);
    static void updateMetadata(domain::Chunk& chunk);
    static domain::ChunkType chunkTypeFor(domain::ElementKind kind);

    ChunkingConfig m_config;
};

} // namespace docweave::application
