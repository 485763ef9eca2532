/**
 * @file LayoutAwareChunker.cpp
 * @brief Implementation of LayoutAwareChunker.
 */

#include "application/LayoutAwareChunker.hpp"
#include "domain/TextNormalizer.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <cctype>

namespace docweave::application {

namespace {

const std::string kSeparator = "\n\n";

bool isContinuationByte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

size_t countSentences(const std::string& text) {
    size_t count = 0;
    bool inTerminal = false;
    for (char c : text) {
        bool terminal = c == '.' || c == '!' || c == '?';
        if (terminal && !inTerminal) ++count;
        inTerminal = terminal;
    }
    return std::max<size_t>(count, 1);
}

} // namespace

LayoutAwareChunker::LayoutAwareChunker(ChunkingConfig config)
    : m_config(config) {}

size_t LayoutAwareChunker::effectiveMaxSize() const {
    size_t reserve = m_config.overlap > 0 ? m_config.overlap + kSeparator.size() : 0;
    if (m_config.maxSize <= reserve) return m_config.maxSize;
    return m_config.maxSize - reserve;
}

std::vector<std::string> LayoutAwareChunker::splitText(const std::string& text, size_t limit) {
    std::vector<std::string> pieces;
    std::string remaining = domain::trim(text);
    if (limit == 0) {
        if (!remaining.empty()) pieces.push_back(remaining);
        return pieces;
    }

    while (remaining.size() > limit) {
        size_t cut = std::string::npos;
        const size_t floor = limit / 2;

        for (size_t i = limit; i > floor; --i) {
            char c = remaining[i - 1];
            if ((c == '.' || c == '!' || c == '?') && (i == remaining.size() || std::isspace(static_cast<unsigned char>(remaining[i])))) {
                cut = i;
                break;
            }
        }
        if (cut == std::string::npos) {
            for (size_t i = limit; i > floor; --i) {
                if (std::isspace(static_cast<unsigned char>(remaining[i]))) {
                    cut = i;
                    break;
                }
            }
        }
        if (cut == std::string::npos) {
            cut = limit;
            while (cut > 1 && isContinuationByte(remaining[cut])) --cut;
        }

        std::string piece = domain::trim(remaining.substr(0, cut));
        if (!piece.empty()) pieces.push_back(piece);
        remaining = domain::trim(remaining.substr(cut));
    }
    if (!remaining.empty()) pieces.push_back(remaining);
    return pieces;
}

domain::ChunkType LayoutAwareChunker::chunkTypeFor(domain::ElementKind kind) {
    switch (kind) {
        case domain::ElementKind::Heading: return domain::ChunkType::Heading;
        case domain::ElementKind::Table: return domain::ChunkType::Table;
        case domain::ElementKind::List: return domain::ChunkType::List;
        default: return domain::ChunkType::Paragraph;
    }
}

namespace {

domain::ChunkType combineTypes(domain::ChunkType current, domain::ChunkType added) {
    if (current == domain::ChunkType::Heading) return added;
    if (added == domain::ChunkType::Heading || added == current) return current;
    return domain::ChunkType::Mixed;
}

} // namespace

void LayoutAwareChunker::startChunk(domain::Chunk& chunk, const Piece& piece) {
    const auto& el = *piece.element;
    chunk = domain::Chunk();
    chunk.text = piece.text;
    chunk.elementIds.push_back(el.id);
    chunk.type = chunkTypeFor(el.kind);
    chunk.hierarchyLevel = el.hierarchy;
    chunk.pageNumber = el.pageNumber;
    chunk.bbox = el.bbox;
    chunk.semanticTags.insert(el.semanticTags.begin(), el.semanticTags.end());
    chunk.confidence = el.confidence;
}

void LayoutAwareChunker::appendPiece(domain::Chunk& chunk, const Piece& piece) {
    const auto& el = *piece.element;
    chunk.text += kSeparator + piece.text;
    chunk.elementIds.push_back(el.id);
    chunk.type = combineTypes(chunk.type, chunkTypeFor(el.kind));
    chunk.bbox = chunk.bbox.merged(el.bbox);
    chunk.semanticTags.insert(el.semanticTags.begin(), el.semanticTags.end());

    const double n = static_cast<double>(chunk.elementIds.size());
    chunk.confidence = (chunk.confidence * (n - 1) + el.confidence) / n;
}

void LayoutAwareChunker::absorb(domain::Chunk& into, const domain::Chunk& other) {
    const double na = static_cast<double>(into.elementIds.size());
    const double nb = static_cast<double>(other.elementIds.size());

    into.text += kSeparator + other.text;
    into.elementIds.insert(into.elementIds.end(), other.elementIds.begin(), other.elementIds.end());
    into.type = combineTypes(into.type, other.type);
    into.bbox = into.bbox.merged(other.bbox);
    into.semanticTags.insert(other.semanticTags.begin(), other.semanticTags.end());
    if (na + nb > 0) into.confidence = (into.confidence * na + other.confidence * nb) / (na + nb);
    into.finalInSection = other.finalInSection;
}

std::vector<domain::Chunk> LayoutAwareChunker::chunkSection(const domain::Section& section,
                                                            const domain::LayoutModel& model,
                                                            const std::set<std::string>& entityBreaks) const {
    const size_t effMax = effectiveMaxSize();
    const size_t limit = std::min(m_config.targetSize, effMax);

    std::vector<Piece> pieces;
    for (const auto& id : section.elementIds) {
        const domain::Element* el = model.findElement(id);
        if (!el || el->kind == domain::ElementKind::Image) continue;
        std::string text = domain::trim(el->text);
        if (text.empty()) continue;

        if (text.size() > effMax) {
            for (auto& part : splitText(text, limit)) pieces.push_back({el, std::move(part)});
        } else {
            pieces.push_back({el, std::move(text)});
        }
    }

    std::vector<domain::Chunk> chunks;
    // softBreaks[i]: chunk i was closed only because the next piece did not fit.
    std::vector<bool> softBreaks;
    domain::Chunk current;
    bool open = false;
    const domain::Element* previous = nullptr;

    for (const auto& piece : pieces) {
        const auto& el = *piece.element;
        bool hardBreak = false;
        bool sizeBreak = false;
        if (open) {
            const bool continuesElement = previous == piece.element;
            hardBreak =
                (m_config.respectHierarchy && el.isHeading() && !continuesElement) ||
                std::abs(el.hierarchy - previous->hierarchy) > 1 ||
                (el.kind == domain::ElementKind::Table && !continuesElement) ||
                el.pageNumber != previous->pageNumber ||
                (m_config.splitOnEntityBoundaries && !continuesElement && entityBreaks.count(previous->id) > 0);
            sizeBreak = current.text.size() + kSeparator.size() + piece.text.size() > limit;
        }

        if (!open || hardBreak || sizeBreak) {
            if (open) {
                chunks.push_back(std::move(current));
                softBreaks.push_back(!hardBreak);
            }
            startChunk(current, piece);
            current.sectionId = section.id;
            open = true;
        } else {
            appendPiece(current, piece);
        }
        previous = piece.element;
    }
    if (open) {
        chunks.push_back(std::move(current));
        softBreaks.push_back(false);
    }

    if (!chunks.empty()) chunks.back().finalInSection = true;
    mergeUndersized(chunks, softBreaks);
    return chunks;
}

void LayoutAwareChunker::mergeUndersized(std::vector<domain::Chunk>& chunks, std::vector<bool>& softBreaks) const {
    const size_t effMax = effectiveMaxSize();
    size_t i = 0;
    while (i < chunks.size()) {
        auto& c = chunks[i];
        if (c.finalInSection || c.text.size() >= m_config.minSize) {
            ++i;
            continue;
        }

        // Page, table, hierarchy and entity breaks stay; the chunk is flagged instead.
        if (softBreaks[i] && i + 1 < chunks.size() &&
            c.text.size() + kSeparator.size() + chunks[i + 1].text.size() <= effMax) {
            absorb(c, chunks[i + 1]);
            softBreaks[i] = softBreaks[i + 1];
            chunks.erase(chunks.begin() + static_cast<std::ptrdiff_t>(i + 1));
            softBreaks.erase(softBreaks.begin() + static_cast<std::ptrdiff_t>(i + 1));
            continue;
        }
        if (i > 0 && softBreaks[i - 1] &&
            chunks[i - 1].text.size() + kSeparator.size() + c.text.size() <= effMax) {
            absorb(chunks[i - 1], c);
            softBreaks[i - 1] = softBreaks[i];
            chunks.erase(chunks.begin() + static_cast<std::ptrdiff_t>(i));
            softBreaks.erase(softBreaks.begin() + static_cast<std::ptrdiff_t>(i));
            --i;
            continue;
        }
        ++i;
    }
}

void LayoutAwareChunker::applyOverlap(std::vector<domain::Chunk>& chunks) const {
    if (m_config.overlap == 0 || chunks.size() < 2) return;

    std::vector<std::string> originals;
    originals.reserve(chunks.size());
    for (const auto& c : chunks) originals.push_back(c.text);

    for (size_t i = 1; i < chunks.size(); ++i) {
        const std::string& prev = originals[i - 1];
        size_t start = prev.size() > m_config.overlap ? prev.size() - m_config.overlap : 0;
        while (start < prev.size() && isContinuationByte(prev[start])) ++start;

        std::string prefix = prev.substr(start) + kSeparator;
        chunks[i].text = prefix + chunks[i].text;
        chunks[i].overlapLength = prefix.size();
    }
}

void LayoutAwareChunker::updateMetadata(domain::Chunk& chunk) {
    chunk.characterCount = chunk.text.size();
    const auto words = domain::splitWords(chunk.text);
    chunk.wordCount = static_cast<int>(words.size());
    chunk.readingTimeSeconds = static_cast<int>(std::ceil(chunk.wordCount / 200.0 * 60.0));

    const double avgSentence = static_cast<double>(words.size()) / static_cast<double>(countSentences(chunk.text));
    chunk.complexity = std::clamp(static_cast<int>(std::lround(avgSentence / 5.0)), 1, 10);
}

void LayoutAwareChunker::validate(std::vector<domain::Chunk>& chunks) const {
    for (auto& c : chunks) {
        updateMetadata(c);
        if (c.characterCount < m_config.minSize) {
            c.sizeFlag = domain::SizeFlag::Undersized;
            c.semanticTags.insert("undersized");
        } else if (c.characterCount > m_config.maxSize) {
            c.sizeFlag = domain::SizeFlag::Oversized;
        } else {
            c.sizeFlag = domain::SizeFlag::Ok;
        }
    }
}

std::vector<domain::Chunk> LayoutAwareChunker::chunk(const domain::LayoutModel& model,
                                                     const std::vector<domain::BoundaryScore>* boundaries,
                                                     const std::string& documentId) const {
    std::set<std::string> entityBreaks;
    if (boundaries) {
        for (const auto& b : *boundaries) {
            if (b.entityBoundary) entityBreaks.insert(b.elementId);
        }
    }

    std::vector<domain::Chunk> chunks;
    model.forEachSection([&](const domain::Section& section) {
        auto sectionChunks = chunkSection(section, model, entityBreaks);
        for (auto& c : sectionChunks) chunks.push_back(std::move(c));
    });

    applyOverlap(chunks);

    for (size_t i = 0; i < chunks.size(); ++i) {
        chunks[i].index = static_cast<int>(i);
        chunks[i].documentId = documentId;
        chunks[i].id = documentId + "_chunk_" + std::to_string(i);
    }
    validate(chunks);
    return chunks;
}

} // namespace docweave::application
