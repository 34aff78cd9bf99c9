#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kgrag {

/**
 * @brief Structural kind of an indexed chunk.
 *
 * Mirrors the levels produced by the document parser for legal text. Unknown
 * kinds coming from a store map to Other.
 */
enum class ChunkType { Document, Chapter, Clause, Point, Subpoint, Other };

constexpr const char* chunkTypeToString(ChunkType type) noexcept {
    switch (type) {
        case ChunkType::Document:
            return "document";
        case ChunkType::Chapter:
            return "chapter";
        case ChunkType::Clause:
            return "clause";
        case ChunkType::Point:
            return "point";
        case ChunkType::Subpoint:
            return "subpoint";
        case ChunkType::Other:
            return "other";
    }
    return "other";
}

ChunkType chunkTypeFromString(std::string_view name);

/**
 * @brief One graph node as materialized by the indexing collaborator.
 *
 * Read-only for the retrieval engine. Optional fields are absent rather than
 * empty-by-convention: a node with no text is not retrievable, a node with no
 * embedding is invisible to vector ranking.
 */
struct ChunkRecord {
    std::string id;
    std::optional<std::string> text;
    ChunkType type = ChunkType::Other;
    std::optional<std::string> parentId;
    std::optional<std::vector<float>> embedding;

    bool hasText() const noexcept { return text.has_value(); }
    bool hasEmbedding() const noexcept { return embedding.has_value() && !embedding->empty(); }
};

struct GraphEdge {
    std::string sourceId;
    std::string targetId;
    std::string relationType;

    // The endpoint opposite to `fromId`; returns sourceId for self-loops.
    const std::string& otherEnd(const std::string& fromId) const noexcept {
        return fromId == sourceId ? targetId : sourceId;
    }
};

} // namespace kgrag
