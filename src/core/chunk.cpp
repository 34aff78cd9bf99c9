#include <kgrag/core/chunk.h>

#include <algorithm>
#include <cctype>
#include <string>

namespace kgrag {

ChunkType chunkTypeFromString(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "document")
        return ChunkType::Document;
    if (lower == "chapter")
        return ChunkType::Chapter;
    if (lower == "clause" || lower == "article")
        return ChunkType::Clause;
    if (lower == "point")
        return ChunkType::Point;
    if (lower == "subpoint")
        return ChunkType::Subpoint;
    return ChunkType::Other;
}

} // namespace kgrag
