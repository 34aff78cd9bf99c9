#pragma once

#include <kgrag/core/chunk.h>
#include <kgrag/core/types.h>
#include <kgrag/graph/graph_store.h>
#include <kgrag/search/candidate.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace kgrag::search {

/**
 * @brief Word-containment scoring of graph nodes.
 *
 * A node's lexical score is the number of distinct lowercased query words that
 * occur as substrings of its lowercased text. Nodes scoring zero are dropped;
 * the rest are ordered by score (ties by ascending id) and capped.
 */
class LexicalSeedSelector {
public:
    explicit LexicalSeedSelector(size_t seedCandidates = 20) : seedCandidates_(seedCandidates) {}

    /// Lowercased, whitespace-split, distinct words in first-seen order.
    static std::vector<std::string> queryWords(std::string_view query);

    static size_t matchCount(const std::vector<std::string>& words, std::string_view lowerText);

    std::vector<Candidate> select(std::string_view query,
                                  const std::vector<ChunkRecord>& nodes) const;

    // Scans `ns` and selects from it. Store errors pass through unchanged.
    Result<std::vector<Candidate>> select(graph::IGraphStore& store, const std::string& ns,
                                          std::string_view query) const;

    size_t seedCandidates() const noexcept { return seedCandidates_; }

private:
    size_t seedCandidates_;
};

} // namespace kgrag::search
