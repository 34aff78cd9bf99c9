#pragma once

#include <kgrag/core/chunk.h>
#include <kgrag/core/types.h>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kgrag::graph {

enum class TraversalDirection { Both, Outgoing, Incoming };

constexpr const char* traversalDirectionToString(TraversalDirection d) noexcept {
    switch (d) {
        case TraversalDirection::Both:
            return "both";
        case TraversalDirection::Outgoing:
            return "outgoing";
        case TraversalDirection::Incoming:
            return "incoming";
    }
    return "both";
}

std::optional<TraversalDirection> traversalDirectionFromString(std::string_view name);

struct GraphTraversalOptions {
    size_t maxHops = 1;
    TraversalDirection direction = TraversalDirection::Both;
    // Expiry turns the traversal into a GraphQueryFailed/Timeout error.
    std::optional<Deadline> deadline;
};

/**
 * @brief One way of reaching `node` from `seedId`.
 *
 * `edge` is the last edge of a shortest path and `hops` its length. A node
 * reached at the same depth over several edges yields one record per edge so
 * callers can apply their own tie-break.
 */
struct NeighborRecord {
    std::string seedId;
    GraphEdge edge;
    ChunkRecord node;
    size_t hops = 1;
};

struct SimilarityHit {
    ChunkRecord chunk;
    float score = 0.0f;
};

/**
 * @brief Read-only query capability over a property graph partitioned by namespace.
 *
 * Implementations must:
 * - Be safe for concurrent read access
 * - Only return nodes that carry text from scans and traversals
 * - Return results in a deterministic order for an unchanged graph
 * - Report unreachable storage as ErrorCode::GraphQueryFailed (or Timeout on
 *   an expired deadline), never throw
 */
class IGraphStore {
public:
    virtual ~IGraphStore() = default;

    /**
     * @brief All nodes of `ns` with non-null text, ordered by ascending id.
     */
    virtual Result<std::vector<ChunkRecord>> scanByLabel(const std::string& ns) = 0;

    /**
     * @brief Nodes within `options.maxHops` edges of each seed.
     *
     * Seeds are not reported as their own neighbors. Records are ordered by
     * seed (input order), hops, node id, then relation type.
     */
    virtual Result<std::vector<NeighborRecord>> neighbors(const std::vector<std::string>& seedIds,
                                                          const std::string& ns,
                                                          const GraphTraversalOptions& options) = 0;

    /**
     * @brief Top `limit` nodes of `ns` by cosine similarity to `query`.
     *
     * Nodes without an embedding of matching dimension are skipped. The default
     * implementation fetches vectors through scanByLabel and scores in-process;
     * stores able to score server-side override it.
     */
    virtual Result<std::vector<SimilarityHit>> similarity(const std::string& ns,
                                                          const std::vector<float>& query,
                                                          size_t limit);

    /**
     * @brief Cheap liveness probe used for the availability signal.
     */
    virtual Result<void> healthCheck() = 0;

    virtual std::string name() const = 0;
};

} // namespace kgrag::graph
