#pragma once

#include <kgrag/core/types.h>
#include <kgrag/graph/graph_store.h>
#include <kgrag/search/candidate.h>
#include <kgrag/search/retrieval_types.h>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace kgrag::search {

struct NeighborExpansionOptions {
    size_t hopDepth = 1;
    size_t neighborLimit = 10; // per seed
    float discount = 0.8f;
    HopDiscount policy = HopDiscount::Compound;
    graph::TraversalDirection direction = graph::TraversalDirection::Both;
    std::optional<Deadline> deadline;
};

/**
 * @brief Turns seeds into discounted neighbor candidates.
 *
 * Per seed, a neighbor keeps its shortest path (ties by smaller relation
 * type) and the first `neighborLimit` neighbors by (hops, id) survive. The
 * neighbor score is the seed's effective score times the hop discount. A
 * node reachable from several seeds keeps the highest score, then the smaller
 * relation type, then the smaller seed id. Seeds are never returned.
 */
class GraphNeighborExpander {
public:
    explicit GraphNeighborExpander(NeighborExpansionOptions options = {})
        : options_(std::move(options)) {}

    /// Neighbors only, ordered by score desc then id asc. Store errors pass through.
    Result<std::vector<Candidate>> expand(graph::IGraphStore& store, const std::string& ns,
                                          const std::vector<Candidate>& seeds) const;

    static float discountedScore(float seedScore, size_t hops, float discount,
                                 HopDiscount policy) noexcept;

    const NeighborExpansionOptions& options() const noexcept { return options_; }

private:
    NeighborExpansionOptions options_;
};

} // namespace kgrag::search
