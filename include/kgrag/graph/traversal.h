#pragma once

#include <kgrag/graph/graph_store.h>

#include <functional>
#include <string>
#include <vector>

namespace kgrag::graph {

// Edges of the namespace touching any id of `frontier` in the given direction.
using EdgeLookup = std::function<Result<std::vector<GraphEdge>>(
    const std::vector<std::string>& frontier, TraversalDirection direction)>;

// Node records for `ids`; missing ids are simply absent from the result.
using NodeLookup =
    std::function<Result<std::vector<ChunkRecord>>(const std::vector<std::string>& ids)>;

/**
 * Level-synchronous breadth-first expansion shared by the store implementations.
 *
 * Walks through every node (with or without text) but reports only nodes that
 * carry text. Checks `options.deadline` before each level and returns
 * ErrorCode::Timeout when it has passed.
 */
Result<std::vector<NeighborRecord>> breadthFirstNeighbors(const std::vector<std::string>& seedIds,
                                                          const GraphTraversalOptions& options,
                                                          const EdgeLookup& edgesOf,
                                                          const NodeLookup& nodesOf);

} // namespace kgrag::graph
