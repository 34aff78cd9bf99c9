#include <kgrag/core/vector_math.h>
#include <kgrag/graph/graph_store.h>
#include <kgrag/graph/traversal.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace kgrag::graph {

std::optional<TraversalDirection> traversalDirectionFromString(std::string_view name) {
    if (name == "both" || name == "any" || name == "undirected")
        return TraversalDirection::Both;
    if (name == "outgoing" || name == "out")
        return TraversalDirection::Outgoing;
    if (name == "incoming" || name == "in")
        return TraversalDirection::Incoming;
    return std::nullopt;
}

Result<std::vector<SimilarityHit>> IGraphStore::similarity(const std::string& ns,
                                                           const std::vector<float>& query,
                                                           size_t limit) {
    auto scan = scanByLabel(ns);
    if (!scan)
        return scan.error();

    std::vector<SimilarityHit> hits;
    for (auto& chunk : scan.value()) {
        if (!chunk.hasEmbedding() || chunk.embedding->size() != query.size())
            continue;
        float score = cosineSimilarity(*chunk.embedding, query);
        hits.push_back(SimilarityHit{std::move(chunk), score});
    }

    std::sort(hits.begin(), hits.end(), [](const SimilarityHit& a, const SimilarityHit& b) {
        if (a.score != b.score)
            return a.score > b.score;
        return a.chunk.id < b.chunk.id;
    });
    if (hits.size() > limit)
        hits.resize(limit);
    return hits;
}

namespace {

struct PendingRecord {
    GraphEdge edge;
    std::string nodeId;
    size_t hops;
};

bool expired(const GraphTraversalOptions& options) {
    return options.deadline && std::chrono::steady_clock::now() >= *options.deadline;
}

} // namespace

Result<std::vector<NeighborRecord>> breadthFirstNeighbors(const std::vector<std::string>& seedIds,
                                                          const GraphTraversalOptions& options,
                                                          const EdgeLookup& edgesOf,
                                                          const NodeLookup& nodesOf) {
    std::vector<std::pair<std::string, std::vector<PendingRecord>>> perSeed;
    std::unordered_set<std::string> reachedIds;
    std::unordered_set<std::string> seenSeeds;

    for (const auto& seed : seedIds) {
        if (!seenSeeds.insert(seed).second)
            continue;

        std::unordered_map<std::string, size_t> depth{{seed, 0}};
        std::vector<std::string> frontier{seed};
        std::vector<PendingRecord> records;

        for (size_t hop = 1; hop <= options.maxHops && !frontier.empty(); ++hop) {
            if (expired(options)) {
                return Error{ErrorCode::Timeout,
                             "graph traversal exceeded its deadline at hop " + std::to_string(hop)};
            }

            auto edges = edgesOf(frontier, options.direction);
            if (!edges)
                return edges.error();

            std::unordered_set<std::string> inFrontier(frontier.begin(), frontier.end());
            std::vector<std::string> next;

            auto visit = [&](const GraphEdge& edge, const std::string& to) {
                auto it = depth.find(to);
                if (it == depth.end()) {
                    depth.emplace(to, hop);
                    next.push_back(to);
                } else if (it->second != hop) {
                    return;
                }
                records.push_back(PendingRecord{edge, to, hop});
            };

            for (const auto& edge : edges.value()) {
                const bool fromSource = inFrontier.count(edge.sourceId) > 0;
                const bool fromTarget = inFrontier.count(edge.targetId) > 0;
                if (options.direction != TraversalDirection::Incoming && fromSource)
                    visit(edge, edge.targetId);
                if (options.direction != TraversalDirection::Outgoing && fromTarget &&
                    edge.sourceId != edge.targetId)
                    visit(edge, edge.sourceId);
            }
            std::sort(next.begin(), next.end());
            frontier = std::move(next);
        }

        for (const auto& r : records)
            reachedIds.insert(r.nodeId);
        perSeed.emplace_back(seed, std::move(records));
    }

    if (reachedIds.empty())
        return std::vector<NeighborRecord>{};

    if (expired(options))
        return Error{ErrorCode::Timeout, "graph traversal exceeded its deadline"};

    std::vector<std::string> ids(reachedIds.begin(), reachedIds.end());
    std::sort(ids.begin(), ids.end());
    auto nodes = nodesOf(ids);
    if (!nodes)
        return nodes.error();

    std::unordered_map<std::string, const ChunkRecord*> byId;
    for (const auto& n : nodes.value()) {
        if (n.hasText())
            byId.emplace(n.id, &n);
    }

    std::vector<NeighborRecord> out;
    for (auto& [seed, records] : perSeed) {
        std::sort(records.begin(), records.end(),
                  [](const PendingRecord& a, const PendingRecord& b) {
                      if (a.hops != b.hops)
                          return a.hops < b.hops;
                      if (a.nodeId != b.nodeId)
                          return a.nodeId < b.nodeId;
                      if (a.edge.relationType != b.edge.relationType)
                          return a.edge.relationType < b.edge.relationType;
                      if (a.edge.sourceId != b.edge.sourceId)
                          return a.edge.sourceId < b.edge.sourceId;
                      return a.edge.targetId < b.edge.targetId;
                  });
        for (auto& r : records) {
            auto it = byId.find(r.nodeId);
            if (it == byId.end() || r.nodeId == seed)
                continue;
            out.push_back(NeighborRecord{seed, std::move(r.edge), *it->second, r.hops});
        }
    }

    spdlog::debug("graph traversal: {} seeds, {} neighbor records, max_hops={}", perSeed.size(),
                  out.size(), options.maxHops);
    return out;
}

} // namespace kgrag::graph
