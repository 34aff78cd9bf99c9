#include <kgrag/search/graph_neighbor_expander.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <map>
#include <unordered_map>

namespace kgrag::search {

namespace {

struct Path {
    const graph::NeighborRecord* record = nullptr;

    size_t hops() const { return record->hops; }
    const std::string& relation() const { return record->edge.relationType; }
    const std::string& nodeId() const { return record->node.id; }
};

// Shorter path first, then the smaller relation type.
bool betterPath(const graph::NeighborRecord& a, const graph::NeighborRecord& b) {
    if (a.hops != b.hops)
        return a.hops < b.hops;
    return a.edge.relationType < b.edge.relationType;
}

} // namespace

float GraphNeighborExpander::discountedScore(float seedScore, size_t hops, float discount,
                                             HopDiscount policy) noexcept {
    if (hops == 0)
        return seedScore;
    if (policy == HopDiscount::Once)
        return seedScore * discount;
    return seedScore * static_cast<float>(std::pow(static_cast<double>(discount),
                                                   static_cast<double>(hops)));
}

Result<std::vector<Candidate>> GraphNeighborExpander::expand(graph::IGraphStore& store,
                                                             const std::string& ns,
                                                             const std::vector<Candidate>& seeds) const {
    std::vector<Candidate> out;
    if (seeds.empty() || options_.hopDepth == 0 || options_.neighborLimit == 0)
        return out;

    std::vector<std::string> seedIds;
    std::unordered_map<std::string, float> seedScores;
    for (const auto& s : seeds) {
        if (seedScores.emplace(s.chunkId, s.effectiveScore()).second)
            seedIds.push_back(s.chunkId);
    }

    graph::GraphTraversalOptions traversal;
    traversal.maxHops = options_.hopDepth;
    traversal.direction = options_.direction;
    traversal.deadline = options_.deadline;

    auto records = store.neighbors(seedIds, ns, traversal);
    if (!records)
        return records.error();

    // seed id -> (neighbor id -> best record)
    std::unordered_map<std::string, std::map<std::string, const graph::NeighborRecord*>> perSeed;
    for (const auto& r : records.value()) {
        if (seedScores.count(r.node.id) || !r.node.hasText())
            continue;
        auto it = seedScores.find(r.seedId);
        if (it == seedScores.end())
            continue;
        auto& best = perSeed[r.seedId][r.node.id];
        if (!best || betterPath(r, *best))
            best = &r;
    }

    std::unordered_map<std::string, Candidate> merged;
    for (const auto& seedId : seedIds) {
        auto ps = perSeed.find(seedId);
        if (ps == perSeed.end())
            continue;

        std::vector<Path> paths;
        paths.reserve(ps->second.size());
        for (const auto& [id, rec] : ps->second)
            paths.push_back(Path{rec});
        std::sort(paths.begin(), paths.end(), [](const Path& a, const Path& b) {
            if (a.hops() != b.hops())
                return a.hops() < b.hops();
            return a.nodeId() < b.nodeId();
        });
        if (paths.size() > options_.neighborLimit)
            paths.resize(options_.neighborLimit);

        const float seedScore = seedScores.at(seedId);
        for (const auto& p : paths) {
            auto c = Candidate::fromChunk(p.record->node);
            c.hybridScore =
                discountedScore(seedScore, p.hops(), options_.discount, options_.policy);
            c.relationType = p.relation();
            c.sourceSeed = seedId;
            c.hops = p.hops();
            c.isSeed = false;

            auto existing = merged.find(c.chunkId);
            if (existing == merged.end()) {
                merged.emplace(c.chunkId, std::move(c));
                continue;
            }
            const Candidate& cur = existing->second;
            bool replace = false;
            if (*c.hybridScore != *cur.hybridScore) {
                replace = *c.hybridScore > *cur.hybridScore;
            } else if (*c.relationType != *cur.relationType) {
                replace = *c.relationType < *cur.relationType;
            } else {
                replace = *c.sourceSeed < *cur.sourceSeed;
            }
            if (replace)
                existing->second = std::move(c);
        }
    }

    out.reserve(merged.size());
    for (auto& [id, c] : merged)
        out.push_back(std::move(c));
    std::sort(out.begin(), out.end(), [](const Candidate& a, const Candidate& b) {
        if (*a.hybridScore != *b.hybridScore)
            return *a.hybridScore > *b.hybridScore;
        return a.chunkId < b.chunkId;
    });

    spdlog::debug("graph expansion: {} seeds -> {} neighbors (hops={}, limit={})", seedIds.size(),
                  out.size(), options_.hopDepth, options_.neighborLimit);
    return out;
}

} // namespace kgrag::search
