#pragma once

#include <kgrag/graph/graph_store.h>

#include <nlohmann/json_fwd.hpp>

#include <filesystem>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace kgrag::graph {

/**
 * @brief Graph store held entirely in memory.
 *
 * Backs the unit tests and the CLI's `--graph-json` mode. Population happens
 * up front through addChunk/addEdge/loadJson; retrieval only reads, and reads
 * take a shared lock so concurrent requests never serialize on each other.
 *
 * JSON layout accepted by loadJson:
 * @code
 * { "namespace": "Chunk",
 *   "nodes": [ {"id": "c1", "text": "...", "type": "clause", "parent_id": "d1",
 *               "embedding": [0.1, 0.2]} ],
 *   "edges": [ {"source": "c1", "target": "c2", "type": "CITES"} ] }
 * @endcode
 * A top-level array of such objects loads several namespaces.
 */
class InMemoryGraphStore final : public IGraphStore {
public:
    InMemoryGraphStore() = default;

    static Result<std::shared_ptr<InMemoryGraphStore>>
    fromJsonFile(const std::filesystem::path& path);

    void addChunk(const std::string& ns, ChunkRecord chunk);
    void addEdge(const std::string& ns, GraphEdge edge);
    Result<void> loadJson(const nlohmann::json& doc);

    Result<std::vector<ChunkRecord>> scanByLabel(const std::string& ns) override;
    Result<std::vector<NeighborRecord>> neighbors(const std::vector<std::string>& seedIds,
                                                  const std::string& ns,
                                                  const GraphTraversalOptions& options) override;
    Result<void> healthCheck() override { return {}; }
    std::string name() const override { return "memory"; }

    size_t nodeCount(const std::string& ns) const;
    size_t edgeCount(const std::string& ns) const;

private:
    struct Partition {
        std::map<std::string, ChunkRecord> nodes; // ordered for deterministic scans
        std::vector<GraphEdge> edges;
        std::unordered_map<std::string, std::vector<size_t>> bySource;
        std::unordered_map<std::string, std::vector<size_t>> byTarget;
    };

    Result<void> loadPartition(const nlohmann::json& doc);

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Partition> partitions_;
};

} // namespace kgrag::graph
