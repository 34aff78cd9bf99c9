#include <kgrag/graph/in_memory_graph_store.h>
#include <kgrag/graph/traversal.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <mutex>
#include <set>

namespace kgrag::graph {

using json = nlohmann::json;

Result<std::shared_ptr<InMemoryGraphStore>>
InMemoryGraphStore::fromJsonFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::NotFound, "cannot open graph file: " + path.string()};
    }

    json doc;
    try {
        doc = json::parse(in);
    } catch (const json::parse_error& e) {
        return Error{ErrorCode::InvalidData,
                     "malformed graph file " + path.string() + ": " + e.what()};
    }

    auto store = std::make_shared<InMemoryGraphStore>();
    auto loaded = store->loadJson(doc);
    if (!loaded)
        return loaded.error();
    return store;
}

void InMemoryGraphStore::addChunk(const std::string& ns, ChunkRecord chunk) {
    std::unique_lock lock(mutex_);
    auto& part = partitions_[ns];
    auto id = chunk.id;
    part.nodes.insert_or_assign(std::move(id), std::move(chunk));
}

void InMemoryGraphStore::addEdge(const std::string& ns, GraphEdge edge) {
    std::unique_lock lock(mutex_);
    auto& part = partitions_[ns];
    const size_t idx = part.edges.size();
    part.bySource[edge.sourceId].push_back(idx);
    part.byTarget[edge.targetId].push_back(idx);
    part.edges.push_back(std::move(edge));
}

Result<void> InMemoryGraphStore::loadJson(const json& doc) {
    if (doc.is_array()) {
        for (const auto& part : doc) {
            auto r = loadPartition(part);
            if (!r)
                return r;
        }
        return {};
    }
    return loadPartition(doc);
}

Result<void> InMemoryGraphStore::loadPartition(const json& doc) {
    if (!doc.is_object()) {
        return Error{ErrorCode::InvalidData, "graph partition must be a JSON object"};
    }

    std::string ns = "Chunk";
    try {
        ns = doc.value("namespace", ns);
        size_t nodes = 0;
        size_t edges = 0;
        for (const auto& n : doc.value("nodes", json::array())) {
            ChunkRecord rec;
            rec.id = n.at("id").get<std::string>();
            if (n.contains("text") && n["text"].is_string())
                rec.text = n["text"].get<std::string>();
            if (n.contains("type") && n["type"].is_string())
                rec.type = chunkTypeFromString(n["type"].get<std::string>());
            if (n.contains("parent_id") && n["parent_id"].is_string())
                rec.parentId = n["parent_id"].get<std::string>();
            if (n.contains("embedding") && n["embedding"].is_array())
                rec.embedding = n["embedding"].get<std::vector<float>>();
            addChunk(ns, std::move(rec));
            ++nodes;
        }
        for (const auto& e : doc.value("edges", json::array())) {
            addEdge(ns, GraphEdge{e.at("source").get<std::string>(),
                                  e.at("target").get<std::string>(),
                                  e.value("type", std::string("RELATED_TO"))});
            ++edges;
        }
        spdlog::debug("loaded namespace '{}': {} nodes, {} edges", ns, nodes, edges);
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidData,
                     "invalid graph data in namespace '" + ns + "': " + e.what()};
    }
    return {};
}

Result<std::vector<ChunkRecord>> InMemoryGraphStore::scanByLabel(const std::string& ns) {
    std::shared_lock lock(mutex_);
    std::vector<ChunkRecord> out;
    auto it = partitions_.find(ns);
    if (it == partitions_.end())
        return out;
    for (const auto& [id, node] : it->second.nodes) {
        if (node.hasText())
            out.push_back(node);
    }
    return out;
}

Result<std::vector<NeighborRecord>>
InMemoryGraphStore::neighbors(const std::vector<std::string>& seedIds, const std::string& ns,
                              const GraphTraversalOptions& options) {
    std::shared_lock lock(mutex_);
    auto it = partitions_.find(ns);
    if (it == partitions_.end())
        return std::vector<NeighborRecord>{};
    const Partition& part = it->second;

    auto edgesOf = [&part](const std::vector<std::string>& frontier,
                           TraversalDirection direction) -> Result<std::vector<GraphEdge>> {
        std::set<size_t> indices;
        for (const auto& id : frontier) {
            if (direction != TraversalDirection::Incoming) {
                if (auto s = part.bySource.find(id); s != part.bySource.end())
                    indices.insert(s->second.begin(), s->second.end());
            }
            if (direction != TraversalDirection::Outgoing) {
                if (auto t = part.byTarget.find(id); t != part.byTarget.end())
                    indices.insert(t->second.begin(), t->second.end());
            }
        }
        std::vector<GraphEdge> edges;
        edges.reserve(indices.size());
        for (auto idx : indices)
            edges.push_back(part.edges[idx]);
        return edges;
    };

    auto nodesOf = [&part](const std::vector<std::string>& ids) -> Result<std::vector<ChunkRecord>> {
        std::vector<ChunkRecord> nodes;
        for (const auto& id : ids) {
            if (auto n = part.nodes.find(id); n != part.nodes.end())
                nodes.push_back(n->second);
        }
        return nodes;
    };

    return breadthFirstNeighbors(seedIds, options, edgesOf, nodesOf);
}

size_t InMemoryGraphStore::nodeCount(const std::string& ns) const {
    std::shared_lock lock(mutex_);
    auto it = partitions_.find(ns);
    return it == partitions_.end() ? 0 : it->second.nodes.size();
}

size_t InMemoryGraphStore::edgeCount(const std::string& ns) const {
    std::shared_lock lock(mutex_);
    auto it = partitions_.find(ns);
    return it == partitions_.end() ? 0 : it->second.edges.size();
}

} // namespace kgrag::graph
