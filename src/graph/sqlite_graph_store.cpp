#include <kgrag/graph/sqlite_graph_store.h>
#include <kgrag/graph/traversal.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <map>

namespace kgrag::graph {

namespace {

// Keeps IN (...) lists well below SQLITE_MAX_VARIABLE_NUMBER.
constexpr size_t kMaxIdsPerQuery = 500;

constexpr const char* kChunkColumns = "id, text, type, parent_id, embedding";

std::string placeholders(size_t n) {
    std::string out;
    out.reserve(n * 2);
    for (size_t i = 0; i < n; ++i) {
        out += (i == 0) ? "?" : ",?";
    }
    return out;
}

ChunkRecord readChunk(const Statement& stmt) {
    ChunkRecord rec;
    rec.id = stmt.getString(0);
    if (!stmt.isNull(1))
        rec.text = stmt.getString(1);
    rec.type = chunkTypeFromString(stmt.getString(2));
    if (!stmt.isNull(3))
        rec.parentId = stmt.getString(3);
    if (!stmt.isNull(4)) {
        auto blob = stmt.getBlob(4);
        rec.embedding = unpackEmbedding(blob);
    }
    return rec;
}

Error toGraphError(const Error& e) {
    if (e.code == ErrorCode::Timeout || e.code == ErrorCode::GraphQueryFailed)
        return e;
    return Error{ErrorCode::GraphQueryFailed, e.message};
}

} // namespace

Result<std::shared_ptr<SqliteGraphStore>> SqliteGraphStore::open(const std::string& path,
                                                                  SqliteGraphStoreConfig config) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Error{ErrorCode::NotFound, "graph database not found: " + path};
    }

    auto store = std::shared_ptr<SqliteGraphStore>(new SqliteGraphStore(path, config));
    auto health = store->healthCheck();
    if (!health)
        return health.error();
    spdlog::debug("sqlite graph store ready at {}", path);
    return store;
}

template <typename Fn>
auto SqliteGraphStore::withConnection(std::optional<Deadline> deadline, Fn&& fn)
    -> decltype(fn(std::declval<Database&>())) {
    Database db;
    auto opened = db.open(path_, ConnectionMode::ReadOnly);
    if (!opened)
        return toGraphError(opened.error());
    auto busy = db.setBusyTimeout(config_.busyTimeout);
    if (!busy)
        return toGraphError(busy.error());
    auto fnReg = db.registerCosineFunction();
    if (!fnReg)
        return toGraphError(fnReg.error());
    db.setDeadline(deadline);

    auto result = fn(db);
    if (!result) {
        spdlog::error("sqlite graph store query failed: {}", result.error().message);
        return toGraphError(result.error());
    }
    return result;
}

Result<std::vector<ChunkRecord>> SqliteGraphStore::scanByLabel(const std::string& ns) {
    std::optional<Deadline> deadline;
    if (config_.queryTimeout)
        deadline = std::chrono::steady_clock::now() + *config_.queryTimeout;

    return withConnection(deadline, [&](Database& db) -> Result<std::vector<ChunkRecord>> {
        auto stmtR = db.prepare(std::string("SELECT ") + kChunkColumns +
                                " FROM chunks WHERE namespace = ? AND text IS NOT NULL"
                                " ORDER BY id");
        if (!stmtR)
            return stmtR.error();
        auto stmt = std::move(stmtR).value();
        auto br = stmt.bind(1, ns);
        if (!br)
            return br.error();

        std::vector<ChunkRecord> out;
        while (true) {
            auto step = stmt.step();
            if (!step)
                return step.error();
            if (!step.value())
                break;
            out.push_back(readChunk(stmt));
        }
        return out;
    });
}

Result<std::vector<SimilarityHit>> SqliteGraphStore::similarity(const std::string& ns,
                                                                const std::vector<float>& query,
                                                                size_t limit) {
    if (query.empty() || limit == 0)
        return std::vector<SimilarityHit>{};

    std::optional<Deadline> deadline;
    if (config_.queryTimeout)
        deadline = std::chrono::steady_clock::now() + *config_.queryTimeout;

    const auto queryBlob = packEmbedding(query);
    return withConnection(deadline, [&](Database& db) -> Result<std::vector<SimilarityHit>> {
        auto stmtR = db.prepare(std::string("SELECT ") + kChunkColumns +
                                ", kgrag_cosine(embedding, ?) AS score FROM chunks"
                                " WHERE namespace = ? AND text IS NOT NULL AND score IS NOT NULL"
                                " ORDER BY score DESC, id ASC LIMIT ?");
        if (!stmtR)
            return stmtR.error();
        auto stmt = std::move(stmtR).value();
        auto br = stmt.bindAll(std::span<const std::byte>(queryBlob), ns,
                               static_cast<int64_t>(limit));
        if (!br)
            return br.error();

        std::vector<SimilarityHit> out;
        while (true) {
            auto step = stmt.step();
            if (!step)
                return step.error();
            if (!step.value())
                break;
            auto score = static_cast<float>(stmt.getDouble(5));
            out.push_back(SimilarityHit{readChunk(stmt), score});
        }
        return out;
    });
}

Result<std::vector<NeighborRecord>>
SqliteGraphStore::neighbors(const std::vector<std::string>& seedIds, const std::string& ns,
                            const GraphTraversalOptions& options) {
    if (seedIds.empty())
        return std::vector<NeighborRecord>{};

    return withConnection(options.deadline, [&](Database& db) -> Result<std::vector<NeighborRecord>> {
        auto edgesOf = [&](const std::vector<std::string>& frontier,
                           TraversalDirection direction) -> Result<std::vector<GraphEdge>> {
            // rowid keeps edges unique when a frontier node matches both columns.
            std::map<int64_t, GraphEdge> found;
            auto collect = [&](const char* column,
                               const std::vector<std::string>& ids) -> Result<void> {
                for (size_t off = 0; off < ids.size(); off += kMaxIdsPerQuery) {
                    const size_t n = std::min(kMaxIdsPerQuery, ids.size() - off);
                    auto stmtR = db.prepare(
                        std::string("SELECT rowid, source_id, target_id, relation_type FROM edges"
                                    " WHERE namespace = ? AND ") +
                        column + " IN (" + placeholders(n) + ")");
                    if (!stmtR)
                        return stmtR.error();
                    auto stmt = std::move(stmtR).value();
                    auto br = stmt.bind(1, ns);
                    if (!br)
                        return br;
                    for (size_t i = 0; i < n; ++i) {
                        br = stmt.bind(static_cast<int>(i + 2), ids[off + i]);
                        if (!br)
                            return br;
                    }
                    while (true) {
                        auto step = stmt.step();
                        if (!step)
                            return step.error();
                        if (!step.value())
                            break;
                        found.emplace(stmt.getInt64(0),
                                      GraphEdge{stmt.getString(1), stmt.getString(2),
                                                stmt.getString(3)});
                    }
                }
                return {};
            };

            if (direction != TraversalDirection::Incoming) {
                auto r = collect("source_id", frontier);
                if (!r)
                    return r.error();
            }
            if (direction != TraversalDirection::Outgoing) {
                auto r = collect("target_id", frontier);
                if (!r)
                    return r.error();
            }

            std::vector<GraphEdge> edges;
            edges.reserve(found.size());
            for (auto& [rowid, edge] : found)
                edges.push_back(std::move(edge));
            return edges;
        };

        auto nodesOf = [&](const std::vector<std::string>& ids) -> Result<std::vector<ChunkRecord>> {
            std::vector<ChunkRecord> nodes;
            for (size_t off = 0; off < ids.size(); off += kMaxIdsPerQuery) {
                const size_t n = std::min(kMaxIdsPerQuery, ids.size() - off);
                auto stmtR = db.prepare(std::string("SELECT ") + kChunkColumns +
                                        " FROM chunks WHERE namespace = ? AND id IN (" +
                                        placeholders(n) + ") ORDER BY id");
                if (!stmtR)
                    return stmtR.error();
                auto stmt = std::move(stmtR).value();
                auto br = stmt.bind(1, ns);
                if (!br)
                    return br.error();
                for (size_t i = 0; i < n; ++i) {
                    br = stmt.bind(static_cast<int>(i + 2), ids[off + i]);
                    if (!br)
                        return br.error();
                }
                while (true) {
                    auto step = stmt.step();
                    if (!step)
                        return step.error();
                    if (!step.value())
                        break;
                    nodes.push_back(readChunk(stmt));
                }
            }
            return nodes;
        };

        return breadthFirstNeighbors(seedIds, options, edgesOf, nodesOf);
    });
}

Result<void> SqliteGraphStore::healthCheck() {
    return withConnection(std::nullopt, [](Database& db) -> Result<void> {
        for (const char* sql : {"SELECT 1 FROM chunks LIMIT 1", "SELECT 1 FROM edges LIMIT 1"}) {
            auto stmtR = db.prepare(sql);
            if (!stmtR)
                return stmtR.error();
            auto stmt = std::move(stmtR).value();
            auto step = stmt.step();
            if (!step)
                return step.error();
        }
        return {};
    });
}

} // namespace kgrag::graph
