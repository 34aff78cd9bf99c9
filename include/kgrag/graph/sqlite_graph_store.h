#pragma once

#include <kgrag/graph/database.h>
#include <kgrag/graph/graph_store.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace kgrag::graph {

/**
 * Table layout read by SqliteGraphStore. The store never writes; this is what
 * an ingestion job or a test fixture creates.
 *
 * chunks   one row per node. `namespace` is the label a retrieval scans,
 *          `text` NULL marks a structural node that is never a seed,
 *          `type` is the node kind (clause, chapter, document, ...),
 *          `embedding` is NULL or a blob of little-endian float32 values
 *          (see packEmbedding); the blob length fixes the dimension.
 * edges    directed, typed relations between chunk ids of one namespace.
 *          Traversal may follow them in either direction.
 */
inline constexpr const char* kSchemaSql = R"SQL(
CREATE TABLE IF NOT EXISTS chunks (
    namespace TEXT NOT NULL,
    id        TEXT NOT NULL,
    text      TEXT,
    type      TEXT NOT NULL DEFAULT 'other',
    parent_id TEXT,
    embedding BLOB,
    PRIMARY KEY (namespace, id)
);
CREATE TABLE IF NOT EXISTS edges (
    namespace     TEXT NOT NULL,
    source_id     TEXT NOT NULL,
    target_id     TEXT NOT NULL,
    relation_type TEXT NOT NULL DEFAULT 'RELATED_TO'
);
CREATE INDEX IF NOT EXISTS idx_edges_source ON edges(namespace, source_id);
CREATE INDEX IF NOT EXISTS idx_edges_target ON edges(namespace, target_id);
)SQL";

struct SqliteGraphStoreConfig {
    std::chrono::milliseconds busyTimeout{5000};
    // Applied to scans and similarity queries; traversals use their own deadline.
    std::optional<std::chrono::milliseconds> queryTimeout;
};

/**
 * @brief Read-only IGraphStore over a SQLite file.
 *
 * Every call opens its own read-only connection, so one store instance is
 * safe to share across request threads. Cosine similarity is evaluated inside
 * SQLite through the `kgrag_cosine` function registered on each connection.
 */
class SqliteGraphStore final : public IGraphStore {
public:
    static Result<std::shared_ptr<SqliteGraphStore>> open(const std::string& path,
                                                          SqliteGraphStoreConfig config = {});

    Result<std::vector<ChunkRecord>> scanByLabel(const std::string& ns) override;
    Result<std::vector<NeighborRecord>> neighbors(const std::vector<std::string>& seedIds,
                                                  const std::string& ns,
                                                  const GraphTraversalOptions& options) override;
    Result<std::vector<SimilarityHit>> similarity(const std::string& ns,
                                                  const std::vector<float>& query,
                                                  size_t limit) override;
    Result<void> healthCheck() override;
    std::string name() const override { return "sqlite"; }

    const std::string& path() const { return path_; }

private:
    SqliteGraphStore(std::string path, SqliteGraphStoreConfig config)
        : path_(std::move(path)), config_(config) {}

    template <typename Fn>
    auto withConnection(std::optional<Deadline> deadline, Fn&& fn) -> decltype(fn(
        std::declval<Database&>()));

    std::string path_;
    SqliteGraphStoreConfig config_;
};

} // namespace kgrag::graph
