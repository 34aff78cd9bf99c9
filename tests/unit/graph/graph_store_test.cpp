#include <gtest/gtest.h>

#include <kgrag/graph/in_memory_graph_store.h>

#include "../../common/retrieval_fakes.h"

#include <nlohmann/json.hpp>

using namespace kgrag;
using namespace kgrag::graph;
using kgrag::tests::makeChunk;

namespace {

std::vector<std::string> nodeIds(const std::vector<NeighborRecord>& records) {
    std::vector<std::string> out;
    for (const auto& r : records)
        out.push_back(r.node.id);
    return out;
}

} // namespace

TEST(InMemoryGraphStoreTest, ScanReturnsTextNodesInIdOrder) {
    InMemoryGraphStore store;
    store.addChunk("Chunk", makeChunk("b", "beta"));
    store.addChunk("Chunk", makeChunk("a", "alpha"));
    ChunkRecord bare;
    bare.id = "0";
    store.addChunk("Chunk", bare);
    store.addChunk("Other", makeChunk("z", "zeta"));

    auto scan = store.scanByLabel("Chunk");
    ASSERT_TRUE(scan);
    ASSERT_EQ(scan.value().size(), 2u);
    EXPECT_EQ(scan.value()[0].id, "a");
    EXPECT_EQ(scan.value()[1].id, "b");
    EXPECT_EQ(store.nodeCount("Chunk"), 3u);
}

TEST(InMemoryGraphStoreTest, UnknownNamespaceIsEmpty) {
    InMemoryGraphStore store;
    auto scan = store.scanByLabel("Missing");
    ASSERT_TRUE(scan);
    EXPECT_TRUE(scan.value().empty());
    auto n = store.neighbors({"x"}, "Missing", {});
    ASSERT_TRUE(n);
    EXPECT_TRUE(n.value().empty());
}

TEST(InMemoryGraphStoreTest, DirectionFiltersEdges) {
    InMemoryGraphStore store;
    for (auto id : {"a", "b", "c"})
        store.addChunk("Chunk", makeChunk(id, id));
    store.addEdge("Chunk", GraphEdge{"a", "b", "CITES"});
    store.addEdge("Chunk", GraphEdge{"c", "a", "AMENDS"});

    GraphTraversalOptions opts;
    opts.direction = TraversalDirection::Outgoing;
    auto out = store.neighbors({"a"}, "Chunk", opts);
    ASSERT_TRUE(out);
    EXPECT_EQ(nodeIds(out.value()), (std::vector<std::string>{"b"}));

    opts.direction = TraversalDirection::Incoming;
    out = store.neighbors({"a"}, "Chunk", opts);
    ASSERT_TRUE(out);
    EXPECT_EQ(nodeIds(out.value()), (std::vector<std::string>{"c"}));

    opts.direction = TraversalDirection::Both;
    out = store.neighbors({"a"}, "Chunk", opts);
    ASSERT_TRUE(out);
    EXPECT_EQ(nodeIds(out.value()), (std::vector<std::string>{"b", "c"}));
}

TEST(InMemoryGraphStoreTest, MultiHopWalksThroughTextlessNodes) {
    InMemoryGraphStore store;
    store.addChunk("Chunk", makeChunk("s", "seed"));
    ChunkRecord hub;
    hub.id = "hub";
    store.addChunk("Chunk", hub);
    store.addChunk("Chunk", makeChunk("far", "far away"));
    store.addEdge("Chunk", GraphEdge{"s", "hub", "PART_OF"});
    store.addEdge("Chunk", GraphEdge{"hub", "far", "HAS_PART"});

    GraphTraversalOptions opts;
    opts.maxHops = 1;
    auto one = store.neighbors({"s"}, "Chunk", opts);
    ASSERT_TRUE(one);
    EXPECT_TRUE(one.value().empty());

    opts.maxHops = 2;
    auto two = store.neighbors({"s"}, "Chunk", opts);
    ASSERT_TRUE(two);
    ASSERT_EQ(two.value().size(), 1u);
    EXPECT_EQ(two.value()[0].node.id, "far");
    EXPECT_EQ(two.value()[0].hops, 2u);
    EXPECT_EQ(two.value()[0].edge.relationType, "HAS_PART");
    EXPECT_EQ(two.value()[0].seedId, "s");
}

TEST(InMemoryGraphStoreTest, SeedIsNotItsOwnNeighbor) {
    InMemoryGraphStore store;
    store.addChunk("Chunk", makeChunk("a", "a"));
    store.addChunk("Chunk", makeChunk("b", "b"));
    store.addEdge("Chunk", GraphEdge{"a", "a", "SELF"});
    store.addEdge("Chunk", GraphEdge{"a", "b", "CITES"});
    GraphTraversalOptions opts;
    opts.maxHops = 3;
    auto out = store.neighbors({"a"}, "Chunk", opts);
    ASSERT_TRUE(out);
    EXPECT_EQ(nodeIds(out.value()), (std::vector<std::string>{"b"}));
}

TEST(InMemoryGraphStoreTest, DefaultSimilaritySkipsMismatchedVectors) {
    InMemoryGraphStore store;
    store.addChunk("Chunk", makeChunk("x", "x", std::vector<float>{1.0f, 0.0f}));
    store.addChunk("Chunk", makeChunk("y", "y", std::vector<float>{0.7f, 0.7f}));
    store.addChunk("Chunk", makeChunk("z", "z", std::vector<float>{1.0f}));
    store.addChunk("Chunk", makeChunk("w", "w"));

    auto hits = store.similarity("Chunk", {1.0f, 0.0f}, 10);
    ASSERT_TRUE(hits);
    ASSERT_EQ(hits.value().size(), 2u);
    EXPECT_EQ(hits.value()[0].chunk.id, "x");
    EXPECT_NEAR(hits.value()[0].score, 1.0f, 1e-6f);
    EXPECT_EQ(hits.value()[1].chunk.id, "y");
}

TEST(InMemoryGraphStoreTest, LoadsJsonDocument) {
    auto doc = nlohmann::json::parse(R"({
        "namespace": "Chunk",
        "nodes": [
            {"id": "d1", "text": "Luật thuế", "type": "document"},
            {"id": "c1", "text": "Điều 1", "type": "clause", "parent_id": "d1",
             "embedding": [0.5, 0.5]},
            {"id": "x", "type": "chapter"}
        ],
        "edges": [ {"source": "c1", "target": "d1", "type": "PART_OF"},
                   {"source": "d1", "target": "x"} ]
    })");
    InMemoryGraphStore store;
    ASSERT_TRUE(store.loadJson(doc));
    EXPECT_EQ(store.nodeCount("Chunk"), 3u);
    EXPECT_EQ(store.edgeCount("Chunk"), 2u);

    auto scan = store.scanByLabel("Chunk");
    ASSERT_TRUE(scan);
    ASSERT_EQ(scan.value().size(), 2u);
    const auto& c1 = scan.value()[0];
    EXPECT_EQ(c1.id, "c1");
    EXPECT_EQ(c1.type, ChunkType::Clause);
    EXPECT_EQ(c1.parentId, std::optional<std::string>("d1"));
    ASSERT_TRUE(c1.hasEmbedding());
    EXPECT_EQ(c1.embedding->size(), 2u);
}

TEST(InMemoryGraphStoreTest, RejectsMalformedJson) {
    InMemoryGraphStore store;
    auto r = store.loadJson(nlohmann::json::parse(R"({"nodes": [{"text": "no id"}]})"));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidData);

    auto missing = InMemoryGraphStore::fromJsonFile("/nonexistent/kgrag/graph.json");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);
}

TEST(InMemoryGraphStoreTest, FromJsonFileLoadsSeveralNamespaces) {
    auto dir = kgrag::tests::make_temp_dir();
    auto path = kgrag::tests::write_file(dir / "graph.json", R"([
        {"namespace": "Chunk", "nodes": [{"id": "a", "text": "x"}]},
        {"namespace": "Article", "nodes": [{"id": "b", "text": "y"}, {"id": "c", "text": "z"}]}
    ])");
    auto store = InMemoryGraphStore::fromJsonFile(path);
    ASSERT_TRUE(store);
    EXPECT_EQ(store.value()->nodeCount("Chunk"), 1u);
    EXPECT_EQ(store.value()->nodeCount("Article"), 2u);
    std::filesystem::remove_all(dir);
}

TEST(ChunkTypeTest, ParsesKnownNamesAndFallsBackToOther) {
    EXPECT_EQ(chunkTypeFromString("clause"), ChunkType::Clause);
    EXPECT_EQ(chunkTypeFromString("subpoint"), ChunkType::Subpoint);
    EXPECT_EQ(chunkTypeFromString("appendix"), ChunkType::Other);
    EXPECT_STREQ(chunkTypeToString(ChunkType::Chapter), "chapter");
}
