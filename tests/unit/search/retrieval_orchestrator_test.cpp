#include <gtest/gtest.h>

#include <kgrag/graph/in_memory_graph_store.h>
#include <kgrag/search/retrieval_orchestrator.h>

#include "../../common/retrieval_fakes.h"

#include <nlohmann/json.hpp>

#include <set>
#include <thread>

using namespace kgrag;
using namespace kgrag::search;
using kgrag::tests::FailingGraphStore;
using kgrag::tests::FakeCrossEncoder;
using kgrag::tests::FakeEmbeddingProvider;
using kgrag::tests::makeChunk;
using kgrag::tests::makeModels;

namespace {

constexpr const char* kQuery = "thuế suất";

std::vector<std::string> ids(const RetrievalResult& r) {
    std::vector<std::string> out;
    for (const auto& c : r.candidates)
        out.push_back(c.chunkId);
    return out;
}

class RetrievalOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<graph::InMemoryGraphStore>();
        store_->addChunk("Chunk", makeChunk("c1", "thuế suất giá trị gia tăng",
                                            std::vector<float>{1.0f, 0.0f}));
        store_->addChunk("Chunk", makeChunk("c2", "thuế thu nhập", std::vector<float>{0.6f, 0.8f}));
        store_->addChunk("Chunk", makeChunk("c3", "quy định chung", std::vector<float>{0.0f, 1.0f}));
        store_->addChunk("Chunk", makeChunk("c4", "điều khoản thuế suất ưu đãi",
                                            std::vector<float>{0.8f, 0.6f}));
        store_->addEdge("Chunk", GraphEdge{"c1", "c3", "CITES"});
        store_->addEdge("Chunk", GraphEdge{"c4", "c2", "AMENDS"});

        embedder_ = std::make_shared<FakeEmbeddingProvider>(
            std::map<std::string, std::vector<float>>{{kQuery, {1.0f, 0.0f}}});
        crossEncoder_ = std::make_shared<FakeCrossEncoder>(
            [](const std::string&, const std::string& text) {
                return static_cast<float>(text.size());
            });
    }

    RetrievalOrchestrator make(RetrievalConfig config = {}) {
        return RetrievalOrchestrator(store_, makeModels(embedder_, crossEncoder_), config);
    }

    static RetrieveRequest request(RetrievalMode mode, std::optional<size_t> topK = std::nullopt) {
        RetrieveRequest r;
        r.query = kQuery;
        r.mode = mode;
        r.topK = topK;
        return r;
    }

    std::shared_ptr<graph::InMemoryGraphStore> store_;
    std::shared_ptr<FakeEmbeddingProvider> embedder_;
    std::shared_ptr<FakeCrossEncoder> crossEncoder_;
};

const std::vector<RetrievalMode> kAllModes{
    RetrievalMode::LexicalOnly, RetrievalMode::EmbeddingOnly, RetrievalMode::HybridFusion,
    RetrievalMode::GraphExact,  RetrievalMode::GraphEmbed,    RetrievalMode::GraphHybrid};

} // namespace

TEST_F(RetrievalOrchestratorTest, EveryModeReturnsUniqueIdsWithinTopK) {
    auto orch = make();
    for (auto mode : kAllModes) {
        for (size_t topK : {1u, 2u, 20u}) {
            auto r = orch.retrieve(request(mode, topK));
            ASSERT_TRUE(r) << retrievalModeToString(mode);
            ASSERT_TRUE(r.value().ok());
            EXPECT_LE(r.value().candidates.size(), topK);
            auto list = ids(r.value());
            std::set<std::string> unique(list.begin(), list.end());
            EXPECT_EQ(unique.size(), list.size()) << retrievalModeToString(mode);
            EXPECT_EQ(r.value().modeUsed, mode);
        }
    }
}

TEST_F(RetrievalOrchestratorTest, DefaultModeIsGraphHybrid) {
    RetrieveRequest r;
    r.query = kQuery;
    auto out = make().retrieve(r);
    ASSERT_TRUE(out);
    EXPECT_EQ(out.value().modeUsed, RetrievalMode::GraphHybrid);
}

TEST_F(RetrievalOrchestratorTest, GraphExactNormalizesSeedsAndDiscountsNeighbors) {
    auto out = make().retrieve(request(RetrievalMode::GraphExact));
    ASSERT_TRUE(out);
    const auto& r = out.value();
    EXPECT_EQ(ids(r), (std::vector<std::string>{"c1", "c4", "c3", "c2"}));
    EXPECT_FALSE(r.embeddingUsed);

    EXPECT_NEAR(*r.candidates[0].hybridScore, 1.0f, 1e-6f);
    EXPECT_NEAR(*r.candidates[2].hybridScore, 0.8f, 1e-6f);
    EXPECT_FALSE(r.candidates[2].isSeed);
    EXPECT_NEAR(*r.candidates[3].hybridScore, 0.5f, 1e-6f);
    EXPECT_TRUE(r.candidates[3].isSeed);

    ASSERT_EQ(r.graphContext.size(), 1u);
    EXPECT_EQ(r.graphContext[0].nodeId, "c3");
    EXPECT_EQ(r.graphContext[0].relationType, "CITES");
    EXPECT_EQ(r.graphContext[0].textPreview, "quy định chung");
}

TEST_F(RetrievalOrchestratorTest, GraphHybridRanksSeedsByEmbedding) {
    auto out = make().retrieve(request(RetrievalMode::GraphHybrid));
    ASSERT_TRUE(out);
    const auto& r = out.value();
    EXPECT_TRUE(r.embeddingUsed);
    EXPECT_TRUE(r.warnings.empty());
    ASSERT_EQ(r.candidates.size(), 4u);
    EXPECT_EQ(r.candidates[0].chunkId, "c1");
    EXPECT_EQ(r.candidates[1].chunkId, "c4");
    EXPECT_NEAR(*r.candidates[1].hybridScore, 0.9f, 1e-5f);
}

TEST_F(RetrievalOrchestratorTest, EmbeddingFailureFallsBackToLexicalOrder) {
    embedder_->fail = true;
    auto orch = make();

    auto fused = orch.retrieve(request(RetrievalMode::HybridFusion));
    auto lexical = orch.retrieve(request(RetrievalMode::LexicalOnly));
    ASSERT_TRUE(fused);
    ASSERT_TRUE(lexical);
    EXPECT_FALSE(fused.value().embeddingUsed);
    EXPECT_EQ(ids(fused.value()), ids(lexical.value()));
    ASSERT_EQ(fused.value().warnings.size(), 1u);
    EXPECT_NE(fused.value().warnings[0].find("embedding unavailable"), std::string::npos);

    auto hybrid = orch.retrieve(request(RetrievalMode::GraphHybrid));
    auto exact = orch.retrieve(request(RetrievalMode::GraphExact));
    ASSERT_TRUE(hybrid);
    ASSERT_TRUE(exact);
    EXPECT_FALSE(hybrid.value().embeddingUsed);
    EXPECT_TRUE(hybrid.value().ok());
    EXPECT_EQ(ids(hybrid.value()), ids(exact.value()));
}

TEST_F(RetrievalOrchestratorTest, ThrowingEmbeddingProviderDegrades) {
    embedder_->throwOnEmbed = true;
    auto out = make().retrieve(request(RetrievalMode::GraphHybrid));
    ASSERT_TRUE(out);
    EXPECT_TRUE(out.value().ok());
    EXPECT_FALSE(out.value().embeddingUsed);
    EXPECT_FALSE(out.value().warnings.empty());
}

TEST_F(RetrievalOrchestratorTest, EmbeddingOnlyWithoutModelIsEmptyWithWarning) {
    RetrievalOrchestrator orch(store_, makeModels(nullptr), {});
    auto out = orch.retrieve(request(RetrievalMode::EmbeddingOnly));
    ASSERT_TRUE(out);
    EXPECT_TRUE(out.value().ok());
    EXPECT_TRUE(out.value().candidates.empty());
    EXPECT_FALSE(out.value().warnings.empty());
    EXPECT_EQ(orch.health().embedding, providers::ModelState::Failed);
}

TEST_F(RetrievalOrchestratorTest, EmbeddingOnlyUsesWholeNamespace) {
    auto out = make().retrieve(request(RetrievalMode::EmbeddingOnly, 3));
    ASSERT_TRUE(out);
    EXPECT_EQ(ids(out.value()), (std::vector<std::string>{"c1", "c4", "c2"}));
    for (const auto& c : out.value().candidates)
        EXPECT_TRUE(c.isSeed);
}

TEST_F(RetrievalOrchestratorTest, IsolatedSeedReturnsSeedSetOnly) {
    auto isolated = std::make_shared<graph::InMemoryGraphStore>();
    isolated->addChunk("Chunk", makeChunk("s", "thuế suất"));
    isolated->addChunk("Chunk", makeChunk("o", "unrelated"));
    RetrievalOrchestrator orch(isolated, makeModels(embedder_), {});

    auto graph = orch.retrieve(request(RetrievalMode::GraphExact));
    auto lexical = orch.retrieve(request(RetrievalMode::LexicalOnly));
    ASSERT_TRUE(graph);
    ASSERT_TRUE(lexical);
    EXPECT_EQ(ids(graph.value()), ids(lexical.value()));
    EXPECT_TRUE(graph.value().graphContext.empty());
}

TEST_F(RetrievalOrchestratorTest, ScanFailureYieldsEmptyErrorResult) {
    auto failing = std::make_shared<FailingGraphStore>(store_);
    failing->failScan = true;
    RetrievalOrchestrator orch(failing, makeModels(embedder_), {});

    auto out = orch.retrieve(request(RetrievalMode::GraphHybrid));
    ASSERT_TRUE(out);
    const auto& r = out.value();
    EXPECT_FALSE(r.ok());
    EXPECT_TRUE(r.candidates.empty());
    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(r.error->code, ErrorCode::GraphQueryFailed);
    ASSERT_FALSE(r.warnings.empty());
    EXPECT_NE(r.warnings.back().find("lexical_seeds"), std::string::npos);

    auto json = r.toJson();
    EXPECT_TRUE(json["candidates"].empty());
    EXPECT_TRUE(json.contains("error"));
}

TEST_F(RetrievalOrchestratorTest, TraversalTimeoutAbortsRequest) {
    auto failing = std::make_shared<FailingGraphStore>(store_);
    failing->failNeighbors = true;
    RetrievalOrchestrator orch(failing, makeModels(embedder_), {});

    auto out = orch.retrieve(request(RetrievalMode::GraphExact));
    ASSERT_TRUE(out);
    EXPECT_TRUE(out.value().candidates.empty());
    ASSERT_TRUE(out.value().error.has_value());
    EXPECT_EQ(out.value().error->code, ErrorCode::GraphQueryFailed);

    // Modes without graph expansion do not traverse.
    auto lexical = orch.retrieve(request(RetrievalMode::LexicalOnly));
    ASSERT_TRUE(lexical);
    EXPECT_TRUE(lexical.value().ok());
}

TEST_F(RetrievalOrchestratorTest, RepeatedGraphFailuresTripHealth) {
    auto failing = std::make_shared<FailingGraphStore>(store_);
    failing->failScan = true;
    RetrievalConfig cfg;
    cfg.failureThreshold = 3;
    RetrievalOrchestrator orch(failing, makeModels(embedder_), cfg);

    EXPECT_EQ(orch.health().graph, GraphHealth::Available);
    for (int i = 0; i < 2; ++i)
        ASSERT_TRUE(orch.retrieve(request(RetrievalMode::LexicalOnly)));
    EXPECT_EQ(orch.health().graph, GraphHealth::Available);
    ASSERT_TRUE(orch.retrieve(request(RetrievalMode::LexicalOnly)));
    auto tripped = orch.health();
    EXPECT_EQ(tripped.graph, GraphHealth::Unavailable);
    EXPECT_EQ(tripped.consecutiveFailures, 3u);
    EXPECT_EQ(tripped.storeName, "failing");

    failing->failScan = false;
    auto ok = orch.retrieve(request(RetrievalMode::LexicalOnly));
    ASSERT_TRUE(ok);
    EXPECT_TRUE(ok.value().ok());
    EXPECT_EQ(orch.health().graph, GraphHealth::Available);
    EXPECT_EQ(orch.health().consecutiveFailures, 0u);
}

TEST_F(RetrievalOrchestratorTest, FailedProbeReportsUnavailable) {
    auto failing = std::make_shared<FailingGraphStore>(store_);
    failing->failHealth = true;
    RetrievalOrchestrator orch(failing, makeModels(embedder_), {});
    auto status = orch.health();
    EXPECT_EQ(status.graph, GraphHealth::Unavailable);
    ASSERT_TRUE(status.probeError.has_value());
}

TEST_F(RetrievalOrchestratorTest, InvalidRequestsAreRejected) {
    auto orch = make();
    auto expectInvalid = [&](RetrieveRequest r) {
        auto out = orch.retrieve(r);
        ASSERT_FALSE(out);
        EXPECT_EQ(out.error().code, ErrorCode::InvalidArgument);
    };

    auto blank = request(RetrievalMode::GraphHybrid);
    blank.query = "   ";
    expectInvalid(blank);
    expectInvalid(request(RetrievalMode::GraphHybrid, 0));
    expectInvalid(request(RetrievalMode::GraphHybrid, 51));

    auto deep = request(RetrievalMode::GraphExact);
    deep.hopDepth = 6;
    expectInvalid(deep);

    auto noNs = request(RetrievalMode::GraphExact);
    noNs.ns = "";
    expectInvalid(noNs);

    auto noRerank = request(RetrievalMode::GraphExact);
    noRerank.rerank = true;
    noRerank.rerankTopN = 0;
    expectInvalid(noRerank);

    RetrievalConfig badAlpha;
    badAlpha.fusionAlpha = 2.0f;
    auto out = make(badAlpha).retrieve(request(RetrievalMode::LexicalOnly));
    ASSERT_FALSE(out);
    EXPECT_EQ(out.error().code, ErrorCode::InvalidArgument);
}

TEST_F(RetrievalOrchestratorTest, MissingStoreIsNotInitialized) {
    RetrievalOrchestrator orch(nullptr, makeModels(embedder_), {});
    auto out = orch.retrieve(request(RetrievalMode::LexicalOnly));
    ASSERT_FALSE(out);
    EXPECT_EQ(out.error().code, ErrorCode::NotInitialized);
}

TEST_F(RetrievalOrchestratorTest, UnknownNamespaceIsEmptyNotError) {
    auto r = request(RetrievalMode::GraphHybrid);
    r.ns = "Article";
    auto out = make().retrieve(r);
    ASSERT_TRUE(out);
    EXPECT_TRUE(out.value().ok());
    EXPECT_TRUE(out.value().candidates.empty());
}

TEST_F(RetrievalOrchestratorTest, HopDepthZeroSkipsNeighbors) {
    auto r = request(RetrievalMode::GraphExact);
    r.hopDepth = 0;
    auto out = make().retrieve(r);
    ASSERT_TRUE(out);
    EXPECT_EQ(ids(out.value()), (std::vector<std::string>{"c1", "c4", "c2"}));
}

TEST_F(RetrievalOrchestratorTest, RerankWithThrowingModelUsesFallbackScores) {
    crossEncoder_->throwOnScore = true;
    auto r = request(RetrievalMode::GraphExact);
    r.rerank = true;
    r.rerankTopN = 3;
    auto out = make().retrieve(r);
    ASSERT_TRUE(out);
    const auto& res = out.value();
    EXPECT_FALSE(res.reranked);
    EXPECT_FALSE(res.warnings.empty());
    EXPECT_EQ(ids(res), (std::vector<std::string>{"c1", "c4", "c3"}));
    EXPECT_FLOAT_EQ(*res.candidates[0].rerankScore, 1.0f);
    EXPECT_FLOAT_EQ(*res.candidates[1].rerankScore, 0.9f);
    EXPECT_FLOAT_EQ(*res.candidates[2].rerankScore, 0.8f);
}

TEST_F(RetrievalOrchestratorTest, RerankOrdersByCrossEncoderScore) {
    auto r = request(RetrievalMode::LexicalOnly);
    r.rerank = true;
    r.rerankTopN = 2;
    auto out = make().retrieve(r);
    ASSERT_TRUE(out);
    EXPECT_TRUE(out.value().reranked);
    // The fake scores by byte length: c4 and c1 carry the longest texts.
    EXPECT_EQ(ids(out.value()), (std::vector<std::string>{"c4", "c1"}));
}

TEST_F(RetrievalOrchestratorTest, RepeatedRequestsAreIdentical) {
    auto orch = make();
    auto first = orch.retrieve(request(RetrievalMode::GraphHybrid));
    auto second = orch.retrieve(request(RetrievalMode::GraphHybrid));
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_EQ(first.value().toJson().dump(), second.value().toJson().dump());
}

TEST_F(RetrievalOrchestratorTest, ConcurrentRequestsShareOneModelLoad) {
    auto models = makeModels(embedder_, crossEncoder_);
    RetrievalOrchestrator orch(store_, models, {});
    const std::string expected = orch.retrieve(request(RetrievalMode::GraphHybrid))
                                     .value()
                                     .toJson()
                                     .dump();

    std::vector<std::thread> threads;
    std::atomic<int> mismatches{0};
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 20; ++i) {
                auto out = orch.retrieve(request(RetrievalMode::GraphHybrid));
                if (!out || out.value().toJson().dump() != expected)
                    ++mismatches;
            }
        });
    }
    for (auto& th : threads)
        th.join();

    EXPECT_EQ(mismatches.load(), 0);
    EXPECT_EQ(models->embeddingHandle().loadCount(), 1u);
    EXPECT_EQ(orch.health().embedding, providers::ModelState::Ready);
}

TEST_F(RetrievalOrchestratorTest, TimingsListEveryStage) {
    auto out = make().retrieve(request(RetrievalMode::GraphHybrid));
    ASSERT_TRUE(out);
    std::vector<std::string> stages;
    for (const auto& t : out.value().timings)
        stages.push_back(t.stage);
    EXPECT_EQ(stages, (std::vector<std::string>{"lexical_seeds", "vector_rank", "seed_scores",
                                                "graph_expand"}));
    auto json = out.value().toJson(true);
    EXPECT_TRUE(json.contains("timings_ms"));
    EXPECT_FALSE(out.value().toJson().contains("timings_ms"));
}

TEST_F(RetrievalOrchestratorTest, QueryDimensionMismatchDegradesWithWarning) {
    embedder_ = std::make_shared<FakeEmbeddingProvider>(
        std::map<std::string, std::vector<float>>{{kQuery, {1.0f, 0.0f, 0.0f}}});
    auto orch = make();

    auto hybrid = orch.retrieve(request(RetrievalMode::GraphHybrid));
    auto exact = orch.retrieve(request(RetrievalMode::GraphExact));
    ASSERT_TRUE(hybrid);
    ASSERT_TRUE(exact);
    EXPECT_TRUE(hybrid.value().ok());
    EXPECT_FALSE(hybrid.value().embeddingUsed);
    EXPECT_EQ(ids(hybrid.value()), ids(exact.value()));
    ASSERT_EQ(hybrid.value().warnings.size(), 1u);
    EXPECT_NE(hybrid.value().warnings[0].find("3-dimensional"), std::string::npos);

    auto fused = orch.retrieve(request(RetrievalMode::HybridFusion));
    auto lexical = orch.retrieve(request(RetrievalMode::LexicalOnly));
    ASSERT_TRUE(fused);
    ASSERT_TRUE(lexical);
    EXPECT_FALSE(fused.value().embeddingUsed);
    EXPECT_EQ(ids(fused.value()), ids(lexical.value()));
    EXPECT_FALSE(fused.value().warnings.empty());

    auto embedOnly = orch.retrieve(request(RetrievalMode::EmbeddingOnly));
    ASSERT_TRUE(embedOnly);
    EXPECT_TRUE(embedOnly.value().candidates.empty());
    EXPECT_FALSE(embedOnly.value().embeddingUsed);
    ASSERT_FALSE(embedOnly.value().warnings.empty());
    EXPECT_NE(embedOnly.value().warnings[0].find("comparable"), std::string::npos);
}

TEST_F(RetrievalOrchestratorTest, PartiallyComparableSeedsAreCountedInWarning) {
    store_->addChunk("Chunk", makeChunk("c5", "phụ lục thuế suất", std::vector<float>{1.0f, 0.0f, 0.0f}));
    auto out = make().retrieve(request(RetrievalMode::GraphHybrid));
    ASSERT_TRUE(out);
    const auto& r = out.value();
    EXPECT_TRUE(r.embeddingUsed);
    for (const auto& id : ids(r))
        EXPECT_NE(id, "c5");
    ASSERT_EQ(r.warnings.size(), 1u);
    EXPECT_NE(r.warnings[0].find("1 of 4 candidates skipped"), std::string::npos);
}

TEST(RetrievalResultJsonTest, MalformedTextIsReplacedBeforeSerialization) {
    RetrievalResult result;
    Candidate c;
    c.chunkId = "c\xC0\xAF";
    c.text = "thu\xED\xA0\x80 suất";
    c.relationType = std::string("CITES\xFF");
    result.candidates.push_back(c);
    result.graphContext.push_back(GraphContextEntry{"n\xE0\x80\x80", "PART_OF", "\xF4\x90\x80\x80"});
    result.warnings.push_back("seed \x80 dropped");
    result.error = Error{ErrorCode::GraphQueryFailed, "bad \xED\xB0\x80 id"};

    auto doc = result.toJson();
    std::string text;
    ASSERT_NO_THROW(text = doc.dump());
    auto parsed = nlohmann::json::parse(text);
    EXPECT_EQ(parsed["candidates"][0]["id"], "c??");
    EXPECT_EQ(parsed["candidates"][0]["text"], "thu??? suất");
    EXPECT_EQ(parsed["candidates"][0]["relation_type"], "CITES?");
    EXPECT_EQ(parsed["graph_context"][0]["node_id"], "n???");
    EXPECT_EQ(parsed["graph_context"][0]["text_preview"], "????");
    EXPECT_EQ(parsed["warnings"][0], "seed ? dropped");
    EXPECT_EQ(parsed["error"]["message"], "bad ??? id");
}
