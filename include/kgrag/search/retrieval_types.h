#pragma once

#include <kgrag/core/types.h>
#include <kgrag/graph/graph_store.h>
#include <kgrag/search/candidate.h>

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kgrag::search {

/**
 * @brief Named retrieval pipelines.
 *
 * lexical-only   - word-match seeds only
 * embedding-only - cosine similarity over the whole namespace
 * hybrid-fusion  - word-match seeds, annotated with cosine, fused
 * graph-exact    - word-match seeds expanded over the graph
 * graph-embed    - cosine top-k over the namespace expanded over the graph
 * graph-hybrid   - word-match seeds reranked by cosine, then expanded
 */
enum class RetrievalMode {
    LexicalOnly,
    EmbeddingOnly,
    HybridFusion,
    GraphExact,
    GraphEmbed,
    GraphHybrid
};

constexpr const char* retrievalModeToString(RetrievalMode mode) noexcept {
    switch (mode) {
        case RetrievalMode::LexicalOnly:
            return "lexical-only";
        case RetrievalMode::EmbeddingOnly:
            return "embedding-only";
        case RetrievalMode::HybridFusion:
            return "hybrid-fusion";
        case RetrievalMode::GraphExact:
            return "graph-exact";
        case RetrievalMode::GraphEmbed:
            return "graph-embed";
        case RetrievalMode::GraphHybrid:
            return "graph-hybrid";
    }
    return "unknown";
}

std::optional<RetrievalMode> retrievalModeFromString(std::string_view name);

enum class HopDiscount {
    Compound, ///< discount^hops
    Once      ///< discount applied once whatever the depth
};

constexpr const char* hopDiscountToString(HopDiscount d) noexcept {
    return d == HopDiscount::Once ? "once" : "compound";
}

std::optional<HopDiscount> hopDiscountFromString(std::string_view name);

inline constexpr size_t kMinTopK = 1;
inline constexpr size_t kMaxTopK = 50;
inline constexpr size_t kMaxHopDepth = 5;

/**
 * @brief Tuning knobs shared by every request of one orchestrator.
 */
struct RetrievalConfig {
    size_t seedCandidates = 20;
    size_t embedTopK = 5;
    size_t neighborLimit = 10; // per seed
    float neighborDiscount = 0.8f;
    size_t hopDepth = 1;
    HopDiscount hopDiscount = HopDiscount::Compound;
    float fusionAlpha = 0.5f;
    size_t rerankTopN = 5;
    size_t defaultTopK = 20;
    std::string defaultNamespace = "Chunk";
    size_t textPreviewChars = 100;

    std::chrono::milliseconds graphTimeout{5000};
    size_t failureThreshold = 3;
    graph::TraversalDirection direction = graph::TraversalDirection::Both;
};

struct RetrieveRequest {
    std::string query;
    std::optional<size_t> topK;             // RetrievalConfig::defaultTopK when unset
    std::optional<std::string> ns;          // RetrievalConfig::defaultNamespace when unset
    RetrievalMode mode = RetrievalMode::GraphHybrid;
    bool rerank = false;
    std::optional<size_t> rerankTopN;
    std::optional<size_t> hopDepth;
};

struct GraphContextEntry {
    std::string nodeId;
    std::string relationType;
    std::string textPreview;
};

struct StageTiming {
    std::string stage;
    double elapsedMs = 0.0;
};

/**
 * @brief Outcome of one retrieve() call.
 *
 * A graph failure is reported through `error` with empty candidates rather
 * than a partial list.
 */
struct RetrievalResult {
    std::vector<Candidate> candidates;
    std::vector<GraphContextEntry> graphContext;
    RetrievalMode modeUsed = RetrievalMode::GraphHybrid;
    bool embeddingUsed = false;
    bool reranked = false;
    std::vector<std::string> warnings;
    std::optional<Error> error;
    std::vector<StageTiming> timings;

    bool ok() const noexcept { return !error.has_value(); }

    nlohmann::json toJson(bool includeTimings = false) const;
};

} // namespace kgrag::search
