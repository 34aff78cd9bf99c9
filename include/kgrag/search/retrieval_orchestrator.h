#pragma once

#include <kgrag/core/types.h>
#include <kgrag/graph/graph_store.h>
#include <kgrag/providers/model_handle.h>
#include <kgrag/providers/model_services.h>
#include <kgrag/search/retrieval_types.h>

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kgrag::search {

/**
 * Individual steps a pipeline is built from. Modes are fixed sequences of
 * these; see RetrievalOrchestrator::pipelineFor.
 */
enum class PipelineStage {
    LexicalSeeds,    ///< word-match seeds from a namespace scan
    VectorRank,      ///< rerank and cap the current set by cosine similarity
    VectorNamespace, ///< cosine top-k over the whole namespace
    VectorAnnotate,  ///< attach cosine scores without filtering
    Fusion,          ///< lexical + embedding linear fusion
    SeedScores,      ///< put seeds on the [0, 1] scale used by neighbors
    GraphExpand      ///< add discounted graph neighbors of the seeds
};

constexpr const char* pipelineStageToString(PipelineStage stage) noexcept {
    switch (stage) {
        case PipelineStage::LexicalSeeds:
            return "lexical_seeds";
        case PipelineStage::VectorRank:
            return "vector_rank";
        case PipelineStage::VectorNamespace:
            return "vector_namespace";
        case PipelineStage::VectorAnnotate:
            return "vector_annotate";
        case PipelineStage::Fusion:
            return "fusion";
        case PipelineStage::SeedScores:
            return "seed_scores";
        case PipelineStage::GraphExpand:
            return "graph_expand";
    }
    return "unknown";
}

enum class GraphHealth { Available, Unavailable };

struct HealthStatus {
    GraphHealth graph = GraphHealth::Available;
    std::string storeName;
    size_t consecutiveFailures = 0;
    std::optional<Error> probeError;
    providers::ModelState embedding = providers::ModelState::Unloaded;
    providers::ModelState crossEncoder = providers::ModelState::Unloaded;
};

/**
 * @brief Composes the retrieval stages into named modes.
 *
 * Holds no per-request state, so one instance serves concurrent retrieve()
 * calls. The only shared mutable value is the consecutive graph-failure
 * counter behind health().
 */
class RetrievalOrchestrator {
public:
    RetrievalOrchestrator(std::shared_ptr<graph::IGraphStore> store,
                          std::shared_ptr<providers::ModelServices> models,
                          RetrievalConfig config = {});

    static const std::vector<PipelineStage>& pipelineFor(RetrievalMode mode);

    /// InvalidArgument for an unusable request or configuration.
    Result<void> validate(const RetrieveRequest& request) const;

    /**
     * @brief Run one request.
     *
     * Returns an error only for invalid input. Graph store failures produce a
     * result with empty candidates and `error` set; provider failures degrade
     * the affected stage and add a warning.
     */
    Result<RetrievalResult> retrieve(const RetrieveRequest& request) const;

    HealthStatus health() const;

    const RetrievalConfig& config() const noexcept { return config_; }

private:
    struct RequestState;

    std::optional<std::vector<float>> embedQuery(RequestState& state) const;
    // False when no working candidate can be compared with `query`; warns about skipped ones.
    bool checkCoverage(RequestState& state, const std::vector<float>& query) const;
    void recordGraphFailure(const Error& error) const;
    void finish(RequestState& state) const;

    std::shared_ptr<graph::IGraphStore> store_;
    std::shared_ptr<providers::ModelServices> models_;
    RetrievalConfig config_;
    mutable std::atomic<size_t> consecutiveGraphFailures_{0};
};

} // namespace kgrag::search
