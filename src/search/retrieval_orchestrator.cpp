#include <kgrag/common/utf8_utils.h>
#include <kgrag/search/cross_encoder_reranker.h>
#include <kgrag/search/graph_neighbor_expander.h>
#include <kgrag/search/lexical_seed_selector.h>
#include <kgrag/search/retrieval_orchestrator.h>
#include <kgrag/search/score_fusion.h>
#include <kgrag/search/vector_similarity_ranker.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <exception>
#include <iterator>

namespace kgrag::search {

struct RetrievalOrchestrator::RequestState {
    const RetrieveRequest& request;
    std::string ns;
    size_t topK = 0;
    size_t hopDepth = 0;
    size_t rerankTopN = 0;

    RetrievalResult result;
    std::vector<Candidate> working;
    std::vector<Candidate> neighbors;
    bool lastSignalEmbedding = false;
    bool embeddingAttempted = false;
    std::optional<std::vector<float>> queryVector;
};

namespace {

double elapsedMs(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - since)
        .count();
}

bool isBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace

RetrievalOrchestrator::RetrievalOrchestrator(std::shared_ptr<graph::IGraphStore> store,
                                             std::shared_ptr<providers::ModelServices> models,
                                             RetrievalConfig config)
    : store_(std::move(store)), models_(std::move(models)), config_(std::move(config)) {}

const std::vector<PipelineStage>& RetrievalOrchestrator::pipelineFor(RetrievalMode mode) {
    using S = PipelineStage;
    static const std::vector<S> kLexicalOnly{S::LexicalSeeds};
    static const std::vector<S> kEmbeddingOnly{S::VectorNamespace};
    static const std::vector<S> kHybridFusion{S::LexicalSeeds, S::VectorAnnotate, S::Fusion};
    static const std::vector<S> kGraphExact{S::LexicalSeeds, S::SeedScores, S::GraphExpand};
    static const std::vector<S> kGraphEmbed{S::VectorNamespace, S::SeedScores, S::GraphExpand};
    static const std::vector<S> kGraphHybrid{S::LexicalSeeds, S::VectorRank, S::SeedScores,
                                             S::GraphExpand};

    switch (mode) {
        case RetrievalMode::LexicalOnly:
            return kLexicalOnly;
        case RetrievalMode::EmbeddingOnly:
            return kEmbeddingOnly;
        case RetrievalMode::HybridFusion:
            return kHybridFusion;
        case RetrievalMode::GraphExact:
            return kGraphExact;
        case RetrievalMode::GraphEmbed:
            return kGraphEmbed;
        case RetrievalMode::GraphHybrid:
            return kGraphHybrid;
    }
    return kGraphHybrid;
}

Result<void> RetrievalOrchestrator::validate(const RetrieveRequest& request) const {
    if (!store_) {
        return Error{ErrorCode::NotInitialized, "no graph store configured"};
    }
    if (isBlank(request.query)) {
        return Error{ErrorCode::InvalidArgument, "query must not be empty"};
    }
    const size_t topK = request.topK.value_or(config_.defaultTopK);
    if (topK < kMinTopK || topK > kMaxTopK) {
        return Error{ErrorCode::InvalidArgument, "top_k must be between " +
                                                     std::to_string(kMinTopK) + " and " +
                                                     std::to_string(kMaxTopK) + ", got " +
                                                     std::to_string(topK)};
    }
    if (request.ns.value_or(config_.defaultNamespace).empty()) {
        return Error{ErrorCode::InvalidArgument, "namespace must not be empty"};
    }
    const size_t hops = request.hopDepth.value_or(config_.hopDepth);
    if (hops > kMaxHopDepth) {
        return Error{ErrorCode::InvalidArgument, "hop_depth must be between 0 and " +
                                                     std::to_string(kMaxHopDepth) + ", got " +
                                                     std::to_string(hops)};
    }
    if (request.rerankTopN && *request.rerankTopN == 0) {
        return Error{ErrorCode::InvalidArgument, "rerank_top_n must be at least 1"};
    }
    if (!(config_.fusionAlpha >= 0.0f && config_.fusionAlpha <= 1.0f)) {
        return Error{ErrorCode::InvalidArgument, "fusion_alpha must lie in [0, 1]"};
    }
    return {};
}

std::optional<std::vector<float>> RetrievalOrchestrator::embedQuery(RequestState& state) const {
    if (state.embeddingAttempted)
        return state.queryVector;
    state.embeddingAttempted = true;

    auto degrade = [&state](const std::string& reason) {
        std::string warning = "embedding unavailable, continuing without vector ranking: " + reason;
        spdlog::warn("{}", warning);
        state.result.warnings.push_back(std::move(warning));
    };

    if (!models_) {
        degrade("no embedding provider configured");
        return std::nullopt;
    }
    auto provider = models_->embedding();
    if (!provider) {
        degrade(provider.error().message);
        return std::nullopt;
    }

    try {
        auto vec = provider.value()->embed(state.request.query);
        if (!vec) {
            degrade(vec.error().message);
            return std::nullopt;
        }
        if (vec.value().empty()) {
            degrade("provider returned an empty vector");
            return std::nullopt;
        }
        state.queryVector = std::move(vec).value();
    } catch (const std::exception& e) {
        degrade(std::string("provider threw: ") + e.what());
        return std::nullopt;
    }
    return state.queryVector;
}

bool RetrievalOrchestrator::checkCoverage(RequestState& state,
                                          const std::vector<float>& query) const {
    if (state.working.empty())
        return true;

    const auto cov = VectorSimilarityRanker::coverage(query, state.working);
    std::string warning;
    if (cov.comparable == 0) {
        warning = fmt::format("no candidate embedding is comparable with the {}-dimensional query "
                              "vector ({} missing, {} of another dimension), continuing without "
                              "vector ranking",
                              query.size(), cov.missingEmbedding, cov.dimensionMismatch);
    } else if (cov.missingEmbedding + cov.dimensionMismatch > 0) {
        warning = fmt::format("{} of {} candidates skipped by vector ranking ({} missing an "
                              "embedding, {} not {}-dimensional)",
                              cov.missingEmbedding + cov.dimensionMismatch, state.working.size(),
                              cov.missingEmbedding, cov.dimensionMismatch, query.size());
    }
    if (!warning.empty()) {
        spdlog::warn("{}", warning);
        state.result.warnings.push_back(std::move(warning));
    }
    return cov.comparable > 0;
}

void RetrievalOrchestrator::recordGraphFailure(const Error& error) const {
    const size_t failures = consecutiveGraphFailures_.fetch_add(1) + 1;
    spdlog::error("graph store '{}' failed ({} consecutive): {}", store_->name(), failures,
                  error.message);
}

Result<RetrievalResult> RetrievalOrchestrator::retrieve(const RetrieveRequest& request) const {
    auto valid = validate(request);
    if (!valid)
        return valid.error();

    RequestState state{request};
    state.ns = request.ns.value_or(config_.defaultNamespace);
    state.topK = request.topK.value_or(config_.defaultTopK);
    state.hopDepth = request.hopDepth.value_or(config_.hopDepth);
    state.rerankTopN = request.rerankTopN.value_or(config_.rerankTopN);
    state.result.modeUsed = request.mode;

    const LexicalSeedSelector selector(config_.seedCandidates);
    const VectorSimilarityRanker ranker(config_.embedTopK);
    const ScoreFusionEngine fusion(config_.fusionAlpha);

    for (PipelineStage stage : pipelineFor(request.mode)) {
        const auto started = std::chrono::steady_clock::now();
        std::optional<Error> graphFailure;

        switch (stage) {
            case PipelineStage::LexicalSeeds: {
                auto seeds = selector.select(*store_, state.ns, request.query);
                if (!seeds) {
                    graphFailure = seeds.error();
                    break;
                }
                state.working = std::move(seeds).value();
                state.lastSignalEmbedding = false;
                break;
            }
            case PipelineStage::VectorRank: {
                auto query = embedQuery(state);
                if (!query || !checkCoverage(state, *query))
                    break;
                state.working = ranker.rank(*query, std::move(state.working));
                state.result.embeddingUsed = true;
                state.lastSignalEmbedding = true;
                break;
            }
            case PipelineStage::VectorNamespace: {
                auto query = embedQuery(state);
                if (!query) {
                    state.working.clear();
                    break;
                }
                auto ranked = ranker.rankNamespace(*store_, state.ns, *query);
                if (!ranked) {
                    graphFailure = ranked.error();
                    break;
                }
                state.working = std::move(ranked).value();
                if (state.working.empty()) {
                    auto warning = fmt::format("no embedding in namespace '{}' is comparable "
                                               "with the {}-dimensional query vector",
                                               state.ns, query->size());
                    spdlog::warn("{}", warning);
                    state.result.warnings.push_back(std::move(warning));
                    break;
                }
                for (auto& c : state.working)
                    c.isSeed = true;
                state.result.embeddingUsed = true;
                state.lastSignalEmbedding = true;
                break;
            }
            case PipelineStage::VectorAnnotate: {
                auto query = embedQuery(state);
                if (!query || !checkCoverage(state, *query))
                    break;
                ranker.annotate(*query, state.working);
                state.result.embeddingUsed = true;
                break;
            }
            case PipelineStage::Fusion: {
                auto fused = fusion.fuse(std::move(state.working));
                if (!fused)
                    return fused.error();
                state.working = std::move(fused).value();
                break;
            }
            case PipelineStage::SeedScores: {
                const float maxLex = ScoreFusionEngine::maxLexical(state.working);
                for (auto& c : state.working) {
                    if (state.lastSignalEmbedding && c.embeddingScore) {
                        c.hybridScore = ScoreFusionEngine::normalizeEmbedding(c.embeddingScore);
                    } else {
                        c.hybridScore = ScoreFusionEngine::normalizeLexical(c.lexicalScore, maxLex);
                    }
                }
                break;
            }
            case PipelineStage::GraphExpand: {
                NeighborExpansionOptions opts;
                opts.hopDepth = state.hopDepth;
                opts.neighborLimit = config_.neighborLimit;
                opts.discount = config_.neighborDiscount;
                opts.policy = config_.hopDiscount;
                opts.direction = config_.direction;
                if (config_.graphTimeout.count() > 0)
                    opts.deadline = std::chrono::steady_clock::now() + config_.graphTimeout;

                auto expanded = GraphNeighborExpander(opts).expand(*store_, state.ns, state.working);
                if (!expanded) {
                    graphFailure = expanded.error();
                    break;
                }
                state.neighbors = std::move(expanded).value();
                break;
            }
        }

        state.result.timings.push_back(StageTiming{pipelineStageToString(stage), elapsedMs(started)});

        if (graphFailure) {
            recordGraphFailure(*graphFailure);
            RetrievalResult failed;
            failed.modeUsed = request.mode;
            failed.embeddingUsed = state.result.embeddingUsed;
            failed.warnings = std::move(state.result.warnings);
            failed.warnings.push_back(std::string("graph query failed during ") +
                                      pipelineStageToString(stage) + ": " +
                                      graphFailure->message);
            failed.error = Error{ErrorCode::GraphQueryFailed, graphFailure->message};
            failed.timings = std::move(state.result.timings);
            return failed;
        }
    }

    consecutiveGraphFailures_.store(0);
    finish(state);
    spdlog::debug("retrieve mode={} ns='{}' -> {} candidates, {} warnings",
                  retrievalModeToString(request.mode), state.ns, state.result.candidates.size(),
                  state.result.warnings.size());
    return std::move(state.result);
}

void RetrievalOrchestrator::finish(RequestState& state) const {
    std::vector<Candidate> all = std::move(state.working);
    all.insert(all.end(), std::make_move_iterator(state.neighbors.begin()),
               std::make_move_iterator(state.neighbors.end()));

    all = deduplicate(std::move(all));
    sortCandidates(all);
    if (all.size() > state.topK)
        all.resize(state.topK);

    if (state.request.rerank) {
        const auto started = std::chrono::steady_clock::now();
        CrossEncoderReranker reranker(
            [models = models_]() -> Result<std::shared_ptr<providers::ICrossEncoderProvider>> {
                if (!models)
                    return Error{ErrorCode::ProviderUnavailable, "no cross-encoder configured"};
                return models->crossEncoder();
            });
        auto outcome = reranker.rerank(state.request.query, std::move(all), state.rerankTopN);
        all = std::move(outcome.candidates);
        if (outcome.degraded) {
            state.result.warnings.push_back(
                outcome.warning.value_or("cross-encoder unavailable, kept prior order"));
        } else {
            state.result.reranked = true;
        }
        sortCandidates(all);
        state.result.timings.push_back(StageTiming{"rerank", elapsedMs(started)});
    }

    for (const auto& c : all) {
        if (c.isSeed || !c.relationType)
            continue;
        state.result.graphContext.push_back(GraphContextEntry{
            c.chunkId, *c.relationType, common::utf8Prefix(c.text, config_.textPreviewChars)});
    }
    state.result.candidates = std::move(all);
}

HealthStatus RetrievalOrchestrator::health() const {
    HealthStatus status;
    status.consecutiveFailures = consecutiveGraphFailures_.load();
    if (store_) {
        status.storeName = store_->name();
        auto probe = store_->healthCheck();
        if (!probe)
            status.probeError = probe.error();
    } else {
        status.storeName = "none";
        status.probeError = Error{ErrorCode::NotInitialized, "no graph store configured"};
    }

    const bool tripped =
        config_.failureThreshold > 0 && status.consecutiveFailures >= config_.failureThreshold;
    status.graph = (tripped || status.probeError) ? GraphHealth::Unavailable
                                                  : GraphHealth::Available;

    if (models_) {
        status.embedding = models_->embeddingHandle().state();
        status.crossEncoder = models_->crossEncoderHandle().state();
    }
    return status;
}

} // namespace kgrag::search
