#include <kgrag/search/vector_similarity_ranker.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace kgrag::search {

namespace {

bool comparable(const Candidate& c, const std::vector<float>& query) {
    return c.embedding && !c.embedding->empty() && c.embedding->size() == query.size();
}

} // namespace

VectorCoverage VectorSimilarityRanker::coverage(const std::vector<float>& query,
                                                const std::vector<Candidate>& candidates) {
    VectorCoverage cov;
    for (const auto& c : candidates) {
        if (!c.embedding || c.embedding->empty())
            ++cov.missingEmbedding;
        else if (c.embedding->size() != query.size())
            ++cov.dimensionMismatch;
        else
            ++cov.comparable;
    }
    return cov;
}

std::vector<Candidate> VectorSimilarityRanker::rank(const std::vector<float>& query,
                                                    std::vector<Candidate> candidates,
                                                    std::optional<size_t> limit) const {
    std::vector<Candidate> ranked;
    ranked.reserve(candidates.size());
    for (auto& c : candidates) {
        if (!comparable(c, query))
            continue;
        c.embeddingScore = cosineSimilarity(*c.embedding, query);
        ranked.push_back(std::move(c));
    }

    std::sort(ranked.begin(), ranked.end(), [](const Candidate& a, const Candidate& b) {
        if (*a.embeddingScore != *b.embeddingScore)
            return *a.embeddingScore > *b.embeddingScore;
        return a.chunkId < b.chunkId;
    });

    const size_t cap = limit.value_or(topK_);
    if (ranked.size() > cap)
        ranked.resize(cap);
    spdlog::debug("vector rank: kept {} of {} candidates", ranked.size(), candidates.size());
    return ranked;
}

void VectorSimilarityRanker::annotate(const std::vector<float>& query,
                                      std::vector<Candidate>& candidates) const {
    for (auto& c : candidates) {
        if (comparable(c, query))
            c.embeddingScore = cosineSimilarity(*c.embedding, query);
    }
}

Result<std::vector<Candidate>>
VectorSimilarityRanker::rankNamespace(graph::IGraphStore& store, const std::string& ns,
                                      const std::vector<float>& query,
                                      std::optional<size_t> limit) const {
    auto hits = store.similarity(ns, query, limit.value_or(topK_));
    if (!hits)
        return hits.error();

    std::vector<Candidate> out;
    out.reserve(hits.value().size());
    for (const auto& hit : hits.value()) {
        auto c = Candidate::fromChunk(hit.chunk);
        c.embeddingScore = hit.score;
        out.push_back(std::move(c));
    }
    return out;
}

} // namespace kgrag::search
