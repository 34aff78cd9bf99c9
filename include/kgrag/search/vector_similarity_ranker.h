#pragma once

#include <kgrag/core/types.h>
#include <kgrag/core/vector_math.h>
#include <kgrag/graph/graph_store.h>
#include <kgrag/search/candidate.h>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace kgrag::search {

/// How many candidates can be compared with a query vector, and why the rest cannot.
struct VectorCoverage {
    size_t comparable = 0;
    size_t missingEmbedding = 0;
    size_t dimensionMismatch = 0;
};

/**
 * @brief Cosine-similarity ranking against a query vector.
 *
 * Candidates without an embedding, or with one whose dimension differs from
 * the query vector, are excluded by rank() and left unscored by annotate().
 */
class VectorSimilarityRanker {
public:
    explicit VectorSimilarityRanker(size_t topK = 5) : topK_(topK) {}

    /// Filter, sort by similarity (ties by ascending id) and truncate to `limit`.
    std::vector<Candidate> rank(const std::vector<float>& query, std::vector<Candidate> candidates,
                                std::optional<size_t> limit = std::nullopt) const;

    /// Set embeddingScore where possible; keeps every candidate and its order.
    void annotate(const std::vector<float>& query, std::vector<Candidate>& candidates) const;

    static VectorCoverage coverage(const std::vector<float>& query,
                                   const std::vector<Candidate>& candidates);

    /// Full-namespace ranking through the store's similarity capability.
    Result<std::vector<Candidate>> rankNamespace(graph::IGraphStore& store, const std::string& ns,
                                                 const std::vector<float>& query,
                                                 std::optional<size_t> limit = std::nullopt) const;

    size_t topK() const noexcept { return topK_; }

private:
    size_t topK_;
};

} // namespace kgrag::search
