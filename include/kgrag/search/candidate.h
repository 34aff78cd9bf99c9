#pragma once

#include <kgrag/core/chunk.h>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace kgrag::search {

/**
 * @brief A node considered for the answer set of one request.
 *
 * Created fresh per request and owned by the pipeline stage that holds it.
 * Each stage fills in the signal it computes and leaves the others untouched.
 */
struct Candidate {
    std::string chunkId;
    std::string text;
    float lexicalScore = 0.0f;                // distinct query words contained, >= 0
    std::optional<float> embeddingScore;      // cosine similarity in [-1, 1]
    std::optional<float> hybridScore;         // fused or graph-discounted score
    std::optional<float> rerankScore;         // cross-encoder score
    bool isSeed = false;
    std::optional<std::string> relationType;  // last edge on the path from a seed
    std::optional<std::string> sourceSeed;    // seed a neighbor was reached from
    size_t hops = 0;

    // Carried from the ChunkRecord for vector stages; never serialized.
    std::optional<std::vector<float>> embedding;

    /**
     * @brief Score used for ordering: the first present of rerank, hybrid,
     * embedding and lexical score.
     */
    float effectiveScore() const noexcept {
        if (rerankScore)
            return *rerankScore;
        if (hybridScore)
            return *hybridScore;
        if (embeddingScore)
            return *embeddingScore;
        return lexicalScore;
    }

    static Candidate fromChunk(const ChunkRecord& chunk) {
        Candidate c;
        c.chunkId = chunk.id;
        c.text = chunk.text.value_or(std::string{});
        c.embedding = chunk.embedding;
        return c;
    }
};

/// Final result order: effective score desc, seeds first, then chunk id asc.
bool rankedBefore(const Candidate& a, const Candidate& b) noexcept;

/// Stable sort by rankedBefore.
void sortCandidates(std::vector<Candidate>& candidates);

/**
 * @brief Collapse duplicates so each chunk id appears once.
 *
 * A seed always beats a non-seed copy. Between two copies of the same kind
 * the higher effective score wins, then the smaller relation type. The
 * survivor takes the position of the first occurrence.
 */
std::vector<Candidate> deduplicate(std::vector<Candidate> candidates);

} // namespace kgrag::search
