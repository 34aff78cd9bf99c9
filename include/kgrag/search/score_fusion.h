#pragma once

#include <kgrag/core/types.h>
#include <kgrag/search/candidate.h>

#include <optional>
#include <vector>

namespace kgrag::search {

/**
 * @brief Linear fusion of the lexical and embedding signals.
 *
 *   hybrid = alpha * lexical / max_lexical + (1 - alpha) * (embedding + 1) / 2
 *
 * A missing embedding contributes 0. alpha = 1 reproduces the lexical order
 * and alpha = 0 the embedding order.
 */
class ScoreFusionEngine {
public:
    explicit ScoreFusionEngine(float alpha = 0.5f) : alpha_(alpha) {}

    /// Sets hybridScore and sorts by it (ties by ascending id).
    /// InvalidArgument when alpha lies outside [0, 1].
    Result<std::vector<Candidate>> fuse(std::vector<Candidate> candidates) const;

    /// Largest lexical score of the set, or 1 when every score is zero.
    static float maxLexical(const std::vector<Candidate>& candidates) noexcept;

    static float normalizeLexical(float lexical, float maxLexical) noexcept {
        return maxLexical > 0.0f ? lexical / maxLexical : 0.0f;
    }

    static float normalizeEmbedding(std::optional<float> similarity) noexcept {
        return similarity ? (*similarity + 1.0f) / 2.0f : 0.0f;
    }

    float alpha() const noexcept { return alpha_; }

private:
    float alpha_;
};

} // namespace kgrag::search
