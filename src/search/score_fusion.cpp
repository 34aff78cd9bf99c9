#include <kgrag/search/score_fusion.h>

#include <algorithm>
#include <cmath>
#include <string>

namespace kgrag::search {

float ScoreFusionEngine::maxLexical(const std::vector<Candidate>& candidates) noexcept {
    float maxLex = 0.0f;
    for (const auto& c : candidates)
        maxLex = std::max(maxLex, c.lexicalScore);
    return maxLex > 0.0f ? maxLex : 1.0f;
}

Result<std::vector<Candidate>> ScoreFusionEngine::fuse(std::vector<Candidate> candidates) const {
    if (!(alpha_ >= 0.0f && alpha_ <= 1.0f)) {
        return Error{ErrorCode::InvalidArgument,
                     "fusion alpha must lie in [0, 1], got " + std::to_string(alpha_)};
    }

    const float maxLex = maxLexical(candidates);
    for (auto& c : candidates) {
        c.hybridScore = alpha_ * normalizeLexical(c.lexicalScore, maxLex) +
                        (1.0f - alpha_) * normalizeEmbedding(c.embeddingScore);
    }

    std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
        if (*a.hybridScore != *b.hybridScore)
            return *a.hybridScore > *b.hybridScore;
        return a.chunkId < b.chunkId;
    });
    return candidates;
}

} // namespace kgrag::search
