#pragma once

#include <cmath>
#include <span>

namespace kgrag {

/**
 * Cosine similarity between two vectors of equal dimension.
 *
 * Returns 0 when either vector has zero norm, the dimensions differ, or a
 * component is not finite, so the result is always within [-1, 1].
 */
inline float cosineSimilarity(std::span<const float> a, std::span<const float> b) noexcept {
    if (a.size() != b.size() || a.empty())
        return 0.0f;

    double dot = 0.0;
    double normA = 0.0;
    double normB = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        normA += static_cast<double>(a[i]) * a[i];
        normB += static_cast<double>(b[i]) * b[i];
    }
    if (normA <= 0.0 || normB <= 0.0)
        return 0.0f;

    double sim = dot / (std::sqrt(normA) * std::sqrt(normB));
    if (!std::isfinite(sim))
        return 0.0f;
    if (sim > 1.0)
        sim = 1.0;
    if (sim < -1.0)
        sim = -1.0;
    return static_cast<float>(sim);
}

} // namespace kgrag
