#pragma once

#include <kgrag/core/types.h>
#include <kgrag/providers/model_provider.h>
#include <kgrag/search/candidate.h>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kgrag::search {

struct RerankOutcome {
    std::vector<Candidate> candidates;
    bool degraded = false; // fallback ordering was used
    std::optional<std::string> warning;
};

/**
 * @brief Final rescoring pass with a pairwise relevance model.
 *
 * Resolves the model through a getter on every call, so model loading stays
 * with whoever owns the handle. When the model cannot be obtained or scoring
 * fails, the candidates keep their prior order, are cut to top_n and receive
 * synthetic scores 1.0, 0.9, 0.8, ...
 */
class CrossEncoderReranker {
public:
    using ProviderGetter =
        std::function<Result<std::shared_ptr<providers::ICrossEncoderProvider>>()>;

    explicit CrossEncoderReranker(ProviderGetter providerGetter)
        : providerGetter_(std::move(providerGetter)) {}

    RerankOutcome rerank(const std::string& query, std::vector<Candidate> candidates,
                         size_t topN) const;

    static std::vector<Candidate> fallbackOrder(std::vector<Candidate> candidates, size_t topN);

private:
    Result<std::vector<float>> scoreAll(const std::string& query,
                                        const std::vector<Candidate>& candidates) const;

    ProviderGetter providerGetter_;
};

} // namespace kgrag::search
