#include <kgrag/search/cross_encoder_reranker.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <numeric>

namespace kgrag::search {

std::vector<Candidate> CrossEncoderReranker::fallbackOrder(std::vector<Candidate> candidates,
                                                           size_t topN) {
    if (candidates.size() > topN)
        candidates.resize(topN);
    for (size_t i = 0; i < candidates.size(); ++i)
        candidates[i].rerankScore = 1.0f - static_cast<float>(i) * 0.1f;
    return candidates;
}

Result<std::vector<float>>
CrossEncoderReranker::scoreAll(const std::string& query,
                               const std::vector<Candidate>& candidates) const {
    if (!providerGetter_)
        return Error{ErrorCode::ProviderUnavailable, "no cross-encoder configured"};

    auto provider = providerGetter_();
    if (!provider)
        return provider.error();
    if (!provider.value())
        return Error{ErrorCode::ProviderUnavailable, "cross-encoder not available"};

    std::vector<std::string> texts;
    texts.reserve(candidates.size());
    for (const auto& c : candidates)
        texts.push_back(c.text);

    try {
        auto scores = provider.value()->scoreBatch(query, texts);
        if (!scores)
            return scores.error();
        if (scores.value().size() != candidates.size()) {
            return Error{ErrorCode::ProviderUnavailable,
                         "cross-encoder returned " + std::to_string(scores.value().size()) +
                             " scores for " + std::to_string(candidates.size()) + " inputs"};
        }
        return scores;
    } catch (const std::exception& e) {
        return Error{ErrorCode::ProviderUnavailable, std::string("cross-encoder threw: ") + e.what()};
    }
}

RerankOutcome CrossEncoderReranker::rerank(const std::string& query,
                                           std::vector<Candidate> candidates, size_t topN) const {
    RerankOutcome outcome;
    if (candidates.empty() || topN == 0)
        return outcome;

    auto scores = scoreAll(query, candidates);
    if (!scores) {
        outcome.degraded = true;
        outcome.warning = "cross-encoder unavailable, kept prior order: " + scores.error().message;
        spdlog::warn("{}", *outcome.warning);
        outcome.candidates = fallbackOrder(std::move(candidates), topN);
        return outcome;
    }

    const auto& s = scores.value();
    std::vector<size_t> order(candidates.size());
    std::iota(order.begin(), order.end(), size_t{0});
    std::stable_sort(order.begin(), order.end(), [&s](size_t a, size_t b) { return s[a] > s[b]; });
    if (order.size() > topN)
        order.resize(topN);

    outcome.candidates.reserve(order.size());
    for (size_t idx : order) {
        Candidate c = std::move(candidates[idx]);
        c.rerankScore = s[idx];
        outcome.candidates.push_back(std::move(c));
    }
    spdlog::debug("cross-encoder reranked {} -> {} candidates", candidates.size(),
                  outcome.candidates.size());
    return outcome;
}

} // namespace kgrag::search
