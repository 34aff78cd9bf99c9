#pragma once

#include <kgrag/providers/model_provider.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace kgrag::providers {

struct HttpProviderOptions {
    std::chrono::milliseconds timeout{30000};
    std::chrono::milliseconds connectTimeout{5000};
    size_t maxInputChars = kDefaultMaxInputChars;
    // Inputs per /embed request; larger batches are split.
    size_t maxBatchSize = 32;
};

/**
 * @brief Embedding provider speaking the text-embeddings-inference protocol.
 *
 * POST <baseUrl>/embed  {"inputs": [...], "truncate": true}  ->  [[float...]...]
 */
class HttpEmbeddingProvider final : public IEmbeddingProvider {
public:
    // Probes <baseUrl>/health before returning the provider.
    static Result<std::shared_ptr<HttpEmbeddingProvider>> connect(std::string baseUrl,
                                                                  HttpProviderOptions options = {});

    HttpEmbeddingProvider(std::string baseUrl, HttpProviderOptions options);

    Result<std::vector<float>> embed(const std::string& text) override;
    Result<std::vector<std::vector<float>>>
    embedBatch(const std::vector<std::string>& texts) override;
    size_t dimension() const override { return dimension_.load(); }
    std::string name() const override { return "http:" + baseUrl_; }

private:
    std::string baseUrl_;
    HttpProviderOptions options_;
    std::atomic<size_t> dimension_{0};
};

/**
 * @brief Cross-encoder provider speaking the text-embeddings-inference protocol.
 *
 * POST <baseUrl>/rerank  {"query": q, "texts": [...]}  ->  [{"index": i, "score": s}...]
 */
class HttpCrossEncoderProvider final : public ICrossEncoderProvider {
public:
    static Result<std::shared_ptr<HttpCrossEncoderProvider>>
    connect(std::string baseUrl, HttpProviderOptions options = {});

    HttpCrossEncoderProvider(std::string baseUrl, HttpProviderOptions options);

    Result<float> score(const std::string& query, const std::string& text) override;
    Result<std::vector<float>> scoreBatch(const std::string& query,
                                          const std::vector<std::string>& texts) override;
    std::string name() const override { return "http:" + baseUrl_; }

private:
    std::string baseUrl_;
    HttpProviderOptions options_;
};

namespace detail {

// Response bodies of the two endpoints; any deviation is ProviderUnavailable.
Result<std::vector<std::vector<float>>> parseEmbedResponse(std::string_view body,
                                                           size_t expectedCount);
Result<std::vector<float>> parseRerankResponse(std::string_view body, size_t expectedCount);

std::string joinUrl(std::string_view baseUrl, std::string_view path);

} // namespace detail

} // namespace kgrag::providers
