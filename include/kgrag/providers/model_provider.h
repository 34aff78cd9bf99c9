#pragma once

#include <kgrag/core/types.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace kgrag::providers {

inline constexpr size_t kDefaultMaxInputChars = 10000;

/**
 * Abstract interface for text embedding backends.
 *
 * Implementations are stateless after construction and safe to call from
 * several request threads at once.
 */
class IEmbeddingProvider {
public:
    virtual ~IEmbeddingProvider() = default;

    /**
     * Generate embedding for a single text
     * @return InvalidArgument for empty text, ProviderUnavailable or Timeout
     *         when the backend cannot answer
     */
    virtual Result<std::vector<float>> embed(const std::string& text) = 0;

    /**
     * Generate embeddings for a batch of texts, one vector per input in order
     */
    virtual Result<std::vector<std::vector<float>>>
    embedBatch(const std::vector<std::string>& texts) = 0;

    // 0 until the backend reported it.
    virtual size_t dimension() const = 0;

    virtual std::string name() const = 0;
};

/**
 * Abstract interface for pairwise (query, passage) relevance models.
 */
class ICrossEncoderProvider {
public:
    virtual ~ICrossEncoderProvider() = default;

    virtual Result<float> score(const std::string& query, const std::string& text) = 0;

    /**
     * Score every text against `query` in one call.
     * @return one score per input text, in input order
     */
    virtual Result<std::vector<float>> scoreBatch(const std::string& query,
                                                  const std::vector<std::string>& texts) = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Validate and bound a model input.
 *
 * Whitespace-only text is InvalidArgument. Text longer than `maxChars` code
 * points is cut at a UTF-8 boundary.
 */
Result<std::string> prepareModelInput(std::string_view text,
                                      size_t maxChars = kDefaultMaxInputChars);

} // namespace kgrag::providers
