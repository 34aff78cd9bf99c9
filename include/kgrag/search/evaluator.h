#pragma once

#include <kgrag/core/types.h>
#include <kgrag/providers/model_services.h>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kgrag::search {

/**
 * @brief Context-level retrieval quality for one question.
 *
 * A retrieved context counts towards precision when it matches any reference;
 * a reference counts towards recall when any retrieved context matches it.
 * MRR is the reciprocal rank of the first matching retrieved context.
 */
struct EvaluationMetrics {
    double precision = 0.0;
    double recall = 0.0;
    double f1 = 0.0;
    double mrr = 0.0;

    nlohmann::json toJson() const {
        return nlohmann::json{{"precision", precision}, {"recall", recall}, {"f1", f1}, {"mrr", mrr}};
    }
};

struct EvaluatorOptions {
    double embeddingThreshold = 0.6; // cosine >= threshold is a match
    double jaccardThreshold = 0.2;   // word-set overlap >= threshold is a match
    double embeddingWeight = 0.5;    // combined = w * embedding + (1 - w) * jaccard
};

struct EvaluationReport {
    EvaluationMetrics jaccard;
    std::optional<EvaluationMetrics> embedding; // unset when the embedding judge was unavailable
    EvaluationMetrics combined;
    std::vector<std::string> warnings;

    nlohmann::json toJson() const;
};

/// Arithmetic mean of several reports, per metric family.
struct EvaluationSummary {
    size_t questions = 0;
    size_t embeddingJudged = 0;
    EvaluationMetrics jaccard;
    EvaluationMetrics embedding;
    EvaluationMetrics combined;

    void add(const EvaluationReport& report);
    EvaluationSummary mean() const;
    nlohmann::json toJson() const;
};

/**
 * @brief Scores retrieved contexts against reference contexts.
 *
 * Two judges are used: Jaccard overlap of lowercased word sets, and cosine
 * similarity of embeddings from the shared embedding model. Duplicate texts
 * are collapsed keeping their first position. When the embedding model is
 * unavailable the combined metrics equal the Jaccard ones and a warning is
 * recorded.
 */
class RetrievalEvaluator {
public:
    explicit RetrievalEvaluator(std::shared_ptr<providers::ModelServices> models,
                                EvaluatorOptions options = {});

    Result<EvaluationReport> evaluate(const std::vector<std::string>& references,
                                      const std::vector<std::string>& retrieved) const;

    static double jaccard(const std::string& a, const std::string& b);

    static EvaluationMetrics evaluateJaccard(const std::vector<std::string>& references,
                                             const std::vector<std::string>& retrieved,
                                             double threshold);

    Result<EvaluationMetrics> evaluateEmbedding(const std::vector<std::string>& references,
                                                const std::vector<std::string>& retrieved) const;

    const EvaluatorOptions& options() const noexcept { return options_; }

private:
    std::shared_ptr<providers::ModelServices> models_;
    EvaluatorOptions options_;
};

namespace detail {

// Shared metric computation over a |references| x |retrieved| similarity function.
EvaluationMetrics
matchMetrics(size_t references, size_t retrieved,
             const std::function<double(size_t ref, size_t ret)>& similarity, double threshold);

// Distinct texts in first-seen order.
std::vector<std::string> distinctInOrder(const std::vector<std::string>& texts);

} // namespace detail

} // namespace kgrag::search
