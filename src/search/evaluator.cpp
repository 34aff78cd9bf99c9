#include <kgrag/common/utf8_utils.h>
#include <kgrag/core/vector_math.h>
#include <kgrag/search/evaluator.h>

#include <spdlog/spdlog.h>

#include <exception>
#include <set>
#include <unordered_set>

namespace kgrag::search {

namespace detail {

EvaluationMetrics
matchMetrics(size_t references, size_t retrieved,
             const std::function<double(size_t ref, size_t ret)>& similarity, double threshold) {
    EvaluationMetrics m;
    if (references == 0 || retrieved == 0)
        return m;

    std::vector<bool> refMatched(references, false);
    std::vector<bool> retMatched(retrieved, false);
    for (size_t r = 0; r < references; ++r) {
        for (size_t k = 0; k < retrieved; ++k) {
            if (similarity(r, k) >= threshold) {
                refMatched[r] = true;
                retMatched[k] = true;
            }
        }
    }

    size_t refHits = 0;
    for (bool b : refMatched)
        refHits += b ? 1 : 0;
    size_t retHits = 0;
    for (size_t k = 0; k < retrieved; ++k) {
        if (!retMatched[k])
            continue;
        if (retHits == 0)
            m.mrr = 1.0 / static_cast<double>(k + 1);
        ++retHits;
    }

    m.precision = static_cast<double>(retHits) / static_cast<double>(retrieved);
    m.recall = static_cast<double>(refHits) / static_cast<double>(references);
    if (m.precision + m.recall > 0.0)
        m.f1 = 2.0 * m.precision * m.recall / (m.precision + m.recall);
    return m;
}

std::vector<std::string> distinctInOrder(const std::vector<std::string>& texts) {
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    for (const auto& t : texts) {
        if (seen.insert(t).second)
            out.push_back(t);
    }
    return out;
}

} // namespace detail

namespace {

std::set<std::string> wordSet(const std::string& text) {
    auto words = common::splitWhitespace(common::toLowerUtf8(text));
    return std::set<std::string>(words.begin(), words.end());
}

EvaluationMetrics blend(const EvaluationMetrics& a, const EvaluationMetrics& b, double wa) {
    const double wb = 1.0 - wa;
    return EvaluationMetrics{a.precision * wa + b.precision * wb, a.recall * wa + b.recall * wb,
                             a.f1 * wa + b.f1 * wb, a.mrr * wa + b.mrr * wb};
}

void accumulate(EvaluationMetrics& sum, const EvaluationMetrics& m) {
    sum.precision += m.precision;
    sum.recall += m.recall;
    sum.f1 += m.f1;
    sum.mrr += m.mrr;
}

EvaluationMetrics divide(const EvaluationMetrics& sum, size_t n) {
    if (n == 0)
        return {};
    const double d = static_cast<double>(n);
    return EvaluationMetrics{sum.precision / d, sum.recall / d, sum.f1 / d, sum.mrr / d};
}

} // namespace

nlohmann::json EvaluationReport::toJson() const {
    nlohmann::json out{{"jaccard", jaccard.toJson()},
                       {"embedding", embedding ? embedding->toJson() : nlohmann::json(nullptr)},
                       {"combined", combined.toJson()}};
    nlohmann::json w = nlohmann::json::array();
    for (const auto& warning : warnings)
        w.push_back(common::sanitizeUtf8(warning));
    out["warnings"] = std::move(w);
    return out;
}

void EvaluationSummary::add(const EvaluationReport& report) {
    ++questions;
    accumulate(jaccard, report.jaccard);
    accumulate(combined, report.combined);
    if (report.embedding) {
        ++embeddingJudged;
        accumulate(embedding, *report.embedding);
    }
}

EvaluationSummary EvaluationSummary::mean() const {
    EvaluationSummary out;
    out.questions = questions;
    out.embeddingJudged = embeddingJudged;
    out.jaccard = divide(jaccard, questions);
    out.embedding = divide(embedding, embeddingJudged);
    out.combined = divide(combined, questions);
    return out;
}

nlohmann::json EvaluationSummary::toJson() const {
    return nlohmann::json{{"questions", questions},
                          {"embedding_judged", embeddingJudged},
                          {"jaccard", jaccard.toJson()},
                          {"embedding", embeddingJudged > 0 ? embedding.toJson()
                                                            : nlohmann::json(nullptr)},
                          {"combined", combined.toJson()}};
}

RetrievalEvaluator::RetrievalEvaluator(std::shared_ptr<providers::ModelServices> models,
                                       EvaluatorOptions options)
    : models_(std::move(models)), options_(options) {}

double RetrievalEvaluator::jaccard(const std::string& a, const std::string& b) {
    const auto A = wordSet(a);
    const auto B = wordSet(b);
    size_t shared = 0;
    for (const auto& w : A)
        shared += B.count(w);
    const size_t unionSize = A.size() + B.size() - shared;
    return unionSize == 0 ? 0.0 : static_cast<double>(shared) / static_cast<double>(unionSize);
}

EvaluationMetrics RetrievalEvaluator::evaluateJaccard(const std::vector<std::string>& references,
                                                      const std::vector<std::string>& retrieved,
                                                      double threshold) {
    const auto refs = detail::distinctInOrder(references);
    const auto rets = detail::distinctInOrder(retrieved);
    return detail::matchMetrics(
        refs.size(), rets.size(),
        [&](size_t r, size_t k) { return jaccard(refs[r], rets[k]); }, threshold);
}

Result<EvaluationMetrics>
RetrievalEvaluator::evaluateEmbedding(const std::vector<std::string>& references,
                                      const std::vector<std::string>& retrieved) const {
    const auto refs = detail::distinctInOrder(references);
    const auto rets = detail::distinctInOrder(retrieved);
    if (refs.empty() || rets.empty())
        return EvaluationMetrics{};
    if (!models_)
        return Error{ErrorCode::ProviderUnavailable, "no embedding provider configured"};

    auto provider = models_->embedding();
    if (!provider)
        return provider.error();

    std::vector<std::string> texts = refs;
    texts.insert(texts.end(), rets.begin(), rets.end());
    std::vector<std::vector<float>> vectors;
    try {
        auto batch = provider.value()->embedBatch(texts);
        if (!batch)
            return batch.error();
        vectors = std::move(batch).value();
    } catch (const std::exception& e) {
        return Error{ErrorCode::ProviderUnavailable, std::string("embedding threw: ") + e.what()};
    }
    if (vectors.size() != texts.size()) {
        return Error{ErrorCode::ProviderUnavailable,
                     "embedding returned " + std::to_string(vectors.size()) + " vectors for " +
                         std::to_string(texts.size()) + " texts"};
    }

    const size_t offset = refs.size();
    return detail::matchMetrics(
        refs.size(), rets.size(),
        [&](size_t r, size_t k) {
            return static_cast<double>(cosineSimilarity(vectors[r], vectors[offset + k]));
        },
        options_.embeddingThreshold);
}

Result<EvaluationReport> RetrievalEvaluator::evaluate(const std::vector<std::string>& references,
                                                      const std::vector<std::string>& retrieved) const {
    if (!(options_.embeddingWeight >= 0.0 && options_.embeddingWeight <= 1.0)) {
        return Error{ErrorCode::InvalidArgument, "embedding weight must lie in [0, 1]"};
    }

    EvaluationReport report;
    report.jaccard = evaluateJaccard(references, retrieved, options_.jaccardThreshold);

    auto embedded = evaluateEmbedding(references, retrieved);
    if (embedded) {
        report.embedding = embedded.value();
        report.combined = blend(*report.embedding, report.jaccard, options_.embeddingWeight);
    } else {
        std::string warning =
            "embedding judge unavailable, combined metrics use Jaccard only: " +
            embedded.error().message;
        spdlog::warn("{}", warning);
        report.warnings.push_back(std::move(warning));
        report.combined = report.jaccard;
    }
    return report;
}

} // namespace kgrag::search
