#include <gtest/gtest.h>

#include <kgrag/search/evaluator.h>

#include "../../common/retrieval_fakes.h"

using namespace kgrag;
using namespace kgrag::search;
using kgrag::tests::FakeEmbeddingProvider;
using kgrag::tests::makeModels;

TEST(RetrievalEvaluatorTest, JaccardOverLowercasedWordSets) {
    EXPECT_DOUBLE_EQ(RetrievalEvaluator::jaccard("Thuế suất GTGT", "thuế suất thu nhập"), 0.4);
    EXPECT_DOUBLE_EQ(RetrievalEvaluator::jaccard("a b a", "A B"), 1.0);
    EXPECT_DOUBLE_EQ(RetrievalEvaluator::jaccard("", "  "), 0.0);
    EXPECT_DOUBLE_EQ(RetrievalEvaluator::jaccard("x", "y"), 0.0);
}

TEST(RetrievalEvaluatorTest, JaccardJudgeComputesPrecisionRecallAndRank) {
    auto m = RetrievalEvaluator::evaluateJaccard({"a b c", "x y z"}, {"q r s", "a b c d", "x y"}, 0.5);
    EXPECT_NEAR(m.precision, 2.0 / 3.0, 1e-9);
    EXPECT_DOUBLE_EQ(m.recall, 1.0);
    EXPECT_NEAR(m.f1, 0.8, 1e-9);
    EXPECT_DOUBLE_EQ(m.mrr, 0.5);
}

TEST(RetrievalEvaluatorTest, DuplicateRetrievedTextsKeepFirstPosition) {
    auto m = RetrievalEvaluator::evaluateJaccard({"a b c"}, {"q r s", "q r s", "a b c"}, 0.5);
    EXPECT_DOUBLE_EQ(m.precision, 0.5);
    EXPECT_DOUBLE_EQ(m.mrr, 0.5);
    EXPECT_DOUBLE_EQ(m.recall, 1.0);
}

TEST(RetrievalEvaluatorTest, EmptyInputsScoreZero) {
    auto m = RetrievalEvaluator::evaluateJaccard({}, {"a"}, 0.1);
    EXPECT_DOUBLE_EQ(m.precision, 0.0);
    EXPECT_DOUBLE_EQ(m.recall, 0.0);
    EXPECT_DOUBLE_EQ(m.f1, 0.0);
    EXPECT_DOUBLE_EQ(m.mrr, 0.0);

    auto provider = std::make_shared<FakeEmbeddingProvider>();
    RetrievalEvaluator evaluator(makeModels(provider));
    auto r = evaluator.evaluate({"a"}, {});
    ASSERT_TRUE(r);
    ASSERT_TRUE(r.value().embedding.has_value());
    EXPECT_DOUBLE_EQ(r.value().embedding->recall, 0.0);
    EXPECT_EQ(provider->calls.load(), 0);
}

TEST(RetrievalEvaluatorTest, EmbeddingJudgeUsesCosineThreshold) {
    auto provider = std::make_shared<FakeEmbeddingProvider>(std::map<std::string, std::vector<float>>{
        {"ref", {1.0f, 0.0f}}, {"hit", {0.9f, 0.1f}}, {"miss", {0.0f, 1.0f}}});
    RetrievalEvaluator evaluator(makeModels(provider));

    auto r = evaluator.evaluate({"ref"}, {"miss", "hit"});
    ASSERT_TRUE(r) << r.error().message;
    const auto& report = r.value();
    ASSERT_TRUE(report.embedding.has_value());
    EXPECT_DOUBLE_EQ(report.embedding->precision, 0.5);
    EXPECT_DOUBLE_EQ(report.embedding->recall, 1.0);
    EXPECT_DOUBLE_EQ(report.embedding->mrr, 0.5);
    EXPECT_NEAR(report.embedding->f1, 2.0 / 3.0, 1e-9);

    EXPECT_DOUBLE_EQ(report.jaccard.recall, 0.0);
    EXPECT_DOUBLE_EQ(report.combined.precision, 0.25);
    EXPECT_DOUBLE_EQ(report.combined.recall, 0.5);
    EXPECT_DOUBLE_EQ(report.combined.mrr, 0.25);
    EXPECT_TRUE(report.warnings.empty());
}

TEST(RetrievalEvaluatorTest, MissingEmbeddingModelFallsBackToJaccard) {
    RetrievalEvaluator evaluator(makeModels(nullptr));
    auto r = evaluator.evaluate({"a b c"}, {"a b c d"});
    ASSERT_TRUE(r);
    const auto& report = r.value();
    EXPECT_FALSE(report.embedding.has_value());
    ASSERT_EQ(report.warnings.size(), 1u);
    EXPECT_NE(report.warnings[0].find("Jaccard only"), std::string::npos);
    EXPECT_DOUBLE_EQ(report.combined.recall, report.jaccard.recall);
    EXPECT_DOUBLE_EQ(report.combined.mrr, 1.0);
    EXPECT_TRUE(report.toJson()["embedding"].is_null());
}

TEST(RetrievalEvaluatorTest, ThrowingEmbeddingModelFallsBackToJaccard) {
    auto provider = std::make_shared<FakeEmbeddingProvider>(std::map<std::string, std::vector<float>>{},
                                                            std::vector<float>{1.0f, 0.0f});
    provider->throwOnEmbed = true;
    RetrievalEvaluator evaluator(makeModels(provider));
    auto r = evaluator.evaluate({"a"}, {"a"});
    ASSERT_TRUE(r);
    EXPECT_FALSE(r.value().embedding.has_value());
    EXPECT_EQ(r.value().warnings.size(), 1u);
    EXPECT_DOUBLE_EQ(r.value().combined.precision, 1.0);
}

TEST(RetrievalEvaluatorTest, EmbeddingWeightOutsideUnitRangeIsRejected) {
    EvaluatorOptions options;
    options.embeddingWeight = 1.5;
    RetrievalEvaluator evaluator(makeModels(nullptr), options);
    auto r = evaluator.evaluate({"a"}, {"a"});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
}

TEST(EvaluationSummaryTest, MeanAveragesEmbeddingOnlyOverJudgedQuestions) {
    EvaluationReport judged;
    judged.jaccard = EvaluationMetrics{1.0, 1.0, 1.0, 1.0};
    judged.embedding = EvaluationMetrics{0.5, 0.5, 0.5, 0.5};
    judged.combined = EvaluationMetrics{0.75, 0.75, 0.75, 0.75};

    EvaluationReport lexicalOnly;
    lexicalOnly.jaccard = EvaluationMetrics{0.0, 0.0, 0.0, 0.0};
    lexicalOnly.combined = lexicalOnly.jaccard;

    EvaluationSummary summary;
    summary.add(judged);
    summary.add(lexicalOnly);
    auto mean = summary.mean();

    EXPECT_EQ(mean.questions, 2u);
    EXPECT_EQ(mean.embeddingJudged, 1u);
    EXPECT_DOUBLE_EQ(mean.jaccard.mrr, 0.5);
    EXPECT_DOUBLE_EQ(mean.embedding.mrr, 0.5);
    EXPECT_DOUBLE_EQ(mean.combined.precision, 0.375);

    auto j = mean.toJson();
    EXPECT_EQ(j["questions"], 2);
    EXPECT_DOUBLE_EQ(j["combined"]["precision"].get<double>(), 0.375);

    EXPECT_TRUE(EvaluationSummary{}.mean().toJson()["embedding"].is_null());
}
