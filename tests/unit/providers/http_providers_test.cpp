#include <gtest/gtest.h>

#include <kgrag/providers/http_providers.h>
#include <kgrag/providers/model_provider.h>

using namespace kgrag;
using namespace kgrag::providers;

TEST(PrepareModelInputTest, RejectsBlankText) {
    for (const char* text : {"", "   ", "\t\n"}) {
        auto r = prepareModelInput(text);
        ASSERT_FALSE(r) << "'" << text << "'";
        EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
    }
}

TEST(PrepareModelInputTest, TruncatesAtCodePointBoundary) {
    auto r = prepareModelInput("thuế suất", 4);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value(), "thuế");

    auto untouched = prepareModelInput("thuế", 4);
    ASSERT_TRUE(untouched);
    EXPECT_EQ(untouched.value(), "thuế");
}

TEST(EmbedResponseTest, ParsesOneVectorPerInput) {
    auto r = detail::parseEmbedResponse("[[0.1, 0.2], [0.3, 0.4]]", 2);
    ASSERT_TRUE(r);
    ASSERT_EQ(r.value().size(), 2u);
    EXPECT_FLOAT_EQ(r.value()[1][0], 0.3f);
}

TEST(EmbedResponseTest, RejectsMalformedBodies) {
    for (const char* body : {"not json", "{\"error\": \"busy\"}", "[[0.1], [0.2, 0.3]]", "[[]]",
                             "[[\"x\"]]"}) {
        auto r = detail::parseEmbedResponse(body, body[1] == '[' ? 2 : 1);
        ASSERT_FALSE(r) << body;
        EXPECT_EQ(r.error().code, ErrorCode::ProviderUnavailable);
    }
    EXPECT_FALSE(detail::parseEmbedResponse("[[0.1]]", 2));
}

TEST(RerankResponseTest, MapsScoresBackToInputOrder) {
    auto r = detail::parseRerankResponse(
        R"([{"index": 2, "score": 0.9}, {"index": 0, "score": 0.5}, {"index": 1, "score": 0.1}])",
        3);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value(), (std::vector<float>{0.5f, 0.1f, 0.9f}));
}

TEST(RerankResponseTest, RejectsMissingDuplicateOrOutOfRangeIndices) {
    EXPECT_FALSE(detail::parseRerankResponse(R"([{"index": 0, "score": 1}])", 2));
    EXPECT_FALSE(detail::parseRerankResponse(
        R"([{"index": 0, "score": 1}, {"index": 0, "score": 2}])", 2));
    EXPECT_FALSE(detail::parseRerankResponse(
        R"([{"index": 0, "score": 1}, {"index": 5, "score": 2}])", 2));
    EXPECT_FALSE(detail::parseRerankResponse(R"([{"score": 1}])", 1));
}

TEST(HttpProvidersTest, JoinUrlHandlesSlashes) {
    EXPECT_EQ(detail::joinUrl("http://host:8080/", "/embed"), "http://host:8080/embed");
    EXPECT_EQ(detail::joinUrl("http://host:8080", "embed"), "http://host:8080/embed");
}

TEST(HttpProvidersTest, UnreachableServiceIsProviderUnavailable) {
    HttpProviderOptions opts;
    opts.connectTimeout = std::chrono::milliseconds(200);
    opts.timeout = std::chrono::milliseconds(500);
    // Port 1 on loopback refuses connections.
    auto r = HttpEmbeddingProvider::connect("http://127.0.0.1:1", opts);
    ASSERT_FALSE(r);
    EXPECT_TRUE(r.error().code == ErrorCode::ProviderUnavailable ||
                r.error().code == ErrorCode::Timeout);
}

TEST(HttpProvidersTest, BlankPassageFailsBeforeAnyRequest) {
    HttpCrossEncoderProvider provider("http://127.0.0.1:1", {});
    auto r = provider.scoreBatch("query", {"fine", "  "});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
}
