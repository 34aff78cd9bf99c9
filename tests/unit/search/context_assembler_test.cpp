#include <gtest/gtest.h>

#include <kgrag/search/context_assembler.h>

using namespace kgrag::search;

namespace {

Candidate passage(const std::string& id, const std::string& text, bool isSeed = true,
                  std::optional<std::string> relation = std::nullopt) {
    Candidate c;
    c.chunkId = id;
    c.text = text;
    c.isSeed = isSeed;
    c.relationType = std::move(relation);
    return c;
}

} // namespace

TEST(ContextAssemblerTest, NumbersPassagesWithSources) {
    RetrievalResult r;
    r.candidates = {passage("c1", "first"), passage("c2", "second", false, "CITES")};

    EXPECT_EQ(ContextAssembler{}.assemble(r),
              "[1] first (Source: c1)\n\n[2] second (Source: c2, via CITES)");
}

TEST(ContextAssemblerTest, RelationAnnotationCanBeDisabled) {
    RetrievalResult r;
    r.candidates = {passage("c2", "second", false, "CITES")};
    ContextOptions opts;
    opts.annotateRelations = false;
    EXPECT_EQ(ContextAssembler(opts).assemble(r), "[1] second (Source: c2)");
}

TEST(ContextAssemblerTest, TruncatesPassageTextByCodePoints) {
    RetrievalResult r;
    r.candidates = {passage("c1", "thuế suất")};
    ContextOptions opts;
    opts.maxPassageChars = 4;
    EXPECT_EQ(ContextAssembler(opts).assemble(r), "[1] thuế (Source: c1)");
}

TEST(ContextAssemblerTest, StopsBeforeExceedingBudget) {
    RetrievalResult r;
    r.candidates = {passage("a", "aaaa"), passage("b", "bbbb"), passage("c", "cccc")};
    ContextOptions opts;
    // "[1] aaaa (Source: a)" is 20 characters; two blocks plus separator are 42.
    opts.maxChars = 45;
    auto text = ContextAssembler(opts).assemble(r);
    EXPECT_EQ(text, "[1] aaaa (Source: a)\n\n[2] bbbb (Source: b)");
}

TEST(ContextAssemblerTest, PassageLimit) {
    RetrievalResult r;
    r.candidates = {passage("a", "x"), passage("b", "y"), passage("c", "z")};
    ContextOptions opts;
    opts.maxPassages = 1;
    EXPECT_EQ(ContextAssembler(opts).assemble(r), "[1] x (Source: a)");
}

TEST(ContextAssemblerTest, EmptyResultGivesEmptyContext) {
    EXPECT_TRUE(ContextAssembler{}.assemble(RetrievalResult{}).empty());
}
