#include <kgrag/common/utf8_utils.h>
#include <kgrag/search/lexical_seed_selector.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <unordered_set>

namespace kgrag::search {

std::vector<std::string> LexicalSeedSelector::queryWords(std::string_view query) {
    std::vector<std::string> words;
    std::unordered_set<std::string> seen;
    for (auto& w : common::splitWhitespace(common::toLowerUtf8(query))) {
        if (seen.insert(w).second)
            words.push_back(std::move(w));
    }
    return words;
}

size_t LexicalSeedSelector::matchCount(const std::vector<std::string>& words,
                                       std::string_view lowerText) {
    size_t count = 0;
    for (const auto& w : words) {
        if (lowerText.find(w) != std::string_view::npos)
            ++count;
    }
    return count;
}

std::vector<Candidate> LexicalSeedSelector::select(std::string_view query,
                                                   const std::vector<ChunkRecord>& nodes) const {
    const auto words = queryWords(query);
    std::vector<Candidate> seeds;
    if (words.empty())
        return seeds;

    for (const auto& node : nodes) {
        if (!node.hasText())
            continue;
        const size_t matches = matchCount(words, common::toLowerUtf8(*node.text));
        if (matches == 0)
            continue;
        auto c = Candidate::fromChunk(node);
        c.lexicalScore = static_cast<float>(matches);
        c.isSeed = true;
        seeds.push_back(std::move(c));
    }

    std::sort(seeds.begin(), seeds.end(), [](const Candidate& a, const Candidate& b) {
        if (a.lexicalScore != b.lexicalScore)
            return a.lexicalScore > b.lexicalScore;
        return a.chunkId < b.chunkId;
    });
    if (seeds.size() > seedCandidates_)
        seeds.resize(seedCandidates_);
    return seeds;
}

Result<std::vector<Candidate>> LexicalSeedSelector::select(graph::IGraphStore& store,
                                                           const std::string& ns,
                                                           std::string_view query) const {
    auto scan = store.scanByLabel(ns);
    if (!scan)
        return scan.error();
    auto seeds = select(query, scan.value());
    spdlog::debug("lexical seeds: {} of {} nodes in '{}'", seeds.size(), scan.value().size(), ns);
    return seeds;
}

} // namespace kgrag::search
