#include <kgrag/search/candidate.h>

#include <algorithm>
#include <unordered_map>

namespace kgrag::search {

bool rankedBefore(const Candidate& a, const Candidate& b) noexcept {
    const float sa = a.effectiveScore();
    const float sb = b.effectiveScore();
    if (sa != sb)
        return sa > sb;
    if (a.isSeed != b.isSeed)
        return a.isSeed;
    return a.chunkId < b.chunkId;
}

void sortCandidates(std::vector<Candidate>& candidates) {
    std::stable_sort(candidates.begin(), candidates.end(), rankedBefore);
}

namespace {

// True when `challenger` should replace `incumbent` for the same chunk id.
bool supersedes(const Candidate& challenger, const Candidate& incumbent) {
    if (challenger.isSeed != incumbent.isSeed)
        return challenger.isSeed;
    const float sc = challenger.effectiveScore();
    const float si = incumbent.effectiveScore();
    if (sc != si)
        return sc > si;
    const std::string rc = challenger.relationType.value_or(std::string{});
    const std::string ri = incumbent.relationType.value_or(std::string{});
    return rc < ri;
}

} // namespace

std::vector<Candidate> deduplicate(std::vector<Candidate> candidates) {
    std::vector<Candidate> out;
    out.reserve(candidates.size());
    std::unordered_map<std::string, size_t> slot;

    for (auto& c : candidates) {
        auto it = slot.find(c.chunkId);
        if (it == slot.end()) {
            slot.emplace(c.chunkId, out.size());
            out.push_back(std::move(c));
        } else if (supersedes(c, out[it->second])) {
            out[it->second] = std::move(c);
        }
    }
    return out;
}

} // namespace kgrag::search
