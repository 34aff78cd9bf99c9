#include <kgrag/common/utf8_utils.h>
#include <kgrag/search/retrieval_types.h>

#include <nlohmann/json.hpp>

namespace kgrag::search {

using json = nlohmann::json;

std::optional<RetrievalMode> retrievalModeFromString(std::string_view name) {
    for (auto mode : {RetrievalMode::LexicalOnly, RetrievalMode::EmbeddingOnly,
                      RetrievalMode::HybridFusion, RetrievalMode::GraphExact,
                      RetrievalMode::GraphEmbed, RetrievalMode::GraphHybrid}) {
        if (name == retrievalModeToString(mode))
            return mode;
    }
    return std::nullopt;
}

std::optional<HopDiscount> hopDiscountFromString(std::string_view name) {
    if (name == "compound")
        return HopDiscount::Compound;
    if (name == "once")
        return HopDiscount::Once;
    return std::nullopt;
}

namespace {

json optionalScore(const std::optional<float>& v) {
    return v ? json(*v) : json(nullptr);
}

} // namespace

json RetrievalResult::toJson(bool includeTimings) const {
    json out;
    json items = json::array();
    for (const auto& c : candidates) {
        items.push_back({
            {"id", common::sanitizeUtf8(c.chunkId)},
            {"text", common::sanitizeUtf8(c.text)},
            {"lexical_score", c.lexicalScore},
            {"embedding_score", optionalScore(c.embeddingScore)},
            {"hybrid_score", optionalScore(c.hybridScore)},
            {"rerank_score", optionalScore(c.rerankScore)},
            {"is_seed", c.isSeed},
            {"relation_type",
             c.relationType ? json(common::sanitizeUtf8(*c.relationType)) : json(nullptr)},
        });
    }
    out["candidates"] = std::move(items);

    json context = json::array();
    for (const auto& g : graphContext) {
        context.push_back({{"node_id", common::sanitizeUtf8(g.nodeId)},
                           {"relation_type", common::sanitizeUtf8(g.relationType)},
                           {"text_preview", common::sanitizeUtf8(g.textPreview)}});
    }
    out["graph_context"] = std::move(context);
    out["mode_used"] = retrievalModeToString(modeUsed);
    out["embedding_used"] = embeddingUsed;
    out["reranked"] = reranked;
    json warningList = json::array();
    for (const auto& w : warnings)
        warningList.push_back(common::sanitizeUtf8(w));
    out["warnings"] = std::move(warningList);
    if (error) {
        out["error"] = {{"code", errorToString(error->code)},
                        {"message", common::sanitizeUtf8(error->message)}};
    }
    if (includeTimings) {
        json t = json::object();
        for (const auto& s : timings)
            t[s.stage] = s.elapsedMs;
        out["timings_ms"] = std::move(t);
    }
    return out;
}

} // namespace kgrag::search
