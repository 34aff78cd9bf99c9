#include <kgrag/config/config_helpers.h>
#include <kgrag/config/engine_config.h>

#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdlib>
#include <stdexcept>
#include <system_error>

namespace kgrag::config {

namespace {

Error badValue(const std::string& key, const std::string& value, const char* expected) {
    return Error{ErrorCode::InvalidArgument,
                 "invalid value '" + value + "' for " + key + ": expected " + expected};
}

Result<size_t> parseSize(const std::string& key, const std::string& value) {
    size_t out = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
    if (ec != std::errc() || ptr != value.data() + value.size())
        return badValue(key, value, "a non-negative integer");
    return out;
}

Result<float> parseFloat(const std::string& key, const std::string& value) {
    try {
        size_t used = 0;
        float out = std::stof(value, &used);
        if (used != value.size())
            return badValue(key, value, "a number");
        return out;
    } catch (const std::exception&) {
        return badValue(key, value, "a number");
    }
}

Result<std::chrono::milliseconds> parseMillis(const std::string& key, const std::string& value) {
    auto n = parseSize(key, value);
    if (!n)
        return n.error();
    return std::chrono::milliseconds(static_cast<long long>(n.value()));
}

} // namespace

Result<EngineConfig> engineConfigFromValues(const std::map<std::string, std::string>& values) {
    EngineConfig cfg;
    auto& r = cfg.retrieval;

    for (const auto& [key, value] : values) {
        Result<void> applied;
        auto setSize = [&](size_t& target) {
            auto v = parseSize(key, value);
            if (!v) {
                applied = v.error();
                return;
            }
            target = v.value();
        };
        auto setFloat = [&](float& target) {
            auto v = parseFloat(key, value);
            if (!v) {
                applied = v.error();
                return;
            }
            target = v.value();
        };
        auto setMillis = [&](std::chrono::milliseconds& target) {
            auto v = parseMillis(key, value);
            if (!v) {
                applied = v.error();
                return;
            }
            target = v.value();
        };

        if (key == "retrieval.seed_candidates") {
            setSize(r.seedCandidates);
        } else if (key == "retrieval.embed_top_k") {
            setSize(r.embedTopK);
        } else if (key == "retrieval.neighbor_limit") {
            setSize(r.neighborLimit);
        } else if (key == "retrieval.neighbor_discount") {
            setFloat(r.neighborDiscount);
        } else if (key == "retrieval.hop_depth") {
            setSize(r.hopDepth);
        } else if (key == "retrieval.hop_discount") {
            auto policy = search::hopDiscountFromString(value);
            if (!policy)
                applied = badValue(key, value, "compound or once");
            else
                r.hopDiscount = *policy;
        } else if (key == "retrieval.fusion_alpha") {
            setFloat(r.fusionAlpha);
        } else if (key == "retrieval.rerank_top_n") {
            setSize(r.rerankTopN);
        } else if (key == "retrieval.default_top_k") {
            setSize(r.defaultTopK);
        } else if (key == "retrieval.namespace") {
            r.defaultNamespace = value;
        } else if (key == "retrieval.text_preview_chars") {
            setSize(r.textPreviewChars);
        } else if (key == "graph.timeout_ms") {
            setMillis(r.graphTimeout);
        } else if (key == "graph.failure_threshold") {
            setSize(r.failureThreshold);
        } else if (key == "graph.direction") {
            auto dir = graph::traversalDirectionFromString(value);
            if (!dir)
                applied = badValue(key, value, "both, outgoing or incoming");
            else
                r.direction = *dir;
        } else if (key == "providers.embed_url") {
            cfg.providers.embedUrl = value;
        } else if (key == "providers.rerank_url") {
            cfg.providers.rerankUrl = value;
        } else if (key == "providers.timeout_ms") {
            setMillis(cfg.providers.timeout);
        } else if (key == "providers.max_input_chars") {
            setSize(cfg.providers.maxInputChars);
        } else if (key == "logging.level") {
            cfg.logging.level = value;
        } else {
            spdlog::debug("ignoring unknown config key '{}'", key);
        }

        if (!applied)
            return applied.error();
    }

    auto valid = validateEngineConfig(cfg);
    if (!valid)
        return valid.error();
    return cfg;
}

Result<void> validateEngineConfig(const EngineConfig& config) {
    const auto& r = config.retrieval;
    if (!(r.fusionAlpha >= 0.0f && r.fusionAlpha <= 1.0f))
        return Error{ErrorCode::InvalidArgument, "retrieval.fusion_alpha must lie in [0, 1]"};
    if (!(r.neighborDiscount >= 0.0f && r.neighborDiscount <= 1.0f))
        return Error{ErrorCode::InvalidArgument, "retrieval.neighbor_discount must lie in [0, 1]"};
    if (r.hopDepth > search::kMaxHopDepth)
        return Error{ErrorCode::InvalidArgument,
                     "retrieval.hop_depth must be at most " + std::to_string(search::kMaxHopDepth)};
    if (r.defaultTopK < search::kMinTopK || r.defaultTopK > search::kMaxTopK)
        return Error{ErrorCode::InvalidArgument, "retrieval.default_top_k must be between 1 and 50"};
    if (r.seedCandidates == 0)
        return Error{ErrorCode::InvalidArgument, "retrieval.seed_candidates must be positive"};
    if (r.embedTopK == 0)
        return Error{ErrorCode::InvalidArgument, "retrieval.embed_top_k must be positive"};
    if (r.rerankTopN == 0)
        return Error{ErrorCode::InvalidArgument, "retrieval.rerank_top_n must be positive"};
    if (r.defaultNamespace.empty())
        return Error{ErrorCode::InvalidArgument, "retrieval.namespace must not be empty"};
    return {};
}

void applyEnvironmentOverrides(EngineConfig& config) {
    if (const char* ns = std::getenv("KGRAG_NAMESPACE"); ns && *ns) {
        config.retrieval.defaultNamespace = ns;
    }
}

Result<EngineConfig> loadEngineConfig(const std::filesystem::path& path, bool mustExist) {
    std::map<std::string, std::string> values;
    std::error_code ec;
    const bool present = !path.empty() && std::filesystem::exists(path, ec);
    if (mustExist && !present)
        return Error{ErrorCode::NotFound, "config file not found: " + path.string()};
    if (present) {
        values = parse_config_file(path);
        spdlog::debug("loaded {} config values from {}", values.size(), path.string());
    } else if (!path.empty()) {
        spdlog::debug("config file {} not found, using defaults", path.string());
    }

    auto cfg = engineConfigFromValues(values);
    if (!cfg)
        return cfg.error();
    auto out = std::move(cfg).value();
    if (!values.empty())
        out.sourcePath = path;
    applyEnvironmentOverrides(out);
    return out;
}

providers::HttpProviderOptions toHttpOptions(const ProvidersConfig& config) {
    providers::HttpProviderOptions opts;
    opts.timeout = config.timeout;
    opts.maxInputChars = config.maxInputChars;
    return opts;
}

} // namespace kgrag::config
