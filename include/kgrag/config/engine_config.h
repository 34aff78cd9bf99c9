#pragma once

#include <kgrag/core/types.h>
#include <kgrag/providers/http_providers.h>
#include <kgrag/search/retrieval_types.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <string>

namespace kgrag::config {

struct ProvidersConfig {
    std::string embedUrl;
    std::string rerankUrl;
    std::chrono::milliseconds timeout{30000};
    size_t maxInputChars = providers::kDefaultMaxInputChars;
};

struct LoggingConfig {
    std::string level = "info";
};

/**
 * @brief Everything read from config.toml.
 *
 * @code
 * [retrieval]
 * seed_candidates = 20
 * embed_top_k = 5
 * neighbor_limit = 10
 * neighbor_discount = 0.8
 * hop_depth = 1
 * hop_discount = "compound"   # or "once"
 * fusion_alpha = 0.5
 * rerank_top_n = 5
 * default_top_k = 20
 * namespace = "Chunk"
 * text_preview_chars = 100
 *
 * [graph]
 * timeout_ms = 5000
 * failure_threshold = 3
 * direction = "both"          # outgoing | incoming
 *
 * [providers]
 * embed_url = "http://localhost:8080"
 * rerank_url = "http://localhost:8081"
 * timeout_ms = 30000
 * max_input_chars = 10000
 *
 * [logging]
 * level = "info"
 * @endcode
 */
struct EngineConfig {
    search::RetrievalConfig retrieval;
    ProvidersConfig providers;
    LoggingConfig logging;
    std::filesystem::path sourcePath; // empty when built from defaults
};

/// Build from "section.key" values. Unknown keys are ignored; bad values are
/// InvalidArgument naming the key.
Result<EngineConfig> engineConfigFromValues(const std::map<std::string, std::string>& values);

/// Read `path` and apply environment overrides. A missing file yields the
/// defaults unless `mustExist` is set, in which case it is NotFound.
Result<EngineConfig> loadEngineConfig(const std::filesystem::path& path, bool mustExist = false);

/// KGRAG_NAMESPACE replaces retrieval.namespace when set and non-empty.
void applyEnvironmentOverrides(EngineConfig& config);

Result<void> validateEngineConfig(const EngineConfig& config);

providers::HttpProviderOptions toHttpOptions(const ProvidersConfig& config);

} // namespace kgrag::config
