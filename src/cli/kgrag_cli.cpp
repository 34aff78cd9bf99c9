#include <kgrag/cli/kgrag_cli.h>
#include <kgrag/common/utf8_utils.h>
#include <kgrag/config/config_helpers.h>
#include <kgrag/graph/in_memory_graph_store.h>
#include <kgrag/graph/sqlite_graph_store.h>
#include <kgrag/search/context_assembler.h>

#include <CLI/CLI.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <thread>

namespace kgrag::cli {

using json = nlohmann::json;

std::optional<spdlog::level::level_enum> parseLogLevel(const std::string& name) {
    std::string v;
    v.reserve(name.size());
    for (char c : name)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "critical" || v == "crit")
        return spdlog::level::critical;
    if (v == "off" || v == "none" || v == "silent")
        return spdlog::level::off;
    return std::nullopt;
}

KgragCLI::KgragCLI()
    : app_(std::make_unique<CLI::App>("kgrag - hybrid graph-augmented retrieval")),
      out_(&std::cout), err_(&std::cerr) {
    app_->require_subcommand(1);

    app_->add_option("--config", configPath_, "Configuration file path");
    app_->add_option("--log-level", logLevel_, "Log level (trace/debug/info/warn/error/off)");
    app_->add_option("--graph-json", graphJson_, "Load the graph from a JSON file");
    app_->add_option("--sqlite", sqlitePath_, "Read the graph from a SQLite database");
    app_->add_option("--embed-url", embedUrl_, "Embedding service base URL");
    app_->add_option("--rerank-url", rerankUrl_, "Rerank service base URL");
    app_->add_option("--namespace", namespace_, "Graph namespace (node label)");
    app_->add_option("--mode", mode_, "Retrieval mode")
        ->check(CLI::IsMember({"lexical-only", "embedding-only", "hybrid-fusion", "graph-exact",
                               "graph-embed", "graph-hybrid"}));
    app_->add_option("--top-k", topK_, "Maximum number of results (1-50)");
    app_->add_option("--hops", hops_, "Graph expansion depth (0-5)");
    app_->add_option("--rerank-top-n", rerankTopN_, "Results kept by the cross-encoder");
    app_->add_flag("--rerank", rerank_, "Apply the cross-encoder as a final pass");
    app_->add_flag("--context", context_, "Print an assembled context block instead of JSON");
    app_->add_flag("--timings", timings_, "Include per-stage timings in JSON output");

    auto* retrieve = app_->add_subcommand("retrieve", "Run one retrieval request");
    retrieve->add_option("query", query_, "Query text")->required();

    auto* batch = app_->add_subcommand("batch", "Run one request per line of a file");
    batch->add_option("file", batchFile_, "File with one query per line")
        ->required()
        ->check(CLI::ExistingFile);
    batch->add_option("-j,--jobs", jobs_, "Concurrent requests (default: hardware threads)");

    auto* health = app_->add_subcommand("health", "Report graph store and model availability");
    health->add_flag("--probe-models", probeModels_, "Load both models before reporting");

    auto* eval = app_->add_subcommand(
        "eval", "Score retrieved contexts against references ({\"question\", \"references\"} lines)");
    eval->add_option("file", evalFile_, "JSON lines file with questions and reference contexts")
        ->required()
        ->check(CLI::ExistingFile);
    eval->add_option("-j,--jobs", jobs_, "Concurrent requests (default: hardware threads)");
    eval->add_option("--embedding-threshold", evalOptions_.embeddingThreshold,
                     "Cosine similarity counted as a match")
        ->check(CLI::Range(-1.0, 1.0));
    eval->add_option("--jaccard-threshold", evalOptions_.jaccardThreshold,
                     "Word overlap counted as a match")
        ->check(CLI::Range(0.0, 1.0));
    eval->add_option("--embedding-weight", evalOptions_.embeddingWeight,
                     "Weight of the embedding judge in the combined metrics")
        ->check(CLI::Range(0.0, 1.0));
}

KgragCLI::~KgragCLI() = default;

void KgragCLI::setOutput(std::ostream& out, std::ostream& err) {
    out_ = &out;
    err_ = &err;
}

Result<void> KgragCLI::initialize() {
    // A path named by --config or KGRAG_CONFIG must exist; the standard path may not.
    const char* envCfg = std::getenv("KGRAG_CONFIG");
    const bool namedPath = !configPath_.empty() || (envCfg && *envCfg);
    auto cfgPath = config::resolve_config_path(configPath_);
    auto loaded = config::loadEngineConfig(cfgPath, namedPath);
    if (!loaded)
        return loaded.error();
    config_ = std::move(loaded).value();

    // Precedence: --log-level > KGRAG_LOG_LEVEL > [logging] level
    std::string level = config_.logging.level;
    if (const char* envLvl = std::getenv("KGRAG_LOG_LEVEL"); envLvl && *envLvl)
        level = envLvl;
    if (!logLevel_.empty())
        level = logLevel_;
    if (auto lvl = parseLogLevel(level)) {
        spdlog::set_level(*lvl);
    } else {
        spdlog::warn("unknown log level '{}', keeping the current level", level);
    }

    if (!namespace_.empty())
        config_.retrieval.defaultNamespace = namespace_;
    if (!embedUrl_.empty())
        config_.providers.embedUrl = embedUrl_;
    if (!rerankUrl_.empty())
        config_.providers.rerankUrl = rerankUrl_;

    if (!graphJson_.empty() && !sqlitePath_.empty()) {
        return Error{ErrorCode::InvalidArgument, "--graph-json and --sqlite are mutually exclusive"};
    }
    if (!graphJson_.empty()) {
        auto store = graph::InMemoryGraphStore::fromJsonFile(config::expand_tilde(graphJson_));
        if (!store)
            return store.error();
        store_ = store.value();
    } else if (!sqlitePath_.empty()) {
        graph::SqliteGraphStoreConfig sqliteCfg;
        sqliteCfg.queryTimeout = config_.retrieval.graphTimeout;
        auto store = graph::SqliteGraphStore::open(config::expand_tilde(sqlitePath_).string(),
                                                   sqliteCfg);
        if (!store)
            return store.error();
        store_ = store.value();
    } else {
        return Error{ErrorCode::InvalidArgument, "a graph is required: use --graph-json or --sqlite"};
    }

    models_ = providers::ModelServices::fromUrls(config_.providers.embedUrl,
                                                 config_.providers.rerankUrl,
                                                 config::toHttpOptions(config_.providers));
    orchestrator_ =
        std::make_unique<search::RetrievalOrchestrator>(store_, models_, config_.retrieval);
    spdlog::debug("kgrag ready: store={}, namespace={}", store_->name(),
                  config_.retrieval.defaultNamespace);
    return {};
}

Result<search::RetrieveRequest> KgragCLI::buildRequest(const std::string& query) const {
    search::RetrieveRequest request;
    request.query = query;
    auto mode = search::retrievalModeFromString(mode_);
    if (!mode)
        return Error{ErrorCode::InvalidArgument, "unknown mode: " + mode_};
    request.mode = *mode;
    request.rerank = rerank_;
    if (app_->count("--top-k") > 0)
        request.topK = topK_;
    if (app_->count("--hops") > 0)
        request.hopDepth = hops_;
    if (app_->count("--rerank-top-n") > 0)
        request.rerankTopN = rerankTopN_;
    return request;
}

int KgragCLI::runRetrieve() {
    auto request = buildRequest(query_);
    if (!request) {
        *err_ << "Error: " << request.error().message << "\n";
        return 1;
    }

    auto result = orchestrator_->retrieve(request.value());
    if (!result) {
        *err_ << "Error: " << result.error().message << "\n";
        return 1;
    }

    if (context_) {
        for (const auto& w : result.value().warnings)
            *err_ << "Warning: " << w << "\n";
        *out_ << search::ContextAssembler{}.assemble(result.value()) << "\n";
    } else {
        *out_ << result.value().toJson(timings_).dump(2) << "\n";
    }
    return result.value().ok() ? 0 : 2;
}

size_t KgragCLI::jobCount() const {
    size_t threads = jobs_;
    if (threads == 0)
        threads = std::max(1u, std::thread::hardware_concurrency());
    return std::min<size_t>(threads, 16);
}

std::string KgragCLI::batchRow(const std::string& query, bool& failed) const {
    json row;
    row["query"] = common::sanitizeUtf8(query);
    auto request = buildRequest(query);
    auto result = request ? orchestrator_->retrieve(request.value())
                          : Result<search::RetrievalResult>(request.error());
    if (!result) {
        row["error"] = {{"code", errorToString(result.error().code)},
                        {"message", common::sanitizeUtf8(result.error().message)}};
        failed = true;
    } else {
        row.update(result.value().toJson(timings_));
        failed = !result.value().ok();
    }
    return row.dump();
}

int KgragCLI::runBatch() {
    std::ifstream in(batchFile_);
    if (!in) {
        *err_ << "Error: cannot open " << batchFile_ << "\n";
        return 1;
    }

    std::vector<std::string> queries;
    std::string line;
    while (std::getline(in, line)) {
        config::trim(line);
        if (!line.empty())
            queries.push_back(line);
    }

    const size_t threads = jobCount();

    std::vector<std::string> lines(queries.size());
    std::vector<std::uint8_t> failed(queries.size(), 0);
    {
        boost::asio::thread_pool pool(threads);
        for (size_t i = 0; i < queries.size(); ++i) {
            boost::asio::post(pool, [this, i, &queries, &lines, &failed]() {
                bool rowFailed = true;
                try {
                    lines[i] = batchRow(queries[i], rowFailed);
                } catch (const std::exception& e) {
                    spdlog::error("batch query {} failed: {}", i + 1, e.what());
                    json row{{"query", common::sanitizeUtf8(queries[i])},
                             {"error", {{"code", errorToString(ErrorCode::InternalError)},
                                        {"message", common::sanitizeUtf8(e.what())}}}};
                    lines[i] = row.dump();
                }
                failed[i] = rowFailed ? 1 : 0;
            });
        }
        pool.join();
    }

    size_t failures = 0;
    for (size_t i = 0; i < lines.size(); ++i) {
        *out_ << lines[i] << "\n";
        if (failed[i])
            ++failures;
    }
    spdlog::info("batch: {} queries, {} failed, {} threads", queries.size(), failures, threads);
    return failures == 0 ? 0 : 2;
}

std::string KgragCLI::evalRow(const std::string& line,
                              std::optional<search::EvaluationReport>& report) const {
    json row;
    auto fail = [&row](ErrorCode code, const std::string& message) {
        row["error"] = {{"code", errorToString(code)},
                        {"message", common::sanitizeUtf8(message)}};
        return row.dump();
    };

    json input = json::parse(line, nullptr, false);
    if (input.is_discarded() || !input.is_object() || !input.contains("question") ||
        !input["question"].is_string()) {
        return fail(ErrorCode::InvalidData, "expected an object with a \"question\" string");
    }
    const auto question = input["question"].get<std::string>();
    row["question"] = common::sanitizeUtf8(question);
    if (input.contains("id"))
        row["id"] = input["id"];

    std::vector<std::string> references;
    for (const auto& ref : input.value("references", json::array())) {
        if (!ref.is_string())
            return fail(ErrorCode::InvalidData, "references must be strings");
        references.push_back(ref.get<std::string>());
    }

    auto request = buildRequest(question);
    if (!request)
        return fail(request.error().code, request.error().message);
    auto result = orchestrator_->retrieve(request.value());
    if (!result)
        return fail(result.error().code, result.error().message);
    if (!result.value().ok())
        return fail(result.value().error->code, result.value().error->message);

    std::vector<std::string> retrieved;
    for (const auto& c : result.value().candidates)
        retrieved.push_back(c.text);

    search::RetrievalEvaluator evaluator(models_, evalOptions_);
    auto scored = evaluator.evaluate(references, retrieved);
    if (!scored)
        return fail(scored.error().code, scored.error().message);

    row["retrieved"] = retrieved.size();
    row["mode_used"] = search::retrievalModeToString(result.value().modeUsed);
    row["metrics"] = scored.value().toJson();
    report = std::move(scored).value();
    return row.dump();
}

int KgragCLI::runEval() {
    std::ifstream in(evalFile_);
    if (!in) {
        *err_ << "Error: cannot open " << evalFile_ << "\n";
        return 1;
    }

    std::vector<std::string> inputs;
    std::string line;
    while (std::getline(in, line)) {
        config::trim(line);
        if (!line.empty())
            inputs.push_back(line);
    }

    const size_t threads = jobCount();
    std::vector<std::string> rows(inputs.size());
    std::vector<std::optional<search::EvaluationReport>> reports(inputs.size());
    {
        boost::asio::thread_pool pool(threads);
        for (size_t i = 0; i < inputs.size(); ++i) {
            boost::asio::post(pool, [this, i, &inputs, &rows, &reports]() {
                try {
                    rows[i] = evalRow(inputs[i], reports[i]);
                } catch (const std::exception& e) {
                    spdlog::error("eval line {} failed: {}", i + 1, e.what());
                    reports[i].reset();
                    json row{{"error", {{"code", errorToString(ErrorCode::InternalError)},
                                        {"message", common::sanitizeUtf8(e.what())}}}};
                    rows[i] = row.dump();
                }
            });
        }
        pool.join();
    }

    search::EvaluationSummary summary;
    size_t failures = 0;
    for (size_t i = 0; i < rows.size(); ++i) {
        *out_ << rows[i] << "\n";
        if (reports[i])
            summary.add(*reports[i]);
        else
            ++failures;
    }
    const auto mean = summary.mean();
    json tail{{"summary", mean.toJson()}, {"failed", failures}};
    *out_ << tail.dump() << "\n";
    spdlog::info("eval: {} questions, {} failed, combined mrr {:.3f}", inputs.size(), failures,
                 mean.combined.mrr);
    return failures == 0 ? 0 : 2;
}

int KgragCLI::runHealth() {
    if (probeModels_) {
        if (auto e = models_->embedding(); !e)
            spdlog::info("embedding probe: {}", e.error().message);
        if (auto c = models_->crossEncoder(); !c)
            spdlog::info("cross-encoder probe: {}", c.error().message);
    }

    auto status = orchestrator_->health();
    json report = {
        {"graph", status.graph == search::GraphHealth::Available ? "available" : "unavailable"},
        {"store", status.storeName},
        {"consecutive_failures", status.consecutiveFailures},
        {"embedding", providers::modelStateToString(status.embedding)},
        {"cross_encoder", providers::modelStateToString(status.crossEncoder)},
    };
    if (status.probeError)
        report["probe_error"] = status.probeError->message;
    *out_ << report.dump(2) << "\n";
    return status.graph == search::GraphHealth::Available ? 0 : 1;
}

int KgragCLI::run(int argc, char* argv[]) {
    try {
        app_->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app_->exit(e, *out_, *err_);
    }

    auto init = initialize();
    if (!init) {
        *err_ << "Error: " << init.error().message << "\n";
        return 1;
    }

    if (app_->got_subcommand("retrieve"))
        return runRetrieve();
    if (app_->got_subcommand("batch"))
        return runBatch();
    if (app_->got_subcommand("health"))
        return runHealth();
    if (app_->got_subcommand("eval"))
        return runEval();
    return 1;
}

} // namespace kgrag::cli
