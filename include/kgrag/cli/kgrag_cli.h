#pragma once

#include <kgrag/config/engine_config.h>
#include <kgrag/core/types.h>
#include <kgrag/graph/graph_store.h>
#include <kgrag/providers/model_services.h>
#include <kgrag/search/evaluator.h>
#include <kgrag/search/retrieval_orchestrator.h>

#include <spdlog/common.h>

#include <cstddef>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace CLI {
class App;
}

namespace kgrag::cli {

std::optional<spdlog::level::level_enum> parseLogLevel(const std::string& name);

/**
 * Main CLI application class
 *
 * kgrag retrieve <query>   one request, JSON (or a context block with --context)
 * kgrag batch <file>       one query per line, JSON lines in input order
 * kgrag health             store probe and model states
 * kgrag eval <file>        retrieval quality against reference contexts (JSON lines)
 */
class KgragCLI {
public:
    KgragCLI();
    ~KgragCLI();

    /**
     * Run the CLI with given arguments
     * @return process exit code
     */
    int run(int argc, char* argv[]);

    // Output streams are injectable so the commands can be exercised in-process.
    void setOutput(std::ostream& out, std::ostream& err);

private:
    Result<void> initialize();
    Result<search::RetrieveRequest> buildRequest(const std::string& query) const;

    int runRetrieve();
    int runBatch();
    // One JSON line for a batch query; `failed` is set when the row carries an error.
    std::string batchRow(const std::string& query, bool& failed) const;
    int runEval();
    // Scores one `{"question", "references"}` line; `report` is set on success.
    std::string evalRow(const std::string& line,
                        std::optional<search::EvaluationReport>& report) const;
    size_t jobCount() const;
    int runHealth();

    std::unique_ptr<CLI::App> app_;
    std::ostream* out_;
    std::ostream* err_;

    // Global options
    std::string configPath_;
    std::string logLevel_;
    std::string graphJson_;
    std::string sqlitePath_;
    std::string embedUrl_;
    std::string rerankUrl_;
    std::string namespace_;

    // Request options
    std::string mode_ = "graph-hybrid";
    size_t topK_ = 0;
    size_t hops_ = 0;
    size_t rerankTopN_ = 0;
    bool rerank_ = false;
    bool context_ = false;
    bool timings_ = false;

    // Subcommand arguments
    std::string query_;
    std::string batchFile_;
    size_t jobs_ = 0;
    bool probeModels_ = false;
    std::string evalFile_;
    search::EvaluatorOptions evalOptions_;

    config::EngineConfig config_;
    std::shared_ptr<graph::IGraphStore> store_;
    std::shared_ptr<providers::ModelServices> models_;
    std::unique_ptr<search::RetrievalOrchestrator> orchestrator_;
};

} // namespace kgrag::cli
