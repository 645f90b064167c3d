#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <thread>

#include <codegraph/config/config.h>
#include <codegraph/extraction/grammar_loader.h>
#include <codegraph/extraction/tree_sitter_parser.h>
#include <codegraph/graph/graph_store.h>
#include <codegraph/pipeline/filesystem_indexer.h>
#include <codegraph/pipeline/orchestrator.h>
#include <codegraph/pipeline/repository_acquirer.h>
#include <codegraph/pipeline/structural_analyzer.h>

using json = nlohmann::json;
using namespace codegraph;

namespace {

void configureLogging(const std::string& level, bool verbose) {
    auto lvl = spdlog::level::from_str(level);
    // from_str maps unknown names to "off"
    if (lvl == spdlog::level::off && level != "off")
        lvl = spdlog::level::info;
    spdlog::set_level(verbose ? spdlog::level::debug : lvl);
    spdlog::set_pattern("[%H:%M:%S] [%l] %v");
}

std::unique_ptr<graph::GraphStore> openStore(const config::CodegraphConfig& cfg) {
    std::error_code ec;
    std::filesystem::create_directories(cfg.graph.dbPath.parent_path(), ec);

    graph::GraphStoreConfig storeCfg;
    storeCfg.dbPath = cfg.graph.dbPath.string();
    storeCfg.pool.maxConnections = cfg.graph.maxConnections;
    storeCfg.pool.busyTimeout = cfg.graph.busyTimeout;
    storeCfg.pool.enableWAL = cfg.graph.enableWAL;

    auto store = graph::makeSqliteGraphStore(storeCfg);
    auto connected = store->connect();
    if (!connected) {
        std::cerr << "Cannot open graph database " << storeCfg.dbPath << ": "
                  << connected.error().message << std::endl;
        return nullptr;
    }
    return store;
}

template <typename T> bool reportError(const Result<T>& r) {
    if (r)
        return false;
    std::cerr << "Error: " << r.error().message << " (" << errorToString(r.error().code) << ")"
              << std::endl;
    return true;
}

std::optional<model::Language> parseLanguageOption(const std::string& name) {
    auto lang = model::parseLanguage(name);
    if (!lang)
        return std::nullopt;
    return lang.value();
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"Code knowledge graph indexer", "codegraph"};
    app.set_version_flag("--version", "0.1.0");
    app.require_subcommand(1);

    std::string configPath;
    std::string dbPath;
    bool verbose = false;
    bool jsonOutput = false;
    app.add_option("-c,--config", configPath, "Configuration file");
    app.add_option("--db", dbPath, "Graph database path");
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");
    app.add_flag("--json", jsonOutput, "Output in JSON format");

    config::CodegraphConfig cfg;
    int exitCode = 0;

    auto prepare = [&]() -> std::unique_ptr<graph::GraphStore> {
        cfg = config::loadConfig(configPath.empty() ? std::filesystem::path{}
                                                    : config::expand_tilde(configPath));
        if (!dbPath.empty())
            cfg.graph.dbPath = config::expand_tilde(dbPath);
        configureLogging(cfg.logLevel, verbose);
        return openStore(cfg);
    };

    // index
    auto* indexCmd = app.add_subcommand("index", "Index a repository into the graph");
    pipeline::RepoSpec spec;
    std::string branch;
    std::string commit;
    std::vector<std::string> languages;
    bool skipAnalysis = false;
    indexCmd->add_option("source", spec.url, "Local path or git url")->required();
    indexCmd->add_option("--repo-id", spec.repoId, "Repository id (derived from the url if omitted)");
    indexCmd->add_option("--branch", branch, "Branch to clone");
    indexCmd->add_option("--commit", commit, "Commit to check out");
    indexCmd->add_option("--lang", languages, "Languages to index (python, javascript, ...)");
    indexCmd->add_option("--include", spec.includePaths, "Path prefixes to index");
    indexCmd->add_option("--exclude", spec.excludePatterns, "Glob patterns to skip");
    indexCmd->add_flag("--no-analysis", skipAnalysis, "Skip downstream analyses");
    indexCmd->callback([&]() {
        auto store = prepare();
        if (!store) {
            exitCode = 2;
            return;
        }
        if (!branch.empty())
            spec.branch = branch;
        if (!commit.empty())
            spec.commit = commit;
        for (const auto& name : languages) {
            auto lang = parseLanguageOption(name);
            if (!lang) {
                std::cerr << "Unknown language: " << name << std::endl;
                exitCode = 2;
                return;
            }
            spec.languages.push_back(*lang);
        }

        pipeline::PipelineCollaborators collaborators;
        collaborators.acquirer = std::make_shared<pipeline::DefaultRepositoryAcquirer>();
        collaborators.indexer = std::make_shared<pipeline::FilesystemIndexer>(
            pipeline::FilesystemIndexerConfig{cfg.pipeline.maxFileSizeBytes,
                                              cfg.pipeline.excludePatterns});
        collaborators.parser = std::make_shared<extraction::TreeSitterParser>(
            std::make_shared<extraction::GrammarLoader>(cfg.dataDir));
        if (!skipAnalysis)
            collaborators.analyzers.push_back(std::make_shared<pipeline::StructuralAnalyzer>());

        pipeline::PipelineOrchestrator orchestrator(
            *store, std::move(collaborators),
            pipeline::OrchestratorConfig{1, cfg.pipeline.extractionThreads});

        auto jobId = orchestrator.submit(spec);
        if (reportError(jobId)) {
            exitCode = 1;
            return;
        }

        double lastProgress = -1.0;
        while (true) {
            auto job = orchestrator.getJobStatus(jobId.value());
            if (reportError(job)) {
                exitCode = 1;
                return;
            }
            if (!jsonOutput && job.value().progress > lastProgress) {
                lastProgress = job.value().progress;
                std::cerr << "\r[" << static_cast<int>(lastProgress * 100) << "%] "
                          << pipeline::toString(job.value().status) << std::flush;
            }
            if (pipeline::isTerminal(job.value().status))
                break;
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        if (!jsonOutput)
            std::cerr << std::endl;

        auto job = orchestrator.getJobStatus(jobId.value());
        if (reportError(job)) {
            exitCode = 1;
            return;
        }
        std::cout << json(job.value()).dump(2) << std::endl;
        exitCode = job.value().status == pipeline::JobStatus::Completed ? 0 : 1;
    });

    // export
    auto* exportCmd = app.add_subcommand("export", "Export a repository graph");
    std::string exportRepo;
    std::string exportFormat = "graphml";
    std::string exportOut;
    exportCmd->add_option("--repo", exportRepo, "Repository id")->required();
    exportCmd->add_option("--format", exportFormat, "graphml or json")->default_val("graphml");
    exportCmd->add_option("--out", exportOut, "Output file (stdout if omitted)");
    exportCmd->callback([&]() {
        auto store = prepare();
        if (!store) {
            exitCode = 2;
            return;
        }
        auto format = graph::parseExportFormat(exportFormat);
        if (reportError(format)) {
            exitCode = 2;
            return;
        }
        if (exportOut.empty()) {
            auto doc = store->exportDocument(exportRepo, format.value());
            if (reportError(doc)) {
                exitCode = 1;
                return;
            }
            std::cout << doc.value() << std::endl;
            return;
        }
        auto written = store->exportGraph(exportRepo, exportOut, format.value());
        if (reportError(written))
            exitCode = 1;
    });

    // import
    auto* importCmd = app.add_subcommand("import", "Import a JSON graph document");
    std::string importFile;
    importCmd->add_option("file", importFile, "JSON document")->required()->check(
        CLI::ExistingFile);
    importCmd->callback([&]() {
        auto store = prepare();
        if (!store) {
            exitCode = 2;
            return;
        }
        std::ifstream in(importFile);
        auto doc = json::parse(in, nullptr, /*allow_exceptions=*/false);
        if (doc.is_discarded()) {
            std::cerr << "Error: " << importFile << " is not valid JSON" << std::endl;
            exitCode = 2;
            return;
        }
        auto imported = store->importBulk(doc);
        if (reportError(imported)) {
            exitCode = 1;
            return;
        }
        std::cout << json{{"symbols", imported.value().symbols},
                          {"edges", imported.value().edges}}
                         .dump(jsonOutput ? -1 : 2)
                  << std::endl;
    });

    // query
    auto* queryCmd = app.add_subcommand("query", "Structural queries");
    std::string queryName;
    std::string queryRepo;
    queryCmd->add_option("name", queryName, "callgraph | orphans | cycles | endpoints")
        ->required()
        ->check(CLI::IsMember({"callgraph", "orphans", "cycles", "endpoints"}));
    queryCmd->add_option("--repo", queryRepo, "Repository id")->required();
    queryCmd->callback([&]() {
        auto store = prepare();
        if (!store) {
            exitCode = 2;
            return;
        }
        json out;
        if (queryName == "callgraph") {
            auto r = store->callGraph(queryRepo);
            if (reportError(r)) {
                exitCode = 1;
                return;
            }
            out = r.value();
        } else if (queryName == "orphans") {
            auto r = store->orphanSymbols(queryRepo);
            if (reportError(r)) {
                exitCode = 1;
                return;
            }
            out = r.value();
        } else if (queryName == "cycles") {
            auto r = store->cycles(queryRepo);
            if (reportError(r)) {
                exitCode = 1;
                return;
            }
            out = r.value();
        } else {
            auto r = store->endpointsWithoutValidation(queryRepo);
            if (reportError(r)) {
                exitCode = 1;
                return;
            }
            out = json::array();
            for (const auto& e : r.value()) {
                out.push_back({{"id", e.symbolId},
                               {"name", e.name},
                               {"file", e.filePath},
                               {"line", e.line},
                               {"parameters", e.parameters}});
            }
        }
        std::cout << out.dump(jsonOutput ? -1 : 2) << std::endl;
    });

    // stats
    auto* statsCmd = app.add_subcommand("stats", "Graph counts for a repository");
    std::string statsRepo;
    statsCmd->add_option("--repo", statsRepo, "Repository id")->required();
    statsCmd->callback([&]() {
        auto store = prepare();
        if (!store) {
            exitCode = 2;
            return;
        }
        auto s = store->stats(statsRepo);
        if (reportError(s)) {
            exitCode = 1;
            return;
        }
        json out{{"repo_id", statsRepo},
                 {"symbols", s.value().symbols},
                 {"edges", s.value().edges},
                 {"relationships", s.value().relationships},
                 {"unresolved_edges", s.value().unresolvedEdges}};
        if (jsonOutput) {
            std::cout << out.dump() << std::endl;
        } else {
            std::cout << "Repository:     " << statsRepo << "\n"
                      << "Symbols:        " << s.value().symbols << "\n"
                      << "Edges:          " << s.value().edges << "\n"
                      << "Relationships:  " << s.value().relationships << "\n"
                      << "Unresolved:     " << s.value().unresolvedEdges << std::endl;
        }
    });

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
    return exitCode;
}
