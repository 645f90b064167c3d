#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <codegraph/core/types.h>
#include <codegraph/extraction/source_parser.h>
#include <codegraph/extraction/symbol_extractor.h>
#include <codegraph/graph/graph_store.h>
#include <codegraph/pipeline/collaborators.h>
#include <codegraph/pipeline/job_registry.h>
#include <codegraph/pipeline/thread_pool.h>

namespace codegraph::pipeline {

struct OrchestratorConfig {
    std::size_t workerThreads = 2;
    /// Per-file extraction parallelism inside one job; 1 keeps it sequential.
    std::size_t extractionThreads = 1;
};

/**
 * @brief External collaborators of the pipeline. acquirer and indexer are
 * required; parser may be null, in which case no file yields symbols.
 */
struct PipelineCollaborators {
    std::shared_ptr<RepositoryAcquirer> acquirer;
    std::shared_ptr<SourceIndexer> indexer;
    std::shared_ptr<extraction::SourceParser> parser;
    std::vector<std::shared_ptr<GraphAnalyzer>> analyzers;
    std::shared_ptr<ChangeApplier> changeApplier;
    std::shared_ptr<PullRequestPublisher> publisher;
};

/**
 * @brief Runs index jobs in the background:
 * acquire -> index -> extract/store -> link -> analyze -> apply/publish.
 *
 * The repository is released on every exit path. A job fails when a stage
 * returns an error or throws; per-file parse and extraction failures are
 * recorded in the result instead. Graph connectivity failures are always
 * fatal to the job.
 */
class PipelineOrchestrator {
public:
    PipelineOrchestrator(graph::GraphStore& store, PipelineCollaborators collaborators,
                         OrchestratorConfig config = {});
    ~PipelineOrchestrator();

    PipelineOrchestrator(const PipelineOrchestrator&) = delete;
    PipelineOrchestrator& operator=(const PipelineOrchestrator&) = delete;

    /// Queue a job and return its id.
    Result<std::string> submit(const RepoSpec& spec);

    /// Latest snapshot; ErrorCode::NotFound for an unknown id.
    Result<Job> getJobStatus(const std::string& jobId) const;

    std::vector<Job> listJobs() const;

    /// Cooperative: the job stops at its next stage or file boundary.
    Result<void> cancel(const std::string& jobId);

    Result<Job> waitForJob(const std::string& jobId,
                           std::chrono::milliseconds timeout = std::chrono::minutes(30)) const;

    /// Stop accepting jobs and wait for running ones to finish.
    void shutdown();

    [[nodiscard]] const JobRegistry& registry() const { return registry_; }

private:
    struct FileOutcome;
    struct RunState;

    void runJob(const std::string& jobId, const RepoSpec& spec, const std::string& repoId);
    Result<nlohmann::json> executeStages(const std::string& jobId, const RepoSpec& spec,
                                         const std::string& repoId, RunState& state);
    FileOutcome processFile(model::ParseUnit& unit) const;
    Result<void> extractAndStore(const std::string& jobId, std::vector<model::ParseUnit>& units,
                                 RunState& state);

    bool cancelRequested(const std::string& jobId) const;
    void progress(const std::string& jobId, double value);

    graph::GraphStore& store_;
    PipelineCollaborators collaborators_;
    OrchestratorConfig config_;
    extraction::SymbolExtractor extractor_;
    JobRegistry registry_;
    std::unique_ptr<ThreadPool> extractionPool_;
    std::unique_ptr<ThreadPool> jobPool_;
};

} // namespace codegraph::pipeline
