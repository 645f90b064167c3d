#include <codegraph/pipeline/orchestrator.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <future>
#include <map>

#include <codegraph/pipeline/repository_acquirer.h>

namespace codegraph::pipeline {

namespace {

constexpr double kAcquiredProgress = 0.1;
constexpr double kIndexedProgress = 0.2;
constexpr double kExtractedProgress = 0.6;
constexpr double kLinkedProgress = 0.65;
constexpr double kAnalyzedProgress = 0.9;
constexpr double kChangesProgress = 0.95;

bool isConnectivityError(const Error& error) {
    return error.code == ErrorCode::NotConnected || error.code == ErrorCode::ServiceUnavailable;
}

/// Thrown inside a job to unwind to the cancellation handler.
struct JobCancelled {};

/**
 * @brief Releases an acquired repository when the job leaves scope.
 */
class ScopedRepository {
public:
    explicit ScopedRepository(RepositoryAcquirer& acquirer) : acquirer_(acquirer) {}
    ~ScopedRepository() { release(); }

    ScopedRepository(const ScopedRepository&) = delete;
    ScopedRepository& operator=(const ScopedRepository&) = delete;

    void reset(AcquiredRepository repo) {
        release();
        repo_ = std::move(repo);
    }

    [[nodiscard]] const AcquiredRepository& get() const { return *repo_; }

    void release() noexcept {
        if (!repo_)
            return;
        try {
            acquirer_.release(*repo_);
            spdlog::debug("Released repository {}", repo_->localPath.string());
        } catch (const std::exception& e) {
            spdlog::error("Releasing repository {} failed: {}", repo_->localPath.string(),
                          e.what());
        }
        repo_.reset();
    }

private:
    RepositoryAcquirer& acquirer_;
    std::optional<AcquiredRepository> repo_;
};

} // namespace

struct PipelineOrchestrator::FileOutcome {
    std::string path;
    model::Language language = model::Language::Python;
    bool extracted = false;
    std::size_t symbols = 0;
    std::size_t edges = 0;
    std::map<std::string, std::size_t> symbolKinds;
    /// Per-file failure; the job continues.
    std::optional<std::string> failure;
    /// Store connectivity failure; the job stops.
    std::optional<Error> fatal;
};

struct PipelineOrchestrator::RunState {
    std::size_t filesIndexed = 0;
    std::size_t filesExtracted = 0;
    std::size_t symbols = 0;
    std::size_t edges = 0;
    std::size_t callsResolved = 0;
    nlohmann::json filesFailed = nlohmann::json::array();
    std::map<std::string, std::size_t> filesPerLanguage;
    std::map<std::string, std::size_t> symbolsPerKind;
    nlohmann::json analyses = nlohmann::json::object();
    std::size_t changesApplied = 0;
    nlohmann::json pullRequest = nullptr;

    void add(FileOutcome&& outcome) {
        ++filesPerLanguage[std::string(model::toString(outcome.language))];
        if (outcome.failure) {
            filesFailed.push_back({{"path", outcome.path}, {"error", *outcome.failure}});
            return;
        }
        if (outcome.extracted)
            ++filesExtracted;
        symbols += outcome.symbols;
        edges += outcome.edges;
        for (const auto& [kind, count] : outcome.symbolKinds)
            symbolsPerKind[kind] += count;
    }

    nlohmann::json toJson() const {
        return nlohmann::json{{"files_indexed", filesIndexed},
                              {"files_extracted", filesExtracted},
                              {"files_failed", filesFailed},
                              {"symbols", symbols},
                              {"edges", edges},
                              {"calls_resolved", callsResolved},
                              {"summary",
                               {{"files_per_language", filesPerLanguage},
                                {"symbols_per_kind", symbolsPerKind}}},
                              {"analyses", analyses},
                              {"changes_applied", changesApplied},
                              {"pull_request", pullRequest}};
    }
};

PipelineOrchestrator::PipelineOrchestrator(graph::GraphStore& store,
                                           PipelineCollaborators collaborators,
                                           OrchestratorConfig config)
    : store_(store), collaborators_(std::move(collaborators)), config_(config) {
    if (!collaborators_.acquirer)
        collaborators_.acquirer = std::make_shared<DefaultRepositoryAcquirer>();
    if (!collaborators_.indexer)
        throw std::invalid_argument("PipelineOrchestrator requires a source indexer");

    if (config_.extractionThreads > 1)
        extractionPool_ = std::make_unique<ThreadPool>(config_.extractionThreads);
    jobPool_ = std::make_unique<ThreadPool>(std::max<std::size_t>(1, config_.workerThreads));
    spdlog::debug("Pipeline orchestrator started ({} job workers, {} extraction threads)",
                  jobPool_->size(), extractionPool_ ? extractionPool_->size() : 1);
}

PipelineOrchestrator::~PipelineOrchestrator() {
    shutdown();
}

void PipelineOrchestrator::shutdown() {
    if (jobPool_)
        jobPool_->stop();
    if (extractionPool_)
        extractionPool_->stop();
}

Result<std::string> PipelineOrchestrator::submit(const RepoSpec& spec) {
    if (spec.url.empty())
        return Error{ErrorCode::InvalidArgument, "Repository url is required"};

    const std::string repoId = spec.repoId.empty() ? deriveRepoId(spec.url) : spec.repoId;
    nlohmann::json metadata{{"repository_url", spec.url}};
    metadata["branch"] = spec.branch ? nlohmann::json(*spec.branch) : nlohmann::json(nullptr);
    metadata["commit"] = spec.commit ? nlohmann::json(*spec.commit) : nlohmann::json(nullptr);

    auto jobId = registry_.create(std::string(kIndexJobKind), repoId, std::move(metadata));
    const bool queued =
        jobPool_->post([this, jobId, spec, repoId] { runJob(jobId, spec, repoId); });
    if (!queued) {
        auto r = registry_.fail(jobId, "Pipeline is shutting down");
        if (!r)
            spdlog::warn("Could not mark job {} failed: {}", jobId, r.error().message);
        return Error{ErrorCode::InvalidState, "Pipeline is shutting down"};
    }
    spdlog::info("Submitted job {} for {} (repo {})", jobId, spec.url, repoId);
    return jobId;
}

Result<Job> PipelineOrchestrator::getJobStatus(const std::string& jobId) const {
    return registry_.get(jobId);
}

std::vector<Job> PipelineOrchestrator::listJobs() const {
    return registry_.list();
}

Result<void> PipelineOrchestrator::cancel(const std::string& jobId) {
    return registry_.requestCancel(jobId);
}

Result<Job> PipelineOrchestrator::waitForJob(const std::string& jobId,
                                             std::chrono::milliseconds timeout) const {
    return registry_.waitForTerminal(jobId, timeout);
}

bool PipelineOrchestrator::cancelRequested(const std::string& jobId) const {
    return registry_.cancelRequested(jobId);
}

void PipelineOrchestrator::progress(const std::string& jobId, double value) {
    auto r = registry_.setProgress(jobId, value);
    if (!r)
        spdlog::debug("Progress update for job {} ignored: {}", jobId, r.error().message);
}

void PipelineOrchestrator::runJob(const std::string& jobId, const RepoSpec& spec,
                                  const std::string& repoId) {
    RunState state;
    auto finish = [&](Result<void> r, const char* what) {
        if (!r)
            spdlog::warn("Could not mark job {} {}: {}", jobId, what, r.error().message);
    };

    if (cancelRequested(jobId)) {
        finish(registry_.markCancelled(jobId, state.toJson()), "cancelled");
        spdlog::info("Job {} cancelled before start", jobId);
        return;
    }
    finish(registry_.markRunning(jobId), "running");
    spdlog::info("Job {} running for repo {}", jobId, repoId);

    try {
        auto result = executeStages(jobId, spec, repoId, state);
        if (!result) {
            spdlog::error("Job {} failed: {}", jobId, result.error().message);
            finish(registry_.fail(jobId, result.error().message), "failed");
            return;
        }
        finish(registry_.complete(jobId, std::move(result).value()), "completed");
        spdlog::info("Job {} completed: {} files, {} symbols, {} edges", jobId, state.filesIndexed,
                     state.symbols, state.edges);
    } catch (const JobCancelled&) {
        finish(registry_.markCancelled(jobId, state.toJson()), "cancelled");
        spdlog::info("Job {} cancelled", jobId);
    } catch (const std::exception& e) {
        spdlog::error("Job {} failed with exception: {}", jobId, e.what());
        finish(registry_.fail(jobId, e.what()), "failed");
    }
}

Result<nlohmann::json> PipelineOrchestrator::executeStages(const std::string& jobId,
                                                           const RepoSpec& spec,
                                                           const std::string& repoId,
                                                           RunState& state) {
    auto checkpoint = [&] {
        if (cancelRequested(jobId))
            throw JobCancelled{};
    };

    // Stage 1: acquire. The guard releases on every path out of this function.
    ScopedRepository repo(*collaborators_.acquirer);
    auto acquired = collaborators_.acquirer->acquire(spec);
    if (!acquired) {
        return Error{acquired.error().code,
                     "Repository acquisition failed: " + acquired.error().message};
    }
    repo.reset(std::move(acquired).value());
    progress(jobId, kAcquiredProgress);
    checkpoint();

    // Stage 2: index
    auto units = collaborators_.indexer->index(repo.get(), spec, repoId);
    if (!units)
        return Error{units.error().code, "Indexing failed: " + units.error().message};
    state.filesIndexed = units.value().size();
    progress(jobId, kIndexedProgress);
    spdlog::info("Job {}: {} files to extract", jobId, state.filesIndexed);
    checkpoint();

    // Stage 3: extract and store
    auto stored = extractAndStore(jobId, units.value(), state);
    if (!stored)
        return stored.error();
    progress(jobId, kExtractedProgress);
    checkpoint();

    // Link calls that cross file boundaries
    auto linked = store_.resolveCrossFileCalls(repoId);
    if (!linked)
        return Error{linked.error().code, "Call linking failed: " + linked.error().message};
    state.callsResolved = linked.value();
    progress(jobId, kLinkedProgress);
    checkpoint();

    // Stage 4: analyses over the read-only view
    const graph::GraphReader& reader = store_;
    const auto& analyzers = collaborators_.analyzers;
    for (size_t i = 0; i < analyzers.size(); ++i) {
        const auto& analyzer = analyzers[i];
        const auto name = analyzer->name();
        spdlog::debug("Job {}: running analysis {}", jobId, name);
        auto analysis = analyzer->analyze(reader, repoId);
        if (!analysis) {
            return Error{analysis.error().code,
                         fmt::format("Analysis '{}' failed: {}", name, analysis.error().message)};
        }
        state.analyses[name] = std::move(analysis).value();
        progress(jobId, kLinkedProgress + (kAnalyzedProgress - kLinkedProgress) *
                                              static_cast<double>(i + 1) /
                                              static_cast<double>(analyzers.size()));
        checkpoint();
    }
    progress(jobId, kAnalyzedProgress);

    // Stage 5: optional changes and pull request
    if (spec.applyChanges && collaborators_.changeApplier) {
        auto changes = collaborators_.changeApplier->apply(repo.get(), state.analyses);
        if (!changes)
            return Error{changes.error().code, "Applying changes failed: " + changes.error().message};
        state.changesApplied = changes.value().value("applied", std::size_t{0});

        if (spec.createPullRequest && collaborators_.publisher && state.changesApplied > 0) {
            auto pr = collaborators_.publisher->publish(spec, repo.get(), changes.value());
            if (!pr) {
                return Error{pr.error().code,
                             "Pull request creation failed: " + pr.error().message};
            }
            state.pullRequest = pr.value();
        }
    }
    progress(jobId, kChangesProgress);

    return state.toJson();
}

PipelineOrchestrator::FileOutcome PipelineOrchestrator::processFile(model::ParseUnit& unit) const {
    FileOutcome outcome;
    outcome.path = unit.path;
    outcome.language = unit.language;

    const auto& parser = collaborators_.parser;
    if (!parser || !parser->supports(unit.language) ||
        !extraction::SymbolExtractor::supports(unit.language)) {
        spdlog::debug("No extraction for {} ({})", unit.path, model::toString(unit.language));
        return outcome;
    }

    auto tree = parser->parse(unit.content, unit.language);
    if (!tree) {
        spdlog::warn("Parse failed for {}: {}", unit.path, tree.error().message);
        outcome.failure = "parse: " + tree.error().message;
        return outcome;
    }
    unit.tree = std::move(tree).value();

    auto stats = extractor_.extractInto(unit);
    if (!stats) {
        spdlog::warn("Extraction failed for {}: {}", unit.path, stats.error().message);
        outcome.failure = "extract: " + stats.error().message;
        return outcome;
    }

    // Symbols first so edges can materialize against both endpoints.
    auto r = store_.upsertSymbols(unit.symbols);
    if (r)
        r = store_.upsertEdges(unit.edges);
    if (!r) {
        if (isConnectivityError(r.error())) {
            outcome.fatal = r.error();
        } else {
            spdlog::warn("Storing graph for {} failed: {}", unit.path, r.error().message);
            outcome.failure = "store: " + r.error().message;
        }
        return outcome;
    }

    outcome.extracted = true;
    outcome.symbols = unit.symbols.size();
    outcome.edges = unit.edges.size();
    for (const auto& s : unit.symbols)
        ++outcome.symbolKinds[std::string(model::toString(s.kind))];
    spdlog::debug("{}: {} symbols, {} edges", unit.path, outcome.symbols, outcome.edges);

    // The store owns the records now.
    unit.tree.reset();
    unit.content.clear();
    unit.content.shrink_to_fit();
    return outcome;
}

Result<void> PipelineOrchestrator::extractAndStore(const std::string& jobId,
                                                   std::vector<model::ParseUnit>& units,
                                                   RunState& state) {
    const size_t total = units.size();
    if (total == 0)
        return {};

    std::atomic<size_t> done{0};
    auto advance = [&] {
        const size_t n = ++done;
        progress(jobId, kIndexedProgress + (kExtractedProgress - kIndexedProgress) *
                                               static_cast<double>(n) /
                                               static_cast<double>(total));
    };
    auto fatalError = [&](const Error& e, const std::string& path) {
        return Error{e.code, fmt::format("Graph store failure while storing {}: {}", path,
                                         e.message)};
    };

    if (!extractionPool_) {
        for (auto& unit : units) {
            if (cancelRequested(jobId))
                throw JobCancelled{};
            auto outcome = processFile(unit);
            if (outcome.fatal)
                return fatalError(*outcome.fatal, outcome.path);
            state.add(std::move(outcome));
            advance();
        }
        return {};
    }

    std::vector<std::future<std::optional<FileOutcome>>> pending;
    pending.reserve(total);
    for (auto& unit : units) {
        pending.push_back(extractionPool_->submit([&, unitPtr = &unit]() {
            if (cancelRequested(jobId))
                return std::optional<FileOutcome>{};
            auto outcome = processFile(*unitPtr);
            advance();
            return std::optional<FileOutcome>{std::move(outcome)};
        }));
    }

    // Collect in file order; every future is drained before returning.
    std::optional<Error> fatal;
    std::optional<std::string> thrown;
    bool cancelled = false;
    for (auto& f : pending) {
        std::optional<FileOutcome> outcome;
        try {
            outcome = f.get();
        } catch (const std::exception& e) {
            if (!thrown)
                thrown = e.what();
            continue;
        }
        if (!outcome) {
            cancelled = true;
            continue;
        }
        if (outcome->fatal) {
            if (!fatal)
                fatal = fatalError(*outcome->fatal, outcome->path);
            continue;
        }
        state.add(std::move(*outcome));
    }
    if (fatal)
        return *fatal;
    if (thrown)
        return Error{ErrorCode::InternalError, "Extraction task failed: " + *thrown};
    if (cancelled)
        throw JobCancelled{};
    return {};
}

} // namespace codegraph::pipeline
