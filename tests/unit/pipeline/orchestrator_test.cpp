#include <gtest/gtest.h>
#include <codegraph/pipeline/orchestrator.h>

#include <atomic>
#include <future>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>

#include "common/syntax_builders.h"
#include "common/temp_dir.h"

using namespace codegraph;
using namespace codegraph::pipeline;
using namespace codegraph::test;
using namespace std::chrono_literals;
using model::Language;

namespace {

class FakeAcquirer : public RepositoryAcquirer {
public:
    Result<AcquiredRepository> acquire(const RepoSpec& spec) override {
        ++acquired;
        if (gate)
            gate->wait();
        if (failWith)
            return Error{ErrorCode::ServiceUnavailable, *failWith};
        return AcquiredRepository{"/checkout/" + spec.url, true, {}};
    }

    void release(const AcquiredRepository&) override { ++released; }

    std::atomic<int> acquired{0};
    std::atomic<int> released{0};
    std::optional<std::string> failWith;
    std::optional<std::shared_future<void>> gate;
};

/// Serves the same files for every repository.
class FakeIndexer : public SourceIndexer {
public:
    Result<std::vector<model::ParseUnit>> index(const AcquiredRepository&, const RepoSpec&,
                                                const std::string& repoId) override {
        std::vector<model::ParseUnit> units;
        for (const auto& [path, content] : files) {
            model::ParseUnit unit;
            unit.id = repoId + ":" + path;
            unit.repoId = repoId;
            unit.path = path;
            unit.language = path.ends_with(".go") ? Language::Go : Language::Python;
            unit.content = content;
            units.push_back(std::move(unit));
        }
        return units;
    }

    std::map<std::string, std::string> files;
};

/// Returns prebuilt trees keyed by file content.
class FakeParser : public extraction::SourceParser {
public:
    Result<extraction::SyntaxNode> parse(std::string_view content, Language) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = trees.find(std::string(content));
        if (it == trees.end())
            return Error{ErrorCode::InvalidData, "syntax error"};
        return it->second;
    }

    bool supports(Language language) const override { return language == Language::Python; }

    std::map<std::string, extraction::SyntaxNode> trees;

private:
    std::mutex mutex_;
};

class CountingAnalyzer : public GraphAnalyzer {
public:
    std::string name() const override { return "counts"; }

    Result<nlohmann::json> analyze(const graph::GraphReader& graph,
                                   const std::string& repoId) override {
        auto stats = graph.stats(repoId);
        if (!stats)
            return stats.error();
        return nlohmann::json{{"symbols", stats.value().symbols}};
    }
};

class ThrowingAnalyzer : public GraphAnalyzer {
public:
    std::string name() const override { return "broken"; }

    Result<nlohmann::json> analyze(const graph::GraphReader&, const std::string&) override {
        throw std::runtime_error("analyzer exploded");
    }
};

class FailingAnalyzer : public GraphAnalyzer {
public:
    std::string name() const override { return "strict"; }

    Result<nlohmann::json> analyze(const graph::GraphReader&, const std::string&) override {
        return Error{ErrorCode::InvalidData, "nothing to analyze"};
    }
};

class RecordingApplier : public ChangeApplier {
public:
    Result<nlohmann::json> apply(const AcquiredRepository&, const nlohmann::json& analyses) override {
        seen = analyses;
        return nlohmann::json{{"applied", 2}};
    }
    nlohmann::json seen;
};

class FakePublisher : public PullRequestPublisher {
public:
    Result<std::string> publish(const RepoSpec& spec, const AcquiredRepository&,
                                const nlohmann::json&) override {
        return "https://review.example/" + spec.repoId + "/1";
    }
};

} // namespace

class OrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = makeTempDir("orchestrator");
        graph::GraphStoreConfig config;
        config.dbPath = (dir_ / "graph.db").string();
        store_ = graph::makeSqliteGraphStore(config);
        ASSERT_TRUE(store_->connect());

        acquirer_ = std::make_shared<FakeAcquirer>();
        indexer_ = std::make_shared<FakeIndexer>();
        parser_ = std::make_shared<FakeParser>();

        // a.py: class Foo with method bar.  b.py: def baz(): obj.bar()
        indexer_->files["a.py"] = "class Foo:\n    def bar(self): pass\n";
        indexer_->files["b.py"] = "def baz():\n    obj.bar()\n";
        parser_->trees[indexer_->files["a.py"]] =
            module({pyClass("Foo", {}, 0, 1, {pyFunction("bar", {"self"}, 1, 1, {}, 4)})});
        parser_->trees[indexer_->files["b.py"]] =
            module({pyFunction("baz", {}, 0, 1, {pyMethodCall("obj", "bar", 1)})});
    }

    void TearDown() override {
        orchestrator_.reset();
        store_.reset();
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    PipelineOrchestrator& start(OrchestratorConfig config = {}) {
        PipelineCollaborators collaborators;
        collaborators.acquirer = acquirer_;
        collaborators.indexer = indexer_;
        collaborators.parser = parser_;
        collaborators.analyzers = analyzers_;
        collaborators.changeApplier = applier_;
        collaborators.publisher = publisher_;
        orchestrator_ = std::make_unique<PipelineOrchestrator>(*store_, collaborators, config);
        return *orchestrator_;
    }

    Job run(const RepoSpec& spec, OrchestratorConfig config = {}) {
        auto& orchestrator = orchestrator_ ? *orchestrator_ : start(config);
        auto id = orchestrator.submit(spec);
        EXPECT_TRUE(id);
        auto job = orchestrator.waitForJob(id.value(), 10s);
        EXPECT_TRUE(job) << (job ? "" : job.error().message);
        return job.value();
    }

    static RepoSpec spec(const std::string& repoId = "repo") {
        RepoSpec s;
        s.url = "https://example.invalid/org/" + repoId + ".git";
        s.repoId = repoId;
        return s;
    }

    std::filesystem::path dir_;
    std::unique_ptr<graph::GraphStore> store_;
    std::shared_ptr<FakeAcquirer> acquirer_;
    std::shared_ptr<FakeIndexer> indexer_;
    std::shared_ptr<FakeParser> parser_;
    std::vector<std::shared_ptr<GraphAnalyzer>> analyzers_;
    std::shared_ptr<ChangeApplier> applier_;
    std::shared_ptr<PullRequestPublisher> publisher_;
    std::unique_ptr<PipelineOrchestrator> orchestrator_;
};

TEST_F(OrchestratorTest, IndexesRepositoryAndLinksCrossFileCalls) {
    analyzers_.push_back(std::make_shared<CountingAnalyzer>());
    auto job = run(spec());

    ASSERT_EQ(job.status, JobStatus::Completed) << job.error.value_or("");
    EXPECT_DOUBLE_EQ(job.progress, 1.0);
    EXPECT_EQ(job.result["files_indexed"], 2);
    EXPECT_EQ(job.result["files_extracted"], 2);
    EXPECT_TRUE(job.result["files_failed"].empty());
    EXPECT_EQ(job.result["symbols"], 3);
    EXPECT_EQ(job.result["calls_resolved"], 1);
    EXPECT_EQ(job.result["summary"]["files_per_language"]["python"], 2);
    EXPECT_EQ(job.result["summary"]["symbols_per_kind"]["method"], 1);
    EXPECT_EQ(job.result["analyses"]["counts"]["symbols"], 3);
    EXPECT_EQ(job.result["changes_applied"], 0);
    EXPECT_TRUE(job.result["pull_request"].is_null());

    auto calls = store_->callGraph("repo");
    ASSERT_TRUE(calls);
    EXPECT_EQ(calls.value().at("baz"), std::vector<std::string>{"bar"});
    EXPECT_EQ(acquirer_->released.load(), 1);
}

TEST_F(OrchestratorTest, ReindexingIsIdempotent) {
    run(spec());
    auto first = store_->stats("repo").value();
    auto job = run(spec());
    ASSERT_EQ(job.status, JobStatus::Completed);
    auto second = store_->stats("repo").value();
    EXPECT_EQ(first.symbols, second.symbols);
    EXPECT_EQ(first.edges, second.edges);
    EXPECT_EQ(first.relationships, second.relationships);
}

TEST_F(OrchestratorTest, ParallelExtractionMatchesSequential) {
    OrchestratorConfig config;
    config.extractionThreads = 3;
    auto job = run(spec(), config);
    ASSERT_EQ(job.status, JobStatus::Completed);
    EXPECT_EQ(job.result["files_extracted"], 2);
    EXPECT_EQ(job.result["calls_resolved"], 1);
}

TEST_F(OrchestratorTest, AcquisitionFailureFailsJob) {
    acquirer_->failWith = "clone refused";
    auto job = run(spec());
    EXPECT_EQ(job.status, JobStatus::Failed);
    ASSERT_TRUE(job.error.has_value());
    EXPECT_EQ(job.error->rfind("Repository acquisition failed: ", 0), 0u);
    EXPECT_NE(job.error->find("clone refused"), std::string::npos);
    // Nothing was acquired, so nothing to release
    EXPECT_EQ(acquirer_->released.load(), 0);
}

TEST_F(OrchestratorTest, PerFileFailuresDoNotFailTheJob) {
    indexer_->files["broken.py"] = "def (:\n";
    indexer_->files["main.go"] = "package main\n";
    auto job = run(spec());

    ASSERT_EQ(job.status, JobStatus::Completed);
    EXPECT_EQ(job.result["files_indexed"], 4);
    EXPECT_EQ(job.result["files_extracted"], 2);
    ASSERT_EQ(job.result["files_failed"].size(), 1u);
    EXPECT_EQ(job.result["files_failed"][0]["path"], "broken.py");
    EXPECT_EQ(job.result["files_failed"][0]["error"], "parse: syntax error");
    EXPECT_EQ(job.result["summary"]["files_per_language"]["go"], 1);
}

TEST_F(OrchestratorTest, ThrowingAnalyzerFailsJobAndReleases) {
    analyzers_.push_back(std::make_shared<ThrowingAnalyzer>());
    auto job = run(spec());
    EXPECT_EQ(job.status, JobStatus::Failed);
    EXPECT_EQ(job.error, std::optional<std::string>("analyzer exploded"));
    EXPECT_EQ(acquirer_->released.load(), 1);
}

TEST_F(OrchestratorTest, AnalyzerErrorNamesTheAnalysis) {
    analyzers_.push_back(std::make_shared<CountingAnalyzer>());
    analyzers_.push_back(std::make_shared<FailingAnalyzer>());
    auto job = run(spec());
    EXPECT_EQ(job.status, JobStatus::Failed);
    EXPECT_EQ(job.error,
              std::optional<std::string>("Analysis 'strict' failed: nothing to analyze"));
    // Graph writes before the failure stay
    EXPECT_EQ(store_->stats("repo").value().symbols, 3u);
}

TEST_F(OrchestratorTest, AppliesChangesAndPublishes) {
    analyzers_.push_back(std::make_shared<CountingAnalyzer>());
    auto applier = std::make_shared<RecordingApplier>();
    applier_ = applier;
    publisher_ = std::make_shared<FakePublisher>();

    auto s = spec();
    s.applyChanges = true;
    s.createPullRequest = true;
    auto job = run(s);

    ASSERT_EQ(job.status, JobStatus::Completed);
    EXPECT_EQ(job.result["changes_applied"], 2);
    EXPECT_EQ(job.result["pull_request"], "https://review.example/repo/1");
    EXPECT_EQ(applier->seen["counts"]["symbols"], 3);
}

TEST_F(OrchestratorTest, CancelStopsAtNextCheckpoint) {
    std::promise<void> open;
    acquirer_->gate = open.get_future().share();
    auto& orchestrator = start();

    auto id = orchestrator.submit(spec());
    ASSERT_TRUE(id);
    while (acquirer_->acquired.load() == 0)
        std::this_thread::sleep_for(1ms);
    ASSERT_TRUE(orchestrator.cancel(id.value()));
    open.set_value();

    auto job = orchestrator.waitForJob(id.value(), 10s);
    ASSERT_TRUE(job);
    EXPECT_EQ(job.value().status, JobStatus::Cancelled);
    EXPECT_EQ(job.value().result["files_indexed"], 0);
    EXPECT_EQ(acquirer_->released.load(), 1);
    EXPECT_EQ(store_->stats("repo").value().symbols, 0u);

    // Terminal jobs cannot be cancelled again
    auto again = orchestrator.cancel(id.value());
    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().code, ErrorCode::InvalidState);
}

TEST_F(OrchestratorTest, ConcurrentJobsStayIsolated) {
    OrchestratorConfig config;
    config.workerThreads = 3;
    auto& orchestrator = start(config);

    std::vector<std::string> ids;
    for (const char* repo : {"one", "two", "three"}) {
        auto id = orchestrator.submit(spec(repo));
        ASSERT_TRUE(id);
        ids.push_back(id.value());
    }
    for (const auto& id : ids) {
        auto job = orchestrator.waitForJob(id, 10s);
        ASSERT_TRUE(job);
        EXPECT_EQ(job.value().status, JobStatus::Completed);
    }
    for (const char* repo : {"one", "two", "three"})
        EXPECT_EQ(store_->stats(repo).value().symbols, 3u);
    EXPECT_EQ(orchestrator.listJobs().size(), 3u);
    EXPECT_EQ(acquirer_->released.load(), 3);
}

TEST_F(OrchestratorTest, SubmitValidatesAndLooksUpJobs) {
    auto& orchestrator = start();
    auto empty = orchestrator.submit(RepoSpec{});
    ASSERT_FALSE(empty);
    EXPECT_EQ(empty.error().code, ErrorCode::InvalidArgument);

    auto missing = orchestrator.getJobStatus("unknown");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);
    EXPECT_EQ(orchestrator.cancel("unknown").error().code, ErrorCode::NotFound);

    // Derived repo id when none is given
    RepoSpec s;
    s.url = "https://example.invalid/org/widgets.git";
    auto id = orchestrator.submit(s);
    ASSERT_TRUE(id);
    auto job = orchestrator.waitForJob(id.value(), 10s);
    ASSERT_TRUE(job);
    EXPECT_EQ(job.value().repoId.rfind("widgets-", 0), 0u);
    EXPECT_EQ(job.value().metadata["repository_url"], s.url);
}

TEST_F(OrchestratorTest, DisconnectedStoreIsFatal) {
    store_->close();
    auto job = run(spec());
    EXPECT_EQ(job.status, JobStatus::Failed);
    ASSERT_TRUE(job.error.has_value());
    EXPECT_NE(job.error->find("Graph store failure while storing a.py"), std::string::npos);
    EXPECT_EQ(acquirer_->released.load(), 1);
}

TEST_F(OrchestratorTest, SubmitAfterShutdownIsRejected) {
    auto& orchestrator = start();
    orchestrator.shutdown();
    auto id = orchestrator.submit(spec());
    ASSERT_FALSE(id);
    EXPECT_EQ(id.error().code, ErrorCode::InvalidState);
}
