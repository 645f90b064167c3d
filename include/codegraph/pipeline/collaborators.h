#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <codegraph/core/types.h>
#include <codegraph/graph/graph_store.h>
#include <codegraph/model/code_model.h>
#include <codegraph/model/parse_unit.h>

namespace codegraph::pipeline {

/**
 * @brief What to index. The url is a local path, a file:// url, or a git
 * remote (https://, ssh://, git@host:path).
 */
struct RepoSpec {
    std::string url;
    std::optional<std::string> branch;
    std::optional<std::string> commit;
    /// Empty repoId derives one from the url.
    std::string repoId;
    /// Empty means every supported language.
    std::vector<model::Language> languages;
    /// Repository-relative path prefixes to keep; empty keeps everything.
    std::vector<std::string> includePaths;
    /// Glob patterns matched against repository-relative paths.
    std::vector<std::string> excludePatterns;
    bool applyChanges = false;
    bool createPullRequest = false;
};

struct AcquiredRepository {
    std::filesystem::path localPath;
    /// Set when the acquirer created localPath and must remove it.
    bool temporary = false;
    nlohmann::json metadata = nlohmann::json::object();
};

class RepositoryAcquirer {
public:
    virtual ~RepositoryAcquirer() = default;

    virtual Result<AcquiredRepository> acquire(const RepoSpec& spec) = 0;

    /// Idempotent; a second call for the same handle does nothing.
    virtual void release(const AcquiredRepository& repo) = 0;
};

/**
 * @brief Builds the ordered ParseUnit list (content loaded, no tree yet).
 */
class SourceIndexer {
public:
    virtual ~SourceIndexer() = default;

    virtual Result<std::vector<model::ParseUnit>>
    index(const AcquiredRepository& repo, const RepoSpec& spec, const std::string& repoId) = 0;
};

/**
 * @brief Downstream consumer of the graph. Receives only the read-only view.
 */
class GraphAnalyzer {
public:
    virtual ~GraphAnalyzer() = default;

    [[nodiscard]] virtual std::string name() const = 0;

    virtual Result<nlohmann::json> analyze(const graph::GraphReader& graph,
                                           const std::string& repoId) = 0;
};

/**
 * @brief Applies proposed changes (derived from analyses) to the checkout.
 * @return a JSON object with at least {"applied": <count>}
 */
class ChangeApplier {
public:
    virtual ~ChangeApplier() = default;

    virtual Result<nlohmann::json> apply(const AcquiredRepository& repo,
                                         const nlohmann::json& analyses) = 0;
};

class PullRequestPublisher {
public:
    virtual ~PullRequestPublisher() = default;

    /// @return the pull request reference (e.g. its URL)
    virtual Result<std::string> publish(const RepoSpec& spec, const AcquiredRepository& repo,
                                        const nlohmann::json& changes) = 0;
};

} // namespace codegraph::pipeline
