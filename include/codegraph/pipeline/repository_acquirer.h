#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include <codegraph/pipeline/collaborators.h>

namespace codegraph::pipeline {

[[nodiscard]] bool isRemoteUrl(std::string_view url) noexcept;

/// Branch or commit name that is safe to hand to git: non-empty, no leading
/// '-', and no whitespace or control characters.
[[nodiscard]] bool isSafeRevision(std::string_view revision) noexcept;

/// Deterministic repository id: the url's last path component plus a short hash.
std::string deriveRepoId(std::string_view url);

/**
 * @brief Resolves local directories and file:// urls. Nothing to release.
 */
class LocalRepositoryAcquirer final : public RepositoryAcquirer {
public:
    Result<AcquiredRepository> acquire(const RepoSpec& spec) override;
    void release(const AcquiredRepository& repo) override;
};

/**
 * @brief Shallow-clones a remote with the git executable into a temporary
 * directory that release() removes.
 */
class GitRepositoryAcquirer final : public RepositoryAcquirer {
public:
    explicit GitRepositoryAcquirer(std::filesystem::path workRoot = {},
                                   std::string gitExecutable = "git");

    Result<AcquiredRepository> acquire(const RepoSpec& spec) override;
    void release(const AcquiredRepository& repo) override;

private:
    std::filesystem::path workRoot_;
    std::string git_;
};

/**
 * @brief Routes remote urls to git and everything else to the local acquirer.
 */
class DefaultRepositoryAcquirer final : public RepositoryAcquirer {
public:
    explicit DefaultRepositoryAcquirer(std::filesystem::path workRoot = {});

    Result<AcquiredRepository> acquire(const RepoSpec& spec) override;
    void release(const AcquiredRepository& repo) override;

private:
    LocalRepositoryAcquirer local_;
    GitRepositoryAcquirer git_;
};

} // namespace codegraph::pipeline
