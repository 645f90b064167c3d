#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <codegraph/pipeline/collaborators.h>

namespace codegraph::pipeline {

/// Language for a file extension (".py", ".tsx", ...); case-insensitive.
std::optional<model::Language> languageForPath(const std::filesystem::path& path);

/// Glob match against a repository-relative path. '**' crosses '/'; a
/// pattern without glob characters matches as a substring.
bool matchesExcludePattern(std::string_view pattern, std::string_view relativePath);

struct FilesystemIndexerConfig {
    std::size_t maxFileSizeBytes = 10 * 1024 * 1024;
    /// Applied in addition to the per-request patterns.
    std::vector<std::string> excludePatterns;
};

/**
 * @brief Walks a checkout and loads every source file into a ParseUnit.
 *
 * Units come out sorted by path. Binary files (a NUL byte in the first
 * 1024 bytes), oversized files, and vendored/VCS directories are skipped.
 */
class FilesystemIndexer final : public SourceIndexer {
public:
    explicit FilesystemIndexer(FilesystemIndexerConfig config = {});

    Result<std::vector<model::ParseUnit>> index(const AcquiredRepository& repo,
                                                const RepoSpec& spec,
                                                const std::string& repoId) override;

    [[nodiscard]] static bool isSkippedDirectory(std::string_view name) noexcept;

private:
    FilesystemIndexerConfig config_;
};

} // namespace codegraph::pipeline
