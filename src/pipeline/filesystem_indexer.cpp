#include <codegraph/pipeline/filesystem_indexer.h>

#include <fnmatch.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <iterator>
#include <sstream>

#include <codegraph/core/ids.h>

namespace codegraph::pipeline {

namespace fs = std::filesystem;

namespace {

struct ExtensionMapping {
    std::string_view extension;
    model::Language language;
};

constexpr std::array<ExtensionMapping, 17> kExtensions{{
    {".py", model::Language::Python},
    {".js", model::Language::JavaScript},
    {".jsx", model::Language::JavaScript},
    {".mjs", model::Language::JavaScript},
    {".ts", model::Language::TypeScript},
    {".tsx", model::Language::TypeScript},
    {".java", model::Language::Java},
    {".go", model::Language::Go},
    {".rs", model::Language::Rust},
    {".c", model::Language::C},
    {".h", model::Language::C},
    {".cpp", model::Language::Cpp},
    {".cc", model::Language::Cpp},
    {".cxx", model::Language::Cpp},
    {".c++", model::Language::Cpp},
    {".hpp", model::Language::Cpp},
    {".cs", model::Language::CSharp},
}};

constexpr std::array<std::string_view, 14> kSkippedDirectories{
    ".git", ".hg",        ".svn",  "node_modules", "__pycache__", ".venv",       "venv",
    ".tox", ".mypy_cache", "dist", "build",        "target",      ".idea", "vendor"};

bool hasGlobMeta(std::string_view s) {
    return s.find_first_of("*?[") != std::string_view::npos;
}

// Collapse "**" to "*" and drop FNM_PATHNAME so the wildcard crosses '/'.
bool fnmatchWrap(std::string_view pat, const std::string& path) {
    int flags = 0;
    std::string pattern(pat);
    if (pattern.find("**") == std::string::npos) {
        flags |= FNM_PATHNAME;
    } else {
        std::string collapsed;
        collapsed.reserve(pattern.size());
        for (size_t i = 0; i < pattern.size(); ++i) {
            if (pattern[i] == '*' && i + 1 < pattern.size() && pattern[i + 1] == '*') {
                collapsed.push_back('*');
                ++i;
                // "**/" also matches zero directories
                if (i + 1 < pattern.size() && pattern[i + 1] == '/' && collapsed.size() == 1)
                    ++i;
            } else {
                collapsed.push_back(pattern[i]);
            }
        }
        pattern.swap(collapsed);
    }
    return fnmatch(pattern.c_str(), path.c_str(), flags) == 0;
}

bool looksBinary(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return false;
    std::array<char, 1024> buf{};
    in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    const auto n = static_cast<size_t>(in.gcount());
    return std::find(buf.begin(), buf.begin() + n, '\0') != buf.begin() + n;
}

Result<std::string> readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return Error{ErrorCode::PermissionDenied, "Cannot open " + path.string()};
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad())
        return Error{ErrorCode::InternalError, "Read failed for " + path.string()};
    return ss.str();
}

bool underIncludedPath(const std::string& rel, const std::vector<std::string>& includes) {
    if (includes.empty())
        return true;
    for (auto prefix : includes) {
        while (prefix.starts_with("./"))
            prefix.erase(0, 2);
        while (!prefix.empty() && prefix.back() == '/')
            prefix.pop_back();
        if (prefix.empty() || rel == prefix || rel.starts_with(prefix + "/"))
            return true;
    }
    return false;
}

} // namespace

std::optional<model::Language> languageForPath(const fs::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const auto& m : kExtensions) {
        if (m.extension == ext)
            return m.language;
    }
    return std::nullopt;
}

bool matchesExcludePattern(std::string_view pattern, std::string_view relativePath) {
    if (pattern.empty())
        return false;
    std::string path(relativePath);
    std::replace(path.begin(), path.end(), '\\', '/');
    if (!hasGlobMeta(pattern))
        return path.find(pattern) != std::string::npos;
    if (fnmatchWrap(pattern, path))
        return true;
    // A bare file pattern ("*.min.js") also applies to the basename
    if (pattern.find('/') == std::string_view::npos) {
        auto slash = path.rfind('/');
        if (slash != std::string::npos)
            return fnmatchWrap(pattern, path.substr(slash + 1));
    }
    return false;
}

FilesystemIndexer::FilesystemIndexer(FilesystemIndexerConfig config)
    : config_(std::move(config)) {}

bool FilesystemIndexer::isSkippedDirectory(std::string_view name) noexcept {
    return std::find(kSkippedDirectories.begin(), kSkippedDirectories.end(), name) !=
           kSkippedDirectories.end();
}

Result<std::vector<model::ParseUnit>>
FilesystemIndexer::index(const AcquiredRepository& repo, const RepoSpec& spec,
                         const std::string& repoId) {
    std::error_code ec;
    if (!fs::is_directory(repo.localPath, ec)) {
        return Error{ErrorCode::FileNotFound,
                     "Repository root is not a directory: " + repo.localPath.string()};
    }

    std::vector<std::string> excludes = config_.excludePatterns;
    excludes.insert(excludes.end(), spec.excludePatterns.begin(), spec.excludePatterns.end());

    auto excluded = [&](const std::string& rel) {
        return std::any_of(excludes.begin(), excludes.end(),
                           [&](const std::string& p) { return matchesExcludePattern(p, rel); });
    };

    std::vector<std::pair<std::string, model::Language>> files;
    size_t skippedBinary = 0;
    size_t skippedLarge = 0;

    fs::recursive_directory_iterator it(repo.localPath,
                                        fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return Error{ErrorCode::PermissionDenied,
                     "Cannot walk " + repo.localPath.string() + ": " + ec.message()};
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            spdlog::warn("Directory walk error under {}: {}", repo.localPath.string(),
                         ec.message());
            break;
        }
        const auto& entry = *it;
        const std::string rel = entry.path().lexically_relative(repo.localPath).generic_string();

        if (entry.is_directory(ec)) {
            if (isSkippedDirectory(entry.path().filename().string()) || excluded(rel + "/"))
                it.disable_recursion_pending();
            continue;
        }
        if (!entry.is_regular_file(ec))
            continue;

        auto language = languageForPath(entry.path());
        if (!language)
            continue;
        if (!spec.languages.empty() &&
            std::find(spec.languages.begin(), spec.languages.end(), *language) ==
                spec.languages.end())
            continue;
        if (!underIncludedPath(rel, spec.includePaths) || excluded(rel))
            continue;

        const auto size = entry.file_size(ec);
        if (ec || size > config_.maxFileSizeBytes) {
            ++skippedLarge;
            spdlog::debug("Skipping {} ({} bytes)", rel, size);
            continue;
        }
        if (looksBinary(entry.path())) {
            ++skippedBinary;
            continue;
        }
        files.emplace_back(rel, *language);
    }

    std::sort(files.begin(), files.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<model::ParseUnit> units;
    units.reserve(files.size());
    for (auto& [rel, language] : files) {
        auto content = readFile(repo.localPath / rel);
        if (!content) {
            spdlog::warn("Skipping unreadable file {}: {}", rel, content.error().message);
            continue;
        }
        model::ParseUnit unit;
        unit.id = core::stableId("file", {repoId, rel});
        unit.repoId = repoId;
        unit.path = rel;
        unit.language = language;
        unit.content = std::move(content).value();
        unit.sizeBytes = unit.content.size();
        units.push_back(std::move(unit));
    }

    spdlog::info("Indexed {} source files under {} (skipped {} binary, {} oversized)",
                 units.size(), repo.localPath.string(), skippedBinary, skippedLarge);
    return units;
}

} // namespace codegraph::pipeline
