#include <codegraph/pipeline/repository_acquirer.h>

#include <spdlog/spdlog.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <vector>

#include <codegraph/core/ids.h>

namespace codegraph::pipeline {

namespace fs = std::filesystem;

bool isRemoteUrl(std::string_view url) noexcept {
    return url.starts_with("https://") || url.starts_with("http://") ||
           url.starts_with("ssh://") || url.starts_with("git://") || url.starts_with("git@");
}

bool isSafeRevision(std::string_view revision) noexcept {
    if (revision.empty() || revision.front() == '-')
        return false;
    return std::none_of(revision.begin(), revision.end(), [](unsigned char c) {
        return c <= ' ' || c == 0x7f;
    });
}

std::string deriveRepoId(std::string_view url) {
    std::string_view trimmed = url;
    while (!trimmed.empty() && (trimmed.back() == '/' || trimmed.back() == '\\'))
        trimmed.remove_suffix(1);
    if (trimmed.ends_with(".git"))
        trimmed.remove_suffix(4);

    auto cut = trimmed.find_last_of("/:\\");
    std::string name(cut == std::string_view::npos ? trimmed : trimmed.substr(cut + 1));
    if (name.empty())
        name = "repo";

    auto hashed = core::stableId("repo", {url});
    // "repo:" + 16 hex digits; keep the first 8 for readability
    return name + "-" + hashed.substr(5, 8);
}

namespace {

// Run argv without a shell and wait for it. Returns the exit status.
Result<int> runCommand(const std::vector<std::string>& args) {
    if (args.empty())
        return Error{ErrorCode::InvalidArgument, "Empty command"};

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args)
        argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        return Error{ErrorCode::InternalError,
                     std::string("fork() failed: ") + std::strerror(errno)};
    }
    if (pid == 0) {
        execvp(argv[0], argv.data());
        _exit(127);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return Error{ErrorCode::InternalError,
                         std::string("waitpid() failed: ") + std::strerror(errno)};
        }
    }
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    return -1;
}

} // namespace

Result<AcquiredRepository> LocalRepositoryAcquirer::acquire(const RepoSpec& spec) {
    std::string path = spec.url;
    if (path.starts_with("file://"))
        path = path.substr(7);
    if (path.empty())
        return Error{ErrorCode::InvalidArgument, "Repository path is empty"};

    std::error_code ec;
    fs::path resolved = fs::weakly_canonical(fs::path(path), ec);
    if (ec)
        resolved = fs::absolute(fs::path(path));
    if (!fs::is_directory(resolved, ec)) {
        return Error{ErrorCode::FileNotFound, "Repository directory not found: " + path};
    }

    AcquiredRepository repo;
    repo.localPath = resolved;
    repo.metadata = {{"source", "local"}, {"path", resolved.string()}};
    if (spec.branch)
        repo.metadata["branch"] = *spec.branch;
    if (spec.commit)
        repo.metadata["commit"] = *spec.commit;
    spdlog::debug("Using local repository {}", resolved.string());
    return repo;
}

void LocalRepositoryAcquirer::release(const AcquiredRepository&) {}

GitRepositoryAcquirer::GitRepositoryAcquirer(fs::path workRoot, std::string gitExecutable)
    : workRoot_(std::move(workRoot)), git_(std::move(gitExecutable)) {
    if (workRoot_.empty()) {
        std::error_code ec;
        workRoot_ = fs::temp_directory_path(ec);
        if (ec)
            workRoot_ = "/tmp";
        workRoot_ /= "codegraph-repos";
    }
}

Result<AcquiredRepository> GitRepositoryAcquirer::acquire(const RepoSpec& spec) {
    if (!isRemoteUrl(spec.url))
        return Error{ErrorCode::InvalidArgument, "Not a git remote: " + spec.url};
    if (spec.branch && !isSafeRevision(*spec.branch))
        return Error{ErrorCode::InvalidArgument, "Invalid branch name: " + *spec.branch};
    if (spec.commit && !isSafeRevision(*spec.commit))
        return Error{ErrorCode::InvalidArgument, "Invalid commit: " + *spec.commit};

    std::error_code ec;
    fs::create_directories(workRoot_, ec);
    if (ec) {
        return Error{ErrorCode::PermissionDenied,
                     "Cannot create clone directory " + workRoot_.string() + ": " + ec.message()};
    }
    const fs::path target = workRoot_ / (deriveRepoId(spec.url) + "-" + core::generateUUID());

    std::vector<std::string> clone{git_, "clone", "--quiet"};
    if (!spec.commit)
        clone.insert(clone.end(), {"--depth", "1"});
    if (spec.branch)
        clone.insert(clone.end(), {"--branch", *spec.branch});
    clone.push_back(spec.url);
    clone.push_back(target.string());

    spdlog::info("Cloning {} into {}", spec.url, target.string());
    auto status = runCommand(clone);
    if (!status || status.value() != 0) {
        fs::remove_all(target, ec);
        return Error{ErrorCode::ServiceUnavailable,
                     status ? fmt::format("git clone of {} exited with status {}", spec.url,
                                          status.value())
                            : status.error().message};
    }

    if (spec.commit) {
        auto checkout =
            runCommand({git_, "-C", target.string(), "checkout", "--quiet", *spec.commit, "--"});
        if (!checkout || checkout.value() != 0) {
            fs::remove_all(target, ec);
            return Error{ErrorCode::NotFound, "Cannot check out commit " + *spec.commit};
        }
    }

    AcquiredRepository repo;
    repo.localPath = target;
    repo.temporary = true;
    repo.metadata = {{"source", "git"}, {"url", spec.url}, {"path", target.string()}};
    if (spec.branch)
        repo.metadata["branch"] = *spec.branch;
    if (spec.commit)
        repo.metadata["commit"] = *spec.commit;
    return repo;
}

void GitRepositoryAcquirer::release(const AcquiredRepository& repo) {
    if (!repo.temporary || repo.localPath.empty())
        return;
    std::error_code ec;
    if (!fs::exists(repo.localPath, ec))
        return;
    auto removed = fs::remove_all(repo.localPath, ec);
    if (ec) {
        spdlog::warn("Failed to remove clone {}: {}", repo.localPath.string(), ec.message());
        return;
    }
    spdlog::debug("Removed clone {} ({} entries)", repo.localPath.string(), removed);
}

DefaultRepositoryAcquirer::DefaultRepositoryAcquirer(fs::path workRoot)
    : git_(std::move(workRoot)) {}

Result<AcquiredRepository> DefaultRepositoryAcquirer::acquire(const RepoSpec& spec) {
    if (isRemoteUrl(spec.url))
        return git_.acquire(spec);
    return local_.acquire(spec);
}

void DefaultRepositoryAcquirer::release(const AcquiredRepository& repo) {
    if (repo.temporary)
        git_.release(repo);
    else
        local_.release(repo);
}

} // namespace codegraph::pipeline
