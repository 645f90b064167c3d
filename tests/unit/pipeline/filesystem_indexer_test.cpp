#include <gtest/gtest.h>
#include <codegraph/pipeline/filesystem_indexer.h>
#include <codegraph/pipeline/repository_acquirer.h>

#include <fstream>

#include "common/temp_dir.h"

using namespace codegraph;
using namespace codegraph::pipeline;
using model::Language;

namespace fs = std::filesystem;

class FilesystemIndexerTest : public ::testing::Test {
protected:
    void SetUp() override { root_ = test::makeTempDir("indexer"); }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    void write(const std::string& rel, const std::string& content) {
        auto path = root_ / rel;
        fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out << content;
    }

    std::vector<std::string> indexedPaths(const RepoSpec& spec = {},
                                          FilesystemIndexerConfig config = {}) {
        FilesystemIndexer indexer(std::move(config));
        auto units = indexer.index(AcquiredRepository{root_, false, {}}, spec, "repo");
        EXPECT_TRUE(units) << (units ? "" : units.error().message);
        std::vector<std::string> out;
        if (units) {
            for (const auto& u : units.value())
                out.push_back(u.path);
        }
        return out;
    }

    fs::path root_;
};

TEST(LanguageForPathTest, MapsKnownExtensions) {
    EXPECT_EQ(languageForPath("a/b.py"), Language::Python);
    EXPECT_EQ(languageForPath("App.TSX"), Language::TypeScript);
    EXPECT_EQ(languageForPath("index.mjs"), Language::JavaScript);
    EXPECT_EQ(languageForPath("lib.rs"), Language::Rust);
    EXPECT_EQ(languageForPath("x.hpp"), Language::Cpp);
    EXPECT_FALSE(languageForPath("README.md").has_value());
    EXPECT_FALSE(languageForPath("Makefile").has_value());
}

TEST(ExcludePatternTest, GlobAndSubstringForms) {
    EXPECT_TRUE(matchesExcludePattern("*.min.js", "web/static/app.min.js"));
    EXPECT_TRUE(matchesExcludePattern("dist/**", "dist/js/app.js"));
    EXPECT_TRUE(matchesExcludePattern("**/migrations/*.py", "app/migrations/0001.py"));
    EXPECT_TRUE(matchesExcludePattern("generated", "src/generated/api.py"));
    EXPECT_FALSE(matchesExcludePattern("src/*.py", "src/pkg/mod.py"));
    EXPECT_TRUE(matchesExcludePattern("src/*.py", "src/mod.py"));
    EXPECT_FALSE(matchesExcludePattern("", "anything.py"));
    EXPECT_FALSE(matchesExcludePattern("*.ts", "main.py"));
}

TEST_F(FilesystemIndexerTest, LoadsSourceFilesSortedWithStableIds) {
    write("pkg/b.py", "def b():\n    pass\n");
    write("pkg/a.py", "def a():\n    pass\n");
    write("web/app.ts", "export function main() {}\n");
    write("README.md", "# docs\n");

    FilesystemIndexer indexer;
    auto units = indexer.index(AcquiredRepository{root_, false, {}}, RepoSpec{}, "repo");
    ASSERT_TRUE(units);
    ASSERT_EQ(units.value().size(), 3u);
    EXPECT_EQ(units.value()[0].path, "pkg/a.py");
    EXPECT_EQ(units.value()[1].path, "pkg/b.py");
    EXPECT_EQ(units.value()[2].path, "web/app.ts");
    EXPECT_EQ(units.value()[2].language, Language::TypeScript);
    EXPECT_EQ(units.value()[0].content, "def a():\n    pass\n");
    EXPECT_EQ(units.value()[0].size(), units.value()[0].content.size());
    EXPECT_EQ(units.value()[0].repoId, "repo");
    EXPECT_FALSE(units.value()[0].tree.has_value());

    auto again = indexer.index(AcquiredRepository{root_, false, {}}, RepoSpec{}, "repo");
    ASSERT_TRUE(again);
    EXPECT_EQ(again.value()[0].id, units.value()[0].id);
    EXPECT_NE(units.value()[0].id, units.value()[1].id);
}

TEST_F(FilesystemIndexerTest, SkipsVendoredBinaryAndOversizedFiles) {
    write("src/main.py", "print('hi')\n");
    write("node_modules/lib/index.js", "module.exports = 1;\n");
    write(".git/hooks/pre-commit.py", "raise SystemExit\n");
    write("src/blob.py", std::string("abc\0def", 7));
    write("src/huge.py", std::string(2048, 'x'));

    FilesystemIndexerConfig config;
    config.maxFileSizeBytes = 1024;
    EXPECT_EQ(indexedPaths({}, config), std::vector<std::string>{"src/main.py"});
}

TEST_F(FilesystemIndexerTest, AppliesLanguageIncludeAndExcludeFilters) {
    write("api/handlers.py", "def h(): pass\n");
    write("api/handlers_test.py", "def test_h(): pass\n");
    write("api/client.ts", "export class C {}\n");
    write("scripts/tool.py", "def t(): pass\n");
    write("api/gen/models.py", "class M: pass\n");

    RepoSpec spec;
    spec.languages = {Language::Python};
    spec.includePaths = {"./api/"};
    spec.excludePatterns = {"*_test.py"};

    FilesystemIndexerConfig config;
    config.excludePatterns = {"api/gen/**"};
    EXPECT_EQ(indexedPaths(spec, config), std::vector<std::string>{"api/handlers.py"});
}

TEST_F(FilesystemIndexerTest, MissingRootIsFileNotFound) {
    FilesystemIndexer indexer;
    auto units =
        indexer.index(AcquiredRepository{root_ / "missing", false, {}}, RepoSpec{}, "repo");
    ASSERT_FALSE(units);
    EXPECT_EQ(units.error().code, ErrorCode::FileNotFound);
}

TEST(RepositoryAcquirerTest, RemoteUrlDetection) {
    EXPECT_TRUE(isRemoteUrl("https://github.com/org/repo.git"));
    EXPECT_TRUE(isRemoteUrl("git@github.com:org/repo.git"));
    EXPECT_TRUE(isRemoteUrl("ssh://git@host/repo"));
    EXPECT_FALSE(isRemoteUrl("/home/me/repo"));
    EXPECT_FALSE(isRemoteUrl("file:///home/me/repo"));
}

TEST(RepositoryAcquirerTest, DerivedRepoIdIsStableAndNamed) {
    auto a = deriveRepoId("https://github.com/org/service.git");
    EXPECT_EQ(a, deriveRepoId("https://github.com/org/service.git"));
    EXPECT_EQ(a.rfind("service-", 0), 0u);
    EXPECT_EQ(a.size(), std::string("service-").size() + 8);
    EXPECT_NE(a, deriveRepoId("https://github.com/other/service.git"));
    EXPECT_EQ(deriveRepoId("git@host:team/tool").rfind("tool-", 0), 0u);
    EXPECT_EQ(deriveRepoId("/srv/code/app/").rfind("app-", 0), 0u);
}

TEST(RepositoryAcquirerTest, LocalAcquirerResolvesDirectories) {
    auto dir = test::makeTempDir("acquire");
    LocalRepositoryAcquirer acquirer;

    RepoSpec spec;
    spec.url = "file://" + dir.string();
    auto repo = acquirer.acquire(spec);
    ASSERT_TRUE(repo) << repo.error().message;
    EXPECT_FALSE(repo.value().temporary);
    EXPECT_TRUE(fs::equivalent(repo.value().localPath, dir));
    EXPECT_EQ(repo.value().metadata["source"], "local");

    acquirer.release(repo.value());
    EXPECT_TRUE(fs::exists(dir)); // local checkouts are never removed

    spec.url = (dir / "nope").string();
    auto missing = acquirer.acquire(spec);
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::FileNotFound);

    fs::remove_all(dir);
}

TEST(RepositoryAcquirerTest, GitFailureIsServiceUnavailable) {
    auto work = test::makeTempDir("clones");
    GitRepositoryAcquirer acquirer(work, "/nonexistent/bin/git");

    RepoSpec spec;
    spec.url = "https://example.invalid/org/repo.git";
    auto repo = acquirer.acquire(spec);
    ASSERT_FALSE(repo);
    EXPECT_EQ(repo.error().code, ErrorCode::ServiceUnavailable);
    // Nothing left behind
    EXPECT_TRUE(fs::is_empty(work));

    spec.url = "/local/path";
    auto notRemote = acquirer.acquire(spec);
    ASSERT_FALSE(notRemote);
    EXPECT_EQ(notRemote.error().code, ErrorCode::InvalidArgument);

    fs::remove_all(work);
}

TEST(RepositoryAcquirerTest, RevisionNames) {
    EXPECT_TRUE(isSafeRevision("main"));
    EXPECT_TRUE(isSafeRevision("feature/x-1.2"));
    EXPECT_TRUE(isSafeRevision("3f2a9c1"));
    EXPECT_TRUE(isSafeRevision("v1.0^{commit}"));
    EXPECT_FALSE(isSafeRevision(""));
    EXPECT_FALSE(isSafeRevision("--upload-pack=touch /tmp/x"));
    EXPECT_FALSE(isSafeRevision("-b"));
    EXPECT_FALSE(isSafeRevision("main branch"));
    EXPECT_FALSE(isSafeRevision("main\n"));
}

TEST(RepositoryAcquirerTest, OptionLikeRevisionsNeverReachGit) {
    auto work = test::makeTempDir("clones");
    // A missing git binary would report ServiceUnavailable if it were run
    GitRepositoryAcquirer acquirer(work, "/nonexistent/bin/git");

    RepoSpec spec;
    spec.url = "https://example.invalid/org/repo.git";
    spec.commit = "--output=/tmp/pwned";
    auto badCommit = acquirer.acquire(spec);
    ASSERT_FALSE(badCommit);
    EXPECT_EQ(badCommit.error().code, ErrorCode::InvalidArgument);

    spec.commit.reset();
    spec.branch = "-c";
    auto badBranch = acquirer.acquire(spec);
    ASSERT_FALSE(badBranch);
    EXPECT_EQ(badBranch.error().code, ErrorCode::InvalidArgument);
    EXPECT_TRUE(fs::is_empty(work));

    fs::remove_all(work);
}

TEST(RepositoryAcquirerTest, GitReleaseRemovesTemporaryCheckout) {
    auto work = test::makeTempDir("clones");
    auto checkout = work / "repo-clone";
    fs::create_directories(checkout / "src");

    GitRepositoryAcquirer acquirer(work);
    AcquiredRepository repo{checkout, true, {}};
    acquirer.release(repo);
    EXPECT_FALSE(fs::exists(checkout));
    acquirer.release(repo); // second release is a no-op

    fs::remove_all(work);
}
