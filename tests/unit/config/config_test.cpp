#include <gtest/gtest.h>
#include <codegraph/config/config.h>

#include <cstdlib>
#include <fstream>
#include <optional>

#include "common/temp_dir.h"

using namespace codegraph::config;

namespace {

// Sets an environment variable for the lifetime of the guard.
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        if (const char* old = std::getenv(name))
            previous_ = old;
        if (value)
            ::setenv(name, value, 1);
        else
            ::unsetenv(name);
    }
    ~ScopedEnv() {
        if (previous_)
            ::setenv(name_, previous_->c_str(), 1);
        else
            ::unsetenv(name_);
    }

    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
    const char* name_;
    std::optional<std::string> previous_;
};

} // namespace

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = codegraph::test::makeTempDir("config");
        configPath_ = dir_ / "config.toml";
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    void writeConfig(const std::string& content) {
        std::ofstream out(configPath_);
        out << content;
    }

    std::filesystem::path dir_;
    std::filesystem::path configPath_;
    // Keep the developer's environment out of the tests
    ScopedEnv dataDir_{"CODEGRAPH_DATA_DIR", nullptr};
    ScopedEnv dbPath_{"CODEGRAPH_DB_PATH", nullptr};
    ScopedEnv logLevel_{"CODEGRAPH_LOG_LEVEL", nullptr};
    ScopedEnv workers_{"CODEGRAPH_WORKER_THREADS", nullptr};
};

TEST(ConfigHelpersTest, TrimAndUnquote) {
    std::string s = "  value \t";
    trim(s);
    EXPECT_EQ(s, "value");
    EXPECT_EQ(unquote("\"quoted\""), "quoted");
    EXPECT_EQ(unquote(" 'single' "), "single");
    EXPECT_EQ(unquote("\"unbalanced"), "\"unbalanced");
}

TEST(ConfigHelpersTest, ParseStringList) {
    EXPECT_EQ(parse_string_list(R"(["*.min.js", "dist/**"])"),
              (std::vector<std::string>{"*.min.js", "dist/**"}));
    EXPECT_EQ(parse_string_list("a, b,,c"), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_TRUE(parse_string_list("[]").empty());
}

TEST(ConfigHelpersTest, ExpandTilde) {
    ScopedEnv home{"HOME", "/home/tester"};
    EXPECT_EQ(expand_tilde("~/graphs/g.db"), std::filesystem::path("/home/tester/graphs/g.db"));
    EXPECT_EQ(expand_tilde("~"), std::filesystem::path("/home/tester"));
    EXPECT_EQ(expand_tilde("/abs/path"), std::filesystem::path("/abs/path"));
}

TEST(ConfigHelpersTest, ConfigPathResolution) {
    ScopedEnv explicitPath{"CODEGRAPH_CONFIG", nullptr};
    ScopedEnv xdg{"XDG_CONFIG_HOME", "/xdg"};
    EXPECT_EQ(get_config_path(), std::filesystem::path("/xdg/codegraph/config.toml"));
    EXPECT_EQ(get_config_path("/etc/cg.toml"), std::filesystem::path("/etc/cg.toml"));

    ScopedEnv envPath{"CODEGRAPH_CONFIG", "/tmp/cg.toml"};
    EXPECT_EQ(get_config_path(), std::filesystem::path("/tmp/cg.toml"));
}

TEST_F(ConfigTest, ParseConfigValueBySectionAndDottedKey) {
    writeConfig(R"(# codegraph settings
core.data_dir = "/srv/codegraph"

[graph]
db_path = "/srv/graph.db"   # inline comment
max_connections = 4

[pipeline]
worker_threads = 3
db_path = "wrong section"
)");
    EXPECT_EQ(parse_config_value(configPath_, "core", "data_dir"), "/srv/codegraph");
    EXPECT_EQ(parse_config_value(configPath_, "graph", "db_path"), "/srv/graph.db");
    EXPECT_EQ(parse_config_value(configPath_, "graph", "max_connections"), "4");
    EXPECT_EQ(parse_config_value(configPath_, "pipeline", "worker_threads"), "3");
    EXPECT_EQ(parse_config_value(configPath_, "graph", "missing"), "");
    EXPECT_EQ(parse_config_value(dir_ / "absent.toml", "graph", "db_path"), "");
}

TEST_F(ConfigTest, ReadConfigFileFlattensSections) {
    writeConfig("graph.db_path = \"/top.db\"\n[graph]\ndb_path = \"/later.db\"\n"
                "[ pipeline ]\nexclude = [\"a\", \"b\"]\nnot a pair\n= orphan\n");
    auto values = read_config_file(configPath_);
    ASSERT_EQ(values.size(), 2u);
    EXPECT_EQ(values.at("graph.db_path"), "/top.db"); // first occurrence wins
    EXPECT_EQ(values.at("pipeline.exclude"), "[\"a\", \"b\"]");
    EXPECT_TRUE(read_config_file(dir_ / "absent.toml").empty());
}

TEST_F(ConfigTest, QuotedValueKeepsHash) {
    writeConfig("[logging]\nlevel = \"debug#1\" # trailing\n");
    EXPECT_EQ(parse_config_value(configPath_, "logging", "level"), "debug#1");
}

TEST_F(ConfigTest, LoadsFileValues) {
    writeConfig(R"([core]
data_dir = "/srv/codegraph"

[graph]
max_connections = 16
busy_timeout_ms = 2500
enable_wal = false

[pipeline]
worker_threads = 4
extraction_threads = 3
max_file_size_bytes = 4096
exclude = ["*.min.js", "dist/**"]

[logging]
level = "debug"
)");
    auto cfg = loadConfig(configPath_);
    EXPECT_EQ(cfg.dataDir, std::filesystem::path("/srv/codegraph"));
    EXPECT_EQ(cfg.graph.dbPath, std::filesystem::path("/srv/codegraph/graph.db"));
    EXPECT_EQ(cfg.graph.maxConnections, 16u);
    EXPECT_EQ(cfg.graph.busyTimeout, std::chrono::milliseconds(2500));
    EXPECT_FALSE(cfg.graph.enableWAL);
    EXPECT_EQ(cfg.pipeline.workerThreads, 4u);
    EXPECT_EQ(cfg.pipeline.extractionThreads, 3u);
    EXPECT_EQ(cfg.pipeline.maxFileSizeBytes, 4096u);
    EXPECT_EQ(cfg.pipeline.excludePatterns, (std::vector<std::string>{"*.min.js", "dist/**"}));
    EXPECT_EQ(cfg.logLevel, "debug");
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    writeConfig("[graph]\ndb_path = \"/from/file.db\"\n[pipeline]\nworker_threads = 2\n");
    ScopedEnv db{"CODEGRAPH_DB_PATH", "/from/env.db"};
    ScopedEnv level{"CODEGRAPH_LOG_LEVEL", "warn"};
    ScopedEnv workers{"CODEGRAPH_WORKER_THREADS", "6"};

    auto cfg = loadConfig(configPath_);
    EXPECT_EQ(cfg.graph.dbPath, std::filesystem::path("/from/env.db"));
    EXPECT_EQ(cfg.logLevel, "warn");
    EXPECT_EQ(cfg.pipeline.workerThreads, 6u);
}

TEST_F(ConfigTest, InvalidNumbersKeepDefaults) {
    writeConfig("[graph]\nmax_connections = lots\n[pipeline]\nworker_threads = 0\n"
                "extraction_threads = -2\n");
    ScopedEnv dataDir{"CODEGRAPH_DATA_DIR", dir_.c_str()};

    auto cfg = loadConfig(configPath_);
    EXPECT_EQ(cfg.graph.maxConnections, 8u);
    EXPECT_EQ(cfg.pipeline.workerThreads, 1u); // zero clamps to one
    EXPECT_EQ(cfg.pipeline.extractionThreads, 1u);
    EXPECT_EQ(cfg.dataDir, dir_);
    EXPECT_EQ(cfg.graph.dbPath, dir_ / "graph.db");
}

TEST_F(ConfigTest, MissingFileGivesDefaults) {
    ScopedEnv dataDir{"CODEGRAPH_DATA_DIR", dir_.c_str()};
    auto cfg = loadConfig(dir_ / "does-not-exist.toml");
    EXPECT_EQ(cfg.logLevel, "info");
    EXPECT_EQ(cfg.pipeline.workerThreads, 2u);
    EXPECT_TRUE(cfg.graph.enableWAL);
    EXPECT_TRUE(cfg.pipeline.excludePatterns.empty());
}
