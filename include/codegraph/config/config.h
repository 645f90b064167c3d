#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace codegraph::config {

/// Strip leading and trailing whitespace in place.
void trim(std::string& s);

/// Trim, then drop one pair of matching single or double quotes.
std::string unquote(std::string val);

/// "~" and "~/x" resolve against $HOME; anything else is returned as is.
std::filesystem::path expand_tilde(const std::string& path);

/// Flattened config file: "section.key" -> raw value, first occurrence wins.
/// Keys written dotted at the top level ("graph.db_path = ...") land in the
/// same slot as "[graph] db_path".
using ConfigValues = std::map<std::string, std::string, std::less<>>;

/// Empty map when the file cannot be read.
ConfigValues read_config_file(const std::filesystem::path& config_path);

/// Single lookup; "" when the key or the file is missing.
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

/// "a, b" or ["a", "b"]; empty items are dropped.
std::vector<std::string> parse_string_list(const std::string& raw);

/// $CODEGRAPH_CONFIG, else $XDG_CONFIG_HOME/codegraph/config.toml or
/// ~/.config/codegraph/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

/// $XDG_DATA_HOME/codegraph or ~/.local/share/codegraph
std::filesystem::path get_data_dir();

struct GraphSettings {
    std::filesystem::path dbPath;
    std::size_t maxConnections = 8;
    std::chrono::milliseconds busyTimeout{5000};
    bool enableWAL = true;
};

struct PipelineSettings {
    std::size_t workerThreads = 2;
    std::size_t extractionThreads = 1;
    std::size_t maxFileSizeBytes = 10 * 1024 * 1024;
    std::vector<std::string> excludePatterns;
};

struct CodegraphConfig {
    std::filesystem::path dataDir;
    GraphSettings graph;
    PipelineSettings pipeline;
    std::string logLevel = "info";
};

/**
 * @brief Resolve configuration: defaults, then the config file, then
 * environment overrides (CODEGRAPH_DATA_DIR, CODEGRAPH_DB_PATH,
 * CODEGRAPH_LOG_LEVEL, CODEGRAPH_WORKER_THREADS).
 *
 * Unparseable numeric values keep their default and are logged.
 */
CodegraphConfig loadConfig(const std::filesystem::path& configPath = {});

} // namespace codegraph::config
