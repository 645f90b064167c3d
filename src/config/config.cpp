#include <codegraph/config/config.h>

#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdlib>
#include <fstream>

namespace codegraph::config {

namespace {

constexpr std::string_view kSpace = " \t\r\n\f\v";

std::string_view stripped(std::string_view s) {
    const auto first = s.find_first_not_of(kSpace);
    if (first == std::string_view::npos)
        return {};
    return s.substr(first, s.find_last_not_of(kSpace) - first + 1);
}

// Drop a trailing "# comment". A quoted value ends at its closing quote.
std::string_view valueText(std::string_view v) {
    if (!v.empty() && (v.front() == '"' || v.front() == '\'')) {
        if (auto close = v.find(v.front(), 1); close != std::string_view::npos)
            return v.substr(0, close + 1);
        return v;
    }
    return stripped(v.substr(0, v.find('#')));
}

} // namespace

void trim(std::string& s) {
    s = std::string(stripped(s));
}

std::string unquote(std::string val) {
    std::string_view v = stripped(val);
    if (v.size() >= 2 && (v.front() == '"' || v.front() == '\'') && v.back() == v.front())
        v = v.substr(1, v.size() - 2);
    return std::string(v);
}

std::filesystem::path expand_tilde(const std::string& path) {
    const char* home = std::getenv("HOME");
    if (!home || path.empty() || path[0] != '~')
        return path;
    if (path.size() <= 2)
        return std::filesystem::path(home);
    return std::filesystem::path(home) / path.substr(2);
}

ConfigValues read_config_file(const std::filesystem::path& config_path) {
    ConfigValues values;
    std::ifstream in(config_path);
    if (!in)
        return values;

    std::string prefix;
    for (std::string raw; std::getline(in, raw);) {
        const std::string_view line = stripped(raw);
        if (line.empty() || line.front() == '#')
            continue;

        if (line.front() == '[') {
            if (auto close = line.find(']'); close != std::string_view::npos) {
                const auto name = stripped(line.substr(1, close - 1));
                prefix = name.empty() ? std::string{} : std::string(name) + ".";
            }
            continue;
        }

        const auto eq = line.find('=');
        if (eq == std::string_view::npos)
            continue;
        const auto key = stripped(line.substr(0, eq));
        if (key.empty())
            continue;
        // A dotted key is already fully qualified.
        std::string fullKey =
            key.find('.') != std::string_view::npos ? std::string(key) : prefix + std::string(key);
        values.emplace(std::move(fullKey), unquote(std::string(valueText(stripped(line.substr(eq + 1))))));
    }
    return values;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    const auto values = read_config_file(config_path);
    const auto it = values.find(section.empty() ? key : section + "." + key);
    return it == values.end() ? std::string{} : it->second;
}

std::vector<std::string> parse_string_list(const std::string& raw) {
    std::string_view s = stripped(raw);
    if (s.size() >= 2 && s.front() == '[' && s.back() == ']')
        s = s.substr(1, s.size() - 2);

    std::vector<std::string> out;
    while (true) {
        const auto comma = s.find(',');
        if (auto item = unquote(std::string(s.substr(0, comma))); !item.empty())
            out.push_back(std::move(item));
        if (comma == std::string_view::npos)
            break;
        s.remove_prefix(comma + 1);
    }
    return out;
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty())
        return override_path;
    if (const char* explicitPath = std::getenv("CODEGRAPH_CONFIG"); explicitPath && *explicitPath)
        return explicitPath;

    std::filesystem::path base;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
        base = xdg;
    else if (const char* home = std::getenv("HOME"))
        base = std::filesystem::path(home) / ".config";
    else
        base = "~/.config";
    return base / "codegraph" / "config.toml";
}

std::filesystem::path get_data_dir() {
    if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg)
        return std::filesystem::path(xdg) / "codegraph";
    if (const char* home = std::getenv("HOME"))
        return std::filesystem::path(home) / ".local" / "share" / "codegraph";
    return std::filesystem::current_path() / "codegraph_data";
}

namespace {

template <typename T> void parseNumber(const std::string& raw, std::string_view name, T& target) {
    if (raw.empty())
        return;
    T value{};
    auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), value);
    if (ec != std::errc{} || ptr != raw.data() + raw.size()) {
        spdlog::warn("Ignoring invalid value '{}' for {}", raw, name);
        return;
    }
    target = value;
}

void parseBool(const std::string& raw, std::string_view name, bool& target) {
    if (raw.empty())
        return;
    if (raw == "true" || raw == "1" || raw == "yes") {
        target = true;
    } else if (raw == "false" || raw == "0" || raw == "no") {
        target = false;
    } else {
        spdlog::warn("Ignoring invalid value '{}' for {}", raw, name);
    }
}

std::string envValue(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? std::string(v) : std::string{};
}

} // namespace

CodegraphConfig loadConfig(const std::filesystem::path& configPath) {
    CodegraphConfig cfg;
    const auto path = configPath.empty() ? get_config_path() : configPath;

    const auto fileValues = read_config_file(path);
    auto value = [&](std::string_view key) -> std::string {
        auto it = fileValues.find(key);
        return it == fileValues.end() ? std::string{} : it->second;
    };

    if (auto v = value("core.data_dir"); !v.empty())
        cfg.dataDir = expand_tilde(v);
    if (auto v = envValue("CODEGRAPH_DATA_DIR"); !v.empty())
        cfg.dataDir = expand_tilde(v);
    if (cfg.dataDir.empty())
        cfg.dataDir = get_data_dir();

    if (auto v = value("graph.db_path"); !v.empty())
        cfg.graph.dbPath = expand_tilde(v);
    std::size_t maxConnections = cfg.graph.maxConnections;
    parseNumber(value("graph.max_connections"), "graph.max_connections", maxConnections);
    if (maxConnections > 0)
        cfg.graph.maxConnections = maxConnections;
    long long busyMs = cfg.graph.busyTimeout.count();
    parseNumber(value("graph.busy_timeout_ms"), "graph.busy_timeout_ms", busyMs);
    cfg.graph.busyTimeout = std::chrono::milliseconds(busyMs);
    parseBool(value("graph.enable_wal"), "graph.enable_wal", cfg.graph.enableWAL);

    parseNumber(value("pipeline.worker_threads"), "pipeline.worker_threads",
                cfg.pipeline.workerThreads);
    parseNumber(value("pipeline.extraction_threads"), "pipeline.extraction_threads",
                cfg.pipeline.extractionThreads);
    parseNumber(value("pipeline.max_file_size_bytes"), "pipeline.max_file_size_bytes",
                cfg.pipeline.maxFileSizeBytes);
    if (auto v = value("pipeline.exclude"); !v.empty())
        cfg.pipeline.excludePatterns = parse_string_list(v);

    if (auto v = value("logging.level"); !v.empty())
        cfg.logLevel = v;

    if (auto v = envValue("CODEGRAPH_DB_PATH"); !v.empty())
        cfg.graph.dbPath = expand_tilde(v);
    if (auto v = envValue("CODEGRAPH_LOG_LEVEL"); !v.empty())
        cfg.logLevel = v;
    parseNumber(envValue("CODEGRAPH_WORKER_THREADS"), "CODEGRAPH_WORKER_THREADS",
                cfg.pipeline.workerThreads);

    if (cfg.graph.dbPath.empty())
        cfg.graph.dbPath = cfg.dataDir / "graph.db";
    if (cfg.pipeline.workerThreads == 0)
        cfg.pipeline.workerThreads = 1;
    if (cfg.pipeline.extractionThreads == 0)
        cfg.pipeline.extractionThreads = 1;

    return cfg;
}

} // namespace codegraph::config
