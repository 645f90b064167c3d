#include <codegraph/graph/migration.h>

#include <spdlog/spdlog.h>
#include <algorithm>

namespace codegraph::graph {

MigrationManager::MigrationManager(Database& db, std::vector<Migration> migrations)
    : db_(db), migrations_(std::move(migrations)) {
    std::sort(migrations_.begin(), migrations_.end(),
              [](const Migration& a, const Migration& b) { return a.version < b.version; });
}

Result<int> MigrationManager::currentVersion() {
    auto r = db_.execute("CREATE TABLE IF NOT EXISTS schema_migrations ("
                         "version INTEGER PRIMARY KEY, name TEXT NOT NULL, "
                         "applied_at INTEGER NOT NULL DEFAULT (strftime('%s', 'now')))");
    if (!r)
        return r.error();
    auto stmt = db_.prepare("SELECT COALESCE(MAX(version), 0) FROM schema_migrations");
    if (!stmt)
        return stmt.error();
    auto row = stmt.value().step();
    if (!row)
        return row.error();
    return row.value() ? stmt.value().getInt(0) : 0;
}

Result<int> MigrationManager::migrate() {
    auto current = currentVersion();
    if (!current)
        return current.error();

    int applied = 0;
    for (const auto& m : migrations_) {
        if (m.version <= current.value())
            continue;
        auto r = db_.transaction([&]() -> Result<void> {
            auto up = db_.execute(m.upSQL);
            if (!up)
                return up;
            auto record =
                db_.prepare("INSERT INTO schema_migrations (version, name) VALUES (?, ?)");
            if (!record)
                return record.error();
            auto b = record.value().bindAll(m.version, m.name);
            if (!b)
                return b;
            return record.value().execute();
        });
        if (!r) {
            return Error{r.error().code, fmt::format("Migration {} ({}) failed: {}", m.version,
                                                     m.name, r.error().message)};
        }
        spdlog::info("Applied schema migration {} ({})", m.version, m.name);
        ++applied;
    }
    return applied;
}

std::vector<Migration> codeGraphMigrations() {
    std::vector<Migration> migrations;

    migrations.push_back(Migration{1, "create_code_graph", R"(
        CREATE TABLE IF NOT EXISTS symbols (
            id TEXT PRIMARY KEY,
            repo_id TEXT NOT NULL,
            name TEXT NOT NULL,
            kind TEXT NOT NULL,
            file_path TEXT NOT NULL,
            language TEXT NOT NULL,
            start_line INTEGER NOT NULL,
            start_column INTEGER NOT NULL,
            end_line INTEGER NOT NULL,
            end_column INTEGER NOT NULL,
            docstring TEXT,
            signature TEXT,
            parent_id TEXT,
            attributes TEXT NOT NULL DEFAULT '{}'
        );
        CREATE INDEX IF NOT EXISTS idx_symbols_name ON symbols(name);
        CREATE INDEX IF NOT EXISTS idx_symbols_kind ON symbols(kind);
        CREATE INDEX IF NOT EXISTS idx_symbols_file_path ON symbols(file_path);
        CREATE INDEX IF NOT EXISTS idx_symbols_repo_file
            ON symbols(repo_id, file_path, start_line);
        CREATE INDEX IF NOT EXISTS idx_symbols_parent ON symbols(parent_id);

        CREATE TABLE IF NOT EXISTS edges (
            id TEXT PRIMARY KEY,
            repo_id TEXT NOT NULL,
            source_id TEXT NOT NULL,
            target_id TEXT,
            kind TEXT NOT NULL,
            attributes TEXT NOT NULL DEFAULT '{}'
        );
        CREATE INDEX IF NOT EXISTS idx_edges_repo ON edges(repo_id, kind);

        CREATE TABLE IF NOT EXISTS relationships (
            edge_id TEXT PRIMARY KEY,
            source_id TEXT NOT NULL,
            target_id TEXT NOT NULL,
            kind TEXT NOT NULL,
            attributes TEXT NOT NULL DEFAULT '{}'
        );
        CREATE INDEX IF NOT EXISTS idx_relationships_kind ON relationships(kind);
        CREATE INDEX IF NOT EXISTS idx_relationships_source ON relationships(source_id);
        CREATE INDEX IF NOT EXISTS idx_relationships_target ON relationships(target_id);
    )"});

    return migrations;
}

} // namespace codegraph::graph
