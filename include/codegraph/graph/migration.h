#pragma once

#include <string>
#include <vector>

#include <codegraph/graph/database.h>

namespace codegraph::graph {

struct Migration {
    int version = 0;
    std::string name;
    std::string upSQL;
};

/**
 * @brief Applies pending migrations in version order, each in its own
 * transaction, recording them in schema_migrations.
 */
class MigrationManager {
public:
    MigrationManager(Database& db, std::vector<Migration> migrations);

    /// Highest applied version, 0 for a fresh database.
    Result<int> currentVersion();

    /// @return the number of migrations applied
    Result<int> migrate();

private:
    Database& db_;
    std::vector<Migration> migrations_;
};

/// Schema of the code graph: symbols, edges and materialized relationships.
std::vector<Migration> codeGraphMigrations();

} // namespace codegraph::graph
