#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <vector>

#include <codegraph/graph/database.h>

namespace codegraph::graph {

struct ConnectionPoolConfig {
    std::size_t maxConnections = 8;
    std::chrono::milliseconds acquireTimeout{10000};
    std::chrono::milliseconds busyTimeout{5000};
    bool enableWAL = true;
    bool createIfMissing = true;
};

class ConnectionPool;

/**
 * @brief Borrowed connection; goes back to its pool on destruction.
 */
class PooledConnection {
public:
    PooledConnection(ConnectionPool& pool, std::unique_ptr<Database> db) noexcept
        : pool_(&pool), db_(std::move(db)) {}
    ~PooledConnection();

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    Database& operator*() noexcept { return *db_; }
    Database* operator->() noexcept { return db_.get(); }

private:
    ConnectionPool* pool_;
    std::unique_ptr<Database> db_;
};

/**
 * @brief Thread-safe pool of SQLite connections to one database.
 *
 * Connections open lazily up to maxConnections. An in-memory database exists
 * only inside its one connection, so the pool holds a single connection then.
 */
class ConnectionPool {
public:
    explicit ConnectionPool(std::string dbPath, const ConnectionPoolConfig& config = {});
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /// Opens the first connection; ServiceUnavailable when that fails.
    Result<void> initialize();

    /// Later acquire() calls fail with NotConnected.
    void shutdown();

    Result<std::unique_ptr<PooledConnection>> acquire();

    /// Run func with a borrowed connection. Exceptions become DatabaseError.
    template <typename Func>
    auto withConnection(Func&& func) -> std::invoke_result_t<Func, Database&> {
        auto conn = acquire();
        if (!conn)
            return conn.error();
        try {
            return std::forward<Func>(func)(**conn.value());
        } catch (const std::exception& e) {
            return Error{ErrorCode::DatabaseError, e.what()};
        }
    }

private:
    friend class PooledConnection;

    Result<std::unique_ptr<Database>> openConnection() const;
    void giveBack(std::unique_ptr<Database> db);

    std::string dbPath_;
    ConnectionPoolConfig config_;

    std::mutex mutex_;
    std::condition_variable released_;
    std::vector<std::unique_ptr<Database>> idle_;
    std::size_t open_ = 0;
    bool shutdown_ = true;
};

} // namespace codegraph::graph
