#pragma once

#include <sqlite3.h>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <codegraph/core/types.h>

namespace codegraph::graph {

/// Database path that opens a private in-memory database.
inline constexpr std::string_view kInMemoryPath = ":memory:";

/**
 * @brief Prepared statement owning its sqlite3_stmt.
 *
 * Bind indices are 1-based and column indices 0-based, as in SQLite.
 */
class Statement {
public:
    Statement() = default;
    explicit Statement(sqlite3_stmt* handle) noexcept : handle_(handle) {}
    ~Statement() { sqlite3_finalize(handle_); }

    Statement(Statement&& other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {}
    Statement& operator=(Statement&& other) noexcept {
        if (this != &other) {
            sqlite3_finalize(handle_);
            handle_ = std::exchange(other.handle_, nullptr);
        }
        return *this;
    }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Result<void> bind(int index, std::nullptr_t);
    Result<void> bind(int index, std::int64_t value);
    Result<void> bind(int index, int value) { return bind(index, std::int64_t{value}); }
    Result<void> bind(int index, std::string_view value);
    Result<void> bind(int index, const std::string& value) {
        return bind(index, std::string_view(value));
    }
    Result<void> bind(int index, const char* value) { return bind(index, std::string_view(value)); }
    /// NULL when empty.
    Result<void> bind(int index, const std::optional<std::string>& value) {
        return value ? bind(index, std::string_view(*value)) : bind(index, nullptr);
    }

    /// Binds args to parameters 1..N, stopping at the first failure.
    template <typename... Args> Result<void> bindAll(const Args&... args) {
        Result<void> result;
        int index = 0;
        (void)(static_cast<bool>(result = bind(++index, args)) && ...);
        return result;
    }

    /// Run to completion, discarding any rows.
    Result<void> execute();

    /// @return true while a row is available
    Result<bool> step();

    int getInt(int column) const { return sqlite3_column_int(handle_, column); }
    std::int64_t getInt64(int column) const { return sqlite3_column_int64(handle_, column); }
    std::string getString(int column) const;
    std::optional<std::string> getOptionalString(int column) const;
    bool isNull(int column) const { return sqlite3_column_type(handle_, column) == SQLITE_NULL; }

    Result<void> reset();
    Result<void> clearBindings();

private:
    int stepWithRetry();
    Error failure(std::string_view what, int rc) const;

    sqlite3_stmt* handle_ = nullptr;
};

class Database;

/**
 * @brief Write transaction opened with BEGIN IMMEDIATE. Rolls back when it
 * goes out of scope uncommitted, including during stack unwinding.
 */
class Transaction {
public:
    static Result<Transaction> begin(Database& db);

    ~Transaction();
    Transaction(Transaction&& other) noexcept : db_(std::exchange(other.db_, nullptr)) {}
    Transaction& operator=(Transaction&&) = delete;
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    Result<void> commit();

private:
    explicit Transaction(Database& db) noexcept : db_(&db) {}

    Database* db_;
};

/**
 * @brief One SQLite connection. Not thread-safe; the connection pool hands
 * each connection to one thread at a time.
 */
class Database {
public:
    Database() = default;
    ~Database() { close(); }

    Database(Database&& other) noexcept
        : db_(std::exchange(other.db_, nullptr)),
          inTransaction_(std::exchange(other.inTransaction_, false)) {}
    Database& operator=(Database&& other) noexcept {
        if (this != &other) {
            close();
            db_ = std::exchange(other.db_, nullptr);
            inTransaction_ = std::exchange(other.inTransaction_, false);
        }
        return *this;
    }
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    /// Open a database file, or a private in-memory database for kInMemoryPath.
    Result<void> open(const std::string& path, bool createIfMissing = true);
    void close() noexcept;
    [[nodiscard]] bool isOpen() const noexcept { return db_ != nullptr; }

    Result<Statement> prepare(std::string_view sql);

    /// Run one or more ';'-separated statements.
    Result<void> execute(const std::string& sql);

    /**
     * @brief Run func inside a write transaction. Commits when func succeeds;
     * rolls back when it returns an error or throws.
     */
    template <typename Func> Result<void> transaction(Func&& func) {
        auto tx = Transaction::begin(*this);
        if (!tx)
            return tx.error();
        Result<void> result = std::forward<Func>(func)();
        if (!result)
            return result;
        return tx.value().commit();
    }

    Result<void> setBusyTimeout(std::chrono::milliseconds timeout);
    Result<void> enableWAL();

private:
    friend class Transaction;

    sqlite3* db_ = nullptr;
    bool inTransaction_ = false;
};

} // namespace codegraph::graph
