#include <codegraph/graph/database.h>

#include <spdlog/spdlog.h>
#include <thread>

namespace codegraph::graph {

namespace {

// Busy retries on top of sqlite3_busy_timeout, for lock upgrades the busy
// handler does not cover.
constexpr int kBusyRetries = 5;
constexpr std::chrono::milliseconds kFirstBackoff{10};

bool isBusy(int rc) {
    return rc == SQLITE_BUSY || rc == SQLITE_LOCKED;
}

Error notOpen() {
    return Error{ErrorCode::InvalidState, "Database is not open"};
}

} // namespace

// ---- Statement ----

Error Statement::failure(std::string_view what, int rc) const {
    sqlite3* db = handle_ ? sqlite3_db_handle(handle_) : nullptr;
    std::string message = fmt::format("{}: {}", what, db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
    if (rc == SQLITE_CONSTRAINT && handle_) {
        if (const char* sql = sqlite3_sql(handle_))
            message += fmt::format(" [{:.100}]", sql);
    }
    return Error{ErrorCode::DatabaseError, std::move(message)};
}

Result<void> Statement::bind(int index, std::nullptr_t) {
    const int rc = sqlite3_bind_null(handle_, index);
    if (rc != SQLITE_OK)
        return failure(fmt::format("Binding NULL to parameter {}", index), rc);
    return {};
}

Result<void> Statement::bind(int index, std::int64_t value) {
    const int rc = sqlite3_bind_int64(handle_, index, value);
    if (rc != SQLITE_OK)
        return failure(fmt::format("Binding integer to parameter {}", index), rc);
    return {};
}

Result<void> Statement::bind(int index, std::string_view value) {
    const int rc = sqlite3_bind_text(handle_, index, value.data(), static_cast<int>(value.size()),
                                     SQLITE_TRANSIENT);
    if (rc != SQLITE_OK)
        return failure(fmt::format("Binding text to parameter {}", index), rc);
    return {};
}

int Statement::stepWithRetry() {
    auto backoff = kFirstBackoff;
    int rc = sqlite3_step(handle_);
    for (int attempt = 1; isBusy(rc) && attempt < kBusyRetries; ++attempt) {
        sqlite3_reset(handle_);
        std::this_thread::sleep_for(backoff);
        backoff *= 2;
        rc = sqlite3_step(handle_);
    }
    return rc;
}

Result<void> Statement::execute() {
    if (!handle_)
        return Error{ErrorCode::InvalidState, "Statement is not prepared"};
    int rc = stepWithRetry();
    while (rc == SQLITE_ROW)
        rc = sqlite3_step(handle_);
    if (rc != SQLITE_DONE)
        return failure("Executing statement", rc);
    return {};
}

Result<bool> Statement::step() {
    if (!handle_)
        return Error{ErrorCode::InvalidState, "Statement is not prepared"};
    const int rc = stepWithRetry();
    if (rc == SQLITE_ROW)
        return true;
    if (rc == SQLITE_DONE)
        return false;
    return failure("Stepping statement", rc);
}

std::string Statement::getString(int column) const {
    const auto* text = sqlite3_column_text(handle_, column);
    if (!text)
        return {};
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<std::size_t>(sqlite3_column_bytes(handle_, column)));
}

std::optional<std::string> Statement::getOptionalString(int column) const {
    if (isNull(column))
        return std::nullopt;
    return getString(column);
}

Result<void> Statement::reset() {
    if (!handle_)
        return Error{ErrorCode::InvalidState, "Statement is not prepared"};
    // sqlite3_reset repeats the last step error; a fresh execution is what matters here.
    sqlite3_reset(handle_);
    return {};
}

Result<void> Statement::clearBindings() {
    if (!handle_)
        return Error{ErrorCode::InvalidState, "Statement is not prepared"};
    const int rc = sqlite3_clear_bindings(handle_);
    if (rc != SQLITE_OK)
        return failure("Clearing bindings", rc);
    return {};
}

// ---- Transaction ----

Result<Transaction> Transaction::begin(Database& db) {
    if (db.inTransaction_)
        return Error{ErrorCode::InvalidState, "Nested transactions are not supported"};
    // IMMEDIATE takes the write lock now, so a busy database fails here and
    // not halfway through the writes.
    auto r = db.execute("BEGIN IMMEDIATE");
    if (!r)
        return r.error();
    db.inTransaction_ = true;
    return Transaction(db);
}

Result<void> Transaction::commit() {
    if (!db_)
        return Error{ErrorCode::InvalidState, "Transaction already finished"};
    auto r = db_->execute("COMMIT");
    if (!r)
        return r;
    db_->inTransaction_ = false;
    db_ = nullptr;
    return {};
}

Transaction::~Transaction() {
    if (!db_ || !db_->inTransaction_)
        return;
    db_->inTransaction_ = false;
    if (auto r = db_->execute("ROLLBACK"); !r)
        spdlog::warn("Rollback failed: {}", r.error().message);
}

// ---- Database ----

Result<void> Database::open(const std::string& path, bool createIfMissing) {
    close();
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_NOMUTEX;
    if (createIfMissing || path == kInMemoryPath)
        flags |= SQLITE_OPEN_CREATE;
    if (path == kInMemoryPath)
        flags |= SQLITE_OPEN_MEMORY;

    const int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string reason = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close(db_);
        db_ = nullptr;
        return Error{ErrorCode::DatabaseError,
                     fmt::format("Cannot open database '{}': {}", path, reason)};
    }
    return {};
}

void Database::close() noexcept {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
    inTransaction_ = false;
}

Result<Statement> Database::prepare(std::string_view sql) {
    if (!db_)
        return notOpen();
    sqlite3_stmt* handle = nullptr;
    const int rc =
        sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()), &handle, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_finalize(handle);
        return Error{ErrorCode::DatabaseError,
                     fmt::format("Cannot prepare statement: {}", sqlite3_errmsg(db_))};
    }
    return Statement(handle);
}

Result<void> Database::execute(const std::string& sql) {
    if (!db_)
        return notOpen();
    char* raw = nullptr;
    const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &raw);
    if (rc != SQLITE_OK) {
        std::string reason = raw ? raw : sqlite3_errstr(rc);
        sqlite3_free(raw);
        spdlog::debug("SQL failed ({}): {}", reason, sql);
        return Error{ErrorCode::DatabaseError, "SQL failed: " + reason};
    }
    return {};
}

Result<void> Database::setBusyTimeout(std::chrono::milliseconds timeout) {
    if (!db_)
        return notOpen();
    if (sqlite3_busy_timeout(db_, static_cast<int>(timeout.count())) != SQLITE_OK)
        return Error{ErrorCode::DatabaseError, "Cannot set busy timeout"};
    return {};
}

Result<void> Database::enableWAL() {
    return execute("PRAGMA journal_mode = WAL");
}

} // namespace codegraph::graph
