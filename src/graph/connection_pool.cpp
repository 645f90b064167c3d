#include <codegraph/graph/connection_pool.h>

#include <spdlog/spdlog.h>

namespace codegraph::graph {

PooledConnection::~PooledConnection() {
    if (db_)
        pool_->giveBack(std::move(db_));
}

ConnectionPool::ConnectionPool(std::string dbPath, const ConnectionPoolConfig& config)
    : dbPath_(std::move(dbPath)), config_(config) {
    if (dbPath_ == kInMemoryPath || config_.maxConnections == 0)
        config_.maxConnections = 1;
}

ConnectionPool::~ConnectionPool() {
    shutdown();
}

Result<void> ConnectionPool::initialize() {
    auto first = openConnection();
    if (!first) {
        return Error{ErrorCode::ServiceUnavailable,
                     fmt::format("Graph database '{}' is unavailable: {}", dbPath_,
                                 first.error().message)};
    }
    std::lock_guard<std::mutex> lock(mutex_);
    idle_.push_back(std::move(first).value());
    open_ = 1;
    shutdown_ = false;
    spdlog::debug("Connection pool for {} ready (up to {} connections)", dbPath_,
                  config_.maxConnections);
    return {};
}

void ConnectionPool::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_)
        return;
    shutdown_ = true;
    open_ -= idle_.size();
    idle_.clear();
    released_.notify_all();
}

Result<std::unique_ptr<PooledConnection>> ConnectionPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    const auto deadline = std::chrono::steady_clock::now() + config_.acquireTimeout;
    while (true) {
        if (shutdown_)
            return Error{ErrorCode::NotConnected, "Graph store is not connected"};

        if (!idle_.empty()) {
            auto db = std::move(idle_.back());
            idle_.pop_back();
            return std::make_unique<PooledConnection>(*this, std::move(db));
        }

        if (open_ < config_.maxConnections) {
            ++open_;
            lock.unlock();
            auto db = openConnection();
            lock.lock();
            if (!db) {
                --open_;
                return Error{ErrorCode::ServiceUnavailable,
                             "Cannot open another database connection: " + db.error().message};
            }
            return std::make_unique<PooledConnection>(*this, std::move(db).value());
        }

        if (released_.wait_until(lock, deadline) == std::cv_status::timeout && idle_.empty() &&
            !shutdown_) {
            return Error{ErrorCode::ServiceUnavailable,
                         "Timed out waiting for a database connection"};
        }
    }
}

void ConnectionPool::giveBack(std::unique_ptr<Database> db) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_ || !db->isOpen()) {
        // Dropped here; the connection closes when db goes out of scope.
        --open_;
    } else {
        idle_.push_back(std::move(db));
    }
    released_.notify_one();
}

Result<std::unique_ptr<Database>> ConnectionPool::openConnection() const {
    auto db = std::make_unique<Database>();
    auto r = db->open(dbPath_, config_.createIfMissing);
    if (r)
        r = db->setBusyTimeout(config_.busyTimeout);
    if (r && config_.enableWAL && dbPath_ != kInMemoryPath) {
        r = db->enableWAL();
        if (r)
            r = db->execute("PRAGMA synchronous = NORMAL");
    }
    if (r)
        r = db->execute("PRAGMA temp_store = MEMORY");
    if (!r)
        return r.error();
    return db;
}

} // namespace codegraph::graph
