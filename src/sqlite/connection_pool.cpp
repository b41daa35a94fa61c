#include <spdlog/spdlog.h>
#include <cstdlib>
#include <string>
#include <cfgstore/sqlite/connection_pool.h>

namespace cfgstore::sqlite {

// PooledConnection implementation
PooledConnection::PooledConnection(std::unique_ptr<Database> db,
                                   std::function<void(std::unique_ptr<Database>)> returnFunc)
    : db_(std::move(db)), returnFunc_(std::move(returnFunc)) {}

PooledConnection::~PooledConnection() {
    if (db_ && returnFunc_) {
        returnFunc_(std::move(db_));
    }
}

// ConnectionPool implementation
ConnectionPool::ConnectionPool(const std::string& dbPath, const ConnectionPoolConfig& config)
    : dbPath_(dbPath), config_(config) {}

ConnectionPool::~ConnectionPool() {
    shutdown();
}

Result<void> ConnectionPool::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (shutdown_) {
        return Error{ErrorCode::InvalidState, "Pool is shut down"};
    }

    for (size_t i = 0; i < config_.minConnections; ++i) {
        auto connResult = createConnection();
        if (!connResult) {
            while (!available_.empty()) {
                available_.pop();
            }
            totalConnections_ = 0;
            return Error{ErrorCode::ConnectionFailed, connResult.error().message};
        }
        available_.push(std::move(connResult).value());
        totalConnections_++;
    }

    spdlog::debug("Connection pool for {} initialized with {} connections", dbPath_,
                  config_.minConnections);
    return {};
}

void ConnectionPool::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (shutdown_) {
        return;
    }

    shutdown_ = true;
    cv_.notify_all();

    while (!available_.empty()) {
        available_.pop();
    }
    totalConnections_ = activeConnections_;
}

std::unique_ptr<PooledConnection> ConnectionPool::wrap(std::unique_ptr<Database> db) {
    return std::make_unique<PooledConnection>(
        std::move(db), [this](std::unique_ptr<Database> d) { returnConnection(std::move(d)); });
}

Result<std::unique_ptr<PooledConnection>> ConnectionPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);

    if (shutdown_) {
        return Error{ErrorCode::NotInitialized, "Pool is shut down"};
    }

    auto deadline = std::chrono::steady_clock::now() + config_.acquireTimeout;

    while (available_.empty()) {
        if (totalConnections_ < config_.maxConnections) {
            // Reserve the slot before dropping the lock
            totalConnections_++;
            lock.unlock();
            auto connResult = createConnection();
            lock.lock();

            if (!connResult) {
                totalConnections_--;
                return connResult.error();
            }
            activeConnections_++;
            return wrap(std::move(connResult).value());
        }

        if (!cv_.wait_until(lock, deadline, [this] { return !available_.empty() || shutdown_; })) {
            return Error{ErrorCode::Timeout, "Timeout acquiring connection"};
        }

        if (shutdown_) {
            return Error{ErrorCode::NotInitialized, "Pool is shut down"};
        }
    }

    auto db = std::move(available_.front());
    available_.pop();
    activeConnections_++;
    return wrap(std::move(db));
}

Result<std::unique_ptr<Database>> ConnectionPool::createConnection() {
    auto db = std::make_unique<Database>();

    auto openResult = db->open(dbPath_);
    if (!openResult) {
        return openResult.error();
    }

    auto configResult = configureConnection(*db);
    if (!configResult) {
        return configResult.error();
    }

    return db;
}

Result<void> ConnectionPool::configureConnection(Database& db) {
    auto timeoutResult = db.setBusyTimeout(config_.busyTimeout);
    if (!timeoutResult) {
        return timeoutResult.error();
    }

    if (config_.enableWAL) {
        auto walResult = db.enableWAL();
        if (!walResult) {
            spdlog::warn("WAL enable failed: {}", walResult.error().message);
        }
    }

    if (config_.enableForeignKeys) {
        auto fkResult = db.execute("PRAGMA foreign_keys = ON");
        if (!fkResult) {
            return fkResult.error();
        }
    }

    // Relaxed durability when running tests
    const char* sync =
        std::getenv("CFGSTORE_TEST_TMPDIR") ? "PRAGMA synchronous = OFF" : "PRAGMA synchronous = NORMAL";
    if (auto r = db.execute(sync); !r) {
        spdlog::debug("Failed to set synchronous pragma: {}", r.error().message);
    }
    return {};
}

void ConnectionPool::returnConnection(std::unique_ptr<Database> db) {
    if (!db)
        return;

    // A caller that bailed out mid-transaction must not leak it to the next user
    if (db->inTransaction()) {
        auto rb = db->rollback();
        if (!rb) {
            spdlog::warn("Failed to rollback transaction, discarding connection: {}",
                         rb.error().message);
            std::lock_guard<std::mutex> lock(mutex_);
            activeConnections_--;
            totalConnections_--;
            cv_.notify_one();
            return;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    activeConnections_--;

    if (shutdown_) {
        totalConnections_--;
        return;
    }

    available_.push(std::move(db));
    cv_.notify_one();
}

} // namespace cfgstore::sqlite
