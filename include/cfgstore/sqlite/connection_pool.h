#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <type_traits>
#include <cfgstore/sqlite/database.h>

namespace cfgstore::sqlite {

/**
 * @brief Configuration for connection pool
 */
struct ConnectionPoolConfig {
    size_t minConnections = 1;                  ///< Minimum connections to maintain
    size_t maxConnections = 8;                  ///< Maximum connections allowed
    std::chrono::milliseconds busyTimeout{5000}; ///< SQLite busy timeout
    std::chrono::milliseconds acquireTimeout{5000};
    bool enableWAL = true;
    bool enableForeignKeys = false; ///< Trader references are checked by migration validation
};

/**
 * @brief Database connection wrapper handed out by the pool
 */
class PooledConnection {
public:
    PooledConnection(std::unique_ptr<Database> db,
                     std::function<void(std::unique_ptr<Database>)> returnFunc);
    ~PooledConnection();

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    Database* operator->() { return db_.get(); }
    Database& operator*() { return *db_; }

    [[nodiscard]] bool isValid() const { return db_ != nullptr; }

private:
    std::unique_ptr<Database> db_;
    std::function<void(std::unique_ptr<Database>)> returnFunc_;
};

/**
 * @brief Thread-safe database connection pool
 */
class ConnectionPool {
public:
    explicit ConnectionPool(const std::string& dbPath, const ConnectionPoolConfig& config = {});
    ~ConnectionPool();

    // Non-copyable, non-movable
    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;
    ConnectionPool(ConnectionPool&&) = delete;
    ConnectionPool& operator=(ConnectionPool&&) = delete;

    /**
     * @brief Open the minimum number of connections
     * @return ConnectionFailed when the database cannot be opened
     */
    Result<void> initialize();

    void shutdown();

    /**
     * @brief Acquire a connection, waiting at most the configured acquire timeout
     */
    Result<std::unique_ptr<PooledConnection>> acquire();

    /**
     * @brief Execute a function with a connection
     */
    template <typename Func>
    auto withConnection(Func&& func) -> std::invoke_result_t<Func, Database&> {
        auto connResult = acquire();
        if (!connResult) {
            return connResult.error();
        }

        auto conn = std::move(connResult).value();
        try {
            return func(**conn);
        } catch (const std::exception& e) {
            return Error{ErrorCode::DatabaseError, e.what()};
        }
    }

    [[nodiscard]] const std::string& path() const { return dbPath_; }

private:
    std::string dbPath_;
    ConnectionPoolConfig config_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<std::unique_ptr<Database>> available_;
    size_t totalConnections_ = 0;
    size_t activeConnections_ = 0;
    bool shutdown_ = false;

    Result<std::unique_ptr<Database>> createConnection();
    Result<void> configureConnection(Database& db);
    void returnConnection(std::unique_ptr<Database> db);
    std::unique_ptr<PooledConnection> wrap(std::unique_ptr<Database> db);
};

} // namespace cfgstore::sqlite
