#pragma once

#include <cfgstore/core/types.h>
#include <sqlite3.h>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cfgstore::sqlite {

/**
 * @brief SQLite statement wrapper with RAII
 */
class Statement {
public:
    Statement() = default;
    Statement(sqlite3* db, const std::string& sql);
    ~Statement();

    // Move-only
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    /**
     * @brief Bind parameters to statement
     */
    Result<void> bind(int index, std::nullptr_t);
    Result<void> bind(int index, int value);
    Result<void> bind(int index, int64_t value);
    Result<void> bind(int index, bool value) { return bind(index, value ? 1 : 0); }
    Result<void> bind(int index, double value);
    Result<void> bind(int index, const std::string& value);
    Result<void> bind(int index, std::string_view value);
    Result<void> bind(int index, const char* value) { return bind(index, std::string_view(value)); }
    Result<void> bind(int index, TimePoint tp);
    Result<void> bind(int index, const std::optional<int64_t>& value);

    /**
     * @brief Bind multiple parameters using variadic templates
     */
    template <typename... Args> Result<void> bindAll(Args&&... args) {
        return bindHelper(1, std::forward<Args>(args)...);
    }

    /**
     * @brief Execute statement (for non-SELECT queries)
     */
    Result<void> execute();

    /**
     * @brief Step through results (for SELECT queries)
     * @return true if row available, false if done
     */
    Result<bool> step();

    /**
     * @brief Get column values
     */
    int getInt(int column) const;
    int64_t getInt64(int column) const;
    double getDouble(int column) const;
    bool getBool(int column) const { return getInt(column) != 0; }
    std::string getString(int column) const;
    TimePoint getTime(int column) const;
    bool isNull(int column) const;

    Result<void> reset();
    Result<void> clearBindings();

private:
    sqlite3_stmt* stmt_ = nullptr;

    Error stepError(int rc, const char* what) const;

    template <typename T, typename... Rest>
    Result<void> bindHelper(int index, T&& value, Rest&&... rest) {
        auto result = bind(index, std::forward<T>(value));
        if (!result)
            return result;
        if constexpr (sizeof...(rest) > 0) {
            return bindHelper(index + 1, std::forward<Rest>(rest)...);
        }
        return {};
    }

    Result<void> bindHelper(int) { return {}; }
};

/**
 * @brief Database connection wrapper
 */
class Database {
public:
    Database() = default;
    ~Database();

    // Move-only
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    /// Opens read-write, creating the file when missing
    Result<void> open(const std::string& path);
    void close();

    [[nodiscard]] bool isOpen() const { return db_ != nullptr; }
    [[nodiscard]] bool inTransaction() const { return inTransaction_; }

    Result<Statement> prepare(const std::string& sql);

    /**
     * @brief Execute SQL directly (for non-SELECT queries)
     */
    Result<void> execute(const std::string& sql);

    Result<void> beginTransaction();
    Result<void> commit();
    Result<void> rollback();

    /**
     * @brief Execute within transaction
     *
     * Uses BEGIN IMMEDIATE so concurrent writers serialize on the
     * reserved lock instead of failing at commit.
     */
    template <typename Func> Result<void> transaction(Func&& func) {
        auto beginResult = beginTransaction();
        if (!beginResult)
            return beginResult;

        try {
            auto result = func();
            if (!result) {
                auto rb = rollback();
                if (!rb) {
                    logRollbackFailure(rb.error());
                }
                return result;
            }
            return commit();
        } catch (...) {
            auto rb = rollback();
            if (!rb) {
                logRollbackFailure(rb.error());
            }
            throw;
        }
    }

    int changes() const;

    Result<bool> tableExists(const std::string& table);

    /**
     * @brief Check whether a table carries a column (PRAGMA table_info)
     */
    Result<bool> columnExists(const std::string& table, const std::string& column);

    /**
     * @brief Column names of a table in declaration order
     */
    Result<std::vector<std::string>> tableColumns(const std::string& table);

    Result<void> setBusyTimeout(std::chrono::milliseconds timeout);
    Result<void> enableWAL();

    /**
     * @brief Copy the whole database to another file with the online backup API
     */
    Result<void> backupTo(const std::string& destPath);

    static std::string version();

    [[nodiscard]] const std::string& path() const { return path_; }

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    bool inTransaction_ = false;

    static void logRollbackFailure(const Error& error);
    std::string getErrorMessage() const;
};

/**
 * @brief Map a sqlite result code onto the store error taxonomy
 */
ErrorCode translateSqliteError(int rc);

} // namespace cfgstore::sqlite
