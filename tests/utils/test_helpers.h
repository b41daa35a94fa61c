#pragma once

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <cfgstore/config/store_config.h>
#include <cfgstore/core/types.h>
#include <cfgstore/sqlite/database.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <random>
#include <string>
#include <utility>

namespace cfgstore::test {

// Root for temporary stores: $CFGSTORE_TEST_TMPDIR or the system temp directory
inline std::filesystem::path testRoot() {
    if (const char* dir = std::getenv("CFGSTORE_TEST_TMPDIR"); dir && *dir) {
        return dir;
    }
    return std::filesystem::temp_directory_path();
}

inline std::filesystem::path uniqueTestDir(const std::string& prefix = "cfgstore_test") {
    static std::mt19937_64 rng{std::random_device{}()};
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    auto path = testRoot() / (prefix + "_" + std::to_string(stamp) + "_" + std::to_string(rng()));
    std::filesystem::create_directories(path);
    return path;
}

/**
 * @brief Table layout written by releases that keyed AI models and exchanges by name
 *
 * No additive columns, no counters table and no migration history.
 */
inline constexpr const char* kLegacySchemaSql = R"(
    CREATE TABLE users (
        id TEXT PRIMARY KEY,
        email TEXT UNIQUE NOT NULL,
        password_hash TEXT NOT NULL DEFAULT '',
        otp_secret TEXT NOT NULL DEFAULT '',
        otp_verified INTEGER NOT NULL DEFAULT 0,
        created_at INTEGER NOT NULL DEFAULT 0,
        updated_at INTEGER NOT NULL DEFAULT 0
    );
    CREATE TABLE ai_models (
        id TEXT NOT NULL,
        user_id TEXT NOT NULL DEFAULT 'default',
        name TEXT NOT NULL DEFAULT '',
        provider TEXT NOT NULL DEFAULT '',
        enabled INTEGER NOT NULL DEFAULT 0,
        api_key TEXT NOT NULL DEFAULT '',
        custom_api_url TEXT NOT NULL DEFAULT '',
        created_at INTEGER NOT NULL DEFAULT 0,
        updated_at INTEGER NOT NULL DEFAULT 0,
        PRIMARY KEY (id, user_id)
    );
    CREATE TABLE exchanges (
        id TEXT NOT NULL,
        user_id TEXT NOT NULL DEFAULT 'default',
        name TEXT NOT NULL DEFAULT '',
        type TEXT NOT NULL DEFAULT '',
        enabled INTEGER NOT NULL DEFAULT 0,
        api_key TEXT NOT NULL DEFAULT '',
        secret_key TEXT NOT NULL DEFAULT '',
        testnet INTEGER NOT NULL DEFAULT 0,
        created_at INTEGER NOT NULL DEFAULT 0,
        updated_at INTEGER NOT NULL DEFAULT 0,
        PRIMARY KEY (id, user_id)
    );
    CREATE TABLE traders (
        id TEXT PRIMARY KEY,
        user_id TEXT NOT NULL DEFAULT 'default',
        name TEXT NOT NULL,
        ai_model_id TEXT NOT NULL,
        exchange_id TEXT NOT NULL,
        initial_balance REAL NOT NULL DEFAULT 0,
        scan_interval_minutes INTEGER NOT NULL DEFAULT 3,
        is_running INTEGER NOT NULL DEFAULT 0,
        use_coin_pool INTEGER NOT NULL DEFAULT 0,
        use_oi_top INTEGER NOT NULL DEFAULT 0,
        custom_prompt TEXT NOT NULL DEFAULT '',
        override_base_prompt INTEGER NOT NULL DEFAULT 0,
        is_cross_margin INTEGER NOT NULL DEFAULT 1,
        created_at INTEGER NOT NULL DEFAULT 0,
        updated_at INTEGER NOT NULL DEFAULT 0
    );
    CREATE TABLE user_signal_sources (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        user_id TEXT NOT NULL UNIQUE,
        coin_pool_url TEXT NOT NULL DEFAULT '',
        oi_top_url TEXT NOT NULL DEFAULT '',
        created_at INTEGER NOT NULL DEFAULT 0,
        updated_at INTEGER NOT NULL DEFAULT 0
    );
    CREATE TABLE system_config (
        key TEXT PRIMARY KEY,
        value TEXT NOT NULL DEFAULT '',
        updated_at INTEGER NOT NULL DEFAULT 0
    );
    CREATE TABLE beta_codes (
        code TEXT PRIMARY KEY,
        used INTEGER NOT NULL DEFAULT 0,
        used_by TEXT NOT NULL DEFAULT '',
        used_at INTEGER,
        created_at INTEGER NOT NULL DEFAULT 0
    );
)";

// Base test fixture with a private directory per test
class StoreTest : public ::testing::Test {
protected:
    void SetUp() override { testDir = uniqueTestDir(); }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(testDir, ec);
    }

    config::StoreConfig sqliteConfig(const std::string& file = "config.db") const {
        config::StoreConfig cfg;
        cfg.backend = config::BackendKind::Sqlite;
        cfg.sqlitePath = testDir / file;
        cfg.backupDir = testDir / "backups";
        cfg.poolMin = 1;
        cfg.poolMax = 4;
        cfg.logLevel = "warn";
        return cfg;
    }

    // Runs SQL against a database file outside any pool
    static void executeSql(const std::filesystem::path& path, const std::string& sql) {
        sqlite::Database db;
        auto opened = db.open(path.string());
        ASSERT_TRUE(opened) << opened.error().message;
        auto executed = db.execute(sql);
        ASSERT_TRUE(executed) << executed.error().message;
    }

    static int64_t queryInt(const std::filesystem::path& path, const std::string& sql) {
        sqlite::Database db;
        auto opened = db.open(path.string());
        if (!opened)
            return -1;
        auto prepared = db.prepare(sql);
        if (!prepared)
            return -1;
        auto stmt = std::move(prepared).value();
        auto hasRow = stmt.step();
        if (!hasRow || !hasRow.value())
            return -1;
        return stmt.getInt64(0);
    }

    std::filesystem::path testDir;
};

} // namespace cfgstore::test
