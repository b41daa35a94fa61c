/**
 * @file error_code_test.cpp
 * @brief Error classes and the SQLite result-code mapping behind them
 */

#include <sqlite3.h>
#include <cfgstore/sqlite/connection_pool.h>

#include "utils/test_helpers.h"

using namespace cfgstore;
using namespace cfgstore::sqlite;

TEST(ErrorCodeTest, FatalAtOpenCoversStoreRefusals) {
    EXPECT_TRUE(isFatalAtOpen(ErrorCode::ConnectionFailed));
    EXPECT_TRUE(isFatalAtOpen(ErrorCode::SchemaError));
    EXPECT_TRUE(isFatalAtOpen(ErrorCode::IntegrityError));
    EXPECT_FALSE(isFatalAtOpen(ErrorCode::NotFound));
    EXPECT_FALSE(isFatalAtOpen(ErrorCode::Timeout));
}

TEST(ErrorCodeTest, TransientCoversRetryableErrors) {
    EXPECT_TRUE(isTransient(ErrorCode::Timeout));
    EXPECT_TRUE(isTransient(ErrorCode::ConcurrencyConflict));
    EXPECT_TRUE(isTransient(ErrorCode::ResourceExhausted));
    EXPECT_FALSE(isTransient(ErrorCode::Duplicate));
    EXPECT_FALSE(isTransient(ErrorCode::SchemaError));
}

TEST(ErrorCodeTest, SqliteCodesMapOntoErrorClasses) {
    EXPECT_EQ(translateSqliteError(SQLITE_BUSY), ErrorCode::Timeout);
    EXPECT_EQ(translateSqliteError(SQLITE_BUSY_SNAPSHOT), ErrorCode::ConcurrencyConflict);
    EXPECT_EQ(translateSqliteError(SQLITE_LOCKED), ErrorCode::ConcurrencyConflict);
    EXPECT_EQ(translateSqliteError(SQLITE_CONSTRAINT_UNIQUE), ErrorCode::Duplicate);
    EXPECT_EQ(translateSqliteError(SQLITE_CONSTRAINT_PRIMARYKEY), ErrorCode::Duplicate);
    EXPECT_EQ(translateSqliteError(SQLITE_CONSTRAINT_NOTNULL), ErrorCode::InvalidData);
    EXPECT_EQ(translateSqliteError(SQLITE_CANTOPEN), ErrorCode::ConnectionFailed);
    EXPECT_EQ(translateSqliteError(SQLITE_CORRUPT), ErrorCode::DatabaseError);

    EXPECT_TRUE(isTransient(translateSqliteError(SQLITE_BUSY)));
    EXPECT_FALSE(isTransient(translateSqliteError(SQLITE_CONSTRAINT_UNIQUE)));
}

class ConnectionPoolErrorTest : public test::StoreTest {};

TEST_F(ConnectionPoolErrorTest, ExhaustedPoolReportsTransientTimeout) {
    ConnectionPoolConfig config;
    config.minConnections = 1;
    config.maxConnections = 1;
    config.acquireTimeout = std::chrono::milliseconds(50);
    ConnectionPool pool((testDir / "pool.db").string(), config);
    ASSERT_TRUE(pool.initialize());

    auto held = pool.acquire();
    ASSERT_TRUE(held) << held.error().message;

    auto second = pool.acquire();
    ASSERT_FALSE(second);
    EXPECT_EQ(second.error().code, ErrorCode::Timeout);
    EXPECT_TRUE(isTransient(second.error().code));
}

TEST_F(ConnectionPoolErrorTest, UnopenableFileIsFatal) {
    ConnectionPool pool((testDir / "missing-dir" / "nested" / "pool.db").string());
    auto initialized = pool.initialize();
    ASSERT_FALSE(initialized);
    EXPECT_TRUE(isFatalAtOpen(initialized.error().code));
}
