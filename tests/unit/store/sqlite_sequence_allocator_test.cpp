#include <algorithm>
#include <mutex>
#include <set>
#include <thread>
#include <vector>
#include <cfgstore/sqlite/connection_pool.h>
#include <cfgstore/sqlite/sqlite_sequence_allocator.h>

#include "utils/test_helpers.h"

using namespace cfgstore;
using namespace cfgstore::sqlite;

class SqliteSequenceAllocatorTest : public test::StoreTest {
protected:
    void SetUp() override {
        StoreTest::SetUp();
        ConnectionPoolConfig config;
        config.minConnections = 1;
        config.maxConnections = 8;
        pool = std::make_unique<ConnectionPool>((testDir / "counters.db").string(), config);
        ASSERT_TRUE(pool->initialize());
        auto created = pool->withConnection(
            [](Database& db) { return SqliteSequenceAllocator::createTable(db); });
        ASSERT_TRUE(created) << created.error().message;
        allocator = std::make_unique<SqliteSequenceAllocator>(*pool);
    }

    void TearDown() override {
        allocator.reset();
        pool->shutdown();
        pool.reset();
        StoreTest::TearDown();
    }

    std::unique_ptr<ConnectionPool> pool;
    std::unique_ptr<SqliteSequenceAllocator> allocator;
};

TEST_F(SqliteSequenceAllocatorTest, StartsAtOnePerFamily) {
    EXPECT_EQ(allocator->current("ai_models").value(), 0);
    EXPECT_EQ(allocator->next("ai_models").value(), 1);
    EXPECT_EQ(allocator->next("ai_models").value(), 2);
    EXPECT_EQ(allocator->next("exchanges").value(), 1);
    EXPECT_EQ(allocator->current("ai_models").value(), 2);
}

TEST_F(SqliteSequenceAllocatorTest, AdvanceNeverLowers) {
    ASSERT_TRUE(allocator->advanceTo("exchanges", 10));
    EXPECT_EQ(allocator->current("exchanges").value(), 10);

    ASSERT_TRUE(allocator->advanceTo("exchanges", 4));
    EXPECT_EQ(allocator->current("exchanges").value(), 10);
    EXPECT_EQ(allocator->next("exchanges").value(), 11);
}

TEST_F(SqliteSequenceAllocatorTest, ConcurrentCallersReceiveDistinctIds) {
    constexpr int kThreads = 8;
    constexpr int kPerThread = 25;

    std::mutex mutex;
    std::vector<int64_t> issued;
    std::vector<std::string> failures;
    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&]() {
            for (int i = 0; i < kPerThread; ++i) {
                auto id = allocator->next("traders");
                std::lock_guard<std::mutex> lock(mutex);
                if (id) {
                    issued.push_back(id.value());
                } else {
                    failures.push_back(id.error().message);
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    ASSERT_TRUE(failures.empty()) << failures.front();
    ASSERT_EQ(issued.size(), static_cast<size_t>(kThreads * kPerThread));
    std::set<int64_t> unique(issued.begin(), issued.end());
    EXPECT_EQ(unique.size(), issued.size());
    EXPECT_EQ(*unique.begin(), 1);
    EXPECT_EQ(*unique.rbegin(), kThreads * kPerThread);
}

TEST_F(SqliteSequenceAllocatorTest, RolledBackTransactionReleasesNothingVisible) {
    auto result = pool->withConnection([](Database& db) -> Result<void> {
        return db.transaction([&]() -> Result<void> {
            auto id = SqliteSequenceAllocator::nextOn(db, "ai_models");
            if (!id)
                return id.error();
            return Error{ErrorCode::InternalError, "abort"};
        });
    });
    ASSERT_FALSE(result);
    EXPECT_EQ(allocator->current("ai_models").value(), 0);
    EXPECT_EQ(allocator->next("ai_models").value(), 1);
}
