#pragma once

#include <cfgstore/sqlite/connection_pool.h>
#include <cfgstore/store/sequence_allocator.h>

namespace cfgstore::sqlite {

/**
 * @brief Counters kept in the `counters` table
 *
 * next() is a single upsert with RETURNING, so the increment and the read
 * happen inside one implicit write transaction.
 */
class SqliteSequenceAllocator : public store::SequenceAllocator {
public:
    explicit SqliteSequenceAllocator(ConnectionPool& pool) : pool_(pool) {}

    Result<int64_t> next(const std::string& family) override;
    Result<int64_t> current(const std::string& family) override;
    Result<void> advanceTo(const std::string& family, int64_t floor) override;

    /// Same operations on a caller-held connection (e.g. inside a migration transaction)
    static Result<int64_t> nextOn(Database& db, const std::string& family);
    static Result<int64_t> currentOn(Database& db, const std::string& family);
    static Result<void> advanceOn(Database& db, const std::string& family, int64_t floor);

    static Result<void> createTable(Database& db);

private:
    ConnectionPool& pool_;
};

} // namespace cfgstore::sqlite
