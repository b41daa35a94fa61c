#include <cfgstore/core/result_helpers.h>
#include <cfgstore/sqlite/sqlite_sequence_allocator.h>

namespace cfgstore::sqlite {

Result<void> SqliteSequenceAllocator::createTable(Database& db) {
    return db.execute("CREATE TABLE IF NOT EXISTS counters ("
                      "name TEXT PRIMARY KEY, "
                      "seq INTEGER NOT NULL DEFAULT 0)");
}

Result<int64_t> SqliteSequenceAllocator::nextOn(Database& db, const std::string& family) {
    CFGSTORE_TRY_UNWRAP(stmt, db.prepare("INSERT INTO counters (name, seq) VALUES (?, 1) "
                                         "ON CONFLICT(name) DO UPDATE SET seq = seq + 1 "
                                         "RETURNING seq"));
    CFGSTORE_TRY(stmt.bind(1, family));
    CFGSTORE_TRY_UNWRAP(hasRow, stmt.step());
    if (!hasRow) {
        return Error{ErrorCode::DatabaseError, "Counter upsert returned no row for " + family};
    }
    const int64_t value = stmt.getInt64(0);
    // Finish the statement so the implicit transaction commits
    CFGSTORE_TRY(stmt.step());
    return value;
}

Result<int64_t> SqliteSequenceAllocator::currentOn(Database& db, const std::string& family) {
    CFGSTORE_TRY_UNWRAP(stmt, db.prepare("SELECT seq FROM counters WHERE name = ?"));
    CFGSTORE_TRY(stmt.bind(1, family));
    CFGSTORE_TRY_UNWRAP(hasRow, stmt.step());
    return hasRow ? stmt.getInt64(0) : int64_t{0};
}

Result<void> SqliteSequenceAllocator::advanceOn(Database& db, const std::string& family,
                                                int64_t floor) {
    CFGSTORE_TRY_UNWRAP(stmt, db.prepare("INSERT INTO counters (name, seq) VALUES (?, ?) "
                                         "ON CONFLICT(name) DO UPDATE "
                                         "SET seq = MAX(seq, excluded.seq)"));
    CFGSTORE_TRY(stmt.bindAll(family, floor));
    return stmt.execute();
}

Result<int64_t> SqliteSequenceAllocator::next(const std::string& family) {
    return pool_.withConnection([&](Database& db) { return nextOn(db, family); });
}

Result<int64_t> SqliteSequenceAllocator::current(const std::string& family) {
    return pool_.withConnection([&](Database& db) { return currentOn(db, family); });
}

Result<void> SqliteSequenceAllocator::advanceTo(const std::string& family, int64_t floor) {
    return pool_.withConnection([&](Database& db) { return advanceOn(db, family, floor); });
}

} // namespace cfgstore::sqlite
