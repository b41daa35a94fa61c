#pragma once

#include <cfgstore/sqlite/connection_pool.h>
#include <cfgstore/sqlite/migration.h>
#include <cfgstore/store/legacy_rows.h>
#include <cfgstore/store/schema_manager.h>

#include <atomic>
#include <filesystem>
#include <string>
#include <vector>

namespace cfgstore::sqlite {

/**
 * @brief Schema generations of the SQLite backend
 *
 * 1 base tables, 2 additive columns and counters, 3 integer ids for AI models
 * and exchanges with trader references remapped, 4 the decision log table.
 *
 * After every run the AI model and exchange counters are raised to at least
 * the highest stored id.
 */
class SqliteSchemaManager : public store::SchemaManager {
public:
    static constexpr int kTargetGeneration = 4;

    SqliteSchemaManager(ConnectionPool& pool, std::filesystem::path backupDir,
                        bool backupBeforeMigrate);

    Result<void> ensureSchema() override;
    Result<void> validate() override;

    int currentGeneration() const override { return generation_.load(); }
    int targetGeneration() const override { return kTargetGeneration; }
    const std::vector<store::MigrationStepReport>& lastRun() const override { return lastRun_; }

    /// Ordered migration steps
    static std::vector<Migration> migrations();

    static Result<store::IntegrityReport> collectIntegrity(Database& db);

private:
    ConnectionPool& pool_;
    std::filesystem::path backupDir_;
    bool backupBeforeMigrate_;
    std::atomic<int> generation_{0};
    std::vector<store::MigrationStepReport> lastRun_;

    Result<std::filesystem::path> backupBefore(Database& db, const Migration& migration);
};

} // namespace cfgstore::sqlite
