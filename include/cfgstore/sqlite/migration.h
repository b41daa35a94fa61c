#pragma once

#include <cfgstore/sqlite/database.h>
#include <cfgstore/store/schema_manager.h>

#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace cfgstore::sqlite {

/**
 * @brief Database migration definition
 */
struct Migration {
    int version = 0;   ///< Migration version number
    std::string name;  ///< Human-readable name
    std::string upSQL; ///< SQL to apply migration

    /// Re-keys or drops existing structures; takes a backup and is validated
    bool destructive = false;

    /**
     * @brief Custom migration function (for complex migrations)
     */
    std::function<Result<void>(Database&)> upFunc;

    /**
     * @brief Structural check: true when the step's result is already in place
     */
    std::function<Result<bool>(Database&)> detect;
};

/**
 * @brief Database migration manager
 *
 * History lives in `schema_migrations`; the highest successful version is
 * the schema generation marker.
 */
class MigrationManager {
public:
    /// Snapshot before a destructive step; returns the artifact path or empty when skipped
    using BackupHook = std::function<Result<std::filesystem::path>(const Migration&)>;
    using ValidateHook = std::function<Result<void>(Database&)>;

    explicit MigrationManager(Database& db);

    /**
     * @brief Initialize migration system (create tables)
     */
    Result<void> initialize();

    void registerMigration(Migration migration);
    void registerMigrations(std::vector<Migration> migrations);

    /**
     * @brief Get current schema version
     */
    Result<int> getCurrentVersion();

    int getLatestVersion() const;

    /**
     * @brief Apply all pending migrations
     *
     * Steps whose detect() reports the structure in place are only recorded.
     * Destructive steps back up first and run the validate hook inside the
     * same transaction as their transform, so a failed validation leaves the
     * database untouched.
     */
    Result<std::vector<store::MigrationStepReport>> migrate();

    void setBackupHook(BackupHook hook) { backupHook_ = std::move(hook); }
    void setValidateHook(ValidateHook hook) { validateHook_ = std::move(hook); }

private:
    Database& db_;
    std::map<int, Migration> migrations_;
    BackupHook backupHook_;
    ValidateHook validateHook_;

    Result<void> applyMigration(const Migration& migration);

    Result<void> recordMigration(int version, const std::string& name,
                                 std::chrono::milliseconds duration, bool success,
                                 const std::string& error = "");

    Result<void> createMigrationTables();
};

} // namespace cfgstore::sqlite
