#include <spdlog/spdlog.h>
#include <cfgstore/sqlite/migration.h>

namespace cfgstore::sqlite {

MigrationManager::MigrationManager(Database& db) : db_(db) {}

Result<void> MigrationManager::initialize() {
    return createMigrationTables();
}

void MigrationManager::registerMigration(Migration migration) {
    migrations_[migration.version] = std::move(migration);
}

void MigrationManager::registerMigrations(std::vector<Migration> migrations) {
    for (auto& migration : migrations) {
        registerMigration(std::move(migration));
    }
}

Result<int> MigrationManager::getCurrentVersion() {
    auto stmtResult = db_.prepare("SELECT MAX(version) FROM schema_migrations WHERE success = 1");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();

    if (stepResult.value() && !stmt.isNull(0)) {
        return stmt.getInt(0);
    }

    return 0; // No migrations applied yet
}

int MigrationManager::getLatestVersion() const {
    if (migrations_.empty())
        return 0;
    return migrations_.rbegin()->first;
}

Result<std::vector<store::MigrationStepReport>> MigrationManager::migrate() {
    auto currentResult = getCurrentVersion();
    if (!currentResult)
        return currentResult.error();

    const int currentVersion = currentResult.value();
    const int targetVersion = getLatestVersion();
    std::vector<store::MigrationStepReport> reports;

    if (currentVersion >= targetVersion) {
        spdlog::debug("Schema already at version {}", currentVersion);
        return reports;
    }

    int totalMigrations = 0;
    for (const auto& [version, _] : migrations_) {
        if (version > currentVersion)
            totalMigrations++;
    }

    int applied = 0;
    bool healed = false;
    for (const auto& [version, migration] : migrations_) {
        if (version <= currentVersion)
            continue;

        ++applied;

        store::MigrationStepReport report;
        report.version = version;
        report.name = migration.name;
        report.destructive = migration.destructive;

        auto start = std::chrono::steady_clock::now();

        bool present = false;
        if (migration.detect) {
            auto detected = migration.detect(db_);
            if (!detected) {
                return Error{ErrorCode::SchemaError, "Failed to inspect schema for migration " +
                                                         std::to_string(version) + ": " +
                                                         detected.error().message};
            }
            present = detected.value();
        }

        if (present) {
            spdlog::info("Migration {} '{}' already in place, recording marker", version,
                         migration.name);
            report.alreadyPresent = true;
            healed = true;
        } else {
            spdlog::info("Applying migration {} '{}' ({}/{})", version, migration.name, applied,
                         totalMigrations);

            if (migration.destructive && backupHook_) {
                auto backup = backupHook_(migration);
                if (!backup) {
                    spdlog::warn("Backup before migration {} failed, continuing: {}", version,
                                 backup.error().message);
                } else {
                    report.backupPath = backup.value();
                }
            }

            auto result = applyMigration(migration);
            if (!result) {
                auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - start);
                auto recordResult =
                    recordMigration(version, migration.name, duration, false, result.error().message);
                if (!recordResult) {
                    spdlog::warn("Failed to record migration failure: {}",
                                 recordResult.error().message);
                }
                if (result.error().code == ErrorCode::IntegrityError) {
                    return result.error();
                }
                return Error{ErrorCode::SchemaError, "Migration " + std::to_string(version) +
                                                         " '" + migration.name +
                                                         "' failed: " + result.error().message};
            }
        }

        report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        auto recordResult = recordMigration(version, migration.name, report.duration, true);
        if (!recordResult)
            return Error{ErrorCode::SchemaError, recordResult.error().message};

        reports.push_back(std::move(report));
    }

    // A healed store skipped the in-transaction validation of its destructive steps
    if (healed && validateHook_) {
        auto valid = validateHook_(db_);
        if (!valid)
            return valid.error();
    }

    spdlog::info("Schema migrated from version {} to {}", currentVersion, targetVersion);
    return reports;
}

Result<void> MigrationManager::applyMigration(const Migration& migration) {
    return db_.transaction([&]() -> Result<void> {
        Result<void> result;
        if (migration.upFunc) {
            result = migration.upFunc(db_);
        } else if (!migration.upSQL.empty()) {
            result = db_.execute(migration.upSQL);
        } else {
            return Error{ErrorCode::InvalidData, "Migration has no up function or SQL"};
        }
        if (!result)
            return result;

        if (migration.destructive && validateHook_) {
            return validateHook_(db_);
        }
        return {};
    });
}

Result<void> MigrationManager::recordMigration(int version, const std::string& name,
                                               std::chrono::milliseconds duration, bool success,
                                               const std::string& error) {
    auto stmtResult = db_.prepare("INSERT OR REPLACE INTO schema_migrations "
                                  "(version, name, applied_at, duration_ms, success, error) "
                                  "VALUES (?, ?, ?, ?, ?, ?)");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bindAll(version, name, std::chrono::system_clock::now(),
                                   static_cast<int64_t>(duration.count()), success, error);
    if (!bindResult)
        return bindResult;

    return stmt.execute();
}

Result<void> MigrationManager::createMigrationTables() {
    return db_.execute(R"(
        CREATE TABLE IF NOT EXISTS schema_migrations (
            version INTEGER PRIMARY KEY,
            name TEXT NOT NULL,
            applied_at INTEGER NOT NULL,
            duration_ms INTEGER NOT NULL,
            success INTEGER NOT NULL,
            error TEXT
        )
    )");
}

} // namespace cfgstore::sqlite
