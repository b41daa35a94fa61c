#include <spdlog/spdlog.h>
#include <algorithm>
#include <system_error>
#include <cfgstore/core/result_helpers.h>
#include <cfgstore/sqlite/sqlite_schema_manager.h>
#include <cfgstore/sqlite/sqlite_sequence_allocator.h>
#include <cfgstore/store/records.h>

namespace cfgstore::sqlite {

using store::IdRemap;
using store::LegacyAIModelRow;
using store::LegacyExchangeRow;
using store::LegacyTraderRefRow;

namespace {

constexpr const char* kBaseSchemaSql = R"(
    CREATE TABLE IF NOT EXISTS users (
        id TEXT PRIMARY KEY,
        email TEXT UNIQUE NOT NULL,
        password_hash TEXT NOT NULL DEFAULT '',
        otp_secret TEXT NOT NULL DEFAULT '',
        otp_verified INTEGER NOT NULL DEFAULT 0,
        created_at INTEGER NOT NULL DEFAULT 0,
        updated_at INTEGER NOT NULL DEFAULT 0
    );

    CREATE TABLE IF NOT EXISTS ai_models (
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

    CREATE TABLE IF NOT EXISTS exchanges (
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

    CREATE TABLE IF NOT EXISTS traders (
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

    CREATE TABLE IF NOT EXISTS user_signal_sources (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        user_id TEXT NOT NULL UNIQUE,
        coin_pool_url TEXT NOT NULL DEFAULT '',
        oi_top_url TEXT NOT NULL DEFAULT '',
        created_at INTEGER NOT NULL DEFAULT 0,
        updated_at INTEGER NOT NULL DEFAULT 0
    );

    CREATE TABLE IF NOT EXISTS system_config (
        key TEXT PRIMARY KEY,
        value TEXT NOT NULL DEFAULT '',
        updated_at INTEGER NOT NULL DEFAULT 0
    );

    CREATE TABLE IF NOT EXISTS beta_codes (
        code TEXT PRIMARY KEY,
        used INTEGER NOT NULL DEFAULT 0,
        used_by TEXT NOT NULL DEFAULT '',
        used_at INTEGER,
        created_at INTEGER NOT NULL DEFAULT 0
    );
)";

struct ColumnAddition {
    const char* table;
    const char* column;
    const char* declaration;
};

constexpr ColumnAddition kAdditiveColumns[] = {
    {"ai_models", "custom_model_name", "TEXT NOT NULL DEFAULT ''"},
    {"exchanges", "hyperliquid_wallet_addr", "TEXT NOT NULL DEFAULT ''"},
    {"exchanges", "aster_user", "TEXT NOT NULL DEFAULT ''"},
    {"exchanges", "aster_signer", "TEXT NOT NULL DEFAULT ''"},
    {"exchanges", "aster_private_key", "TEXT NOT NULL DEFAULT ''"},
    {"traders", "btc_eth_leverage", "INTEGER NOT NULL DEFAULT 0"},
    {"traders", "altcoin_leverage", "INTEGER NOT NULL DEFAULT 0"},
    {"traders", "trading_symbols", "TEXT NOT NULL DEFAULT ''"},
    {"traders", "system_prompt_template", "TEXT NOT NULL DEFAULT ''"},
    {"traders", "taker_fee_rate", "REAL NOT NULL DEFAULT 0"},
    {"traders", "maker_fee_rate", "REAL NOT NULL DEFAULT 0"},
    {"traders", "order_strategy", "TEXT NOT NULL DEFAULT ''"},
    {"traders", "limit_price_offset", "REAL NOT NULL DEFAULT 0"},
    {"traders", "limit_timeout_seconds", "INTEGER NOT NULL DEFAULT 0"},
    {"traders", "timeframes", "TEXT NOT NULL DEFAULT ''"},
};

constexpr const char* kAIModelsV3Sql = R"(
    CREATE TABLE ai_models_new (
        id INTEGER PRIMARY KEY,
        model_id TEXT NOT NULL,
        user_id TEXT NOT NULL DEFAULT 'default',
        display_name TEXT NOT NULL DEFAULT '',
        name TEXT NOT NULL DEFAULT '',
        provider TEXT NOT NULL DEFAULT '',
        enabled INTEGER NOT NULL DEFAULT 0,
        api_key TEXT NOT NULL DEFAULT '',
        custom_api_url TEXT NOT NULL DEFAULT '',
        custom_model_name TEXT NOT NULL DEFAULT '',
        created_at INTEGER NOT NULL DEFAULT 0,
        updated_at INTEGER NOT NULL DEFAULT 0
    )
)";

constexpr const char* kExchangesV3Sql = R"(
    CREATE TABLE exchanges_new (
        id INTEGER PRIMARY KEY,
        exchange_id TEXT NOT NULL,
        user_id TEXT NOT NULL DEFAULT 'default',
        display_name TEXT NOT NULL DEFAULT '',
        name TEXT NOT NULL DEFAULT '',
        type TEXT NOT NULL DEFAULT '',
        enabled INTEGER NOT NULL DEFAULT 0,
        api_key TEXT NOT NULL DEFAULT '',
        secret_key TEXT NOT NULL DEFAULT '',
        testnet INTEGER NOT NULL DEFAULT 0,
        hyperliquid_wallet_addr TEXT NOT NULL DEFAULT '',
        aster_user TEXT NOT NULL DEFAULT '',
        aster_signer TEXT NOT NULL DEFAULT '',
        aster_private_key TEXT NOT NULL DEFAULT '',
        created_at INTEGER NOT NULL DEFAULT 0,
        updated_at INTEGER NOT NULL DEFAULT 0
    )
)";

constexpr const char* kTradersV3Sql = R"(
    CREATE TABLE traders_new (
        id TEXT PRIMARY KEY,
        user_id TEXT NOT NULL DEFAULT 'default',
        name TEXT NOT NULL,
        ai_model_id INTEGER NOT NULL DEFAULT 0,
        exchange_id INTEGER NOT NULL DEFAULT 0,
        initial_balance REAL NOT NULL DEFAULT 0,
        scan_interval_minutes INTEGER NOT NULL DEFAULT 3,
        is_running INTEGER NOT NULL DEFAULT 0,
        btc_eth_leverage INTEGER NOT NULL DEFAULT 0,
        altcoin_leverage INTEGER NOT NULL DEFAULT 0,
        trading_symbols TEXT NOT NULL DEFAULT '',
        use_coin_pool INTEGER NOT NULL DEFAULT 0,
        use_oi_top INTEGER NOT NULL DEFAULT 0,
        custom_prompt TEXT NOT NULL DEFAULT '',
        override_base_prompt INTEGER NOT NULL DEFAULT 0,
        system_prompt_template TEXT NOT NULL DEFAULT '',
        is_cross_margin INTEGER NOT NULL DEFAULT 1,
        taker_fee_rate REAL NOT NULL DEFAULT 0,
        maker_fee_rate REAL NOT NULL DEFAULT 0,
        order_strategy TEXT NOT NULL DEFAULT '',
        limit_price_offset REAL NOT NULL DEFAULT 0,
        limit_timeout_seconds INTEGER NOT NULL DEFAULT 0,
        timeframes TEXT NOT NULL DEFAULT '',
        created_at INTEGER NOT NULL DEFAULT 0,
        updated_at INTEGER NOT NULL DEFAULT 0
    )
)";

constexpr const char* kV3IndexesSql = R"(
    CREATE UNIQUE INDEX IF NOT EXISTS idx_ai_models_model_user ON ai_models(model_id, user_id);
    CREATE UNIQUE INDEX IF NOT EXISTS idx_exchanges_exchange_user ON exchanges(exchange_id, user_id);
    CREATE INDEX IF NOT EXISTS idx_traders_user ON traders(user_id);
)";

constexpr const char* kDecisionLogsSql = R"(
    CREATE TABLE IF NOT EXISTS decision_logs (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        user_id TEXT NOT NULL,
        trader_id TEXT NOT NULL,
        record TEXT NOT NULL,
        created_at INTEGER NOT NULL DEFAULT 0
    );
    CREATE INDEX IF NOT EXISTS idx_decision_logs_trader
        ON decision_logs(user_id, trader_id, created_at);
)";

const std::vector<std::string> kRequiredAIModelColumns = {
    "id", "model_id", "user_id", "name", "provider", "enabled", "api_key"};
const std::vector<std::string> kRequiredExchangeColumns = {
    "id", "exchange_id", "user_id", "name", "type", "enabled", "api_key", "secret_key"};
const std::vector<std::string> kRequiredTraderColumns = {
    "id", "user_id", "name", "ai_model_id", "exchange_id", "initial_balance", "is_running"};

Result<bool> allTablesExist(Database& db) {
    for (const char* table :
         {store::family::kUsers, store::family::kAIModels, store::family::kExchanges,
          store::family::kTraders, store::family::kSignalSources, store::family::kSystemConfig,
          store::family::kBetaCodes}) {
        CFGSTORE_TRY_UNWRAP(exists, db.tableExists(table));
        if (!exists)
            return false;
    }
    return true;
}

Result<bool> additiveColumnsPresent(Database& db) {
    CFGSTORE_TRY_UNWRAP(hasCounters, db.tableExists(store::family::kCounters));
    if (!hasCounters)
        return false;
    for (const auto& addition : kAdditiveColumns) {
        CFGSTORE_TRY_UNWRAP(present, db.columnExists(addition.table, addition.column));
        if (!present)
            return false;
    }
    return true;
}

Result<void> addAdditiveColumns(Database& db) {
    for (const auto& addition : kAdditiveColumns) {
        CFGSTORE_TRY_UNWRAP(present, db.columnExists(addition.table, addition.column));
        if (present)
            continue;
        CFGSTORE_TRY(db.execute(std::string("ALTER TABLE ") + addition.table + " ADD COLUMN " +
                                addition.column + " " + addition.declaration));
        spdlog::debug("Added column {}.{}", addition.table, addition.column);
    }
    return SqliteSequenceAllocator::createTable(db);
}

Result<bool> integerIdsPresent(Database& db) {
    CFGSTORE_TRY_UNWRAP(hasModelId, db.columnExists("ai_models", "model_id"));
    CFGSTORE_TRY_UNWRAP(hasExchangeId, db.columnExists("exchanges", "exchange_id"));
    return hasModelId && hasExchangeId;
}

Result<int64_t> countRows(Database& db, const std::string& sql) {
    CFGSTORE_TRY_UNWRAP(stmt, db.prepare(sql));
    CFGSTORE_TRY_UNWRAP(hasRow, stmt.step());
    return hasRow ? stmt.getInt64(0) : int64_t{0};
}

Result<bool> decisionLogsPresent(Database& db) {
    return db.tableExists(store::family::kDecisionLogs);
}

// Counters created next to an already re-keyed layout would start at 0
Result<void> floorCounters(Database& db) {
    CFGSTORE_TRY_UNWRAP(hasCounters, db.tableExists(store::family::kCounters));
    CFGSTORE_TRY_UNWRAP(integerIds, integerIdsPresent(db));
    if (!hasCounters || !integerIds)
        return {};
    for (const char* familyName : {store::family::kAIModels, store::family::kExchanges}) {
        CFGSTORE_TRY_UNWRAP(maxId, countRows(db, std::string("SELECT COALESCE(MAX(id), 0) FROM ") +
                                                     familyName));
        if (maxId > 0) {
            CFGSTORE_TRY(SqliteSequenceAllocator::advanceOn(db, familyName, maxId));
        }
    }
    return {};
}

Result<std::vector<LegacyAIModelRow>> readLegacyAIModels(Database& db) {
    CFGSTORE_TRY_UNWRAP(stmt, db.prepare("SELECT id, user_id, name, provider, enabled, api_key, "
                                         "custom_api_url, custom_model_name, created_at, "
                                         "updated_at FROM ai_models ORDER BY created_at, rowid"));
    std::vector<LegacyAIModelRow> rows;
    while (true) {
        CFGSTORE_TRY_UNWRAP(hasRow, stmt.step());
        if (!hasRow)
            break;
        LegacyAIModelRow row;
        row.id = stmt.getString(0);
        row.userId = stmt.getString(1);
        row.name = stmt.getString(2);
        row.provider = stmt.getString(3);
        row.enabled = stmt.getBool(4);
        row.apiKey = stmt.getString(5);
        row.customApiUrl = stmt.getString(6);
        row.customModelName = stmt.getString(7);
        row.createdAt = stmt.getInt64(8);
        row.updatedAt = stmt.getInt64(9);
        rows.push_back(std::move(row));
    }
    return rows;
}

Result<std::vector<LegacyExchangeRow>> readLegacyExchanges(Database& db) {
    CFGSTORE_TRY_UNWRAP(stmt,
                        db.prepare("SELECT id, user_id, name, type, enabled, api_key, secret_key, "
                                   "testnet, hyperliquid_wallet_addr, aster_user, aster_signer, "
                                   "aster_private_key, created_at, updated_at FROM exchanges "
                                   "ORDER BY created_at, rowid"));
    std::vector<LegacyExchangeRow> rows;
    while (true) {
        CFGSTORE_TRY_UNWRAP(hasRow, stmt.step());
        if (!hasRow)
            break;
        LegacyExchangeRow row;
        row.id = stmt.getString(0);
        row.userId = stmt.getString(1);
        row.name = stmt.getString(2);
        row.type = stmt.getString(3);
        row.enabled = stmt.getBool(4);
        row.apiKey = stmt.getString(5);
        row.secretKey = stmt.getString(6);
        row.testnet = stmt.getBool(7);
        row.hyperliquidWalletAddr = stmt.getString(8);
        row.asterUser = stmt.getString(9);
        row.asterSigner = stmt.getString(10);
        row.asterPrivateKey = stmt.getString(11);
        row.createdAt = stmt.getInt64(12);
        row.updatedAt = stmt.getInt64(13);
        rows.push_back(std::move(row));
    }
    return rows;
}

Result<std::vector<LegacyTraderRefRow>> readLegacyTraderRefs(Database& db) {
    CFGSTORE_TRY_UNWRAP(stmt, db.prepare("SELECT id, user_id, CAST(ai_model_id AS TEXT), "
                                         "CAST(exchange_id AS TEXT) FROM traders"));
    std::vector<LegacyTraderRefRow> rows;
    while (true) {
        CFGSTORE_TRY_UNWRAP(hasRow, stmt.step());
        if (!hasRow)
            break;
        rows.push_back({stmt.getString(0), stmt.getString(1), stmt.getString(2),
                        stmt.getString(3)});
    }
    return rows;
}

Result<IdRemap> copyAIModels(Database& db, const std::vector<LegacyAIModelRow>& rows) {
    CFGSTORE_TRY(db.execute(kAIModelsV3Sql));
    CFGSTORE_TRY_UNWRAP(stmt,
                        db.prepare("INSERT INTO ai_models_new (id, model_id, user_id, "
                                   "display_name, name, provider, enabled, api_key, "
                                   "custom_api_url, custom_model_name, created_at, updated_at) "
                                   "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)"));
    IdRemap remap;
    for (const auto& row : rows) {
        CFGSTORE_TRY_UNWRAP(newId, SqliteSequenceAllocator::nextOn(db, store::family::kAIModels));
        CFGSTORE_TRY(stmt.reset());
        CFGSTORE_TRY(stmt.clearBindings());
        CFGSTORE_TRY(stmt.bindAll(newId, row.id, row.userId, row.name, row.name, row.provider,
                                  row.enabled, row.apiKey, row.customApiUrl, row.customModelName,
                                  row.createdAt, row.updatedAt));
        CFGSTORE_TRY(stmt.execute());
        remap.add(row.userId, row.id, newId);
    }
    return remap;
}

Result<IdRemap> copyExchanges(Database& db, const std::vector<LegacyExchangeRow>& rows) {
    CFGSTORE_TRY(db.execute(kExchangesV3Sql));
    CFGSTORE_TRY_UNWRAP(
        stmt, db.prepare("INSERT INTO exchanges_new (id, exchange_id, user_id, display_name, "
                         "name, type, enabled, api_key, secret_key, testnet, "
                         "hyperliquid_wallet_addr, aster_user, aster_signer, aster_private_key, "
                         "created_at, updated_at) "
                         "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)"));
    IdRemap remap;
    for (const auto& row : rows) {
        CFGSTORE_TRY_UNWRAP(newId, SqliteSequenceAllocator::nextOn(db, store::family::kExchanges));
        CFGSTORE_TRY(stmt.reset());
        CFGSTORE_TRY(stmt.clearBindings());
        CFGSTORE_TRY(stmt.bindAll(newId, row.id, row.userId, row.name, row.name, row.type,
                                  row.enabled, row.apiKey, row.secretKey, row.testnet,
                                  row.hyperliquidWalletAddr, row.asterUser, row.asterSigner,
                                  row.asterPrivateKey, row.createdAt, row.updatedAt));
        CFGSTORE_TRY(stmt.execute());
        remap.add(row.userId, row.id, newId);
    }
    return remap;
}

Result<void> copyTraders(Database& db, const IdRemap& models, const IdRemap& exchanges) {
    CFGSTORE_TRY_UNWRAP(refs, readLegacyTraderRefs(db));
    CFGSTORE_TRY(db.execute(kTradersV3Sql));

    // Copy every column both shapes share except the references being re-keyed
    CFGSTORE_TRY_UNWRAP(oldColumns, db.tableColumns("traders"));
    CFGSTORE_TRY_UNWRAP(newColumns, db.tableColumns("traders_new"));
    std::string columnList;
    for (const auto& column : oldColumns) {
        if (column == "ai_model_id" || column == "exchange_id")
            continue;
        if (std::find(newColumns.begin(), newColumns.end(), column) == newColumns.end())
            continue;
        if (!columnList.empty())
            columnList += ", ";
        columnList += column;
    }
    CFGSTORE_TRY(db.execute("INSERT INTO traders_new (" + columnList + ") SELECT " + columnList +
                            " FROM traders"));

    CFGSTORE_TRY_UNWRAP(update, db.prepare("UPDATE traders_new SET ai_model_id = ?, "
                                           "exchange_id = ? WHERE id = ?"));
    int unresolved = 0;
    for (const auto& ref : refs) {
        const int64_t modelId = models.resolve(ref.userId, ref.aiModelId);
        const int64_t exchangeId = exchanges.resolve(ref.userId, ref.exchangeId);
        if (modelId == 0 || exchangeId == 0) {
            ++unresolved;
        }
        CFGSTORE_TRY(update.reset());
        CFGSTORE_TRY(update.clearBindings());
        CFGSTORE_TRY(update.bindAll(modelId, exchangeId, ref.traderId));
        CFGSTORE_TRY(update.execute());
    }
    if (unresolved > 0) {
        spdlog::warn("{} trader(s) reference an AI model or exchange that does not exist",
                     unresolved);
    }
    return {};
}

Result<void> migrateToIntegerIds(Database& db) {
    CFGSTORE_TRY_UNWRAP(models, readLegacyAIModels(db));
    CFGSTORE_TRY_UNWRAP(exchanges, readLegacyExchanges(db));

    CFGSTORE_TRY_UNWRAP(modelRemap, copyAIModels(db, models));
    CFGSTORE_TRY_UNWRAP(exchangeRemap, copyExchanges(db, exchanges));
    CFGSTORE_TRY(copyTraders(db, modelRemap, exchangeRemap));

    CFGSTORE_TRY(db.execute("DROP TABLE ai_models; ALTER TABLE ai_models_new RENAME TO ai_models;"
                            "DROP TABLE exchanges; ALTER TABLE exchanges_new RENAME TO exchanges;"
                            "DROP TABLE traders; ALTER TABLE traders_new RENAME TO traders;"));
    CFGSTORE_TRY(db.execute(kV3IndexesSql));

    spdlog::info("Re-keyed {} AI model(s) and {} exchange(s) to integer ids", modelRemap.size(),
                 exchangeRemap.size());
    return {};
}

Result<void> checkColumns(Database& db, const std::string& table,
                          const std::vector<std::string>& required,
                          std::vector<std::string>& missing) {
    CFGSTORE_TRY_UNWRAP(columns, db.tableColumns(table));
    for (const auto& column : required) {
        if (std::find(columns.begin(), columns.end(), column) == columns.end()) {
            missing.push_back(table + "." + column);
        }
    }
    return {};
}

} // namespace

SqliteSchemaManager::SqliteSchemaManager(ConnectionPool& pool, std::filesystem::path backupDir,
                                         bool backupBeforeMigrate)
    : pool_(pool), backupDir_(std::move(backupDir)), backupBeforeMigrate_(backupBeforeMigrate) {}

std::vector<Migration> SqliteSchemaManager::migrations() {
    std::vector<Migration> steps;

    Migration base;
    base.version = 1;
    base.name = "base_schema";
    base.upSQL = kBaseSchemaSql;
    base.detect = allTablesExist;
    steps.push_back(std::move(base));

    Migration additive;
    additive.version = 2;
    additive.name = "additive_columns";
    additive.upFunc = addAdditiveColumns;
    additive.detect = additiveColumnsPresent;
    steps.push_back(std::move(additive));

    Migration integerIds;
    integerIds.version = 3;
    integerIds.name = "integer_record_ids";
    integerIds.destructive = true;
    integerIds.upFunc = migrateToIntegerIds;
    integerIds.detect = integerIdsPresent;
    steps.push_back(std::move(integerIds));

    Migration decisionLogs;
    decisionLogs.version = 4;
    decisionLogs.name = "decision_logs";
    decisionLogs.upSQL = kDecisionLogsSql;
    decisionLogs.detect = decisionLogsPresent;
    steps.push_back(std::move(decisionLogs));

    return steps;
}

Result<void> SqliteSchemaManager::ensureSchema() {
    return pool_.withConnection([this](Database& db) -> Result<void> {
        MigrationManager manager(db);
        CFGSTORE_TRY(manager.initialize());
        manager.registerMigrations(migrations());

        CFGSTORE_TRY_UNWRAP(stored, manager.getCurrentVersion());
        generation_.store(stored);

        manager.setBackupHook(
            [this, &db](const Migration& migration) { return backupBefore(db, migration); });
        manager.setValidateHook([](Database& conn) -> Result<void> {
            CFGSTORE_TRY_UNWRAP(report, collectIntegrity(conn));
            return report.toResult();
        });

        auto steps = manager.migrate();
        if (!steps) {
            return steps.error();
        }
        lastRun_ = std::move(steps).value();
        generation_.store(manager.getLatestVersion());
        return floorCounters(db);
    });
}

Result<void> SqliteSchemaManager::validate() {
    return pool_.withConnection([](Database& db) -> Result<void> {
        CFGSTORE_TRY_UNWRAP(report, collectIntegrity(db));
        return report.toResult();
    });
}

Result<store::IntegrityReport> SqliteSchemaManager::collectIntegrity(Database& db) {
    store::IntegrityReport report;

    CFGSTORE_TRY(checkColumns(db, "ai_models", kRequiredAIModelColumns, report.missingFields));
    CFGSTORE_TRY(checkColumns(db, "exchanges", kRequiredExchangeColumns, report.missingFields));
    CFGSTORE_TRY(checkColumns(db, "traders", kRequiredTraderColumns, report.missingFields));
    if (!report.missingFields.empty()) {
        return report;
    }

    CFGSTORE_TRY_UNWRAP(traders, countRows(db, "SELECT COUNT(*) FROM traders"));
    CFGSTORE_TRY_UNWRAP(aiModels, countRows(db, "SELECT COUNT(*) FROM ai_models"));
    CFGSTORE_TRY_UNWRAP(exchanges, countRows(db, "SELECT COUNT(*) FROM exchanges"));
    CFGSTORE_TRY_UNWRAP(orphanModels,
                        countRows(db, "SELECT COUNT(*) FROM traders t WHERE NOT EXISTS "
                                      "(SELECT 1 FROM ai_models a WHERE a.id = t.ai_model_id)"));
    CFGSTORE_TRY_UNWRAP(orphanExchanges,
                        countRows(db, "SELECT COUNT(*) FROM traders t WHERE NOT EXISTS "
                                      "(SELECT 1 FROM exchanges e WHERE e.id = t.exchange_id)"));

    report.traders = traders;
    report.aiModels = aiModels;
    report.exchanges = exchanges;
    report.orphanedAIModelRefs = orphanModels;
    report.orphanedExchangeRefs = orphanExchanges;
    return report;
}

Result<std::filesystem::path> SqliteSchemaManager::backupBefore(Database& db,
                                                               const Migration& migration) {
    if (!backupBeforeMigrate_) {
        return std::filesystem::path{};
    }

    CFGSTORE_TRY_UNWRAP(rows, countRows(db, "SELECT (SELECT COUNT(*) FROM ai_models) + "
                                            "(SELECT COUNT(*) FROM exchanges) + "
                                            "(SELECT COUNT(*) FROM traders)"));
    if (rows == 0) {
        spdlog::debug("Nothing to back up before migration {}", migration.version);
        return std::filesystem::path{};
    }

    std::error_code ec;
    std::filesystem::create_directories(backupDir_, ec);
    if (ec) {
        return Error{ErrorCode::WriteError,
                     "Failed to create backup directory " + backupDir_.string() + ": " +
                         ec.message()};
    }

    const auto stem = std::filesystem::path(pool_.path()).filename().string();
    auto target = store::backupArtifactPath(backupDir_, stem, migration.name, "");
    CFGSTORE_TRY(db.backupTo(target.string()));
    spdlog::info("Backed up database to {} before migration {}", target.string(),
                 migration.version);
    return target;
}

} // namespace cfgstore::sqlite
