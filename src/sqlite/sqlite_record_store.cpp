#include <spdlog/spdlog.h>
#include <algorithm>
#include <system_error>
#include <cfgstore/core/result_helpers.h>
#include <cfgstore/crypto/credential_vault.h>
#include <cfgstore/sqlite/sqlite_record_store.h>
#include <cfgstore/store/catalog.h>

namespace cfgstore::sqlite {

using store::AIModelConfig;
using store::ExchangeConfig;
using store::TraderRecord;
using store::User;

namespace {

constexpr const char* kUserColumns =
    "id, email, password_hash, otp_secret, otp_verified, created_at, updated_at";

constexpr const char* kAIModelColumns =
    "id, model_id, user_id, display_name, name, provider, enabled, api_key, custom_api_url, "
    "custom_model_name, created_at, updated_at";

constexpr const char* kExchangeColumns =
    "id, exchange_id, user_id, display_name, name, type, enabled, api_key, secret_key, testnet, "
    "hyperliquid_wallet_addr, aster_user, aster_signer, aster_private_key, created_at, "
    "updated_at";

constexpr const char* kTraderColumns =
    "id, user_id, name, ai_model_id, exchange_id, initial_balance, scan_interval_minutes, "
    "is_running, btc_eth_leverage, altcoin_leverage, trading_symbols, use_coin_pool, "
    "use_oi_top, custom_prompt, override_base_prompt, system_prompt_template, is_cross_margin, "
    "taker_fee_rate, maker_fee_rate, order_strategy, limit_price_offset, "
    "limit_timeout_seconds, timeframes, created_at, updated_at";

TimePoint now() {
    return std::chrono::system_clock::now();
}

TimePoint orNow(TimePoint tp) {
    return tp == TimePoint{} ? now() : tp;
}

User readUser(const Statement& stmt) {
    User user;
    user.id = stmt.getString(0);
    user.email = stmt.getString(1);
    user.passwordHash = stmt.getString(2);
    user.otpSecret = stmt.getString(3);
    user.otpVerified = stmt.getBool(4);
    user.createdAt = stmt.getTime(5);
    user.updatedAt = stmt.getTime(6);
    return user;
}

AIModelConfig readAIModel(const Statement& stmt, const crypto::CredentialVault& vault) {
    AIModelConfig model;
    model.id = stmt.getInt64(0);
    model.modelId = stmt.getString(1);
    model.userId = stmt.getString(2);
    model.displayName = stmt.getString(3);
    model.name = stmt.getString(4);
    model.provider = stmt.getString(5);
    model.enabled = stmt.getBool(6);
    model.apiKey = vault.decryptFromStorage(stmt.getString(7));
    model.customApiUrl = stmt.getString(8);
    model.customModelName = stmt.getString(9);
    model.createdAt = stmt.getTime(10);
    model.updatedAt = stmt.getTime(11);
    return model;
}

ExchangeConfig readExchange(const Statement& stmt, const crypto::CredentialVault& vault) {
    ExchangeConfig exchange;
    exchange.id = stmt.getInt64(0);
    exchange.exchangeId = stmt.getString(1);
    exchange.userId = stmt.getString(2);
    exchange.displayName = stmt.getString(3);
    exchange.name = stmt.getString(4);
    exchange.type = stmt.getString(5);
    exchange.enabled = stmt.getBool(6);
    exchange.apiKey = vault.decryptFromStorage(stmt.getString(7));
    exchange.secretKey = vault.decryptFromStorage(stmt.getString(8));
    exchange.testnet = stmt.getBool(9);
    exchange.hyperliquidWalletAddr = stmt.getString(10);
    exchange.asterUser = stmt.getString(11);
    exchange.asterSigner = stmt.getString(12);
    exchange.asterPrivateKey = vault.decryptFromStorage(stmt.getString(13));
    exchange.createdAt = stmt.getTime(14);
    exchange.updatedAt = stmt.getTime(15);
    return exchange;
}

TraderRecord readTrader(const Statement& stmt) {
    TraderRecord trader;
    trader.id = stmt.getString(0);
    trader.userId = stmt.getString(1);
    trader.name = stmt.getString(2);
    trader.aiModelId = stmt.getInt64(3);
    trader.exchangeId = stmt.getInt64(4);
    trader.initialBalance = stmt.getDouble(5);
    trader.scanIntervalMinutes = stmt.getInt(6);
    trader.isRunning = stmt.getBool(7);
    trader.btcEthLeverage = stmt.getInt(8);
    trader.altcoinLeverage = stmt.getInt(9);
    trader.tradingSymbols = stmt.getString(10);
    trader.useCoinPool = stmt.getBool(11);
    trader.useOiTop = stmt.getBool(12);
    trader.customPrompt = stmt.getString(13);
    trader.overrideBasePrompt = stmt.getBool(14);
    trader.systemPromptTemplate = stmt.getString(15);
    trader.isCrossMargin = stmt.getBool(16);
    trader.takerFeeRate = stmt.getDouble(17);
    trader.makerFeeRate = stmt.getDouble(18);
    trader.orderStrategy = stmt.getString(19);
    trader.limitPriceOffset = stmt.getDouble(20);
    trader.limitTimeoutSeconds = stmt.getInt(21);
    trader.timeframes = stmt.getString(22);
    trader.createdAt = stmt.getTime(23);
    trader.updatedAt = stmt.getTime(24);
    store::applyTraderDefaults(trader);
    return trader;
}

Result<std::vector<std::string>> readStrings(Statement& stmt) {
    std::vector<std::string> values;
    while (true) {
        CFGSTORE_TRY_UNWRAP(hasRow, stmt.step());
        if (!hasRow)
            break;
        values.push_back(stmt.getString(0));
    }
    return values;
}

} // namespace

Result<std::unique_ptr<SqliteRecordStore>>
SqliteRecordStore::open(const config::StoreConfig& config) {
    if (config.sqlitePath.empty()) {
        return Error{ErrorCode::InvalidArgument, "SQLite path is empty"};
    }

    auto parent = config.sqlitePath.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return Error{ErrorCode::ConnectionFailed,
                         "Cannot create database directory " + parent.string() + ": " +
                             ec.message()};
        }
    }

    ConnectionPoolConfig poolConfig;
    poolConfig.minConnections = config.poolMin;
    poolConfig.maxConnections = config.poolMax;
    poolConfig.busyTimeout = config.operationTimeout;
    poolConfig.acquireTimeout = config.operationTimeout;

    auto pool = std::make_unique<ConnectionPool>(config.sqlitePath.string(), poolConfig);
    auto initResult = pool->initialize();
    if (!initResult) {
        return Error{ErrorCode::ConnectionFailed, "Failed to open " +
                                                      config.sqlitePath.string() + ": " +
                                                      initResult.error().message};
    }

    std::unique_ptr<SqliteRecordStore> recordStore(
        new SqliteRecordStore(std::move(pool), config));

    auto schemaResult = recordStore->schema_->ensureSchema();
    if (!schemaResult) {
        spdlog::error("Schema migration failed for {}: {}", config.sqlitePath.string(),
                      schemaResult.error().message);
        return schemaResult.error();
    }

    store::DefaultDataSeeder seeder(*recordStore);
    auto seedResult = seeder.seedDefaults();
    if (!seedResult) {
        return seedResult.error();
    }

    spdlog::info("Opened SQLite config store {} (schema generation {}, sqlite {})",
                 config.sqlitePath.string(), recordStore->schemaGeneration(),
                 Database::version());
    return recordStore;
}

SqliteRecordStore::SqliteRecordStore(std::unique_ptr<ConnectionPool> pool,
                                     const config::StoreConfig& config)
    : pool_(std::move(pool)), allocator_(std::make_unique<SqliteSequenceAllocator>(*pool_)),
      schema_(std::make_unique<SqliteSchemaManager>(*pool_, config.effectiveBackupDir(),
                                                    config.backupBeforeMigrate)),
      vault_(std::make_shared<crypto::CredentialVault>()) {}

SqliteRecordStore::~SqliteRecordStore() {
    close();
}

void SqliteRecordStore::close() {
    if (pool_) {
        pool_->shutdown();
    }
}

void SqliteRecordStore::setCredentialVault(std::shared_ptr<const crypto::CredentialVault> vault) {
    std::lock_guard<std::mutex> lock(vaultMutex_);
    vault_ = vault ? std::move(vault) : std::make_shared<crypto::CredentialVault>();
}

std::shared_ptr<const crypto::CredentialVault> SqliteRecordStore::vault() const {
    std::lock_guard<std::mutex> lock(vaultMutex_);
    return vault_;
}

Result<void> SqliteRecordStore::updateOne(Statement& stmt, Database& db, const std::string& what) {
    CFGSTORE_TRY(stmt.execute());
    if (db.changes() == 0) {
        return Error{ErrorCode::NotFound, what + " not found"};
    }
    return {};
}

// Users

Result<void> SqliteRecordStore::createUser(const User& user) {
    return pool_->withConnection([&](Database& db) -> Result<void> {
        CFGSTORE_TRY_UNWRAP(stmt, db.prepare(std::string("INSERT INTO users (") + kUserColumns +
                                             ") VALUES (?, ?, ?, ?, ?, ?, ?)"));
        CFGSTORE_TRY(stmt.bindAll(user.id, user.email, user.passwordHash, user.otpSecret,
                                  user.otpVerified, orNow(user.createdAt),
                                  orNow(user.updatedAt)));
        auto result = stmt.execute();
        if (!result && result.error().code == ErrorCode::Duplicate) {
            return Error{ErrorCode::Duplicate, "User already exists: " + user.email};
        }
        return result;
    });
}

Result<User> SqliteRecordStore::getUserByEmail(const std::string& email) {
    return pool_->withConnection([&](Database& db) -> Result<User> {
        CFGSTORE_TRY_UNWRAP(stmt, db.prepare(std::string("SELECT ") + kUserColumns +
                                             " FROM users WHERE email = ?"));
        CFGSTORE_TRY(stmt.bind(1, email));
        CFGSTORE_TRY_UNWRAP(hasRow, stmt.step());
        if (!hasRow) {
            return Error{ErrorCode::NotFound, "User not found: " + email};
        }
        return readUser(stmt);
    });
}

Result<User> SqliteRecordStore::getUserById(const std::string& id) {
    return pool_->withConnection([&](Database& db) -> Result<User> {
        CFGSTORE_TRY_UNWRAP(stmt, db.prepare(std::string("SELECT ") + kUserColumns +
                                             " FROM users WHERE id = ?"));
        CFGSTORE_TRY(stmt.bind(1, id));
        CFGSTORE_TRY_UNWRAP(hasRow, stmt.step());
        if (!hasRow) {
            return Error{ErrorCode::NotFound, "User not found: " + id};
        }
        return readUser(stmt);
    });
}

Result<std::vector<std::string>> SqliteRecordStore::listUserIds() {
    return pool_->withConnection([](Database& db) -> Result<std::vector<std::string>> {
        CFGSTORE_TRY_UNWRAP(stmt, db.prepare("SELECT id FROM users ORDER BY id"));
        return readStrings(stmt);
    });
}

Result<void> SqliteRecordStore::setUserOtpVerified(const std::string& id, bool verified) {
    return pool_->withConnection([&](Database& db) -> Result<void> {
        CFGSTORE_TRY_UNWRAP(
            stmt, db.prepare("UPDATE users SET otp_verified = ?, updated_at = ? WHERE id = ?"));
        CFGSTORE_TRY(stmt.bindAll(verified, now(), id));
        return updateOne(stmt, db, "User " + id);
    });
}

Result<void> SqliteRecordStore::updateUserPassword(const std::string& id,
                                                   const std::string& passwordHash) {
    return pool_->withConnection([&](Database& db) -> Result<void> {
        CFGSTORE_TRY_UNWRAP(
            stmt, db.prepare("UPDATE users SET password_hash = ?, updated_at = ? WHERE id = ?"));
        CFGSTORE_TRY(stmt.bindAll(passwordHash, now(), id));
        return updateOne(stmt, db, "User " + id);
    });
}

// AI models

Result<std::vector<AIModelConfig>> SqliteRecordStore::listAIModels(const std::string& userId) {
    auto v = vault();
    return pool_->withConnection([&](Database& db) -> Result<std::vector<AIModelConfig>> {
        CFGSTORE_TRY_UNWRAP(stmt, db.prepare(std::string("SELECT ") + kAIModelColumns +
                                             " FROM ai_models WHERE user_id = ? ORDER BY id"));
        CFGSTORE_TRY(stmt.bind(1, userId));
        std::vector<AIModelConfig> models;
        while (true) {
            CFGSTORE_TRY_UNWRAP(hasRow, stmt.step());
            if (!hasRow)
                break;
            models.push_back(readAIModel(stmt, *v));
        }
        return models;
    });
}

Result<void> SqliteRecordStore::upsertAIModel(const std::string& userId,
                                              const std::string& modelKey, bool enabled,
                                              const std::string& apiKey,
                                              const std::string& customApiUrl,
                                              const std::string& customModelName) {
    auto v = vault();
    return pool_->withConnection([&](Database& db) -> Result<void> {
        return db.transaction([&]() -> Result<void> {
            RecordId existing = 0;
            {
                CFGSTORE_TRY_UNWRAP(find, db.prepare("SELECT id FROM ai_models "
                                                     "WHERE user_id = ? AND model_id = ?"));
                CFGSTORE_TRY(find.bindAll(userId, modelKey));
                CFGSTORE_TRY_UNWRAP(found, find.step());
                if (found)
                    existing = find.getInt64(0);
            }
            if (existing == 0) {
                CFGSTORE_TRY_UNWRAP(find, db.prepare("SELECT id, model_id FROM ai_models "
                                                     "WHERE user_id = ? AND provider = ? "
                                                     "ORDER BY id LIMIT 1"));
                CFGSTORE_TRY(find.bindAll(userId, modelKey));
                CFGSTORE_TRY_UNWRAP(found, find.step());
                if (found) {
                    existing = find.getInt64(0);
                    spdlog::warn("AI model '{}' of user {} matched by provider (row {})",
                                 modelKey, userId, find.getString(1));
                }
            }

            if (existing != 0) {
                std::string sql = "UPDATE ai_models SET enabled = ?, custom_api_url = ?, "
                                  "custom_model_name = ?, updated_at = ?";
                if (!apiKey.empty())
                    sql += ", api_key = ?";
                sql += " WHERE id = ?";
                CFGSTORE_TRY_UNWRAP(update, db.prepare(sql));
                CFGSTORE_TRY(update.bindAll(enabled, customApiUrl, customModelName, now()));
                int index = 5;
                if (!apiKey.empty()) {
                    CFGSTORE_TRY(update.bind(index++, v->encryptForStorage(apiKey)));
                }
                CFGSTORE_TRY(update.bind(index, existing));
                return update.execute();
            }

            const auto provider = store::catalog::inferProvider(modelKey);
            std::string name;
            {
                CFGSTORE_TRY_UNWRAP(lookup, db.prepare("SELECT name FROM ai_models "
                                                       "WHERE provider = ? ORDER BY id LIMIT 1"));
                CFGSTORE_TRY(lookup.bind(1, provider));
                CFGSTORE_TRY_UNWRAP(found, lookup.step());
                name = found ? lookup.getString(0) : store::catalog::fallbackModelName(provider);
            }

            AIModelConfig model;
            model.modelId = store::catalog::newModelId(userId, modelKey, provider);
            model.userId = userId;
            model.name = name;
            model.provider = provider;
            model.enabled = enabled;
            model.apiKey = v->encryptForStorage(apiKey);
            model.customApiUrl = customApiUrl;
            model.customModelName = customModelName;
            CFGSTORE_TRY_UNWRAP(inserted, insertAIModelOn(db, model));
            if (inserted) {
                spdlog::info("Created AI model {} for user {}", model.modelId, userId);
            }
            return {};
        });
    });
}

Result<void> SqliteRecordStore::createAIModel(const std::string& userId,
                                              const std::string& modelId,
                                              const std::string& name,
                                              const std::string& provider, bool enabled,
                                              const std::string& apiKey,
                                              const std::string& customApiUrl) {
    AIModelConfig model;
    model.modelId = modelId;
    model.userId = userId;
    model.name = name;
    model.provider = provider;
    model.enabled = enabled;
    model.apiKey = vault()->encryptForStorage(apiKey);
    model.customApiUrl = customApiUrl;
    return pool_->withConnection([&](Database& db) -> Result<void> {
        return db.transaction([&]() -> Result<void> {
            CFGSTORE_TRY(insertAIModelOn(db, model));
            return {};
        });
    });
}

Result<bool> SqliteRecordStore::insertAIModelOn(Database& db, const AIModelConfig& model) {
    CFGSTORE_TRY_UNWRAP(find,
                        db.prepare("SELECT 1 FROM ai_models WHERE model_id = ? AND user_id = ?"));
    CFGSTORE_TRY(find.bindAll(model.modelId, model.userId));
    CFGSTORE_TRY_UNWRAP(exists, find.step());
    if (exists) {
        return false;
    }

    CFGSTORE_TRY_UNWRAP(id, SqliteSequenceAllocator::nextOn(db, store::family::kAIModels));
    CFGSTORE_TRY_UNWRAP(stmt, db.prepare(std::string("INSERT INTO ai_models (") +
                                         kAIModelColumns +
                                         ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)"));
    const auto displayName = model.displayName.empty() ? model.name : model.displayName;
    CFGSTORE_TRY(stmt.bindAll(id, model.modelId, model.userId, displayName, model.name,
                              model.provider, model.enabled, model.apiKey, model.customApiUrl,
                              model.customModelName, orNow(model.createdAt),
                              orNow(model.updatedAt)));
    CFGSTORE_TRY(stmt.execute());
    return true;
}

Result<AIModelConfig> SqliteRecordStore::aiModelById(Database& db, RecordId id) {
    CFGSTORE_TRY_UNWRAP(stmt, db.prepare(std::string("SELECT ") + kAIModelColumns +
                                         " FROM ai_models WHERE id = ?"));
    CFGSTORE_TRY(stmt.bind(1, id));
    CFGSTORE_TRY_UNWRAP(hasRow, stmt.step());
    if (!hasRow) {
        return Error{ErrorCode::NotFound, "AI model not found: " + std::to_string(id)};
    }
    return readAIModel(stmt, *vault());
}

// Exchanges

Result<std::vector<ExchangeConfig>> SqliteRecordStore::listExchanges(const std::string& userId) {
    auto v = vault();
    return pool_->withConnection([&](Database& db) -> Result<std::vector<ExchangeConfig>> {
        CFGSTORE_TRY_UNWRAP(stmt, db.prepare(std::string("SELECT ") + kExchangeColumns +
                                             " FROM exchanges WHERE user_id = ? ORDER BY id"));
        CFGSTORE_TRY(stmt.bind(1, userId));
        std::vector<ExchangeConfig> exchanges;
        while (true) {
            CFGSTORE_TRY_UNWRAP(hasRow, stmt.step());
            if (!hasRow)
                break;
            exchanges.push_back(readExchange(stmt, *v));
        }
        return exchanges;
    });
}

Result<void> SqliteRecordStore::upsertExchange(const std::string& userId,
                                               const std::string& exchangeKey,
                                               const store::ExchangeUpdate& update) {
    auto v = vault();
    return pool_->withConnection([&](Database& db) -> Result<void> {
        return db.transaction([&]() -> Result<void> {
            RecordId existing = 0;
            {
                CFGSTORE_TRY_UNWRAP(find, db.prepare("SELECT id FROM exchanges "
                                                     "WHERE exchange_id = ? AND user_id = ?"));
                CFGSTORE_TRY(find.bindAll(exchangeKey, userId));
                CFGSTORE_TRY_UNWRAP(found, find.step());
                if (found)
                    existing = find.getInt64(0);
            }

            if (existing != 0) {
                std::string sql = "UPDATE exchanges SET enabled = ?, testnet = ?, "
                                  "hyperliquid_wallet_addr = ?, aster_user = ?, "
                                  "aster_signer = ?, updated_at = ?";
                std::vector<std::string> secrets;
                if (!update.apiKey.empty()) {
                    sql += ", api_key = ?";
                    secrets.push_back(v->encryptForStorage(update.apiKey));
                }
                if (!update.secretKey.empty()) {
                    sql += ", secret_key = ?";
                    secrets.push_back(v->encryptForStorage(update.secretKey));
                }
                if (!update.asterPrivateKey.empty()) {
                    sql += ", aster_private_key = ?";
                    secrets.push_back(v->encryptForStorage(update.asterPrivateKey));
                }
                sql += " WHERE id = ?";

                CFGSTORE_TRY_UNWRAP(stmt, db.prepare(sql));
                CFGSTORE_TRY(stmt.bindAll(update.enabled, update.testnet,
                                          update.hyperliquidWalletAddr, update.asterUser,
                                          update.asterSigner, now()));
                int index = 7;
                for (const auto& secret : secrets) {
                    CFGSTORE_TRY(stmt.bind(index++, secret));
                }
                CFGSTORE_TRY(stmt.bind(index, existing));
                return stmt.execute();
            }

            const auto descriptor = store::catalog::exchangeDescriptor(exchangeKey);
            ExchangeConfig exchange;
            exchange.exchangeId = exchangeKey;
            exchange.userId = userId;
            exchange.name = descriptor.name;
            exchange.type = descriptor.type;
            exchange.enabled = update.enabled;
            exchange.apiKey = v->encryptForStorage(update.apiKey);
            exchange.secretKey = v->encryptForStorage(update.secretKey);
            exchange.testnet = update.testnet;
            exchange.hyperliquidWalletAddr = update.hyperliquidWalletAddr;
            exchange.asterUser = update.asterUser;
            exchange.asterSigner = update.asterSigner;
            exchange.asterPrivateKey = v->encryptForStorage(update.asterPrivateKey);
            CFGSTORE_TRY_UNWRAP(inserted, insertExchangeOn(db, exchange));
            if (inserted) {
                spdlog::info("Created exchange {} for user {}", exchangeKey, userId);
            }
            return {};
        });
    });
}

Result<void> SqliteRecordStore::createExchange(const std::string& userId,
                                               const std::string& exchangeId,
                                               const std::string& name, const std::string& type,
                                               const store::ExchangeUpdate& fields) {
    auto v = vault();
    ExchangeConfig exchange;
    exchange.exchangeId = exchangeId;
    exchange.userId = userId;
    exchange.name = name;
    exchange.type = type;
    exchange.enabled = fields.enabled;
    exchange.apiKey = v->encryptForStorage(fields.apiKey);
    exchange.secretKey = v->encryptForStorage(fields.secretKey);
    exchange.testnet = fields.testnet;
    exchange.hyperliquidWalletAddr = fields.hyperliquidWalletAddr;
    exchange.asterUser = fields.asterUser;
    exchange.asterSigner = fields.asterSigner;
    exchange.asterPrivateKey = v->encryptForStorage(fields.asterPrivateKey);
    return pool_->withConnection([&](Database& db) -> Result<void> {
        return db.transaction([&]() -> Result<void> {
            CFGSTORE_TRY(insertExchangeOn(db, exchange));
            return {};
        });
    });
}

Result<bool> SqliteRecordStore::insertExchangeOn(Database& db, const ExchangeConfig& exchange) {
    CFGSTORE_TRY_UNWRAP(
        find, db.prepare("SELECT 1 FROM exchanges WHERE exchange_id = ? AND user_id = ?"));
    CFGSTORE_TRY(find.bindAll(exchange.exchangeId, exchange.userId));
    CFGSTORE_TRY_UNWRAP(exists, find.step());
    if (exists) {
        return false;
    }

    CFGSTORE_TRY_UNWRAP(id, SqliteSequenceAllocator::nextOn(db, store::family::kExchanges));
    CFGSTORE_TRY_UNWRAP(stmt,
                        db.prepare(std::string("INSERT INTO exchanges (") + kExchangeColumns +
                                   ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)"));
    const auto displayName = exchange.displayName.empty() ? exchange.name : exchange.displayName;
    CFGSTORE_TRY(stmt.bindAll(id, exchange.exchangeId, exchange.userId, displayName,
                              exchange.name, exchange.type, exchange.enabled, exchange.apiKey,
                              exchange.secretKey, exchange.testnet,
                              exchange.hyperliquidWalletAddr, exchange.asterUser,
                              exchange.asterSigner, exchange.asterPrivateKey,
                              orNow(exchange.createdAt), orNow(exchange.updatedAt)));
    CFGSTORE_TRY(stmt.execute());
    return true;
}

Result<ExchangeConfig> SqliteRecordStore::exchangeById(Database& db, RecordId id) {
    CFGSTORE_TRY_UNWRAP(stmt, db.prepare(std::string("SELECT ") + kExchangeColumns +
                                         " FROM exchanges WHERE id = ?"));
    CFGSTORE_TRY(stmt.bind(1, id));
    CFGSTORE_TRY_UNWRAP(hasRow, stmt.step());
    if (!hasRow) {
        return Error{ErrorCode::NotFound, "Exchange not found: " + std::to_string(id)};
    }
    return readExchange(stmt, *vault());
}

// Traders

Result<void> SqliteRecordStore::createTrader(const TraderRecord& trader) {
    return pool_->withConnection([&](Database& db) -> Result<void> {
        CFGSTORE_TRY_UNWRAP(stmt, db.prepare(std::string("INSERT INTO traders (") +
                                             kTraderColumns +
                                             ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, "
                                             "?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)"));
        CFGSTORE_TRY(stmt.bindAll(
            trader.id, trader.userId, trader.name, trader.aiModelId, trader.exchangeId,
            trader.initialBalance, trader.scanIntervalMinutes, trader.isRunning,
            trader.btcEthLeverage, trader.altcoinLeverage, trader.tradingSymbols,
            trader.useCoinPool, trader.useOiTop, trader.customPrompt, trader.overrideBasePrompt,
            trader.systemPromptTemplate, trader.isCrossMargin, trader.takerFeeRate,
            trader.makerFeeRate, trader.orderStrategy, trader.limitPriceOffset,
            trader.limitTimeoutSeconds, trader.timeframes, orNow(trader.createdAt),
            orNow(trader.updatedAt)));
        auto result = stmt.execute();
        if (!result && result.error().code == ErrorCode::Duplicate) {
            return Error{ErrorCode::Duplicate, "Trader already exists: " + trader.id};
        }
        return result;
    });
}

Result<std::vector<TraderRecord>> SqliteRecordStore::listTraders(const std::string& userId) {
    return pool_->withConnection([&](Database& db) -> Result<std::vector<TraderRecord>> {
        CFGSTORE_TRY_UNWRAP(stmt, db.prepare(std::string("SELECT ") + kTraderColumns +
                                             " FROM traders WHERE user_id = ? "
                                             "ORDER BY created_at DESC, rowid DESC"));
        CFGSTORE_TRY(stmt.bind(1, userId));
        std::vector<TraderRecord> traders;
        while (true) {
            CFGSTORE_TRY_UNWRAP(hasRow, stmt.step());
            if (!hasRow)
                break;
            traders.push_back(readTrader(stmt));
        }
        return traders;
    });
}

Result<void> SqliteRecordStore::setTraderRunning(const std::string& userId, const std::string& id,
                                                 bool running) {
    return pool_->withConnection([&](Database& db) -> Result<void> {
        CFGSTORE_TRY_UNWRAP(stmt, db.prepare("UPDATE traders SET is_running = ?, updated_at = ? "
                                             "WHERE id = ? AND user_id = ?"));
        CFGSTORE_TRY(stmt.bindAll(running, now(), id, userId));
        return updateOne(stmt, db, "Trader " + id);
    });
}

Result<void> SqliteRecordStore::updateTrader(const TraderRecord& trader) {
    return pool_->withConnection([&](Database& db) -> Result<void> {
        CFGSTORE_TRY_UNWRAP(
            stmt, db.prepare("UPDATE traders SET name = ?, ai_model_id = ?, exchange_id = ?, "
                             "initial_balance = ?, scan_interval_minutes = ?, "
                             "btc_eth_leverage = ?, altcoin_leverage = ?, trading_symbols = ?, "
                             "use_coin_pool = ?, use_oi_top = ?, custom_prompt = ?, "
                             "override_base_prompt = ?, system_prompt_template = ?, "
                             "is_cross_margin = ?, taker_fee_rate = ?, maker_fee_rate = ?, "
                             "order_strategy = ?, limit_price_offset = ?, "
                             "limit_timeout_seconds = ?, timeframes = ?, updated_at = ? "
                             "WHERE id = ? AND user_id = ?"));
        CFGSTORE_TRY(stmt.bindAll(
            trader.name, trader.aiModelId, trader.exchangeId, trader.initialBalance,
            trader.scanIntervalMinutes, trader.btcEthLeverage, trader.altcoinLeverage,
            trader.tradingSymbols, trader.useCoinPool, trader.useOiTop, trader.customPrompt,
            trader.overrideBasePrompt, trader.systemPromptTemplate, trader.isCrossMargin,
            trader.takerFeeRate, trader.makerFeeRate, trader.orderStrategy,
            trader.limitPriceOffset, trader.limitTimeoutSeconds, trader.timeframes, now(),
            trader.id, trader.userId));
        return updateOne(stmt, db, "Trader " + trader.id);
    });
}

Result<void> SqliteRecordStore::setTraderCustomPrompt(const std::string& userId,
                                                      const std::string& id,
                                                      const std::string& prompt,
                                                      bool overrideBase) {
    return pool_->withConnection([&](Database& db) -> Result<void> {
        CFGSTORE_TRY_UNWRAP(stmt,
                            db.prepare("UPDATE traders SET custom_prompt = ?, "
                                       "override_base_prompt = ?, updated_at = ? "
                                       "WHERE id = ? AND user_id = ?"));
        CFGSTORE_TRY(stmt.bindAll(prompt, overrideBase, now(), id, userId));
        return updateOne(stmt, db, "Trader " + id);
    });
}

Result<void> SqliteRecordStore::setTraderInitialBalance(const std::string& userId,
                                                        const std::string& id, double balance) {
    return pool_->withConnection([&](Database& db) -> Result<void> {
        CFGSTORE_TRY_UNWRAP(stmt, db.prepare("UPDATE traders SET initial_balance = ?, "
                                             "updated_at = ? WHERE id = ? AND user_id = ?"));
        CFGSTORE_TRY(stmt.bindAll(balance, now(), id, userId));
        return updateOne(stmt, db, "Trader " + id);
    });
}

Result<void> SqliteRecordStore::deleteTrader(const std::string& userId, const std::string& id) {
    return pool_->withConnection([&](Database& db) -> Result<void> {
        CFGSTORE_TRY_UNWRAP(stmt, db.prepare("DELETE FROM traders WHERE id = ? AND user_id = ?"));
        CFGSTORE_TRY(stmt.bindAll(id, userId));
        return updateOne(stmt, db, "Trader " + id);
    });
}

Result<store::TraderFullConfig> SqliteRecordStore::getTraderFullConfig(const std::string& userId,
                                                                       const std::string& traderId) {
    return pool_->withConnection([&](Database& db) -> Result<store::TraderFullConfig> {
        store::TraderFullConfig full;
        {
            CFGSTORE_TRY_UNWRAP(stmt, db.prepare(std::string("SELECT ") + kTraderColumns +
                                                 " FROM traders WHERE id = ? AND user_id = ?"));
            CFGSTORE_TRY(stmt.bindAll(traderId, userId));
            CFGSTORE_TRY_UNWRAP(hasRow, stmt.step());
            if (!hasRow) {
                return Error{ErrorCode::NotFound, "Trader not found: " + traderId};
            }
            full.trader = readTrader(stmt);
        }

        CFGSTORE_TRY_UNWRAP(model, aiModelById(db, full.trader.aiModelId));
        CFGSTORE_TRY_UNWRAP(exchange, exchangeById(db, full.trader.exchangeId));
        full.aiModel = std::move(model);
        full.exchange = std::move(exchange);
        return full;
    });
}

// System settings

Result<std::string> SqliteRecordStore::getSystemConfig(const std::string& key) {
    return pool_->withConnection([&](Database& db) -> Result<std::string> {
        CFGSTORE_TRY_UNWRAP(stmt, db.prepare("SELECT value FROM system_config WHERE key = ?"));
        CFGSTORE_TRY(stmt.bind(1, key));
        CFGSTORE_TRY_UNWRAP(hasRow, stmt.step());
        if (!hasRow) {
            return Error{ErrorCode::NotFound, "System config key not set: " + key};
        }
        return stmt.getString(0);
    });
}

Result<void> SqliteRecordStore::setSystemConfig(const std::string& key, const std::string& value) {
    return pool_->withConnection([&](Database& db) -> Result<void> {
        CFGSTORE_TRY_UNWRAP(stmt, db.prepare("INSERT INTO system_config (key, value, updated_at) "
                                             "VALUES (?, ?, ?) ON CONFLICT(key) DO UPDATE SET "
                                             "value = excluded.value, "
                                             "updated_at = excluded.updated_at"));
        CFGSTORE_TRY(stmt.bindAll(key, value, now()));
        return stmt.execute();
    });
}

// Signal sources

Result<void> SqliteRecordStore::createOrUpdateSignalSource(const std::string& userId,
                                                           const std::string& coinPoolUrl,
                                                           const std::string& oiTopUrl) {
    return pool_->withConnection([&](Database& db) -> Result<void> {
        CFGSTORE_TRY_UNWRAP(
            stmt, db.prepare("INSERT INTO user_signal_sources "
                             "(user_id, coin_pool_url, oi_top_url, created_at, updated_at) "
                             "VALUES (?, ?, ?, ?, ?) ON CONFLICT(user_id) DO UPDATE SET "
                             "coin_pool_url = excluded.coin_pool_url, "
                             "oi_top_url = excluded.oi_top_url, "
                             "updated_at = excluded.updated_at"));
        const auto ts = now();
        CFGSTORE_TRY(stmt.bindAll(userId, coinPoolUrl, oiTopUrl, ts, ts));
        return stmt.execute();
    });
}

Result<void> SqliteRecordStore::updateSignalSource(const std::string& userId,
                                                   const std::string& coinPoolUrl,
                                                   const std::string& oiTopUrl) {
    return pool_->withConnection([&](Database& db) -> Result<void> {
        CFGSTORE_TRY_UNWRAP(stmt, db.prepare("UPDATE user_signal_sources SET coin_pool_url = ?, "
                                             "oi_top_url = ?, updated_at = ? WHERE user_id = ?"));
        CFGSTORE_TRY(stmt.bindAll(coinPoolUrl, oiTopUrl, now(), userId));
        return updateOne(stmt, db, "Signal source of " + userId);
    });
}

Result<store::UserSignalSource> SqliteRecordStore::getSignalSource(const std::string& userId) {
    return pool_->withConnection([&](Database& db) -> Result<store::UserSignalSource> {
        CFGSTORE_TRY_UNWRAP(stmt, db.prepare("SELECT id, user_id, coin_pool_url, oi_top_url, "
                                             "created_at, updated_at FROM user_signal_sources "
                                             "WHERE user_id = ?"));
        CFGSTORE_TRY(stmt.bind(1, userId));
        CFGSTORE_TRY_UNWRAP(hasRow, stmt.step());
        if (!hasRow) {
            return Error{ErrorCode::NotFound, "No signal source for user " + userId};
        }
        store::UserSignalSource source;
        source.id = stmt.getInt64(0);
        source.userId = stmt.getString(1);
        source.coinPoolUrl = stmt.getString(2);
        source.oiTopUrl = stmt.getString(3);
        source.createdAt = stmt.getTime(4);
        source.updatedAt = stmt.getTime(5);
        return source;
    });
}

// Aggregates

Result<std::vector<std::string>> SqliteRecordStore::collectTradingSymbols() {
    return pool_->withConnection([](Database& db) -> Result<std::vector<std::string>> {
        CFGSTORE_TRY_UNWRAP(stmt, db.prepare("SELECT trading_symbols FROM traders "
                                             "WHERE trading_symbols != '' "
                                             "ORDER BY created_at, rowid"));
        return readStrings(stmt);
    });
}

Result<std::vector<std::string>> SqliteRecordStore::collectRunningTimeframes() {
    return pool_->withConnection([](Database& db) -> Result<std::vector<std::string>> {
        CFGSTORE_TRY_UNWRAP(stmt, db.prepare("SELECT timeframes FROM traders "
                                             "WHERE is_running = 1 AND timeframes != ''"));
        return readStrings(stmt);
    });
}

// Decision logs

Result<void> SqliteRecordStore::appendDecisionLog(const store::DecisionLogEntry& entry) {
    return pool_->withConnection([&](Database& db) -> Result<void> {
        CFGSTORE_TRY_UNWRAP(stmt, db.prepare("INSERT INTO decision_logs "
                                             "(user_id, trader_id, record, created_at) "
                                             "VALUES (?, ?, ?, ?)"));
        CFGSTORE_TRY(stmt.bindAll(entry.userId, entry.traderId, entry.record,
                                  orNow(entry.createdAt)));
        return stmt.execute();
    });
}

Result<std::vector<store::DecisionLogEntry>>
SqliteRecordStore::getDecisionLogs(const std::string& userId, const std::string& traderId,
                                   int limit) {
    return pool_->withConnection([&](Database& db) -> Result<std::vector<store::DecisionLogEntry>> {
        // A negative LIMIT means no limit in SQLite
        CFGSTORE_TRY_UNWRAP(stmt, db.prepare("SELECT id, user_id, trader_id, record, created_at "
                                             "FROM decision_logs "
                                             "WHERE user_id = ? AND trader_id = ? "
                                             "ORDER BY created_at DESC, id DESC LIMIT ?"));
        CFGSTORE_TRY(stmt.bindAll(userId, traderId, limit > 0 ? limit : -1));
        std::vector<store::DecisionLogEntry> entries;
        while (true) {
            CFGSTORE_TRY_UNWRAP(hasRow, stmt.step());
            if (!hasRow)
                break;
            store::DecisionLogEntry entry;
            entry.id = stmt.getInt64(0);
            entry.userId = stmt.getString(1);
            entry.traderId = stmt.getString(2);
            entry.record = stmt.getString(3);
            entry.createdAt = stmt.getTime(4);
            entries.push_back(std::move(entry));
        }
        std::reverse(entries.begin(), entries.end());
        return entries;
    });
}

// Beta codes

Result<size_t> SqliteRecordStore::loadBetaCodes(const std::vector<std::string>& lines) {
    const auto codes = store::parseBetaCodeLines(lines);
    if (codes.empty()) {
        return size_t{0};
    }

    size_t inserted = 0;
    auto result = pool_->withConnection([&](Database& db) -> Result<void> {
        return db.transaction([&]() -> Result<void> {
            CFGSTORE_TRY_UNWRAP(stmt,
                                db.prepare("INSERT OR IGNORE INTO beta_codes "
                                           "(code, used, used_by, created_at) "
                                           "VALUES (?, 0, '', ?)"));
            const auto ts = now();
            for (const auto& code : codes) {
                CFGSTORE_TRY(stmt.reset());
                CFGSTORE_TRY(stmt.clearBindings());
                CFGSTORE_TRY(stmt.bindAll(code, ts));
                CFGSTORE_TRY(stmt.execute());
                inserted += static_cast<size_t>(db.changes());
            }
            return {};
        });
    });
    if (!result) {
        return result.error();
    }

    spdlog::info("Loaded {} new beta code(s) from {} candidate(s)", inserted, codes.size());
    return inserted;
}

Result<bool> SqliteRecordStore::validateBetaCode(const std::string& code) {
    return pool_->withConnection([&](Database& db) -> Result<bool> {
        CFGSTORE_TRY_UNWRAP(stmt, db.prepare("SELECT used FROM beta_codes WHERE code = ?"));
        CFGSTORE_TRY(stmt.bind(1, code));
        CFGSTORE_TRY_UNWRAP(hasRow, stmt.step());
        return hasRow && !stmt.getBool(0);
    });
}

Result<void> SqliteRecordStore::claimBetaCode(const std::string& code, const std::string& email) {
    return pool_->withConnection([&](Database& db) -> Result<void> {
        CFGSTORE_TRY_UNWRAP(stmt, db.prepare("UPDATE beta_codes SET used = 1, used_by = ?, "
                                             "used_at = ? WHERE code = ? AND used = 0"));
        CFGSTORE_TRY(stmt.bindAll(email, now(), code));
        CFGSTORE_TRY(stmt.execute());
        if (db.changes() == 0) {
            return Error{ErrorCode::InvalidOrUsed, "Beta code invalid or already used"};
        }
        return {};
    });
}

Result<store::BetaCodeStats> SqliteRecordStore::betaCodeStats() {
    return pool_->withConnection([](Database& db) -> Result<store::BetaCodeStats> {
        CFGSTORE_TRY_UNWRAP(stmt,
                            db.prepare("SELECT COUNT(*), COALESCE(SUM(used), 0) FROM beta_codes"));
        CFGSTORE_TRY_UNWRAP(hasRow, stmt.step());
        store::BetaCodeStats stats;
        if (hasRow) {
            stats.total = stmt.getInt64(0);
            stats.used = stmt.getInt64(1);
        }
        return stats;
    });
}

// Seeding

Result<bool> SqliteRecordStore::insertAIModelIfAbsent(const AIModelConfig& model) {
    AIModelConfig sealed = model;
    sealed.apiKey = vault()->encryptForStorage(model.apiKey);
    bool inserted = false;
    auto result = pool_->withConnection([&](Database& db) -> Result<void> {
        return db.transaction([&]() -> Result<void> {
            CFGSTORE_TRY_UNWRAP(added, insertAIModelOn(db, sealed));
            inserted = added;
            return {};
        });
    });
    if (!result)
        return result.error();
    return inserted;
}

Result<bool> SqliteRecordStore::insertExchangeIfAbsent(const ExchangeConfig& exchange) {
    auto v = vault();
    ExchangeConfig sealed = exchange;
    sealed.apiKey = v->encryptForStorage(exchange.apiKey);
    sealed.secretKey = v->encryptForStorage(exchange.secretKey);
    sealed.asterPrivateKey = v->encryptForStorage(exchange.asterPrivateKey);
    bool inserted = false;
    auto result = pool_->withConnection([&](Database& db) -> Result<void> {
        return db.transaction([&]() -> Result<void> {
            CFGSTORE_TRY_UNWRAP(added, insertExchangeOn(db, sealed));
            inserted = added;
            return {};
        });
    });
    if (!result)
        return result.error();
    return inserted;
}

Result<bool> SqliteRecordStore::insertSystemConfigIfAbsent(const std::string& key,
                                                           const std::string& value) {
    return pool_->withConnection([&](Database& db) -> Result<bool> {
        CFGSTORE_TRY_UNWRAP(stmt, db.prepare("INSERT OR IGNORE INTO system_config "
                                             "(key, value, updated_at) VALUES (?, ?, ?)"));
        CFGSTORE_TRY(stmt.bindAll(key, value, now()));
        CFGSTORE_TRY(stmt.execute());
        return db.changes() > 0;
    });
}

Result<bool> SqliteRecordStore::insertUserIfAbsent(const User& user) {
    return pool_->withConnection([&](Database& db) -> Result<bool> {
        CFGSTORE_TRY_UNWRAP(stmt, db.prepare(std::string("INSERT OR IGNORE INTO users (") +
                                             kUserColumns + ") VALUES (?, ?, ?, ?, ?, ?, ?)"));
        CFGSTORE_TRY(stmt.bindAll(user.id, user.email, user.passwordHash, user.otpSecret,
                                  user.otpVerified, orNow(user.createdAt),
                                  orNow(user.updatedAt)));
        CFGSTORE_TRY(stmt.execute());
        return db.changes() > 0;
    });
}

} // namespace cfgstore::sqlite
