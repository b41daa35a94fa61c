#include <spdlog/spdlog.h>
#include <algorithm>
#include <iterator>
#include <cfgstore/core/result_helpers.h>
#include <cfgstore/crypto/credential_vault.h>
#include <cfgstore/redis/redis_documents.h>
#include <cfgstore/redis/redis_record_store.h>
#include <cfgstore/redis/redis_scripts.h>
#include <cfgstore/store/catalog.h>

namespace cfgstore::redis {

using store::AIModelConfig;
using store::ExchangeConfig;
using store::TraderRecord;
using store::User;
namespace family = store::family;

namespace {

TimePoint now() {
    return std::chrono::system_clock::now();
}

TimePoint orNow(TimePoint tp) {
    return tp == TimePoint{} ? now() : tp;
}

std::vector<std::string> withArgs(std::vector<std::string> head, const Document& d) {
    auto pairs = doc::flatten(d);
    head.insert(head.end(), pairs.begin(), pairs.end());
    return head;
}

AIModelConfig unsealAIModel(const Document& d, const crypto::CredentialVault& vault) {
    auto model = doc::toAIModel(d);
    model.apiKey = vault.decryptFromStorage(model.apiKey);
    return model;
}

ExchangeConfig unsealExchange(const Document& d, const crypto::CredentialVault& vault) {
    auto exchange = doc::toExchange(d);
    exchange.apiKey = vault.decryptFromStorage(exchange.apiKey);
    exchange.secretKey = vault.decryptFromStorage(exchange.secretKey);
    exchange.asterPrivateKey = vault.decryptFromStorage(exchange.asterPrivateKey);
    return exchange;
}

} // namespace

Result<std::unique_ptr<RedisRecordStore>>
RedisRecordStore::open(const config::StoreConfig& config) {
    if (config.redisUrl.empty()) {
        return Error{ErrorCode::InvalidArgument, "Redis URL is empty"};
    }

    CFGSTORE_TRY_UNWRAP(client, RedisClient::connect(config));
    std::unique_ptr<RedisRecordStore> recordStore(new RedisRecordStore(std::move(client), config));

    auto schemaResult = recordStore->schema_->ensureSchema();
    if (!schemaResult) {
        spdlog::error("Layout migration failed for Redis prefix '{}': {}", config.redisPrefix,
                      schemaResult.error().message);
        return schemaResult.error();
    }

    store::DefaultDataSeeder seeder(*recordStore);
    CFGSTORE_TRY(seeder.seedDefaults());

    spdlog::info("Opened Redis config store at prefix '{}' (schema generation {})",
                 config.redisPrefix, recordStore->schemaGeneration());
    return recordStore;
}

RedisRecordStore::RedisRecordStore(std::shared_ptr<RedisClient> client,
                                   const config::StoreConfig& config)
    : client_(std::move(client)), allocator_(std::make_unique<RedisSequenceAllocator>(client_)),
      schema_(std::make_unique<RedisSchemaManager>(client_, config.effectiveBackupDir(),
                                                   config.backupBeforeMigrate)),
      vault_(std::make_shared<crypto::CredentialVault>()) {}

void RedisRecordStore::setCredentialVault(std::shared_ptr<const crypto::CredentialVault> vault) {
    std::lock_guard<std::mutex> lock(vaultMutex_);
    vault_ = vault ? std::move(vault) : std::make_shared<crypto::CredentialVault>();
}

std::shared_ptr<const crypto::CredentialVault> RedisRecordStore::vault() const {
    std::lock_guard<std::mutex> lock(vaultMutex_);
    return vault_;
}

Result<std::vector<std::string>> RedisRecordStore::members(const std::string& setKey) {
    return client_->call("SMEMBERS", [&](sw::redis::Redis& r) {
        std::vector<std::string> out;
        r.smembers(setKey, std::back_inserter(out));
        std::sort(out.begin(), out.end());
        return out;
    });
}

Result<std::vector<Document>> RedisRecordStore::loadAll(const std::string& familyName,
                                                        const std::vector<std::string>& ids) {
    std::vector<Document> docs;
    docs.reserve(ids.size());
    for (const auto& id : ids) {
        CFGSTORE_TRY_UNWRAP(d, client_->load(client_->docKey(familyName, id)));
        // Removed between SMEMBERS and HGETALL
        if (d.empty())
            continue;
        docs.push_back(std::move(d));
    }
    return docs;
}

Result<RecordId> RedisRecordStore::lookupIndexed(const std::string& familyName,
                                                 const std::string& userId,
                                                 const std::string& naturalId) {
    const auto key = client_->indexKey(familyName);
    const auto field = RedisClient::ownedField(userId, naturalId);
    CFGSTORE_TRY_UNWRAP(value, client_->call("HGET index", [&](sw::redis::Redis& r) {
        return r.hget(key, field);
    }));
    if (!value || !doc::isInteger(*value)) {
        return RecordId{0};
    }
    return static_cast<RecordId>(std::stoll(*value));
}

Result<bool> RedisRecordStore::insertIndexed(const std::string& familyName,
                                             const std::string& userId,
                                             const std::string& naturalId, const Document& d) {
    CFGSTORE_TRY_UNWRAP(
        id, client_->evalInt("insert document", scripts::kInsertIndexed,
                             {client_->indexKey(familyName), client_->counterKey(familyName),
                              client_->ownerKey(familyName, userId), client_->allKey(familyName)},
                             withArgs({RedisClient::ownedField(userId, naturalId),
                                       client_->docKey(familyName, "")},
                                      d)));
    return id > 0;
}

Result<void> RedisRecordStore::updateExisting(const std::string& key, const Document& fields,
                                              const std::string& what) {
    CFGSTORE_TRY_UNWRAP(updated, client_->evalInt("update document", scripts::kUpdateExisting,
                                                  {key}, doc::flatten(fields)));
    if (updated == 0) {
        return Error{ErrorCode::NotFound, what + " not found"};
    }
    return {};
}

Result<void> RedisRecordStore::updateOwnedTrader(const std::string& userId, const std::string& id,
                                                 const Document& fields) {
    CFGSTORE_TRY_UNWRAP(updated,
                        client_->evalInt("update trader", scripts::kUpdateOwned,
                                         {client_->docKey(family::kTraders, id)},
                                         withArgs({userId}, fields)));
    if (updated == 0) {
        return Error{ErrorCode::NotFound, "Trader " + id + " not found"};
    }
    return {};
}

// Users

Result<void> RedisRecordStore::createUser(const User& user) {
    User stored = user;
    stored.createdAt = orNow(user.createdAt);
    stored.updatedAt = orNow(user.updatedAt);
    CFGSTORE_TRY_UNWRAP(created,
                        client_->evalInt("create user", scripts::kCreateUser,
                                         {client_->docKey(family::kUsers, user.id),
                                          client_->indexKey(family::kUsers),
                                          client_->allKey(family::kUsers)},
                                         withArgs({user.id, user.email}, doc::fromUser(stored))));
    if (created <= 0) {
        return Error{ErrorCode::Duplicate, "User already exists: " + user.email};
    }
    return {};
}

Result<User> RedisRecordStore::userByKey(const std::string& key, const std::string& what) {
    CFGSTORE_TRY_UNWRAP(d, client_->load(key));
    if (d.empty()) {
        return Error{ErrorCode::NotFound, "User not found: " + what};
    }
    return doc::toUser(d);
}

Result<User> RedisRecordStore::getUserByEmail(const std::string& email) {
    const auto key = client_->indexKey(family::kUsers);
    CFGSTORE_TRY_UNWRAP(id, client_->call("HGET email", [&](sw::redis::Redis& r) {
        return r.hget(key, email);
    }));
    if (!id) {
        return Error{ErrorCode::NotFound, "User not found: " + email};
    }
    return userByKey(client_->docKey(family::kUsers, *id), email);
}

Result<User> RedisRecordStore::getUserById(const std::string& id) {
    return userByKey(client_->docKey(family::kUsers, id), id);
}

Result<std::vector<std::string>> RedisRecordStore::listUserIds() {
    return members(client_->allKey(family::kUsers));
}

Result<void> RedisRecordStore::setUserOtpVerified(const std::string& id, bool verified) {
    return updateExisting(client_->docKey(family::kUsers, id),
                          {{"otp_verified", doc::encodeBool(verified)},
                           {"updated_at", doc::encodeTime(now())}},
                          "User " + id);
}

Result<void> RedisRecordStore::updateUserPassword(const std::string& id,
                                                  const std::string& passwordHash) {
    return updateExisting(
        client_->docKey(family::kUsers, id),
        {{"password_hash", passwordHash}, {"updated_at", doc::encodeTime(now())}}, "User " + id);
}

// AI models

Result<std::vector<AIModelConfig>> RedisRecordStore::listAIModels(const std::string& userId) {
    auto v = vault();
    CFGSTORE_TRY_UNWRAP(ids, members(client_->ownerKey(family::kAIModels, userId)));
    CFGSTORE_TRY_UNWRAP(docs, loadAll(family::kAIModels, ids));

    std::vector<AIModelConfig> models;
    models.reserve(docs.size());
    for (const auto& d : docs) {
        models.push_back(unsealAIModel(d, *v));
    }
    std::sort(models.begin(), models.end(),
              [](const AIModelConfig& a, const AIModelConfig& b) { return a.id < b.id; });
    return models;
}

Result<void> RedisRecordStore::upsertAIModel(const std::string& userId,
                                             const std::string& modelKey, bool enabled,
                                             const std::string& apiKey,
                                             const std::string& customApiUrl,
                                             const std::string& customModelName) {
    auto v = vault();
    CFGSTORE_TRY_UNWRAP(existing, lookupIndexed(family::kAIModels, userId, modelKey));

    if (existing == 0) {
        CFGSTORE_TRY_UNWRAP(owned, listAIModels(userId));
        for (const auto& model : owned) {
            if (model.provider == modelKey) {
                existing = model.id;
                spdlog::warn("AI model '{}' of user {} matched by provider (row {})", modelKey,
                             userId, model.modelId);
                break;
            }
        }
    }

    if (existing != 0) {
        auto fields =
            doc::aiModelUpdateFields(enabled, apiKey, customApiUrl, customModelName, *v, now());
        return updateExisting(client_->docKey(family::kAIModels, std::to_string(existing)),
                              fields, "AI model " + modelKey);
    }

    const auto provider = store::catalog::inferProvider(modelKey);
    std::string name = store::catalog::fallbackModelName(provider);
    {
        CFGSTORE_TRY_UNWRAP(ids, members(client_->allKey(family::kAIModels)));
        CFGSTORE_TRY_UNWRAP(docs, loadAll(family::kAIModels, ids));
        RecordId lowest = 0;
        for (const auto& d : docs) {
            const auto id = doc::fieldInt(d, "id");
            if (doc::field(d, "provider") == provider && (lowest == 0 || id < lowest)) {
                lowest = id;
                name = doc::field(d, "name");
            }
        }
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
    model.createdAt = now();
    model.updatedAt = model.createdAt;
    CFGSTORE_TRY_UNWRAP(inserted, insertIndexed(family::kAIModels, userId, model.modelId,
                                                doc::fromAIModel(model)));
    if (inserted) {
        spdlog::info("Created AI model {} for user {}", model.modelId, userId);
    }
    return {};
}

Result<void> RedisRecordStore::createAIModel(const std::string& userId,
                                             const std::string& modelId, const std::string& name,
                                             const std::string& provider, bool enabled,
                                             const std::string& apiKey,
                                             const std::string& customApiUrl) {
    AIModelConfig model;
    model.modelId = modelId;
    model.userId = userId;
    model.name = name;
    model.provider = provider;
    model.enabled = enabled;
    model.apiKey = apiKey;
    model.customApiUrl = customApiUrl;
    CFGSTORE_TRY(insertAIModelIfAbsent(model));
    return {};
}

// Exchanges

Result<std::vector<ExchangeConfig>> RedisRecordStore::listExchanges(const std::string& userId) {
    auto v = vault();
    CFGSTORE_TRY_UNWRAP(ids, members(client_->ownerKey(family::kExchanges, userId)));
    CFGSTORE_TRY_UNWRAP(docs, loadAll(family::kExchanges, ids));

    std::vector<ExchangeConfig> exchanges;
    exchanges.reserve(docs.size());
    for (const auto& d : docs) {
        exchanges.push_back(unsealExchange(d, *v));
    }
    std::sort(exchanges.begin(), exchanges.end(),
              [](const ExchangeConfig& a, const ExchangeConfig& b) { return a.id < b.id; });
    return exchanges;
}

Result<void> RedisRecordStore::upsertExchange(const std::string& userId,
                                              const std::string& exchangeKey,
                                              const store::ExchangeUpdate& update) {
    auto v = vault();
    CFGSTORE_TRY_UNWRAP(existing, lookupIndexed(family::kExchanges, userId, exchangeKey));

    if (existing != 0) {
        return updateExisting(client_->docKey(family::kExchanges, std::to_string(existing)),
                              doc::exchangeUpdateFields(update, *v, now()),
                              "Exchange " + exchangeKey);
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
    exchange.createdAt = now();
    exchange.updatedAt = exchange.createdAt;
    CFGSTORE_TRY_UNWRAP(inserted, insertIndexed(family::kExchanges, userId, exchangeKey,
                                                doc::fromExchange(exchange)));
    if (inserted) {
        spdlog::info("Created exchange {} for user {}", exchangeKey, userId);
    }
    return {};
}

Result<void> RedisRecordStore::createExchange(const std::string& userId,
                                              const std::string& exchangeId,
                                              const std::string& name, const std::string& type,
                                              const store::ExchangeUpdate& fields) {
    ExchangeConfig exchange;
    exchange.exchangeId = exchangeId;
    exchange.userId = userId;
    exchange.name = name;
    exchange.type = type;
    exchange.enabled = fields.enabled;
    exchange.apiKey = fields.apiKey;
    exchange.secretKey = fields.secretKey;
    exchange.testnet = fields.testnet;
    exchange.hyperliquidWalletAddr = fields.hyperliquidWalletAddr;
    exchange.asterUser = fields.asterUser;
    exchange.asterSigner = fields.asterSigner;
    exchange.asterPrivateKey = fields.asterPrivateKey;
    CFGSTORE_TRY(insertExchangeIfAbsent(exchange));
    return {};
}

// Traders

Result<void> RedisRecordStore::createTrader(const TraderRecord& trader) {
    TraderRecord stored = trader;
    stored.createdAt = orNow(trader.createdAt);
    stored.updatedAt = orNow(trader.updatedAt);
    CFGSTORE_TRY_UNWRAP(created,
                        client_->evalInt("create trader", scripts::kCreateIfAbsent,
                                         {client_->docKey(family::kTraders, trader.id),
                                          client_->ownerKey(family::kTraders, trader.userId),
                                          client_->allKey(family::kTraders)},
                                         withArgs({trader.id}, doc::fromTrader(stored))));
    if (created == 0) {
        return Error{ErrorCode::Duplicate, "Trader already exists: " + trader.id};
    }
    return {};
}

Result<std::vector<TraderRecord>> RedisRecordStore::tradersOf(const std::string& setKey) {
    CFGSTORE_TRY_UNWRAP(ids, members(setKey));
    CFGSTORE_TRY_UNWRAP(docs, loadAll(family::kTraders, ids));
    std::vector<TraderRecord> traders;
    traders.reserve(docs.size());
    for (const auto& d : docs) {
        traders.push_back(doc::toTrader(d));
    }
    return traders;
}

Result<std::vector<TraderRecord>> RedisRecordStore::listTraders(const std::string& userId) {
    CFGSTORE_TRY_UNWRAP(traders, tradersOf(client_->ownerKey(family::kTraders, userId)));
    std::sort(traders.begin(), traders.end(), doc::newerTraderFirst);
    return traders;
}

Result<void> RedisRecordStore::setTraderRunning(const std::string& userId, const std::string& id,
                                                bool running) {
    return updateOwnedTrader(userId, id,
                             {{"is_running", doc::encodeBool(running)},
                              {"updated_at", doc::encodeTime(now())}});
}

Result<void> RedisRecordStore::updateTrader(const TraderRecord& trader) {
    TraderRecord stored = trader;
    stored.updatedAt = now();
    auto fields = doc::fromTrader(stored);
    // Identity, ownership, run state and creation time are not editable here
    for (const char* name : {"id", "user_id", "is_running", "created_at"}) {
        fields.erase(name);
    }
    return updateOwnedTrader(trader.userId, trader.id, fields);
}

Result<void> RedisRecordStore::setTraderCustomPrompt(const std::string& userId,
                                                     const std::string& id,
                                                     const std::string& prompt,
                                                     bool overrideBase) {
    return updateOwnedTrader(userId, id,
                             {{"custom_prompt", prompt},
                              {"override_base_prompt", doc::encodeBool(overrideBase)},
                              {"updated_at", doc::encodeTime(now())}});
}

Result<void> RedisRecordStore::setTraderInitialBalance(const std::string& userId,
                                                       const std::string& id, double balance) {
    return updateOwnedTrader(userId, id,
                             {{"initial_balance", doc::encodeDouble(balance)},
                              {"updated_at", doc::encodeTime(now())}});
}

Result<void> RedisRecordStore::deleteTrader(const std::string& userId, const std::string& id) {
    CFGSTORE_TRY_UNWRAP(deleted, client_->evalInt("delete trader", scripts::kDeleteOwned,
                                                  {client_->docKey(family::kTraders, id),
                                                   client_->ownerKey(family::kTraders, userId),
                                                   client_->allKey(family::kTraders)},
                                                  {userId, id}));
    if (deleted == 0) {
        return Error{ErrorCode::NotFound, "Trader " + id + " not found"};
    }
    return {};
}

Result<store::TraderFullConfig> RedisRecordStore::getTraderFullConfig(const std::string& userId,
                                                                      const std::string& traderId) {
    CFGSTORE_TRY_UNWRAP(traderDoc, client_->load(client_->docKey(family::kTraders, traderId)));
    if (traderDoc.empty() || doc::field(traderDoc, "user_id") != userId) {
        return Error{ErrorCode::NotFound, "Trader not found: " + traderId};
    }

    store::TraderFullConfig full;
    full.trader = doc::toTrader(traderDoc);

    auto v = vault();
    const auto modelKey = std::to_string(full.trader.aiModelId);
    CFGSTORE_TRY_UNWRAP(modelDoc, client_->load(client_->docKey(family::kAIModels, modelKey)));
    if (modelDoc.empty()) {
        return Error{ErrorCode::NotFound, "AI model not found: " + modelKey};
    }
    const auto exchangeKey = std::to_string(full.trader.exchangeId);
    CFGSTORE_TRY_UNWRAP(exchangeDoc,
                        client_->load(client_->docKey(family::kExchanges, exchangeKey)));
    if (exchangeDoc.empty()) {
        return Error{ErrorCode::NotFound, "Exchange not found: " + exchangeKey};
    }
    full.aiModel = unsealAIModel(modelDoc, *v);
    full.exchange = unsealExchange(exchangeDoc, *v);
    return full;
}

// System settings

Result<std::string> RedisRecordStore::getSystemConfig(const std::string& key) {
    const auto values = client_->docKey(family::kSystemConfig, "values");
    CFGSTORE_TRY_UNWRAP(value, client_->call("HGET setting", [&](sw::redis::Redis& r) {
        return r.hget(values, key);
    }));
    if (!value) {
        return Error{ErrorCode::NotFound, "System config key not set: " + key};
    }
    return *value;
}

Result<void> RedisRecordStore::setSystemConfig(const std::string& key, const std::string& value) {
    const auto values = client_->docKey(family::kSystemConfig, "values");
    const auto stamps = client_->docKey(family::kSystemConfig, "updated_at");
    const auto ts = doc::encodeTime(now());
    return client_->call("HSET setting", [&](sw::redis::Redis& r) {
        auto tx = r.transaction();
        tx.hset(values, key, value).hset(stamps, key, ts).exec();
    });
}

Result<bool> RedisRecordStore::insertSystemConfigIfAbsent(const std::string& key,
                                                          const std::string& value) {
    const auto values = client_->docKey(family::kSystemConfig, "values");
    const auto stamps = client_->docKey(family::kSystemConfig, "updated_at");
    CFGSTORE_TRY_UNWRAP(added, client_->call("HSETNX setting", [&](sw::redis::Redis& r) {
        return r.hsetnx(values, key, value);
    }));
    if (added) {
        CFGSTORE_TRY(client_->call("HSET setting time", [&](sw::redis::Redis& r) {
            r.hset(stamps, key, doc::encodeTime(now()));
        }));
    }
    return added;
}

// Signal sources

Result<void> RedisRecordStore::createOrUpdateSignalSource(const std::string& userId,
                                                          const std::string& coinPoolUrl,
                                                          const std::string& oiTopUrl) {
    CFGSTORE_TRY(client_->evalInt("upsert signal source", scripts::kUpsertSignalSource,
                                  {client_->docKey(family::kSignalSources, userId),
                                   client_->counterKey(family::kSignalSources)},
                                  {userId, coinPoolUrl, oiTopUrl, doc::encodeTime(now())}));
    return {};
}

Result<void> RedisRecordStore::updateSignalSource(const std::string& userId,
                                                  const std::string& coinPoolUrl,
                                                  const std::string& oiTopUrl) {
    return updateExisting(client_->docKey(family::kSignalSources, userId),
                          {{"coin_pool_url", coinPoolUrl},
                           {"oi_top_url", oiTopUrl},
                           {"updated_at", doc::encodeTime(now())}},
                          "Signal source of " + userId);
}

Result<store::UserSignalSource> RedisRecordStore::getSignalSource(const std::string& userId) {
    CFGSTORE_TRY_UNWRAP(d, client_->load(client_->docKey(family::kSignalSources, userId)));
    if (d.empty()) {
        return Error{ErrorCode::NotFound, "No signal source for user " + userId};
    }
    return doc::toSignalSource(d);
}

// Aggregates

Result<std::vector<std::string>> RedisRecordStore::collectTradingSymbols() {
    CFGSTORE_TRY_UNWRAP(traders, tradersOf(client_->allKey(family::kTraders)));
    std::sort(traders.begin(), traders.end(), [](const TraderRecord& a, const TraderRecord& b) {
        if (a.createdAt != b.createdAt)
            return a.createdAt < b.createdAt;
        return a.id < b.id;
    });
    std::vector<std::string> symbols;
    for (auto& trader : traders) {
        if (!trader.tradingSymbols.empty())
            symbols.push_back(std::move(trader.tradingSymbols));
    }
    return symbols;
}

Result<std::vector<std::string>> RedisRecordStore::collectRunningTimeframes() {
    CFGSTORE_TRY_UNWRAP(ids, members(client_->allKey(family::kTraders)));
    CFGSTORE_TRY_UNWRAP(docs, loadAll(family::kTraders, ids));
    // Raw fields: toTrader would substitute the read-time default for an empty value
    return doc::runningTimeframes(docs);
}

// Decision logs

Result<void> RedisRecordStore::appendDecisionLog(const store::DecisionLogEntry& entry) {
    store::DecisionLogEntry stored = entry;
    stored.createdAt = orNow(entry.createdAt);
    CFGSTORE_TRY(client_->evalInt(
        "append decision log", scripts::kAppendDecisionLog,
        {client_->counterKey(family::kDecisionLogs),
         client_->decisionKey(entry.userId, entry.traderId)},
        withArgs({client_->docKey(family::kDecisionLogs, "")}, doc::fromDecisionLog(stored))));
    return {};
}

Result<std::vector<store::DecisionLogEntry>>
RedisRecordStore::getDecisionLogs(const std::string& userId, const std::string& traderId,
                                  int limit) {
    const auto key = client_->decisionKey(userId, traderId);
    const long long stop = limit > 0 ? limit - 1 : -1;
    CFGSTORE_TRY_UNWRAP(ids, client_->call("ZREVRANGE", [&](sw::redis::Redis& r) {
        std::vector<std::string> out;
        r.zrevrange(key, 0, stop, std::back_inserter(out));
        return out;
    }));
    // Newest first from the sorted set, oldest first for the caller
    std::reverse(ids.begin(), ids.end());
    CFGSTORE_TRY_UNWRAP(docs, loadAll(family::kDecisionLogs, ids));

    std::vector<store::DecisionLogEntry> entries;
    entries.reserve(docs.size());
    for (const auto& d : docs) {
        entries.push_back(doc::toDecisionLog(d));
    }
    return entries;
}

// Beta codes

Result<size_t> RedisRecordStore::loadBetaCodes(const std::vector<std::string>& lines) {
    const auto codes = store::parseBetaCodeLines(lines);
    const auto ts = doc::encodeTime(now());
    size_t inserted = 0;
    for (const auto& code : codes) {
        CFGSTORE_TRY_UNWRAP(created,
                            client_->evalInt("insert beta code", scripts::kCreateIfAbsent,
                                             {client_->docKey(family::kBetaCodes, code),
                                              client_->allKey(family::kBetaCodes)},
                                             {code, "code", code, "used", "0", "used_by", "",
                                              "used_at", "", "created_at", ts}));
        inserted += created > 0 ? 1 : 0;
    }
    if (!codes.empty()) {
        spdlog::info("Loaded {} new beta code(s) from {} candidate(s)", inserted, codes.size());
    }
    return inserted;
}

Result<bool> RedisRecordStore::validateBetaCode(const std::string& code) {
    const auto key = client_->docKey(family::kBetaCodes, code);
    CFGSTORE_TRY_UNWRAP(used, client_->call("HGET beta code", [&](sw::redis::Redis& r) {
        return r.hget(key, "used");
    }));
    return used && *used == "0";
}

Result<void> RedisRecordStore::claimBetaCode(const std::string& code, const std::string& email) {
    CFGSTORE_TRY_UNWRAP(claimed, client_->evalInt("claim beta code", scripts::kClaimBetaCode,
                                                  {client_->docKey(family::kBetaCodes, code)},
                                                  {email, doc::encodeTime(now())}));
    if (claimed == 0) {
        return Error{ErrorCode::InvalidOrUsed, "Beta code invalid or already used"};
    }
    return {};
}

Result<store::BetaCodeStats> RedisRecordStore::betaCodeStats() {
    CFGSTORE_TRY_UNWRAP(codes, members(client_->allKey(family::kBetaCodes)));
    store::BetaCodeStats stats;
    for (const auto& code : codes) {
        const auto key = client_->docKey(family::kBetaCodes, code);
        CFGSTORE_TRY_UNWRAP(used, client_->call("HGET beta code", [&](sw::redis::Redis& r) {
            return r.hget(key, "used");
        }));
        if (!used)
            continue;
        stats.total++;
        if (*used == "1")
            stats.used++;
    }
    return stats;
}

// Seeding

Result<bool> RedisRecordStore::insertAIModelIfAbsent(const AIModelConfig& model) {
    AIModelConfig sealed = model;
    sealed.apiKey = vault()->encryptForStorage(model.apiKey);
    sealed.createdAt = orNow(model.createdAt);
    sealed.updatedAt = orNow(model.updatedAt);
    return insertIndexed(family::kAIModels, model.userId, model.modelId,
                         doc::fromAIModel(sealed));
}

Result<bool> RedisRecordStore::insertExchangeIfAbsent(const ExchangeConfig& exchange) {
    auto v = vault();
    ExchangeConfig sealed = exchange;
    sealed.apiKey = v->encryptForStorage(exchange.apiKey);
    sealed.secretKey = v->encryptForStorage(exchange.secretKey);
    sealed.asterPrivateKey = v->encryptForStorage(exchange.asterPrivateKey);
    sealed.createdAt = orNow(exchange.createdAt);
    sealed.updatedAt = orNow(exchange.updatedAt);
    return insertIndexed(family::kExchanges, exchange.userId, exchange.exchangeId,
                         doc::fromExchange(sealed));
}

Result<bool> RedisRecordStore::insertUserIfAbsent(const User& user) {
    User stored = user;
    stored.createdAt = orNow(user.createdAt);
    stored.updatedAt = orNow(user.updatedAt);
    CFGSTORE_TRY_UNWRAP(created,
                        client_->evalInt("create user", scripts::kCreateUser,
                                         {client_->docKey(family::kUsers, user.id),
                                          client_->indexKey(family::kUsers),
                                          client_->allKey(family::kUsers)},
                                         withArgs({user.id, user.email}, doc::fromUser(stored))));
    return created > 0;
}

} // namespace cfgstore::redis
