#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <iterator>
#include <set>
#include <string_view>
#include <system_error>
#include <cfgstore/core/result_helpers.h>
#include <cfgstore/redis/redis_documents.h>
#include <cfgstore/redis/redis_rekey.h>
#include <cfgstore/redis/redis_schema_manager.h>
#include <cfgstore/redis/redis_scripts.h>

namespace cfgstore::redis {

using store::IdRemap;
using store::LegacyAIModelRow;
using store::LegacyExchangeRow;
using store::LegacyTraderRefRow;
namespace family = store::family;

namespace {

/// Keys written by the re-keying step, removed again when validation fails
struct WrittenDocument {
    std::string docKey;
    std::string indexKey;
    std::string indexField;
    std::string ownerKey;
    std::string allKey;
    std::string member;
};

std::string userOrDefault(const std::string& userId) {
    return userId.empty() ? std::string(store::kDefaultOwner) : userId;
}

} // namespace

RedisSchemaManager::RedisSchemaManager(std::shared_ptr<RedisClient> client,
                                       std::filesystem::path backupDir, bool backupBeforeMigrate)
    : client_(std::move(client)), backupDir_(std::move(backupDir)),
      backupBeforeMigrate_(backupBeforeMigrate) {}

std::vector<RedisSchemaManager::Step> RedisSchemaManager::steps() {
    return {
        {1, "additive_fields", false, [this] { return additiveFieldsPresent(); },
         [this] { return addAdditiveFields(); }},
        {2, "integer_record_ids", true, [this] { return integerIdsPresent(); },
         [this] { return migrateToIntegerIds(); }},
    };
}

Result<int> RedisSchemaManager::readMarker() {
    const auto key = client_->generationKey();
    CFGSTORE_TRY_UNWRAP(value,
                        client_->call("GET generation", [&](sw::redis::Redis& r) { return r.get(key); }));
    if (!value) {
        return 0;
    }
    try {
        return std::stoi(*value);
    } catch (const std::exception&) {
        return Error{ErrorCode::SchemaError, "Unreadable schema generation marker: " + *value};
    }
}

Result<void> RedisSchemaManager::writeMarker(int version) {
    const auto key = client_->generationKey();
    return client_->call("SET generation",
                         [&](sw::redis::Redis& r) { r.set(key, std::to_string(version)); });
}

Result<void> RedisSchemaManager::ensureSchema() {
    CFGSTORE_TRY_UNWRAP(marker, readMarker());
    generation_.store(marker);
    lastRun_.clear();

    if (marker >= kTargetGeneration) {
        spdlog::debug("Redis layout already at generation {}", marker);
        return {};
    }

    bool healed = false;
    for (auto& step : steps()) {
        if (step.version <= marker)
            continue;

        store::MigrationStepReport report;
        report.version = step.version;
        report.name = step.name;
        report.destructive = step.destructive;
        auto start = std::chrono::steady_clock::now();

        auto present = step.detect();
        if (!present) {
            return Error{ErrorCode::SchemaError, "Failed to inspect layout for migration " +
                                                     std::to_string(step.version) + ": " +
                                                     present.error().message};
        }

        if (present.value()) {
            spdlog::info("Migration {} '{}' already in place, recording marker", step.version,
                         step.name);
            report.alreadyPresent = true;
            healed = true;
        } else {
            spdlog::info("Applying migration {} '{}'", step.version, step.name);
            if (step.destructive && backupBeforeMigrate_) {
                auto backup = snapshot(step.name);
                if (!backup) {
                    spdlog::warn("Backup before migration {} failed, continuing: {}",
                                 step.version, backup.error().message);
                } else {
                    report.backupPath = backup.value();
                }
            }

            auto applied = step.apply();
            if (!applied) {
                if (applied.error().code == ErrorCode::IntegrityError) {
                    return applied.error();
                }
                return Error{ErrorCode::SchemaError, "Migration " + std::to_string(step.version) +
                                                         " '" + step.name +
                                                         "' failed: " + applied.error().message};
            }
        }

        auto marked = writeMarker(step.version);
        if (!marked) {
            return Error{ErrorCode::SchemaError, marked.error().message};
        }
        generation_.store(step.version);
        report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        lastRun_.push_back(std::move(report));
    }

    if (healed) {
        CFGSTORE_TRY(validate());
    }
    spdlog::info("Redis layout migrated from generation {} to {}", marker, kTargetGeneration);
    return {};
}

Result<void> RedisSchemaManager::validate() {
    CFGSTORE_TRY_UNWRAP(report, collectIntegrity());
    return report.toResult();
}

Result<store::IntegrityReport> RedisSchemaManager::collectIntegrity() {
    store::IntegrityReport report;

    auto members = [&](const std::string& fam) -> Result<std::vector<std::string>> {
        const auto key = client_->allKey(fam);
        return client_->call("SMEMBERS", [&](sw::redis::Redis& r) {
            std::vector<std::string> out;
            r.smembers(key, std::back_inserter(out));
            return out;
        });
    };

    std::set<std::string> modelIds;
    std::set<std::string> exchangeIds;
    for (const char* fam : {family::kAIModels, family::kExchanges, family::kTraders}) {
        CFGSTORE_TRY_UNWRAP(ids, members(fam));
        const auto& required = doc::requiredFields(fam);
        for (const auto& id : ids) {
            CFGSTORE_TRY_UNWRAP(d, client_->load(client_->docKey(fam, id)));
            if (d.empty()) {
                report.missingFields.push_back(std::string(fam) + ":" + id);
                continue;
            }
            for (const auto& field : required) {
                if (d.find(field) == d.end()) {
                    report.missingFields.push_back(std::string(fam) + ":" + id + "." + field);
                }
            }

            const std::string_view name(fam);
            if (name == family::kAIModels) {
                modelIds.insert(id);
            } else if (name == family::kExchanges) {
                exchangeIds.insert(id);
            } else {
                report.traders++;
                if (modelIds.count(doc::field(d, "ai_model_id")) == 0)
                    report.orphanedAIModelRefs++;
                if (exchangeIds.count(doc::field(d, "exchange_id")) == 0)
                    report.orphanedExchangeRefs++;
            }
        }
    }
    report.aiModels = static_cast<int64_t>(modelIds.size());
    report.exchanges = static_cast<int64_t>(exchangeIds.size());
    return report;
}

Result<std::filesystem::path> RedisSchemaManager::snapshot(const std::string& reason) {
    CFGSTORE_TRY_UNWRAP(keys, client_->scanKeys(client_->keyPattern()));

    nlohmann::json dump = nlohmann::json::object();
    for (const auto& key : keys) {
        CFGSTORE_TRY_UNWRAP(entry, client_->call("snapshot", [&](sw::redis::Redis& r) {
            nlohmann::json item;
            const auto type = r.type(key);
            item["type"] = type;
            if (type == "hash") {
                Document d;
                r.hgetall(key, std::inserter(d, d.begin()));
                item["value"] = d;
            } else if (type == "set") {
                std::vector<std::string> values;
                r.smembers(key, std::back_inserter(values));
                item["value"] = values;
            } else if (type == "string") {
                auto value = r.get(key);
                item["value"] = value ? *value : std::string();
            }
            return item;
        }));
        dump[key] = std::move(entry);
    }

    std::error_code ec;
    std::filesystem::create_directories(backupDir_, ec);
    if (ec) {
        return Error{ErrorCode::WriteError, "Failed to create backup directory " +
                                                backupDir_.string() + ": " + ec.message()};
    }

    auto target = store::backupArtifactPath(backupDir_, "redis-" + client_->prefix(), reason,
                                            ".json");
    std::ofstream out(target);
    if (!out) {
        return Error{ErrorCode::WriteError, "Cannot write backup " + target.string()};
    }
    out << dump.dump(2);
    if (!out) {
        return Error{ErrorCode::WriteError, "Failed writing backup " + target.string()};
    }
    spdlog::info("Saved {} Redis key(s) to {} before {}", keys.size(), target.string(), reason);
    return target;
}

// Generation 1: additive fields

Result<bool> RedisSchemaManager::additiveFieldsPresent() {
    for (const char* fam : {family::kAIModels, family::kExchanges, family::kTraders}) {
        CFGSTORE_TRY_UNWRAP(keys, client_->scanKeys(client_->docPattern(fam)));
        for (const auto& key : keys) {
            CFGSTORE_TRY_UNWRAP(d, client_->load(key));
            for (const auto& [name, _] : doc::additiveFields(fam)) {
                if (d.find(name) == d.end())
                    return false;
            }
        }
    }
    return true;
}

Result<void> RedisSchemaManager::addAdditiveFields() {
    size_t filled = 0;
    for (const char* fam : {family::kAIModels, family::kExchanges, family::kTraders}) {
        CFGSTORE_TRY_UNWRAP(keys, client_->scanKeys(client_->docPattern(fam)));
        for (const auto& key : keys) {
            for (const auto& [name, value] : doc::additiveFields(fam)) {
                CFGSTORE_TRY_UNWRAP(added, client_->call("HSETNX", [&](sw::redis::Redis& r) {
                    return r.hsetnx(key, name, value);
                }));
                filled += added ? 1 : 0;
            }
        }
    }
    spdlog::debug("Filled {} missing document field(s)", filled);
    return {};
}

// Generation 2: integer ids

Result<std::vector<LegacyAIModelRow>> RedisSchemaManager::readLegacyAIModels() {
    CFGSTORE_TRY_UNWRAP(keys, client_->scanKeys(client_->docPattern(family::kAIModels)));
    std::vector<LegacyAIModelRow> rows;
    for (const auto& key : keys) {
        CFGSTORE_TRY_UNWRAP(d, client_->load(key));
        if (d.empty() || d.count("model_id") > 0)
            continue;
        LegacyAIModelRow row;
        row.id = doc::field(d, "id");
        row.userId = userOrDefault(doc::field(d, "user_id"));
        row.name = doc::field(d, "name");
        row.provider = doc::field(d, "provider");
        row.enabled = doc::fieldBool(d, "enabled");
        row.apiKey = doc::field(d, "api_key");
        row.customApiUrl = doc::field(d, "custom_api_url");
        row.customModelName = doc::field(d, "custom_model_name");
        row.createdAt = doc::fieldInt(d, "created_at");
        row.updatedAt = doc::fieldInt(d, "updated_at");
        row.sourceKey = key;
        rows.push_back(std::move(row));
    }
    return rows;
}

Result<std::vector<LegacyExchangeRow>> RedisSchemaManager::readLegacyExchanges() {
    CFGSTORE_TRY_UNWRAP(keys, client_->scanKeys(client_->docPattern(family::kExchanges)));
    std::vector<LegacyExchangeRow> rows;
    for (const auto& key : keys) {
        CFGSTORE_TRY_UNWRAP(d, client_->load(key));
        if (d.empty() || d.count("exchange_id") > 0)
            continue;
        LegacyExchangeRow row;
        row.id = doc::field(d, "id");
        row.userId = userOrDefault(doc::field(d, "user_id"));
        row.name = doc::field(d, "name");
        row.type = doc::field(d, "type");
        row.enabled = doc::fieldBool(d, "enabled");
        row.apiKey = doc::field(d, "api_key");
        row.secretKey = doc::field(d, "secret_key");
        row.testnet = doc::fieldBool(d, "testnet");
        row.hyperliquidWalletAddr = doc::field(d, "hyperliquid_wallet_addr");
        row.asterUser = doc::field(d, "aster_user");
        row.asterSigner = doc::field(d, "aster_signer");
        row.asterPrivateKey = doc::field(d, "aster_private_key");
        row.createdAt = doc::fieldInt(d, "created_at");
        row.updatedAt = doc::fieldInt(d, "updated_at");
        row.sourceKey = key;
        rows.push_back(std::move(row));
    }
    return rows;
}

Result<std::vector<LegacyTraderRefRow>> RedisSchemaManager::readTraderRefs() {
    CFGSTORE_TRY_UNWRAP(keys, client_->scanKeys(client_->docPattern(family::kTraders)));
    std::vector<LegacyTraderRefRow> rows;
    for (const auto& key : keys) {
        CFGSTORE_TRY_UNWRAP(d, client_->load(key));
        if (d.empty())
            continue;
        rows.push_back({doc::field(d, "id"), userOrDefault(doc::field(d, "user_id")),
                        doc::field(d, "ai_model_id"), doc::field(d, "exchange_id"), key});
    }
    return rows;
}

Result<bool> RedisSchemaManager::integerIdsPresent() {
    CFGSTORE_TRY_UNWRAP(models, readLegacyAIModels());
    CFGSTORE_TRY_UNWRAP(exchanges, readLegacyExchanges());
    return models.empty() && exchanges.empty();
}

Result<void> RedisSchemaManager::migrateToIntegerIds() {
    CFGSTORE_TRY_UNWRAP(legacyModels, readLegacyAIModels());
    CFGSTORE_TRY_UNWRAP(legacyExchanges, readLegacyExchanges());
    CFGSTORE_TRY_UNWRAP(traderRefs, readTraderRefs());

    // Every string reference must resolve before the first write
    CFGSTORE_TRY(remapTraderRefs(traderRefs, provisionalRemap(legacyModels),
                                 provisionalRemap(legacyExchanges)));

    std::vector<WrittenDocument> written;
    IdRemap modelRemap;
    IdRemap exchangeRemap;

    auto insert = [&](const std::string& fam, const std::string& userId,
                      const std::string& naturalId, const Document& d,
                      IdRemap& remap) -> Result<void> {
        WrittenDocument w;
        w.indexKey = client_->indexKey(fam);
        w.indexField = RedisClient::ownedField(userId, naturalId);
        w.ownerKey = client_->ownerKey(fam, userId);
        w.allKey = client_->allKey(fam);

        std::vector<std::string> args{w.indexField, client_->docKey(fam, "")};
        auto pairs = doc::flatten(d);
        args.insert(args.end(), pairs.begin(), pairs.end());

        CFGSTORE_TRY_UNWRAP(id, client_->evalInt("re-key document", scripts::kInsertIndexed,
                                                 {w.indexKey, client_->counterKey(fam),
                                                  w.ownerKey, w.allKey},
                                                 args));
        if (id > 0) {
            w.member = std::to_string(id);
            w.docKey = client_->docKey(fam, w.member);
            written.push_back(std::move(w));
            remap.add(userId, naturalId, id);
        } else {
            remap.add(userId, naturalId, -id);
        }
        return {};
    };

    auto rollback = [&](const Error& cause) -> Error {
        spdlog::error("Re-keying failed, removing {} new document(s): {}", written.size(),
                      cause.message);
        for (const auto& w : written) {
            auto undone = client_->call("rollback", [&](sw::redis::Redis& r) {
                r.del(w.docKey);
                r.hdel(w.indexKey, w.indexField);
                r.srem(w.ownerKey, w.member);
                r.srem(w.allKey, w.member);
            });
            if (!undone) {
                spdlog::error("Failed to remove {}: {}", w.docKey, undone.error().message);
            }
        }
        for (const auto& ref : traderRefs) {
            auto restored = client_->call("rollback", [&](sw::redis::Redis& r) {
                r.hset(ref.sourceKey, "ai_model_id", ref.aiModelId);
                r.hset(ref.sourceKey, "exchange_id", ref.exchangeId);
            });
            if (!restored) {
                spdlog::error("Failed to restore trader {}: {}", ref.traderId,
                              restored.error().message);
            }
        }
        return cause;
    };

    for (const auto& row : legacyModels) {
        auto inserted = insert(family::kAIModels, row.userId, row.id, doc::fromLegacyAIModel(row),
                               modelRemap);
        if (!inserted)
            return rollback(inserted.error());
    }

    for (const auto& row : legacyExchanges) {
        auto inserted = insert(family::kExchanges, row.userId, row.id,
                               doc::fromLegacyExchange(row), exchangeRemap);
        if (!inserted)
            return rollback(inserted.error());
    }

    auto updates = remapTraderRefs(traderRefs, modelRemap, exchangeRemap);
    if (!updates)
        return rollback(updates.error());
    for (const auto& update : updates.value()) {
        auto updated = client_->call("remap trader", [&](sw::redis::Redis& r) {
            r.hset(update.sourceKey, "ai_model_id", update.aiModelId);
            r.hset(update.sourceKey, "exchange_id", update.exchangeId);
            r.sadd(client_->ownerKey(family::kTraders, update.userId), update.traderId);
            r.sadd(client_->allKey(family::kTraders), update.traderId);
        });
        if (!updated)
            return rollback(updated.error());
    }

    auto valid = validate();
    if (!valid)
        return rollback(valid.error());

    for (const auto& row : legacyModels) {
        CFGSTORE_TRY(client_->call("drop legacy", [&](sw::redis::Redis& r) { r.del(row.sourceKey); }));
    }
    for (const auto& row : legacyExchanges) {
        CFGSTORE_TRY(client_->call("drop legacy", [&](sw::redis::Redis& r) { r.del(row.sourceKey); }));
    }

    spdlog::info("Re-keyed {} AI model(s) and {} exchange(s) to integer ids", modelRemap.size(),
                 exchangeRemap.size());
    return {};
}

} // namespace cfgstore::redis
