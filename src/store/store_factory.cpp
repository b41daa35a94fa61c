#include <spdlog/spdlog.h>
#include <cfgstore/core/result_helpers.h>
#include <cfgstore/crypto/credential_vault.h>
#include <cfgstore/sqlite/sqlite_record_store.h>
#include <cfgstore/store/store_factory.h>

#ifdef CFGSTORE_WITH_REDIS
#include <cfgstore/redis/redis_record_store.h>
#endif

namespace cfgstore::store {

bool backendAvailable(config::BackendKind kind) {
    switch (kind) {
        case config::BackendKind::Sqlite:
            return true;
        case config::BackendKind::Redis:
#ifdef CFGSTORE_WITH_REDIS
            return true;
#else
            return false;
#endif
    }
    return false;
}

Result<std::unique_ptr<RecordStore>> openRecordStore(const config::StoreConfig& config) {
    CFGSTORE_TRY(config.validate());

    auto vault = crypto::CredentialVault::fromSettings(config.vaultKey, config.vaultPassphrase);
    if (!vault) {
        spdlog::error("Invalid vault configuration: {}", vault.error().message);
        return vault.error();
    }
    if (!vault.value()->hasKey()) {
        spdlog::warn("No vault key configured, secrets are stored as plaintext");
    }

    std::unique_ptr<RecordStore> recordStore;
    switch (config.backend) {
        case config::BackendKind::Sqlite: {
            CFGSTORE_TRY_UNWRAP(sqliteStore, sqlite::SqliteRecordStore::open(config));
            recordStore = std::move(sqliteStore);
            break;
        }
        case config::BackendKind::Redis: {
#ifdef CFGSTORE_WITH_REDIS
            CFGSTORE_TRY_UNWRAP(redisStore, redis::RedisRecordStore::open(config));
            recordStore = std::move(redisStore);
            break;
#else
            return Error{ErrorCode::NotSupported, "cfgstore was built without Redis support"};
#endif
        }
    }
    if (!recordStore) {
        return Error{ErrorCode::InvalidArgument, "Unknown backend"};
    }

    recordStore->setCredentialVault(std::move(vault).value());
    return recordStore;
}

} // namespace cfgstore::store
