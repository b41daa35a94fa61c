#pragma once

#include <cfgstore/config/store_config.h>
#include <cfgstore/redis/redis_client.h>
#include <cfgstore/redis/redis_schema_manager.h>
#include <cfgstore/redis/redis_sequence_allocator.h>
#include <cfgstore/store/default_data_seeder.h>
#include <cfgstore/store/record_store.h>

#include <memory>
#include <mutex>

namespace cfgstore::redis {

/**
 * @brief RecordStore over hash documents in one Redis keyspace prefix
 *
 * Writes that touch more than one key (document, business-key index,
 * membership sets) run as Lua scripts so each call stays atomic.
 */
class RedisRecordStore : public store::RecordStore, public store::SeedSink {
public:
    static Result<std::unique_ptr<RedisRecordStore>> open(const config::StoreConfig& config);

    ~RedisRecordStore() override = default;

    void setCredentialVault(std::shared_ptr<const crypto::CredentialVault> vault) override;

    Result<void> createUser(const store::User& user) override;
    Result<store::User> getUserByEmail(const std::string& email) override;
    Result<store::User> getUserById(const std::string& id) override;
    Result<std::vector<std::string>> listUserIds() override;
    Result<void> setUserOtpVerified(const std::string& id, bool verified) override;
    Result<void> updateUserPassword(const std::string& id,
                                    const std::string& passwordHash) override;

    Result<std::vector<store::AIModelConfig>> listAIModels(const std::string& userId) override;
    Result<void> upsertAIModel(const std::string& userId, const std::string& modelKey,
                               bool enabled, const std::string& apiKey,
                               const std::string& customApiUrl,
                               const std::string& customModelName) override;
    Result<void> createAIModel(const std::string& userId, const std::string& modelId,
                               const std::string& name, const std::string& provider, bool enabled,
                               const std::string& apiKey,
                               const std::string& customApiUrl) override;

    Result<std::vector<store::ExchangeConfig>> listExchanges(const std::string& userId) override;
    Result<void> upsertExchange(const std::string& userId, const std::string& exchangeKey,
                                const store::ExchangeUpdate& update) override;
    Result<void> createExchange(const std::string& userId, const std::string& exchangeId,
                                const std::string& name, const std::string& type,
                                const store::ExchangeUpdate& fields) override;

    Result<void> createTrader(const store::TraderRecord& trader) override;
    Result<std::vector<store::TraderRecord>> listTraders(const std::string& userId) override;
    Result<void> setTraderRunning(const std::string& userId, const std::string& id,
                                  bool running) override;
    Result<void> updateTrader(const store::TraderRecord& trader) override;
    Result<void> setTraderCustomPrompt(const std::string& userId, const std::string& id,
                                       const std::string& prompt, bool overrideBase) override;
    Result<void> setTraderInitialBalance(const std::string& userId, const std::string& id,
                                         double balance) override;
    Result<void> deleteTrader(const std::string& userId, const std::string& id) override;
    Result<store::TraderFullConfig> getTraderFullConfig(const std::string& userId,
                                                        const std::string& traderId) override;

    Result<std::string> getSystemConfig(const std::string& key) override;
    Result<void> setSystemConfig(const std::string& key, const std::string& value) override;

    Result<void> createOrUpdateSignalSource(const std::string& userId,
                                            const std::string& coinPoolUrl,
                                            const std::string& oiTopUrl) override;
    Result<void> updateSignalSource(const std::string& userId, const std::string& coinPoolUrl,
                                    const std::string& oiTopUrl) override;
    Result<store::UserSignalSource> getSignalSource(const std::string& userId) override;

    Result<std::vector<store::DecisionLogEntry>>
    getDecisionLogs(const std::string& userId, const std::string& traderId, int limit) override;

    Result<size_t> loadBetaCodes(const std::vector<std::string>& lines) override;
    Result<bool> validateBetaCode(const std::string& code) override;
    Result<void> claimBetaCode(const std::string& code, const std::string& email) override;
    Result<store::BetaCodeStats> betaCodeStats() override;

    int schemaGeneration() const override { return schema_->currentGeneration(); }

    /// Connections are returned when the store is destroyed
    void close() override {}

    // SeedSink
    Result<bool> insertAIModelIfAbsent(const store::AIModelConfig& model) override;
    Result<bool> insertExchangeIfAbsent(const store::ExchangeConfig& exchange) override;
    Result<bool> insertSystemConfigIfAbsent(const std::string& key,
                                            const std::string& value) override;
    Result<bool> insertUserIfAbsent(const store::User& user) override;

    RedisSchemaManager& schemaManager() { return *schema_; }
    RedisSequenceAllocator& allocator() { return *allocator_; }
    RedisClient& client() { return *client_; }

protected:
    Result<std::vector<std::string>> collectTradingSymbols() override;
    Result<std::vector<std::string>> collectRunningTimeframes() override;
    Result<void> appendDecisionLog(const store::DecisionLogEntry& entry) override;

private:
    RedisRecordStore(std::shared_ptr<RedisClient> client, const config::StoreConfig& config);

    std::shared_ptr<RedisClient> client_;
    std::unique_ptr<RedisSequenceAllocator> allocator_;
    std::unique_ptr<RedisSchemaManager> schema_;

    mutable std::mutex vaultMutex_;
    std::shared_ptr<const crypto::CredentialVault> vault_;

    std::shared_ptr<const crypto::CredentialVault> vault() const;

    /// Sorted members of a set
    Result<std::vector<std::string>> members(const std::string& setKey);
    /// Documents of the given ids, missing ones skipped
    Result<std::vector<Document>> loadAll(const std::string& family,
                                          const std::vector<std::string>& ids);
    /// Id stored under a business key, 0 when absent
    Result<RecordId> lookupIndexed(const std::string& family, const std::string& userId,
                                   const std::string& naturalId);
    /// Requires the secret fields already sealed
    Result<bool> insertIndexed(const std::string& family, const std::string& userId,
                               const std::string& naturalId, const Document& d);
    /// Field update on an existing document; NotFound when missing
    Result<void> updateExisting(const std::string& key, const Document& fields,
                                const std::string& what);
    /// Field update on a trader owned by userId; NotFound otherwise
    Result<void> updateOwnedTrader(const std::string& userId, const std::string& id,
                                   const Document& fields);

    Result<std::vector<store::TraderRecord>> tradersOf(const std::string& setKey);
    Result<store::User> userByKey(const std::string& key, const std::string& what);
};

} // namespace cfgstore::redis
