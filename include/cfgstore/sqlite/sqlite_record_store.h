#pragma once

#include <cfgstore/config/store_config.h>
#include <cfgstore/sqlite/connection_pool.h>
#include <cfgstore/sqlite/sqlite_schema_manager.h>
#include <cfgstore/sqlite/sqlite_sequence_allocator.h>
#include <cfgstore/store/default_data_seeder.h>
#include <cfgstore/store/record_store.h>

#include <memory>
#include <mutex>

namespace cfgstore::sqlite {

/**
 * @brief RecordStore over a pooled SQLite database file
 *
 * open() migrates the schema and seeds defaults before returning, so a
 * store handed out is always at the current generation.
 */
class SqliteRecordStore : public store::RecordStore, public store::SeedSink {
public:
    static Result<std::unique_ptr<SqliteRecordStore>> open(const config::StoreConfig& config);

    ~SqliteRecordStore() override;

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

    void close() override;

    // SeedSink
    Result<bool> insertAIModelIfAbsent(const store::AIModelConfig& model) override;
    Result<bool> insertExchangeIfAbsent(const store::ExchangeConfig& exchange) override;
    Result<bool> insertSystemConfigIfAbsent(const std::string& key,
                                            const std::string& value) override;
    Result<bool> insertUserIfAbsent(const store::User& user) override;

    SqliteSchemaManager& schemaManager() { return *schema_; }
    SqliteSequenceAllocator& allocator() { return *allocator_; }
    ConnectionPool& pool() { return *pool_; }

protected:
    Result<std::vector<std::string>> collectTradingSymbols() override;
    Result<std::vector<std::string>> collectRunningTimeframes() override;
    Result<void> appendDecisionLog(const store::DecisionLogEntry& entry) override;

private:
    SqliteRecordStore(std::unique_ptr<ConnectionPool> pool, const config::StoreConfig& config);

    std::unique_ptr<ConnectionPool> pool_;
    std::unique_ptr<SqliteSequenceAllocator> allocator_;
    std::unique_ptr<SqliteSchemaManager> schema_;

    mutable std::mutex vaultMutex_;
    std::shared_ptr<const crypto::CredentialVault> vault_;

    std::shared_ptr<const crypto::CredentialVault> vault() const;

    /// Requires the secret fields already sealed
    Result<bool> insertAIModelOn(Database& db, const store::AIModelConfig& model);
    Result<bool> insertExchangeOn(Database& db, const store::ExchangeConfig& exchange);

    Result<store::AIModelConfig> aiModelById(Database& db, RecordId id);
    Result<store::ExchangeConfig> exchangeById(Database& db, RecordId id);

    /// Runs an UPDATE and maps zero affected rows to NotFound
    Result<void> updateOne(Statement& stmt, Database& db, const std::string& what);
};

} // namespace cfgstore::sqlite
