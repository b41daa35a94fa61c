#pragma once

#include <cfgstore/core/types.h>
#include <cfgstore/store/records.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace cfgstore::crypto {
class CredentialVault;
}

namespace cfgstore::store {

/**
 * @brief Typed access to the configuration record families
 *
 * Implementations are safe to call from many threads once open. Each call
 * is atomic for the single record it touches; nothing spans records.
 *
 * Secret fields (api key, secret key, Aster private key) are encrypted on
 * write and decrypted on read through the vault set with
 * setCredentialVault(). Without a vault they are stored as given.
 */
class RecordStore {
public:
    virtual ~RecordStore() = default;

    RecordStore() = default;
    RecordStore(const RecordStore&) = delete;
    RecordStore& operator=(const RecordStore&) = delete;

    virtual void setCredentialVault(std::shared_ptr<const crypto::CredentialVault> vault) = 0;

    // Users
    /// Duplicate when the id or email is taken
    virtual Result<void> createUser(const User& user) = 0;
    virtual Result<User> getUserByEmail(const std::string& email) = 0;
    virtual Result<User> getUserById(const std::string& id) = 0;
    /// All user ids in ascending order
    virtual Result<std::vector<std::string>> listUserIds() = 0;
    virtual Result<void> setUserOtpVerified(const std::string& id, bool verified) = 0;
    virtual Result<void> updateUserPassword(const std::string& id,
                                            const std::string& passwordHash) = 0;
    /// Create the reserved admin account when missing
    Result<void> ensureAdminUser();

    // AI models
    virtual Result<std::vector<AIModelConfig>> listAIModels(const std::string& userId) = 0;

    /**
     * @brief Update a user's AI model, creating it when absent
     *
     * Matches on model_id, then on a legacy provider match. An empty api key
     * leaves the stored key unchanged.
     */
    virtual Result<void> upsertAIModel(const std::string& userId, const std::string& modelKey,
                                       bool enabled, const std::string& apiKey,
                                       const std::string& customApiUrl,
                                       const std::string& customModelName) = 0;

    /// No-op success when (modelId, userId) already exists
    virtual Result<void> createAIModel(const std::string& userId, const std::string& modelId,
                                       const std::string& name, const std::string& provider,
                                       bool enabled, const std::string& apiKey,
                                       const std::string& customApiUrl) = 0;

    // Exchanges
    virtual Result<std::vector<ExchangeConfig>> listExchanges(const std::string& userId) = 0;

    /**
     * @brief Update a user's exchange, creating it from the built-in table when absent
     *
     * Empty secret fields leave the stored values unchanged.
     */
    virtual Result<void> upsertExchange(const std::string& userId, const std::string& exchangeKey,
                                        const ExchangeUpdate& update) = 0;

    /// No-op success when (exchangeId, userId) already exists
    virtual Result<void> createExchange(const std::string& userId, const std::string& exchangeId,
                                        const std::string& name, const std::string& type,
                                        const ExchangeUpdate& fields) = 0;

    // Traders
    /// Duplicate when the id is taken
    virtual Result<void> createTrader(const TraderRecord& trader) = 0;
    /// Newest first, read-time defaults applied
    virtual Result<std::vector<TraderRecord>> listTraders(const std::string& userId) = 0;
    virtual Result<void> setTraderRunning(const std::string& userId, const std::string& id,
                                          bool running) = 0;
    virtual Result<void> updateTrader(const TraderRecord& trader) = 0;
    virtual Result<void> setTraderCustomPrompt(const std::string& userId, const std::string& id,
                                               const std::string& prompt, bool overrideBase) = 0;
    virtual Result<void> setTraderInitialBalance(const std::string& userId, const std::string& id,
                                                 double balance) = 0;
    virtual Result<void> deleteTrader(const std::string& userId, const std::string& id) = 0;
    virtual Result<TraderFullConfig> getTraderFullConfig(const std::string& userId,
                                                         const std::string& traderId) = 0;

    // System settings
    /// NotFound when the key was never set
    virtual Result<std::string> getSystemConfig(const std::string& key) = 0;
    virtual Result<void> setSystemConfig(const std::string& key, const std::string& value) = 0;
    Result<std::string> getSystemConfigOr(const std::string& key, const std::string& fallback);

    // Signal sources
    virtual Result<void> createOrUpdateSignalSource(const std::string& userId,
                                                    const std::string& coinPoolUrl,
                                                    const std::string& oiTopUrl) = 0;
    /// NotFound when the user has no signal source
    virtual Result<void> updateSignalSource(const std::string& userId,
                                            const std::string& coinPoolUrl,
                                            const std::string& oiTopUrl) = 0;
    virtual Result<UserSignalSource> getSignalSource(const std::string& userId) = 0;

    // Aggregates
    /**
     * @brief Symbols configured on any trader, normalized, first occurrence order
     *
     * Falls back to the `default_coins` setting, then to a built-in list when
     * that setting is missing or unparsable.
     */
    Result<std::vector<std::string>> listCustomCoins();

    /// Sorted union of running traders' timeframes; 15m, 1h, 4h when none
    Result<std::vector<std::string>> listActiveTimeframes();

    // Decision logs
    /**
     * @brief Append one decision record of a trader, timestamped now
     *
     * InvalidArgument for an empty user or trader id, InvalidData when
     * @p record is not valid JSON.
     */
    Result<void> saveDecisionLog(const std::string& userId, const std::string& traderId,
                                 const std::string& record);

    /// The newest @p limit records in chronological order; all of them when limit <= 0
    virtual Result<std::vector<DecisionLogEntry>>
    getDecisionLogs(const std::string& userId, const std::string& traderId, int limit) = 0;

    // Beta codes
    /**
     * @brief Insert new codes, ignoring blank lines and `#` comments
     * @return number of codes newly inserted
     */
    virtual Result<size_t> loadBetaCodes(const std::vector<std::string>& lines) = 0;
    Result<size_t> loadBetaCodesFromFile(const std::filesystem::path& path);
    /// false for unknown or used codes
    virtual Result<bool> validateBetaCode(const std::string& code) = 0;
    /// InvalidOrUsed when the code is unknown or already claimed
    virtual Result<void> claimBetaCode(const std::string& code, const std::string& email) = 0;
    virtual Result<BetaCodeStats> betaCodeStats() = 0;

    /// Cached schema generation marker
    virtual int schemaGeneration() const = 0;

    virtual void close() = 0;

protected:
    /// trading_symbols of every trader
    virtual Result<std::vector<std::string>> collectTradingSymbols() = 0;
    /// timeframes of every running trader
    virtual Result<std::vector<std::string>> collectRunningTimeframes() = 0;
    /// Stores an already validated decision record
    virtual Result<void> appendDecisionLog(const DecisionLogEntry& entry) = 0;
};

/**
 * @brief Beta code lines reduced to trimmed codes, blanks and comments dropped
 */
std::vector<std::string> parseBetaCodeLines(const std::vector<std::string>& lines);

} // namespace cfgstore::store
