#pragma once

#include <cfgstore/core/types.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cfgstore::store {

/// Record family names shared by both backends
namespace family {
inline constexpr const char* kUsers = "users";
inline constexpr const char* kAIModels = "ai_models";
inline constexpr const char* kExchanges = "exchanges";
inline constexpr const char* kTraders = "traders";
inline constexpr const char* kSignalSources = "user_signal_sources";
inline constexpr const char* kSystemConfig = "system_config";
inline constexpr const char* kBetaCodes = "beta_codes";
inline constexpr const char* kCounters = "counters";
inline constexpr const char* kDecisionLogs = "decision_logs";
} // namespace family

/// Owner of the built-in catalog rows
inline constexpr const char* kDefaultOwner = "default";
/// Reserved administrator account
inline constexpr const char* kAdminUserId = "admin";
inline constexpr const char* kAdminEmail = "admin@localhost";

/**
 * @brief User account
 */
struct User {
    std::string id;
    std::string email;
    std::string passwordHash;
    std::string otpSecret;
    bool otpVerified = false;
    TimePoint createdAt;
    TimePoint updatedAt;
};

/**
 * @brief Per-user AI model configuration
 *
 * `modelId` is the model-type key ("deepseek", "alice_qwen"); `id` is the
 * allocator-issued primary key that traders reference.
 */
struct AIModelConfig {
    RecordId id = 0;
    std::string modelId;
    std::string userId;
    std::string displayName;
    std::string name;
    std::string provider;
    bool enabled = false;
    std::string apiKey;
    std::string customApiUrl;
    std::string customModelName;
    TimePoint createdAt;
    TimePoint updatedAt;
};

/**
 * @brief Per-user exchange credentials
 */
struct ExchangeConfig {
    RecordId id = 0;
    std::string exchangeId;
    std::string userId;
    std::string displayName;
    std::string name;
    std::string type;
    bool enabled = false;
    std::string apiKey;
    std::string secretKey;
    bool testnet = false;
    std::string hyperliquidWalletAddr;
    std::string asterUser;
    std::string asterSigner;
    std::string asterPrivateKey;
    TimePoint createdAt;
    TimePoint updatedAt;
};

/**
 * @brief Trader definition
 */
struct TraderRecord {
    std::string id;
    std::string userId;
    std::string name;
    RecordId aiModelId = 0;
    RecordId exchangeId = 0;
    double initialBalance = 0.0;
    int scanIntervalMinutes = 3;
    bool isRunning = false;
    int btcEthLeverage = 0;
    int altcoinLeverage = 0;
    std::string tradingSymbols; ///< comma separated
    bool useCoinPool = false;
    bool useOiTop = false;
    std::string customPrompt;
    bool overrideBasePrompt = false;
    std::string systemPromptTemplate;
    bool isCrossMargin = true;
    double takerFeeRate = 0.0;
    double makerFeeRate = 0.0;
    std::string orderStrategy;
    double limitPriceOffset = 0.0;
    int limitTimeoutSeconds = 0;
    std::string timeframes; ///< comma separated
    TimePoint createdAt;
    TimePoint updatedAt;
};

/// Defaults applied to zero/empty trader fields on every read
namespace trader_defaults {
inline constexpr int kBtcEthLeverage = 5;
inline constexpr int kAltcoinLeverage = 5;
inline constexpr const char* kSystemPromptTemplate = "default";
inline constexpr double kTakerFeeRate = 0.0004;
inline constexpr double kMakerFeeRate = 0.0002;
inline constexpr const char* kOrderStrategy = "conservative_hybrid";
inline constexpr double kLimitPriceOffset = -0.03;
inline constexpr int kLimitTimeoutSeconds = 60;
inline constexpr const char* kTimeframes = "4h";
} // namespace trader_defaults

/**
 * @brief Fill unset trader fields with their read-time defaults
 */
void applyTraderDefaults(TraderRecord& trader);

struct UserSignalSource {
    RecordId id = 0;
    std::string userId;
    std::string coinPoolUrl;
    std::string oiTopUrl;
    TimePoint createdAt;
    TimePoint updatedAt;
};

struct SystemConfigEntry {
    std::string key;
    std::string value;
    TimePoint updatedAt;
};

struct BetaCode {
    std::string code;
    bool used = false;
    std::string usedBy;
    std::optional<TimePoint> usedAt;
    TimePoint createdAt;
};

struct BetaCodeStats {
    int64_t total = 0;
    int64_t used = 0;
};

/**
 * @brief Arguments of upsertExchange / createExchange
 *
 * Empty secret fields on update leave the stored value unchanged.
 */
struct ExchangeUpdate {
    bool enabled = false;
    std::string apiKey;
    std::string secretKey;
    bool testnet = false;
    std::string hyperliquidWalletAddr;
    std::string asterUser;
    std::string asterSigner;
    std::string asterPrivateKey;
};

/**
 * @brief One decision cycle of a trader, kept for later review
 *
 * `record` is the decision as JSON text, stored as given.
 */
struct DecisionLogEntry {
    int64_t id = 0;
    std::string userId;
    std::string traderId;
    std::string record;
    TimePoint createdAt;
};

/**
 * @brief Trader together with the AI model and exchange it references
 */
struct TraderFullConfig {
    TraderRecord trader;
    AIModelConfig aiModel;
    ExchangeConfig exchange;
};

} // namespace cfgstore::store
