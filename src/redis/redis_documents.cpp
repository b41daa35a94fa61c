#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cctype>
#include <cfgstore/crypto/credential_vault.h>
#include <cfgstore/redis/redis_documents.h>

namespace cfgstore::redis::doc {

using namespace store;

const FieldDefaults& additiveFields(const std::string& familyName) {
    static const FieldDefaults aiModels = {{"custom_model_name", ""}};
    static const FieldDefaults exchanges = {{"hyperliquid_wallet_addr", ""},
                                            {"aster_user", ""},
                                            {"aster_signer", ""},
                                            {"aster_private_key", ""}};
    static const FieldDefaults traders = {
        {"btc_eth_leverage", "0"},      {"altcoin_leverage", "0"},
        {"trading_symbols", ""},        {"system_prompt_template", ""},
        {"taker_fee_rate", "0"},        {"maker_fee_rate", "0"},
        {"order_strategy", ""},         {"limit_price_offset", "0"},
        {"limit_timeout_seconds", "0"}, {"timeframes", ""}};
    static const FieldDefaults none;

    if (familyName == family::kAIModels)
        return aiModels;
    if (familyName == family::kExchanges)
        return exchanges;
    if (familyName == family::kTraders)
        return traders;
    return none;
}

const std::vector<std::string>& requiredFields(const std::string& familyName) {
    static const std::vector<std::string> aiModels = {"id",       "model_id", "user_id", "name",
                                                      "provider", "enabled",  "api_key"};
    static const std::vector<std::string> exchanges = {
        "id", "exchange_id", "user_id", "name", "type", "enabled", "api_key", "secret_key"};
    static const std::vector<std::string> traders = {
        "id", "user_id", "name", "ai_model_id", "exchange_id", "initial_balance", "is_running"};
    static const std::vector<std::string> none;

    if (familyName == family::kAIModels)
        return aiModels;
    if (familyName == family::kExchanges)
        return exchanges;
    if (familyName == family::kTraders)
        return traders;
    return none;
}

std::string field(const Document& d, const std::string& name, const std::string& fallback) {
    auto it = d.find(name);
    return it == d.end() ? fallback : it->second;
}

int64_t fieldInt(const Document& d, const std::string& name, int64_t fallback) {
    auto it = d.find(name);
    if (it == d.end() || it->second.empty())
        return fallback;
    try {
        return std::stoll(it->second);
    } catch (const std::exception&) {
        return fallback;
    }
}

double fieldDouble(const Document& d, const std::string& name, double fallback) {
    auto it = d.find(name);
    if (it == d.end() || it->second.empty())
        return fallback;
    try {
        return std::stod(it->second);
    } catch (const std::exception&) {
        return fallback;
    }
}

bool fieldBool(const Document& d, const std::string& name, bool fallback) {
    auto it = d.find(name);
    if (it == d.end() || it->second.empty())
        return fallback;
    return it->second == "1" || it->second == "true";
}

std::string encodeBool(bool value) {
    return value ? "1" : "0";
}

std::string encodeTime(TimePoint tp) {
    return std::to_string(
        std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count());
}

std::string encodeDouble(double value) {
    return fmt::format("{}", value);
}

bool isInteger(const std::string& value) {
    return !value.empty() &&
           std::all_of(value.begin(), value.end(), [](char c) { return c >= '0' && c <= '9'; });
}

std::vector<std::string> flatten(const Document& d) {
    std::vector<std::string> out;
    out.reserve(d.size() * 2);
    for (const auto& [name, value] : d) {
        out.push_back(name);
        out.push_back(value);
    }
    return out;
}

namespace {

TimePoint fieldTime(const Document& d, const std::string& name) {
    return TimePoint{std::chrono::seconds{fieldInt(d, name)}};
}

TimePoint fromSeconds(int64_t seconds) {
    return TimePoint{std::chrono::seconds{seconds}};
}

// Digit runs compare by value, so "t-9" sorts before "t-10"
bool naturalLess(const std::string& a, const std::string& b) {
    size_t i = 0;
    size_t j = 0;
    auto isDigit = [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; };
    while (i < a.size() && j < b.size()) {
        if (isDigit(a[i]) && isDigit(b[j])) {
            size_t endA = i;
            size_t endB = j;
            while (endA < a.size() && isDigit(a[endA]))
                ++endA;
            while (endB < b.size() && isDigit(b[endB]))
                ++endB;
            auto runA = a.substr(i, endA - i);
            auto runB = b.substr(j, endB - j);
            runA.erase(0, std::min(runA.find_first_not_of('0'), runA.size()));
            runB.erase(0, std::min(runB.find_first_not_of('0'), runB.size()));
            if (runA.size() != runB.size())
                return runA.size() < runB.size();
            if (runA != runB)
                return runA < runB;
            i = endA;
            j = endB;
            continue;
        }
        if (a[i] != b[j])
            return a[i] < b[j];
        ++i;
        ++j;
    }
    if ((a.size() - i) != (b.size() - j))
        return (a.size() - i) < (b.size() - j);
    return a < b;
}

} // namespace

Document fromUser(const User& user) {
    return {{"id", user.id},
            {"email", user.email},
            {"password_hash", user.passwordHash},
            {"otp_secret", user.otpSecret},
            {"otp_verified", encodeBool(user.otpVerified)},
            {"created_at", encodeTime(user.createdAt)},
            {"updated_at", encodeTime(user.updatedAt)}};
}

User toUser(const Document& d) {
    User user;
    user.id = field(d, "id");
    user.email = field(d, "email");
    user.passwordHash = field(d, "password_hash");
    user.otpSecret = field(d, "otp_secret");
    user.otpVerified = fieldBool(d, "otp_verified");
    user.createdAt = fieldTime(d, "created_at");
    user.updatedAt = fieldTime(d, "updated_at");
    return user;
}

Document fromAIModel(const AIModelConfig& model) {
    return {{"model_id", model.modelId},
            {"user_id", model.userId},
            {"display_name", model.displayName.empty() ? model.name : model.displayName},
            {"name", model.name},
            {"provider", model.provider},
            {"enabled", encodeBool(model.enabled)},
            {"api_key", model.apiKey},
            {"custom_api_url", model.customApiUrl},
            {"custom_model_name", model.customModelName},
            {"created_at", encodeTime(model.createdAt)},
            {"updated_at", encodeTime(model.updatedAt)}};
}

AIModelConfig toAIModel(const Document& d) {
    AIModelConfig model;
    model.id = fieldInt(d, "id");
    model.modelId = field(d, "model_id");
    model.userId = field(d, "user_id");
    model.displayName = field(d, "display_name");
    model.name = field(d, "name");
    model.provider = field(d, "provider");
    model.enabled = fieldBool(d, "enabled");
    model.apiKey = field(d, "api_key");
    model.customApiUrl = field(d, "custom_api_url");
    model.customModelName = field(d, "custom_model_name");
    model.createdAt = fieldTime(d, "created_at");
    model.updatedAt = fieldTime(d, "updated_at");
    return model;
}

Document fromExchange(const ExchangeConfig& exchange) {
    return {{"exchange_id", exchange.exchangeId},
            {"user_id", exchange.userId},
            {"display_name", exchange.displayName.empty() ? exchange.name : exchange.displayName},
            {"name", exchange.name},
            {"type", exchange.type},
            {"enabled", encodeBool(exchange.enabled)},
            {"api_key", exchange.apiKey},
            {"secret_key", exchange.secretKey},
            {"testnet", encodeBool(exchange.testnet)},
            {"hyperliquid_wallet_addr", exchange.hyperliquidWalletAddr},
            {"aster_user", exchange.asterUser},
            {"aster_signer", exchange.asterSigner},
            {"aster_private_key", exchange.asterPrivateKey},
            {"created_at", encodeTime(exchange.createdAt)},
            {"updated_at", encodeTime(exchange.updatedAt)}};
}

ExchangeConfig toExchange(const Document& d) {
    ExchangeConfig exchange;
    exchange.id = fieldInt(d, "id");
    exchange.exchangeId = field(d, "exchange_id");
    exchange.userId = field(d, "user_id");
    exchange.displayName = field(d, "display_name");
    exchange.name = field(d, "name");
    exchange.type = field(d, "type");
    exchange.enabled = fieldBool(d, "enabled");
    exchange.apiKey = field(d, "api_key");
    exchange.secretKey = field(d, "secret_key");
    exchange.testnet = fieldBool(d, "testnet");
    exchange.hyperliquidWalletAddr = field(d, "hyperliquid_wallet_addr");
    exchange.asterUser = field(d, "aster_user");
    exchange.asterSigner = field(d, "aster_signer");
    exchange.asterPrivateKey = field(d, "aster_private_key");
    exchange.createdAt = fieldTime(d, "created_at");
    exchange.updatedAt = fieldTime(d, "updated_at");
    return exchange;
}

Document fromTrader(const TraderRecord& trader) {
    return {{"id", trader.id},
            {"user_id", trader.userId},
            {"name", trader.name},
            {"ai_model_id", std::to_string(trader.aiModelId)},
            {"exchange_id", std::to_string(trader.exchangeId)},
            {"initial_balance", encodeDouble(trader.initialBalance)},
            {"scan_interval_minutes", std::to_string(trader.scanIntervalMinutes)},
            {"is_running", encodeBool(trader.isRunning)},
            {"btc_eth_leverage", std::to_string(trader.btcEthLeverage)},
            {"altcoin_leverage", std::to_string(trader.altcoinLeverage)},
            {"trading_symbols", trader.tradingSymbols},
            {"use_coin_pool", encodeBool(trader.useCoinPool)},
            {"use_oi_top", encodeBool(trader.useOiTop)},
            {"custom_prompt", trader.customPrompt},
            {"override_base_prompt", encodeBool(trader.overrideBasePrompt)},
            {"system_prompt_template", trader.systemPromptTemplate},
            {"is_cross_margin", encodeBool(trader.isCrossMargin)},
            {"taker_fee_rate", encodeDouble(trader.takerFeeRate)},
            {"maker_fee_rate", encodeDouble(trader.makerFeeRate)},
            {"order_strategy", trader.orderStrategy},
            {"limit_price_offset", encodeDouble(trader.limitPriceOffset)},
            {"limit_timeout_seconds", std::to_string(trader.limitTimeoutSeconds)},
            {"timeframes", trader.timeframes},
            {"created_at", encodeTime(trader.createdAt)},
            {"updated_at", encodeTime(trader.updatedAt)}};
}

TraderRecord toTrader(const Document& d) {
    TraderRecord trader;
    trader.id = field(d, "id");
    trader.userId = field(d, "user_id");
    trader.name = field(d, "name");
    trader.aiModelId = fieldInt(d, "ai_model_id");
    trader.exchangeId = fieldInt(d, "exchange_id");
    trader.initialBalance = fieldDouble(d, "initial_balance");
    trader.scanIntervalMinutes = static_cast<int>(fieldInt(d, "scan_interval_minutes", 3));
    trader.isRunning = fieldBool(d, "is_running");
    trader.btcEthLeverage = static_cast<int>(fieldInt(d, "btc_eth_leverage"));
    trader.altcoinLeverage = static_cast<int>(fieldInt(d, "altcoin_leverage"));
    trader.tradingSymbols = field(d, "trading_symbols");
    trader.useCoinPool = fieldBool(d, "use_coin_pool");
    trader.useOiTop = fieldBool(d, "use_oi_top");
    trader.customPrompt = field(d, "custom_prompt");
    trader.overrideBasePrompt = fieldBool(d, "override_base_prompt");
    trader.systemPromptTemplate = field(d, "system_prompt_template");
    trader.isCrossMargin = fieldBool(d, "is_cross_margin", true);
    trader.takerFeeRate = fieldDouble(d, "taker_fee_rate");
    trader.makerFeeRate = fieldDouble(d, "maker_fee_rate");
    trader.orderStrategy = field(d, "order_strategy");
    trader.limitPriceOffset = fieldDouble(d, "limit_price_offset");
    trader.limitTimeoutSeconds = static_cast<int>(fieldInt(d, "limit_timeout_seconds"));
    trader.timeframes = field(d, "timeframes");
    trader.createdAt = fieldTime(d, "created_at");
    trader.updatedAt = fieldTime(d, "updated_at");
    applyTraderDefaults(trader);
    return trader;
}

UserSignalSource toSignalSource(const Document& d) {
    UserSignalSource source;
    source.id = fieldInt(d, "id");
    source.userId = field(d, "user_id");
    source.coinPoolUrl = field(d, "coin_pool_url");
    source.oiTopUrl = field(d, "oi_top_url");
    source.createdAt = fieldTime(d, "created_at");
    source.updatedAt = fieldTime(d, "updated_at");
    return source;
}

Document fromDecisionLog(const DecisionLogEntry& entry) {
    return {{"user_id", entry.userId},
            {"trader_id", entry.traderId},
            {"record", entry.record},
            {"created_at", encodeTime(entry.createdAt)}};
}

DecisionLogEntry toDecisionLog(const Document& d) {
    DecisionLogEntry entry;
    entry.id = fieldInt(d, "id");
    entry.userId = field(d, "user_id");
    entry.traderId = field(d, "trader_id");
    entry.record = field(d, "record");
    entry.createdAt = fieldTime(d, "created_at");
    return entry;
}

Document fromLegacyAIModel(const LegacyAIModelRow& row) {
    AIModelConfig model;
    model.modelId = row.id;
    model.userId = row.userId;
    model.name = row.name;
    model.provider = row.provider;
    model.enabled = row.enabled;
    model.apiKey = row.apiKey;
    model.customApiUrl = row.customApiUrl;
    model.customModelName = row.customModelName;
    model.createdAt = fromSeconds(row.createdAt);
    model.updatedAt = fromSeconds(row.updatedAt);
    return fromAIModel(model);
}

Document fromLegacyExchange(const LegacyExchangeRow& row) {
    ExchangeConfig exchange;
    exchange.exchangeId = row.id;
    exchange.userId = row.userId;
    exchange.name = row.name;
    exchange.type = row.type;
    exchange.enabled = row.enabled;
    exchange.apiKey = row.apiKey;
    exchange.secretKey = row.secretKey;
    exchange.testnet = row.testnet;
    exchange.hyperliquidWalletAddr = row.hyperliquidWalletAddr;
    exchange.asterUser = row.asterUser;
    exchange.asterSigner = row.asterSigner;
    exchange.asterPrivateKey = row.asterPrivateKey;
    exchange.createdAt = fromSeconds(row.createdAt);
    exchange.updatedAt = fromSeconds(row.updatedAt);
    return fromExchange(exchange);
}

Document aiModelUpdateFields(bool enabled, const std::string& apiKey,
                             const std::string& customApiUrl,
                             const std::string& customModelName,
                             const crypto::CredentialVault& vault, TimePoint at) {
    Document fields{{"enabled", encodeBool(enabled)},
                    {"custom_api_url", customApiUrl},
                    {"custom_model_name", customModelName},
                    {"updated_at", encodeTime(at)}};
    if (!apiKey.empty())
        fields["api_key"] = vault.encryptForStorage(apiKey);
    return fields;
}

Document exchangeUpdateFields(const ExchangeUpdate& update, const crypto::CredentialVault& vault,
                              TimePoint at) {
    Document fields{{"enabled", encodeBool(update.enabled)},
                    {"testnet", encodeBool(update.testnet)},
                    {"hyperliquid_wallet_addr", update.hyperliquidWalletAddr},
                    {"aster_user", update.asterUser},
                    {"aster_signer", update.asterSigner},
                    {"updated_at", encodeTime(at)}};
    if (!update.apiKey.empty())
        fields["api_key"] = vault.encryptForStorage(update.apiKey);
    if (!update.secretKey.empty())
        fields["secret_key"] = vault.encryptForStorage(update.secretKey);
    if (!update.asterPrivateKey.empty())
        fields["aster_private_key"] = vault.encryptForStorage(update.asterPrivateKey);
    return fields;
}

bool newerTraderFirst(const TraderRecord& a, const TraderRecord& b) {
    if (a.createdAt != b.createdAt)
        return a.createdAt > b.createdAt;
    return naturalLess(b.id, a.id);
}

std::vector<std::string> runningTimeframes(const std::vector<Document>& traders) {
    std::vector<std::string> timeframes;
    for (const auto& d : traders) {
        if (!fieldBool(d, "is_running"))
            continue;
        auto value = field(d, "timeframes");
        if (!value.empty())
            timeframes.push_back(std::move(value));
    }
    return timeframes;
}

} // namespace cfgstore::redis::doc
