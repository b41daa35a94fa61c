#pragma once

#include <array>
#include <string>
#include <string_view>
#include <utility>

namespace cfgstore::store::catalog {

struct AIModelEntry {
    const char* modelId;
    const char* name;
    const char* provider;
};

struct ExchangeEntry {
    const char* exchangeId;
    const char* name;
    const char* type;
};

/// AI models seeded for the default owner
inline constexpr std::array<AIModelEntry, 2> kDefaultAIModels{{
    {"deepseek", "DeepSeek", "deepseek"},
    {"qwen", "Qwen", "qwen"},
}};

/// Exchanges seeded for the default owner
inline constexpr std::array<ExchangeEntry, 3> kDefaultExchanges{{
    {"binance", "Binance Futures", "binance"},
    {"hyperliquid", "Hyperliquid", "hyperliquid"},
    {"aster", "Aster DEX", "aster"},
}};

/// System settings seeded when absent
inline constexpr std::array<std::pair<const char*, const char*>, 11> kDefaultSystemSettings{{
    {"beta_mode", "false"},
    {"api_server_port", "8080"},
    {"use_default_coins", "true"},
    {"default_coins",
     R"(["BTCUSDT","ETHUSDT","SOLUSDT","BNBUSDT","XRPUSDT","DOGEUSDT","ADAUSDT","HYPEUSDT"])"},
    {"max_daily_loss", "10.0"},
    {"max_drawdown", "20.0"},
    {"stop_trading_minutes", "60"},
    {"btc_eth_leverage", "5"},
    {"altcoin_leverage", "5"},
    {"jwt_secret", ""},
    {"registration_enabled", "true"},
}};

/// Used by listCustomCoins when default_coins is unusable
inline constexpr std::array<const char*, 4> kFallbackCoins{{"BTCUSDT", "ETHUSDT", "SOLUSDT",
                                                            "BNBUSDT"}};

/**
 * @brief Provider of an AI model key that matched no existing row
 *
 * `deepseek` and `qwen` stand for themselves; otherwise the last
 * `_`-separated segment ("alice_deepseek" -> "deepseek"), which is empty for
 * a key ending in `_`. A key without `_` is its own provider.
 */
std::string inferProvider(std::string_view modelKey);

/// Display name for a provider with no catalog row: "DeepSeek AI", "Qwen AI", "<p> AI"
std::string fallbackModelName(std::string_view provider);

/// model_id for a newly created user model: `<user>_<provider>` when the key is the provider
std::string newModelId(std::string_view userId, std::string_view modelKey,
                       std::string_view provider);

struct ExchangeDescriptor {
    std::string name;
    std::string type;
};

/// Name and type for an exchange created by upsertExchange: known venues, else "<id> Exchange" / cex
ExchangeDescriptor exchangeDescriptor(std::string_view exchangeId);

} // namespace cfgstore::store::catalog
