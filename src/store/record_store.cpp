#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>
#include <set>
#include <cfgstore/config/config_helpers.h>
#include <cfgstore/core/result_helpers.h>
#include <cfgstore/store/catalog.h>
#include <cfgstore/store/record_store.h>
#include <cfgstore/store/symbol_utils.h>

namespace cfgstore::store {

void applyTraderDefaults(TraderRecord& trader) {
    using namespace trader_defaults;
    if (trader.btcEthLeverage == 0)
        trader.btcEthLeverage = kBtcEthLeverage;
    if (trader.altcoinLeverage == 0)
        trader.altcoinLeverage = kAltcoinLeverage;
    if (trader.systemPromptTemplate.empty())
        trader.systemPromptTemplate = kSystemPromptTemplate;
    if (trader.takerFeeRate == 0.0)
        trader.takerFeeRate = kTakerFeeRate;
    if (trader.makerFeeRate == 0.0)
        trader.makerFeeRate = kMakerFeeRate;
    if (trader.orderStrategy.empty())
        trader.orderStrategy = kOrderStrategy;
    if (trader.limitPriceOffset == 0.0)
        trader.limitPriceOffset = kLimitPriceOffset;
    if (trader.limitTimeoutSeconds == 0)
        trader.limitTimeoutSeconds = kLimitTimeoutSeconds;
    if (trader.timeframes.empty())
        trader.timeframes = kTimeframes;
}

std::vector<std::string> parseBetaCodeLines(const std::vector<std::string>& lines) {
    std::vector<std::string> codes;
    codes.reserve(lines.size());
    for (const auto& line : lines) {
        auto code = config::trimmed(line);
        if (code.empty() || code.front() == '#')
            continue;
        codes.push_back(std::move(code));
    }
    return codes;
}

Result<void> RecordStore::ensureAdminUser() {
    auto existing = getUserById(kAdminUserId);
    if (existing) {
        return {};
    }
    if (existing.error().code != ErrorCode::NotFound) {
        return existing.error();
    }

    User admin;
    admin.id = kAdminUserId;
    admin.email = kAdminEmail;
    admin.otpVerified = true;
    auto created = createUser(admin);
    // Another process may have created it in between
    if (!created && created.error().code != ErrorCode::Duplicate) {
        return created.error();
    }
    if (created) {
        spdlog::info("Created reserved '{}' user", kAdminUserId);
    }
    return {};
}

Result<std::string> RecordStore::getSystemConfigOr(const std::string& key,
                                                    const std::string& fallback) {
    auto value = getSystemConfig(key);
    if (value) {
        return value;
    }
    if (value.error().code == ErrorCode::NotFound) {
        return fallback;
    }
    return value.error();
}

Result<std::vector<std::string>> RecordStore::listCustomCoins() {
    CFGSTORE_TRY_UNWRAP(symbolLists, collectTradingSymbols());

    std::vector<std::string> coins;
    std::set<std::string> seen;
    for (const auto& csv : symbolLists) {
        for (const auto& raw : splitCsv(csv)) {
            auto coin = normalizeSymbol(raw);
            if (!coin.empty() && seen.insert(coin).second) {
                coins.push_back(std::move(coin));
            }
        }
    }
    if (!coins.empty()) {
        return coins;
    }

    const std::vector<std::string> fallback(catalog::kFallbackCoins.begin(),
                                            catalog::kFallbackCoins.end());
    auto defaultsJson = getSystemConfig("default_coins");
    if (!defaultsJson) {
        if (defaultsJson.error().code == ErrorCode::NotFound)
            return fallback;
        return defaultsJson.error();
    }
    // An explicit empty array is a valid setting
    auto parsed = parseCoinList(defaultsJson.value());
    if (!parsed) {
        spdlog::warn("Unusable default_coins setting ({}), using built-in list",
                     parsed.error().message);
        return fallback;
    }
    return parsed;
}

Result<std::vector<std::string>> RecordStore::listActiveTimeframes() {
    CFGSTORE_TRY_UNWRAP(lists, collectRunningTimeframes());

    std::set<std::string> timeframes;
    for (const auto& csv : lists) {
        for (auto& tf : splitCsv(csv)) {
            timeframes.insert(std::move(tf));
        }
    }
    if (timeframes.empty()) {
        return std::vector<std::string>{"15m", "1h", "4h"};
    }
    return std::vector<std::string>(timeframes.begin(), timeframes.end());
}

Result<void> RecordStore::saveDecisionLog(const std::string& userId,
                                          const std::string& traderId,
                                          const std::string& record) {
    if (userId.empty() || traderId.empty()) {
        return Error{ErrorCode::InvalidArgument, "Decision log needs a user and a trader id"};
    }
    if (!nlohmann::json::accept(record)) {
        return Error{ErrorCode::InvalidData,
                     "Decision record of trader " + traderId + " is not valid JSON"};
    }

    DecisionLogEntry entry;
    entry.userId = userId;
    entry.traderId = traderId;
    entry.record = record;
    entry.createdAt = std::chrono::system_clock::now();
    return appendDecisionLog(entry);
}

Result<size_t> RecordStore::loadBetaCodesFromFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::FileNotFound, "Cannot read beta code file: " + path.string()};
    }
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return loadBetaCodes(lines);
}

} // namespace cfgstore::store
