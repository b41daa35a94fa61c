#include <cfgstore/store/catalog.h>

namespace cfgstore::store::catalog {

std::string inferProvider(std::string_view modelKey) {
    if (modelKey == "deepseek" || modelKey == "qwen") {
        return std::string(modelKey);
    }
    auto pos = modelKey.rfind('_');
    if (pos == std::string_view::npos) {
        return std::string(modelKey);
    }
    return std::string(modelKey.substr(pos + 1));
}

std::string fallbackModelName(std::string_view provider) {
    if (provider == "deepseek")
        return "DeepSeek AI";
    if (provider == "qwen")
        return "Qwen AI";
    return std::string(provider) + " AI";
}

std::string newModelId(std::string_view userId, std::string_view modelKey,
                       std::string_view provider) {
    if (modelKey == provider) {
        return std::string(userId) + "_" + std::string(provider);
    }
    return std::string(modelKey);
}

ExchangeDescriptor exchangeDescriptor(std::string_view exchangeId) {
    if (exchangeId == "binance")
        return {"Binance Futures", "cex"};
    if (exchangeId == "hyperliquid")
        return {"Hyperliquid", "dex"};
    if (exchangeId == "aster")
        return {"Aster DEX", "dex"};
    return {std::string(exchangeId) + " Exchange", "cex"};
}

} // namespace cfgstore::store::catalog
