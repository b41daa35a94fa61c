#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cfgstore/config/config_helpers.h>
#include <cfgstore/store/symbol_utils.h>

namespace cfgstore::store {

std::vector<std::string> splitCsv(std::string_view csv) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= csv.size()) {
        size_t end = csv.find(',', start);
        if (end == std::string_view::npos)
            end = csv.size();
        auto item = config::trimmed(csv.substr(start, end - start));
        if (!item.empty())
            out.push_back(std::move(item));
        start = end + 1;
    }
    return out;
}

std::string normalizeSymbol(std::string_view symbol) {
    auto s = config::trimmed(symbol);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (!s.empty() && (s.size() < 4 || s.compare(s.size() - 4, 4, "USDT") != 0)) {
        s += "USDT";
    }
    return s;
}

Result<std::vector<std::string>> parseCoinList(const std::string& json) {
    try {
        auto parsed = nlohmann::json::parse(json);
        if (!parsed.is_array()) {
            return Error{ErrorCode::InvalidData, "Coin list is not a JSON array"};
        }
        std::vector<std::string> coins;
        for (const auto& item : parsed) {
            if (!item.is_string()) {
                return Error{ErrorCode::InvalidData, "Coin list contains a non-string entry"};
            }
            coins.push_back(item.get<std::string>());
        }
        return coins;
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorCode::InvalidData, std::string("Invalid coin list JSON: ") + e.what()};
    }
}

} // namespace cfgstore::store
