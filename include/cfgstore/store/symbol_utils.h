#pragma once

#include <cfgstore/core/types.h>

#include <string>
#include <string_view>
#include <vector>

namespace cfgstore::store {

/// Split a comma separated list, trimming items and dropping empty ones
std::vector<std::string> splitCsv(std::string_view csv);

/// Trim, upper-case and append `USDT` when missing ("btc" -> "BTCUSDT")
std::string normalizeSymbol(std::string_view symbol);

/// Parse a JSON array of strings such as the `default_coins` setting
Result<std::vector<std::string>> parseCoinList(const std::string& json);

} // namespace cfgstore::store
