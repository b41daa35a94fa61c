#pragma once

#include <cfgstore/store/legacy_rows.h>
#include <cfgstore/store/records.h>

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace cfgstore::crypto {
class CredentialVault;
}

namespace cfgstore::redis {

/// Field map of one hash document
using Document = std::unordered_map<std::string, std::string>;

/**
 * @brief Record <-> hash document mapping
 *
 * Field names match the SQLite column names. Numbers are decimal strings,
 * booleans "0"/"1", timestamps epoch seconds. Secret fields are copied as
 * given; callers seal and unseal them.
 */
namespace doc {

using FieldDefaults = std::vector<std::pair<std::string, std::string>>;

/// Fields added after the first layout, with the value older documents receive
const FieldDefaults& additiveFields(const std::string& family);

/// Fields every document of the family must carry
const std::vector<std::string>& requiredFields(const std::string& family);

std::string field(const Document& d, const std::string& name, const std::string& fallback = "");
int64_t fieldInt(const Document& d, const std::string& name, int64_t fallback = 0);
double fieldDouble(const Document& d, const std::string& name, double fallback = 0.0);
bool fieldBool(const Document& d, const std::string& name, bool fallback = false);

std::string encodeBool(bool value);
std::string encodeTime(TimePoint tp);
std::string encodeDouble(double value);
/// Decimal digits only
bool isInteger(const std::string& value);

/// name, value, name, value... for HSET and Lua ARGV
std::vector<std::string> flatten(const Document& d);

Document fromUser(const store::User& user);
store::User toUser(const Document& d);

Document fromAIModel(const store::AIModelConfig& model);
store::AIModelConfig toAIModel(const Document& d);

Document fromExchange(const store::ExchangeConfig& exchange);
store::ExchangeConfig toExchange(const Document& d);

Document fromTrader(const store::TraderRecord& trader);
/// Read-time defaults applied
store::TraderRecord toTrader(const Document& d);

store::UserSignalSource toSignalSource(const Document& d);

/// Without the id, which the append script assigns
Document fromDecisionLog(const store::DecisionLogEntry& entry);
store::DecisionLogEntry toDecisionLog(const Document& d);

/// Legacy rows as current-layout documents, secret fields copied unchanged
Document fromLegacyAIModel(const store::LegacyAIModelRow& row);
Document fromLegacyExchange(const store::LegacyExchangeRow& row);

/**
 * @brief Field update applied to an existing AI model document
 *
 * The api key is sealed with @p vault and only written when non-empty.
 */
Document aiModelUpdateFields(bool enabled, const std::string& apiKey,
                             const std::string& customApiUrl,
                             const std::string& customModelName,
                             const crypto::CredentialVault& vault, TimePoint at);

/// Same for an exchange: each empty secret leaves the stored value in place
Document exchangeUpdateFields(const store::ExchangeUpdate& update,
                              const crypto::CredentialVault& vault, TimePoint at);

/// listTraders order: newest first, then higher id first (numeric ids compared as numbers)
bool newerTraderFirst(const store::TraderRecord& a, const store::TraderRecord& b);

/// Non-empty raw timeframes of running trader documents
std::vector<std::string> runningTimeframes(const std::vector<Document>& traders);

} // namespace doc
} // namespace cfgstore::redis
