#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <utility>

namespace cfgstore::store {

/// ai_models row before integer re-keying
struct LegacyAIModelRow {
    std::string id;
    std::string userId;
    std::string name;
    std::string provider;
    bool enabled = false;
    std::string apiKey;
    std::string customApiUrl;
    std::string customModelName;
    int64_t createdAt = 0;
    int64_t updatedAt = 0;
    std::string sourceKey; ///< document key on key-value backends
};

/// exchanges row before integer re-keying
struct LegacyExchangeRow {
    std::string id;
    std::string userId;
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
    int64_t createdAt = 0;
    int64_t updatedAt = 0;
    std::string sourceKey; ///< document key on key-value backends
};

/// Trader foreign keys as stored before re-keying
struct LegacyTraderRefRow {
    std::string traderId;
    std::string userId;
    std::string aiModelId;
    std::string exchangeId;
    std::string sourceKey;
};

/**
 * @brief (user_id, legacy string id) -> allocator-issued id
 */
class IdRemap {
public:
    void add(const std::string& userId, const std::string& legacyId, int64_t newId) {
        ids_[{userId, legacyId}] = newId;
    }

    /// Looks in the user's rows first, then in the default owner's; 0 when unknown
    int64_t resolve(const std::string& userId, const std::string& legacyId) const;

    size_t size() const { return ids_.size(); }

private:
    std::map<std::pair<std::string, std::string>, int64_t> ids_;
};

} // namespace cfgstore::store
