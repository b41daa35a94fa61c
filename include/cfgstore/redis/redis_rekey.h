#pragma once

#include <cfgstore/core/types.h>
#include <cfgstore/store/legacy_rows.h>

#include <string>
#include <vector>

namespace cfgstore::redis {

/// Trader reference values after re-keying
struct TraderRefUpdate {
    std::string traderId;
    std::string userId;
    std::string sourceKey;
    std::string aiModelId;
    std::string exchangeId;
};

/**
 * @brief Rewrite trader references through the legacy id remaps
 *
 * References that already hold integer ids are kept. A string reference
 * resolves in the owner's rows, then the default owner's. IntegrityError
 * when any reference resolves in neither.
 */
Result<std::vector<TraderRefUpdate>>
remapTraderRefs(const std::vector<store::LegacyTraderRefRow>& refs, const store::IdRemap& models,
                const store::IdRemap& exchanges);

/// Remap with placeholder ids, used to check every reference before anything is written
template <typename Row> store::IdRemap provisionalRemap(const std::vector<Row>& rows) {
    store::IdRemap remap;
    int64_t slot = 0;
    for (const auto& row : rows) {
        remap.add(row.userId, row.id, ++slot);
    }
    return remap;
}

} // namespace cfgstore::redis
