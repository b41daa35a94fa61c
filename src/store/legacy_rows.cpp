#include <cfgstore/store/legacy_rows.h>
#include <cfgstore/store/records.h>

namespace cfgstore::store {

int64_t IdRemap::resolve(const std::string& userId, const std::string& legacyId) const {
    auto it = ids_.find({userId, legacyId});
    if (it != ids_.end())
        return it->second;
    it = ids_.find({kDefaultOwner, legacyId});
    if (it != ids_.end())
        return it->second;
    return 0;
}

} // namespace cfgstore::store
