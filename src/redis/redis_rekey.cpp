#include <spdlog/spdlog.h>
#include <cfgstore/redis/redis_documents.h>
#include <cfgstore/redis/redis_rekey.h>

namespace cfgstore::redis {

Result<std::vector<TraderRefUpdate>>
remapTraderRefs(const std::vector<store::LegacyTraderRefRow>& refs, const store::IdRemap& models,
                const store::IdRemap& exchanges) {
    auto remapOne = [](const store::IdRemap& remap, const std::string& userId,
                       const std::string& ref) -> std::string {
        if (doc::isInteger(ref))
            return ref;
        const auto id = remap.resolve(userId, ref);
        return id == 0 ? std::string() : std::to_string(id);
    };

    std::vector<TraderRefUpdate> updates;
    updates.reserve(refs.size());
    std::string firstUnresolved;
    size_t unresolved = 0;
    for (const auto& ref : refs) {
        TraderRefUpdate update{ref.traderId, ref.userId, ref.sourceKey,
                               remapOne(models, ref.userId, ref.aiModelId),
                               remapOne(exchanges, ref.userId, ref.exchangeId)};
        if (update.aiModelId.empty() || update.exchangeId.empty()) {
            if (unresolved++ == 0) {
                firstUnresolved = ref.traderId + " (model '" + ref.aiModelId + "', exchange '" +
                                  ref.exchangeId + "')";
            }
            continue;
        }
        updates.push_back(std::move(update));
    }

    if (unresolved > 0) {
        spdlog::error("{} trader(s) reference an AI model or exchange that does not exist",
                      unresolved);
        return Error{ErrorCode::IntegrityError,
                     std::to_string(unresolved) +
                         " trader reference(s) cannot be re-keyed, first: " + firstUnresolved};
    }
    return updates;
}

} // namespace cfgstore::redis
