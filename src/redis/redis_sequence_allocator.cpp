#include <cfgstore/core/result_helpers.h>
#include <cfgstore/redis/redis_sequence_allocator.h>

namespace cfgstore::redis {

namespace {

constexpr const char* kAdvanceScript = R"(
local current = tonumber(redis.call('GET', KEYS[1]) or '0')
local floor = tonumber(ARGV[1])
if current < floor then
    redis.call('SET', KEYS[1], ARGV[1])
    return floor
end
return current
)";

} // namespace

Result<int64_t> RedisSequenceAllocator::next(const std::string& family) {
    const auto key = client_->counterKey(family);
    return client_->call("INCR", [&](sw::redis::Redis& r) -> int64_t { return r.incr(key); });
}

Result<int64_t> RedisSequenceAllocator::current(const std::string& family) {
    const auto key = client_->counterKey(family);
    CFGSTORE_TRY_UNWRAP(value, client_->call("GET", [&](sw::redis::Redis& r) { return r.get(key); }));
    if (!value) {
        return int64_t{0};
    }
    try {
        return static_cast<int64_t>(std::stoll(*value));
    } catch (const std::exception&) {
        return Error{ErrorCode::InvalidData, "Counter " + key + " is not an integer"};
    }
}

Result<void> RedisSequenceAllocator::advanceTo(const std::string& family, int64_t floor) {
    CFGSTORE_TRY(client_->evalInt("advance counter", kAdvanceScript,
                                  {client_->counterKey(family)}, {std::to_string(floor)}));
    return {};
}

} // namespace cfgstore::redis
