#pragma once

#include <cfgstore/redis/redis_client.h>
#include <cfgstore/store/sequence_allocator.h>

#include <memory>

namespace cfgstore::redis {

/**
 * @brief Counters kept as `<prefix>:counters:<family>` strings, advanced with INCR
 */
class RedisSequenceAllocator : public store::SequenceAllocator {
public:
    explicit RedisSequenceAllocator(std::shared_ptr<RedisClient> client)
        : client_(std::move(client)) {}

    Result<int64_t> next(const std::string& family) override;
    Result<int64_t> current(const std::string& family) override;
    Result<void> advanceTo(const std::string& family, int64_t floor) override;

private:
    std::shared_ptr<RedisClient> client_;
};

} // namespace cfgstore::redis
