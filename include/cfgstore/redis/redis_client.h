#pragma once

#include <cfgstore/config/store_config.h>
#include <cfgstore/core/types.h>
#include <cfgstore/redis/redis_documents.h>

#include <sw/redis++/redis++.h>

#include <memory>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace cfgstore::redis {

/**
 * @brief Map a redis++ exception onto an ErrorCode
 */
ErrorCode translateRedisError(const sw::redis::Error& error);

/**
 * @brief Connection pool and key layout of one Redis-backed store
 *
 * Layout under `<prefix>`:
 *   doc:<family>:<id>       hash document
 *   idx:<family>            unique business key -> id
 *   own:<family>:<user>     ids owned by a user
 *   all:<family>            every id of the family
 *   counters:<family>       INCR sequence
 *   decisions:<user>:<trader> decision log ids scored by id
 *   schema:generation       generation marker
 */
class RedisClient {
public:
    static Result<std::shared_ptr<RedisClient>> connect(const config::StoreConfig& config);

    RedisClient(std::unique_ptr<sw::redis::Redis> redis, std::string prefix);

    RedisClient(const RedisClient&) = delete;
    RedisClient& operator=(const RedisClient&) = delete;

    /**
     * @brief Run a command, converting redis++ exceptions into Error
     */
    template <typename Func>
    auto call(const char* what, Func&& func)
        -> Result<std::invoke_result_t<Func, sw::redis::Redis&>> {
        using R = std::invoke_result_t<Func, sw::redis::Redis&>;
        try {
            if constexpr (std::is_void_v<R>) {
                func(*redis_);
                return Result<void>();
            } else {
                return func(*redis_);
            }
        } catch (const sw::redis::Error& e) {
            return Error{translateRedisError(e), std::string(what) + ": " + e.what()};
        }
    }

    std::string docKey(const std::string& family, const std::string& id) const;
    std::string docPattern(const std::string& family) const;
    std::string indexKey(const std::string& family) const;
    std::string ownerKey(const std::string& family, const std::string& userId) const;
    std::string allKey(const std::string& family) const;
    std::string counterKey(const std::string& family) const;
    std::string decisionKey(const std::string& userId, const std::string& traderId) const;
    std::string generationKey() const;
    std::string keyPattern() const;

    /// Business key field in an index hash: `<user>|<natural id>`
    static std::string ownedField(const std::string& userId, const std::string& naturalId);

    /// HGETALL; empty document when the key is missing
    Result<Document> load(const std::string& key);

    /// Keys matching a pattern, via SCAN
    Result<std::vector<std::string>> scanKeys(const std::string& pattern);

    /// Integer-reply Lua script
    Result<long long> evalInt(const char* what, const std::string& script,
                              const std::vector<std::string>& keys,
                              const std::vector<std::string>& args);

    const std::string& prefix() const { return prefix_; }

private:
    std::unique_ptr<sw::redis::Redis> redis_;
    std::string prefix_;
};

} // namespace cfgstore::redis
