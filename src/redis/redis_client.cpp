#include <spdlog/spdlog.h>
#include <algorithm>
#include <iterator>
#include <cfgstore/redis/redis_client.h>

namespace cfgstore::redis {

ErrorCode translateRedisError(const sw::redis::Error& error) {
    if (dynamic_cast<const sw::redis::TimeoutError*>(&error)) {
        return ErrorCode::Timeout;
    }
    if (dynamic_cast<const sw::redis::ClosedError*>(&error) ||
        dynamic_cast<const sw::redis::IoError*>(&error)) {
        return ErrorCode::ConnectionFailed;
    }
    return ErrorCode::DatabaseError;
}

Result<std::shared_ptr<RedisClient>> RedisClient::connect(const config::StoreConfig& config) {
    try {
        sw::redis::ConnectionOptions options(config.redisUrl);
        options.connect_timeout = config.operationTimeout;
        options.socket_timeout = config.operationTimeout;

        sw::redis::ConnectionPoolOptions poolOptions;
        poolOptions.size = config.poolMax;
        poolOptions.wait_timeout = config.operationTimeout;

        auto redis = std::make_unique<sw::redis::Redis>(options, poolOptions);
        redis->ping();
        spdlog::debug("Connected to Redis at {}:{}", options.host, options.port);
        return std::make_shared<RedisClient>(std::move(redis), config.redisPrefix);
    } catch (const sw::redis::Error& e) {
        return Error{ErrorCode::ConnectionFailed,
                     "Failed to connect to Redis " + config.redisUrl + ": " + e.what()};
    }
}

RedisClient::RedisClient(std::unique_ptr<sw::redis::Redis> redis, std::string prefix)
    : redis_(std::move(redis)), prefix_(std::move(prefix)) {}

std::string RedisClient::docKey(const std::string& family, const std::string& id) const {
    return prefix_ + ":doc:" + family + ":" + id;
}

std::string RedisClient::docPattern(const std::string& family) const {
    return prefix_ + ":doc:" + family + ":*";
}

std::string RedisClient::indexKey(const std::string& family) const {
    return prefix_ + ":idx:" + family;
}

std::string RedisClient::ownerKey(const std::string& family, const std::string& userId) const {
    return prefix_ + ":own:" + family + ":" + userId;
}

std::string RedisClient::allKey(const std::string& family) const {
    return prefix_ + ":all:" + family;
}

std::string RedisClient::counterKey(const std::string& family) const {
    return prefix_ + ":counters:" + family;
}

std::string RedisClient::decisionKey(const std::string& userId,
                                     const std::string& traderId) const {
    return prefix_ + ":decisions:" + userId + ":" + traderId;
}

std::string RedisClient::generationKey() const {
    return prefix_ + ":schema:generation";
}

std::string RedisClient::keyPattern() const {
    return prefix_ + ":*";
}

std::string RedisClient::ownedField(const std::string& userId, const std::string& naturalId) {
    return userId + "|" + naturalId;
}

Result<Document> RedisClient::load(const std::string& key) {
    return call("HGETALL", [&](sw::redis::Redis& r) {
        Document doc;
        r.hgetall(key, std::inserter(doc, doc.begin()));
        return doc;
    });
}

Result<std::vector<std::string>> RedisClient::scanKeys(const std::string& pattern) {
    return call("SCAN", [&](sw::redis::Redis& r) {
        std::vector<std::string> keys;
        long long cursor = 0;
        do {
            cursor = r.scan(cursor, pattern, 200, std::back_inserter(keys));
        } while (cursor != 0);
        // SCAN may return a key more than once
        std::sort(keys.begin(), keys.end());
        keys.erase(std::unique(keys.begin(), keys.end()), keys.end());
        return keys;
    });
}

Result<long long> RedisClient::evalInt(const char* what, const std::string& script,
                                       const std::vector<std::string>& keys,
                                       const std::vector<std::string>& args) {
    return call(what, [&](sw::redis::Redis& r) {
        return r.eval<long long>(script, keys.begin(), keys.end(), args.begin(), args.end());
    });
}

} // namespace cfgstore::redis
