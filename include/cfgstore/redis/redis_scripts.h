#pragma once

/**
 * @file redis_scripts.h
 * @brief Lua scripts that make multi-key document writes atomic
 */

namespace cfgstore::redis::scripts {

/**
 * Insert a document under an allocated id unless its business key is indexed.
 * KEYS: index hash, counter, owner set, family set
 * ARGV: index field, document key prefix, field/value pairs...
 * Returns the new id, or the negated existing id.
 */
inline constexpr const char* kInsertIndexed = R"(
local existing = redis.call('HGET', KEYS[1], ARGV[1])
if existing then
    return -tonumber(existing)
end
local id = redis.call('INCR', KEYS[2])
redis.call('HSET', ARGV[2] .. id, 'id', id, unpack(ARGV, 3))
redis.call('HSET', KEYS[1], ARGV[1], id)
redis.call('SADD', KEYS[3], id)
redis.call('SADD', KEYS[4], id)
return id
)";

/**
 * Append a decision log document and index it under its trader.
 * KEYS: counter, trader log sorted set
 * ARGV: document key prefix, field/value pairs...
 * Returns the new id.
 */
inline constexpr const char* kAppendDecisionLog = R"(
local id = redis.call('INCR', KEYS[1])
redis.call('HSET', ARGV[1] .. id, 'id', id, unpack(ARGV, 2))
redis.call('ZADD', KEYS[2], id, id)
return id
)";

/**
 * Update fields of a document owned by the given user.
 * KEYS: document
 * ARGV: user id, field/value pairs...
 * Returns 1 when updated, 0 when missing or owned by someone else.
 */
inline constexpr const char* kUpdateOwned = R"(
if redis.call('HGET', KEYS[1], 'user_id') ~= ARGV[1] then
    return 0
end
redis.call('HSET', KEYS[1], unpack(ARGV, 2))
return 1
)";

/**
 * Update fields of an existing document.
 * KEYS: document
 * ARGV: field/value pairs...
 */
inline constexpr const char* kUpdateExisting = R"(
if redis.call('EXISTS', KEYS[1]) == 0 then
    return 0
end
redis.call('HSET', KEYS[1], unpack(ARGV))
return 1
)";

/**
 * Create a document unless its key exists, adding the member to every set.
 * KEYS: document, sets...
 * ARGV: member, field/value pairs...
 */
inline constexpr const char* kCreateIfAbsent = R"(
if redis.call('EXISTS', KEYS[1]) == 1 then
    return 0
end
redis.call('HSET', KEYS[1], unpack(ARGV, 2))
for i = 2, #KEYS do
    redis.call('SADD', KEYS[i], ARGV[1])
end
return 1
)";

/**
 * Create a user; the email index makes addresses unique.
 * KEYS: document, email index, user set
 * ARGV: id, email, field/value pairs...
 * Returns 1 created, 0 id taken, -1 email taken.
 */
inline constexpr const char* kCreateUser = R"(
if redis.call('EXISTS', KEYS[1]) == 1 then
    return 0
end
if redis.call('HSETNX', KEYS[2], ARGV[2], ARGV[1]) == 0 then
    return -1
end
redis.call('HSET', KEYS[1], unpack(ARGV, 3))
redis.call('SADD', KEYS[3], ARGV[1])
return 1
)";

/**
 * Delete a document owned by the given user.
 * KEYS: document, owner set, family set
 * ARGV: user id, member
 */
inline constexpr const char* kDeleteOwned = R"(
if redis.call('HGET', KEYS[1], 'user_id') ~= ARGV[1] then
    return 0
end
redis.call('DEL', KEYS[1])
redis.call('SREM', KEYS[2], ARGV[2])
redis.call('SREM', KEYS[3], ARGV[2])
return 1
)";

/**
 * Claim an unused beta code.
 * KEYS: code document
 * ARGV: email, timestamp
 */
inline constexpr const char* kClaimBetaCode = R"(
if redis.call('HGET', KEYS[1], 'used') ~= '0' then
    return 0
end
redis.call('HSET', KEYS[1], 'used', '1', 'used_by', ARGV[1], 'used_at', ARGV[2])
return 1
)";

/**
 * Create or update a user's signal source.
 * KEYS: document, counter
 * ARGV: user id, coin pool url, oi top url, timestamp
 */
inline constexpr const char* kUpsertSignalSource = R"(
if redis.call('EXISTS', KEYS[1]) == 0 then
    local id = redis.call('INCR', KEYS[2])
    redis.call('HSET', KEYS[1], 'id', id, 'user_id', ARGV[1], 'created_at', ARGV[4])
end
redis.call('HSET', KEYS[1], 'coin_pool_url', ARGV[2], 'oi_top_url', ARGV[3], 'updated_at', ARGV[4])
return 1
)";

} // namespace cfgstore::redis::scripts
