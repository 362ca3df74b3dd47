/*
 * Part of the LoRaKeys (LK) project.
 *
 * SPDX-FileCopyrightText: 2025 LoRaKeys contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of LoRaKeys (LK). See LICENSE for details.
 */

#include "lk/internal/redis_store.hpp"
#include "lk/errors.hpp"

namespace lk::internal {

namespace {
const char* const kReleaseScript =
    "if redis.call('GET', KEYS[1]) == ARGV[1] then "
    "return redis.call('DEL', KEYS[1]) "
    "else return 0 end";
} // namespace

RedisStore::RedisStore(std::shared_ptr<RedisPool> pool)
    : _pool(std::move(pool))
{
    if (!_pool) throw StoreError("redis pool is required");
}

ReplyPtr RedisStore::run(const std::vector<std::string>& argv) {
    std::string err;
    ReplyPtr r = _pool->command(argv, err);
    if (!r) {
        throw StoreError(argv[0] + " " + err);
    }
    if (r->type == REDIS_REPLY_ERROR) {
        throw StoreError(argv[0] + " error: " + std::string(r->str ? r->str : ""));
    }
    return r;
}

bool RedisStore::try_acquire_lock(const std::string& key, const std::string& token,
                                  duration lease)
{
    ReplyPtr r = run({"SET", key, token, "NX", "PX", std::to_string(lease.count())});
    // +OK when taken, nil when someone else holds it
    return r->type == REDIS_REPLY_STATUS;
}

void RedisStore::release_lock(const std::string& key, const std::string& token) {
    (void)run({"EVAL", kReleaseScript, "1", key, token});
}

std::optional<std::string> RedisStore::get(const std::string& key) {
    ReplyPtr r = run({"GET", key});
    if (r->type == REDIS_REPLY_NIL) return std::nullopt;
    if (r->type != REDIS_REPLY_STRING) {
        throw StoreError("GET unexpected reply type " + std::to_string(r->type));
    }
    return std::string(r->str, r->len);
}

void RedisStore::set(const std::string& key, const std::string& value, duration ttl) {
    if (ttl.count() > 0) {
        (void)run({"SET", key, value, "PX", std::to_string(ttl.count())});
    } else {
        (void)run({"SET", key, value});
    }
}

void RedisStore::del(const std::string& key) {
    (void)run({"DEL", key});
}

} // namespace lk::internal
