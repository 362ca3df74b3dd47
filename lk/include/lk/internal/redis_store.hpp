/*
 * Part of the LoRaKeys (LK) project.
 *
 * SPDX-FileCopyrightText: 2025 LoRaKeys contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of LoRaKeys (LK). See LICENSE for details.
 */

#pragma once
#include <memory>
#include <string>
#include <vector>
#include "lk/internal/cache_store.hpp"
#include "lk/internal/redis_pool.hpp"

namespace lk::internal {

/**
 * Redis-backed cache + lock store.
 *  lock:    SET key token NX PX lease
 *  release: compare-and-delete script, a foreign token is left untouched
 * All commands go to the configured primary, never a replica.
 */
class RedisStore : public CacheStore {
public:
    explicit RedisStore(std::shared_ptr<RedisPool> pool);

    bool try_acquire_lock(const std::string& key, const std::string& token,
                          duration lease) override;
    void release_lock(const std::string& key, const std::string& token) override;

    std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value, duration ttl) override;
    void del(const std::string& key) override;

private:
    std::shared_ptr<RedisPool> _pool;

    // Throws StoreError on transport failure or error reply.
    ReplyPtr run(const std::vector<std::string>& argv);
};

} // namespace lk::internal
