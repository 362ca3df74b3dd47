/*
 * Part of the LoRaKeys (LK) project.
 *
 * SPDX-FileCopyrightText: 2025 LoRaKeys contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of LoRaKeys (LK). See LICENSE for details.
 */

#pragma once
#include <unordered_map>
#include <functional>
#include <string>
#include <chrono>
#include <mutex>
#include <cstddef>
#include "lk/internal/cache_store.hpp"

namespace lk::internal {

// Single-process cache store: values and lock leases with expiry.
// Only coordinates callers inside this process.
class MemoryStore : public CacheStore {
public:
    using clock = std::chrono::steady_clock;
    using now_fn = std::function<clock::time_point()>;

    MemoryStore();
    // Clock override for tests that need to step past TTLs.
    explicit MemoryStore(now_fn now);

    bool try_acquire_lock(const std::string& key, const std::string& token,
                          duration lease) override;
    void release_lock(const std::string& key, const std::string& token) override;

    std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value, duration ttl) override;
    void del(const std::string& key) override;

    // Periodic GC: drop expired values and leases.
    void gc();

    std::size_t size();

private:
    struct Entry {
        std::string value;
        clock::time_point expires;
        bool has_ttl = false;
    };
    struct Lease {
        std::string token;
        clock::time_point expires;
    };

    now_fn _now;
    std::mutex _mtx;
    std::unordered_map<std::string, Entry> _values;
    std::unordered_map<std::string, Lease> _locks;
};

} // namespace lk::internal
