/*
 * Part of the LoRaKeys (LK) project.
 *
 * SPDX-FileCopyrightText: 2025 LoRaKeys contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of LoRaKeys (LK). See LICENSE for details.
 */

#pragma once
#include <string>
#include <optional>
#include <chrono>

namespace lk::internal {

/**
 * Distributed cache + advisory lock provider.
 * Implementations must be thread-safe and read from the authoritative node.
 * Faults (unreachable server, error replies) are thrown as lk::StoreError.
 */
class CacheStore {
public:
    using duration = std::chrono::milliseconds;

    virtual ~CacheStore() = default;

    // Non-blocking. False if the lock is held by another token within its lease.
    virtual bool try_acquire_lock(const std::string& key, const std::string& token,
                                  duration lease) = 0;

    // Idempotent. No-op if not held, or held by a different token.
    virtual void release_lock(const std::string& key, const std::string& token) = 0;

    virtual std::optional<std::string> get(const std::string& key) = 0;
    virtual void set(const std::string& key, const std::string& value, duration ttl) = 0;
    virtual void del(const std::string& key) = 0;
};

} // namespace lk::internal
