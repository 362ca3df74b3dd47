/*
 * Part of the LoRaKeys (LK) project.
 *
 * SPDX-FileCopyrightText: 2025 LoRaKeys contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of LoRaKeys (LK). See LICENSE for details.
 */

#include "lk/internal/memory_store.hpp"

namespace lk::internal {

MemoryStore::MemoryStore()
    : _now([]{ return clock::now(); })
{}

MemoryStore::MemoryStore(now_fn now)
    : _now(std::move(now))
{}

bool MemoryStore::try_acquire_lock(const std::string& key,
                                   const std::string& token,
                                   duration lease)
{
    const auto now = _now();
    std::lock_guard<std::mutex> lk(_mtx);
    auto it = _locks.find(key);
    if (it != _locks.end() && now < it->second.expires) {
        return false; // held, lease still running
    }
    _locks[key] = Lease{token, now + lease};
    return true;
}

void MemoryStore::release_lock(const std::string& key, const std::string& token) {
    std::lock_guard<std::mutex> lk(_mtx);
    auto it = _locks.find(key);
    if (it != _locks.end() && it->second.token == token) {
        _locks.erase(it);
    }
}

std::optional<std::string> MemoryStore::get(const std::string& key) {
    const auto now = _now();
    std::lock_guard<std::mutex> lk(_mtx);
    auto it = _values.find(key);
    if (it == _values.end()) return std::nullopt;
    if (it->second.has_ttl && now >= it->second.expires) {
        _values.erase(it);
        return std::nullopt;
    }
    return it->second.value;
}

// ttl <= 0 keeps the value until deleted.
void MemoryStore::set(const std::string& key, const std::string& value, duration ttl) {
    const auto now = _now();
    std::lock_guard<std::mutex> lk(_mtx);
    Entry e;
    e.value = value;
    e.has_ttl = ttl.count() > 0;
    e.expires = now + ttl;
    _values[key] = std::move(e);
}

void MemoryStore::del(const std::string& key) {
    std::lock_guard<std::mutex> lk(_mtx);
    _values.erase(key);
}

void MemoryStore::gc() {
    const auto now = _now();
    std::lock_guard<std::mutex> lk(_mtx);
    for (auto it = _values.begin(); it != _values.end();) {
        if (it->second.has_ttl && now >= it->second.expires) it = _values.erase(it);
        else ++it;
    }
    for (auto it = _locks.begin(); it != _locks.end();) {
        if (now >= it->second.expires) it = _locks.erase(it);
        else ++it;
    }
}

std::size_t MemoryStore::size() {
    std::lock_guard<std::mutex> lk(_mtx);
    return _values.size();
}

} // namespace lk::internal
