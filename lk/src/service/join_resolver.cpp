/*
 * Part of the LoRaKeys (LK) project.
 *
 * SPDX-FileCopyrightText: 2025 LoRaKeys contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of LoRaKeys (LK). See LICENSE for details.
 */

#include "lk/join_resolver.hpp"
#include "lk/log.hpp"

#include <exception>

namespace lk {

namespace {

// Holds the join lock for one scope. Release happens in the destructor, so
// every return and every exception out of the critical section frees it.
class JoinLockGuard {
public:
    JoinLockGuard(internal::CacheStore& store, std::string key, std::string token,
                  std::chrono::milliseconds lease)
        : _store(store), _key(std::move(key)), _token(std::move(token))
    {
        _owned = _store.try_acquire_lock(_key, _token, lease);
    }

    ~JoinLockGuard() {
        if (!_owned) return;
        try {
            _store.release_lock(_key, _token);
        } catch (const std::exception& e) {
            // The lease expires on its own; the request outcome stands.
            log_warn("[JOIN] lock release failed key=" + _key + ": " + e.what());
        }
    }

    JoinLockGuard(const JoinLockGuard&) = delete;
    JoinLockGuard& operator=(const JoinLockGuard&) = delete;

    bool owned() const { return _owned; }

private:
    internal::CacheStore& _store;
    std::string _key;
    std::string _token;
    bool _owned = false;
};

} // namespace

JoinResolver::JoinResolver(internal::CacheStore& store, internal::DeviceRegistry& registry)
    : JoinResolver(store, registry, JoinOptions{})
{}

JoinResolver::JoinResolver(internal::CacheStore& store, internal::DeviceRegistry& registry,
                           const JoinOptions& opt)
    : _store(store), _registry(registry), _opt(opt)
{}

std::string JoinResolver::nonce_key(const std::string& dev_eui, const std::string& dev_nonce) {
    return dev_eui + dev_nonce;
}

std::string JoinResolver::lock_key(const std::string& dev_eui, const std::string& dev_nonce) {
    return nonce_key(dev_eui, dev_nonce) + "joinlock";
}

JoinOutcome JoinResolver::resolve(const std::string& dev_eui,
                                  const std::string& dev_nonce,
                                  const std::string& gateway_id)
{
    JoinOutcome out;
    const std::string cache_key = nonce_key(dev_eui, dev_nonce);

    JoinLockGuard lock(_store, lock_key(dev_eui, dev_nonce), gateway_id, _opt.lock_lease);
    if (!lock.owned()) {
        log_line("[JOIN] lock-denied DevEUI=" + dev_eui + " DevNonce=" + dev_nonce +
                 " gw=" + gateway_id);
        out.status = JoinStatus::LockDenied;
        return out;
    }

    // Same pair seen inside the TTL: replay, or the same join heard by another gateway.
    const auto cached = _store.get(cache_key);
    if (cached && !cached->empty()) {
        log_line("[JOIN] used-nonce DevEUI=" + dev_eui + " DevNonce=" + dev_nonce +
                 " gw=" + gateway_id);
        out.status = JoinStatus::ReplayDetected;
        return out;
    }

    // Marker goes in before the registry call so it survives a lost lease.
    _store.set(cache_key, dev_nonce, _opt.nonce_ttl);

    out.status = JoinStatus::FreshAdmission;
    const auto device = _registry.get_by_id(dev_eui);
    if (!device) {
        log_line("[JOIN] unknown-device DevEUI=" + dev_eui + " DevNonce=" + dev_nonce +
                 " gw=" + gateway_id);
        return out;
    }

    DeviceKeyRecord rec;
    rec.dev_eui = dev_eui;
    rec.primary_key = device->primary_key;
    out.devices.push_back(std::move(rec));

    // New session: frame counters restart
    _store.del(dev_eui);

    log_line("[JOIN] admitted DevEUI=" + dev_eui + " DevNonce=" + dev_nonce +
             " gw=" + gateway_id);
    return out;
}

} // namespace lk
