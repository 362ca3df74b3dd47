/*
 * Part of the LoRaKeys (LK) project.
 *
 * SPDX-FileCopyrightText: 2025 LoRaKeys contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of LoRaKeys (LK). See LICENSE for details.
 */

#pragma once
#include <chrono>
#include <string>
#include "lk/types.hpp"
#include "lk/internal/cache_store.hpp"
#include "lk/internal/registry.hpp"

namespace lk {

struct JoinOptions {
    std::chrono::milliseconds lock_lease{10000};  // join lock lease
    std::chrono::milliseconds nonce_ttl{60000};   // used-nonce marker lifetime
};

/**
 * OTAA join admission. For one (DevEUI, DevNonce) pair, at most one caller
 * gets FreshAdmission while the nonce marker lives:
 *
 *   1. take lock  <DevEUI><DevNonce>joinlock  (token = gateway id), else LockDenied
 *   2. marker     <DevEUI><DevNonce>  present  -> ReplayDetected
 *   3. write marker, then fetch the device key
 *   4. on a known device drop the frame-counter entry <DevEUI>
 *   5. release the lock on every exit path
 *
 * Store and registry faults propagate; the lock is still released.
 */
class JoinResolver {
public:
    JoinResolver(internal::CacheStore& store, internal::DeviceRegistry& registry);
    JoinResolver(internal::CacheStore& store, internal::DeviceRegistry& registry,
                 const JoinOptions& opt);

    JoinOutcome resolve(const std::string& dev_eui,
                        const std::string& dev_nonce,
                        const std::string& gateway_id);

    static std::string nonce_key(const std::string& dev_eui, const std::string& dev_nonce);
    static std::string lock_key(const std::string& dev_eui, const std::string& dev_nonce);

    const JoinOptions& options() const { return _opt; }

private:
    internal::CacheStore& _store;
    internal::DeviceRegistry& _registry;
    JoinOptions _opt;
};

} // namespace lk
