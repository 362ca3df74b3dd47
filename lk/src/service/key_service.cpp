/*
 * Part of the LoRaKeys (LK) project.
 *
 * SPDX-FileCopyrightText: 2025 LoRaKeys contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of LoRaKeys (LK). See LICENSE for details.
 */

#include "lk/key_service.hpp"

namespace lk {

static LookupResult bad_request(const char* reason) {
    LookupResult r;
    r.status = LookupStatus::BadRequest;
    r.reason = reason;
    return r;
}

KeyService::KeyService(internal::CacheStore& store, internal::DeviceRegistry& registry,
                       const JoinOptions& join_opt)
    : _join(store, registry, join_opt), _addr(registry), _direct(registry)
{}

LookupResult KeyService::lookup(const LookupQuery& q) {
    // OTAA join
    if (q.has_dev_eui) {
        if (q.dev_eui.empty()) return bad_request("MISSING_DEVEUI");
        if (q.dev_nonce.empty()) return bad_request("MISSING_DEVNONCE");

        JoinOutcome jo = _join.resolve(q.dev_eui, q.dev_nonce, q.gateway_id);
        LookupResult r;
        switch (jo.status) {
        case JoinStatus::FreshAdmission:
            r.status = LookupStatus::Ok;
            r.devices = std::move(jo.devices);
            break;
        case JoinStatus::ReplayDetected:
            r.status = LookupStatus::UsedNonce;
            break;
        case JoinStatus::LockDenied:
            r.status = LookupStatus::LockDenied;
            break;
        }
        return r;
    }

    // ABP or data uplink
    if (q.has_dev_addr) {
        const std::string addr = sanitize_dev_addr(q.dev_addr);
        if (addr.empty()) return bad_request("BAD_DEVADDR");
        LookupResult r;
        r.devices = _addr.resolve(addr);
        return r;
    }

    return bad_request("MISSING_DEVEUI_OR_DEVADDR");
}

LookupResult KeyService::lookup_by_eui(const std::string& dev_eui) {
    if (dev_eui.empty()) return bad_request("MISSING_DEVEUI");
    LookupResult r;
    r.devices = _direct.resolve(dev_eui);
    return r;
}

} // namespace lk
