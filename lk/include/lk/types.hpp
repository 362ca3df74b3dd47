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
#include <vector>

namespace lk {

// Key material handed back to a gateway. Transient, one per matched device.
struct DeviceKeyRecord {
    std::string dev_eui;
    std::string primary_key;
    std::string dev_addr;   // empty unless resolved by address
};

// Device as held by the registry.
struct DeviceRecord {
    std::string dev_eui;
    std::string primary_key;
    std::string desired_dev_addr;
    std::string reported_dev_addr;
};

// Outcome of a join attempt for one (DevEUI, DevNonce) pair.
enum class JoinStatus {
    FreshAdmission,   // pair admitted now; devices is empty for unknown DevEUI
    ReplayDetected,   // pair already admitted inside the nonce TTL
    LockDenied        // another caller holds the join lock
};

struct JoinOutcome {
    JoinStatus status = JoinStatus::LockDenied;
    std::vector<DeviceKeyRecord> devices;
};

// Request as seen by the dispatcher. Empty string means "parameter absent".
struct LookupQuery {
    std::string dev_eui;
    std::string dev_nonce;
    std::string dev_addr;
    std::string gateway_id;
    bool has_dev_eui  = false;
    bool has_dev_addr = false;
};

enum class LookupStatus {
    Ok,
    UsedNonce,
    LockDenied,
    BadRequest
};

struct LookupResult {
    LookupStatus status = LookupStatus::Ok;
    std::vector<DeviceKeyRecord> devices;
    std::string reason;   // set for BadRequest
};

const char* to_string(JoinStatus s);
const char* to_string(LookupStatus s);

} // namespace lk
