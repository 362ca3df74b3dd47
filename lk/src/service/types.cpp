/*
 * Part of the LoRaKeys (LK) project.
 *
 * SPDX-FileCopyrightText: 2025 LoRaKeys contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of LoRaKeys (LK). See LICENSE for details.
 */

#include "lk/types.hpp"

namespace lk {

const char* to_string(JoinStatus s) {
    switch (s) {
    case JoinStatus::FreshAdmission: return "FreshAdmission";
    case JoinStatus::ReplayDetected: return "ReplayDetected";
    case JoinStatus::LockDenied:     return "LockDenied";
    }
    return "?";
}

const char* to_string(LookupStatus s) {
    switch (s) {
    case LookupStatus::Ok:         return "Ok";
    case LookupStatus::UsedNonce:  return "UsedNonce";
    case LookupStatus::LockDenied: return "LockDenied";
    case LookupStatus::BadRequest: return "BadRequest";
    }
    return "?";
}

} // namespace lk
