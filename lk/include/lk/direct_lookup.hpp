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
#include "lk/types.hpp"
#include "lk/internal/registry.hpp"

namespace lk {

// Single-device lookup by DevEUI. No locking, no nonce bookkeeping.
class DirectLookup {
public:
    explicit DirectLookup(internal::DeviceRegistry& registry);

    std::vector<DeviceKeyRecord> resolve(const std::string& dev_eui);

private:
    internal::DeviceRegistry& _registry;
};

} // namespace lk
