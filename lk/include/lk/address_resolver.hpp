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

// Keep hex digits only. Quotes, spaces, wildcards etc. are dropped.
std::string sanitize_dev_addr(const std::string& raw);

// ABP / data-uplink lookup: every device bound to a DevAddr, with its key.
class AddressResolver {
public:
    explicit AddressResolver(internal::DeviceRegistry& registry);

    // dev_addr must already be sanitized and non-empty.
    std::vector<DeviceKeyRecord> resolve(const std::string& dev_addr);

private:
    internal::DeviceRegistry& _registry;
};

} // namespace lk
