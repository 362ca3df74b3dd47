/*
 * Part of the LoRaKeys (LK) project.
 *
 * SPDX-FileCopyrightText: 2025 LoRaKeys contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of LoRaKeys (LK). See LICENSE for details.
 */

#include "lk/direct_lookup.hpp"

namespace lk {

DirectLookup::DirectLookup(internal::DeviceRegistry& registry)
    : _registry(registry)
{}

std::vector<DeviceKeyRecord> DirectLookup::resolve(const std::string& dev_eui) {
    std::vector<DeviceKeyRecord> results;
    const auto device = _registry.get_by_id(dev_eui);
    if (device) {
        DeviceKeyRecord rec;
        rec.dev_eui = dev_eui;
        rec.primary_key = device->primary_key;
        results.push_back(std::move(rec));
    }
    return results;
}

} // namespace lk
