/*
 * Part of the LoRaKeys (LK) project.
 *
 * SPDX-FileCopyrightText: 2025 LoRaKeys contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of LoRaKeys (LK). See LICENSE for details.
 */

#include "lk/address_resolver.hpp"
#include "lk/internal/utils.hpp"
#include "lk/log.hpp"

namespace lk {

std::string sanitize_dev_addr(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    for (char c : raw) {
        if (internal::hexval(c) >= 0) out.push_back(c);
    }
    return out;
}

AddressResolver::AddressResolver(internal::DeviceRegistry& registry)
    : _registry(registry)
{}

std::vector<DeviceKeyRecord> AddressResolver::resolve(const std::string& dev_addr) {
    std::vector<DeviceKeyRecord> results;
    auto query = _registry.query_by_address(dev_addr);
    while (query->has_more()) {
        for (const auto& id : query->next_page()) {
            // The address index carries no credentials; fetch the key per device.
            const auto device = _registry.get_by_id(id);
            if (!device) {
                log_warn("[ADDR] DevEUI=" + id + " vanished between query and fetch");
                continue;
            }
            DeviceKeyRecord rec;
            rec.dev_eui = id;
            rec.primary_key = device->primary_key;
            rec.dev_addr = dev_addr;
            results.push_back(std::move(rec));
        }
    }
    log_line("[ADDR] DevAddr=" + dev_addr + " matches=" + std::to_string(results.size()));
    return results;
}

} // namespace lk
