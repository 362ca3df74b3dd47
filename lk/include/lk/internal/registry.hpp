/*
 * Part of the LoRaKeys (LK) project.
 *
 * SPDX-FileCopyrightText: 2025 LoRaKeys contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of LoRaKeys (LK). See LICENSE for details.
 */

#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "lk/types.hpp"

namespace lk::internal {

/**
 * One issued address query. Finite and forward-only: pages are pulled with
 * next_page() while has_more() is true. Pages carry device ids only.
 * To restart, issue a new query.
 */
class DeviceQuery {
public:
    virtual ~DeviceQuery() = default;
    virtual bool has_more() const = 0;
    virtual std::vector<std::string> next_page() = 0;
};

/**
 * Read-only view of the device registry.
 * Faults are thrown as lk::RegistryError; an unknown device is not a fault.
 */
class DeviceRegistry {
public:
    virtual ~DeviceRegistry() = default;

    virtual std::optional<DeviceRecord> get_by_id(const std::string& dev_eui) = 0;

    // Devices whose desired or reported DevAddr equals dev_addr.
    // dev_addr is a bound value, never part of query text.
    virtual std::unique_ptr<DeviceQuery> query_by_address(const std::string& dev_addr) = 0;
};

} // namespace lk::internal
