/*
 * Part of the LoRaKeys (LK) project.
 *
 * SPDX-FileCopyrightText: 2025 LoRaKeys contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of LoRaKeys (LK). See LICENSE for details.
 */

#pragma once
#include <istream>
#include <map>
#include <mutex>
#include <string>
#include <cstddef>
#include "lk/internal/registry.hpp"

namespace lk::internal {

/**
 * Devices file backend. One device per line:
 *
 *   <DevEUI> <PrimaryKey> [desired=<DevAddr>] [reported=<DevAddr>]
 *
 * Blank lines and lines starting with '#' are ignored. Thread-safe lookups.
 */
class FileRegistry : public DeviceRegistry {
public:
    explicit FileRegistry(std::size_t page_size = 100);

    // Replace the device table. On a malformed line nothing is replaced
    // and false is returned (line number logged).
    bool init_file(const std::string& path);
    bool init_stream(std::istream& in, const std::string& source);

    std::optional<DeviceRecord> get_by_id(const std::string& dev_eui) override;
    std::unique_ptr<DeviceQuery> query_by_address(const std::string& dev_addr) override;

    std::size_t size();

private:
    std::size_t _page_size;
    std::mutex _mtx;
    std::map<std::string, DeviceRecord> _devices; // DevEUI -> record, ordered for stable paging
};

} // namespace lk::internal
