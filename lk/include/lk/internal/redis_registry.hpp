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
#include <string>
#include "lk/internal/registry.hpp"
#include "lk/internal/redis_pool.hpp"

namespace lk::internal {

/**
 * Registry kept in Redis by the provisioning side:
 *
 *   <prefix>dev:<DevEUI>   hash  { primary_key, desired_addr, reported_addr }
 *   <prefix>addr:<DevAddr> set   { DevEUI, ... }   (desired or reported binding)
 *
 * Address queries page through the index set with SSCAN.
 */
class RedisRegistry : public DeviceRegistry {
public:
    RedisRegistry(std::shared_ptr<RedisPool> pool, std::string key_prefix,
                  int page_size = 100);

    std::optional<DeviceRecord> get_by_id(const std::string& dev_eui) override;
    std::unique_ptr<DeviceQuery> query_by_address(const std::string& dev_addr) override;

    std::string device_key(const std::string& dev_eui) const { return _prefix + "dev:" + dev_eui; }
    std::string address_key(const std::string& dev_addr) const { return _prefix + "addr:" + dev_addr; }

private:
    std::shared_ptr<RedisPool> _pool;
    std::string _prefix;
    int _page_size;
};

} // namespace lk::internal
