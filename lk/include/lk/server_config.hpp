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
#include <cstdint>
#include <cstddef>

namespace lk {

enum class StoreBackend { Redis, Memory };
enum class RegistryBackend { Redis, File };

struct ServerConfig {
    // Core
    uint16_t port = 8080;
    std::string log_file = "lk_server.log";

    size_t max_body = 64*1024;

    // Error redaction
    bool redact_errors = false;

    // Shared secret for /api/* (header x-functions-key or ?code=). Empty disables the check.
    std::string function_key;

    // Keep-alive
    int  ka_timeout_sec = 5;
    int  ka_max         = 100;

    // Build the service context on the first request instead of at start-up.
    bool lazy_init = false;

    // ---- Backends ----
    StoreBackend    store    = StoreBackend::Redis;
    RegistryBackend registry = RegistryBackend::Redis;
    std::string     devices_file;        // RegistryBackend::File
    int             query_page_size = 100;

    // ---- Join protocol ----
    int join_lock_lease_ms = 10000;
    int join_nonce_ttl_ms  = 60000;

    // ---- Redis (cache/lock store and/or registry) ----
    struct {
        std::string host = "127.0.0.1";
        int         port = 6379;
        int         db   = 0;
        std::string password;
        std::string key_prefix = "lk:";  // registry keys only; join keys are unprefixed
        int         pool_size  = 8;
        int         timeout_ms = 200;
    } redis;
};

// Fill unset fields from LK_* environment variables. Values already set
// from the command line (tracked by the caller) are not overwritten.
struct EnvOverrides {
    bool redis_host = true, redis_port = true, redis_db = true, redis_password = true,
         redis_prefix = true, function_key = true, devices_file = true;
};
void apply_env(ServerConfig& cfg, const EnvOverrides& which = EnvOverrides{});

// Throws lk::ConfigError describing the first inconsistency found.
void validate_config(const ServerConfig& cfg);

} // namespace lk
