/*
 * Part of the LoRaKeys (LK) project.
 *
 * SPDX-FileCopyrightText: 2025 LoRaKeys contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of LoRaKeys (LK). See LICENSE for details.
 */

#include "lk/server_config.hpp"
#include "lk/errors.hpp"
#include "lk/internal/utils.hpp"

#include <cstdlib>

namespace lk {

namespace {

bool env_str(const char* name, std::string& out) {
    const char* v = std::getenv(name);
    if (!v || !*v) return false;
    out = v;
    return true;
}

void env_int(const char* name, int& out) {
    std::string s;
    if (!env_str(name, s)) return;
    int v = 0;
    if (!internal::parse_int(s, v)) {
        throw ConfigError(std::string(name) + " is not an integer: '" + s + "'");
    }
    out = v;
}

bool uses_redis(const ServerConfig& cfg) {
    return cfg.store == StoreBackend::Redis || cfg.registry == RegistryBackend::Redis;
}

} // namespace

void apply_env(ServerConfig& cfg, const EnvOverrides& which) {
    if (which.redis_host)     env_str("LK_REDIS_HOST", cfg.redis.host);
    if (which.redis_port)     env_int("LK_REDIS_PORT", cfg.redis.port);
    if (which.redis_db)       env_int("LK_REDIS_DB", cfg.redis.db);
    if (which.redis_password) env_str("LK_REDIS_PASSWORD", cfg.redis.password);
    if (which.redis_prefix)   env_str("LK_REDIS_PREFIX", cfg.redis.key_prefix);
    if (which.function_key)   env_str("LK_FUNCTION_KEY", cfg.function_key);
    if (which.devices_file)   env_str("LK_DEVICES_FILE", cfg.devices_file);
}

void validate_config(const ServerConfig& cfg) {
    if (cfg.port == 0) throw ConfigError("port must be non-zero");
    if (cfg.ka_max < 1) throw ConfigError("ka_max must be >= 1");
    if (cfg.ka_timeout_sec < 1) throw ConfigError("ka_timeout_sec must be >= 1");
    if (cfg.query_page_size < 1) throw ConfigError("query page size must be >= 1");

    if (cfg.registry == RegistryBackend::File && cfg.devices_file.empty()) {
        throw ConfigError("file registry requires a devices file");
    }
    if (uses_redis(cfg)) {
        if (cfg.redis.host.empty()) throw ConfigError("redis host is empty");
        if (cfg.redis.port <= 0 || cfg.redis.port > 65535) throw ConfigError("redis port out of range");
        if (cfg.redis.db < 0) throw ConfigError("redis db must be >= 0");
        if (cfg.redis.pool_size < 1) throw ConfigError("redis pool size must be >= 1");
        if (cfg.redis.timeout_ms < 1) throw ConfigError("redis timeout must be >= 1 ms");
    }

    if (cfg.join_lock_lease_ms <= 0) throw ConfigError("join lock lease must be positive");
    if (cfg.join_nonce_ttl_ms <= 0) throw ConfigError("join nonce TTL must be positive");
    // The lease must end before the nonce marker does.
    if (cfg.join_lock_lease_ms >= cfg.join_nonce_ttl_ms) {
        throw ConfigError("join lock lease must be shorter than the nonce TTL");
    }
}

} // namespace lk
