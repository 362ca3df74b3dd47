/*
 * Part of the LoRaKeys (LK) project.
 *
 * SPDX-FileCopyrightText: 2025 LoRaKeys contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of LoRaKeys (LK). See LICENSE for details.
 */

#include "lk/service_context.hpp"
#include "lk/errors.hpp"
#include "lk/log.hpp"
#include "lk/internal/memory_store.hpp"
#include "lk/internal/redis_pool.hpp"
#include "lk/internal/redis_store.hpp"
#include "lk/internal/file_registry.hpp"
#include "lk/internal/redis_registry.hpp"

namespace lk {

ServiceContext::ServiceContext(std::unique_ptr<internal::CacheStore> store,
                               std::unique_ptr<internal::DeviceRegistry> registry,
                               const JoinOptions& join_opt)
    : _store(std::move(store)),
      _registry(std::move(registry)),
      _memory(dynamic_cast<internal::MemoryStore*>(_store.get())),
      _service(*_store, *_registry, join_opt)
{}

void ServiceContext::maintenance() {
    if (_memory) _memory->gc();
}

std::unique_ptr<ServiceContext> make_service_context(const ServerConfig& cfg) {
    std::shared_ptr<internal::RedisPool> pool;
    if (cfg.store == StoreBackend::Redis || cfg.registry == RegistryBackend::Redis) {
        internal::RedisPool::Options ropt;
        ropt.host       = cfg.redis.host;
        ropt.port       = cfg.redis.port;
        ropt.db         = cfg.redis.db;
        ropt.password   = cfg.redis.password;
        ropt.pool_size  = cfg.redis.pool_size;
        ropt.timeout_ms = cfg.redis.timeout_ms;
        pool = std::make_shared<internal::RedisPool>(ropt);
    }

    std::unique_ptr<internal::CacheStore> store;
    if (cfg.store == StoreBackend::Redis) {
        store = std::make_unique<internal::RedisStore>(pool);
    } else {
        log_warn("cache store is in-process: join dedup covers this instance only");
        store = std::make_unique<internal::MemoryStore>();
    }

    std::unique_ptr<internal::DeviceRegistry> registry;
    if (cfg.registry == RegistryBackend::Redis) {
        registry = std::make_unique<internal::RedisRegistry>(pool, cfg.redis.key_prefix,
                                                             cfg.query_page_size);
    } else {
        auto file = std::make_unique<internal::FileRegistry>(
            static_cast<std::size_t>(cfg.query_page_size));
        if (!file->init_file(cfg.devices_file)) {
            throw RegistryError("failed to load devices file " + cfg.devices_file);
        }
        registry = std::move(file);
    }

    JoinOptions jopt;
    jopt.lock_lease = std::chrono::milliseconds(cfg.join_lock_lease_ms);
    jopt.nonce_ttl  = std::chrono::milliseconds(cfg.join_nonce_ttl_ms);
    return std::make_unique<ServiceContext>(std::move(store), std::move(registry), jopt);
}

LazyServiceContext::LazyServiceContext(Factory factory)
    : _factory(std::move(factory))
{}

ServiceContext& LazyServiceContext::get() {
    ServiceContext* p = _ptr.load(std::memory_order_acquire);
    if (p) return *p;

    std::lock_guard<std::mutex> lk(_mtx);
    p = _ptr.load(std::memory_order_relaxed);
    if (p) return *p;

    _owned = _factory();
    if (!_owned) throw Error("service context factory returned null");
    _ptr.store(_owned.get(), std::memory_order_release);
    return *_owned;
}

} // namespace lk
