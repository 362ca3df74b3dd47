/*
 * Part of the LoRaKeys (LK) project.
 *
 * SPDX-FileCopyrightText: 2025 LoRaKeys contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of LoRaKeys (LK). See LICENSE for details.
 */

#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include "lk/key_service.hpp"
#include "lk/server_config.hpp"
#include "lk/internal/cache_store.hpp"
#include "lk/internal/registry.hpp"

namespace lk {

namespace internal { class MemoryStore; }

// Everything a request handler needs: the two collaborators and the
// lookup service wired on top of them. Built once, then read-only.
class ServiceContext {
public:
    ServiceContext(std::unique_ptr<internal::CacheStore> store,
                   std::unique_ptr<internal::DeviceRegistry> registry,
                   const JoinOptions& join_opt);

    KeyService& service() { return _service; }
    internal::CacheStore& store() { return *_store; }
    internal::DeviceRegistry& registry() { return *_registry; }

    // Drop expired entries when the store is in-process; no-op for Redis.
    void maintenance();

private:
    std::unique_ptr<internal::CacheStore> _store;
    std::unique_ptr<internal::DeviceRegistry> _registry;
    internal::MemoryStore* _memory = nullptr; // non-owning view of _store
    KeyService _service;
};

// Build collaborators from configuration. Throws lk::Error on failure.
std::unique_ptr<ServiceContext> make_service_context(const ServerConfig& cfg);

/**
 * Memoized, thread-safe construction of a ServiceContext.
 * Concurrent first callers run the factory exactly once; if it throws, the
 * exception reaches that caller and the next call tries again.
 */
class LazyServiceContext {
public:
    using Factory = std::function<std::unique_ptr<ServiceContext>()>;

    explicit LazyServiceContext(Factory factory);

    ServiceContext& get();

    // Null until the first successful get().
    ServiceContext* peek() const { return _ptr.load(std::memory_order_acquire); }

private:
    Factory _factory;
    std::mutex _mtx;
    std::unique_ptr<ServiceContext> _owned;
    std::atomic<ServiceContext*> _ptr{nullptr};
};

} // namespace lk
