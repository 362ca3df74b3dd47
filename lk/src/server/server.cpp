/*
 * Part of the LoRaKeys (LK) project.
 *
 * SPDX-FileCopyrightText: 2025 LoRaKeys contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of LoRaKeys (LK). See LICENSE for details.
 */

#include "lk/server.hpp"
#include "lk/errors.hpp"
#include "lk/log.hpp"

#include <chrono>
#include <cstdio>
#include <cstring>
#include <cerrno>
#include <string>

#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <unistd.h>

// Per-connection handler provided by http_plain.cpp.
namespace lk::internal {

// Handles a single plain HTTP connection (keep-alive is managed inside) and closes fd.
void handle_connection_plain(int fd,
                             const lk::ServerConfig& cfg,
                             const std::string& peer_ip,
                             lk::LazyServiceContext& ctx);

} // namespace lk::internal

namespace lk {

// ---------- small socket helpers (internal) ----------

static int set_reuseaddr(int s) { int o = 1; return ::setsockopt(s, SOL_SOCKET, SO_REUSEADDR, &o, sizeof(o)); }
static int set_nodelay (int s)  { int o = 1; return ::setsockopt(s, IPPROTO_TCP, TCP_NODELAY, &o, sizeof(o)); }

static std::string sockaddr_to_ip(const sockaddr_storage& ss) {
    char buf[INET6_ADDRSTRLEN] = {0};
    if (ss.ss_family == AF_INET) {
        const sockaddr_in* a = reinterpret_cast<const sockaddr_in*>(&ss);
        inet_ntop(AF_INET, &a->sin_addr, buf, sizeof(buf));
    } else if (ss.ss_family == AF_INET6) {
        const sockaddr_in6* a = reinterpret_cast<const sockaddr_in6*>(&ss);
        inet_ntop(AF_INET6, &a->sin6_addr, buf, sizeof(buf));
    } else {
        std::snprintf(buf, sizeof(buf), "unknown");
    }
    return std::string(buf);
}

// ---------- Server impl ----------

Server::Server(const ServerConfig& cfg)
    : _cfg(cfg),
      _ctx([cfg]{ return make_service_context(cfg); })
{
    validate_config(_cfg);

    // Build collaborators now unless lazy_init is set; failures are fatal at start-up.
    if (!_cfg.lazy_init) {
        (void)_ctx.get();
    }

    if (_cfg.store == StoreBackend::Memory) {
        _gc_thread = std::thread(&Server::gc_loop, this);
    }
}

Server::~Server() {
    stop();
    if (_gc_thread.joinable()) {
        _gc_thread.join();
    }
}

void Server::stop() {
    _stop.store(true, std::memory_order_relaxed);
    const int fd = _listen_fd.exchange(-1);
    if (fd >= 0) {
        ::shutdown(fd, SHUT_RDWR);
        ::close(fd);
    }
}

int Server::create_listen_socket() {
    int srv = ::socket(AF_INET, SOCK_STREAM, 0);
    if (srv < 0) {
        lk::log_line(std::string("[FATAL] socket() failed: ") + std::strerror(errno));
        throw Error("socket() failed");
    }
    (void)set_reuseaddr(srv);

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(_cfg.port);

    if (bind(srv, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        lk::log_line(std::string("[FATAL] bind() failed: ") + std::strerror(errno));
        ::close(srv);
        throw Error("bind() failed");
    }
    if (listen(srv, 512) < 0) {
        lk::log_line(std::string("[FATAL] listen() failed: ") + std::strerror(errno));
        ::close(srv);
        throw Error("listen() failed");
    }
    return srv;
}

void Server::run() {
    lk::log_line("[INFO] LoRaKeys server starting...");
    lk::log_line("[INFO] Port: " + std::to_string(_cfg.port));
    if (_cfg.store == StoreBackend::Redis || _cfg.registry == RegistryBackend::Redis) {
        lk::log_line(std::string("[INFO] Redis: host=") + _cfg.redis.host +
                     ":" + std::to_string(_cfg.redis.port) +
                     " db=" + std::to_string(_cfg.redis.db) +
                     " pool=" + std::to_string(_cfg.redis.pool_size));
    }
    lk::log_line(std::string("[INFO] Cache store: ") +
                 (_cfg.store == StoreBackend::Redis ? "REDIS" : "MEMORY"));
    if (_cfg.registry == RegistryBackend::Redis) {
        lk::log_line("[INFO] Registry: REDIS prefix=" + _cfg.redis.key_prefix);
    } else {
        lk::log_line("[INFO] Registry: FILE " + _cfg.devices_file);
    }
    lk::log_line("[INFO] Join: lock_lease=" + std::to_string(_cfg.join_lock_lease_ms) +
                 "ms, nonce_ttl=" + std::to_string(_cfg.join_nonce_ttl_ms) + "ms");
    if (!_cfg.function_key.empty()) {
        lk::log_line("[INFO] Function key: REQUIRED");
    }
    if (_cfg.redact_errors) {
        lk::log_line("[INFO] Error redaction: ENABLED");
    }
    lk::log_line("[INFO] KA timeout=" + std::to_string(_cfg.ka_timeout_sec) +
                 "s, KA max=" + std::to_string(_cfg.ka_max));

    serve_plain();
}

void Server::gc_loop() {
    while (!_stop.load(std::memory_order_relaxed)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(250));

        // Expired nonce markers and leases are otherwise only dropped on read.
        ServiceContext* ctx = _ctx.peek();
        if (ctx) ctx->maintenance();
    }
}

void Server::serve_plain() {
    int srv = create_listen_socket();
    _listen_fd.store(srv);
    lk::log_line(std::string("[INFO] Listening HTTP on :") + std::to_string(_cfg.port));

    while (!_stop.load(std::memory_order_relaxed)) {
        sockaddr_storage cli{};
        socklen_t cl = sizeof(cli);
        int fd = ::accept(srv, reinterpret_cast<sockaddr*>(&cli), &cl);
        if (fd < 0) {
            if (errno == EINTR) continue;
            if (_stop.load(std::memory_order_relaxed)) break;
            // transient error; continue
            continue;
        }
        (void)set_nodelay(fd);
        std::string peer = sockaddr_to_ip(cli);

        // Detach a per-connection handler; it owns and closes the fd.
        std::thread([this, fd, peer]() {
            internal::handle_connection_plain(fd, this->_cfg, peer, this->_ctx);
        }).detach();
    }

    // stop() may already have closed it
    const int fd = _listen_fd.exchange(-1);
    if (fd >= 0) ::close(fd);
}

} // namespace lk
