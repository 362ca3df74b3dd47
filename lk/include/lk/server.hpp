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
#include <thread>
#include "lk/server_config.hpp"
#include "lk/service_context.hpp"

namespace lk {

// Device key lookup HTTP server
class Server {
public:
    explicit Server(const ServerConfig& cfg);
    ~Server();

    // Blocking run: create socket, listen and accept.
    void run();

    // Sets the stop flag and shuts the listening socket down to unblock accept().
    void stop();

private:
    ServerConfig _cfg;
    LazyServiceContext _ctx;
    std::atomic<bool> _stop{false};
    std::atomic<int> _listen_fd{-1};
    std::thread _gc_thread;

    void gc_loop();
    void serve_plain();

    // helpers
    int create_listen_socket();
};

} // namespace lk
