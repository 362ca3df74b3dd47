// SPDX-License-Identifier: Apache-2.0
// Part of LoRaKeys (LK) project.
// apps/lk_server.cpp

#include "lk/server.hpp"
#include "lk/server_config.hpp"
#include "lk/errors.hpp"
#include "lk/log.hpp"

#include <iostream>
#include <string>
#include <unistd.h>   // dup2, STDOUT_FILENO, STDERR_FILENO
#include <fcntl.h>    // open

// Silences all console output by redirecting stdout/stderr to /dev/null.
// This is process-wide and affects all library logs printing to stdio.
static void make_process_quiet() {
    int nullfd = ::open("/dev/null", O_WRONLY);
    if (nullfd >= 0) {
        (void)::dup2(nullfd, STDOUT_FILENO);
        (void)::dup2(nullfd, STDERR_FILENO);
        ::close(nullfd);
    }
}

static void usage(const char* argv0) {
    std::cerr <<
      "Usage:\n  " << argv0
      << " [--port <n>] [--log_file <path>] [--quiet 0|1]\n"
         "  [--store redis|memory] [--registry redis|file] [--devices_file <path>]\n"
         "  [--function_key <secret>] [--redact_errors 0|1] [--lazy_init 0|1]\n"
         "  [--join_lease_ms 10000] [--nonce_ttl_ms 60000] [--page_size 100]\n"
         "  [--ka_timeout 5] [--ka_max 100]\n"
         "  Redis:\n"
         "    [--redis_host 127.0.0.1] [--redis_port 6379] [--redis_db 0]\n"
         "    [--redis_password ****] [--redis_prefix lk:] [--redis_pool 8]\n"
         "    [--redis_timeout_ms 200]\n"
         "  Environment fallbacks: LK_REDIS_HOST LK_REDIS_PORT LK_REDIS_DB LK_REDIS_PASSWORD\n"
         "    LK_REDIS_PREFIX LK_FUNCTION_KEY LK_DEVICES_FILE\n";
}

static bool to_int(const std::string& s, int& out) {
    try {
        std::size_t pos = 0;
        out = std::stoi(s, &pos);
        return pos == s.size();
    } catch (const std::exception&) {
        return false;
    }
}

int main(int argc, char** argv) {
    lk::ServerConfig cfg;
    lk::EnvOverrides env;  // cleared for every flag given explicitly
    bool quiet = false;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (i + 1 >= argc) { usage(argv[0]); return 2; }
        std::string v = argv[++i];
        int n = 0;
        bool num_ok = to_int(v, n);

        if      (a == "--port" && num_ok && n > 0 && n < 65536) cfg.port = (uint16_t)n;
        else if (a == "--log_file") cfg.log_file = v;
        else if (a == "--quiet" && num_ok) quiet = (n != 0);
        else if (a == "--store" && (v == "redis" || v == "memory"))
            cfg.store = (v == "redis") ? lk::StoreBackend::Redis : lk::StoreBackend::Memory;
        else if (a == "--registry" && (v == "redis" || v == "file"))
            cfg.registry = (v == "redis") ? lk::RegistryBackend::Redis : lk::RegistryBackend::File;
        else if (a == "--devices_file") { cfg.devices_file = v; env.devices_file = false; }
        else if (a == "--function_key") { cfg.function_key = v; env.function_key = false; }
        else if (a == "--redact_errors" && num_ok) cfg.redact_errors = (n != 0);
        else if (a == "--lazy_init" && num_ok) cfg.lazy_init = (n != 0);
        else if (a == "--join_lease_ms" && num_ok) cfg.join_lock_lease_ms = n;
        else if (a == "--nonce_ttl_ms" && num_ok) cfg.join_nonce_ttl_ms = n;
        else if (a == "--page_size" && num_ok) cfg.query_page_size = n;
        else if (a == "--ka_timeout" && num_ok) cfg.ka_timeout_sec = n;
        else if (a == "--ka_max" && num_ok) cfg.ka_max = n;

        // Redis flags
        else if (a == "--redis_host") { cfg.redis.host = v; env.redis_host = false; }
        else if (a == "--redis_port" && num_ok) { cfg.redis.port = n; env.redis_port = false; }
        else if (a == "--redis_db" && num_ok) { cfg.redis.db = n; env.redis_db = false; }
        else if (a == "--redis_password") { cfg.redis.password = v; env.redis_password = false; }
        else if (a == "--redis_prefix") { cfg.redis.key_prefix = v; env.redis_prefix = false; }
        else if (a == "--redis_pool" && num_ok) cfg.redis.pool_size = n;
        else if (a == "--redis_timeout_ms" && num_ok) cfg.redis.timeout_ms = n;

        else { usage(argv[0]); return 2; }
    }

    // Apply quiet mode before any logging can occur.
    if (quiet) {
        make_process_quiet();
    }

    try {
        lk::apply_env(cfg, env);
        lk::validate_config(cfg);
    } catch (const lk::ConfigError& e) {
        std::cerr << e.what() << "\n";
        usage(argv[0]);
        return 2;
    }

    lk::set_log_file(cfg.log_file);

    try {
        lk::Server srv(cfg);
        srv.run();  // blocking
    } catch (const std::exception& e) {
        // Note: if --quiet 1 is used, this message is suppressed as well.
        lk::log_line(std::string("[FATAL] exception: ") + e.what());
        return 1;
    }
    return 0;
}
