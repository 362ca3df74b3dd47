/*
 * Part of the LoRaKeys (LK) project.
 *
 * SPDX-FileCopyrightText: 2025 LoRaKeys contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of LoRaKeys (LK). See LICENSE for details.
 */

#include "lk/log.hpp"
#include "lk/internal/time.hpp"
#include <mutex>
#include <fstream>
#include <iostream>

namespace {
std::mutex g_log_mtx;
std::ofstream g_log_ofs;
std::string g_log_path = "lk_server.log";

void open_if_needed_unlocked() {
    if (!g_log_ofs.is_open() && !g_log_path.empty()) {
        g_log_ofs.open(g_log_path, std::ios::out | std::ios::app);
    }
}
} // namespace

namespace lk {

// An empty path disables the file sink; stdout stays on.
void set_log_file(const std::string& path) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    g_log_path = path;
    if (g_log_ofs.is_open()) {
        g_log_ofs.close();
    }
    open_if_needed_unlocked();
}

void log_line(const std::string& line) {
    const std::string stamped = utc_iso8601_now() + " " + line;
    std::lock_guard<std::mutex> lk(g_log_mtx);
    open_if_needed_unlocked();
    if (g_log_ofs.is_open()) {
        g_log_ofs << stamped << '\n';
        g_log_ofs.flush();
    }
    std::cout << stamped << '\n';
}

void log_info(const std::string& msg)  { log_line("[INFO] " + msg); }
void log_warn(const std::string& msg)  { log_line("[WARN] " + msg); }
void log_error(const std::string& msg) { log_line("[ERROR] " + msg); }

} // namespace lk
