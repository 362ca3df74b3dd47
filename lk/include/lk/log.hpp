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

namespace lk {

// Thread-safe logging (to file + stdout). Each line is prefixed with a UTC timestamp.
void set_log_file(const std::string& path);
void log_line(const std::string& line);

// Tagged shortcuts: "[INFO] ...", "[WARN] ...", "[ERROR] ..."
void log_info(const std::string& msg);
void log_warn(const std::string& msg);
void log_error(const std::string& msg);

} // namespace lk
