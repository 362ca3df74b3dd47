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
#include <unordered_map>
#include "lk/http_request.hpp"

namespace lk::internal {

using QueryMap = std::unordered_map<std::string, std::string>;

// Parse "GET /path?x=1 HTTP/1.1"
bool parse_request_line(const std::string& line, lk::HttpRequest& r);

// Parse query string into map (percent-decoded, '+' as space).
// A key without '=' maps to an empty value.
QueryMap parse_query(const std::string& q);

// Case-insensitive lookups; found reports presence (an empty value still counts).
std::string query_ci(const QueryMap& q, const char* name, bool* found = nullptr);
std::string hdr_ci(const lk::HttpRequest& R, const char* name);

} // namespace lk::internal
