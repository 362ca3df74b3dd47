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
#include <utility>
#include <vector>

namespace lk {

// Plain HTTP request structure as produced by our parser.
struct HttpRequest {
    std::string method;   // "GET", "POST", ...
    std::string path;     // "/api/GetDevice"
    std::string query;    // "DevEUI=...&DevNonce=..."
    std::string httpver;  // "HTTP/1.1"
    std::unordered_map<std::string, std::string> headers;
    std::string body;
};

// Response produced by the API layer; the transport adds framing headers.
struct HttpResponse {
    int status = 200;
    std::string reason = "OK";
    std::string content_type = "application/json";
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
};

} // namespace lk
