/*
 * Part of the LoRaKeys (LK) project.
 *
 * SPDX-FileCopyrightText: 2025 LoRaKeys contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of LoRaKeys (LK). See LICENSE for details.
 */

#include "lk/server_config.hpp"
#include "lk/service_context.hpp"
#include "lk/http_request.hpp"
#include "lk/internal/api.hpp"
#include "lk/internal/http_parser.hpp"
#include "lk/internal/utils.hpp"
#include "lk/log.hpp"

#include <sys/types.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <unistd.h>
#include <algorithm>
#include <sstream>

namespace lk::internal {

// --- HTTP/1.1 keep-alive helpers ---

static bool is_http11(const std::string& ver) {
    return ver == "HTTP/1.1";
}

static bool should_keep_alive(const lk::HttpRequest& R) {
    std::string conn = lower_copy(hdr_ci(R, "Connection"));
    if (is_http11(R.httpver)) {
        return (conn != "close");
    } else {
        return (conn == "keep-alive");
    }
}

// --- I/O helpers ---

static bool send_all(int fd, const char* d, std::size_t len) {
    std::size_t off = 0;
    while (off < len) {
        ssize_t n = ::send(fd, d + off, len - off, MSG_NOSIGNAL);
        if (n <= 0) return false;
        off += static_cast<std::size_t>(n);
    }
    return true;
}

static bool send_http_resp(int fd,
                           const lk::ServerConfig& cfg,
                           const lk::HttpResponse& resp,
                           bool keep_alive)
{
    std::ostringstream oss;
    oss << "HTTP/1.1 " << resp.status << " " << resp.reason << "\r\n";
    oss << "Content-Type: " << resp.content_type << "\r\n";
    for (const auto& kv : resp.headers) {
        oss << kv.first << ": " << kv.second << "\r\n";
    }
    oss << "Content-Length: " << resp.body.size() << "\r\n";
    if (keep_alive) {
        oss << "Connection: keep-alive\r\n";
        oss << "Keep-Alive: timeout=" << cfg.ka_timeout_sec
            << ", max=" << cfg.ka_max << "\r\n";
    } else {
        oss << "Connection: close\r\n";
    }
    oss << "\r\n";
    const std::string h = oss.str();
    return send_all(fd, h.data(), h.size()) &&
           send_all(fd, resp.body.data(), resp.body.size());
}

// Returns false on EOF, timeout or a malformed/oversized request.
static bool recv_http_request(int fd,
                              const lk::ServerConfig& cfg,
                              lk::HttpRequest& R)
{
    // Read headers
    std::string req;
    req.reserve(4096);
    char buf[1024];
    while (true) {
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) return false;
        req.append(buf, buf + n);
        if (req.find("\r\n\r\n") != std::string::npos) break;
        if (req.size() > (64u << 10)) return false; // header abuse guard
    }
    std::size_t hdr_end = req.find("\r\n\r\n");
    std::string hdrs = req.substr(0, hdr_end);
    std::size_t line_end = hdrs.find("\r\n");
    std::string first = hdrs.substr(0, line_end);
    if (!parse_request_line(first, R)) return false;

    R.headers.clear();
    if (line_end != std::string::npos) {
        std::size_t pos = line_end + 2;
        while (pos < hdrs.size()) {
            std::size_t next = hdrs.find("\r\n", pos);
            if (next == std::string::npos) next = hdrs.size();
            std::string line = hdrs.substr(pos, next - pos);
            pos = next + 2;
            std::size_t c = line.find(':');
            if (c != std::string::npos) {
                std::string k = line.substr(0, c), v = line.substr(c + 1);
                trim_inplace(k);
                trim_inplace(v);
                R.headers[k] = v;
            }
        }
    }

    std::size_t content_len = 0;
    const std::string cl = hdr_ci(R, "Content-Length");
    if (!cl.empty()) {
        int v = 0;
        if (!parse_int(cl, v) || v < 0) return false;
        content_len = static_cast<std::size_t>(v);
        if (content_len > cfg.max_body) return false;
    }

    // Body is read to keep the connection in sync; the API only uses the query.
    R.body.clear();
    if (hdr_end + 4 < req.size()) {
        const char* p = req.data() + hdr_end + 4;
        std::size_t have = req.size() - (hdr_end + 4);
        R.body.assign(p, p + std::min(have, content_len));
    }
    while (R.body.size() < content_len) {
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) return false;
        std::size_t need = content_len - R.body.size();
        R.body.append(buf, buf + std::min<std::size_t>(static_cast<std::size_t>(n), need));
    }
    return true;
}

// --- Exported entry point for server.cpp ---

void handle_connection_plain(int fd,
                             const lk::ServerConfig& cfg,
                             const std::string& peer_ip,
                             lk::LazyServiceContext& ctx)
{
    // Per-connection kernel timeouts
    timeval tv{cfg.ka_timeout_sec, 0};
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    int served = 0;
    while (served < cfg.ka_max) {
        lk::HttpRequest R;
        if (!recv_http_request(fd, cfg, R)) break;

        bool ka = should_keep_alive(R) && served + 1 < cfg.ka_max;
        lk::HttpResponse resp = handle_api_request(R, cfg, ctx);
        log_line("[" + std::to_string(resp.status) + "] ip=" + peer_ip +
                 " " + R.method + " " + R.path);
        ++served;
        if (!send_http_resp(fd, cfg, resp, ka)) break;
        if (!ka) break;
    }
    ::close(fd);
}

} // namespace lk::internal
