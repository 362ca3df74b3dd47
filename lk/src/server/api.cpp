/*
 * Part of the LoRaKeys (LK) project.
 *
 * SPDX-FileCopyrightText: 2025 LoRaKeys contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of LoRaKeys (LK). See LICENSE for details.
 */

#include "lk/internal/api.hpp"
#include "lk/internal/http_parser.hpp"
#include "lk/internal/utils.hpp"
#include "lk/errors.hpp"
#include "lk/log.hpp"

#include <exception>
#include <sstream>

namespace lk::internal {

const char* const kApiVersion = "2019-02-20-preview";
const char* const kJoinHeader = "x-lk-join";

namespace {

const char* const kSupportedVersions[] = {
    "2018-12-16-preview",
    "2019-02-12-preview",
    "2019-02-20-preview",
};

std::string make_error_body(const lk::ServerConfig& cfg, const std::string& reason) {
    if (cfg.redact_errors) return R"({"status":"ERROR"})";
    return std::string(R"({"status":"ERROR","reason":")") + json_escape(reason) + R"("})";
}

lk::HttpResponse make_resp(int sc, const char* st, std::string body) {
    lk::HttpResponse r;
    r.status = sc;
    r.reason = st;
    r.body = std::move(body);
    return r;
}

bool function_key_ok(const lk::HttpRequest& R, const QueryMap& params,
                     const lk::ServerConfig& cfg)
{
    if (cfg.function_key.empty()) return true;
    std::string presented = hdr_ci(R, "x-functions-key");
    if (presented.empty()) presented = query_ci(params, "code");
    return ct_equal(presented, cfg.function_key);
}

lk::HttpResponse to_http(const lk::LookupResult& res, const lk::ServerConfig& cfg) {
    switch (res.status) {
    case lk::LookupStatus::Ok:
        return make_resp(200, "OK", devices_to_json(res.devices));
    case lk::LookupStatus::UsedNonce:
        return make_resp(400, "Bad Request", R"("UsedDevNonce")");
    case lk::LookupStatus::LockDenied: {
        lk::HttpResponse r = make_resp(200, "OK", "[]");
        r.headers.emplace_back(kJoinHeader, "lock-denied");
        return r;
    }
    case lk::LookupStatus::BadRequest:
        break;
    }
    return make_resp(400, "Bad Request", make_error_body(cfg, res.reason));
}

} // namespace

bool api_version_supported(const std::string& v) {
    for (const char* s : kSupportedVersions) {
        if (v == s) return true;
    }
    return false;
}

std::string devices_to_json(const std::vector<DeviceKeyRecord>& devices) {
    std::ostringstream os;
    os << '[';
    bool first = true;
    for (const auto& d : devices) {
        if (!first) os << ',';
        first = false;
        os << R"({"DevEUI":")" << json_escape(d.dev_eui)
           << R"(","PrimaryKey":")" << json_escape(d.primary_key) << '"';
        if (!d.dev_addr.empty()) {
            os << R"(,"DevAddr":")" << json_escape(d.dev_addr) << '"';
        }
        os << '}';
    }
    os << ']';
    return os.str();
}

lk::HttpResponse handle_api_request(const lk::HttpRequest& R,
                                    const lk::ServerConfig& cfg,
                                    lk::LazyServiceContext& ctx)
{
    if (R.method != "GET" && R.method != "POST") {
        return make_resp(405, "Method Not Allowed", make_error_body(cfg, "ONLY_GET_OR_POST"));
    }
    if (R.path == "/health") {
        return make_resp(200, "OK", R"({"status":"OK"})");
    }

    const bool by_eui = (R.path == "/api/GetDeviceByDevEUI");
    if (!by_eui && R.path != "/api/GetDevice") {
        return make_resp(404, "Not Found", make_error_body(cfg, "NOT_FOUND"));
    }

    const QueryMap params = parse_query(R.query);
    lk::HttpResponse resp;

    std::string requested = query_ci(params, "api-version");
    if (requested.empty()) requested = hdr_ci(R, "api-version");
    if (!function_key_ok(R, params, cfg)) {
        resp = make_resp(401, "Unauthorized", make_error_body(cfg, "BAD_FUNCTION_KEY"));
    } else if (!requested.empty() && !api_version_supported(requested)) {
        resp = make_resp(400, "Bad Request", make_error_body(cfg,
            "Incompatible versions (requested: '" + requested + "', current: '" + kApiVersion + "')"));
    } else {
        try {
            lk::KeyService& svc = ctx.get().service();
            lk::LookupResult res;
            if (by_eui) {
                res = svc.lookup_by_eui(query_ci(params, "DevEUI"));
            } else {
                lk::LookupQuery q;
                q.dev_eui    = query_ci(params, "DevEUI", &q.has_dev_eui);
                q.dev_nonce  = query_ci(params, "DevNonce");
                q.dev_addr   = query_ci(params, "DevAddr", &q.has_dev_addr);
                q.gateway_id = query_ci(params, "GatewayId");
                res = svc.lookup(q);
            }
            if (res.status != lk::LookupStatus::Ok) {
                log_line(std::string("[API] ") + R.path + " -> " + lk::to_string(res.status) +
                         (res.reason.empty() ? "" : " " + res.reason));
            }
            resp = to_http(res, cfg);
        } catch (const lk::Error& e) {
            log_error(R.path + " failed: " + e.what());
            resp = make_resp(500, "Internal Server Error", make_error_body(cfg, "INTERNAL"));
        } catch (const std::exception& e) {
            log_error(R.path + " unexpected failure: " + e.what());
            resp = make_resp(500, "Internal Server Error", make_error_body(cfg, "INTERNAL"));
        }
    }

    resp.headers.emplace_back("api-version", kApiVersion);
    return resp;
}

} // namespace lk::internal
