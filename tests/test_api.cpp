/*
 * Part of the LoRaKeys (LK) project.
 *
 * SPDX-FileCopyrightText: 2025 LoRaKeys contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of LoRaKeys (LK). See LICENSE for details.
 */

#include <gtest/gtest.h>

#include "fakes.hpp"
#include "lk/internal/api.hpp"

using namespace std::chrono_literals;
using lk::internal::handle_api_request;

namespace {

std::string header(const lk::HttpResponse& r, const std::string& name) {
    for (const auto& h : r.headers) {
        if (h.first == name) return h.second;
    }
    return {};
}

bool has_header(const lk::HttpResponse& r, const std::string& name) {
    for (const auto& h : r.headers) {
        if (h.first == name) return true;
    }
    return false;
}

lk::HttpRequest get(const std::string& path, const std::string& query = {}) {
    lk::HttpRequest r;
    r.method = "GET";
    r.path = path;
    r.query = query;
    r.httpver = "HTTP/1.1";
    return r;
}

struct ApiFixture : ::testing::Test {
    lk::ServerConfig cfg;
    lk::test::FakeRegistry* registry = nullptr; // owned by the context
    lk::internal::MemoryStore* store = nullptr;
    int builds = 0;

    lk::LazyServiceContext ctx{[this] {
        ++builds;
        auto reg = std::make_unique<lk::test::FakeRegistry>();
        reg->add("0004A30B001C0530", "2B7E151628AED2A6ABF7158809CF4F3C", "0102AABB");
        reg->add("0004A30B001C0531", "key-b", "", "0102AABB");
        registry = reg.get();
        auto mem = std::make_unique<lk::internal::MemoryStore>();
        store = mem.get();
        return std::make_unique<lk::ServiceContext>(std::move(mem), std::move(reg),
                                                    lk::JoinOptions{});
    }};

    lk::HttpResponse call(const lk::HttpRequest& r) { return handle_api_request(r, cfg, ctx); }
};

} // namespace

TEST_F(ApiFixture, JoinAdmittedThenReplayRejected) {
    auto r = call(get("/api/GetDevice",
                      "DevEUI=0004A30B001C0530&DevNonce=A1B2&GatewayId=gw-1&api-version=2019-02-20-preview"));
    EXPECT_EQ(r.status, 200);
    EXPECT_EQ(r.body, R"([{"DevEUI":"0004A30B001C0530","PrimaryKey":"2B7E151628AED2A6ABF7158809CF4F3C"}])");
    EXPECT_EQ(header(r, "api-version"), "2019-02-20-preview");
    EXPECT_FALSE(has_header(r, lk::internal::kJoinHeader));

    r = call(get("/api/GetDevice", "DevEUI=0004A30B001C0530&DevNonce=A1B2&GatewayId=gw-2"));
    EXPECT_EQ(r.status, 400);
    EXPECT_EQ(r.body, R"("UsedDevNonce")");
}

TEST_F(ApiFixture, LockContentionIsEmptyListWithMarkerHeader) {
    ctx.get();
    ASSERT_TRUE(store->try_acquire_lock(lk::JoinResolver::lock_key("0004A30B001C0530", "A1B2"),
                                        "gw-0", 10s));
    auto r = call(get("/api/GetDevice", "DevEUI=0004A30B001C0530&DevNonce=A1B2&GatewayId=gw-1"));
    EXPECT_EQ(r.status, 200);
    EXPECT_EQ(r.body, "[]");
    EXPECT_EQ(header(r, lk::internal::kJoinHeader), "lock-denied");
}

TEST_F(ApiFixture, UnknownDeviceJoinIsEmptyList) {
    auto r = call(get("/api/GetDevice", "DevEUI=FFFFFFFFFFFFFFFF&DevNonce=0001&GatewayId=gw-1"));
    EXPECT_EQ(r.status, 200);
    EXPECT_EQ(r.body, "[]");
    EXPECT_FALSE(has_header(r, lk::internal::kJoinHeader));
}

TEST_F(ApiFixture, AddressLookupListsAllBoundDevices) {
    auto r = call(get("/api/GetDevice", "DevAddr=0102AABB"));
    EXPECT_EQ(r.status, 200);
    EXPECT_EQ(r.body,
              R"([{"DevEUI":"0004A30B001C0530","PrimaryKey":"2B7E151628AED2A6ABF7158809CF4F3C","DevAddr":"0102AABB"},)"
              R"({"DevEUI":"0004A30B001C0531","PrimaryKey":"key-b","DevAddr":"0102AABB"}])");
}

TEST_F(ApiFixture, InjectedAddressIsStrippedBeforeQuery) {
    auto r = call(get("/api/GetDevice", "DevAddr=0102AABB%27%20OR%20%271%27%3D%271"));
    EXPECT_EQ(r.status, 200);
    EXPECT_EQ(r.body, "[]");
    ASSERT_EQ(registry->queried_addrs.size(), 1u);
    EXPECT_EQ(registry->queried_addrs[0], "0102AABB11");
}

TEST_F(ApiFixture, MissingParametersAreBadRequest) {
    auto r = call(get("/api/GetDevice", "GatewayId=gw-1"));
    EXPECT_EQ(r.status, 400);
    EXPECT_EQ(r.body, R"({"status":"ERROR","reason":"MISSING_DEVEUI_OR_DEVADDR"})");

    r = call(get("/api/GetDevice", "DevEUI=0004A30B001C0530"));
    EXPECT_EQ(r.status, 400);
    EXPECT_EQ(r.body, R"({"status":"ERROR","reason":"MISSING_DEVNONCE"})");

    r = call(get("/api/GetDevice", "DevAddr=zz"));
    EXPECT_EQ(r.status, 400);
    EXPECT_EQ(r.body, R"({"status":"ERROR","reason":"BAD_DEVADDR"})");
}

TEST_F(ApiFixture, DirectLookupByDevEui) {
    auto r = call(get("/api/GetDeviceByDevEUI", "DevEUI=0004A30B001C0531"));
    EXPECT_EQ(r.status, 200);
    EXPECT_EQ(r.body, R"([{"DevEUI":"0004A30B001C0531","PrimaryKey":"key-b"}])");

    r = call(get("/api/GetDeviceByDevEUI", "DevEUI=FFFFFFFFFFFFFFFF"));
    EXPECT_EQ(r.status, 200);
    EXPECT_EQ(r.body, "[]");

    r = call(get("/api/GetDeviceByDevEUI"));
    EXPECT_EQ(r.status, 400);
}

TEST_F(ApiFixture, RegistryFaultIsInternalError) {
    ctx.get();
    registry->fail_get = true;
    auto r = call(get("/api/GetDeviceByDevEUI", "DevEUI=0004A30B001C0530"));
    EXPECT_EQ(r.status, 500);
    EXPECT_EQ(r.body, R"({"status":"ERROR","reason":"INTERNAL"})");

    // the join lock was freed on the way out
    r = call(get("/api/GetDevice", "DevEUI=0004A30B001C0530&DevNonce=0009&GatewayId=gw-1"));
    EXPECT_EQ(r.status, 500);
    EXPECT_TRUE(store->try_acquire_lock(lk::JoinResolver::lock_key("0004A30B001C0530", "0009"),
                                        "probe", 1s));
}

TEST_F(ApiFixture, ContextBuildFailureIsInternalErrorAndRetried) {
    bool fail = true;
    lk::LazyServiceContext flaky([&]() -> std::unique_ptr<lk::ServiceContext> {
        if (fail) throw lk::StoreError("connect refused");
        return std::make_unique<lk::ServiceContext>(std::make_unique<lk::internal::MemoryStore>(),
                                                    std::make_unique<lk::test::FakeRegistry>(),
                                                    lk::JoinOptions{});
    });

    auto r = handle_api_request(get("/api/GetDeviceByDevEUI", "DevEUI=AA"), cfg, flaky);
    EXPECT_EQ(r.status, 500);
    fail = false;
    r = handle_api_request(get("/api/GetDeviceByDevEUI", "DevEUI=AA"), cfg, flaky);
    EXPECT_EQ(r.status, 200);
    EXPECT_EQ(r.body, "[]");
}

TEST_F(ApiFixture, FunctionKeyFromHeaderOrCode) {
    cfg.function_key = "s3cret";

    auto r = call(get("/api/GetDeviceByDevEUI", "DevEUI=0004A30B001C0530"));
    EXPECT_EQ(r.status, 401);
    EXPECT_EQ(r.body, R"({"status":"ERROR","reason":"BAD_FUNCTION_KEY"})");
    EXPECT_EQ(builds, 0);

    r = call(get("/api/GetDeviceByDevEUI", "DevEUI=0004A30B001C0530&code=wrong"));
    EXPECT_EQ(r.status, 401);

    r = call(get("/api/GetDeviceByDevEUI", "DevEUI=0004A30B001C0530&code=s3cret"));
    EXPECT_EQ(r.status, 200);

    auto req = get("/api/GetDeviceByDevEUI", "DevEUI=0004A30B001C0530");
    req.headers["X-Functions-Key"] = "s3cret";
    EXPECT_EQ(call(req).status, 200);

    // health stays open
    EXPECT_EQ(call(get("/health")).status, 200);
}

TEST_F(ApiFixture, ApiVersionNegotiation) {
    auto r = call(get("/api/GetDeviceByDevEUI", "DevEUI=AA&api-version=2018-12-16-preview"));
    EXPECT_EQ(r.status, 200);

    auto req = get("/api/GetDeviceByDevEUI", "DevEUI=AA");
    req.headers["api-version"] = "2019-02-12-preview";
    EXPECT_EQ(call(req).status, 200);

    r = call(get("/api/GetDeviceByDevEUI", "DevEUI=AA&api-version=2017-01-01"));
    EXPECT_EQ(r.status, 400);
    EXPECT_EQ(r.body, R"json({"status":"ERROR","reason":"Incompatible versions (requested: '2017-01-01', current: '2019-02-20-preview')"})json");
    EXPECT_EQ(header(r, "api-version"), "2019-02-20-preview");
}

TEST_F(ApiFixture, RedactedErrorsCarryNoReason) {
    cfg.redact_errors = true;
    auto r = call(get("/api/GetDevice"));
    EXPECT_EQ(r.status, 400);
    EXPECT_EQ(r.body, R"({"status":"ERROR"})");
}

TEST_F(ApiFixture, RoutingAndMethods) {
    auto r = call(get("/health"));
    EXPECT_EQ(r.status, 200);
    EXPECT_EQ(r.body, R"({"status":"OK"})");
    EXPECT_FALSE(has_header(r, "api-version"));

    r = call(get("/api/Other"));
    EXPECT_EQ(r.status, 404);

    auto del = get("/api/GetDevice", "DevAddr=0102AABB");
    del.method = "DELETE";
    EXPECT_EQ(call(del).status, 405);

    auto post = get("/api/GetDeviceByDevEUI", "DevEUI=0004A30B001C0530");
    post.method = "POST";
    EXPECT_EQ(call(post).status, 200);
    EXPECT_EQ(builds, 1);
}

TEST(DevicesToJson, EscapesValues) {
    std::vector<lk::DeviceKeyRecord> v{{"A\"B", "k\\1", ""}};
    EXPECT_EQ(lk::internal::devices_to_json(v), R"([{"DevEUI":"A\"B","PrimaryKey":"k\\1"}])");
    EXPECT_EQ(lk::internal::devices_to_json({}), "[]");
}
