/*
 * Part of the LoRaKeys (LK) project.
 *
 * SPDX-FileCopyrightText: 2025 LoRaKeys contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of LoRaKeys (LK). See LICENSE for details.
 */

#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "fakes.hpp"
#include "lk/join_resolver.hpp"

using namespace std::chrono_literals;
using lk::JoinResolver;
using lk::JoinStatus;

namespace {

const char* const kEui   = "0004A30B001C0530";
const char* const kNonce = "A1B2";
const char* const kKey   = "2B7E151628AED2A6ABF7158809CF4F3C";

struct JoinFixture : ::testing::Test {
    lk::test::ManualClock clk;
    lk::internal::MemoryStore mem{clk.fn()};
    lk::test::RecordingStore store{mem};
    lk::test::FakeRegistry registry;
    JoinResolver resolver{store, registry};

    void SetUp() override { registry.add(kEui, kKey); }
};

} // namespace

TEST_F(JoinFixture, KeyNamesFollowDevEuiAndNonce) {
    EXPECT_EQ(JoinResolver::nonce_key(kEui, kNonce), "0004A30B001C0530A1B2");
    EXPECT_EQ(JoinResolver::lock_key(kEui, kNonce), "0004A30B001C0530A1B2joinlock");
    EXPECT_EQ(resolver.options().lock_lease, 10s);
    EXPECT_EQ(resolver.options().nonce_ttl, 60s);
}

TEST_F(JoinFixture, FirstJoinIsAdmittedAndResetsFrameCounter) {
    mem.set(kEui, "fcnt-state", 0ms);

    auto out = resolver.resolve(kEui, kNonce, "gw-1");
    EXPECT_EQ(out.status, JoinStatus::FreshAdmission);
    ASSERT_EQ(out.devices.size(), 1u);
    EXPECT_EQ(out.devices[0].dev_eui, kEui);
    EXPECT_EQ(out.devices[0].primary_key, kKey);
    EXPECT_TRUE(out.devices[0].dev_addr.empty());

    // nonce marker holds the nonce itself
    auto marker = mem.get(JoinResolver::nonce_key(kEui, kNonce));
    ASSERT_TRUE(marker.has_value());
    EXPECT_EQ(*marker, kNonce);

    EXPECT_FALSE(mem.get(kEui).has_value());
    EXPECT_EQ(store.deleted, std::vector<std::string>{kEui});

    EXPECT_EQ(store.acquired, 1);
    EXPECT_EQ(store.released, 1);
    EXPECT_TRUE(store.held.empty());
    EXPECT_EQ(store.last_release.first, JoinResolver::lock_key(kEui, kNonce));
    EXPECT_EQ(store.last_release.second, "gw-1");
}

TEST_F(JoinFixture, SecondJoinWithinTtlIsReplay) {
    ASSERT_EQ(resolver.resolve(kEui, kNonce, "gw-1").status, JoinStatus::FreshAdmission);
    clk.advance(30s);

    auto again = resolver.resolve(kEui, kNonce, "gw-2");
    EXPECT_EQ(again.status, JoinStatus::ReplayDetected);
    EXPECT_TRUE(again.devices.empty());
    // rejected before the registry is consulted
    EXPECT_EQ(registry.get_calls.load(), 1);
    EXPECT_EQ(store.released, 2);
}

TEST_F(JoinFixture, SameNonceIsAdmittedAgainAfterTtl) {
    ASSERT_EQ(resolver.resolve(kEui, kNonce, "gw-1").status, JoinStatus::FreshAdmission);
    clk.advance(59s);
    EXPECT_EQ(resolver.resolve(kEui, kNonce, "gw-1").status, JoinStatus::ReplayDetected);
    clk.advance(1s);
    auto out = resolver.resolve(kEui, kNonce, "gw-1");
    EXPECT_EQ(out.status, JoinStatus::FreshAdmission);
    EXPECT_EQ(out.devices.size(), 1u);
}

TEST_F(JoinFixture, DifferentNonceIsIndependent) {
    ASSERT_EQ(resolver.resolve(kEui, kNonce, "gw-1").status, JoinStatus::FreshAdmission);
    EXPECT_EQ(resolver.resolve(kEui, "A1B3", "gw-1").status, JoinStatus::FreshAdmission);
}

TEST_F(JoinFixture, HeldLockFailsFastWithoutTouchingCacheOrRegistry) {
    ASSERT_TRUE(mem.try_acquire_lock(JoinResolver::lock_key(kEui, kNonce), "gw-other", 10s));

    auto out = resolver.resolve(kEui, kNonce, "gw-1");
    EXPECT_EQ(out.status, JoinStatus::LockDenied);
    EXPECT_TRUE(out.devices.empty());
    EXPECT_EQ(registry.get_calls.load(), 0);
    EXPECT_TRUE(store.set_keys.empty());
    // a denied caller never releases someone else's lock
    EXPECT_EQ(store.released, 0);
    EXPECT_FALSE(mem.try_acquire_lock(JoinResolver::lock_key(kEui, kNonce), "gw-3", 10s));
}

TEST_F(JoinFixture, UnknownDeviceStillBurnsTheNonce) {
    auto out = resolver.resolve("FFFFFFFFFFFFFFFF", kNonce, "gw-1");
    EXPECT_EQ(out.status, JoinStatus::FreshAdmission);
    EXPECT_TRUE(out.devices.empty());
    EXPECT_TRUE(mem.get(JoinResolver::nonce_key("FFFFFFFFFFFFFFFF", kNonce)).has_value());
    EXPECT_TRUE(store.deleted.empty());
    EXPECT_EQ(store.released, 1);

    // registering the device afterwards does not reopen the nonce
    registry.add("FFFFFFFFFFFFFFFF", "late-key");
    EXPECT_EQ(resolver.resolve("FFFFFFFFFFFFFFFF", kNonce, "gw-1").status,
              JoinStatus::ReplayDetected);
}

TEST_F(JoinFixture, RegistryFailureReleasesLockAndKeepsMarker) {
    registry.fail_get = true;
    EXPECT_THROW(resolver.resolve(kEui, kNonce, "gw-1"), lk::RegistryError);

    EXPECT_EQ(store.acquired, 1);
    EXPECT_EQ(store.released, 1);
    EXPECT_TRUE(store.held.empty());
    EXPECT_TRUE(mem.try_acquire_lock(JoinResolver::lock_key(kEui, kNonce), "gw-2", 10s));
    mem.release_lock(JoinResolver::lock_key(kEui, kNonce), "gw-2");

    // marker was written before the fault, so a retry of the same pair is a replay
    registry.fail_get = false;
    EXPECT_EQ(resolver.resolve(kEui, kNonce, "gw-1").status, JoinStatus::ReplayDetected);
}

TEST_F(JoinFixture, StoreFailureReleasesLock) {
    store.fail_get = true;
    EXPECT_THROW(resolver.resolve(kEui, kNonce, "gw-1"), lk::StoreError);
    EXPECT_EQ(store.released, 1);
    EXPECT_TRUE(store.held.empty());
    EXPECT_EQ(registry.get_calls.load(), 0);
}

TEST_F(JoinFixture, EmptyGatewayIdIsUsedForBothAcquireAndRelease) {
    auto out = resolver.resolve(kEui, kNonce, "");
    EXPECT_EQ(out.status, JoinStatus::FreshAdmission);
    EXPECT_EQ(store.last_release.second, "");
    EXPECT_TRUE(mem.try_acquire_lock(JoinResolver::lock_key(kEui, kNonce), "gw-2", 10s));
}

TEST_F(JoinFixture, LeaseExpiryMidCallStillPreventsDoubleAdmission) {
    // First caller takes the lock and writes the marker, then stalls past the lease.
    ASSERT_TRUE(mem.try_acquire_lock(JoinResolver::lock_key(kEui, kNonce), "slow-gw", 10s));
    mem.set(JoinResolver::nonce_key(kEui, kNonce), kNonce, 60s);
    clk.advance(11s);

    auto out = resolver.resolve(kEui, kNonce, "gw-2");
    EXPECT_EQ(out.status, JoinStatus::ReplayDetected);
}

TEST(JoinResolverConcurrency, AtMostOneGatewayIsAdmitted) {
    lk::internal::MemoryStore store;
    lk::test::FakeRegistry registry;
    registry.add(kEui, kKey);
    registry.get_delay = 20ms; // widen the critical section
    JoinResolver resolver(store, registry);

    constexpr int kCallers = 16;
    std::vector<JoinStatus> results(kCallers);
    std::vector<std::thread> threads;
    for (int i = 0; i < kCallers; ++i) {
        threads.emplace_back([&, i] {
            results[i] = resolver.resolve(kEui, kNonce, "gw-" + std::to_string(i)).status;
        });
    }
    for (auto& t : threads) t.join();

    int fresh = 0, other = 0;
    for (auto s : results) {
        if (s == JoinStatus::FreshAdmission) ++fresh;
        else if (s == JoinStatus::LockDenied || s == JoinStatus::ReplayDetected) ++other;
    }
    EXPECT_EQ(fresh, 1);
    EXPECT_EQ(other, kCallers - 1);
    EXPECT_EQ(registry.get_calls.load(), 1);

    // and nobody is left holding the lock
    EXPECT_TRUE(store.try_acquire_lock(JoinResolver::lock_key(kEui, kNonce), "probe", 1s));
}

TEST(JoinResolverOptions, CustomDurationsAreApplied) {
    lk::test::ManualClock clk;
    lk::internal::MemoryStore store(clk.fn());
    lk::test::FakeRegistry registry;
    registry.add(kEui, kKey);

    lk::JoinOptions opt;
    opt.lock_lease = 1s;
    opt.nonce_ttl = 5s;
    JoinResolver resolver(store, registry, opt);

    ASSERT_EQ(resolver.resolve(kEui, kNonce, "gw").status, JoinStatus::FreshAdmission);
    clk.advance(4s);
    EXPECT_EQ(resolver.resolve(kEui, kNonce, "gw").status, JoinStatus::ReplayDetected);
    clk.advance(1s);
    EXPECT_EQ(resolver.resolve(kEui, kNonce, "gw").status, JoinStatus::FreshAdmission);
}
