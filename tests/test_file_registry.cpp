/*
 * Part of the LoRaKeys (LK) project.
 *
 * SPDX-FileCopyrightText: 2025 LoRaKeys contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of LoRaKeys (LK). See LICENSE for details.
 */

#include <gtest/gtest.h>

#include <sstream>
#include "lk/internal/file_registry.hpp"

using lk::internal::FileRegistry;

namespace {

std::vector<std::string> drain(lk::internal::DeviceQuery& q, int* pages = nullptr) {
    std::vector<std::string> ids;
    int n = 0;
    while (q.has_more()) {
        auto page = q.next_page();
        ++n;
        ids.insert(ids.end(), page.begin(), page.end());
    }
    if (pages) *pages = n;
    return ids;
}

} // namespace

TEST(FileRegistry, LoadsDevicesAndSkipsComments) {
    std::istringstream in(
        "# devices\n"
        "\n"
        "0004A30B001C0530 2B7E151628AED2A6ABF7158809CF4F3C desired=0102AABB\n"
        "  0004A30B001C0531   key-two   reported=0102AABB  \n"
        "0004A30B001C0532 key-three\n");
    FileRegistry reg;
    ASSERT_TRUE(reg.init_stream(in, "test"));
    EXPECT_EQ(reg.size(), 3u);

    auto d = reg.get_by_id("0004A30B001C0530");
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->primary_key, "2B7E151628AED2A6ABF7158809CF4F3C");
    EXPECT_EQ(d->desired_dev_addr, "0102AABB");
    EXPECT_TRUE(d->reported_dev_addr.empty());

    d = reg.get_by_id("0004A30B001C0531");
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->primary_key, "key-two");
    EXPECT_EQ(d->reported_dev_addr, "0102AABB");

    EXPECT_FALSE(reg.get_by_id("FFFFFFFFFFFFFFFF").has_value());
}

TEST(FileRegistry, RejectsMalformedInputWithoutReplacingTable) {
    FileRegistry reg;
    std::istringstream good("AAAA key1\n");
    ASSERT_TRUE(reg.init_stream(good, "good"));

    std::istringstream missing_key("BBBB\n");
    EXPECT_FALSE(reg.init_stream(missing_key, "bad"));

    std::istringstream bad_attr("BBBB key2 owner=me\n");
    EXPECT_FALSE(reg.init_stream(bad_attr, "bad"));

    std::istringstream bad_addr("BBBB key2 desired=01'02\n");
    EXPECT_FALSE(reg.init_stream(bad_addr, "bad"));

    std::istringstream dup("CCCC k\nCCCC k\n");
    EXPECT_FALSE(reg.init_stream(dup, "bad"));

    EXPECT_EQ(reg.size(), 1u);
    EXPECT_TRUE(reg.get_by_id("AAAA").has_value());
}

TEST(FileRegistry, MissingFileFailsLoad) {
    FileRegistry reg;
    EXPECT_FALSE(reg.init_file("/nonexistent/lk-devices.txt"));
}

TEST(FileRegistry, AddressQueryMatchesDesiredOrReportedAndPages) {
    std::istringstream in(
        "D1 k1 desired=0102AABB\n"
        "D2 k2 reported=0102AABB\n"
        "D3 k3 desired=11111111 reported=0102AABB\n"
        "D4 k4 desired=22222222\n"
        "D5 k5\n");
    FileRegistry reg(2);
    ASSERT_TRUE(reg.init_stream(in, "test"));

    auto q = reg.query_by_address("0102AABB");
    int pages = 0;
    auto ids = drain(*q, &pages);
    EXPECT_EQ(ids, (std::vector<std::string>{"D1", "D2", "D3"}));
    EXPECT_EQ(pages, 2);

    // exhausted cursor stays exhausted; a new query starts over
    EXPECT_FALSE(q->has_more());
    EXPECT_EQ(drain(*reg.query_by_address("0102AABB")).size(), 3u);
}

TEST(FileRegistry, EmptyAddressMatchesNothing) {
    std::istringstream in("D5 k5\n");
    FileRegistry reg;
    ASSERT_TRUE(reg.init_stream(in, "test"));
    auto q = reg.query_by_address("");
    EXPECT_FALSE(q->has_more());
}
