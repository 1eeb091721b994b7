/**
 * @file test_discovery.cpp
 * @brief Unit tests for IPv4 range handling and the Scanner.
 */

#include "discovery/ipv4.hpp"
#include "discovery/scanner.hpp"
#include "protocol/mock_client.hpp"
#include "support/mock_fleet.hpp"

#include <gtest/gtest.h>

using namespace fleetwatch;
using namespace fleetwatch::testing;

TEST(Ipv4Test, ParseAndFormat) {
    auto address = parse_ipv4("192.168.1.10");
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(*address, 0xC0A8010Au);
    EXPECT_EQ(format_ipv4(*address), "192.168.1.10");

    EXPECT_FALSE(parse_ipv4("192.168.1").has_value());
    EXPECT_FALSE(parse_ipv4("192.168.1.256").has_value());
    EXPECT_FALSE(parse_ipv4("192.168.1.1.").has_value());
    EXPECT_FALSE(parse_ipv4("a.b.c.d").has_value());
}

TEST(Ipv4Test, CidrMasksHostBits) {
    auto range = parse_cidr("10.0.0.77/24");
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(format_ipv4(range->network), "10.0.0.0");
    EXPECT_EQ(range->prefix, 24);
    EXPECT_EQ(range->host_count(), 254u);

    auto hosts = range->hosts();
    ASSERT_EQ(hosts.size(), 254u);
    EXPECT_EQ(format_ipv4(hosts.front()), "10.0.0.1");
    EXPECT_EQ(format_ipv4(hosts.back()), "10.0.0.254");
}

TEST(Ipv4Test, PointToPointAndSingleHost) {
    EXPECT_EQ(parse_cidr("10.0.0.4/31")->hosts().size(), 2u);
    auto single = parse_cidr("10.0.0.9/32");
    ASSERT_TRUE(single.has_value());
    ASSERT_EQ(single->hosts().size(), 1u);
    EXPECT_EQ(format_ipv4(single->hosts()[0]), "10.0.0.9");
    EXPECT_EQ(parse_cidr("0.0.0.0/0")->host_count(), 4294967294u);
}

TEST(Ipv4Test, MalformedCidr) {
    EXPECT_EQ(parse_cidr("10.0.0.0").error().code, ErrorCode::InvalidArgument);
    EXPECT_FALSE(parse_cidr("10.0.0.0/33").has_value());
    EXPECT_FALSE(parse_cidr("10.0.0.0/").has_value());
    EXPECT_FALSE(parse_cidr("10.0.0/24").has_value());
}

// ─────────────────────────────────────────────
// Scanner
// ─────────────────────────────────────────────

class ScannerTest : public ::testing::Test {
protected:
    MockProtocolClient client_;
    Logger logger_ = make_null_logger();
    ScannerConfig config_;
    DriverConfig ports_;

    void SetUp() override {
        config_.workers = 4;
    }
};

TEST_F(ScannerTest, SlashThirtyProbesOnlyHosts) {
    client_.open_port("10.0.0.0", 22);     // network address, never probed
    client_.open_port("10.0.0.3", 22);     // broadcast, never probed
    seed_access_point(client_, "10.0.0.1", 10, 20, 3);

    Scanner scanner(client_, config_, ports_, logger_);
    auto result = scanner.discover("10.0.0.0/30");
    ASSERT_TRUE(result.has_value()) << result.error().message;

    ASSERT_EQ(result->size(), 1u);
    const auto& candidate = result->front();
    EXPECT_EQ(candidate.address, "10.0.0.1");
    EXPECT_EQ(candidate.family, DeviceFamily::AccessPoint);
    EXPECT_EQ(candidate.open_port, 22);
    EXPECT_EQ(candidate.sys_name, "ap-10.0.0.1");
    EXPECT_EQ(candidate.uptime, "1d 01:00:00");
}

TEST_F(ScannerTest, ClassifiesAndSortsByAddress) {
    seed_switch(client_, "10.0.1.20", 5, 5);
    seed_access_point(client_, "10.0.1.3", 5, 5, 0);
    client_.open_port("10.0.1.9", 80);
    client_.set_value("10.0.1.9", oids::SYS_DESCR, SnmpValue::string("Linux 5.15 router"));
    client_.open_port("10.0.1.100", 22);    // answers TCP, no SNMP agent data

    Scanner scanner(client_, config_, ports_, logger_);
    auto result = scanner.discover("10.0.1.0/24");
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->size(), 4u);

    EXPECT_EQ((*result)[0].address, "10.0.1.3");
    EXPECT_EQ((*result)[0].family, DeviceFamily::AccessPoint);
    EXPECT_EQ((*result)[1].address, "10.0.1.9");
    EXPECT_FALSE((*result)[1].family.has_value());
    EXPECT_EQ((*result)[1].open_port, 80);
    EXPECT_EQ((*result)[2].address, "10.0.1.20");
    EXPECT_EQ((*result)[2].family, DeviceFamily::Switch);
    EXPECT_EQ((*result)[3].address, "10.0.1.100");
    EXPECT_TRUE((*result)[3].sys_descr.empty());
}

TEST_F(ScannerTest, WrongCommunityLeavesHostUnclassified) {
    seed_switch(client_, "10.0.2.5", 5, 5);
    client_.set_community("10.0.2.5", "private");

    Scanner scanner(client_, config_, ports_, logger_);
    auto result = scanner.discover("10.0.2.5/32");
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->size(), 1u);
    EXPECT_FALSE(result->front().family.has_value());
}

TEST_F(ScannerTest, EmptyRangeResult) {
    Scanner scanner(client_, config_, ports_, logger_);
    auto result = scanner.discover("172.16.0.0/29");
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->empty());
    EXPECT_EQ(client_.probe_count(), 12u);  // 6 hosts x (management + fallback)
}

TEST_F(ScannerTest, RejectsOversizedAndMalformedRanges) {
    config_.max_hosts = 254;
    Scanner scanner(client_, config_, ports_, logger_);

    auto oversized = scanner.discover("10.0.0.0/16");
    ASSERT_FALSE(oversized.has_value());
    EXPECT_EQ(oversized.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(client_.probe_count(), 0u);

    EXPECT_EQ(scanner.discover("not-a-range").error().code, ErrorCode::InvalidArgument);
    EXPECT_TRUE(scanner.discover("10.0.0.0/24").has_value());
}
