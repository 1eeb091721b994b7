/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading.
 */

#include "core/config.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace fleetwatch;

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "fw_test_config";
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }

    std::filesystem::path write_toml(const std::string& content) {
        auto path = temp_dir_ / "test.toml";
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }
};

TEST_F(ConfigTest, DefaultConfig) {
    auto config = default_config();
    EXPECT_EQ(config.service.name, "fleetwatch");
    EXPECT_EQ(config.poller.collection_interval_s, 30u);
    EXPECT_EQ(config.poller.alert_interval_s, 60u);
    EXPECT_EQ(config.poller.gc_interval_s, 300u);
    EXPECT_EQ(config.poller.stale_after_s, 3600u);
    EXPECT_EQ(config.scanner.workers, 20u);
    EXPECT_EQ(config.alerts.capacity, 100u);
    EXPECT_EQ(config.alerts.offline_after_s, 120u);
    EXPECT_EQ(config.driver.management_port, 22);
    EXPECT_EQ(config.driver.fallback_port, 80);
}

TEST_F(ConfigTest, LoadFullConfig) {
    auto path = write_toml(R"(
        [service]
        name = "branch-monitor"
        inventory_path = "/etc/fleetwatch/devices.toml"

        [poller]
        collection_interval_s = 15
        alert_interval_s = 45
        gc_interval_s = 600
        stale_after_s = 7200
        workers = 4

        [driver]
        management_port = 2222
        fallback_port = 443
        probe_timeout_ms = 1500
        snmp_timeout_ms = 900
        ssh_timeout_ms = 5000
        max_backups_per_device = 3

        [scanner]
        workers = 32
        probe_timeout_ms = 750
        max_hosts = 1024
        community = "monitor"

        [alerts]
        capacity = 50
        offline_after_s = 300

        [alerts.rules.high_cpu_usage]
        threshold = 90

        [alerts.rules.low_client_count]
        enabled = false

        [telemetry]
        log_dir = "/tmp/fw_logs"
        log_level = "debug"
        max_file_size_mb = 10
        rotate_count = 2
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    auto& config = *result;
    EXPECT_EQ(config.service.name, "branch-monitor");
    EXPECT_EQ(config.service.inventory_path.string(), "/etc/fleetwatch/devices.toml");
    EXPECT_EQ(config.poller.collection_interval_s, 15u);
    EXPECT_EQ(config.poller.alert_interval_s, 45u);
    EXPECT_EQ(config.poller.gc_interval_s, 600u);
    EXPECT_EQ(config.poller.stale_after_s, 7200u);
    EXPECT_EQ(config.poller.workers, 4u);
    EXPECT_EQ(config.driver.management_port, 2222);
    EXPECT_EQ(config.driver.fallback_port, 443);
    EXPECT_EQ(config.driver.snmp_timeout_ms, 900u);
    EXPECT_EQ(config.driver.max_backups_per_device, 3u);
    EXPECT_EQ(config.scanner.workers, 32u);
    EXPECT_EQ(config.scanner.max_hosts, 1024u);
    EXPECT_EQ(config.scanner.community, "monitor");
    EXPECT_EQ(config.alerts.capacity, 50u);
    EXPECT_EQ(config.alerts.offline_after_s, 300u);

    ASSERT_EQ(config.alerts.rules.count("high_cpu_usage"), 1u);
    EXPECT_DOUBLE_EQ(*config.alerts.rules.at("high_cpu_usage").threshold, 90.0);
    EXPECT_FALSE(config.alerts.rules.at("high_cpu_usage").enabled.has_value());
    ASSERT_EQ(config.alerts.rules.count("low_client_count"), 1u);
    EXPECT_EQ(config.alerts.rules.at("low_client_count").enabled, false);

    EXPECT_EQ(config.telemetry.log_dir.string(), "/tmp/fw_logs");
    EXPECT_EQ(config.telemetry.log_level, "debug");
    EXPECT_EQ(config.telemetry.max_file_size_mb, 10u);
    EXPECT_EQ(config.telemetry.rotate_count, 2u);
}

TEST_F(ConfigTest, PartialConfig) {
    auto path = write_toml(R"(
        [poller]
        workers = 2
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value());

    // Overridden field
    EXPECT_EQ(result->poller.workers, 2u);
    // Defaults for everything else
    EXPECT_EQ(result->poller.collection_interval_s, 30u);
    EXPECT_EQ(result->alerts.capacity, 100u);
}

TEST_F(ConfigTest, NegativeValueKeepsDefault) {
    auto path = write_toml(R"(
        [poller]
        workers = -3
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->poller.workers, 8u);
}

TEST_F(ConfigTest, NonexistentFile) {
    auto result = load_config("/nonexistent/path/config.toml");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Io);
}

TEST_F(ConfigTest, MalformedToml) {
    auto path = write_toml("this is [[ not valid toml }}}}");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Parse);
}
