/**
 * @file test_logger.cpp
 * @brief Unit tests for Logger, log sinks and MetricsCollector.
 */

#include "alerting/alert_engine.hpp"
#include "core/logger.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

using namespace fleetwatch;

namespace {

/// Keeps lines in memory; the vector outlives the sink through shared_ptr.
class CaptureSink : public ILogSink {
public:
    explicit CaptureSink(std::shared_ptr<std::vector<std::string>> lines) : lines_(std::move(lines)) {}

    void write(std::string_view json_line) override {
        std::lock_guard lock(mutex_);
        lines_->emplace_back(json_line);
    }
    void flush() override {}

private:
    std::shared_ptr<std::vector<std::string>> lines_;
    std::mutex mutex_;
};

size_t count_lines(const std::filesystem::path& path) {
    std::ifstream in(path);
    size_t n = 0;
    std::string line;
    while (std::getline(in, line)) ++n;
    return n;
}

}  // namespace

TEST(LoggerTest, FiltersBelowMinimumLevel) {
    auto lines = std::make_shared<std::vector<std::string>>();
    Logger logger(std::make_unique<CaptureSink>(lines), LogLevel::Warn);

    logger.debug("hidden");
    logger.info("hidden");
    logger.warn("shown");
    logger.error("shown");
    EXPECT_EQ(lines->size(), 2u);

    logger.set_level(LogLevel::Debug);
    logger.debug("now visible");
    EXPECT_EQ(lines->size(), 3u);
    EXPECT_EQ(logger.level(), LogLevel::Debug);
}

TEST(LoggerTest, WritesNdjsonWithComponent) {
    auto lines = std::make_shared<std::vector<std::string>>();
    Logger logger(std::make_unique<CaptureSink>(lines), LogLevel::Debug);

    logger.log(LogLevel::Info, "poller", "Collected 3 devices");
    ASSERT_EQ(lines->size(), 1u);
    const auto& line = lines->front();
    EXPECT_EQ(line.front(), '{');
    EXPECT_EQ(line.back(), '}');
    EXPECT_NE(line.find(R"("level":"info")"), std::string::npos);
    EXPECT_NE(line.find(R"("component":"poller")"), std::string::npos);
    EXPECT_NE(line.find(R"("msg":"Collected 3 devices")"), std::string::npos);
    EXPECT_NE(line.find(R"("ts":")"), std::string::npos);
}

TEST(LoggerTest, EscapesMessage) {
    EXPECT_EQ(json_escape(R"(say "hi")"), R"(say \"hi\")");
    EXPECT_EQ(json_escape("a\\b"), "a\\\\b");
    EXPECT_EQ(json_escape("line\nbreak"), "line\\nbreak");
    EXPECT_EQ(json_escape(std::string("\x01", 1)), "\\u0001");
}

TEST(LoggerTest, ParseLevel) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("error"), LogLevel::Error);
    EXPECT_FALSE(parse_log_level("verbose").has_value());
}

// ─────────────────────────────────────────────
// JsonFileSink
// ─────────────────────────────────────────────

class JsonFileSinkTest : public ::testing::Test {
protected:
    std::filesystem::path dir_;

    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / "fw_test_sink";
        std::filesystem::remove_all(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }
};

TEST_F(JsonFileSinkTest, AppendsLines) {
    {
        JsonFileSink sink(dir_, "fleet", 1024 * 1024, 3);
        sink.write(R"({"n":1})");
        sink.write(R"({"n":2})");
        sink.flush();
    }
    EXPECT_EQ(count_lines(dir_ / "fleet.ndjson"), 2u);
}

TEST_F(JsonFileSinkTest, RotatesAndBoundsFileCount) {
    JsonFileSink sink(dir_, "fleet", 64, 2);
    const std::string line(40, 'x');
    for (int i = 0; i < 10; ++i) sink.write(line);
    sink.flush();

    EXPECT_TRUE(std::filesystem::exists(sink.active_path()));
    EXPECT_TRUE(std::filesystem::exists(sink.rotated_path(1)));
    EXPECT_TRUE(std::filesystem::exists(sink.rotated_path(2)));
    EXPECT_FALSE(std::filesystem::exists(sink.rotated_path(3)));
    EXPECT_LE(std::filesystem::file_size(sink.rotated_path(1)), 64u + line.size() + 1);
}

// ─────────────────────────────────────────────
// MetricsCollector
// ─────────────────────────────────────────────

TEST(MetricsCollectorTest, EmitsStructuredEvents) {
    auto lines = std::make_shared<std::vector<std::string>>();
    MetricsCollector collector(std::make_unique<CaptureSink>(lines));

    collector.record_poll_tick(3, 2, Duration{120});
    collector.record_gc_pass(1, 4);
    collector.record_discovery("10.0.0.0/30", 2, 1, Duration{15});

    Alert alert;
    alert.id = "sw-1_port_down_0_0";
    alert.device_id = "sw-1";
    alert.rule_name = "port_down";
    alert.severity = Severity::Warning;
    collector.record_alert(alert);
    collector.record_custom("startup", R"({"devices":3})");

    ASSERT_EQ(lines->size(), 5u);
    EXPECT_EQ(collector.events_recorded(), 5u);
    EXPECT_NE((*lines)[0].find(R"("event":"poll_tick")"), std::string::npos);
    EXPECT_NE((*lines)[0].find(R"("reachable":2)"), std::string::npos);
    EXPECT_NE((*lines)[1].find(R"("removed":1)"), std::string::npos);
    EXPECT_NE((*lines)[2].find(R"("cidr":"10.0.0.0/30")"), std::string::npos);
    EXPECT_NE((*lines)[3].find(R"("severity":"warning")"), std::string::npos);
    EXPECT_NE((*lines)[4].find(R"("data":{"devices":3})"), std::string::npos);
}
