/**
 * @file test_poller.cpp
 * @brief Unit tests for the Poller cadences and dispatcher lifecycle.
 */

#include "monitoring/poller.hpp"
#include "support/mock_fleet.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>

using namespace fleetwatch;
using namespace fleetwatch::testing;
using namespace std::chrono_literals;

namespace {

/// Mock whose liveness probe throws for one address.
class FaultyClient : public MockProtocolClient {
public:
    explicit FaultyClient(std::string faulty) : faulty_(std::move(faulty)) {}

    bool probe(const std::string& address, uint16_t port, Duration timeout) override {
        if (address == faulty_) throw std::runtime_error("socket table exhausted");
        return MockProtocolClient::probe(address, port, timeout);
    }

private:
    std::string faulty_;
};

/// Mock that holds the liveness probe of one address until released.
class GatedClient : public MockProtocolClient {
public:
    explicit GatedClient(std::string gated) : gated_(std::move(gated)) {}

    bool probe(const std::string& address, uint16_t port, Duration timeout) override {
        if (address == gated_) {
            if (!entered_flag_.exchange(true)) entered_.set_value();
            release_future_.wait();
        }
        return MockProtocolClient::probe(address, port, timeout);
    }

    bool wait_entered(std::chrono::seconds limit) {
        return entered_future_.wait_for(limit) == std::future_status::ready;
    }

    void release() { release_.set_value(); }

private:
    std::string gated_;
    std::atomic<bool> entered_flag_{false};
    std::promise<void> entered_;
    std::future<void> entered_future_{entered_.get_future()};
    std::promise<void> release_;
    std::shared_future<void> release_future_{release_.get_future().share()};
};

/// Telemetry sink whose first write throws a std::exception and whose
/// second throws a non-standard type.
class ThrowingSink : public ILogSink {
public:
    explicit ThrowingSink(std::atomic<int>& writes) : writes_(writes) {}

    void write(std::string_view /*json_line*/) override {
        int n = ++writes_;
        if (n == 1) throw std::runtime_error("telemetry disk full");
        if (n == 2) throw 7;
    }
    void flush() override {}

private:
    std::atomic<int>& writes_;
};

}  // namespace

class PollerTest : public ::testing::Test {
protected:
    FaultyClient client_{"10.0.0.99"};
    Logger logger_ = make_null_logger();
    DriverContext ctx_{client_, DriverConfig{}, logger_};
    DeviceRegistry registry_{ctx_};
    MetricsStore metrics_;
    AlertEngine alerts_{default_rules(), 0, logger_};
    PollerConfig config_;
    Timestamp t0_ = std::chrono::system_clock::now();

    void SetUp() override {
        config_.workers = 2;
        seed_switch(client_, "10.0.0.20", 15, 35);
        seed_access_point(client_, "10.0.0.10", 95, 40, 4);
        ASSERT_TRUE(registry_.add(make_device("sw-1", DeviceFamily::Switch, "10.0.0.20")).has_value());
        ASSERT_TRUE(registry_.add(make_device("ap-1", DeviceFamily::AccessPoint, "10.0.0.10")).has_value());
    }
};

TEST_F(PollerTest, CollectRecordsEveryEnabledDevice) {
    auto disabled = make_device("ap-off", DeviceFamily::AccessPoint, "10.0.0.12");
    disabled.enabled = false;
    ASSERT_TRUE(registry_.add(disabled).has_value());

    Poller poller(registry_, metrics_, alerts_, config_, logger_);
    auto stats = poller.collect_once(t0_);

    EXPECT_EQ(stats.polled, 2u);
    EXPECT_EQ(stats.reachable, 2u);
    EXPECT_EQ(stats.failed, 0u);
    EXPECT_EQ(metrics_.device_count(), 2u);

    auto sw = metrics_.live_state("sw-1");
    ASSERT_TRUE(sw.has_value());
    EXPECT_EQ(sw->last_seen, t0_);
    EXPECT_FLOAT_EQ(sw->last_status.cpu_percent, 15.0f);
    EXPECT_FALSE(metrics_.live_state("ap-off").has_value());
}

TEST_F(PollerTest, UnreachableAndThrowingDevicesAreRecorded) {
    ASSERT_TRUE(registry_.add(make_device("sw-gone", DeviceFamily::Switch, "10.0.0.30")).has_value());
    ASSERT_TRUE(registry_.add(make_device("sw-bad", DeviceFamily::Switch, "10.0.0.99")).has_value());

    Poller poller(registry_, metrics_, alerts_, config_, logger_);
    auto stats = poller.collect_once(t0_);

    EXPECT_EQ(stats.polled, 4u);
    EXPECT_EQ(stats.reachable, 2u);
    EXPECT_EQ(stats.failed, 1u);

    auto bad = metrics_.live_state("sw-bad");
    ASSERT_TRUE(bad.has_value());
    EXPECT_FALSE(bad->last_status.reachable);
    EXPECT_FALSE(metrics_.live_state("sw-gone")->last_status.reachable);
}

TEST_F(PollerTest, SuccessiveTicksAppendHistory) {
    Poller poller(registry_, metrics_, alerts_, config_, logger_);
    poller.collect_once(t0_);
    client_.set_value("10.0.0.20", oids::COMWARE_CPU_PERCENT, SnmpValue::gauge(22));
    poller.collect_once(t0_ + 30s);

    auto history = metrics_.history("sw-1");
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].timestamp, t0_);
    EXPECT_EQ(history[1].timestamp, t0_ + 30s);
    EXPECT_FLOAT_EQ(history[1].cpu_percent, 22.0f);
}

TEST_F(PollerTest, AlertCadenceUsesLiveState) {
    Poller poller(registry_, metrics_, alerts_, config_, logger_);
    poller.collect_once(t0_);

    auto raised = poller.evaluate_alerts_once(t0_);
    ASSERT_EQ(raised.size(), 1u);
    EXPECT_EQ(raised[0].device_id, "ap-1");
    EXPECT_EQ(raised[0].rule_name, "high_cpu_usage");

    // Polling stopped: both devices cross the offline threshold.
    auto later = poller.evaluate_alerts_once(t0_ + 121s);
    size_t offline = 0;
    for (const auto& alert : later) {
        if (alert.rule_name == "device_offline") ++offline;
    }
    EXPECT_EQ(offline, 2u);
}

TEST_F(PollerTest, GarbageCadenceKeepsConfig) {
    Poller poller(registry_, metrics_, alerts_, config_, logger_);
    poller.collect_once(t0_ - 61min);

    auto paused = make_device("ap-1", DeviceFamily::AccessPoint, "10.0.0.10");
    paused.enabled = false;
    ASSERT_TRUE(registry_.update(paused).has_value());
    poller.collect_once(t0_);

    auto removed = poller.collect_garbage_once(t0_);
    ASSERT_EQ(removed.size(), 1u);
    EXPECT_EQ(removed[0], "ap-1");
    EXPECT_FALSE(metrics_.live_state("ap-1").has_value());
    EXPECT_TRUE(registry_.contains("ap-1"));
    EXPECT_TRUE(metrics_.live_state("sw-1").has_value());
}

TEST_F(PollerTest, StartRunsCollectionImmediatelyAndStops) {
    Poller poller(registry_, metrics_, alerts_, config_, logger_);
    EXPECT_FALSE(poller.running());

    poller.start();
    poller.start();     // no-op
    EXPECT_TRUE(poller.running());

    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (metrics_.device_count() < 2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    poller.stop();

    EXPECT_FALSE(poller.running());
    EXPECT_EQ(metrics_.device_count(), 2u);
    EXPECT_GE(poller.ticks_completed(), 1u);
    poller.stop();      // idempotent
}

TEST_F(PollerTest, DispatcherSurvivesThrowingTicks) {
    std::atomic<int> writes{0};
    MetricsCollector telemetry(std::make_unique<ThrowingSink>(writes));
    config_.collection_interval_s = 1;
    Poller poller(registry_, metrics_, alerts_, config_, logger_, &telemetry);

    poller.start();
    auto deadline = std::chrono::steady_clock::now() + 10s;
    while (poller.ticks_completed() < 1 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(20ms);
    }
    poller.stop();

    // Two collection ticks threw out of telemetry; the third completed.
    EXPECT_GE(writes.load(), 3);
    EXPECT_GE(poller.ticks_completed(), 1u);
    EXPECT_GE(metrics_.history("sw-1").size(), 3u);
}

TEST(PollerRemovalTest, DeviceRemovedMidTickLeavesNoState) {
    GatedClient client("10.0.0.20");
    Logger logger = make_null_logger();
    DriverContext ctx{client, DriverConfig{}, logger};
    DeviceRegistry registry(ctx);
    MetricsStore metrics;
    AlertEngine alerts(default_rules(), 0, logger);
    PollerConfig config;
    config.workers = 2;
    auto t0 = std::chrono::system_clock::now();

    seed_switch(client, "10.0.0.20", 15, 35);
    seed_access_point(client, "10.0.0.10", 30, 40, 4);
    ASSERT_TRUE(registry.add(make_device("sw-1", DeviceFamily::Switch, "10.0.0.20")).has_value());
    ASSERT_TRUE(registry.add(make_device("ap-1", DeviceFamily::AccessPoint, "10.0.0.10")).has_value());

    Poller poller(registry, metrics, alerts, config, logger);
    auto tick = std::async(std::launch::async, [&] { return poller.collect_once(t0); });

    bool entered = client.wait_entered(5s);
    if (entered) {
        EXPECT_TRUE(registry.remove("sw-1").has_value());
        metrics.erase("sw-1");
    }
    client.release();
    auto stats = tick.get();
    ASSERT_TRUE(entered);

    EXPECT_EQ(stats.polled, 1u);
    EXPECT_FALSE(metrics.live_state("sw-1").has_value());
    EXPECT_TRUE(metrics.history("sw-1").empty());
    EXPECT_TRUE(metrics.live_state("ap-1").has_value());

    for (const auto& alert : poller.evaluate_alerts_once(t0 + 121s)) {
        EXPECT_NE(alert.device_id, "sw-1");
    }
}
