/**
 * @file test_metrics_store.cpp
 * @brief Unit tests for MetricsStore history, live state and garbage collection.
 */

#include "monitoring/metrics_store.hpp"

#include <gtest/gtest.h>
#include <thread>
#include <vector>

using namespace fleetwatch;
using namespace std::chrono_literals;

namespace {

StatusSample make_sample(const DeviceId& id, Timestamp at, float cpu) {
    StatusSample sample;
    sample.device_id = id;
    sample.family = DeviceFamily::Switch;
    sample.timestamp = at;
    sample.reachable = true;
    sample.cpu_percent = cpu;
    return sample;
}

}  // namespace

TEST(MetricsStoreTest, RecordSetsLiveState) {
    MetricsStore store;
    auto t0 = std::chrono::system_clock::now();
    store.record(make_sample("sw-1", t0, 15.0f), t0);

    auto live = store.live_state("sw-1");
    ASSERT_TRUE(live.has_value());
    EXPECT_EQ(live->last_seen, t0);
    EXPECT_FLOAT_EQ(live->last_status.cpu_percent, 15.0f);
    EXPECT_FALSE(store.live_state("sw-2").has_value());
    EXPECT_TRUE(store.history("sw-2").empty());
}

TEST(MetricsStoreTest, HistoryKeepsOrder) {
    MetricsStore store;
    auto t0 = std::chrono::system_clock::now();
    store.record(make_sample("sw-1", t0, 10.0f), t0);
    store.record(make_sample("sw-1", t0 + 30s, 20.0f), t0 + 30s);

    auto history = store.history("sw-1");
    ASSERT_EQ(history.size(), 2u);
    EXPECT_LT(history[0].timestamp, history[1].timestamp);
    EXPECT_FLOAT_EQ(history[1].cpu_percent, 20.0f);
    EXPECT_EQ(store.live_state("sw-1")->last_seen, t0 + 30s);
}

TEST(MetricsStoreTest, HistoryCapacityEvictsOldest) {
    MetricsStore store;
    EXPECT_EQ(store.history_capacity(), 60u);

    auto t0 = std::chrono::system_clock::now();
    for (int i = 0; i < 75; ++i) {
        auto at = t0 + std::chrono::seconds(i);
        store.record(make_sample("ap-1", at, static_cast<float>(i)), at);
    }

    auto history = store.history("ap-1");
    ASSERT_EQ(history.size(), 60u);
    EXPECT_FLOAT_EQ(history.front().cpu_percent, 15.0f);
    EXPECT_FLOAT_EQ(history.back().cpu_percent, 74.0f);
}

TEST(MetricsStoreTest, GarbageCollectionDropsStaleDevices) {
    MetricsStore store;
    auto now = std::chrono::system_clock::now();
    store.record(make_sample("stale", now - 61min, 1.0f), now - 61min);
    store.record(make_sample("edge", now - 60min, 1.0f), now - 60min);
    store.record(make_sample("fresh", now - 1min, 1.0f), now - 1min);

    auto removed = store.collect_garbage(now, 3600s);
    ASSERT_EQ(removed.size(), 1u);
    EXPECT_EQ(removed[0], "stale");
    EXPECT_FALSE(store.live_state("stale").has_value());
    EXPECT_TRUE(store.history("stale").empty());
    EXPECT_TRUE(store.live_state("edge").has_value());
    EXPECT_EQ(store.device_count(), 2u);
}

TEST(MetricsStoreTest, EraseRemovesBothViews) {
    MetricsStore store;
    auto t0 = std::chrono::system_clock::now();
    store.record(make_sample("sw-1", t0, 1.0f), t0);
    store.erase("sw-1");
    EXPECT_EQ(store.device_count(), 0u);
    EXPECT_TRUE(store.live_states().empty());
}

TEST(MetricsStoreTest, ConcurrentWritersAndReaders) {
    MetricsStore store(10);
    auto t0 = std::chrono::system_clock::now();

    std::vector<std::jthread> threads;
    for (int w = 0; w < 4; ++w) {
        threads.emplace_back([&store, t0, w] {
            auto id = "dev-" + std::to_string(w);
            for (int i = 0; i < 200; ++i) {
                auto at = t0 + std::chrono::seconds(i);
                store.record(make_sample(id, at, 1.0f), at);
            }
        });
    }
    threads.emplace_back([&store] {
        for (int i = 0; i < 200; ++i) (void)store.live_states();
    });
    threads.clear();

    EXPECT_EQ(store.device_count(), 4u);
    EXPECT_EQ(store.history("dev-2").size(), 10u);
}
