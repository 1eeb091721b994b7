/**
 * @file test_types.cpp
 * @brief Unit tests for core types and the ring buffer.
 */

#include "core/ring_buffer.hpp"
#include "core/types.hpp"

#include <gtest/gtest.h>

using namespace fleetwatch;

TEST(DeviceFamilyTest, ToStringAndLabel) {
    EXPECT_EQ(to_string(DeviceFamily::AccessPoint), "access_point");
    EXPECT_EQ(to_string(DeviceFamily::Switch), "switch");
    EXPECT_EQ(display_label(DeviceFamily::AccessPoint), "Aruba AP");
    EXPECT_EQ(display_label(DeviceFamily::Switch), "3Com Switch");
}

TEST(DeviceFamilyTest, ParseAcceptsLegacyNames) {
    EXPECT_EQ(parse_family("access_point"), DeviceFamily::AccessPoint);
    EXPECT_EQ(parse_family("aruba_ap500"), DeviceFamily::AccessPoint);
    EXPECT_EQ(parse_family("SWITCH"), DeviceFamily::Switch);
    EXPECT_EQ(parse_family("3com_switch"), DeviceFamily::Switch);
    EXPECT_FALSE(parse_family("router").has_value());
}

TEST(StatusSampleTest, UnreachableSampleIsZeroed) {
    DeviceConfig device;
    device.id = "ap-1";
    device.family = DeviceFamily::AccessPoint;

    auto at = std::chrono::system_clock::now();
    auto sample = unreachable_sample(device, at);
    EXPECT_EQ(sample.device_id, "ap-1");
    EXPECT_FALSE(sample.reachable);
    EXPECT_FLOAT_EQ(sample.cpu_percent, 0.0f);
    EXPECT_FLOAT_EQ(sample.memory_percent, 0.0f);
    EXPECT_FALSE(sample.temperature_c.has_value());
    EXPECT_EQ(sample.access_point(), nullptr);
    EXPECT_EQ(sample.client_count(), 0u);
    EXPECT_EQ(sample.timestamp, at);
}

TEST(StatusSampleTest, SwitchPortsDown) {
    SwitchStatus sw;
    sw.ports[1] = PortState{1, "Gi1/0/1", true};
    sw.ports[2] = PortState{2, "Gi1/0/2", false};
    sw.ports[3] = PortState{3, "Gi1/0/3", false};
    EXPECT_EQ(sw.ports_down(), 2u);
}

// ─────────────────────────────────────────────
// RingBuffer
// ─────────────────────────────────────────────

TEST(RingBufferTest, ZeroCapacityRejected) {
    EXPECT_THROW(RingBuffer<int>(0), std::invalid_argument);
}

TEST(RingBufferTest, EvictsOldestWhenFull) {
    RingBuffer<int> ring(3);
    for (int i = 1; i <= 5; ++i) ring.push(i);

    EXPECT_TRUE(ring.full());
    EXPECT_EQ(ring.size(), 3u);
    EXPECT_EQ(ring.front(), 3);
    EXPECT_EQ(ring.back(), 5);
    EXPECT_EQ(ring.to_vector(), (std::vector<int>{3, 4, 5}));
}

TEST(RingBufferTest, AtCountsFromOldest) {
    RingBuffer<int> ring(4);
    ring.push(10);
    ring.push(20);
    EXPECT_EQ(ring.at(0), 10);
    EXPECT_EQ(ring.at(1), 20);
    EXPECT_THROW((void)ring.at(2), std::out_of_range);
}

TEST(RingBufferTest, ClearEmpties) {
    RingBuffer<int> ring(2);
    ring.push(1);
    ring.clear();
    EXPECT_TRUE(ring.empty());
    ring.push(7);
    EXPECT_EQ(ring.to_vector(), (std::vector<int>{7}));
}
