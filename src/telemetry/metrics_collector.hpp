/**
 * @file metrics_collector.hpp
 * @brief Structured event collection for telemetry.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string_view>

namespace fleetwatch {

struct Alert;

/**
 * @brief Collects and logs structured telemetry events as NDJSON.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_poll_tick(size_t devices_polled, size_t reachable, Duration elapsed);
    void record_alert(const Alert& alert);
    void record_gc_pass(size_t removed, size_t remaining);
    void record_discovery(std::string_view cidr, size_t hosts, size_t candidates, Duration elapsed);
    void record_custom(std::string_view event, std::string_view json_payload);

    void flush();

    [[nodiscard]] uint64_t events_recorded() const noexcept { return events_.load(); }

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;
    std::atomic<uint64_t> events_{0};

    void emit(std::string_view json_line);
};

}  // namespace fleetwatch
