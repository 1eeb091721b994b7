/**
 * @file poller.hpp
 * @brief Background dispatcher for collection, alert evaluation and GC.
 *
 * One std::jthread runs three independent cadences:
 *   - collection   poll every enabled device through a bounded worker pool
 *   - alerts       evaluate rules over MetricsStore::live_states()
 *   - gc           drop monitoring state not refreshed within stale_after
 *
 * Each cadence is also callable directly (collect_once() and friends) so
 * tests can drive ticks with a fixed clock.
 */

#pragma once

#include "alerting/alert_engine.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/thread_pool.hpp"
#include "monitoring/metrics_store.hpp"
#include "registry/device_registry.hpp"
#include "telemetry/metrics_collector.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <stop_token>
#include <thread>
#include <vector>

namespace fleetwatch {

using Clock = std::function<Timestamp()>;

struct PollStats {
    size_t polled{0};
    size_t reachable{0};
    size_t failed{0};               ///< Driver threw; recorded as unreachable
};

class Poller {
public:
    Poller(DeviceRegistry& registry,
           MetricsStore& metrics,
           AlertEngine& alerts,
           const PollerConfig& config,
           Logger& logger,
           MetricsCollector* telemetry = nullptr,
           Clock clock = [] { return std::chrono::system_clock::now(); });
    ~Poller();

    Poller(const Poller&) = delete;
    Poller& operator=(const Poller&) = delete;

    /// Start the dispatcher. A second call while running is a no-op.
    void start();

    /// Stop scheduling ticks, wait for the tick in progress, join.
    void stop();

    [[nodiscard]] bool running() const noexcept { return running_.load(); }

    /// Poll every enabled device once and record the samples at @p now.
    PollStats collect_once(Timestamp now);

    std::vector<Alert> evaluate_alerts_once(Timestamp now);

    std::vector<DeviceId> collect_garbage_once(Timestamp now);

    [[nodiscard]] uint64_t ticks_completed() const noexcept { return ticks_.load(); }

private:
    void dispatch_loop(std::stop_token stop);

    /// Run @p tick, logging anything it throws.
    void guarded(const char* cadence, const std::function<void()>& tick);

    DeviceRegistry& registry_;
    MetricsStore& metrics_;
    AlertEngine& alerts_;
    PollerConfig config_;
    Logger& logger_;
    MetricsCollector* telemetry_;
    Clock clock_;

    std::unique_ptr<ThreadPool> pool_;
    std::jthread dispatcher_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> ticks_{0};
};

}  // namespace fleetwatch
