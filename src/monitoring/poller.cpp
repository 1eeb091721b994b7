/**
 * @file poller.cpp
 * @brief Poller implementation.
 */

#include "monitoring/poller.hpp"

#include <algorithm>
#include <exception>
#include <future>

namespace fleetwatch {

namespace {

constexpr auto DISPATCH_SLICE = std::chrono::milliseconds(50);

}  // namespace

Poller::Poller(DeviceRegistry& registry,
               MetricsStore& metrics,
               AlertEngine& alerts,
               const PollerConfig& config,
               Logger& logger,
               MetricsCollector* telemetry,
               Clock clock)
    : registry_(registry)
    , metrics_(metrics)
    , alerts_(alerts)
    , config_(config)
    , logger_(logger)
    , telemetry_(telemetry)
    , clock_(std::move(clock))
    , pool_(std::make_unique<ThreadPool>(std::max<uint32_t>(1, config.workers))) {}

Poller::~Poller() {
    stop();
    pool_->shutdown();
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

void Poller::start() {
    if (running_.exchange(true)) return;

    logger_.log(LogLevel::Info, "poller",
                "Starting: collection=" + std::to_string(config_.collection_interval_s)
                + "s alerts=" + std::to_string(config_.alert_interval_s)
                + "s gc=" + std::to_string(config_.gc_interval_s) + "s");

    dispatcher_ = std::jthread([this](std::stop_token stop) { dispatch_loop(stop); });
}

void Poller::stop() {
    if (!running_.exchange(false)) return;

    dispatcher_.request_stop();
    if (dispatcher_.joinable()) dispatcher_.join();
    logger_.log(LogLevel::Info, "poller",
                "Stopped after " + std::to_string(ticks_.load()) + " ticks");
}

void Poller::dispatch_loop(std::stop_token stop) {
    using steady = std::chrono::steady_clock;

    const auto collection_every = std::chrono::seconds(std::max<uint32_t>(1, config_.collection_interval_s));
    const auto alerts_every = std::chrono::seconds(std::max<uint32_t>(1, config_.alert_interval_s));
    const auto gc_every = std::chrono::seconds(std::max<uint32_t>(1, config_.gc_interval_s));

    auto next_collection = steady::now();
    auto next_alerts = steady::now() + alerts_every;
    auto next_gc = steady::now() + gc_every;

    while (!stop.stop_requested()) {
        auto now = steady::now();

        if (now >= next_collection) {
            guarded("collection", [this] { collect_once(clock_()); });
            next_collection = now + collection_every;
        }
        if (now >= next_alerts) {
            guarded("alerts", [this] { evaluate_alerts_once(clock_()); });
            next_alerts = now + alerts_every;
        }
        if (now >= next_gc) {
            guarded("gc", [this] { collect_garbage_once(clock_()); });
            next_gc = now + gc_every;
        }

        auto deadline = std::min({next_collection, next_alerts, next_gc});
        while (!stop.stop_requested() && steady::now() < deadline) {
            std::this_thread::sleep_for(DISPATCH_SLICE);
        }
    }
}

void Poller::guarded(const char* cadence, const std::function<void()>& tick) {
    try {
        tick();
        ticks_.fetch_add(1, std::memory_order_relaxed);
    } catch (const std::exception& e) {
        logger_.log(LogLevel::Error, "poller",
                    std::string(cadence) + " tick failed: " + e.what());
    } catch (...) {
        logger_.log(LogLevel::Error, "poller",
                    std::string(cadence) + " tick failed: non-standard exception");
    }
}

// ─────────────────────────────────────────────
// Cadences
// ─────────────────────────────────────────────

PollStats Poller::collect_once(Timestamp now) {
    auto started = std::chrono::steady_clock::now();
    auto drivers = registry_.enabled_drivers();

    std::vector<std::future<StatusSample>> pending;
    pending.reserve(drivers.size());
    for (const auto& driver : drivers) {
        pending.push_back(pool_->submit([driver, now] { return driver->status(now); }));
    }

    PollStats stats;
    for (size_t i = 0; i < pending.size(); ++i) {
        const auto& device = drivers[i]->device();
        StatusSample sample;
        bool threw = false;
        try {
            sample = pending[i].get();
        } catch (const std::exception& e) {
            logger_.log(LogLevel::Warn, "poller",
                        "Poll of " + device.id + " failed: " + e.what());
            threw = true;
        } catch (...) {
            logger_.log(LogLevel::Warn, "poller",
                        "Poll of " + device.id + " failed: non-standard exception");
            threw = true;
        }
        if (threw) sample = unreachable_sample(device, now);

        bool reachable = sample.reachable;
        // A device removed while its poll was in flight gets no state back.
        bool recorded = metrics_.record_if(std::move(sample), now,
            [this](const DeviceId& id) { return registry_.contains(id); });
        if (!recorded) {
            logger_.log(LogLevel::Debug, "poller", "Discarded sample of removed device " + device.id);
            continue;
        }
        if (threw) ++stats.failed;
        if (reachable) ++stats.reachable;
        ++stats.polled;
    }

    auto elapsed = std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - started);
    logger_.log(LogLevel::Debug, "poller",
                "Collected " + std::to_string(stats.polled) + " devices ("
                + std::to_string(stats.reachable) + " reachable) in "
                + std::to_string(elapsed.count()) + " ms");
    if (telemetry_) telemetry_->record_poll_tick(stats.polled, stats.reachable, elapsed);
    return stats;
}

std::vector<Alert> Poller::evaluate_alerts_once(Timestamp now) {
    auto raised = alerts_.evaluate(metrics_.live_states(), now);
    if (telemetry_) {
        for (const auto& alert : raised) telemetry_->record_alert(alert);
    }
    return raised;
}

std::vector<DeviceId> Poller::collect_garbage_once(Timestamp now) {
    auto removed = metrics_.collect_garbage(now, std::chrono::seconds(config_.stale_after_s));
    for (const auto& id : removed) {
        logger_.log(LogLevel::Info, "poller", "Dropped stale monitoring state for " + id);
    }
    if (telemetry_) telemetry_->record_gc_pass(removed.size(), metrics_.device_count());
    return removed;
}

}  // namespace fleetwatch
