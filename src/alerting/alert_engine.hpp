/**
 * @file alert_engine.hpp
 * @brief Rule evaluation over live device state and the bounded alert log.
 */

#pragma once

#include "alerting/alert_rule.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <atomic>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace fleetwatch {

struct Alert {
    std::string id;                 ///< <device>_<rule>_<epoch seconds>_<seq>
    DeviceId device_id;
    std::string rule_name;
    Severity severity{Severity::Info};
    std::string message;
    std::string description;
    Timestamp raised_at;
    bool acknowledged{false};
    std::optional<Timestamp> acknowledged_at;
    bool resolved{false};
    std::optional<Timestamp> resolved_at;
};

/**
 * @brief Evaluates every enabled rule against every device and keeps the
 *        most recent alerts, newest first.
 *
 * When the log is full the oldest alert is discarded. Alerts are never
 * deduplicated: a condition that persists raises one alert per evaluation.
 */
class AlertEngine {
public:
    static constexpr size_t DEFAULT_CAPACITY = 100;

    AlertEngine(std::vector<AlertRule> rules, size_t capacity, Logger& logger);

    /// Run one evaluation pass. Returns the alerts raised, in raise order.
    std::vector<Alert> evaluate(const std::map<DeviceId, DeviceLiveState>& states, Timestamp now);

    /// All retained alerts, newest first.
    [[nodiscard]] std::vector<Alert> alerts() const;

    /// The @p count newest alerts.
    [[nodiscard]] std::vector<Alert> recent(size_t count) const;

    [[nodiscard]] Result<Alert> find(const std::string& alert_id) const;

    /// Idempotent; a second call keeps the first timestamp.
    Result<Alert> acknowledge(const std::string& alert_id, Timestamp now);

    /// Idempotent; a second call keeps the first timestamp.
    Result<Alert> resolve(const std::string& alert_id, Timestamp now);

    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t unresolved_count() const;
    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] const std::vector<AlertRule>& rules() const noexcept { return rules_; }

private:
    Alert* locate(const std::string& alert_id);
    std::string next_id(const DeviceId& device, const std::string& rule, Timestamp now);

    std::vector<AlertRule> rules_;
    size_t capacity_;
    Logger& logger_;

    mutable std::mutex mutex_;
    std::deque<Alert> alerts_;      ///< Front is newest
    std::atomic<uint64_t> sequence_{0};
};

}  // namespace fleetwatch
