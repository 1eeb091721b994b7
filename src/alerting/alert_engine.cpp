/**
 * @file alert_engine.cpp
 * @brief AlertEngine implementation.
 */

#include "alerting/alert_engine.hpp"

#include <algorithm>
#include <chrono>
#include <exception>

namespace fleetwatch {

AlertEngine::AlertEngine(std::vector<AlertRule> rules, size_t capacity, Logger& logger)
    : rules_(std::move(rules))
    , capacity_(capacity == 0 ? DEFAULT_CAPACITY : capacity)
    , logger_(logger) {}

std::string AlertEngine::next_id(const DeviceId& device, const std::string& rule, Timestamp now) {
    auto epoch = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
    return device + "_" + rule + "_" + std::to_string(epoch) + "_"
           + std::to_string(sequence_.fetch_add(1, std::memory_order_relaxed));
}

std::vector<Alert> AlertEngine::evaluate(const std::map<DeviceId, DeviceLiveState>& states,
                                         Timestamp now) {
    std::vector<Alert> raised;

    for (const auto& [device_id, state] : states) {
        for (const auto& rule : rules_) {
            if (!rule.enabled || !rule.predicate) continue;

            std::optional<std::string> message;
            try {
                message = rule.predicate(rule, state, now);
            } catch (const std::exception& e) {
                logger_.log(LogLevel::Error, "alerts",
                            "Rule " + rule.name + " failed on " + device_id + ": " + e.what());
                continue;
            }
            if (!message) continue;

            Alert alert;
            alert.id = next_id(device_id, rule.name, now);
            alert.device_id = device_id;
            alert.rule_name = rule.name;
            alert.severity = rule.severity;
            alert.message = std::move(*message);
            alert.description = rule.description;
            alert.raised_at = now;
            raised.push_back(std::move(alert));
        }
    }

    if (!raised.empty()) {
        std::lock_guard lock(mutex_);
        for (const auto& alert : raised) {
            alerts_.push_front(alert);
            if (alerts_.size() > capacity_) alerts_.pop_back();
        }
    }

    for (const auto& alert : raised) {
        logger_.log(LogLevel::Warn, "alerts",
                    "[" + std::string(to_string(alert.severity)) + "] " + alert.device_id
                    + " " + alert.rule_name + ": " + alert.message);
    }
    return raised;
}

std::vector<Alert> AlertEngine::alerts() const {
    std::lock_guard lock(mutex_);
    return std::vector<Alert>(alerts_.begin(), alerts_.end());
}

std::vector<Alert> AlertEngine::recent(size_t count) const {
    std::lock_guard lock(mutex_);
    auto n = std::min(count, alerts_.size());
    return std::vector<Alert>(alerts_.begin(), alerts_.begin() + static_cast<std::ptrdiff_t>(n));
}

Alert* AlertEngine::locate(const std::string& alert_id) {
    auto it = std::find_if(alerts_.begin(), alerts_.end(),
                           [&](const Alert& a) { return a.id == alert_id; });
    return it == alerts_.end() ? nullptr : &*it;
}

Result<Alert> AlertEngine::find(const std::string& alert_id) const {
    std::lock_guard lock(mutex_);
    auto it = std::find_if(alerts_.begin(), alerts_.end(),
                           [&](const Alert& a) { return a.id == alert_id; });
    if (it == alerts_.end()) {
        return Error{ErrorCode::NotFound, "Alert not found: " + alert_id};
    }
    return *it;
}

Result<Alert> AlertEngine::acknowledge(const std::string& alert_id, Timestamp now) {
    std::lock_guard lock(mutex_);
    auto* alert = locate(alert_id);
    if (!alert) return Error{ErrorCode::NotFound, "Alert not found: " + alert_id};
    if (!alert->acknowledged) {
        alert->acknowledged = true;
        alert->acknowledged_at = now;
    }
    return *alert;
}

Result<Alert> AlertEngine::resolve(const std::string& alert_id, Timestamp now) {
    std::lock_guard lock(mutex_);
    auto* alert = locate(alert_id);
    if (!alert) return Error{ErrorCode::NotFound, "Alert not found: " + alert_id};
    if (!alert->resolved) {
        alert->resolved = true;
        alert->resolved_at = now;
    }
    return *alert;
}

size_t AlertEngine::size() const {
    std::lock_guard lock(mutex_);
    return alerts_.size();
}

size_t AlertEngine::unresolved_count() const {
    std::lock_guard lock(mutex_);
    return static_cast<size_t>(std::count_if(alerts_.begin(), alerts_.end(),
                                             [](const Alert& a) { return !a.resolved; }));
}

}  // namespace fleetwatch
