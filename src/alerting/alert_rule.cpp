/**
 * @file alert_rule.cpp
 * @brief Built-in alert rules and override handling.
 */

#include "alerting/alert_rule.hpp"

#include <algorithm>
#include <cstdio>

namespace fleetwatch {

namespace {

std::string format_one_decimal(double value) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f", value);
    return buf;
}

std::string format_threshold(const AlertRule& rule) {
    return format_one_decimal(rule.threshold.value_or(0.0));
}

/// Metric rules only judge a sample the device actually answered.
const StatusSample* reachable_sample(const DeviceLiveState& state) {
    return state.last_status.reachable ? &state.last_status : nullptr;
}

}  // namespace

std::vector<AlertRule> default_rules(std::chrono::seconds offline_after) {
    std::vector<AlertRule> rules;

    rules.push_back(AlertRule{
        "device_offline", true, Severity::Critical,
        static_cast<double>(offline_after.count()),
        "Device is not responding to polls",
        [](const AlertRule& rule, const DeviceLiveState& state, Timestamp now)
            -> std::optional<std::string> {
            auto limit = std::chrono::duration<double>(rule.threshold.value_or(120.0));
            if (now - state.last_seen <= limit) return std::nullopt;
            auto minutes = static_cast<long long>(rule.threshold.value_or(120.0) / 60.0);
            std::string span = minutes >= 1
                ? std::to_string(minutes) + " minute" + (minutes == 1 ? "" : "s")
                : format_one_decimal(rule.threshold.value_or(0.0)) + " seconds";
            return "Device " + state.last_status.device_id
                   + " has been offline for more than " + span;
        }});

    rules.push_back(AlertRule{
        "high_cpu_usage", true, Severity::Warning, 80.0,
        "CPU usage exceeds threshold",
        [](const AlertRule& rule, const DeviceLiveState& state, Timestamp)
            -> std::optional<std::string> {
            const auto* sample = reachable_sample(state);
            if (!sample || sample->cpu_percent <= rule.threshold.value_or(80.0)) return std::nullopt;
            return "CPU usage is " + format_one_decimal(sample->cpu_percent)
                   + "% (threshold: " + format_threshold(rule) + "%)";
        }});

    rules.push_back(AlertRule{
        "high_memory_usage", true, Severity::Warning, 85.0,
        "Memory usage exceeds threshold",
        [](const AlertRule& rule, const DeviceLiveState& state, Timestamp)
            -> std::optional<std::string> {
            const auto* sample = reachable_sample(state);
            if (!sample || sample->memory_percent <= rule.threshold.value_or(85.0)) return std::nullopt;
            return "Memory usage is " + format_one_decimal(sample->memory_percent)
                   + "% (threshold: " + format_threshold(rule) + "%)";
        }});

    rules.push_back(AlertRule{
        "high_temperature", true, Severity::Warning, 60.0,
        "Device temperature exceeds threshold",
        [](const AlertRule& rule, const DeviceLiveState& state, Timestamp)
            -> std::optional<std::string> {
            const auto* sample = reachable_sample(state);
            if (!sample || !sample->temperature_c) return std::nullopt;
            if (*sample->temperature_c <= rule.threshold.value_or(60.0)) return std::nullopt;
            return "Temperature is " + format_one_decimal(*sample->temperature_c)
                   + "C (threshold: " + format_threshold(rule) + "C)";
        }});

    rules.push_back(AlertRule{
        "port_down", true, Severity::Warning, 0.0,
        "One or more switch ports are down",
        [](const AlertRule& rule, const DeviceLiveState& state, Timestamp)
            -> std::optional<std::string> {
            const auto* sample = reachable_sample(state);
            if (!sample) return std::nullopt;
            const auto* sw = sample->switch_status();
            if (!sw) return std::nullopt;
            auto down = sw->ports_down();
            if (static_cast<double>(down) <= rule.threshold.value_or(0.0)) return std::nullopt;
            return std::to_string(down) + " port(s) down on " + sample->device_id;
        }});

    rules.push_back(AlertRule{
        "low_client_count", true, Severity::Info, 0.0,
        "No wireless clients connected to AP",
        [](const AlertRule& rule, const DeviceLiveState& state, Timestamp)
            -> std::optional<std::string> {
            const auto* sample = reachable_sample(state);
            if (!sample || !sample->access_point()) return std::nullopt;
            auto clients = sample->client_count();
            if (static_cast<double>(clients) > rule.threshold.value_or(0.0)) return std::nullopt;
            return "Access point " + sample->device_id + " has "
                   + std::to_string(clients) + " connected clients";
        }});

    return rules;
}

std::vector<std::string> apply_overrides(std::vector<AlertRule>& rules,
                                         const std::map<std::string, RuleOverride>& overrides) {
    std::vector<std::string> unknown;
    for (const auto& [name, patch] : overrides) {
        auto it = std::find_if(rules.begin(), rules.end(),
                               [&](const AlertRule& r) { return r.name == name; });
        if (it == rules.end()) {
            unknown.push_back(name);
            continue;
        }
        if (patch.enabled) it->enabled = *patch.enabled;
        if (patch.threshold) it->threshold = *patch.threshold;
    }
    return unknown;
}

}  // namespace fleetwatch
