/**
 * @file alert_rule.hpp
 * @brief Alert severities, rules and the built-in rule table.
 */

#pragma once

#include "core/config.hpp"
#include "core/types.hpp"
#include "monitoring/metrics_store.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fleetwatch {

enum class Severity : uint8_t {
    Info,
    Warning,
    Critical
};

[[nodiscard]] constexpr std::string_view to_string(Severity severity) noexcept {
    switch (severity) {
        case Severity::Info:     return "info";
        case Severity::Warning:  return "warning";
        case Severity::Critical: return "critical";
    }
    return "unknown";
}

struct AlertRule;

/// Returns the alert message when the rule fires for this device state.
using RulePredicate = std::function<std::optional<std::string>(
    const AlertRule& rule, const DeviceLiveState& state, Timestamp now)>;

struct AlertRule {
    std::string name;
    bool enabled{true};
    Severity severity{Severity::Info};
    std::optional<double> threshold;
    std::string description;
    RulePredicate predicate;
};

/**
 * @brief The six built-in rules.
 *
 *   device_offline      now - last_seen > offline_after        critical
 *   high_cpu_usage      cpu_percent > 80                        warning
 *   high_memory_usage   memory_percent > 85                     warning
 *   high_temperature    temperature_c > 60                      warning
 *   port_down           any switch port down                    warning
 *   low_client_count    AP client_count <= 0                    info
 *
 * Every rule except device_offline judges the latest sample and stays
 * silent when that sample is unreachable.
 */
[[nodiscard]] std::vector<AlertRule> default_rules(std::chrono::seconds offline_after = std::chrono::seconds{120});

/// Apply [alerts.rules.*] overrides. Returns the names that matched no rule.
std::vector<std::string> apply_overrides(std::vector<AlertRule>& rules,
                                         const std::map<std::string, RuleOverride>& overrides);

}  // namespace fleetwatch
