/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

namespace fleetwatch {

namespace {

template <typename T>
T read_uint(const toml::node_view<toml::node>& node, T fallback) {
    auto value = node.value<int64_t>();
    if (!value || *value < 0) return fallback;
    return static_cast<T>(*value);
}

}  // namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::Io, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [service]
        if (auto service = tbl["service"]; service.is_table()) {
            config.service.name = service["name"].value_or(config.service.name);
            config.service.inventory_path = service["inventory_path"].value_or(
                config.service.inventory_path.string());
        }

        // [poller]
        if (auto poller = tbl["poller"]; poller.is_table()) {
            auto& p = config.poller;
            p.collection_interval_s = read_uint(poller["collection_interval_s"], p.collection_interval_s);
            p.alert_interval_s = read_uint(poller["alert_interval_s"], p.alert_interval_s);
            p.gc_interval_s = read_uint(poller["gc_interval_s"], p.gc_interval_s);
            p.stale_after_s = read_uint(poller["stale_after_s"], p.stale_after_s);
            p.workers = read_uint(poller["workers"], p.workers);
        }

        // [driver]
        if (auto driver = tbl["driver"]; driver.is_table()) {
            auto& d = config.driver;
            d.management_port = read_uint(driver["management_port"], d.management_port);
            d.fallback_port = read_uint(driver["fallback_port"], d.fallback_port);
            d.probe_timeout_ms = read_uint(driver["probe_timeout_ms"], d.probe_timeout_ms);
            d.snmp_timeout_ms = read_uint(driver["snmp_timeout_ms"], d.snmp_timeout_ms);
            d.ssh_timeout_ms = read_uint(driver["ssh_timeout_ms"], d.ssh_timeout_ms);
            d.max_backups_per_device = read_uint(driver["max_backups_per_device"], d.max_backups_per_device);
        }

        // [scanner]
        if (auto scanner = tbl["scanner"]; scanner.is_table()) {
            auto& s = config.scanner;
            s.workers = read_uint(scanner["workers"], s.workers);
            s.probe_timeout_ms = read_uint(scanner["probe_timeout_ms"], s.probe_timeout_ms);
            s.max_hosts = read_uint(scanner["max_hosts"], s.max_hosts);
            s.community = scanner["community"].value_or(s.community);
        }

        // [alerts]
        if (auto alerts = tbl["alerts"]; alerts.is_table()) {
            auto& a = config.alerts;
            a.capacity = read_uint(alerts["capacity"], a.capacity);
            a.offline_after_s = read_uint(alerts["offline_after_s"], a.offline_after_s);

            // [alerts.rules.<name>]
            if (auto* rules = alerts["rules"].as_table()) {
                for (const auto& [name, node] : *rules) {
                    const auto* rule = node.as_table();
                    if (!rule) continue;
                    RuleOverride override_;
                    if (auto enabled = (*rule)["enabled"].value<bool>()) {
                        override_.enabled = *enabled;
                    }
                    if (auto threshold = (*rule)["threshold"].value<double>()) {
                        override_.threshold = *threshold;
                    }
                    a.rules[std::string(name.str())] = override_;
                }
            }
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            auto& t = config.telemetry;
            t.log_dir = telemetry["log_dir"].value_or(t.log_dir.string());
            t.max_file_size_mb = read_uint(telemetry["max_file_size_mb"], t.max_file_size_mb);
            t.rotate_count = read_uint(telemetry["rotate_count"], t.rotate_count);
            t.log_level = telemetry["log_level"].value_or(t.log_level);
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::Parse,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace fleetwatch
