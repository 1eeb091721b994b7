/**
 * @file config.hpp
 * @brief Service configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

#include "core/result.hpp"

namespace fleetwatch {

struct ServiceConfig {
    std::string name = "fleetwatch";
    std::filesystem::path inventory_path = "config/devices.toml";
};

struct PollerConfig {
    uint32_t collection_interval_s = 30;
    uint32_t alert_interval_s = 60;
    uint32_t gc_interval_s = 300;
    uint32_t stale_after_s = 3600;      ///< Monitoring state older than this is pruned
    uint32_t workers = 8;
};

struct DriverConfig {
    uint16_t management_port = 22;
    uint16_t fallback_port = 80;
    uint32_t probe_timeout_ms = 3000;
    uint32_t snmp_timeout_ms = 2000;
    uint32_t ssh_timeout_ms = 10000;
    uint32_t max_backups_per_device = 20;   ///< 0 keeps every backup
};

struct ScannerConfig {
    uint32_t workers = 20;
    uint32_t probe_timeout_ms = 2000;
    uint32_t max_hosts = 4096;
    std::string community = "public";
};

/// Per-rule override; unset fields keep the built-in rule defaults.
struct RuleOverride {
    std::optional<bool> enabled;
    std::optional<double> threshold;
};

struct AlertsConfig {
    uint32_t capacity = 100;
    uint32_t offline_after_s = 120;
    std::map<std::string, RuleOverride> rules;
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

/**
 * @brief Top-level service configuration.
 */
struct Config {
    ServiceConfig service;
    PollerConfig poller;
    DriverConfig driver;
    ScannerConfig scanner;
    AlertsConfig alerts;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Missing keys keep their defaults. A missing file is an Io error, a
 * malformed one a Parse error.
 */
Result<Config> load_config(const std::filesystem::path& path);

Config default_config();

}  // namespace fleetwatch
