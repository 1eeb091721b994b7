/**
 * @file monitor_service.hpp
 * @brief MonitorService facade: the query surface over the monitoring core.
 *
 * Wires the registry, metrics store, alert engine, scanner and poller
 * together and exposes the operations an outer layer (HTTP, CLI) calls:
 *   1. Read operations over cached state (status, dashboard, alerts)
 *   2. Live device operations (discovery, config read/update/backup/restore)
 *   3. Inventory management persisted through IDeviceStore
 *
 * Read operations never touch the network.
 */

#pragma once

#include "alerting/alert_engine.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "dashboard/dashboard.hpp"
#include "device/config_types.hpp"
#include "device/driver_common.hpp"
#include "discovery/scanner.hpp"
#include "monitoring/metrics_store.hpp"
#include "monitoring/poller.hpp"
#include "protocol/protocol_client.hpp"
#include "registry/device_registry.hpp"
#include "registry/device_store.hpp"
#include "telemetry/metrics_collector.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace fleetwatch {

/// One row of list_devices().
struct DeviceOverview {
    DeviceConfig config;
    bool online{false};
    std::optional<Timestamp> last_seen;
};

/// Result of get_device_status().
struct DeviceStatusView {
    DeviceConfig config;
    std::optional<DeviceLiveState> live;        ///< Empty until the first poll
    std::vector<StatusSample> recent_history;   ///< Up to 10, oldest first
};

struct ServiceHealth {
    bool running{false};
    size_t registered_devices{0};
    size_t monitored_devices{0};
    size_t alerts{0};
    size_t unresolved_alerts{0};
    uint64_t ticks_completed{0};
};

class MonitorService {
public:
    static constexpr size_t STATUS_HISTORY_POINTS = 10;

    MonitorService(const Config& config,
                   IProtocolClient& client,
                   IDeviceStore& store,
                   Logger& logger,
                   MetricsCollector* telemetry = nullptr,
                   Clock clock = [] { return std::chrono::system_clock::now(); });
    ~MonitorService();

    MonitorService(const MonitorService&) = delete;
    MonitorService& operator=(const MonitorService&) = delete;

    // ── Lifecycle ────────────────────────────

    /// Load the inventory. Invalid entries are logged and skipped.
    Result<void> load();
    void start();
    void stop();

    // ── Device queries ───────────────────────
    [[nodiscard]] std::vector<DeviceOverview> list_devices() const;
    Result<std::vector<DiscoveryCandidate>> discover_devices(std::string_view cidr);
    [[nodiscard]] Result<DeviceStatusView> get_device_status(const DeviceId& id) const;

    // ── Live configuration ───────────────────
    Result<ConfigSnapshot> get_device_config(const DeviceId& id);
    Result<UpdateOutcome> update_device_config(const DeviceId& id, const ConfigPatch& patch);
    Result<BackupHandle> backup_device_config(const DeviceId& id);
    Result<UpdateOutcome> restore_device_config(const DeviceId& id, const std::string& backup_id);
    [[nodiscard]] Result<std::vector<BackupHandle>> list_backups(const DeviceId& id) const;

    // ── Dashboard & alerts ───────────────────
    [[nodiscard]] Dashboard get_dashboard() const;
    [[nodiscard]] std::vector<Alert> list_alerts() const;
    Result<Alert> acknowledge_alert(const std::string& alert_id);
    Result<Alert> resolve_alert(const std::string& alert_id);

    // ── Inventory ────────────────────────────
    Result<void> add_device(DeviceConfig device);
    Result<void> update_device(DeviceConfig device);
    Result<void> remove_device(const DeviceId& id);

    [[nodiscard]] ServiceHealth health() const;

    // ── Accessors (for testing) ─────────────
    Poller& poller() { return poller_; }
    MetricsStore& metrics() { return metrics_; }
    AlertEngine& alerts() { return alerts_; }
    DeviceRegistry& registry() { return registry_; }

private:
    Result<void> persist();

    Config config_;
    IDeviceStore& store_;
    Logger& logger_;
    MetricsCollector* telemetry_;
    Clock clock_;

    DriverContext driver_ctx_;
    DeviceRegistry registry_;
    MetricsStore metrics_;
    AlertEngine alerts_;
    Scanner scanner_;
    Poller poller_;

    std::mutex inventory_mutex_;        ///< Serializes mutate-then-persist
};

/// Built-in rules with the [alerts] section applied; unknown names are logged.
[[nodiscard]] std::vector<AlertRule> configured_rules(const AlertsConfig& config, Logger& logger);

}  // namespace fleetwatch
