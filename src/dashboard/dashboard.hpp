/**
 * @file dashboard.hpp
 * @brief Read-side fleet summary built from monitoring state and alerts.
 */

#pragma once

#include "alerting/alert_engine.hpp"
#include "core/types.hpp"
#include "monitoring/metrics_store.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace fleetwatch {

struct Dashboard {
    size_t total_devices{0};
    size_t online_devices{0};
    size_t offline_devices{0};
    size_t total_alerts{0};
    size_t unresolved_alerts{0};
    double average_cpu{0.0};
    double average_memory{0.0};
    uint64_t total_wireless_clients{0};
    std::map<std::string, size_t> device_types;     ///< "Aruba AP" / "3Com Switch" -> count
    std::vector<Alert> recent_alerts;               ///< At most 10, newest first
    Timestamp generated_at;
};

inline constexpr size_t DASHBOARD_RECENT_ALERTS = 10;

/**
 * @brief Pure aggregation; no locks, no I/O.
 *
 * @param states  Snapshot of MetricsStore::live_states().
 * @param alerts  Snapshot of AlertEngine::alerts(), newest first.
 *
 * A device is online when its latest sample is reachable. CPU and memory
 * averages cover online devices only and are rounded to one decimal.
 */
[[nodiscard]] Dashboard build_dashboard(const std::map<DeviceId, DeviceLiveState>& states,
                                        const std::vector<Alert>& alerts,
                                        Timestamp now);

}  // namespace fleetwatch
