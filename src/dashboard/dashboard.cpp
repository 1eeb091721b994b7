/**
 * @file dashboard.cpp
 * @brief Dashboard aggregation.
 */

#include "dashboard/dashboard.hpp"

#include <algorithm>
#include <cmath>

namespace fleetwatch {

namespace {

double round_one_decimal(double value) {
    return std::round(value * 10.0) / 10.0;
}

}  // namespace

Dashboard build_dashboard(const std::map<DeviceId, DeviceLiveState>& states,
                          const std::vector<Alert>& alerts,
                          Timestamp now) {
    Dashboard dash;
    dash.generated_at = now;
    dash.total_devices = states.size();

    double cpu_sum = 0.0;
    double mem_sum = 0.0;

    for (const auto& [id, state] : states) {
        const auto& sample = state.last_status;
        ++dash.device_types[std::string(display_label(sample.family))];

        if (!sample.reachable) continue;
        ++dash.online_devices;
        cpu_sum += sample.cpu_percent;
        mem_sum += sample.memory_percent;
        dash.total_wireless_clients += sample.client_count();
    }
    dash.offline_devices = dash.total_devices - dash.online_devices;

    if (dash.online_devices > 0) {
        auto n = static_cast<double>(dash.online_devices);
        dash.average_cpu = round_one_decimal(cpu_sum / n);
        dash.average_memory = round_one_decimal(mem_sum / n);
    }

    dash.total_alerts = alerts.size();
    dash.unresolved_alerts = static_cast<size_t>(
        std::count_if(alerts.begin(), alerts.end(), [](const Alert& a) { return !a.resolved; }));

    auto recent = std::min(alerts.size(), DASHBOARD_RECENT_ALERTS);
    dash.recent_alerts.assign(alerts.begin(), alerts.begin() + static_cast<std::ptrdiff_t>(recent));
    return dash;
}

}  // namespace fleetwatch
