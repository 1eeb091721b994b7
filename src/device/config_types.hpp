/**
 * @file config_types.hpp
 * @brief Configuration snapshots, patches and backups exchanged with drivers.
 */

#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace fleetwatch {

/// Placeholder for identity fields whose query failed.
inline constexpr const char* UNKNOWN_FIELD = "unknown";

struct DeviceIdentity {
    std::string name;
    std::string address;
    DeviceFamily family{DeviceFamily::AccessPoint};
    std::string model = UNKNOWN_FIELD;
    std::string serial = UNKNOWN_FIELD;
    std::string firmware = UNKNOWN_FIELD;
    std::string location = UNKNOWN_FIELD;
    std::string sys_description = UNKNOWN_FIELD;
    std::string uptime = UNKNOWN_FIELD;     ///< "Nd HH:MM:SS"
};

struct AccessPointSettings {
    std::vector<SsidInfo> ssids;
    std::vector<RadioStatus> radios;
};

/// Administrative view of a switch port (what a restore writes back).
struct PortSettings {
    uint32_t number{0};
    std::string name;
    bool admin_enabled{true};
    uint32_t vlan{1};
    std::string description;

    bool operator==(const PortSettings&) const = default;
};

struct SpanningTreeState {
    std::string protocol = UNKNOWN_FIELD;   ///< "ieee8021d", "rstp", ...
    uint32_t priority{0};
    std::string designated_root = UNKNOWN_FIELD;
    std::map<uint32_t, std::string> port_states;    ///< port -> "forwarding", ...
};

struct SwitchSettings {
    std::map<uint32_t, PortSettings> ports;
    std::vector<VlanInfo> vlans;
    SpanningTreeState spanning_tree;
};

/**
 * @brief Read-only configuration snapshot returned by config().
 */
struct ConfigSnapshot {
    DeviceIdentity identity;
    std::variant<AccessPointSettings, SwitchSettings> settings;
    Timestamp captured_at;
};

/**
 * @brief Flat key/value changes for update_config().
 *
 * Keys are "<section>.<name>.<field>", e.g. "port.3.vlan" or
 * "ssid.Guest-WiFi.enabled". The name part may itself contain dots.
 */
struct ConfigPatch {
    std::map<std::string, std::string> settings;

    [[nodiscard]] bool empty() const noexcept { return settings.empty(); }
};

struct UpdateOutcome {
    DeviceId device_id;
    size_t applied{0};                  ///< Number of patch keys applied
    std::vector<std::string> commands;  ///< CLI batch sent to the device
    std::string output;                 ///< Device response
};

struct BackupHandle {
    std::string id;
    DeviceId device_id;
    Timestamp created_at;
    ConfigSnapshot snapshot;
};

}  // namespace fleetwatch
