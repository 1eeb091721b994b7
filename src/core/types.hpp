/**
 * @file types.hpp
 * @brief Fundamental types used throughout FleetWatch.
 *
 * Defines device identity, configuration and the StatusSample produced by
 * every poll. All types have value semantics; a StatusSample is immutable
 * once handed to the MetricsStore.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace fleetwatch {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using DeviceId = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;

// ─────────────────────────────────────────────
// Device Family
// ─────────────────────────────────────────────

enum class DeviceFamily : uint8_t {
    AccessPoint,
    Switch
};

[[nodiscard]] constexpr std::string_view to_string(DeviceFamily family) noexcept {
    switch (family) {
        case DeviceFamily::AccessPoint: return "access_point";
        case DeviceFamily::Switch:      return "switch";
    }
    return "unknown";
}

/**
 * @brief Parse a family tag. Accepts the canonical names and the legacy
 *        inventory type names ("aruba_ap500", "3com_switch").
 */
[[nodiscard]] std::optional<DeviceFamily> parse_family(std::string_view text) noexcept;

/// Human-readable label used for dashboard breakdowns.
[[nodiscard]] constexpr std::string_view display_label(DeviceFamily family) noexcept {
    switch (family) {
        case DeviceFamily::AccessPoint: return "Aruba AP";
        case DeviceFamily::Switch:      return "3Com Switch";
    }
    return "Other";
}

// ─────────────────────────────────────────────
// Device Configuration
// ─────────────────────────────────────────────

struct Credentials {
    std::string snmp_community = "public";
    std::string ssh_user = "admin";
    std::string ssh_password;
};

/**
 * @brief Static configuration of one monitored device.
 *
 * Owned by DeviceRegistry. Replaced wholesale by an explicit update.
 */
struct DeviceConfig {
    DeviceId id;
    std::string display_name;
    DeviceFamily family{DeviceFamily::AccessPoint};
    std::string address;            ///< IPv4 dotted quad
    Credentials credentials;
    std::string location;
    bool enabled{true};
};

// ─────────────────────────────────────────────
// Family-specific status fields
// ─────────────────────────────────────────────

struct SsidInfo {
    std::string name;
    bool enabled{true};
    uint32_t clients{0};
    std::string band;

    bool operator==(const SsidInfo&) const = default;
};

struct RadioStatus {
    std::string band;               ///< "2.4GHz", "5GHz"
    bool enabled{false};
    uint32_t channel{0};
    int32_t power_dbm{0};
    uint32_t utilization_percent{0};

    bool operator==(const RadioStatus&) const = default;
};

struct PortState {
    uint32_t number{0};
    std::string name;
    bool up{false};
    uint32_t speed_mbps{0};
    uint32_t vlan{1};
    std::string description;

    bool operator==(const PortState&) const = default;
};

struct VlanInfo {
    uint32_t id{1};
    std::string name;
    std::vector<uint32_t> ports;
    bool active{true};

    bool operator==(const VlanInfo&) const = default;
};

struct AccessPointStatus {
    std::vector<SsidInfo> ssids;
    std::vector<RadioStatus> radios;
    uint32_t client_count{0};
};

struct SwitchStatus {
    std::map<uint32_t, PortState> ports;    ///< Keyed by port number
    std::vector<VlanInfo> vlans;

    [[nodiscard]] size_t ports_down() const noexcept {
        size_t down = 0;
        for (const auto& [number, port] : ports) {
            if (!port.up) ++down;
        }
        return down;
    }
};

// ─────────────────────────────────────────────
// Status Sample
// ─────────────────────────────────────────────

/**
 * @brief Result of one poll of one device.
 *
 * When reachable is false every numeric field is zero and the family
 * details are empty.
 */
struct StatusSample {
    DeviceId device_id;
    DeviceFamily family{DeviceFamily::AccessPoint};
    Timestamp timestamp;
    bool reachable{false};

    float cpu_percent{0.0f};
    float memory_percent{0.0f};
    std::optional<float> temperature_c;

    std::variant<std::monostate, AccessPointStatus, SwitchStatus> details;

    [[nodiscard]] const AccessPointStatus* access_point() const noexcept {
        return std::get_if<AccessPointStatus>(&details);
    }

    [[nodiscard]] const SwitchStatus* switch_status() const noexcept {
        return std::get_if<SwitchStatus>(&details);
    }

    [[nodiscard]] uint32_t client_count() const noexcept {
        const auto* ap = access_point();
        return ap ? ap->client_count : 0;
    }
};

/// Build the sample a driver reports for a device that failed its liveness probe.
[[nodiscard]] StatusSample unreachable_sample(const DeviceConfig& device, Timestamp at);

}  // namespace fleetwatch
