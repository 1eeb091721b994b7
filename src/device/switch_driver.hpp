/**
 * @file switch_driver.hpp
 * @brief Driver for 3Com / H3C Comware switches.
 *
 * Ports come from IF-MIB (Ethernet interfaces only, numbered by ifIndex),
 * VLANs from Q-BRIDGE-MIB and health from the Comware entity extension.
 * Patch vocabulary, rendered as a Comware system-view batch:
 *
 *   port.<n>.enabled       true|false
 *   port.<n>.vlan          access VLAN, 1-4094
 *   port.<n>.description   free text, empty clears it
 *   vlan.<id>.name         free text
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "device/config_types.hpp"
#include "device/driver_common.hpp"

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace fleetwatch {

class SwitchDriver {
public:
    static constexpr uint32_t MAX_VLAN_ID = 4094;
    static constexpr size_t MAX_DESCRIPTION = 80;

    SwitchDriver(DeviceConfig device, const DriverContext& ctx);

    [[nodiscard]] static constexpr DeviceFamily family() noexcept { return DeviceFamily::Switch; }
    [[nodiscard]] const DeviceConfig& device() const noexcept { return device_; }
    [[nodiscard]] const DriverContext& context() const noexcept { return ctx_; }

    StatusSample status(Timestamp now);
    Result<ConfigSnapshot> config();

    [[nodiscard]] Result<void> validate_patch(const ConfigPatch& patch) const;
    [[nodiscard]] std::vector<std::string> render_commands(const ConfigPatch& patch) const;

    static Result<ConfigPatch> patch_from_snapshot(const ConfigSnapshot& snapshot);

private:
    std::map<uint32_t, PortState> read_ports(const SnmpSession& snmp) const;
    std::vector<VlanInfo> read_vlans(const SnmpSession& snmp) const;
    SpanningTreeState read_spanning_tree(const SnmpSession& snmp) const;

    DeviceConfig device_;
    DriverContext ctx_;
};

/// Decode a Q-BRIDGE PortList bitmap (first octet, high bit = port 1).
[[nodiscard]] std::vector<uint32_t> decode_port_list(std::string_view bitmap);

}  // namespace fleetwatch
