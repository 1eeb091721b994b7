/**
 * @file access_point_driver.hpp
 * @brief Driver for Aruba access points.
 *
 * Status comes from the Aruba WLSX MIB (CPU, memory, client count, ESSID
 * and radio tables). Configuration changes are rendered as an ArubaOS CLI
 * batch. Patch vocabulary:
 *
 *   ssid.<name>.enabled      true|false
 *   radio.<band>.enabled     true|false        band: 2.4GHz, 5GHz, 6GHz
 *   radio.<band>.channel     channel valid for the band
 *   radio.<band>.power       transmit power, 0-30 dBm
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "device/config_types.hpp"
#include "device/driver_common.hpp"

#include <string>
#include <vector>

namespace fleetwatch {

class AccessPointDriver {
public:
    AccessPointDriver(DeviceConfig device, const DriverContext& ctx);

    [[nodiscard]] static constexpr DeviceFamily family() noexcept { return DeviceFamily::AccessPoint; }
    [[nodiscard]] const DeviceConfig& device() const noexcept { return device_; }
    [[nodiscard]] const DriverContext& context() const noexcept { return ctx_; }

    /// Never fails: an unreachable AP yields reachable=false with zeroed fields.
    StatusSample status(Timestamp now);

    Result<ConfigSnapshot> config();

    [[nodiscard]] Result<void> validate_patch(const ConfigPatch& patch) const;
    [[nodiscard]] std::vector<std::string> render_commands(const ConfigPatch& patch) const;

    /// Patch that rewrites every SSID and radio setting recorded in @p snapshot.
    static Result<ConfigPatch> patch_from_snapshot(const ConfigSnapshot& snapshot);

private:
    std::vector<SsidInfo> read_ssids(const SnmpSession& snmp) const;
    std::vector<RadioStatus> read_radios(const SnmpSession& snmp) const;

    DeviceConfig device_;
    DriverContext ctx_;
};

}  // namespace fleetwatch
