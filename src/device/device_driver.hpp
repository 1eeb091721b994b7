/**
 * @file device_driver.hpp
 * @brief DeviceDriver: closed variant over the supported device families.
 *
 * Built once per DeviceConfig and dispatched with std::visit. Every call
 * performs fresh protocol I/O; the driver holds no device state beyond the
 * configuration it was built from.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "device/access_point_driver.hpp"
#include "device/backup_store.hpp"
#include "device/config_types.hpp"
#include "device/driver_common.hpp"
#include "device/switch_driver.hpp"

#include <string>
#include <variant>

namespace fleetwatch {

static_assert(DeviceDriverLike<AccessPointDriver>);
static_assert(DeviceDriverLike<SwitchDriver>);

class DeviceDriver {
public:
    using Variant = std::variant<AccessPointDriver, SwitchDriver>;

    /// Picks the family driver from device.family.
    DeviceDriver(DeviceConfig device, const DriverContext& ctx);

    [[nodiscard]] const DeviceConfig& device() const noexcept;
    [[nodiscard]] DeviceFamily family() const noexcept;

    StatusSample status(Timestamp now);
    Result<ConfigSnapshot> config();

    /// Validate, render and apply @p patch in one SSH batch.
    Result<UpdateOutcome> update_config(const ConfigPatch& patch);

    /// Capture the current configuration into @p store.
    Result<BackupHandle> backup(BackupStore& store);

    /// Replay a stored snapshot through update_config().
    Result<UpdateOutcome> restore(const BackupStore& store, const std::string& backup_id);

private:
    static Variant make(DeviceConfig device, const DriverContext& ctx);

    Variant impl_;
};

}  // namespace fleetwatch
