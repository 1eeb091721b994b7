/**
 * @file device_registry.hpp
 * @brief Source of truth for which devices exist and how to reach them.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "device/backup_store.hpp"
#include "device/device_driver.hpp"
#include "device/driver_common.hpp"

#include <map>
#include <memory>
#include <shared_mutex>
#include <vector>

namespace fleetwatch {

/**
 * @brief Maps device id -> DeviceConfig + DeviceDriver.
 *
 * A driver is built eagerly when its device is added or updated. Drivers
 * are handed out as shared_ptr so a poll in flight keeps using the driver it
 * started with while the configuration is replaced. Read-mostly; guarded by a
 * shared_mutex.
 */
class DeviceRegistry {
public:
    explicit DeviceRegistry(const DriverContext& ctx, size_t max_backups_per_device = 0);

    /// InvalidArgument for a malformed config, AlreadyExists for a duplicate id.
    Result<void> add(DeviceConfig device);

    /// Replace an existing device wholesale. UnknownDevice when absent.
    Result<void> update(DeviceConfig device);

    /// Remove the device and its backups. UnknownDevice when absent.
    Result<void> remove(const DeviceId& id);

    [[nodiscard]] Result<DeviceConfig> find(const DeviceId& id) const;
    [[nodiscard]] Result<std::shared_ptr<DeviceDriver>> driver(const DeviceId& id) const;

    /// All devices ordered by id.
    [[nodiscard]] std::vector<DeviceConfig> list() const;

    /// Drivers of enabled devices, ordered by id.
    [[nodiscard]] std::vector<std::shared_ptr<DeviceDriver>> enabled_drivers() const;

    [[nodiscard]] bool contains(const DeviceId& id) const;
    [[nodiscard]] size_t size() const;

    [[nodiscard]] BackupStore& backups() noexcept { return backups_; }
    [[nodiscard]] const BackupStore& backups() const noexcept { return backups_; }

private:
    DriverContext ctx_;
    mutable std::shared_mutex mutex_;
    std::map<DeviceId, std::shared_ptr<DeviceDriver>> drivers_;
    BackupStore backups_;
};

/// Structural checks applied before a device enters the registry.
[[nodiscard]] Result<void> validate_device(const DeviceConfig& device);

}  // namespace fleetwatch
