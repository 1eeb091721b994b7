/**
 * @file backup_store.hpp
 * @brief In-memory store of configuration backups, grouped by device.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "device/config_types.hpp"

#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace fleetwatch {

/**
 * @brief Thread-safe backup store.
 *
 * Backup ids have the form "bk-<device>-<epoch ms>-<sequence>" and are
 * unique for the lifetime of the store. With a non-zero per-device cap the
 * oldest backup of a device is dropped when a new one exceeds it.
 */
class BackupStore {
public:
    explicit BackupStore(size_t max_per_device = 0);

    BackupHandle save(const DeviceId& device_id, ConfigSnapshot snapshot, Timestamp created_at);

    /// BackupNotFound when the id is unknown or belongs to another device.
    [[nodiscard]] Result<BackupHandle> find(const DeviceId& device_id, const std::string& backup_id) const;

    /// Newest first.
    [[nodiscard]] std::vector<BackupHandle> list(const DeviceId& device_id) const;

    void erase_device(const DeviceId& device_id);

    [[nodiscard]] size_t size() const;

private:
    size_t max_per_device_;
    mutable std::mutex mutex_;
    std::map<DeviceId, std::deque<BackupHandle>> backups_;   ///< front = newest
    uint64_t sequence_{0};
};

}  // namespace fleetwatch
