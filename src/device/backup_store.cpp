/**
 * @file backup_store.cpp
 * @brief BackupStore implementation.
 */

#include "device/backup_store.hpp"

#include <chrono>

namespace fleetwatch {

BackupStore::BackupStore(size_t max_per_device)
    : max_per_device_(max_per_device) {}

BackupHandle BackupStore::save(const DeviceId& device_id, ConfigSnapshot snapshot, Timestamp created_at) {
    auto epoch_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        created_at.time_since_epoch()).count();

    std::lock_guard lock(mutex_);
    BackupHandle handle;
    handle.id = "bk-" + device_id + "-" + std::to_string(epoch_ms) + "-" + std::to_string(++sequence_);
    handle.device_id = device_id;
    handle.created_at = created_at;
    handle.snapshot = std::move(snapshot);

    auto& entries = backups_[device_id];
    entries.push_front(handle);
    if (max_per_device_ > 0 && entries.size() > max_per_device_) {
        entries.pop_back();
    }
    return handle;
}

Result<BackupHandle> BackupStore::find(const DeviceId& device_id, const std::string& backup_id) const {
    std::lock_guard lock(mutex_);
    if (auto it = backups_.find(device_id); it != backups_.end()) {
        for (const auto& handle : it->second) {
            if (handle.id == backup_id) return handle;
        }
    }
    return Error{ErrorCode::BackupNotFound, "Backup " + backup_id + " not found for device " + device_id};
}

std::vector<BackupHandle> BackupStore::list(const DeviceId& device_id) const {
    std::lock_guard lock(mutex_);
    auto it = backups_.find(device_id);
    if (it == backups_.end()) return {};
    return std::vector<BackupHandle>(it->second.begin(), it->second.end());
}

void BackupStore::erase_device(const DeviceId& device_id) {
    std::lock_guard lock(mutex_);
    backups_.erase(device_id);
}

size_t BackupStore::size() const {
    std::lock_guard lock(mutex_);
    size_t total = 0;
    for (const auto& [id, entries] : backups_) total += entries.size();
    return total;
}

}  // namespace fleetwatch
