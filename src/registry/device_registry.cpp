/**
 * @file device_registry.cpp
 * @brief DeviceRegistry implementation.
 */

#include "registry/device_registry.hpp"

#include "discovery/ipv4.hpp"

#include <mutex>

namespace fleetwatch {

Result<void> validate_device(const DeviceConfig& device) {
    if (device.id.empty()) {
        return Error{ErrorCode::InvalidArgument, "Device id must not be empty"};
    }
    for (char c : device.id) {
        bool allowed = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')
                    || c == '-' || c == '_' || c == '.';
        if (!allowed) {
            return Error{ErrorCode::InvalidArgument, "Device id '" + device.id + "' contains invalid characters"};
        }
    }
    if (!parse_ipv4(device.address)) {
        return Error{ErrorCode::InvalidArgument,
                     "Device " + device.id + " has invalid IPv4 address '" + device.address + "'"};
    }
    return {};
}

DeviceRegistry::DeviceRegistry(const DriverContext& ctx, size_t max_backups_per_device)
    : ctx_(ctx), backups_(max_backups_per_device) {}

Result<void> DeviceRegistry::add(DeviceConfig device) {
    if (auto valid = validate_device(device); !valid) return valid.error();

    auto driver = std::make_shared<DeviceDriver>(device, ctx_);
    std::unique_lock lock(mutex_);
    if (drivers_.contains(device.id)) {
        return Error{ErrorCode::AlreadyExists, "Device " + device.id + " already exists"};
    }
    drivers_.emplace(device.id, std::move(driver));
    return {};
}

Result<void> DeviceRegistry::update(DeviceConfig device) {
    if (auto valid = validate_device(device); !valid) return valid.error();

    auto driver = std::make_shared<DeviceDriver>(device, ctx_);
    std::unique_lock lock(mutex_);
    auto it = drivers_.find(device.id);
    if (it == drivers_.end()) {
        return Error{ErrorCode::UnknownDevice, "Unknown device " + device.id};
    }
    it->second = std::move(driver);
    return {};
}

Result<void> DeviceRegistry::remove(const DeviceId& id) {
    {
        std::unique_lock lock(mutex_);
        if (drivers_.erase(id) == 0) {
            return Error{ErrorCode::UnknownDevice, "Unknown device " + id};
        }
    }
    backups_.erase_device(id);
    return {};
}

Result<DeviceConfig> DeviceRegistry::find(const DeviceId& id) const {
    std::shared_lock lock(mutex_);
    auto it = drivers_.find(id);
    if (it == drivers_.end()) {
        return Error{ErrorCode::UnknownDevice, "Unknown device " + id};
    }
    return it->second->device();
}

Result<std::shared_ptr<DeviceDriver>> DeviceRegistry::driver(const DeviceId& id) const {
    std::shared_lock lock(mutex_);
    auto it = drivers_.find(id);
    if (it == drivers_.end()) {
        return Error{ErrorCode::UnknownDevice, "Unknown device " + id};
    }
    return it->second;
}

std::vector<DeviceConfig> DeviceRegistry::list() const {
    std::shared_lock lock(mutex_);
    std::vector<DeviceConfig> devices;
    devices.reserve(drivers_.size());
    for (const auto& [id, driver] : drivers_) {
        devices.push_back(driver->device());
    }
    return devices;
}

std::vector<std::shared_ptr<DeviceDriver>> DeviceRegistry::enabled_drivers() const {
    std::shared_lock lock(mutex_);
    std::vector<std::shared_ptr<DeviceDriver>> enabled;
    for (const auto& [id, driver] : drivers_) {
        if (driver->device().enabled) enabled.push_back(driver);
    }
    return enabled;
}

bool DeviceRegistry::contains(const DeviceId& id) const {
    std::shared_lock lock(mutex_);
    return drivers_.contains(id);
}

size_t DeviceRegistry::size() const {
    std::shared_lock lock(mutex_);
    return drivers_.size();
}

}  // namespace fleetwatch
