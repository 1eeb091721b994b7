/**
 * @file device_driver.cpp
 * @brief DeviceDriver variant dispatch.
 */

#include "device/device_driver.hpp"

#include <chrono>
#include <type_traits>

namespace fleetwatch {

DeviceDriver::Variant DeviceDriver::make(DeviceConfig device, const DriverContext& ctx) {
    switch (device.family) {
        case DeviceFamily::Switch:
            return SwitchDriver(std::move(device), ctx);
        case DeviceFamily::AccessPoint:
            break;
    }
    return AccessPointDriver(std::move(device), ctx);
}

DeviceDriver::DeviceDriver(DeviceConfig device, const DriverContext& ctx)
    : impl_(make(std::move(device), ctx)) {}

const DeviceConfig& DeviceDriver::device() const noexcept {
    return std::visit([](const auto& d) -> const DeviceConfig& { return d.device(); }, impl_);
}

DeviceFamily DeviceDriver::family() const noexcept {
    return std::visit([](const auto& d) { return d.family(); }, impl_);
}

StatusSample DeviceDriver::status(Timestamp now) {
    return std::visit([now](auto& d) { return d.status(now); }, impl_);
}

Result<ConfigSnapshot> DeviceDriver::config() {
    return std::visit([](auto& d) { return d.config(); }, impl_);
}

Result<UpdateOutcome> DeviceDriver::update_config(const ConfigPatch& patch) {
    return std::visit([&patch](auto& d) -> Result<UpdateOutcome> {
        auto valid = d.validate_patch(patch);
        if (!valid) return valid.error();
        return apply_batch(d.context(), d.device(), d.render_commands(patch), patch.settings.size());
    }, impl_);
}

Result<BackupHandle> DeviceDriver::backup(BackupStore& store) {
    auto snapshot = config();
    if (!snapshot) return snapshot.error();
    return store.save(device().id, std::move(*snapshot), std::chrono::system_clock::now());
}

Result<UpdateOutcome> DeviceDriver::restore(const BackupStore& store, const std::string& backup_id) {
    auto handle = store.find(device().id, backup_id);
    if (!handle) return handle.error();

    auto patch = std::visit([&handle](const auto& d) {
        return std::decay_t<decltype(d)>::patch_from_snapshot(handle->snapshot);
    }, impl_);
    if (!patch) return patch.error();
    if (patch->empty()) {
        return Error{ErrorCode::InvalidArgument, "Backup " + backup_id + " holds no restorable settings"};
    }
    return update_config(*patch);
}

}  // namespace fleetwatch
