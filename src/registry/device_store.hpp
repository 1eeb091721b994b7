/**
 * @file device_store.hpp
 * @brief Persistence of the device inventory.
 *
 * IDeviceStore is virtual so the service can be wired to a TOML file in the
 * daemon and to an in-memory store in tests.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <mutex>
#include <vector>

namespace fleetwatch {

class IDeviceStore {
public:
    virtual ~IDeviceStore() = default;

    virtual Result<std::vector<DeviceConfig>> load_devices() = 0;
    virtual Result<void> save_devices(const std::vector<DeviceConfig>& devices) = 0;
};

/**
 * @brief Inventory kept in a TOML file as an array of [[device]] tables.
 *
 *   [[device]]
 *   id = "sw-1"
 *   name = "3Com Switch - Main"
 *   family = "switch"            # or "access_point"; legacy type names accepted
 *   address = "192.168.1.20"
 *   location = "Server Room"
 *   enabled = true
 *   snmp_community = "public"
 *   ssh_user = "admin"
 *   ssh_password = ""
 *
 * When the file does not exist, load_devices() writes default_inventory()
 * to it and returns that.
 */
class TomlDeviceStore : public IDeviceStore {
public:
    explicit TomlDeviceStore(std::filesystem::path path);

    Result<std::vector<DeviceConfig>> load_devices() override;
    Result<void> save_devices(const std::vector<DeviceConfig>& devices) override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    std::mutex mutex_;
};

class InMemoryDeviceStore : public IDeviceStore {
public:
    InMemoryDeviceStore() = default;
    explicit InMemoryDeviceStore(std::vector<DeviceConfig> devices);

    Result<std::vector<DeviceConfig>> load_devices() override;
    Result<void> save_devices(const std::vector<DeviceConfig>& devices) override;

    [[nodiscard]] size_t save_count() const;

private:
    mutable std::mutex mutex_;
    std::vector<DeviceConfig> devices_;
    size_t saves_{0};
};

/// Two access points and one switch on 192.168.1.0/24.
[[nodiscard]] std::vector<DeviceConfig> default_inventory();

}  // namespace fleetwatch
