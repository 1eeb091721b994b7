/**
 * @file device_store.cpp
 * @brief TOML and in-memory device stores using toml++.
 */

#include "registry/device_store.hpp"

#include <fstream>
#include <system_error>

#include <toml++/toml.hpp>

namespace fleetwatch {

namespace {

Result<DeviceConfig> device_from_table(const toml::table& entry, size_t index) {
    auto where = "device #" + std::to_string(index + 1);

    DeviceConfig device;
    auto id = entry["id"].value<std::string>();
    auto address = entry["address"].value<std::string>();
    auto family_text = entry["family"].value<std::string>();
    if (!id || !address || !family_text) {
        return Error{ErrorCode::Parse, where + ": id, address and family are required"};
    }
    auto family = parse_family(*family_text);
    if (!family) {
        return Error{ErrorCode::Parse, where + ": unknown family '" + *family_text + "'"};
    }

    device.id = *id;
    device.address = *address;
    device.family = *family;
    device.display_name = entry["name"].value_or(device.id);
    device.location = entry["location"].value_or(std::string{});
    device.enabled = entry["enabled"].value_or(true);
    device.credentials.snmp_community = entry["snmp_community"].value_or(device.credentials.snmp_community);
    device.credentials.ssh_user = entry["ssh_user"].value_or(device.credentials.ssh_user);
    device.credentials.ssh_password = entry["ssh_password"].value_or(std::string{});
    return device;
}

toml::table device_to_table(const DeviceConfig& device) {
    return toml::table{
        {"id", device.id},
        {"name", device.display_name},
        {"family", std::string(to_string(device.family))},
        {"address", device.address},
        {"location", device.location},
        {"enabled", device.enabled},
        {"snmp_community", device.credentials.snmp_community},
        {"ssh_user", device.credentials.ssh_user},
        {"ssh_password", device.credentials.ssh_password},
    };
}

}  // namespace

// ── TomlDeviceStore ──────────────────────────

TomlDeviceStore::TomlDeviceStore(std::filesystem::path path)
    : path_(std::move(path)) {}

Result<std::vector<DeviceConfig>> TomlDeviceStore::load_devices() {
    std::unique_lock lock(mutex_);
    if (!std::filesystem::exists(path_)) {
        lock.unlock();
        auto defaults = default_inventory();
        if (auto saved = save_devices(defaults); !saved) return saved.error();
        return defaults;
    }

    try {
        auto tbl = toml::parse_file(path_.string());
        std::vector<DeviceConfig> devices;

        if (auto* entries = tbl["device"].as_array()) {
            for (size_t i = 0; i < entries->size(); ++i) {
                const auto* entry = entries->get(i)->as_table();
                if (!entry) {
                    return Error{ErrorCode::Parse, "device #" + std::to_string(i + 1) + " is not a table"};
                }
                auto device = device_from_table(*entry, i);
                if (!device) return device.error();
                devices.push_back(std::move(*device));
            }
        }
        return devices;

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::Parse,
                     "Inventory " + path_.string() + ": " + std::string{err.description()}};
    }
}

Result<void> TomlDeviceStore::save_devices(const std::vector<DeviceConfig>& devices) {
    std::lock_guard lock(mutex_);

    toml::array entries;
    for (const auto& device : devices) {
        entries.push_back(device_to_table(device));
    }
    toml::table root{{"device", std::move(entries)}};

    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::Io, "Cannot create " + path_.parent_path().string() + ": " + ec.message()};
        }
    }

    // Write then rename so a crash never leaves a truncated inventory.
    auto staging = path_;
    staging += ".tmp";
    {
        std::ofstream out(staging, std::ios::trunc);
        if (!out) {
            return Error{ErrorCode::Io, "Cannot open " + staging.string() + " for writing"};
        }
        out << "# FleetWatch device inventory\n\n" << root << '\n';
        if (!out.good()) {
            return Error{ErrorCode::Io, "Failed writing " + staging.string()};
        }
    }
    std::filesystem::rename(staging, path_, ec);
    if (ec) {
        return Error{ErrorCode::Io, "Cannot replace " + path_.string() + ": " + ec.message()};
    }
    return {};
}

// ── InMemoryDeviceStore ──────────────────────

InMemoryDeviceStore::InMemoryDeviceStore(std::vector<DeviceConfig> devices)
    : devices_(std::move(devices)) {}

Result<std::vector<DeviceConfig>> InMemoryDeviceStore::load_devices() {
    std::lock_guard lock(mutex_);
    return devices_;
}

Result<void> InMemoryDeviceStore::save_devices(const std::vector<DeviceConfig>& devices) {
    std::lock_guard lock(mutex_);
    devices_ = devices;
    ++saves_;
    return {};
}

size_t InMemoryDeviceStore::save_count() const {
    std::lock_guard lock(mutex_);
    return saves_;
}

// ── Defaults ─────────────────────────────────

std::vector<DeviceConfig> default_inventory() {
    auto make = [](std::string id, std::string name, DeviceFamily family,
                   std::string address, std::string location) {
        DeviceConfig device;
        device.id = std::move(id);
        device.display_name = std::move(name);
        device.family = family;
        device.address = std::move(address);
        device.location = std::move(location);
        return device;
    };

    return {
        make("aruba_ap_1", "Aruba AP 500 - Office", DeviceFamily::AccessPoint,
             "192.168.1.10", "Main Office"),
        make("aruba_ap_2", "Aruba AP 500 - Conference Room", DeviceFamily::AccessPoint,
             "192.168.1.11", "Conference Room"),
        make("3com_switch_1", "3Com Switch - Main", DeviceFamily::Switch,
             "192.168.1.20", "Server Room"),
    };
}

}  // namespace fleetwatch
