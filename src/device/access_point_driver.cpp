/**
 * @file access_point_driver.cpp
 * @brief AccessPointDriver implementation.
 */

#include "device/access_point_driver.hpp"

#include "device/oids.hpp"

#include <algorithm>
#include <chrono>

namespace fleetwatch {

namespace {

constexpr uint32_t MAX_TX_POWER_DBM = 30;

bool is_known_band(std::string_view band) noexcept {
    return band == "2.4GHz" || band == "5GHz" || band == "6GHz";
}

bool is_valid_channel(std::string_view band, uint32_t channel) noexcept {
    if (band == "2.4GHz") return channel >= 1 && channel <= 14;
    if (band == "5GHz") return channel >= 36 && channel <= 177;
    if (band == "6GHz") return channel >= 1 && channel <= 233;
    return false;
}

Result<void> invalid(const std::string& key, std::string_view reason) {
    return Error{ErrorCode::InvalidArgument, "Invalid setting '" + key + "': " + std::string(reason)};
}

}  // namespace

AccessPointDriver::AccessPointDriver(DeviceConfig device, const DriverContext& ctx)
    : device_(std::move(device)), ctx_(ctx) {}

// ─────────────────────────────────────────────
// Status
// ─────────────────────────────────────────────

StatusSample AccessPointDriver::status(Timestamp now) {
    if (!probe_liveness(ctx_, device_)) {
        return unreachable_sample(device_, now);
    }

    SnmpSession snmp(ctx_, device_);

    StatusSample sample;
    sample.device_id = device_.id;
    sample.family = family();
    sample.timestamp = now;
    sample.reachable = true;
    sample.cpu_percent = percent_or_zero(snmp.number(oids::ARUBA_CPU_PERCENT, "cpu_percent"));
    sample.memory_percent = percent_or_zero(snmp.number(oids::ARUBA_MEM_PERCENT, "memory_percent"));

    AccessPointStatus ap;
    ap.ssids = read_ssids(snmp);
    ap.radios = read_radios(snmp);
    auto clients = snmp.number(oids::ARUBA_CLIENT_COUNT, "client_count");
    ap.client_count = clients && *clients > 0 ? static_cast<uint32_t>(*clients) : 0;
    sample.details = std::move(ap);
    return sample;
}

std::vector<SsidInfo> AccessPointDriver::read_ssids(const SnmpSession& snmp) const {
    auto names = snmp.indexed_column(oids::ARUBA_ESSID_NAME, "ssid_names");
    auto states = snmp.indexed_column(oids::ARUBA_ESSID_STATUS, "ssid_status");
    auto clients = snmp.indexed_column(oids::ARUBA_ESSID_CLIENTS, "ssid_clients");
    auto bands = snmp.indexed_column(oids::ARUBA_ESSID_BAND, "ssid_band");

    std::vector<SsidInfo> ssids;
    ssids.reserve(names.size());
    for (const auto& [index, name] : names) {
        SsidInfo info;
        info.name = name.as_string();
        if (auto it = states.find(index); it != states.end()) {
            info.enabled = it->second.as_integer().value_or(1) == 1;
        }
        if (auto it = clients.find(index); it != clients.end()) {
            info.clients = static_cast<uint32_t>(std::max<int64_t>(0, it->second.as_integer().value_or(0)));
        }
        if (auto it = bands.find(index); it != bands.end()) {
            info.band = it->second.as_string();
        }
        ssids.push_back(std::move(info));
    }
    return ssids;
}

std::vector<RadioStatus> AccessPointDriver::read_radios(const SnmpSession& snmp) const {
    auto bands = snmp.indexed_column(oids::ARUBA_RADIO_BAND, "radio_band");
    auto enabled = snmp.indexed_column(oids::ARUBA_RADIO_ENABLED, "radio_enabled");
    auto channels = snmp.indexed_column(oids::ARUBA_RADIO_CHANNEL, "radio_channel");
    auto power = snmp.indexed_column(oids::ARUBA_RADIO_POWER, "radio_power");
    auto utilization = snmp.indexed_column(oids::ARUBA_RADIO_UTILIZATION, "radio_utilization");

    auto number_at = [](const std::map<uint32_t, SnmpValue>& column, uint32_t index) -> int64_t {
        auto it = column.find(index);
        return it == column.end() ? 0 : it->second.as_integer().value_or(0);
    };

    std::vector<RadioStatus> radios;
    radios.reserve(bands.size());
    for (const auto& [index, band] : bands) {
        RadioStatus radio;
        radio.band = band.as_string();
        radio.enabled = number_at(enabled, index) == 1;
        radio.channel = static_cast<uint32_t>(std::max<int64_t>(0, number_at(channels, index)));
        radio.power_dbm = static_cast<int32_t>(number_at(power, index));
        radio.utilization_percent = static_cast<uint32_t>(percent_or_zero(number_at(utilization, index)));
        radios.push_back(std::move(radio));
    }
    return radios;
}

// ─────────────────────────────────────────────
// Configuration
// ─────────────────────────────────────────────

Result<ConfigSnapshot> AccessPointDriver::config() {
    if (!probe_liveness(ctx_, device_)) {
        return Error{ErrorCode::DeviceUnreachable, "Device " + device_.id + " is unreachable"};
    }

    SnmpSession snmp(ctx_, device_);

    ConfigSnapshot snapshot;
    snapshot.identity = read_identity(snmp, device_);
    AccessPointSettings settings;
    settings.ssids = read_ssids(snmp);
    settings.radios = read_radios(snmp);
    snapshot.settings = std::move(settings);
    snapshot.captured_at = std::chrono::system_clock::now();
    return snapshot;
}

Result<void> AccessPointDriver::validate_patch(const ConfigPatch& patch) const {
    if (patch.empty()) {
        return Error{ErrorCode::InvalidArgument, "Empty configuration patch"};
    }

    for (const auto& [key, value] : patch.settings) {
        auto parts = split_setting_key(key);
        if (!parts) return invalid(key, "expected <section>.<name>.<field>");

        if (parts->section == "ssid") {
            if (!is_cli_safe(parts->name)) return invalid(key, "SSID name contains unsupported characters");
            if (parts->field != "enabled") return invalid(key, "unknown SSID field");
            if (!parse_bool(value)) return invalid(key, "expected a boolean");
        } else if (parts->section == "radio") {
            if (!is_known_band(parts->name)) return invalid(key, "unknown radio band");
            if (parts->field == "enabled") {
                if (!parse_bool(value)) return invalid(key, "expected a boolean");
            } else if (parts->field == "channel") {
                auto channel = parse_uint(value);
                if (!channel || !is_valid_channel(parts->name, *channel)) {
                    return invalid(key, "channel not valid for band");
                }
            } else if (parts->field == "power") {
                auto power = parse_uint(value);
                if (!power || *power > MAX_TX_POWER_DBM) return invalid(key, "power must be 0-30 dBm");
            } else {
                return invalid(key, "unknown radio field");
            }
        } else {
            return invalid(key, "unknown section");
        }
    }
    return {};
}

std::vector<std::string> AccessPointDriver::render_commands(const ConfigPatch& patch) const {
    std::vector<std::string> commands{"configure terminal"};

    std::string open_block;
    auto enter = [&](const std::string& block, std::string header) {
        if (open_block == block) return;
        if (!open_block.empty()) commands.emplace_back(" exit");
        commands.push_back(std::move(header));
        open_block = block;
    };

    for (const auto& [key, value] : patch.settings) {
        auto parts = split_setting_key(key);
        if (!parts) continue;

        if (parts->section == "ssid") {
            enter(key.substr(0, key.rfind('.')), "wlan ssid-profile \"" + parts->name + "\"");
            commands.emplace_back(parse_bool(value).value_or(false) ? " enable" : " disable-ssid");
        } else if (parts->section == "radio") {
            enter(key.substr(0, key.rfind('.')), "rf radio-profile " + parts->name);
            if (parts->field == "enabled") {
                commands.emplace_back(parse_bool(value).value_or(false) ? " radio-enable" : " radio-disable");
            } else if (parts->field == "channel") {
                commands.push_back(" channel " + value);
            } else if (parts->field == "power") {
                commands.push_back(" tx-power " + value);
            }
        }
    }
    if (!open_block.empty()) commands.emplace_back(" exit");

    commands.emplace_back("end");
    commands.emplace_back("commit apply");
    return commands;
}

Result<ConfigPatch> AccessPointDriver::patch_from_snapshot(const ConfigSnapshot& snapshot) {
    const auto* settings = std::get_if<AccessPointSettings>(&snapshot.settings);
    if (!settings) {
        return Error{ErrorCode::InvalidArgument, "Snapshot does not hold access point settings"};
    }

    ConfigPatch patch;
    for (const auto& ssid : settings->ssids) {
        if (ssid.name.empty() || !is_cli_safe(ssid.name)) continue;
        patch.settings["ssid." + ssid.name + ".enabled"] = ssid.enabled ? "true" : "false";
    }
    for (const auto& radio : settings->radios) {
        if (!is_known_band(radio.band)) continue;
        auto prefix = "radio." + radio.band + ".";
        patch.settings[prefix + "enabled"] = radio.enabled ? "true" : "false";
        if (is_valid_channel(radio.band, radio.channel)) {
            patch.settings[prefix + "channel"] = std::to_string(radio.channel);
        }
        if (radio.power_dbm >= 0 && static_cast<uint32_t>(radio.power_dbm) <= MAX_TX_POWER_DBM) {
            patch.settings[prefix + "power"] = std::to_string(radio.power_dbm);
        }
    }
    return patch;
}

}  // namespace fleetwatch
