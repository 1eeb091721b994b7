/**
 * @file switch_driver.cpp
 * @brief SwitchDriver implementation.
 */

#include "device/switch_driver.hpp"

#include "device/oids.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>

namespace fleetwatch {

namespace {

constexpr size_t MAX_VLAN_NAME = 32;

Result<void> invalid(const std::string& key, std::string_view reason) {
    return Error{ErrorCode::InvalidArgument, "Invalid setting '" + key + "': " + std::string(reason)};
}

std::string stp_port_state_name(int64_t state) {
    switch (state) {
        case 1: return "disabled";
        case 2: return "blocking";
        case 3: return "listening";
        case 4: return "learning";
        case 5: return "forwarding";
        case 6: return "broken";
        default: return UNKNOWN_FIELD;
    }
}

std::string stp_protocol_name(int64_t protocol) {
    switch (protocol) {
        case 2: return "declb100";
        case 3: return "ieee8021d";
        default: return UNKNOWN_FIELD;
    }
}

/// BridgeId: 2-octet priority followed by a 6-octet MAC.
std::string format_bridge_id(std::string_view raw) {
    if (raw.size() != 8) return raw.empty() ? UNKNOWN_FIELD : std::string(raw);
    char buf[24];
    auto b = [&raw](size_t i) { return static_cast<unsigned>(static_cast<unsigned char>(raw[i])); };
    std::snprintf(buf, sizeof(buf), "%02x%02x.%02x%02x%02x%02x%02x%02x",
                  b(0), b(1), b(2), b(3), b(4), b(5), b(6), b(7));
    return buf;
}

std::string interface_name(uint32_t port) {
    return "GigabitEthernet1/0/" + std::to_string(port);
}

}  // namespace

std::vector<uint32_t> decode_port_list(std::string_view bitmap) {
    std::vector<uint32_t> ports;
    for (size_t octet = 0; octet < bitmap.size(); ++octet) {
        auto bits = static_cast<unsigned char>(bitmap[octet]);
        for (uint32_t bit = 0; bit < 8; ++bit) {
            if (bits & (0x80u >> bit)) {
                ports.push_back(static_cast<uint32_t>(octet * 8 + bit + 1));
            }
        }
    }
    return ports;
}

SwitchDriver::SwitchDriver(DeviceConfig device, const DriverContext& ctx)
    : device_(std::move(device)), ctx_(ctx) {}

// ─────────────────────────────────────────────
// Status
// ─────────────────────────────────────────────

StatusSample SwitchDriver::status(Timestamp now) {
    if (!probe_liveness(ctx_, device_)) {
        return unreachable_sample(device_, now);
    }

    SnmpSession snmp(ctx_, device_);

    StatusSample sample;
    sample.device_id = device_.id;
    sample.family = family();
    sample.timestamp = now;
    sample.reachable = true;
    sample.cpu_percent = percent_or_zero(snmp.number(oids::COMWARE_CPU_PERCENT, "cpu_percent"));
    sample.memory_percent = percent_or_zero(snmp.number(oids::COMWARE_MEM_PERCENT, "memory_percent"));
    if (auto temperature = snmp.number(oids::COMWARE_TEMPERATURE, "temperature_c")) {
        sample.temperature_c = static_cast<float>(*temperature);
    }

    SwitchStatus sw;
    sw.ports = read_ports(snmp);
    sw.vlans = read_vlans(snmp);
    sample.details = std::move(sw);
    return sample;
}

std::map<uint32_t, PortState> SwitchDriver::read_ports(const SnmpSession& snmp) const {
    auto names = snmp.indexed_column(oids::IF_DESCR, "port_names");
    auto types = snmp.indexed_column(oids::IF_TYPE, "port_types");
    auto oper = snmp.indexed_column(oids::IF_OPER_STATUS, "port_oper_status");
    auto speed = snmp.indexed_column(oids::IF_SPEED, "port_speed");
    auto alias = snmp.indexed_column(oids::IF_ALIAS, "port_alias");
    auto pvid = snmp.indexed_column(oids::DOT1Q_PVID, "port_pvid");

    std::map<uint32_t, PortState> ports;
    for (const auto& [index, name] : names) {
        if (auto it = types.find(index); it != types.end()
                && it->second.as_integer().value_or(oids::IF_TYPE_ETHERNET) != oids::IF_TYPE_ETHERNET) {
            continue;
        }

        PortState port;
        port.number = index;
        port.name = name.as_string();
        if (auto it = oper.find(index); it != oper.end()) {
            port.up = it->second.as_integer().value_or(0) == oids::IF_STATUS_UP;
        }
        if (auto it = speed.find(index); it != speed.end()) {
            port.speed_mbps = static_cast<uint32_t>(std::max<int64_t>(0, it->second.as_integer().value_or(0)) / 1'000'000);
        }
        if (auto it = alias.find(index); it != alias.end()) {
            port.description = it->second.as_string();
        }
        if (auto it = pvid.find(index); it != pvid.end()) {
            auto vlan = it->second.as_integer().value_or(1);
            port.vlan = vlan > 0 ? static_cast<uint32_t>(vlan) : 1;
        }
        ports.emplace(index, std::move(port));
    }
    return ports;
}

std::vector<VlanInfo> SwitchDriver::read_vlans(const SnmpSession& snmp) const {
    auto names = snmp.indexed_column(oids::DOT1Q_VLAN_NAME, "vlan_names");
    auto egress = snmp.indexed_column(oids::DOT1Q_VLAN_EGRESS, "vlan_ports");
    auto status = snmp.indexed_column(oids::DOT1Q_VLAN_ROW_STATUS, "vlan_status");

    std::vector<VlanInfo> vlans;
    vlans.reserve(names.size());
    for (const auto& [id, name] : names) {
        VlanInfo vlan;
        vlan.id = id;
        vlan.name = name.as_string();
        if (auto it = egress.find(id); it != egress.end()) {
            vlan.ports = decode_port_list(it->second.text);
        }
        if (auto it = status.find(id); it != status.end()) {
            vlan.active = it->second.as_integer().value_or(1) == 1;
        }
        vlans.push_back(std::move(vlan));
    }
    return vlans;
}

SpanningTreeState SwitchDriver::read_spanning_tree(const SnmpSession& snmp) const {
    SpanningTreeState stp;
    if (auto protocol = snmp.number(oids::DOT1D_STP_PROTOCOL, "stp_protocol")) {
        stp.protocol = stp_protocol_name(*protocol);
    }
    if (auto priority = snmp.number(oids::DOT1D_STP_PRIORITY, "stp_priority"); priority && *priority >= 0) {
        stp.priority = static_cast<uint32_t>(*priority);
    }
    if (auto root = snmp.text(oids::DOT1D_STP_ROOT, "stp_root")) {
        stp.designated_root = format_bridge_id(*root);
    }
    for (const auto& [port, state] : snmp.indexed_column(oids::DOT1D_STP_PORT_STATE, "stp_port_state")) {
        stp.port_states.emplace(port, stp_port_state_name(state.as_integer().value_or(0)));
    }
    return stp;
}

// ─────────────────────────────────────────────
// Configuration
// ─────────────────────────────────────────────

Result<ConfigSnapshot> SwitchDriver::config() {
    if (!probe_liveness(ctx_, device_)) {
        return Error{ErrorCode::DeviceUnreachable, "Device " + device_.id + " is unreachable"};
    }

    SnmpSession snmp(ctx_, device_);

    ConfigSnapshot snapshot;
    snapshot.identity = read_identity(snmp, device_);

    SwitchSettings settings;
    auto admin = snmp.indexed_column(oids::IF_ADMIN_STATUS, "port_admin_status");
    for (const auto& [number, port] : read_ports(snmp)) {
        PortSettings entry;
        entry.number = number;
        entry.name = port.name;
        entry.vlan = port.vlan;
        entry.description = port.description;
        if (auto it = admin.find(number); it != admin.end()) {
            entry.admin_enabled = it->second.as_integer().value_or(oids::IF_STATUS_UP) == oids::IF_STATUS_UP;
        }
        settings.ports.emplace(number, std::move(entry));
    }
    settings.vlans = read_vlans(snmp);
    settings.spanning_tree = read_spanning_tree(snmp);

    snapshot.settings = std::move(settings);
    snapshot.captured_at = std::chrono::system_clock::now();
    return snapshot;
}

Result<void> SwitchDriver::validate_patch(const ConfigPatch& patch) const {
    if (patch.empty()) {
        return Error{ErrorCode::InvalidArgument, "Empty configuration patch"};
    }

    for (const auto& [key, value] : patch.settings) {
        auto parts = split_setting_key(key);
        if (!parts) return invalid(key, "expected <section>.<name>.<field>");

        if (parts->section == "port") {
            auto port = parse_uint(parts->name);
            if (!port || *port == 0) return invalid(key, "port must be a positive number");

            if (parts->field == "enabled") {
                if (!parse_bool(value)) return invalid(key, "expected a boolean");
            } else if (parts->field == "vlan") {
                auto vlan = parse_uint(value);
                if (!vlan || *vlan == 0 || *vlan > MAX_VLAN_ID) return invalid(key, "VLAN must be 1-4094");
            } else if (parts->field == "description") {
                if (value.size() > MAX_DESCRIPTION || !is_cli_safe(value)) {
                    return invalid(key, "description too long or contains unsupported characters");
                }
            } else {
                return invalid(key, "unknown port field");
            }
        } else if (parts->section == "vlan") {
            auto vlan = parse_uint(parts->name);
            if (!vlan || *vlan == 0 || *vlan > MAX_VLAN_ID) return invalid(key, "VLAN must be 1-4094");
            if (parts->field != "name") return invalid(key, "unknown VLAN field");
            if (value.empty() || value.size() > MAX_VLAN_NAME || !is_cli_safe(value)) {
                return invalid(key, "VLAN name empty, too long or contains unsupported characters");
            }
        } else {
            return invalid(key, "unknown section");
        }
    }
    return {};
}

std::vector<std::string> SwitchDriver::render_commands(const ConfigPatch& patch) const {
    std::vector<std::string> commands{"system-view"};

    std::string open_block;
    auto enter = [&](const std::string& block, std::string header) {
        if (open_block == block) return;
        if (!open_block.empty()) commands.emplace_back(" quit");
        commands.push_back(std::move(header));
        open_block = block;
    };

    for (const auto& [key, value] : patch.settings) {
        auto parts = split_setting_key(key);
        if (!parts) continue;

        if (parts->section == "port") {
            enter(key.substr(0, key.rfind('.')), "interface " + interface_name(parse_uint(parts->name).value_or(0)));
            if (parts->field == "enabled") {
                commands.emplace_back(parse_bool(value).value_or(true) ? " undo shutdown" : " shutdown");
            } else if (parts->field == "vlan") {
                commands.push_back(" port access vlan " + value);
            } else if (parts->field == "description") {
                commands.push_back(value.empty() ? std::string(" undo description") : " description " + value);
            }
        } else if (parts->section == "vlan") {
            enter(key.substr(0, key.rfind('.')), "vlan " + parts->name);
            commands.push_back(" name " + value);
        }
    }
    if (!open_block.empty()) commands.emplace_back(" quit");

    commands.emplace_back("return");
    commands.emplace_back("save force");
    return commands;
}

Result<ConfigPatch> SwitchDriver::patch_from_snapshot(const ConfigSnapshot& snapshot) {
    const auto* settings = std::get_if<SwitchSettings>(&snapshot.settings);
    if (!settings) {
        return Error{ErrorCode::InvalidArgument, "Snapshot does not hold switch settings"};
    }

    ConfigPatch patch;
    for (const auto& [number, port] : settings->ports) {
        if (number == 0) continue;
        auto prefix = "port." + std::to_string(number) + ".";
        patch.settings[prefix + "enabled"] = port.admin_enabled ? "true" : "false";
        if (port.vlan >= 1 && port.vlan <= MAX_VLAN_ID) {
            patch.settings[prefix + "vlan"] = std::to_string(port.vlan);
        }
        if (port.description.size() <= MAX_DESCRIPTION && is_cli_safe(port.description)) {
            patch.settings[prefix + "description"] = port.description;
        }
    }
    for (const auto& vlan : settings->vlans) {
        if (vlan.id == 0 || vlan.id > MAX_VLAN_ID) continue;
        if (vlan.name.empty() || vlan.name.size() > MAX_VLAN_NAME || !is_cli_safe(vlan.name)) continue;
        patch.settings["vlan." + std::to_string(vlan.id) + ".name"] = vlan.name;
    }
    return patch;
}

}  // namespace fleetwatch
