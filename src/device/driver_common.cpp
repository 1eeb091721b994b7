/**
 * @file driver_common.cpp
 * @brief Shared driver helpers.
 */

#include "device/driver_common.hpp"

#include "device/oids.hpp"

#include <algorithm>
#include <charconv>
#include <cstdio>
#include <system_error>

namespace fleetwatch {

// ── SnmpSession ──────────────────────────────

SnmpSession::SnmpSession(const DriverContext& ctx, const DeviceConfig& device)
    : ctx_(ctx), device_(device) {}

void SnmpSession::degraded(std::string_view field, const Error& error) const {
    std::string message = std::string(to_string(ErrorCode::PartialMetricFailure))
        + ": " + device_.id + " " + std::string(field) + ": " + error.message;
    ctx_.logger.log(LogLevel::Debug, "driver", message);
}

std::optional<int64_t> SnmpSession::number(const char* oid, std::string_view field) const {
    auto value = ctx_.client.snmp_get(device_.address, device_.credentials.snmp_community, oid,
                                      Duration{ctx_.settings.snmp_timeout_ms});
    if (!value) {
        degraded(field, value.error());
        return std::nullopt;
    }
    auto parsed = value->as_integer();
    if (!parsed) {
        degraded(field, Error{ErrorCode::Parse, "non-numeric value '" + value->as_string() + "'"});
    }
    return parsed;
}

std::optional<std::string> SnmpSession::text(const char* oid, std::string_view field) const {
    auto value = ctx_.client.snmp_get(device_.address, device_.credentials.snmp_community, oid,
                                      Duration{ctx_.settings.snmp_timeout_ms});
    if (!value) {
        degraded(field, value.error());
        return std::nullopt;
    }
    return value->as_string();
}

std::map<std::string, SnmpValue> SnmpSession::column(const char* oid, std::string_view field) const {
    std::map<std::string, SnmpValue> rows;
    auto walked = ctx_.client.snmp_walk(device_.address, device_.credentials.snmp_community, oid,
                                        Duration{ctx_.settings.snmp_timeout_ms});
    if (!walked) {
        degraded(field, walked.error());
        return rows;
    }
    for (auto& binding : *walked) {
        auto suffix = oid_suffix(binding.oid, oid);
        if (suffix && !suffix->empty()) {
            rows.emplace(std::move(*suffix), std::move(binding.value));
        }
    }
    return rows;
}

std::map<uint32_t, SnmpValue> SnmpSession::indexed_column(const char* oid, std::string_view field) const {
    std::map<uint32_t, SnmpValue> rows;
    for (auto& [suffix, value] : column(oid, field)) {
        if (auto index = parse_uint(suffix)) {
            rows.emplace(*index, std::move(value));
        }
    }
    return rows;
}

// ── Shared operations ────────────────────────

bool probe_liveness(const DriverContext& ctx, const DeviceConfig& device) {
    Duration timeout{ctx.settings.probe_timeout_ms};
    if (ctx.client.probe(device.address, ctx.settings.management_port, timeout)) return true;
    return ctx.client.probe(device.address, ctx.settings.fallback_port, timeout);
}

DeviceIdentity read_identity(const SnmpSession& snmp, const DeviceConfig& device) {
    DeviceIdentity identity;
    identity.name = device.display_name.empty() ? device.id : device.display_name;
    identity.address = device.address;
    identity.family = device.family;

    auto assign = [](std::string& field, std::optional<std::string> value) {
        if (value && !value->empty()) field = std::move(*value);
    };

    assign(identity.sys_description, snmp.text(oids::SYS_DESCR, "sys_description"));
    assign(identity.location, snmp.text(oids::SYS_LOCATION, "location"));
    assign(identity.model, snmp.text(oids::ENT_MODEL, "model"));
    assign(identity.serial, snmp.text(oids::ENT_SERIAL, "serial"));
    assign(identity.firmware, snmp.text(oids::ENT_FIRMWARE, "firmware"));
    if (identity.firmware == UNKNOWN_FIELD) {
        assign(identity.firmware, snmp.text(oids::ENT_SOFTWARE, "software"));
    }
    if (auto ticks = snmp.number(oids::SYS_UPTIME, "uptime")) {
        identity.uptime = format_uptime(*ticks);
    }
    return identity;
}

float percent_or_zero(std::optional<int64_t> reading) noexcept {
    if (!reading) return 0.0f;
    return static_cast<float>(std::clamp<int64_t>(*reading, 0, 100));
}

std::string format_uptime(int64_t timeticks) {
    if (timeticks < 0) timeticks = 0;
    int64_t seconds = timeticks / 100;
    int64_t days = seconds / 86400;
    seconds %= 86400;

    char buf[48];
    std::snprintf(buf, sizeof(buf), "%lldd %02lld:%02lld:%02lld",
                  static_cast<long long>(days),
                  static_cast<long long>(seconds / 3600),
                  static_cast<long long>((seconds % 3600) / 60),
                  static_cast<long long>(seconds % 60));
    return buf;
}

Result<UpdateOutcome> apply_batch(const DriverContext& ctx,
                                  const DeviceConfig& device,
                                  std::vector<std::string> commands,
                                  size_t applied) {
    std::string batch;
    for (const auto& line : commands) {
        batch += line;
        batch += '\n';
    }

    auto output = ctx.client.ssh_exec(device.address, device.credentials, batch,
                                      Duration{ctx.settings.ssh_timeout_ms});
    if (!output) {
        ctx.logger.log(LogLevel::Warn, "driver",
                       "Config update on " + device.id + " failed: " + output.error().message);
        return Error{ErrorCode::ConfigUpdateFailed,
                     "Update of " + device.id + " failed, device state unknown until next poll: "
                     + output.error().message};
    }

    UpdateOutcome outcome;
    outcome.device_id = device.id;
    outcome.applied = applied;
    outcome.commands = std::move(commands);
    outcome.output = std::move(*output);
    return outcome;
}

// ── Patch key helpers ────────────────────────

std::optional<SettingKey> split_setting_key(std::string_view key) {
    auto first = key.find('.');
    auto last = key.rfind('.');
    if (first == std::string_view::npos || first == last) return std::nullopt;

    SettingKey parts{std::string(key.substr(0, first)),
                     std::string(key.substr(first + 1, last - first - 1)),
                     std::string(key.substr(last + 1))};
    if (parts.section.empty() || parts.name.empty() || parts.field.empty()) return std::nullopt;
    return parts;
}

std::optional<bool> parse_bool(std::string_view text) noexcept {
    if (text == "true" || text == "enabled" || text == "on" || text == "1") return true;
    if (text == "false" || text == "disabled" || text == "off" || text == "0") return false;
    return std::nullopt;
}

std::optional<uint32_t> parse_uint(std::string_view text) noexcept {
    uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

bool is_cli_safe(std::string_view text) noexcept {
    for (unsigned char c : text) {
        if (c < 0x20 || c == 0x7F || c == '"' || c == '\\') return false;
    }
    return true;
}

}  // namespace fleetwatch
