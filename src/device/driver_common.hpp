/**
 * @file driver_common.hpp
 * @brief Building blocks shared by the AccessPoint and Switch drivers.
 *
 * A DriverContext bundles what every driver needs to talk to its device:
 * the protocol client, the timeouts and ports from [driver], and the logger.
 * SnmpSession binds that context to one device so family code reads as a
 * list of queries. A failed individual query degrades to nullopt or an empty
 * column and is logged at debug level as a partial metric failure.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "device/config_types.hpp"
#include "protocol/protocol_client.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fleetwatch {

struct DriverContext {
    IProtocolClient& client;
    DriverConfig settings;
    Logger& logger;
};

// ─────────────────────────────────────────────
// SNMP access bound to one device
// ─────────────────────────────────────────────

class SnmpSession {
public:
    SnmpSession(const DriverContext& ctx, const DeviceConfig& device);

    [[nodiscard]] std::optional<int64_t> number(const char* oid, std::string_view field) const;
    [[nodiscard]] std::optional<std::string> text(const char* oid, std::string_view field) const;

    /// Walk a table column; keys are the instance suffixes ("3", "1.2", ...).
    [[nodiscard]] std::map<std::string, SnmpValue> column(const char* oid, std::string_view field) const;

    /// Column keyed by a single numeric index; rows with other suffixes are dropped.
    [[nodiscard]] std::map<uint32_t, SnmpValue> indexed_column(const char* oid, std::string_view field) const;

private:
    void degraded(std::string_view field, const Error& error) const;

    const DriverContext& ctx_;
    const DeviceConfig& device_;
};

// ─────────────────────────────────────────────
// Shared operations
// ─────────────────────────────────────────────

/// TCP probe on the management port, then on the fallback port.
[[nodiscard]] bool probe_liveness(const DriverContext& ctx, const DeviceConfig& device);

/// Identity from the system and entity MIBs; failed fields read "unknown".
[[nodiscard]] DeviceIdentity read_identity(const SnmpSession& snmp, const DeviceConfig& device);

/// Clamp a percentage reading to [0, 100]; a missing reading is 0.
[[nodiscard]] float percent_or_zero(std::optional<int64_t> reading) noexcept;

/// Render sysUpTime hundredths of a second as "Nd HH:MM:SS".
[[nodiscard]] std::string format_uptime(int64_t timeticks);

/// Send a CLI batch in one SSH session; transport failure is ConfigUpdateFailed.
Result<UpdateOutcome> apply_batch(const DriverContext& ctx,
                                  const DeviceConfig& device,
                                  std::vector<std::string> commands,
                                  size_t applied);

// ─────────────────────────────────────────────
// Patch key helpers
// ─────────────────────────────────────────────

struct SettingKey {
    std::string section;
    std::string name;
    std::string field;
};

/// Split "<section>.<name>.<field>" at the first and last dot.
[[nodiscard]] std::optional<SettingKey> split_setting_key(std::string_view key);

[[nodiscard]] std::optional<bool> parse_bool(std::string_view text) noexcept;
[[nodiscard]] std::optional<uint32_t> parse_uint(std::string_view text) noexcept;

/// True when @p text can be placed on a device CLI line verbatim.
[[nodiscard]] bool is_cli_safe(std::string_view text) noexcept;

}  // namespace fleetwatch
