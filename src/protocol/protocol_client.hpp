/**
 * @file protocol_client.hpp
 * @brief Abstract transport to a single managed device (SNMP, SSH, TCP probe).
 *
 * Drivers and the scanner only talk to devices through IProtocolClient, so
 * tests inject MockProtocolClient and the daemon uses SocketProtocolClient.
 * Every call makes exactly one attempt; retry policy belongs to the caller.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fleetwatch {

/**
 * @brief A decoded SNMP variable value.
 */
struct SnmpValue {
    enum class Type : uint8_t {
        Integer,
        OctetString,
        Null,
        ObjectId,
        IpAddress,
        Counter32,
        Gauge32,
        TimeTicks,
        Counter64,
        NoSuchObject,
        NoSuchInstance,
        EndOfMibView
    };

    Type type{Type::Null};
    int64_t number{0};          ///< Integer, counters, gauges, ticks
    std::string text;           ///< Octet strings, OIDs, IP addresses

    static SnmpValue integer(int64_t v) { return SnmpValue{Type::Integer, v, {}}; }
    static SnmpValue gauge(int64_t v) { return SnmpValue{Type::Gauge32, v, {}}; }
    static SnmpValue ticks(int64_t v) { return SnmpValue{Type::TimeTicks, v, {}}; }
    static SnmpValue string(std::string v) { return SnmpValue{Type::OctetString, 0, std::move(v)}; }

    [[nodiscard]] bool is_numeric() const noexcept;
    [[nodiscard]] bool is_exception() const noexcept;

    /// Numeric view; octet strings holding a decimal number also convert.
    [[nodiscard]] std::optional<int64_t> as_integer() const;
    [[nodiscard]] std::string as_string() const;
};

struct SnmpBinding {
    std::string oid;
    SnmpValue value;
};

/**
 * @brief Device transport interface (virtual, injected per component).
 */
class IProtocolClient {
public:
    virtual ~IProtocolClient() = default;

    /// TCP connect check; true when the port accepted within the timeout.
    virtual bool probe(const std::string& address, uint16_t port, Duration timeout) = 0;

    virtual Result<SnmpValue> snmp_get(const std::string& address,
                                       const std::string& community,
                                       const std::string& oid,
                                       Duration timeout) = 0;

    /// Walk the subtree rooted at @p oid. An empty subtree is a success.
    virtual Result<std::vector<SnmpBinding>> snmp_walk(const std::string& address,
                                                       const std::string& community,
                                                       const std::string& oid,
                                                       Duration timeout) = 0;

    virtual Result<std::string> ssh_exec(const std::string& address,
                                         const Credentials& credentials,
                                         const std::string& command,
                                         Duration timeout) = 0;
};

/**
 * @brief Return the part of @p oid after @p root ("" when equal, nullopt when
 *        @p oid is outside the subtree).
 */
[[nodiscard]] std::optional<std::string> oid_suffix(std::string_view oid, std::string_view root);

}  // namespace fleetwatch
