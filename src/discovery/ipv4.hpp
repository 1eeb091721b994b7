/**
 * @file ipv4.hpp
 * @brief IPv4 address and CIDR range helpers.
 */

#pragma once

#include "core/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fleetwatch {

/// Strict dotted-quad parse (four decimal octets, no leading '+' or spaces).
[[nodiscard]] std::optional<uint32_t> parse_ipv4(std::string_view text) noexcept;
[[nodiscard]] std::string format_ipv4(uint32_t address);

struct Ipv4Range {
    uint32_t network{0};
    uint8_t prefix{32};

    /// Addresses a scan visits: network and broadcast excluded, except for
    /// /31 and /32 where every address is a host.
    [[nodiscard]] uint64_t host_count() const noexcept;
    [[nodiscard]] std::vector<uint32_t> hosts() const;
};

/// Parse "a.b.c.d/p". Host bits set in the address are masked off.
Result<Ipv4Range> parse_cidr(std::string_view text);

}  // namespace fleetwatch
