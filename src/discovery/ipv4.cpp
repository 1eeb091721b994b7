/**
 * @file ipv4.cpp
 * @brief IPv4 parsing and range enumeration.
 */

#include "discovery/ipv4.hpp"

#include <charconv>
#include <system_error>

namespace fleetwatch {

std::optional<uint32_t> parse_ipv4(std::string_view text) noexcept {
    uint32_t address = 0;
    int octets = 0;
    const char* pos = text.data();
    const char* end = text.data() + text.size();

    while (octets < 4) {
        unsigned value = 0;
        auto [ptr, ec] = std::from_chars(pos, end, value);
        if (ec != std::errc{} || ptr == pos || value > 255 || ptr - pos > 3) return std::nullopt;
        address = (address << 8) | value;
        ++octets;
        pos = ptr;
        if (octets < 4) {
            if (pos == end || *pos != '.') return std::nullopt;
            ++pos;
        }
    }
    if (pos != end) return std::nullopt;
    return address;
}

std::string format_ipv4(uint32_t address) {
    return std::to_string((address >> 24) & 0xFF) + "."
         + std::to_string((address >> 16) & 0xFF) + "."
         + std::to_string((address >> 8) & 0xFF) + "."
         + std::to_string(address & 0xFF);
}

uint64_t Ipv4Range::host_count() const noexcept {
    uint64_t total = uint64_t{1} << (32 - prefix);
    return prefix >= 31 ? total : total - 2;
}

std::vector<uint32_t> Ipv4Range::hosts() const {
    uint64_t total = uint64_t{1} << (32 - prefix);
    uint64_t first = network;
    uint64_t last = first + total - 1;
    if (prefix < 31) {
        ++first;
        --last;
    }

    std::vector<uint32_t> result;
    result.reserve(static_cast<size_t>(last - first + 1));
    for (uint64_t address = first; address <= last; ++address) {
        result.push_back(static_cast<uint32_t>(address));
    }
    return result;
}

Result<Ipv4Range> parse_cidr(std::string_view text) {
    auto slash = text.find('/');
    if (slash == std::string_view::npos) {
        return Error{ErrorCode::InvalidArgument, "Expected a.b.c.d/prefix, got '" + std::string(text) + "'"};
    }

    auto address = parse_ipv4(text.substr(0, slash));
    if (!address) {
        return Error{ErrorCode::InvalidArgument, "Invalid network address in '" + std::string(text) + "'"};
    }

    auto prefix_text = text.substr(slash + 1);
    unsigned prefix = 0;
    auto [ptr, ec] = std::from_chars(prefix_text.data(), prefix_text.data() + prefix_text.size(), prefix);
    if (prefix_text.empty() || ec != std::errc{} || ptr != prefix_text.data() + prefix_text.size() || prefix > 32) {
        return Error{ErrorCode::InvalidArgument, "Invalid prefix length in '" + std::string(text) + "'"};
    }

    uint32_t mask = prefix == 0 ? 0 : ~uint32_t{0} << (32 - prefix);
    return Ipv4Range{*address & mask, static_cast<uint8_t>(prefix)};
}

}  // namespace fleetwatch
