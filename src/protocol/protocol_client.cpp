/**
 * @file protocol_client.cpp
 * @brief SnmpValue accessors and OID helpers.
 */

#include "protocol/protocol_client.hpp"

#include <charconv>
#include <system_error>

namespace fleetwatch {

bool SnmpValue::is_numeric() const noexcept {
    switch (type) {
        case Type::Integer:
        case Type::Counter32:
        case Type::Gauge32:
        case Type::TimeTicks:
        case Type::Counter64:
            return true;
        default:
            return false;
    }
}

bool SnmpValue::is_exception() const noexcept {
    return type == Type::NoSuchObject
        || type == Type::NoSuchInstance
        || type == Type::EndOfMibView;
}

std::optional<int64_t> SnmpValue::as_integer() const {
    if (is_numeric()) return number;
    if (type != Type::OctetString) return std::nullopt;

    // Some agents report gauges as strings, sometimes with a trailing '%'.
    std::string_view digits = text;
    while (!digits.empty() && (digits.back() == '%' || digits.back() == ' ')) {
        digits.remove_suffix(1);
    }
    int64_t parsed = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), parsed);
    if (digits.empty() || ec != std::errc{} || ptr != digits.data() + digits.size()) {
        return std::nullopt;
    }
    return parsed;
}

std::string SnmpValue::as_string() const {
    if (is_numeric()) return std::to_string(number);
    return text;
}

std::optional<std::string> oid_suffix(std::string_view oid, std::string_view root) {
    if (!oid.empty() && oid.front() == '.') oid.remove_prefix(1);
    if (!root.empty() && root.front() == '.') root.remove_prefix(1);

    if (oid.size() < root.size() || oid.substr(0, root.size()) != root) {
        return std::nullopt;
    }
    if (oid.size() == root.size()) return std::string{};
    if (oid[root.size()] != '.') return std::nullopt;
    return std::string(oid.substr(root.size() + 1));
}

}  // namespace fleetwatch
