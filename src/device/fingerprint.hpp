/**
 * @file fingerprint.hpp
 * @brief Device family identification from an SNMP sysDescr string.
 */

#pragma once

#include "core/types.hpp"

#include <optional>
#include <string_view>

namespace fleetwatch {

/**
 * @brief Classify a device from its system description.
 *
 * Case-insensitive substring match: "aruba" together with "ap" is an access
 * point, "3com" or "comware" is a switch. Anything else is unclassified.
 */
[[nodiscard]] std::optional<DeviceFamily> fingerprint(std::string_view sys_descr);

}  // namespace fleetwatch
