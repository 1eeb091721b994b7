/**
 * @file fingerprint.cpp
 * @brief Vendor substring matching on sysDescr.
 */

#include "device/fingerprint.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace fleetwatch {

std::optional<DeviceFamily> fingerprint(std::string_view sys_descr) {
    std::string lowered(sys_descr);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto contains = [&lowered](std::string_view needle) {
        return lowered.find(needle) != std::string::npos;
    };

    if (contains("aruba") && contains("ap")) return DeviceFamily::AccessPoint;
    if (contains("3com") || contains("comware")) return DeviceFamily::Switch;
    return std::nullopt;
}

}  // namespace fleetwatch
