/**
 * @file types.cpp
 * @brief Helpers for the shared vocabulary types.
 */

#include "core/types.hpp"

#include <algorithm>
#include <cctype>

namespace fleetwatch {

std::optional<DeviceFamily> parse_family(std::string_view text) noexcept {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "access_point" || lowered == "accesspoint" || lowered == "ap"
        || lowered == "aruba_ap500") {
        return DeviceFamily::AccessPoint;
    }
    if (lowered == "switch" || lowered == "3com_switch") {
        return DeviceFamily::Switch;
    }
    return std::nullopt;
}

StatusSample unreachable_sample(const DeviceConfig& device, Timestamp at) {
    StatusSample sample;
    sample.device_id = device.id;
    sample.family = device.family;
    sample.timestamp = at;
    sample.reachable = false;
    return sample;
}

}  // namespace fleetwatch
