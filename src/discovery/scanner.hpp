/**
 * @file scanner.hpp
 * @brief Concurrent sweep of an IPv4 range for manageable devices.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "protocol/protocol_client.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fleetwatch {

/**
 * @brief A host that answered the liveness probe.
 *
 * family is empty for hosts whose sysDescr matched no known vendor (or that
 * did not answer SNMP); they are still reported.
 */
struct DiscoveryCandidate {
    std::string address;
    std::optional<DeviceFamily> family;
    uint16_t open_port{0};
    std::string sys_name;
    std::string sys_descr;
    std::string sys_location;
    std::string uptime;
    Timestamp discovered_at;
};

/**
 * @brief Stateless scanner; each discover() call owns its own worker pool.
 *
 * A host that does not accept a TCP connection on the management or
 * fallback port within the probe timeout is left out of the result.
 */
class Scanner {
public:
    Scanner(IProtocolClient& client,
            const ScannerConfig& config,
            const DriverConfig& ports,
            Logger& logger);

    /// Candidates sorted by address. InvalidArgument for a malformed or oversized range.
    Result<std::vector<DiscoveryCandidate>> discover(std::string_view cidr);

private:
    std::optional<DiscoveryCandidate> scan_host(uint32_t address);

    IProtocolClient& client_;
    ScannerConfig config_;
    DriverConfig ports_;
    Logger& logger_;
};

}  // namespace fleetwatch
