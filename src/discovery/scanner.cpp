/**
 * @file scanner.cpp
 * @brief Scanner implementation.
 */

#include "discovery/scanner.hpp"

#include "device/driver_common.hpp"
#include "device/fingerprint.hpp"
#include "device/oids.hpp"
#include "discovery/ipv4.hpp"
#include "executor/thread_pool.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <future>

namespace fleetwatch {

Scanner::Scanner(IProtocolClient& client,
                 const ScannerConfig& config,
                 const DriverConfig& ports,
                 Logger& logger)
    : client_(client), config_(config), ports_(ports), logger_(logger) {}

Result<std::vector<DiscoveryCandidate>> Scanner::discover(std::string_view cidr) {
    auto range = parse_cidr(cidr);
    if (!range) return range.error();

    if (range->host_count() > config_.max_hosts) {
        return Error{ErrorCode::InvalidArgument,
                     "Range " + std::string(cidr) + " has " + std::to_string(range->host_count())
                     + " hosts, limit is " + std::to_string(config_.max_hosts)};
    }

    auto started = std::chrono::steady_clock::now();
    auto hosts = range->hosts();

    std::vector<std::future<std::optional<DiscoveryCandidate>>> pending;
    pending.reserve(hosts.size());
    {
        ThreadPool pool(std::max<uint32_t>(1, config_.workers));
        for (auto address : hosts) {
            pending.push_back(pool.submit([this, address] { return scan_host(address); }));
        }
        pool.shutdown();
    }

    std::vector<DiscoveryCandidate> candidates;
    for (size_t i = 0; i < pending.size(); ++i) {
        try {
            if (auto candidate = pending[i].get()) {
                candidates.push_back(std::move(*candidate));
            }
        } catch (const std::exception& e) {
            logger_.log(LogLevel::Debug, "scanner",
                        "Probe of " + format_ipv4(hosts[i]) + " failed: " + e.what());
        }
    }

    std::sort(candidates.begin(), candidates.end(),
              [](const DiscoveryCandidate& a, const DiscoveryCandidate& b) {
                  return parse_ipv4(a.address).value_or(0) < parse_ipv4(b.address).value_or(0);
              });

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    logger_.log(LogLevel::Info, "scanner",
                "Discovered " + std::to_string(candidates.size()) + " of "
                + std::to_string(hosts.size()) + " hosts in " + std::string(cidr)
                + " (" + std::to_string(elapsed.count()) + " ms)");
    return candidates;
}

std::optional<DiscoveryCandidate> Scanner::scan_host(uint32_t address) {
    auto ip = format_ipv4(address);
    Duration timeout{config_.probe_timeout_ms};

    uint16_t open_port = 0;
    for (auto port : {ports_.management_port, ports_.fallback_port}) {
        if (client_.probe(ip, port, timeout)) {
            open_port = port;
            break;
        }
    }
    if (open_port == 0) {
        logger_.log(LogLevel::Debug, "scanner",
                    std::string(to_string(ErrorCode::DiscoveryTimeout)) + ": " + ip);
        return std::nullopt;
    }

    DiscoveryCandidate candidate;
    candidate.address = ip;
    candidate.open_port = open_port;
    candidate.discovered_at = std::chrono::system_clock::now();

    auto get = [&](const char* oid) -> std::optional<SnmpValue> {
        auto value = client_.snmp_get(ip, config_.community, oid, timeout);
        if (!value) return std::nullopt;
        return *value;
    };

    if (auto descr = get(oids::SYS_DESCR)) {
        candidate.sys_descr = descr->as_string();
        candidate.family = fingerprint(candidate.sys_descr);

        if (auto name = get(oids::SYS_NAME)) candidate.sys_name = name->as_string();
        if (auto location = get(oids::SYS_LOCATION)) candidate.sys_location = location->as_string();
        if (auto uptime = get(oids::SYS_UPTIME); uptime && uptime->is_numeric()) {
            candidate.uptime = format_uptime(uptime->number);
        }
    }
    return candidate;
}

}  // namespace fleetwatch
