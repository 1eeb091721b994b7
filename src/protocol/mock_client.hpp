/**
 * @file mock_client.hpp
 * @brief In-memory IProtocolClient for tests and demo mode.
 *
 * Each simulated agent is keyed by address and holds the TCP ports that
 * accept connections, an OID -> value table and a scripted SSH response.
 * Walks are served from the same OID table in numeric OID order, so a test
 * only declares leaf values.
 */

#pragma once

#include "protocol/protocol_client.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace fleetwatch {

class MockProtocolClient : public IProtocolClient {
public:
    struct SshCall {
        std::string address;
        std::string user;
        std::string command;
    };

    MockProtocolClient() = default;

    // ── IProtocolClient ─────────────────────

    bool probe(const std::string& address, uint16_t port, Duration timeout) override;

    Result<SnmpValue> snmp_get(const std::string& address,
                               const std::string& community,
                               const std::string& oid,
                               Duration timeout) override;

    Result<std::vector<SnmpBinding>> snmp_walk(const std::string& address,
                                               const std::string& community,
                                               const std::string& oid,
                                               Duration timeout) override;

    Result<std::string> ssh_exec(const std::string& address,
                                 const Credentials& credentials,
                                 const std::string& command,
                                 Duration timeout) override;

    // ── Scripting ───────────────────────────

    void open_port(const std::string& address, uint16_t port);
    void close_port(const std::string& address, uint16_t port);

    /// Close every port; the address stops answering SNMP and SSH too.
    void take_offline(const std::string& address);
    void bring_online(const std::string& address);

    void set_value(const std::string& address, const std::string& oid, SnmpValue value);
    void clear_value(const std::string& address, const std::string& oid);

    /// Only agents configured with this community answer; empty accepts any.
    void set_community(const std::string& address, std::string community);

    void set_ssh_output(const std::string& address, std::string output);
    void fail_ssh(const std::string& address, std::string message);

    // ── Inspection ──────────────────────────

    [[nodiscard]] std::vector<SshCall> ssh_calls() const;
    [[nodiscard]] size_t probe_count() const noexcept { return probes_.load(); }
    [[nodiscard]] size_t snmp_request_count() const noexcept { return snmp_requests_.load(); }

private:
    struct Agent {
        std::set<uint16_t> open_ports;
        bool offline{false};
        std::string community;
        std::map<std::string, SnmpValue> values;
        std::string ssh_output;
        std::optional<std::string> ssh_failure;
    };

    /// Returns nullptr when the agent does not exist or is offline.
    const Agent* answering_agent(const std::string& address,
                                 const std::string& community) const;

    mutable std::mutex mutex_;
    std::map<std::string, Agent> agents_;
    std::vector<SshCall> ssh_calls_;
    std::atomic<size_t> probes_{0};
    std::atomic<size_t> snmp_requests_{0};
};

}  // namespace fleetwatch
