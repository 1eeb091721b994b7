/**
 * @file socket_client.hpp
 * @brief POSIX socket implementation of IProtocolClient.
 *
 *   probe      non-blocking TCP connect completed with poll()
 *   snmp_*     SNMPv2c over UDP/161 using snmp_codec
 *   ssh_exec   OpenSSH client in batch mode; the command batch is fed on stdin
 *
 * SSH authentication is key-based only; Credentials::ssh_password is ignored.
 */

#pragma once

#include "protocol/protocol_client.hpp"
#include "protocol/snmp_codec.hpp"

#include <atomic>
#include <cstdint>
#include <string>

namespace fleetwatch {

class SocketProtocolClient : public IProtocolClient {
public:
    static constexpr uint16_t SNMP_PORT = 161;
    static constexpr size_t MAX_WALK_ROWS = 2048;
    static constexpr size_t MAX_DATAGRAM = 65507;

    explicit SocketProtocolClient(std::string ssh_binary = "ssh");

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

private:
    /// One request/response exchange on a fresh UDP socket.
    Result<snmp::Message> exchange(const std::string& address,
                                    const std::vector<uint8_t>& request,
                                    int32_t request_id,
                                    Duration timeout);

    int32_t next_request_id() noexcept;

    std::string ssh_binary_;
    std::atomic<int32_t> request_counter_{1};
};

}  // namespace fleetwatch
