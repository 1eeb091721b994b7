/**
 * @file mock_client.cpp
 * @brief MockProtocolClient implementation.
 */

#include "protocol/mock_client.hpp"

#include "protocol/snmp_codec.hpp"

#include <algorithm>

namespace fleetwatch {

namespace {

bool oid_less(const std::string& lhs, const std::string& rhs) {
    auto a = snmp::parse_oid(lhs);
    auto b = snmp::parse_oid(rhs);
    if (!a || !b) return lhs < rhs;
    return std::lexicographical_compare(a->begin(), a->end(), b->begin(), b->end());
}

}  // namespace

const MockProtocolClient::Agent* MockProtocolClient::answering_agent(
        const std::string& address, const std::string& community) const {
    auto it = agents_.find(address);
    if (it == agents_.end() || it->second.offline) return nullptr;
    const auto& agent = it->second;
    if (!agent.community.empty() && agent.community != community) return nullptr;
    return &agent;
}

bool MockProtocolClient::probe(const std::string& address, uint16_t port, Duration /*timeout*/) {
    ++probes_;
    std::lock_guard lock(mutex_);
    auto it = agents_.find(address);
    if (it == agents_.end() || it->second.offline) return false;
    return it->second.open_ports.contains(port);
}

Result<SnmpValue> MockProtocolClient::snmp_get(const std::string& address,
                                               const std::string& community,
                                               const std::string& oid,
                                               Duration /*timeout*/) {
    ++snmp_requests_;
    std::lock_guard lock(mutex_);
    const auto* agent = answering_agent(address, community);
    if (!agent) {
        return Error{ErrorCode::Transport, "SNMP request to " + address + " timed out"};
    }
    auto it = agent->values.find(oid);
    if (it == agent->values.end()) {
        return Error{ErrorCode::NotFound, "No such object " + oid + " on " + address};
    }
    return it->second;
}

Result<std::vector<SnmpBinding>> MockProtocolClient::snmp_walk(const std::string& address,
                                                               const std::string& community,
                                                               const std::string& oid,
                                                               Duration /*timeout*/) {
    ++snmp_requests_;
    std::lock_guard lock(mutex_);
    const auto* agent = answering_agent(address, community);
    if (!agent) {
        return Error{ErrorCode::Transport, "SNMP request to " + address + " timed out"};
    }

    std::vector<SnmpBinding> rows;
    for (const auto& [key, value] : agent->values) {
        auto suffix = oid_suffix(key, oid);
        if (suffix && !suffix->empty()) {
            rows.push_back(SnmpBinding{key, value});
        }
    }
    std::sort(rows.begin(), rows.end(), [](const SnmpBinding& a, const SnmpBinding& b) {
        return oid_less(a.oid, b.oid);
    });
    return rows;
}

Result<std::string> MockProtocolClient::ssh_exec(const std::string& address,
                                                 const Credentials& credentials,
                                                 const std::string& command,
                                                 Duration /*timeout*/) {
    std::lock_guard lock(mutex_);
    ssh_calls_.push_back(SshCall{address, credentials.ssh_user, command});

    auto it = agents_.find(address);
    if (it == agents_.end() || it->second.offline) {
        return Error{ErrorCode::Transport, "SSH session to " + address + " timed out"};
    }
    if (it->second.ssh_failure) {
        return Error{ErrorCode::Transport, *it->second.ssh_failure};
    }
    return it->second.ssh_output;
}

void MockProtocolClient::open_port(const std::string& address, uint16_t port) {
    std::lock_guard lock(mutex_);
    agents_[address].open_ports.insert(port);
}

void MockProtocolClient::close_port(const std::string& address, uint16_t port) {
    std::lock_guard lock(mutex_);
    agents_[address].open_ports.erase(port);
}

void MockProtocolClient::take_offline(const std::string& address) {
    std::lock_guard lock(mutex_);
    agents_[address].offline = true;
}

void MockProtocolClient::bring_online(const std::string& address) {
    std::lock_guard lock(mutex_);
    agents_[address].offline = false;
}

void MockProtocolClient::set_value(const std::string& address, const std::string& oid, SnmpValue value) {
    std::lock_guard lock(mutex_);
    agents_[address].values[oid] = std::move(value);
}

void MockProtocolClient::clear_value(const std::string& address, const std::string& oid) {
    std::lock_guard lock(mutex_);
    agents_[address].values.erase(oid);
}

void MockProtocolClient::set_community(const std::string& address, std::string community) {
    std::lock_guard lock(mutex_);
    agents_[address].community = std::move(community);
}

void MockProtocolClient::set_ssh_output(const std::string& address, std::string output) {
    std::lock_guard lock(mutex_);
    auto& agent = agents_[address];
    agent.ssh_output = std::move(output);
    agent.ssh_failure.reset();
}

void MockProtocolClient::fail_ssh(const std::string& address, std::string message) {
    std::lock_guard lock(mutex_);
    agents_[address].ssh_failure = std::move(message);
}

std::vector<MockProtocolClient::SshCall> MockProtocolClient::ssh_calls() const {
    std::lock_guard lock(mutex_);
    return ssh_calls_;
}

}  // namespace fleetwatch
