/**
 * @file mock_fleet.hpp
 * @brief Helpers that script MockProtocolClient agents for tests.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "device/driver_common.hpp"
#include "device/oids.hpp"
#include "protocol/mock_client.hpp"
#include "telemetry/json_sink.hpp"

#include <memory>
#include <string>

namespace fleetwatch::testing {

inline Logger make_null_logger() {
    return Logger(std::make_unique<NullSink>(), LogLevel::Debug);
}

inline DeviceConfig make_device(const std::string& id, DeviceFamily family, const std::string& address) {
    DeviceConfig device;
    device.id = id;
    device.display_name = id;
    device.family = family;
    device.address = address;
    device.location = "Lab";
    return device;
}

inline std::string row(const char* column, uint32_t index) {
    return std::string(column) + "." + std::to_string(index);
}

/// Reachable Aruba AP with one SSID and two radios.
inline void seed_access_point(MockProtocolClient& client, const std::string& ip,
                              int64_t cpu, int64_t memory, int64_t clients) {
    client.open_port(ip, 22);
    client.set_value(ip, oids::SYS_DESCR, SnmpValue::string("ArubaOS (MODEL: 505) AP"));
    client.set_value(ip, oids::SYS_NAME, SnmpValue::string("ap-" + ip));
    client.set_value(ip, oids::SYS_UPTIME, SnmpValue::ticks(9'000'000));
    client.set_value(ip, oids::ARUBA_CPU_PERCENT, SnmpValue::gauge(cpu));
    client.set_value(ip, oids::ARUBA_MEM_PERCENT, SnmpValue::gauge(memory));
    client.set_value(ip, oids::ARUBA_CLIENT_COUNT, SnmpValue::gauge(clients));

    client.set_value(ip, row(oids::ARUBA_ESSID_NAME, 1), SnmpValue::string("Corporate"));
    client.set_value(ip, row(oids::ARUBA_ESSID_STATUS, 1), SnmpValue::integer(1));
    client.set_value(ip, row(oids::ARUBA_ESSID_CLIENTS, 1), SnmpValue::gauge(clients));
    client.set_value(ip, row(oids::ARUBA_ESSID_BAND, 1), SnmpValue::string("5GHz"));

    client.set_value(ip, row(oids::ARUBA_RADIO_BAND, 1), SnmpValue::string("2.4GHz"));
    client.set_value(ip, row(oids::ARUBA_RADIO_ENABLED, 1), SnmpValue::integer(1));
    client.set_value(ip, row(oids::ARUBA_RADIO_CHANNEL, 1), SnmpValue::integer(6));
    client.set_value(ip, row(oids::ARUBA_RADIO_POWER, 1), SnmpValue::integer(18));
    client.set_value(ip, row(oids::ARUBA_RADIO_BAND, 2), SnmpValue::string("5GHz"));
    client.set_value(ip, row(oids::ARUBA_RADIO_ENABLED, 2), SnmpValue::integer(2));
    client.set_value(ip, row(oids::ARUBA_RADIO_CHANNEL, 2), SnmpValue::integer(36));
    client.set_value(ip, row(oids::ARUBA_RADIO_POWER, 2), SnmpValue::integer(20));
}

/// Reachable Comware switch with @p ports ethernet ports; @p down_port (if non-zero) is down.
inline void seed_switch(MockProtocolClient& client, const std::string& ip,
                        int64_t cpu, int64_t memory, uint32_t ports = 4, uint32_t down_port = 0) {
    client.open_port(ip, 22);
    client.set_value(ip, oids::SYS_DESCR, SnmpValue::string("3Com Switch 4500, Comware Platform Software"));
    client.set_value(ip, oids::SYS_NAME, SnmpValue::string("sw-" + ip));
    client.set_value(ip, oids::COMWARE_CPU_PERCENT, SnmpValue::gauge(cpu));
    client.set_value(ip, oids::COMWARE_MEM_PERCENT, SnmpValue::gauge(memory));

    for (uint32_t port = 1; port <= ports; ++port) {
        client.set_value(ip, row(oids::IF_DESCR, port),
                         SnmpValue::string("GigabitEthernet1/0/" + std::to_string(port)));
        client.set_value(ip, row(oids::IF_TYPE, port), SnmpValue::integer(oids::IF_TYPE_ETHERNET));
        client.set_value(ip, row(oids::IF_SPEED, port), SnmpValue::gauge(1'000'000'000));
        client.set_value(ip, row(oids::IF_ADMIN_STATUS, port), SnmpValue::integer(1));
        client.set_value(ip, row(oids::IF_OPER_STATUS, port), SnmpValue::integer(port == down_port ? 2 : 1));
        client.set_value(ip, row(oids::DOT1Q_PVID, port), SnmpValue::gauge(1));
    }
    client.set_value(ip, row(oids::DOT1Q_VLAN_NAME, 1), SnmpValue::string("default"));
    client.set_value(ip, row(oids::DOT1Q_VLAN_ROW_STATUS, 1), SnmpValue::integer(1));
}

}  // namespace fleetwatch::testing
