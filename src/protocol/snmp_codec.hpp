/**
 * @file snmp_codec.hpp
 * @brief BER encoder/decoder for SNMPv2c GET / GETNEXT messages.
 *
 * Message layout (RFC 3416):
 *   SEQUENCE { INTEGER version(1), OCTET STRING community,
 *              PDU[A0|A1|A2] { INTEGER request-id, INTEGER error-status,
 *                              INTEGER error-index,
 *                              SEQUENCE OF SEQUENCE { OID, value } } }
 */

#pragma once

#include "core/result.hpp"
#include "protocol/protocol_client.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace fleetwatch::snmp {

inline constexpr int64_t VERSION_2C = 1;

enum class PduType : uint8_t {
    Get = 0xA0,
    GetNext = 0xA1,
    Response = 0xA2
};

struct Message {
    int64_t version{VERSION_2C};
    std::string community;
    PduType type{PduType::Get};
    int32_t request_id{0};
    int32_t error_status{0};
    int32_t error_index{0};
    std::vector<SnmpBinding> bindings;
};

Result<std::vector<uint32_t>> parse_oid(std::string_view dotted);
std::string format_oid(const std::vector<uint32_t>& arcs);

/// Encode a request whose bindings all carry NULL values.
Result<std::vector<uint8_t>> encode_request(PduType type,
                                            std::string_view community,
                                            int32_t request_id,
                                            const std::vector<std::string>& oids);

/// Encode a full message; used for responses in tests and by the mock agent.
Result<std::vector<uint8_t>> encode_message(const Message& message);

Result<Message> decode_message(const std::vector<uint8_t>& data);

}  // namespace fleetwatch::snmp
