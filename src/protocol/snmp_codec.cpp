/**
 * @file snmp_codec.cpp
 * @brief SNMPv2c BER encoding and decoding.
 */

#include "protocol/snmp_codec.hpp"

#include <charconv>
#include <system_error>

namespace fleetwatch::snmp {

namespace {

constexpr uint8_t TAG_INTEGER = 0x02;
constexpr uint8_t TAG_OCTET_STRING = 0x04;
constexpr uint8_t TAG_NULL = 0x05;
constexpr uint8_t TAG_OID = 0x06;
constexpr uint8_t TAG_SEQUENCE = 0x30;
constexpr uint8_t TAG_IP_ADDRESS = 0x40;
constexpr uint8_t TAG_COUNTER32 = 0x41;
constexpr uint8_t TAG_GAUGE32 = 0x42;
constexpr uint8_t TAG_TIMETICKS = 0x43;
constexpr uint8_t TAG_COUNTER64 = 0x46;
constexpr uint8_t TAG_NO_SUCH_OBJECT = 0x80;
constexpr uint8_t TAG_NO_SUCH_INSTANCE = 0x81;
constexpr uint8_t TAG_END_OF_MIB_VIEW = 0x82;

// ── Encoding helpers ─────────────────────────

void put_length(std::vector<uint8_t>& out, size_t length) {
    if (length < 0x80) {
        out.push_back(static_cast<uint8_t>(length));
        return;
    }
    uint8_t bytes[sizeof(size_t)];
    size_t count = 0;
    while (length > 0) {
        bytes[count++] = static_cast<uint8_t>(length & 0xFF);
        length >>= 8;
    }
    out.push_back(static_cast<uint8_t>(0x80 | count));
    while (count > 0) {
        out.push_back(bytes[--count]);
    }
}

void put_tlv(std::vector<uint8_t>& out, uint8_t tag, const std::vector<uint8_t>& content) {
    out.push_back(tag);
    put_length(out, content.size());
    out.insert(out.end(), content.begin(), content.end());
}

std::vector<uint8_t> signed_bytes(int64_t value) {
    std::vector<uint8_t> bytes;
    for (int shift = 56; shift >= 0; shift -= 8) {
        bytes.push_back(static_cast<uint8_t>((static_cast<uint64_t>(value) >> shift) & 0xFF));
    }
    // Strip redundant sign octets while keeping the sign bit intact.
    size_t start = 0;
    while (start + 1 < bytes.size()) {
        bool redundant_zero = bytes[start] == 0x00 && (bytes[start + 1] & 0x80) == 0;
        bool redundant_ones = bytes[start] == 0xFF && (bytes[start + 1] & 0x80) != 0;
        if (!redundant_zero && !redundant_ones) break;
        ++start;
    }
    return {bytes.begin() + static_cast<std::ptrdiff_t>(start), bytes.end()};
}

std::vector<uint8_t> unsigned_bytes(uint64_t value) {
    std::vector<uint8_t> bytes;
    do {
        bytes.insert(bytes.begin(), static_cast<uint8_t>(value & 0xFF));
        value >>= 8;
    } while (value > 0);
    if (bytes.front() & 0x80) bytes.insert(bytes.begin(), 0x00);
    return bytes;
}

void put_base128(std::vector<uint8_t>& out, uint64_t value) {
    uint8_t groups[10];
    size_t count = 0;
    do {
        groups[count++] = static_cast<uint8_t>(value & 0x7F);
        value >>= 7;
    } while (value > 0);
    while (count > 1) {
        out.push_back(static_cast<uint8_t>(groups[--count] | 0x80));
    }
    out.push_back(groups[0]);
}

Result<std::vector<uint8_t>> oid_bytes(std::string_view dotted) {
    auto arcs = parse_oid(dotted);
    if (!arcs) return arcs.error();
    const auto& a = *arcs;

    std::vector<uint8_t> out;
    put_base128(out, static_cast<uint64_t>(a[0]) * 40 + a[1]);
    for (size_t i = 2; i < a.size(); ++i) {
        put_base128(out, a[i]);
    }
    return out;
}

Result<std::vector<uint8_t>> ipv4_bytes(std::string_view dotted) {
    std::vector<uint8_t> out;
    size_t pos = 0;
    while (true) {
        auto dot = dotted.find('.', pos);
        auto part = dotted.substr(pos, dot == std::string_view::npos ? std::string_view::npos : dot - pos);
        unsigned value = 0;
        auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), value);
        if (part.empty() || ec != std::errc{} || ptr != part.data() + part.size() || value > 255
            || out.size() == 4) {
            return Error{ErrorCode::InvalidArgument, "Invalid IpAddress value: " + std::string(dotted)};
        }
        out.push_back(static_cast<uint8_t>(value));
        if (dot == std::string_view::npos) break;
        pos = dot + 1;
    }
    if (out.size() != 4) {
        return Error{ErrorCode::InvalidArgument, "Invalid IpAddress value: " + std::string(dotted)};
    }
    return out;
}

Result<void> put_value(std::vector<uint8_t>& out, const SnmpValue& value) {
    using Type = SnmpValue::Type;
    switch (value.type) {
        case Type::Integer:
            put_tlv(out, TAG_INTEGER, signed_bytes(value.number));
            break;
        case Type::OctetString:
            put_tlv(out, TAG_OCTET_STRING, std::vector<uint8_t>(value.text.begin(), value.text.end()));
            break;
        case Type::Null:
            put_tlv(out, TAG_NULL, {});
            break;
        case Type::ObjectId: {
            auto bytes = oid_bytes(value.text);
            if (!bytes) return bytes.error();
            put_tlv(out, TAG_OID, *bytes);
            break;
        }
        case Type::IpAddress: {
            auto bytes = ipv4_bytes(value.text);
            if (!bytes) return bytes.error();
            put_tlv(out, TAG_IP_ADDRESS, *bytes);
            break;
        }
        case Type::Counter32:
            put_tlv(out, TAG_COUNTER32, unsigned_bytes(static_cast<uint32_t>(value.number)));
            break;
        case Type::Gauge32:
            put_tlv(out, TAG_GAUGE32, unsigned_bytes(static_cast<uint32_t>(value.number)));
            break;
        case Type::TimeTicks:
            put_tlv(out, TAG_TIMETICKS, unsigned_bytes(static_cast<uint32_t>(value.number)));
            break;
        case Type::Counter64:
            put_tlv(out, TAG_COUNTER64, unsigned_bytes(static_cast<uint64_t>(value.number)));
            break;
        case Type::NoSuchObject:
            put_tlv(out, TAG_NO_SUCH_OBJECT, {});
            break;
        case Type::NoSuchInstance:
            put_tlv(out, TAG_NO_SUCH_INSTANCE, {});
            break;
        case Type::EndOfMibView:
            put_tlv(out, TAG_END_OF_MIB_VIEW, {});
            break;
    }
    return {};
}

// ── Decoding helpers ─────────────────────────

struct Tlv {
    uint8_t tag{0};
    size_t offset{0};   ///< Start of content
    size_t length{0};
};

/**
 * @brief Sequential TLV reader over [pos, end) of a buffer.
 */
class Reader {
public:
    Reader(const std::vector<uint8_t>& data, size_t pos, size_t end)
        : data_(data), pos_(pos), end_(end) {}

    [[nodiscard]] bool at_end() const noexcept { return pos_ >= end_; }

    Result<Tlv> next() {
        if (pos_ + 2 > end_) return truncated();
        Tlv tlv;
        tlv.tag = data_[pos_++];

        uint8_t first = data_[pos_++];
        if (first < 0x80) {
            tlv.length = first;
        } else {
            size_t count = first & 0x7F;
            if (count == 0 || count > 4) {
                return Error{ErrorCode::Parse, "Unsupported BER length form"};
            }
            if (pos_ + count > end_) return truncated();
            for (size_t i = 0; i < count; ++i) {
                tlv.length = (tlv.length << 8) | data_[pos_++];
            }
        }

        if (pos_ + tlv.length > end_) return truncated();
        tlv.offset = pos_;
        pos_ += tlv.length;
        return tlv;
    }

    Result<Tlv> expect(uint8_t tag) {
        auto tlv = next();
        if (!tlv) return tlv;
        if (tlv->tag != tag) {
            return Error{ErrorCode::Parse, "Unexpected BER tag " + std::to_string(tlv->tag)
                                           + ", wanted " + std::to_string(tag)};
        }
        return tlv;
    }

private:
    static Error truncated() { return Error{ErrorCode::Parse, "Truncated BER element"}; }

    const std::vector<uint8_t>& data_;
    size_t pos_;
    size_t end_;
};

Result<int64_t> read_signed(const std::vector<uint8_t>& data, const Tlv& tlv) {
    if (tlv.length == 0 || tlv.length > 8) {
        return Error{ErrorCode::Parse, "Bad INTEGER length"};
    }
    int64_t value = (data[tlv.offset] & 0x80) ? -1 : 0;
    for (size_t i = 0; i < tlv.length; ++i) {
        value = static_cast<int64_t>((static_cast<uint64_t>(value) << 8) | data[tlv.offset + i]);
    }
    return value;
}

Result<int64_t> read_unsigned(const std::vector<uint8_t>& data, const Tlv& tlv) {
    if (tlv.length == 0 || tlv.length > 9) {
        return Error{ErrorCode::Parse, "Bad unsigned length"};
    }
    uint64_t value = 0;
    for (size_t i = 0; i < tlv.length; ++i) {
        value = (value << 8) | data[tlv.offset + i];
    }
    return static_cast<int64_t>(value);
}

Result<std::string> read_oid(const std::vector<uint8_t>& data, const Tlv& tlv) {
    if (tlv.length == 0) return Error{ErrorCode::Parse, "Empty OID"};

    std::vector<uint32_t> arcs;
    uint64_t current = 0;
    bool first = true;
    for (size_t i = 0; i < tlv.length; ++i) {
        uint8_t byte = data[tlv.offset + i];
        current = (current << 7) | (byte & 0x7F);
        if (current > 0xFFFFFFFFull) return Error{ErrorCode::Parse, "OID arc overflow"};
        if (byte & 0x80) continue;

        if (first) {
            uint32_t head = current < 80 ? static_cast<uint32_t>(current / 40) : 2;
            arcs.push_back(head);
            arcs.push_back(static_cast<uint32_t>(current - head * 40));
            first = false;
        } else {
            arcs.push_back(static_cast<uint32_t>(current));
        }
        current = 0;
    }
    if (data[tlv.offset + tlv.length - 1] & 0x80) {
        return Error{ErrorCode::Parse, "Unterminated OID arc"};
    }
    return format_oid(arcs);
}

Result<SnmpValue> read_value(const std::vector<uint8_t>& data, const Tlv& tlv) {
    using Type = SnmpValue::Type;
    SnmpValue value;

    switch (tlv.tag) {
        case TAG_INTEGER: {
            auto v = read_signed(data, tlv);
            if (!v) return v.error();
            value.type = Type::Integer;
            value.number = *v;
            return value;
        }
        case TAG_OCTET_STRING:
            value.type = Type::OctetString;
            value.text.assign(reinterpret_cast<const char*>(data.data() + tlv.offset), tlv.length);
            return value;
        case TAG_NULL:
            value.type = Type::Null;
            return value;
        case TAG_OID: {
            auto oid = read_oid(data, tlv);
            if (!oid) return oid.error();
            value.type = Type::ObjectId;
            value.text = *oid;
            return value;
        }
        case TAG_IP_ADDRESS: {
            if (tlv.length != 4) return Error{ErrorCode::Parse, "Bad IpAddress length"};
            value.type = Type::IpAddress;
            for (size_t i = 0; i < 4; ++i) {
                if (i > 0) value.text += '.';
                value.text += std::to_string(data[tlv.offset + i]);
            }
            return value;
        }
        case TAG_COUNTER32:
        case TAG_GAUGE32:
        case TAG_TIMETICKS:
        case TAG_COUNTER64: {
            auto v = read_unsigned(data, tlv);
            if (!v) return v.error();
            value.number = *v;
            value.type = tlv.tag == TAG_COUNTER32 ? Type::Counter32
                       : tlv.tag == TAG_GAUGE32   ? Type::Gauge32
                       : tlv.tag == TAG_TIMETICKS ? Type::TimeTicks
                                                  : Type::Counter64;
            return value;
        }
        case TAG_NO_SUCH_OBJECT:
            value.type = Type::NoSuchObject;
            return value;
        case TAG_NO_SUCH_INSTANCE:
            value.type = Type::NoSuchInstance;
            return value;
        case TAG_END_OF_MIB_VIEW:
            value.type = Type::EndOfMibView;
            return value;
        default:
            return Error{ErrorCode::Parse, "Unsupported SNMP value tag " + std::to_string(tlv.tag)};
    }
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// OID text form
// ─────────────────────────────────────────────

Result<std::vector<uint32_t>> parse_oid(std::string_view dotted) {
    if (!dotted.empty() && dotted.front() == '.') dotted.remove_prefix(1);

    std::vector<uint32_t> arcs;
    size_t pos = 0;
    while (pos <= dotted.size()) {
        auto dot = dotted.find('.', pos);
        auto part = dotted.substr(pos, dot == std::string_view::npos ? std::string_view::npos : dot - pos);
        uint32_t arc = 0;
        auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), arc);
        if (part.empty() || ec != std::errc{} || ptr != part.data() + part.size()) {
            return Error{ErrorCode::InvalidArgument, "Malformed OID: " + std::string(dotted)};
        }
        arcs.push_back(arc);
        if (dot == std::string_view::npos) break;
        pos = dot + 1;
    }

    if (arcs.size() < 2 || arcs[0] > 2 || (arcs[0] < 2 && arcs[1] >= 40)) {
        return Error{ErrorCode::InvalidArgument, "Malformed OID: " + std::string(dotted)};
    }
    return arcs;
}

std::string format_oid(const std::vector<uint32_t>& arcs) {
    std::string out;
    for (size_t i = 0; i < arcs.size(); ++i) {
        if (i > 0) out += '.';
        out += std::to_string(arcs[i]);
    }
    return out;
}

// ─────────────────────────────────────────────
// Messages
// ─────────────────────────────────────────────

Result<std::vector<uint8_t>> encode_message(const Message& message) {
    std::vector<uint8_t> bindings;
    for (const auto& binding : message.bindings) {
        auto oid = oid_bytes(binding.oid);
        if (!oid) return oid.error();

        std::vector<uint8_t> pair;
        put_tlv(pair, TAG_OID, *oid);
        auto value = put_value(pair, binding.value);
        if (!value) return value.error();
        put_tlv(bindings, TAG_SEQUENCE, pair);
    }

    std::vector<uint8_t> pdu;
    put_tlv(pdu, TAG_INTEGER, signed_bytes(message.request_id));
    put_tlv(pdu, TAG_INTEGER, signed_bytes(message.error_status));
    put_tlv(pdu, TAG_INTEGER, signed_bytes(message.error_index));
    put_tlv(pdu, TAG_SEQUENCE, bindings);

    std::vector<uint8_t> body;
    put_tlv(body, TAG_INTEGER, signed_bytes(message.version));
    put_tlv(body, TAG_OCTET_STRING,
            std::vector<uint8_t>(message.community.begin(), message.community.end()));
    put_tlv(body, static_cast<uint8_t>(message.type), pdu);

    std::vector<uint8_t> out;
    put_tlv(out, TAG_SEQUENCE, body);
    return out;
}

Result<std::vector<uint8_t>> encode_request(PduType type,
                                            std::string_view community,
                                            int32_t request_id,
                                            const std::vector<std::string>& oids) {
    Message message;
    message.community = std::string(community);
    message.type = type;
    message.request_id = request_id;
    for (const auto& oid : oids) {
        message.bindings.push_back(SnmpBinding{oid, SnmpValue{}});
    }
    return encode_message(message);
}

Result<Message> decode_message(const std::vector<uint8_t>& data) {
    Reader outer(data, 0, data.size());
    auto envelope = outer.expect(TAG_SEQUENCE);
    if (!envelope) return envelope.error();

    Reader body(data, envelope->offset, envelope->offset + envelope->length);
    Message message;

    auto version = body.expect(TAG_INTEGER);
    if (!version) return version.error();
    auto version_value = read_signed(data, *version);
    if (!version_value) return version_value.error();
    message.version = *version_value;

    auto community = body.expect(TAG_OCTET_STRING);
    if (!community) return community.error();
    message.community.assign(reinterpret_cast<const char*>(data.data() + community->offset),
                             community->length);

    auto pdu = body.next();
    if (!pdu) return pdu.error();
    if (pdu->tag != static_cast<uint8_t>(PduType::Get)
        && pdu->tag != static_cast<uint8_t>(PduType::GetNext)
        && pdu->tag != static_cast<uint8_t>(PduType::Response)) {
        return Error{ErrorCode::Parse, "Unsupported PDU type " + std::to_string(pdu->tag)};
    }
    message.type = static_cast<PduType>(pdu->tag);

    Reader fields(data, pdu->offset, pdu->offset + pdu->length);
    int32_t* targets[] = {&message.request_id, &message.error_status, &message.error_index};
    for (auto* target : targets) {
        auto tlv = fields.expect(TAG_INTEGER);
        if (!tlv) return tlv.error();
        auto value = read_signed(data, *tlv);
        if (!value) return value.error();
        *target = static_cast<int32_t>(*value);
    }

    auto list = fields.expect(TAG_SEQUENCE);
    if (!list) return list.error();

    Reader bindings(data, list->offset, list->offset + list->length);
    while (!bindings.at_end()) {
        auto pair = bindings.expect(TAG_SEQUENCE);
        if (!pair) return pair.error();

        Reader entry(data, pair->offset, pair->offset + pair->length);
        auto oid_tlv = entry.expect(TAG_OID);
        if (!oid_tlv) return oid_tlv.error();
        auto oid = read_oid(data, *oid_tlv);
        if (!oid) return oid.error();

        auto value_tlv = entry.next();
        if (!value_tlv) return value_tlv.error();
        auto value = read_value(data, *value_tlv);
        if (!value) return value.error();

        message.bindings.push_back(SnmpBinding{*oid, *value});
    }

    return message;
}

}  // namespace fleetwatch::snmp
