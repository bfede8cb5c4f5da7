#include "infrastructure/network/SnmpCodec.hpp"

#include "core/types/Ipv4Network.hpp"

#include <algorithm>
#include <charconv>
#include <iomanip>
#include <sstream>

namespace vlanvision::infra {

namespace {
// ASN.1/BER tag types
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

// SNMP message versions on the wire
constexpr int64_t WIRE_VERSION_1 = 0;
constexpr int64_t WIRE_VERSION_2C = 1;
constexpr int64_t WIRE_VERSION_3 = 3;

constexpr int64_t SECURITY_MODEL_USM = 3;

core::SnmpDataType tagToDataType(uint8_t tag) {
    switch (tag) {
        case TAG_INTEGER: return core::SnmpDataType::Integer;
        case TAG_OCTET_STRING: return core::SnmpDataType::OctetString;
        case TAG_OID: return core::SnmpDataType::ObjectIdentifier;
        case TAG_IP_ADDRESS: return core::SnmpDataType::IpAddress;
        case TAG_COUNTER32: return core::SnmpDataType::Counter32;
        case TAG_GAUGE32: return core::SnmpDataType::Gauge32;
        case TAG_TIMETICKS: return core::SnmpDataType::TimeTicks;
        case TAG_COUNTER64: return core::SnmpDataType::Counter64;
        case TAG_NULL: return core::SnmpDataType::Null;
        case TAG_NO_SUCH_OBJECT: return core::SnmpDataType::NoSuchObject;
        case TAG_NO_SUCH_INSTANCE: return core::SnmpDataType::NoSuchInstance;
        case TAG_END_OF_MIB_VIEW: return core::SnmpDataType::EndOfMibView;
        default: return core::SnmpDataType::Unknown;
    }
}

bool isPduTag(uint8_t tag) {
    return (tag >= 0xA0 && tag <= 0xA3) || tag == 0xA5 || tag == 0xA8;
}

void append(std::vector<uint8_t>& target, const std::vector<uint8_t>& source) {
    target.insert(target.end(), source.begin(), source.end());
}

std::vector<uint8_t> encodeTlv(uint8_t tag, const std::vector<uint8_t>& content) {
    std::vector<uint8_t> encoded;
    encoded.push_back(tag);
    append(encoded, SnmpCodec::encodeLength(content.size()));
    append(encoded, content);
    return encoded;
}

/**
 * Bounds-checked cursor over a BER buffer. Every accessor throws
 * MalformedPacket instead of reading past the end.
 */
class Reader {
public:
    struct Tlv {
        uint8_t tag{0};
        const uint8_t* data{nullptr};
        size_t length{0};
    };

    Reader(const uint8_t* data, size_t size) : data_(data), size_(size) {}

    [[nodiscard]] bool atEnd() const { return offset_ >= size_; }

    [[nodiscard]] uint8_t peekTag() const {
        need(1);
        return data_[offset_];
    }

    Tlv read() {
        need(1);
        uint8_t tag = data_[offset_++];
        size_t length = readLength();
        need(length);
        Tlv tlv{tag, data_ + offset_, length};
        offset_ += length;
        return tlv;
    }

    Tlv expect(uint8_t tag, const char* what) {
        auto tlv = read();
        if (tlv.tag != tag) {
            std::ostringstream oss;
            oss << "Expected " << what << " (tag 0x" << std::hex << std::setw(2) << std::setfill('0')
                << static_cast<int>(tag) << "), got 0x" << std::setw(2) << static_cast<int>(tlv.tag);
            throw MalformedPacket(oss.str());
        }
        return tlv;
    }

    Reader enter(uint8_t tag, const char* what) {
        auto tlv = expect(tag, what);
        return Reader(tlv.data, tlv.length);
    }

    int64_t readInteger(const char* what) {
        auto tlv = expect(TAG_INTEGER, what);
        if (tlv.length == 0 || tlv.length > 8) {
            throw MalformedPacket(std::string("Bad integer length for ") + what);
        }
        return SnmpCodec::decodeInteger(tlv.data, tlv.length);
    }

    std::string readOctetString(const char* what) {
        auto tlv = expect(TAG_OCTET_STRING, what);
        return std::string(reinterpret_cast<const char*>(tlv.data), tlv.length);
    }

private:
    void need(size_t count) const {
        if (count > size_ - offset_) {
            throw MalformedPacket("Truncated packet");
        }
    }

    size_t readLength() {
        need(1);
        uint8_t first = data_[offset_++];
        if ((first & 0x80) == 0) {
            return first;
        }

        size_t numBytes = first & 0x7F;
        if (numBytes == 0 || numBytes > 4) {
            throw MalformedPacket("Unsupported length encoding");
        }
        need(numBytes);

        size_t length = 0;
        for (size_t i = 0; i < numBytes; ++i) {
            length = (length << 8) | data_[offset_++];
        }
        return length;
    }

    const uint8_t* data_;
    size_t size_;
    size_t offset_{0};
};

core::SnmpVarBind decodeVarBind(Reader& list) {
    auto entry = list.enter(TAG_SEQUENCE, "varbind");

    auto oidTlv = entry.expect(TAG_OID, "OID");
    if (oidTlv.length == 0) {
        throw MalformedPacket("Empty OID in varbind");
    }

    core::SnmpVarBind varbind;
    varbind.oid = SnmpCodec::decodeOid(oidTlv.data, oidTlv.length);

    auto value = entry.read();
    varbind.type = tagToDataType(value.tag);

    switch (value.tag) {
        case TAG_INTEGER:
            if (value.length == 0 || value.length > 8) {
                throw MalformedPacket("Bad INTEGER length");
            }
            varbind.intValue = SnmpCodec::decodeInteger(value.data, value.length);
            varbind.value = std::to_string(*varbind.intValue);
            break;
        case TAG_OCTET_STRING:
            varbind.value.assign(reinterpret_cast<const char*>(value.data), value.length);
            break;
        case TAG_OID:
            varbind.value = SnmpCodec::decodeOid(value.data, value.length);
            break;
        case TAG_IP_ADDRESS:
            if (value.length != 4) {
                throw MalformedPacket("IpAddress must be 4 bytes");
            }
            varbind.value = std::to_string(value.data[0]) + "." + std::to_string(value.data[1]) + "." +
                            std::to_string(value.data[2]) + "." + std::to_string(value.data[3]);
            break;
        case TAG_COUNTER32:
        case TAG_GAUGE32:
        case TAG_TIMETICKS:
        case TAG_COUNTER64:
            if (value.length == 0 || value.length > 9) {
                throw MalformedPacket("Bad counter length");
            }
            varbind.counterValue = SnmpCodec::decodeUnsigned(value.data, value.length);
            varbind.value = std::to_string(*varbind.counterValue);
            break;
        case TAG_NULL:
        case TAG_NO_SUCH_OBJECT:
        case TAG_NO_SUCH_INSTANCE:
        case TAG_END_OF_MIB_VIEW:
            break;
        default: {
            // Store unknown types as hex
            std::ostringstream oss;
            oss << std::hex;
            for (size_t i = 0; i < value.length; ++i) {
                oss << std::setw(2) << std::setfill('0') << static_cast<int>(value.data[i]);
            }
            varbind.value = oss.str();
            break;
        }
    }

    if (!entry.atEnd()) {
        throw MalformedPacket("Trailing data in varbind");
    }
    return varbind;
}

} // anonymous namespace

SnmpMessage SnmpCodec::makeRequest(PduType type, int32_t requestId, const std::vector<std::string>& oids) {
    SnmpMessage message;
    message.pduType = type;
    message.requestId = requestId;
    for (const auto& oid : oids) {
        core::SnmpVarBind varbind;
        varbind.oid = oid;
        varbind.type = core::SnmpDataType::Null;
        message.varbinds.push_back(std::move(varbind));
    }
    return message;
}

std::vector<uint8_t> SnmpCodec::encode(const SnmpMessage& message) {
    std::vector<uint8_t> varbindList;
    for (const auto& varbind : message.varbinds) {
        std::vector<uint8_t> entry;
        append(entry, encodeOid(varbind.oid));
        append(entry, encodeValue(varbind));
        append(varbindList, encodeSequence(entry));
    }

    std::vector<uint8_t> pduContent;
    append(pduContent, encodeInteger(message.requestId));
    append(pduContent, encodeInteger(message.errorStatus));
    append(pduContent, encodeInteger(message.errorIndex));
    append(pduContent, encodeSequence(varbindList));
    auto pdu = encodeTlv(static_cast<uint8_t>(message.pduType), pduContent);

    std::vector<uint8_t> msgContent;

    if (message.version == core::SnmpVersion::V3) {
        SnmpV3Header header = message.v3.value_or(SnmpV3Header{});

        std::vector<uint8_t> scopedPdu;
        append(scopedPdu, encodeOctetString(header.contextEngineId));
        append(scopedPdu, encodeOctetString(header.contextName));
        append(scopedPdu, pdu);

        std::vector<uint8_t> usm;
        append(usm, encodeOctetString(header.engineId));
        append(usm, encodeInteger(header.engineBoots));
        append(usm, encodeInteger(header.engineTime));
        append(usm, encodeOctetString(header.userName));
        append(usm, encodeOctetString("")); // authentication parameters
        append(usm, encodeOctetString("")); // privacy parameters
        auto usmSeq = encodeSequence(usm);

        std::vector<uint8_t> globalData;
        append(globalData, encodeInteger(header.msgId));
        append(globalData, encodeInteger(header.maxSize));
        append(globalData, encodeOctetString(std::string(1, static_cast<char>(header.flags))));
        append(globalData, encodeInteger(SECURITY_MODEL_USM));

        append(msgContent, encodeInteger(WIRE_VERSION_3));
        append(msgContent, encodeSequence(globalData));
        append(msgContent, encodeOctetString(std::string(usmSeq.begin(), usmSeq.end())));
        append(msgContent, encodeSequence(scopedPdu));
    } else {
        int64_t version = message.version == core::SnmpVersion::V1 ? WIRE_VERSION_1 : WIRE_VERSION_2C;
        append(msgContent, encodeInteger(version));
        append(msgContent, encodeOctetString(message.community));
        append(msgContent, pdu);
    }

    return encodeSequence(msgContent);
}

SnmpMessage SnmpCodec::decode(const std::vector<uint8_t>& packet) {
    Reader outer(packet.data(), packet.size());
    auto msg = outer.enter(TAG_SEQUENCE, "message SEQUENCE");

    SnmpMessage result;
    auto version = msg.readInteger("version");

    Reader pduHolder = msg;
    if (version == WIRE_VERSION_3) {
        result.version = core::SnmpVersion::V3;
        SnmpV3Header header;

        auto global = msg.enter(TAG_SEQUENCE, "msgGlobalData");
        header.msgId = static_cast<int32_t>(global.readInteger("msgID"));
        header.maxSize = static_cast<int32_t>(global.readInteger("msgMaxSize"));
        auto flags = global.readOctetString("msgFlags");
        if (flags.size() != 1) {
            throw MalformedPacket("msgFlags must be one byte");
        }
        header.flags = static_cast<uint8_t>(flags[0]);
        global.readInteger("msgSecurityModel");

        auto securityTlv = msg.expect(TAG_OCTET_STRING, "msgSecurityParameters");
        Reader securityParams(securityTlv.data, securityTlv.length);
        auto usm = securityParams.enter(TAG_SEQUENCE, "UsmSecurityParameters");
        header.engineId = usm.readOctetString("msgAuthoritativeEngineID");
        header.engineBoots = static_cast<int32_t>(usm.readInteger("msgAuthoritativeEngineBoots"));
        header.engineTime = static_cast<int32_t>(usm.readInteger("msgAuthoritativeEngineTime"));
        header.userName = usm.readOctetString("msgUserName");

        if (msg.peekTag() != TAG_SEQUENCE) {
            throw MalformedPacket("Encrypted scoped PDU is not supported");
        }
        auto scoped = msg.enter(TAG_SEQUENCE, "ScopedPDU");
        header.contextEngineId = scoped.readOctetString("contextEngineID");
        header.contextName = scoped.readOctetString("contextName");

        result.v3 = std::move(header);
        pduHolder = scoped;
    } else if (version == WIRE_VERSION_1 || version == WIRE_VERSION_2C) {
        result.version = version == WIRE_VERSION_1 ? core::SnmpVersion::V1 : core::SnmpVersion::V2c;
        result.community = msg.readOctetString("community");
        pduHolder = msg;
    } else {
        throw MalformedPacket("Unsupported SNMP version " + std::to_string(version));
    }

    uint8_t pduTag = pduHolder.peekTag();
    if (!isPduTag(pduTag)) {
        throw MalformedPacket("Unknown PDU type");
    }
    auto pdu = pduHolder.enter(pduTag, "PDU");
    result.pduType = static_cast<PduType>(pduTag);
    result.requestId = static_cast<int32_t>(pdu.readInteger("request-id"));
    result.errorStatus = static_cast<int32_t>(pdu.readInteger("error-status"));
    result.errorIndex = static_cast<int32_t>(pdu.readInteger("error-index"));

    auto list = pdu.enter(TAG_SEQUENCE, "varbind-list");
    while (!list.atEnd()) {
        result.varbinds.push_back(decodeVarBind(list));
    }

    return result;
}

// BER encoding helpers

std::vector<uint8_t> SnmpCodec::encodeLength(size_t length) {
    std::vector<uint8_t> encoded;

    if (length < 128) {
        encoded.push_back(static_cast<uint8_t>(length));
    } else if (length < 256) {
        encoded.push_back(0x81);
        encoded.push_back(static_cast<uint8_t>(length));
    } else if (length < 65536) {
        encoded.push_back(0x82);
        encoded.push_back(static_cast<uint8_t>((length >> 8) & 0xFF));
        encoded.push_back(static_cast<uint8_t>(length & 0xFF));
    } else {
        encoded.push_back(0x83);
        encoded.push_back(static_cast<uint8_t>((length >> 16) & 0xFF));
        encoded.push_back(static_cast<uint8_t>((length >> 8) & 0xFF));
        encoded.push_back(static_cast<uint8_t>(length & 0xFF));
    }

    return encoded;
}

std::vector<uint8_t> SnmpCodec::encodeInteger(int64_t value) {
    std::vector<uint8_t> bytes;
    auto raw = static_cast<uint64_t>(value);
    for (int shift = 56; shift >= 0; shift -= 8) {
        bytes.push_back(static_cast<uint8_t>((raw >> shift) & 0xFF));
    }

    // Strip redundant sign bytes, keeping two's complement minimal
    size_t start = 0;
    while (start + 1 < bytes.size()) {
        bool redundantZero = bytes[start] == 0x00 && (bytes[start + 1] & 0x80) == 0;
        bool redundantOnes = bytes[start] == 0xFF && (bytes[start + 1] & 0x80) != 0;
        if (!redundantZero && !redundantOnes) {
            break;
        }
        ++start;
    }

    return encodeTlv(TAG_INTEGER, std::vector<uint8_t>(bytes.begin() + static_cast<std::ptrdiff_t>(start),
                                                       bytes.end()));
}

std::vector<uint8_t> SnmpCodec::encodeUnsigned(uint8_t tag, uint64_t value) {
    std::vector<uint8_t> bytes;
    do {
        bytes.insert(bytes.begin(), static_cast<uint8_t>(value & 0xFF));
        value >>= 8;
    } while (value > 0);

    // Leading zero keeps the value positive
    if (bytes[0] & 0x80) {
        bytes.insert(bytes.begin(), 0);
    }
    return encodeTlv(tag, bytes);
}

std::vector<uint8_t> SnmpCodec::encodeOctetString(const std::string& str) {
    return encodeTlv(TAG_OCTET_STRING, std::vector<uint8_t>(str.begin(), str.end()));
}

std::vector<uint8_t> SnmpCodec::encodeOid(const std::string& oid) {
    auto components = parseOidString(oid);
    if (components.size() < 2) {
        throw std::invalid_argument("OID needs at least two components: '" + oid + "'");
    }

    auto appendSubId = [](std::vector<uint8_t>& out, uint32_t val) {
        std::vector<uint8_t> subId;
        do {
            subId.insert(subId.begin(), static_cast<uint8_t>(val & 0x7F));
            val >>= 7;
        } while (val > 0);
        // Set high bit on all but last byte
        for (size_t j = 0; j + 1 < subId.size(); ++j) {
            subId[j] |= 0x80;
        }
        out.insert(out.end(), subId.begin(), subId.end());
    };

    std::vector<uint8_t> oidBytes;
    // First two components are encoded as (first * 40 + second)
    appendSubId(oidBytes, components[0] * 40 + components[1]);
    for (size_t i = 2; i < components.size(); ++i) {
        appendSubId(oidBytes, components[i]);
    }

    return encodeTlv(TAG_OID, oidBytes);
}

std::vector<uint8_t> SnmpCodec::encodeNull() {
    return {TAG_NULL, 0x00};
}

std::vector<uint8_t> SnmpCodec::encodeSequence(const std::vector<uint8_t>& content) {
    return encodeTlv(TAG_SEQUENCE, content);
}

std::vector<uint8_t> SnmpCodec::encodeValue(const core::SnmpVarBind& varbind) {
    switch (varbind.type) {
        case core::SnmpDataType::Integer:
            return encodeInteger(varbind.intValue.value_or(0));
        case core::SnmpDataType::OctetString:
            return encodeOctetString(varbind.value);
        case core::SnmpDataType::ObjectIdentifier:
            return encodeOid(varbind.value);
        case core::SnmpDataType::IpAddress: {
            auto address = core::Ipv4Network::parseAddress(varbind.value);
            if (!address) {
                throw std::invalid_argument("Invalid IpAddress value: '" + varbind.value + "'");
            }
            return encodeTlv(TAG_IP_ADDRESS, {static_cast<uint8_t>(*address >> 24),
                                              static_cast<uint8_t>(*address >> 16),
                                              static_cast<uint8_t>(*address >> 8),
                                              static_cast<uint8_t>(*address)});
        }
        case core::SnmpDataType::Counter32:
            return encodeUnsigned(TAG_COUNTER32, varbind.counterValue.value_or(0));
        case core::SnmpDataType::Gauge32:
            return encodeUnsigned(TAG_GAUGE32, varbind.counterValue.value_or(0));
        case core::SnmpDataType::TimeTicks:
            return encodeUnsigned(TAG_TIMETICKS, varbind.counterValue.value_or(0));
        case core::SnmpDataType::Counter64:
            return encodeUnsigned(TAG_COUNTER64, varbind.counterValue.value_or(0));
        case core::SnmpDataType::NoSuchObject:
            return {TAG_NO_SUCH_OBJECT, 0x00};
        case core::SnmpDataType::NoSuchInstance:
            return {TAG_NO_SUCH_INSTANCE, 0x00};
        case core::SnmpDataType::EndOfMibView:
            return {TAG_END_OF_MIB_VIEW, 0x00};
        case core::SnmpDataType::Null:
        case core::SnmpDataType::Unknown:
            break;
    }
    return encodeNull();
}

// BER decoding helpers

int64_t SnmpCodec::decodeInteger(const uint8_t* data, size_t length) {
    if (length == 0) return 0;

    // Sign extend from the first byte
    uint64_t value = (data[0] & 0x80) ? ~uint64_t{0} : 0;
    for (size_t i = 0; i < length; ++i) {
        value = (value << 8) | data[i];
    }
    return static_cast<int64_t>(value);
}

uint64_t SnmpCodec::decodeUnsigned(const uint8_t* data, size_t length) {
    uint64_t value = 0;
    for (size_t i = 0; i < length; ++i) {
        value = (value << 8) | data[i];
    }
    return value;
}

std::string SnmpCodec::decodeOid(const uint8_t* data, size_t length) {
    if (length == 0) return "";

    std::vector<uint32_t> components;
    uint64_t value = 0;
    bool first = true;

    for (size_t i = 0; i < length; ++i) {
        value = (value << 7) | (data[i] & 0x7F);
        if (value > 0xFFFFFFFFu) {
            throw MalformedPacket("OID sub-identifier overflow");
        }
        if ((data[i] & 0x80) != 0) {
            continue;
        }

        if (first) {
            // First sub-identifier encodes the first two components
            if (value < 80) {
                components.push_back(static_cast<uint32_t>(value / 40));
                components.push_back(static_cast<uint32_t>(value % 40));
            } else {
                components.push_back(2);
                components.push_back(static_cast<uint32_t>(value - 80));
            }
            first = false;
        } else {
            components.push_back(static_cast<uint32_t>(value));
        }
        value = 0;
    }

    if ((data[length - 1] & 0x80) != 0) {
        throw MalformedPacket("Truncated OID sub-identifier");
    }

    return oidVectorToString(components);
}

std::vector<uint32_t> SnmpCodec::parseOidString(const std::string& oid) {
    std::vector<uint32_t> components;
    size_t start = (!oid.empty() && oid.front() == '.') ? 1 : 0;

    while (start < oid.size()) {
        auto dot = oid.find('.', start);
        auto end = dot == std::string::npos ? oid.size() : dot;

        uint32_t value = 0;
        auto [ptr, ec] = std::from_chars(oid.data() + start, oid.data() + end, value);
        if (end == start || ec != std::errc() || ptr != oid.data() + end) {
            throw std::invalid_argument("Invalid OID: '" + oid + "'");
        }
        components.push_back(value);

        if (dot == std::string::npos) {
            break;
        }
        start = dot + 1;
    }

    return components;
}

std::string SnmpCodec::oidVectorToString(const std::vector<uint32_t>& oid) {
    std::ostringstream oss;
    for (size_t i = 0; i < oid.size(); ++i) {
        if (i > 0) oss << ".";
        oss << oid[i];
    }
    return oss.str();
}

bool SnmpCodec::isOidPrefix(const std::string& prefix, const std::string& oid) {
    if (oid.size() < prefix.size()) return false;
    if (oid.compare(0, prefix.size(), prefix) != 0) return false;

    // Ensure we're at a boundary
    if (oid.size() > prefix.size() && oid[prefix.size()] != '.') {
        return false;
    }

    return true;
}

std::vector<uint32_t> SnmpCodec::oidSuffix(const std::string& prefix, const std::string& oid) {
    if (!isOidPrefix(prefix, oid) || oid.size() == prefix.size()) {
        return {};
    }
    try {
        return parseOidString(oid.substr(prefix.size() + 1));
    } catch (const std::invalid_argument&) {
        return {};
    }
}

std::string SnmpCodec::hexExcerpt(const std::vector<uint8_t>& data, size_t maxBytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    size_t count = std::min(data.size(), maxBytes);
    for (size_t i = 0; i < count; ++i) {
        if (i > 0) oss << ' ';
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    if (data.size() > maxBytes) {
        oss << " ...";
    }
    return oss.str();
}

std::string SnmpCodec::errorStatusToString(int32_t errorStatus) {
    switch (errorStatus) {
        case 0: return "No error";
        case 1: return "Response too big";
        case 2: return "No such name";
        case 3: return "Bad value";
        case 4: return "Read only";
        case 5: return "General error";
        case 6: return "No access";
        case 16: return "Authorization error";
        default: return "Error status " + std::to_string(errorStatus);
    }
}

} // namespace vlanvision::infra
