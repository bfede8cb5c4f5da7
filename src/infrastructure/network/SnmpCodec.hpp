/**
 * @file SnmpCodec.hpp
 * @brief BER encoding and decoding of SNMP v1/v2c/v3 messages.
 */

#pragma once

#include "core/types/SnmpTypes.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace vlanvision::infra {

/**
 * @brief SNMP PDU types (context-specific constructed tags).
 */
enum class PduType : uint8_t {
    GetRequest = 0xA0,
    GetNextRequest = 0xA1,
    GetResponse = 0xA2,
    SetRequest = 0xA3,
    GetBulkRequest = 0xA5,
    Report = 0xA8
};

/**
 * @brief Thrown when a datagram is not a well-formed SNMP message.
 */
class MalformedPacket : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Header fields of an SNMPv3 message (USM, no authentication).
 */
struct SnmpV3Header {
    int32_t msgId{0};
    int32_t maxSize{65507};
    uint8_t flags{0x04}; ///< 0x04 reportable, 0x01 auth, 0x02 priv
    std::string engineId;
    int32_t engineBoots{0};
    int32_t engineTime{0};
    std::string userName;
    std::string contextEngineId;
    std::string contextName;

    bool operator==(const SnmpV3Header& other) const = default;
};

/**
 * @brief Decoded SNMP message. Community is used for v1/v2c, v3 for version 3.
 */
struct SnmpMessage {
    core::SnmpVersion version{core::SnmpVersion::V2c};
    std::string community;
    std::optional<SnmpV3Header> v3;
    PduType pduType{PduType::GetRequest};
    int32_t requestId{0};
    int32_t errorStatus{0};
    int32_t errorIndex{0};
    std::vector<core::SnmpVarBind> varbinds;

    bool operator==(const SnmpMessage& other) const = default;
};

/**
 * @brief Stateless BER helpers.
 *
 * Decoding is bounds-checked throughout and throws MalformedPacket on any
 * truncated or unexpected element.
 */
class SnmpCodec {
public:
    /// SNMP error-status values used by the client.
    static constexpr int32_t ERR_NO_SUCH_NAME = 2;
    static constexpr int32_t ERR_AUTHORIZATION = 16;

    [[nodiscard]] static std::vector<uint8_t> encode(const SnmpMessage& message);
    [[nodiscard]] static SnmpMessage decode(const std::vector<uint8_t>& packet);

    /**
     * @brief Builds a request message with NULL values for each OID.
     */
    [[nodiscard]] static SnmpMessage makeRequest(PduType type, int32_t requestId,
                                                 const std::vector<std::string>& oids);

    static std::vector<uint8_t> encodeLength(size_t length);
    static std::vector<uint8_t> encodeInteger(int64_t value);
    static std::vector<uint8_t> encodeUnsigned(uint8_t tag, uint64_t value);
    static std::vector<uint8_t> encodeOctetString(const std::string& str);
    static std::vector<uint8_t> encodeOid(const std::string& oid);
    static std::vector<uint8_t> encodeNull();
    static std::vector<uint8_t> encodeSequence(const std::vector<uint8_t>& content);
    static std::vector<uint8_t> encodeValue(const core::SnmpVarBind& varbind);

    static int64_t decodeInteger(const uint8_t* data, size_t length);
    static uint64_t decodeUnsigned(const uint8_t* data, size_t length);
    static std::string decodeOid(const uint8_t* data, size_t length);

    /**
     * @brief Splits a dotted OID into components.
     * @throws std::invalid_argument on a non-numeric component.
     */
    static std::vector<uint32_t> parseOidString(const std::string& oid);
    static std::string oidVectorToString(const std::vector<uint32_t>& oid);

    /// True if @p oid equals @p prefix or lies in its subtree.
    static bool isOidPrefix(const std::string& prefix, const std::string& oid);

    /// Components of @p oid after @p prefix, e.g. the table index of a column value.
    static std::vector<uint32_t> oidSuffix(const std::string& prefix, const std::string& oid);

    /// Space-separated hex dump of at most @p maxBytes bytes.
    static std::string hexExcerpt(const std::vector<uint8_t>& data, size_t maxBytes = 64);

    static std::string errorStatusToString(int32_t errorStatus);
};

} // namespace vlanvision::infra
