/**
 * @file SnmpTypes.hpp
 * @brief SNMP types, credentials, agent settings and the OIDs the probes read.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace vlanvision::core {

/**
 * @brief Supported SNMP protocol versions.
 */
enum class SnmpVersion : int {
    V1 = 1,  ///< SNMP version 1 (community-based)
    V2c = 2, ///< SNMP version 2c (community-based, GETBULK-era error values)
    V3 = 3   ///< SNMP version 3 (user-based security model)
};

/**
 * @brief Security levels for SNMP v3.
 *
 * Only NoAuthNoPriv is implemented by the client; the other levels are
 * rejected as an authentication failure.
 */
enum class SnmpSecurityLevel : int {
    NoAuthNoPriv = 1, ///< No authentication, no privacy
    AuthNoPriv = 2,   ///< Authentication only
    AuthPriv = 3      ///< Authentication and privacy
};

/**
 * @brief SNMP v1/v2c credentials using a community string.
 */
struct SnmpCommunityCredentials {
    std::string community{"public"};

    bool operator==(const SnmpCommunityCredentials& other) const = default;
};

/**
 * @brief SNMP v3 credentials (User-based Security Model).
 */
struct SnmpV3Credentials {
    std::string username;
    SnmpSecurityLevel securityLevel{SnmpSecurityLevel::NoAuthNoPriv};
    std::string contextName;

    bool operator==(const SnmpV3Credentials& other) const = default;
};

using SnmpCredentials = std::variant<SnmpCommunityCredentials, SnmpV3Credentials>;

/**
 * @brief SNMP data types as defined in RFC 2578.
 */
enum class SnmpDataType : int {
    Integer = 0,          ///< 32-bit signed integer
    OctetString = 1,      ///< Arbitrary binary or text data
    ObjectIdentifier = 2, ///< Object identifier (OID)
    IpAddress = 3,        ///< 32-bit IPv4 address
    Counter32 = 4,        ///< 32-bit counter (wraps at max)
    Gauge32 = 5,          ///< 32-bit gauge
    TimeTicks = 6,        ///< Hundredths of a second
    Counter64 = 7,        ///< 64-bit counter
    Null = 8,             ///< Null value
    NoSuchObject = 9,     ///< OID does not exist
    NoSuchInstance = 10,  ///< Instance does not exist
    EndOfMibView = 11,    ///< End of MIB tree reached
    Unknown = 99          ///< Unknown data type
};

/**
 * @brief SNMP variable binding (OID + value pair).
 */
struct SnmpVarBind {
    std::string oid;
    SnmpDataType type{SnmpDataType::Unknown};
    std::string value;                    ///< Printable value; raw bytes for octet strings
    std::optional<int64_t> intValue;      ///< Integer value (if applicable)
    std::optional<uint64_t> counterValue; ///< Counter, gauge or timeticks value (if applicable)

    [[nodiscard]] bool isException() const {
        return type == SnmpDataType::NoSuchObject || type == SnmpDataType::NoSuchInstance ||
               type == SnmpDataType::EndOfMibView;
    }

    /// Numeric value regardless of whether it arrived as an integer or a counter.
    [[nodiscard]] std::optional<uint64_t> unsignedValue() const {
        if (counterValue) {
            return counterValue;
        }
        if (intValue && *intValue >= 0) {
            return static_cast<uint64_t>(*intValue);
        }
        return std::nullopt;
    }

    bool operator==(const SnmpVarBind& other) const = default;
};

/**
 * @brief Transport-level failure class of an SNMP request.
 */
enum class SnmpErrorKind : int {
    None = 0,        ///< A response was received
    Timeout = 1,     ///< No response after all retries
    Unreachable = 2, ///< ICMP port unreachable or the address could not be resolved
    AuthFailure = 3, ///< authorizationError or a v3 usmStats report
    Malformed = 4    ///< The response could not be decoded
};

/**
 * @brief Result of an SNMP GET, GET-NEXT or WALK.
 */
struct SnmpResult {
    std::chrono::system_clock::time_point timestamp;
    SnmpVersion version{SnmpVersion::V2c};
    std::vector<SnmpVarBind> varbinds;
    std::chrono::microseconds responseTime{0};
    bool success{false};
    SnmpErrorKind errorKind{SnmpErrorKind::None};
    std::string errorMessage;
    std::string rawExcerpt; ///< Hex dump of the offending datagram for malformed responses
    int errorStatus{0};     ///< SNMP error-status (0 = noError)
    int errorIndex{0};

    [[nodiscard]] double responseTimeMs() const {
        return static_cast<double>(responseTime.count()) / 1000.0;
    }

    [[nodiscard]] std::optional<SnmpVarBind> getVarBind(const std::string& oid) const {
        for (const auto& vb : varbinds) {
            if (vb.oid == oid) {
                return vb;
            }
        }
        return std::nullopt;
    }

    bool operator==(const SnmpResult& other) const = default;
};

/**
 * @brief How to reach the SNMP agents of a discovery range.
 */
struct SnmpAgentConfig {
    SnmpVersion version{SnmpVersion::V2c};
    SnmpCredentials credentials{SnmpCommunityCredentials{}};
    uint16_t port{161};
    int timeoutMs{2000}; ///< Per-request timeout
    int retries{1};      ///< Extra attempts after the first timeout

    bool operator==(const SnmpAgentConfig& other) const = default;
};

/**
 * @brief OIDs read by the discovery probes.
 */
namespace SnmpOids {
    /** @name System MIB (SNMPv2-MIB)
     *  @{ */
    constexpr const char* SYS_DESCR = "1.3.6.1.2.1.1.1.0";
    constexpr const char* SYS_OBJECT_ID = "1.3.6.1.2.1.1.2.0";
    constexpr const char* SYS_UPTIME = "1.3.6.1.2.1.1.3.0";
    constexpr const char* SYS_NAME = "1.3.6.1.2.1.1.5.0";
    constexpr const char* SYS_LOCATION = "1.3.6.1.2.1.1.6.0";
    /** @} */

    /** @name Interface table columns (IF-MIB)
     *  @{ */
    constexpr const char* IF_DESCR = "1.3.6.1.2.1.2.2.1.2";
    constexpr const char* IF_SPEED = "1.3.6.1.2.1.2.2.1.5";
    constexpr const char* IF_PHYS_ADDRESS = "1.3.6.1.2.1.2.2.1.6";
    constexpr const char* IF_ADMIN_STATUS = "1.3.6.1.2.1.2.2.1.7";
    constexpr const char* IF_OPER_STATUS = "1.3.6.1.2.1.2.2.1.8";
    constexpr const char* IF_IN_OCTETS = "1.3.6.1.2.1.2.2.1.10";
    constexpr const char* IF_IN_ERRORS = "1.3.6.1.2.1.2.2.1.14";
    constexpr const char* IF_OUT_OCTETS = "1.3.6.1.2.1.2.2.1.16";
    constexpr const char* IF_OUT_ERRORS = "1.3.6.1.2.1.2.2.1.20";
    /** @} */

    constexpr const char* IP_AD_ENT_IF_INDEX = "1.3.6.1.2.1.4.20.1.2"; ///< ipAddrTable ifIndex column
    constexpr const char* HR_PROCESSOR_LOAD = "1.3.6.1.2.1.25.3.3.1.2"; ///< hrProcessorLoad column
    constexpr const char* DOT1Q_PVID = "1.3.6.1.2.1.17.7.1.4.5.1.1";   ///< Q-BRIDGE port VLAN id
    constexpr const char* VTP_VLAN_STATE = "1.3.6.1.4.1.9.9.46.1.3.1.1.2"; ///< CISCO-VTP-MIB vtpVlanState

    /** @name CISCO-CDP-MIB cdpCacheEntry columns
     *  @{ */
    constexpr const char* CDP_CACHE_ENTRY = "1.3.6.1.4.1.9.9.23.1.2.1.1";
    constexpr const char* CDP_CACHE_ADDRESS = "1.3.6.1.4.1.9.9.23.1.2.1.1.4";
    constexpr const char* CDP_CACHE_DEVICE_ID = "1.3.6.1.4.1.9.9.23.1.2.1.1.6";
    constexpr const char* CDP_CACHE_DEVICE_PORT = "1.3.6.1.4.1.9.9.23.1.2.1.1.7";
    constexpr const char* CDP_CACHE_PLATFORM = "1.3.6.1.4.1.9.9.23.1.2.1.1.8";
    /** @} */

    /** @name LLDP-MIB lldpRemEntry columns
     *  @{ */
    constexpr const char* LLDP_REM_ENTRY = "1.0.8802.1.1.2.1.4.1.1";
    constexpr const char* LLDP_REM_CHASSIS_ID_SUBTYPE = "1.0.8802.1.1.2.1.4.1.1.4";
    constexpr const char* LLDP_REM_CHASSIS_ID = "1.0.8802.1.1.2.1.4.1.1.5";
    constexpr const char* LLDP_REM_PORT_ID = "1.0.8802.1.1.2.1.4.1.1.7";
    constexpr const char* LLDP_REM_PORT_DESC = "1.0.8802.1.1.2.1.4.1.1.8";
    constexpr const char* LLDP_REM_SYS_NAME = "1.0.8802.1.1.2.1.4.1.1.9";
    constexpr const char* LLDP_REM_MAN_ADDR_IF_SUBTYPE = "1.0.8802.1.1.2.1.4.2.1.3";
    /** @} */

    constexpr const char* USM_STATS_PREFIX = "1.3.6.1.6.3.15.1.1"; ///< usmStats report counters
}

inline std::string snmpVersionToString(SnmpVersion version) {
    switch (version) {
        case SnmpVersion::V1: return "v1";
        case SnmpVersion::V2c: return "v2c";
        case SnmpVersion::V3: return "v3";
    }
    return "unknown";
}

/**
 * @brief Parses "v1"/"1", "v2c"/"2c"/"2" and "v3"/"3".
 * @return The matching version, V2c for anything else.
 */
inline SnmpVersion snmpVersionFromString(const std::string& str) {
    if (str == "v1" || str == "1") return SnmpVersion::V1;
    if (str == "v3" || str == "3") return SnmpVersion::V3;
    return SnmpVersion::V2c;
}

inline std::string snmpSecurityLevelToString(SnmpSecurityLevel level) {
    switch (level) {
        case SnmpSecurityLevel::NoAuthNoPriv: return "noAuthNoPriv";
        case SnmpSecurityLevel::AuthNoPriv: return "authNoPriv";
        case SnmpSecurityLevel::AuthPriv: return "authPriv";
    }
    return "noAuthNoPriv";
}

inline SnmpSecurityLevel snmpSecurityLevelFromString(const std::string& str) {
    if (str == "authNoPriv") return SnmpSecurityLevel::AuthNoPriv;
    if (str == "authPriv") return SnmpSecurityLevel::AuthPriv;
    return SnmpSecurityLevel::NoAuthNoPriv;
}

inline std::string snmpDataTypeToString(SnmpDataType type) {
    switch (type) {
        case SnmpDataType::Integer: return "INTEGER";
        case SnmpDataType::OctetString: return "OCTET STRING";
        case SnmpDataType::ObjectIdentifier: return "OBJECT IDENTIFIER";
        case SnmpDataType::IpAddress: return "IpAddress";
        case SnmpDataType::Counter32: return "Counter32";
        case SnmpDataType::Gauge32: return "Gauge32";
        case SnmpDataType::TimeTicks: return "TimeTicks";
        case SnmpDataType::Counter64: return "Counter64";
        case SnmpDataType::Null: return "Null";
        case SnmpDataType::NoSuchObject: return "noSuchObject";
        case SnmpDataType::NoSuchInstance: return "noSuchInstance";
        case SnmpDataType::EndOfMibView: return "endOfMibView";
        case SnmpDataType::Unknown: return "Unknown";
    }
    return "Unknown";
}

} // namespace vlanvision::core
