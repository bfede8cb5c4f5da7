/**
 * @file ProbeResult.hpp
 * @brief Outcome types produced by a single probe against one address.
 */

#pragma once

#include "core/types/Device.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace vlanvision::core {

/**
 * @brief Discovery techniques a probe can implement.
 */
enum class ProbeTechnique : int {
    Snmp = 0,     ///< SNMP system, interface and VLAN walk
    Arp = 1,      ///< ARP resolution (MAC only)
    Neighbor = 2, ///< CDP/LLDP neighbor tables
    Icmp = 3      ///< ICMP echo reachability
};

enum class ProbeErrorKind : int {
    Unreachable = 0,      ///< Target actively unreachable (ICMP error, resolve failure)
    Timeout = 1,          ///< No answer within the timeout
    AuthFailure = 2,      ///< Target rejected the credentials
    MalformedResponse = 3 ///< Target answered with data that cannot be parsed
};

struct ProbeError {
    ProbeErrorKind kind{ProbeErrorKind::Timeout};
    std::string message;
    std::string payloadContext; ///< Hex excerpt of the offending payload, if any

    /// Timeouts and unreachable targets count toward the miss threshold.
    [[nodiscard]] bool countsAsMiss() const {
        return kind == ProbeErrorKind::Unreachable || kind == ProbeErrorKind::Timeout;
    }

    [[nodiscard]] std::string kindToString() const;

    bool operator==(const ProbeError& other) const = default;
};

/**
 * @brief Attributes observed by a successful probe.
 *
 * Every attribute is optional: each technique fills in only what it can see.
 */
struct ProbeResult {
    std::string address;
    ProbeTechnique technique{ProbeTechnique::Snmp};
    std::chrono::system_clock::time_point observedAt;

    std::optional<std::string> macAddress;
    std::optional<std::string> hostname;
    std::optional<std::string> sysDescr;
    std::optional<std::string> sysObjectId;
    std::optional<std::string> location;
    std::optional<std::string> vendor;
    std::optional<DeviceClass> deviceClass;
    std::optional<int> vlanId;
    std::optional<double> cpuPercent;
    std::optional<uint64_t> uptimeTicks;
    std::optional<std::vector<Interface>> interfaces;
    std::optional<std::vector<LinkNeighbor>> neighbors;
    std::optional<std::chrono::microseconds> latency;

    bool operator==(const ProbeResult& other) const = default;
};

using ProbeOutcome = std::variant<ProbeResult, ProbeError>;

inline bool isSuccess(const ProbeOutcome& outcome) {
    return std::holds_alternative<ProbeResult>(outcome);
}

std::string probeTechniqueToString(ProbeTechnique technique);
std::optional<ProbeTechnique> probeTechniqueFromString(const std::string& str);

std::string probeErrorKindToString(ProbeErrorKind kind);

} // namespace vlanvision::core
