#include "core/types/ProbeResult.hpp"

namespace vlanvision::core {

std::string ProbeError::kindToString() const {
    return probeErrorKindToString(kind);
}

std::string probeTechniqueToString(ProbeTechnique technique) {
    switch (technique) {
    case ProbeTechnique::Snmp:
        return "snmp";
    case ProbeTechnique::Arp:
        return "arp";
    case ProbeTechnique::Neighbor:
        return "neighbor";
    case ProbeTechnique::Icmp:
        return "icmp";
    }
    return "unknown";
}

std::optional<ProbeTechnique> probeTechniqueFromString(const std::string& str) {
    if (str == "snmp")
        return ProbeTechnique::Snmp;
    if (str == "arp")
        return ProbeTechnique::Arp;
    if (str == "neighbor" || str == "cdp" || str == "lldp")
        return ProbeTechnique::Neighbor;
    if (str == "icmp" || str == "ping")
        return ProbeTechnique::Icmp;
    return std::nullopt;
}

std::string probeErrorKindToString(ProbeErrorKind kind) {
    switch (kind) {
    case ProbeErrorKind::Unreachable:
        return "unreachable";
    case ProbeErrorKind::Timeout:
        return "timeout";
    case ProbeErrorKind::AuthFailure:
        return "auth_failure";
    case ProbeErrorKind::MalformedResponse:
        return "malformed_response";
    }
    return "unknown";
}

} // namespace vlanvision::core
