#include "core/types/Alert.hpp"

namespace vlanvision::core {

std::string Alert::ruleToString() const {
    switch (rule) {
    case AlertRule::DeviceUnreachable:
        return "device_unreachable";
    case AlertRule::DeviceDegraded:
        return "device_degraded";
    case AlertRule::HighCpu:
        return "high_cpu";
    case AlertRule::InterfaceErrorRate:
        return "interface_error_rate";
    case AlertRule::HighUtilization:
        return "high_utilization";
    }
    return "unknown";
}

std::string Alert::severityToString() const {
    switch (severity) {
    case AlertSeverity::Info:
        return "info";
    case AlertSeverity::Warning:
        return "warning";
    case AlertSeverity::Critical:
        return "critical";
    }
    return "unknown";
}

AlertRule Alert::ruleFromString(const std::string& str) {
    if (str == "device_degraded")
        return AlertRule::DeviceDegraded;
    if (str == "high_cpu")
        return AlertRule::HighCpu;
    if (str == "interface_error_rate")
        return AlertRule::InterfaceErrorRate;
    if (str == "high_utilization")
        return AlertRule::HighUtilization;
    return AlertRule::DeviceUnreachable;
}

AlertSeverity Alert::severityFromString(const std::string& str) {
    if (str == "warning")
        return AlertSeverity::Warning;
    if (str == "critical")
        return AlertSeverity::Critical;
    return AlertSeverity::Info;
}

std::string AlertDelta::kindToString() const {
    switch (kind) {
    case AlertDeltaKind::Opened:
        return "opened";
    case AlertDeltaKind::Refreshed:
        return "refreshed";
    case AlertDeltaKind::Closed:
        return "closed";
    }
    return "unknown";
}

} // namespace vlanvision::core
