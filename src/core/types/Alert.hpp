#pragma once

#include "core/types/Device.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace vlanvision::core {

enum class AlertRule : int {
    DeviceUnreachable = 0,
    DeviceDegraded = 1,
    HighCpu = 2,
    InterfaceErrorRate = 3,
    HighUtilization = 4
};

enum class AlertSeverity : int { Info = 0, Warning = 1, Critical = 2 };

struct Alert {
    int64_t id{0};
    DeviceId deviceId{0};
    std::optional<int32_t> interfaceIndex;
    std::string interfaceName;
    AlertRule rule{AlertRule::DeviceUnreachable};
    AlertSeverity severity{AlertSeverity::Info};
    std::string message;
    std::chrono::system_clock::time_point firstFired;
    std::chrono::system_clock::time_point lastSeen;
    std::optional<std::chrono::system_clock::time_point> resolvedAt;
    bool acknowledged{false};

    [[nodiscard]] bool isOpen() const { return !resolvedAt.has_value(); }

    [[nodiscard]] std::string ruleToString() const;
    [[nodiscard]] std::string severityToString() const;
    static AlertRule ruleFromString(const std::string& str);
    static AlertSeverity severityFromString(const std::string& str);

    bool operator==(const Alert& other) const = default;
};

enum class AlertDeltaKind : int { Opened = 0, Refreshed = 1, Closed = 2 };

/**
 * @brief Change to an alert produced by one evaluation pass.
 */
struct AlertDelta {
    AlertDeltaKind kind{AlertDeltaKind::Opened};
    Alert alert;

    [[nodiscard]] std::string kindToString() const;

    bool operator==(const AlertDelta& other) const = default;
};

struct AlertThresholds {
    int clearAfterEvaluations{3};
    double cpuWarningPercent{70.0};
    double cpuCriticalPercent{90.0};
    double errorRateWarningPerSecond{1.0};
    double errorRateCriticalPerSecond{10.0};
    int errorRateWindowSamples{5};
    double utilizationWarningPercent{80.0};
    double utilizationCriticalPercent{95.0};
    bool degradedAlertsEnabled{true};
};

} // namespace vlanvision::core
