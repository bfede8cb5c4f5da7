#include <catch2/catch_test_macros.hpp>

#include "core/types/Alert.hpp"

using namespace vlanvision::core;

TEST_CASE("Alert rule string conversion", "[Alert]") {
    SECTION("ruleToString") {
        Alert alert;

        alert.rule = AlertRule::DeviceUnreachable;
        REQUIRE(alert.ruleToString() == "device_unreachable");

        alert.rule = AlertRule::DeviceDegraded;
        REQUIRE(alert.ruleToString() == "device_degraded");

        alert.rule = AlertRule::HighCpu;
        REQUIRE(alert.ruleToString() == "high_cpu");

        alert.rule = AlertRule::InterfaceErrorRate;
        REQUIRE(alert.ruleToString() == "interface_error_rate");

        alert.rule = AlertRule::HighUtilization;
        REQUIRE(alert.ruleToString() == "high_utilization");
    }

    SECTION("ruleFromString") {
        REQUIRE(Alert::ruleFromString("high_cpu") == AlertRule::HighCpu);
        REQUIRE(Alert::ruleFromString("interface_error_rate") == AlertRule::InterfaceErrorRate);
        REQUIRE(Alert::ruleFromString("Invalid") == AlertRule::DeviceUnreachable);
    }
}

TEST_CASE("Alert severity string conversion", "[Alert]") {
    Alert alert;
    alert.severity = AlertSeverity::Critical;
    REQUIRE(alert.severityToString() == "critical");

    REQUIRE(Alert::severityFromString("warning") == AlertSeverity::Warning);
    REQUIRE(Alert::severityFromString("critical") == AlertSeverity::Critical);
    REQUIRE(Alert::severityFromString("Invalid") == AlertSeverity::Info);
}

TEST_CASE("Alert open state", "[Alert]") {
    Alert alert;
    REQUIRE(alert.isOpen());

    alert.resolvedAt = std::chrono::system_clock::now();
    REQUIRE_FALSE(alert.isOpen());
}

TEST_CASE("Alert delta kind", "[Alert]") {
    AlertDelta delta;
    REQUIRE(delta.kindToString() == "opened");
    delta.kind = AlertDeltaKind::Refreshed;
    REQUIRE(delta.kindToString() == "refreshed");
    delta.kind = AlertDeltaKind::Closed;
    REQUIRE(delta.kindToString() == "closed");
}

TEST_CASE("Default alert thresholds", "[Alert]") {
    AlertThresholds thresholds;
    REQUIRE(thresholds.clearAfterEvaluations == 3);
    REQUIRE(thresholds.cpuWarningPercent < thresholds.cpuCriticalPercent);
    REQUIRE(thresholds.utilizationWarningPercent < thresholds.utilizationCriticalPercent);
    REQUIRE(thresholds.degradedAlertsEnabled);
}
