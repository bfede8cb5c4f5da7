#include <catch2/catch_test_macros.hpp>

#include "engine/AlertEvaluator.hpp"
#include "support/ProbeFixtures.hpp"

#include <algorithm>
#include <iterator>

using namespace vlanvision;
using core::AlertDeltaKind;
using core::AlertRule;
using core::AlertSeverity;
using engine::AlertEvaluator;

namespace {

using Clock = std::chrono::system_clock;

core::Device withReachability(core::Device device, core::Reachability reachability, int misses = 0) {
    device.reachability = reachability;
    device.consecutiveMisses = misses;
    return device;
}

size_t countKind(const std::vector<core::AlertDelta>& deltas, AlertDeltaKind kind) {
    return static_cast<size_t>(
        std::count_if(deltas.begin(), deltas.end(), [kind](const auto& d) { return d.kind == kind; }));
}

std::vector<core::AlertDelta> forRule(const std::vector<core::AlertDelta>& deltas, AlertRule rule) {
    std::vector<core::AlertDelta> result;
    std::copy_if(deltas.begin(), deltas.end(), std::back_inserter(result),
                 [rule](const auto& d) { return d.alert.rule == rule; });
    return result;
}

core::AlertThresholds withoutDegraded() {
    core::AlertThresholds thresholds;
    thresholds.degradedAlertsEnabled = false;
    return thresholds;
}

} // namespace

TEST_CASE("Unreachable alert lifecycle", "[AlertEvaluator]") {
    AlertEvaluator evaluator(withoutDegraded());
    auto up = test::makeDevice(1, "10.0.0.1", std::nullopt, "core-sw1");
    auto down = withReachability(up, core::Reachability::Down, 3);
    auto now = Clock::now();

    auto opened = evaluator.evaluate({down}, now);
    REQUIRE(opened.size() == 1);
    REQUIRE(opened[0].kind == AlertDeltaKind::Opened);
    REQUIRE(opened[0].alert.rule == AlertRule::DeviceUnreachable);
    REQUIRE(opened[0].alert.severity == AlertSeverity::Critical);
    REQUIRE(opened[0].alert.deviceId == 1);
    REQUIRE(opened[0].alert.isOpen());
    auto alertId = opened[0].alert.id;

    SECTION("Persisting violation refreshes the same alert") {
        auto refreshed = evaluator.evaluate({down}, now + std::chrono::seconds(60));
        REQUIRE(refreshed.size() == 1);
        REQUIRE(refreshed[0].kind == AlertDeltaKind::Refreshed);
        REQUIRE(refreshed[0].alert.id == alertId);
        REQUIRE(refreshed[0].alert.lastSeen == now + std::chrono::seconds(60));
        REQUIRE(evaluator.activeAlerts().size() == 1);
    }

    SECTION("Closes after the configured number of clean evaluations") {
        REQUIRE(evaluator.evaluate({up}, now + std::chrono::seconds(1)).empty());
        REQUIRE(evaluator.evaluate({up}, now + std::chrono::seconds(2)).empty());
        auto closed = evaluator.evaluate({up}, now + std::chrono::seconds(3));
        REQUIRE(closed.size() == 1);
        REQUIRE(closed[0].kind == AlertDeltaKind::Closed);
        REQUIRE(closed[0].alert.id == alertId);
        REQUIRE(closed[0].alert.resolvedAt == now + std::chrono::seconds(3));
        REQUIRE(evaluator.activeAlerts().empty());
        REQUIRE(evaluator.find(alertId)->resolvedAt.has_value());
    }

    SECTION("A flapping device keeps a single alert") {
        std::vector<core::AlertDelta> all;
        for (int i = 1; i <= 6; ++i) {
            auto& device = i % 2 == 0 ? down : up;
            auto deltas = evaluator.evaluate({device}, now + std::chrono::seconds(i));
            all.insert(all.end(), deltas.begin(), deltas.end());
        }
        REQUIRE(countKind(all, AlertDeltaKind::Opened) == 0);
        REQUIRE(countKind(all, AlertDeltaKind::Closed) == 0);
        REQUIRE(evaluator.activeAlerts().size() == 1);
        REQUIRE(evaluator.activeAlerts()[0].id == alertId);
    }

    SECTION("A new episode opens a new alert") {
        for (int i = 1; i <= 3; ++i) {
            evaluator.evaluate({up}, now + std::chrono::seconds(i));
        }
        auto again = evaluator.evaluate({down}, now + std::chrono::seconds(10));
        REQUIRE(again.size() == 1);
        REQUIRE(again[0].kind == AlertDeltaKind::Opened);
        REQUIRE(again[0].alert.id != alertId);
        REQUIRE(evaluator.history().size() == 2);
    }

    SECTION("Retired devices close their alerts") {
        auto retired = withReachability(up, core::Reachability::Retired);
        auto deltas = evaluator.evaluate({retired}, now + std::chrono::seconds(1));
        REQUIRE(deltas.size() == 1);
        REQUIRE(deltas[0].kind == AlertDeltaKind::Closed);
    }

    SECTION("Removed devices close their alerts") {
        auto deltas = evaluator.evaluate({}, now + std::chrono::seconds(1));
        REQUIRE(deltas.size() == 1);
        REQUIRE(deltas[0].kind == AlertDeltaKind::Closed);
    }
}

TEST_CASE("Degraded alerts", "[AlertEvaluator]") {
    auto device = test::makeDevice(2, "10.0.0.2");
    auto degraded = withReachability(device, core::Reachability::Degraded, 1);
    auto now = Clock::now();

    SECTION("Enabled by default") {
        AlertEvaluator evaluator;
        auto deltas = evaluator.evaluate({degraded}, now);
        REQUIRE(deltas.size() == 1);
        REQUIRE(deltas[0].alert.rule == AlertRule::DeviceDegraded);
        REQUIRE(deltas[0].alert.severity == AlertSeverity::Warning);
    }

    SECTION("Can be switched off") {
        AlertEvaluator evaluator(withoutDegraded());
        REQUIRE(evaluator.evaluate({degraded}, now).empty());
    }
}

TEST_CASE("CPU alerts escalate but never downgrade", "[AlertEvaluator]") {
    AlertEvaluator evaluator;
    auto device = test::makeDevice(3, "10.0.0.3");
    auto now = Clock::now();

    device.cpuPercent = 50.0;
    REQUIRE(evaluator.evaluate({device}, now).empty());

    device.cpuPercent = 75.0;
    auto opened = evaluator.evaluate({device}, now + std::chrono::seconds(1));
    REQUIRE(opened.size() == 1);
    REQUIRE(opened[0].alert.rule == AlertRule::HighCpu);
    REQUIRE(opened[0].alert.severity == AlertSeverity::Warning);

    device.cpuPercent = 95.0;
    auto escalated = evaluator.evaluate({device}, now + std::chrono::seconds(2));
    REQUIRE(escalated[0].kind == AlertDeltaKind::Refreshed);
    REQUIRE(escalated[0].alert.severity == AlertSeverity::Critical);

    device.cpuPercent = 72.0;
    auto still = evaluator.evaluate({device}, now + std::chrono::seconds(3));
    REQUIRE(still[0].alert.severity == AlertSeverity::Critical);
    REQUIRE(still[0].alert.message == "CPU load on 10.0.0.3 is 72%");
}

TEST_CASE("Metric rules are suspended while a device is down", "[AlertEvaluator]") {
    AlertEvaluator evaluator(withoutDegraded());
    auto device = test::makeDevice(4, "10.0.0.4");
    device.cpuPercent = 99.0;
    auto now = Clock::now();

    REQUIRE(forRule(evaluator.evaluate({device}, now), AlertRule::HighCpu).size() == 1);

    auto down = withReachability(device, core::Reachability::Down, 3);
    down.cpuPercent = 10.0;
    for (int i = 1; i <= 5; ++i) {
        auto deltas = evaluator.evaluate({down}, now + std::chrono::seconds(i));
        REQUIRE(forRule(deltas, AlertRule::HighCpu).empty());
    }
    REQUIRE(evaluator.activeAlerts().size() == 2);
}

TEST_CASE("Interface error rate", "[AlertEvaluator]") {
    AlertEvaluator evaluator;
    auto device = test::makeDevice(5, "10.0.0.5");
    core::Interface uplink;
    uplink.index = 49;
    uplink.name = "Gi1/0/49";
    device.interfaces = {uplink};
    auto now = Clock::now();

    // First sample only establishes a baseline
    REQUIRE(evaluator.evaluate({device}, now).empty());

    SECTION("Errors above the warning rate") {
        device.interfaces[0].inErrors = 50;
        auto deltas = evaluator.evaluate({device}, now + std::chrono::seconds(10));
        REQUIRE(deltas.size() == 1);
        REQUIRE(deltas[0].alert.rule == AlertRule::InterfaceErrorRate);
        REQUIRE(deltas[0].alert.severity == AlertSeverity::Warning);
        REQUIRE(deltas[0].alert.interfaceIndex == 49);
        REQUIRE(deltas[0].alert.interfaceName == "Gi1/0/49");
        REQUIRE(deltas[0].alert.message == "Interface Gi1/0/49 on 10.0.0.5 has 5.00 errors/s");
    }

    SECTION("Critical rate") {
        device.interfaces[0].outErrors = 200;
        auto deltas = evaluator.evaluate({device}, now + std::chrono::seconds(10));
        REQUIRE(deltas[0].alert.severity == AlertSeverity::Critical);
    }

    SECTION("Slow error growth stays quiet") {
        device.interfaces[0].inErrors = 5;
        REQUIRE(evaluator.evaluate({device}, now + std::chrono::seconds(10)).empty());
    }

    SECTION("Counter reset starts a new window") {
        device.interfaces[0].inErrors = 1000;
        REQUIRE(evaluator.evaluate({device}, now + std::chrono::seconds(10)).size() == 1);
        device.interfaces[0].inErrors = 0;
        auto deltas = evaluator.evaluate({device}, now + std::chrono::seconds(20));
        REQUIRE(deltas.empty());
    }
}

TEST_CASE("Interface utilization", "[AlertEvaluator]") {
    AlertEvaluator evaluator;
    auto device = test::makeDevice(6, "10.0.0.6");
    core::Interface busy;
    busy.index = 1;
    busy.name = "Te1/1/1";
    busy.utilizationPercent = 96.5;
    core::Interface quiet;
    quiet.index = 2;
    quiet.name = "Te1/1/2";
    quiet.utilizationPercent = 85.0;
    device.interfaces = {quiet, busy};

    auto deltas = evaluator.evaluate({device}, Clock::now());
    REQUIRE(deltas.size() == 1);
    REQUIRE(deltas[0].alert.rule == AlertRule::HighUtilization);
    REQUIRE(deltas[0].alert.severity == AlertSeverity::Critical);
    REQUIRE(deltas[0].alert.interfaceName == "Te1/1/1");
}

TEST_CASE("Alert deltas are ordered by device then rule", "[AlertEvaluator]") {
    AlertEvaluator evaluator;
    auto high = withReachability(test::makeDevice(9, "10.0.0.9"), core::Reachability::Down, 3);
    auto low = withReachability(test::makeDevice(3, "10.0.0.3"), core::Reachability::Degraded, 1);
    low.cpuPercent = 80.0;

    auto deltas = evaluator.evaluate({high, low}, Clock::now());
    REQUIRE(deltas.size() == 3);
    REQUIRE(deltas[0].alert.deviceId == 3);
    REQUIRE(deltas[0].alert.rule == AlertRule::DeviceDegraded);
    REQUIRE(deltas[1].alert.rule == AlertRule::HighCpu);
    REQUIRE(deltas[2].alert.deviceId == 9);
}

TEST_CASE("Acknowledgement, history and restore", "[AlertEvaluator]") {
    AlertEvaluator evaluator(withoutDegraded());
    auto now = Clock::now();
    auto a = withReachability(test::makeDevice(1, "10.0.0.1"), core::Reachability::Down, 3);
    auto b = withReachability(test::makeDevice(2, "10.0.0.2"), core::Reachability::Down, 3);
    evaluator.evaluate({a, b}, now);

    SECTION("Acknowledging keeps the alert open") {
        auto acked = evaluator.acknowledge(1);
        REQUIRE(acked->acknowledged);
        REQUIRE(acked->isOpen());
        REQUIRE(evaluator.find(1)->acknowledged);
        REQUIRE_FALSE(evaluator.acknowledge(99).has_value());
    }

    SECTION("History is newest first and limited") {
        auto history = evaluator.history(1);
        REQUIRE(history.size() == 1);
        REQUIRE(history[0].id == 2);
    }

    SECTION("Restore keeps open alerts and never reuses ids") {
        auto open = evaluator.activeAlerts();
        AlertEvaluator restarted(withoutDegraded());
        restarted.restore(open, 40);
        REQUIRE(restarted.activeAlerts().size() == 2);

        // Still violating: refreshed rather than reopened
        auto deltas = restarted.evaluate({a, b}, now + std::chrono::seconds(1));
        REQUIRE(countKind(deltas, AlertDeltaKind::Refreshed) == 2);

        auto c = withReachability(test::makeDevice(3, "10.0.0.3"), core::Reachability::Down, 3);
        auto opened = forRule(restarted.evaluate({a, b, c}, now + std::chrono::seconds(2)),
                              AlertRule::DeviceUnreachable);
        auto fresh = std::find_if(opened.begin(), opened.end(),
                                  [](const auto& d) { return d.kind == AlertDeltaKind::Opened; });
        REQUIRE(fresh != opened.end());
        REQUIRE(fresh->alert.id == 41);
    }
}
