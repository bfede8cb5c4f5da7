#include <catch2/catch_test_macros.hpp>

#include "engine/TopologyBuilder.hpp"
#include "infrastructure/api/ApiJson.hpp"
#include "support/ProbeFixtures.hpp"

using namespace vlanvision;
using json = nlohmann::json;

TEST_CASE("Device JSON", "[ApiJson]") {
    auto device = test::makeDevice(3, "10.0.10.3", 10, "acc-sw3");
    device.deviceClass = core::DeviceClass::Switch;
    device.firstSeen = std::chrono::system_clock::from_time_t(1700000000);
    device.lastSeen = std::chrono::system_clock::from_time_t(1700000300);

    SECTION("Summary fields") {
        auto j = infra::api::deviceSummaryToJson(device);
        REQUIRE(j["id"] == 3);
        REQUIRE(j["hostname"] == "acc-sw3");
        REQUIRE(j["ip_address"] == "10.0.10.3");
        REQUIRE(j["mac_address"].is_null());
        REQUIRE(j["device_type"] == "switch");
        REQUIRE(j["vlan_id"] == 10);
        REQUIRE(j["status"] == "up");
        REQUIRE_FALSE(j.contains("interfaces"));
    }

    SECTION("Detail adds owned collections and timestamps") {
        device.macAddress = "AA:BB:CC:00:00:03";
        core::Interface iface;
        iface.index = 1;
        iface.name = "Gi1/0/1";
        iface.operStatus = core::InterfaceStatus::Up;
        device.interfaces.push_back(iface);
        device.ipHistory.push_back({"10.0.10.99", device.firstSeen});

        auto j = infra::api::deviceToJson(device);
        REQUIRE(j["mac_address"] == "AA:BB:CC:00:00:03");
        REQUIRE(j["first_seen"] == 1700000000);
        REQUIRE(j["last_seen"] == 1700000300);
        REQUIRE(j["interfaces"].size() == 1);
        REQUIRE(j["interfaces"][0]["oper_status"] == "up");
        REQUIRE(j["interfaces"][0]["utilization_percent"].is_null());
        REQUIRE(j["neighbors"].is_array());
        REQUIRE(j["ip_history"][0]["ip_address"] == "10.0.10.99");
        REQUIRE(j["cpu_percent"].is_null());
    }

    SECTION("Device without VLAN") {
        device.vlanId.reset();
        REQUIRE(infra::api::deviceSummaryToJson(device)["vlan_id"].is_null());
    }
}

TEST_CASE("Job JSON", "[ApiJson]") {
    core::DiscoveryJob job;
    job.id = 12;
    job.range = "10.0.0.0/30";
    job.techniques = {core::ProbeTechnique::Snmp, core::ProbeTechnique::Arp};
    job.state = core::JobState::Completed;
    job.createdAt = std::chrono::system_clock::from_time_t(1700000000);
    job.outcomes = {{"10.0.0.1", core::TargetOutcome::Success},
                    {"10.0.0.2", core::TargetOutcome::Timeout},
                    {"10.0.0.3", core::TargetOutcome::Timeout}};

    auto j = infra::api::jobToJson(job, false);
    REQUIRE(j["job_id"] == 12);
    REQUIRE(j["status"] == "completed");
    REQUIRE(j["origin"] == "on-demand");
    REQUIRE(j["techniques"] == json::array({"snmp", "arp"}));
    REQUIRE(j["started_at"].is_null());
    REQUIRE(j["summary"]["success"] == 1);
    REQUIRE(j["summary"]["timeout"] == 2);
    REQUIRE(j["summary"]["skipped"] == 0);
    REQUIRE_FALSE(j.contains("outcomes"));
    REQUIRE_FALSE(j.contains("error"));

    SECTION("Outcome map on request") {
        auto detail = infra::api::jobToJson(job, true);
        REQUIRE(detail["outcomes"]["10.0.0.2"] == "timeout");
    }

    SECTION("Failure message") {
        job.state = core::JobState::Failed;
        job.errorMessage = "worker stopped";
        REQUIRE(infra::api::jobToJson(job, false)["error"] == "worker stopped");
    }
}

TEST_CASE("Alert JSON", "[ApiJson]") {
    core::Alert alert;
    alert.id = 5;
    alert.deviceId = 2;
    alert.rule = core::AlertRule::InterfaceErrorRate;
    alert.severity = core::AlertSeverity::Critical;
    alert.interfaceIndex = 49;
    alert.interfaceName = "Gi1/0/49";

    auto j = infra::api::alertToJson(alert);
    REQUIRE(j["rule"] == "interface_error_rate");
    REQUIRE(j["severity"] == "critical");
    REQUIRE(j["interface_index"] == 49);
    REQUIRE(j["open"] == true);
    REQUIRE(j["resolved_at"].is_null());
}

TEST_CASE("Topology JSON", "[ApiJson]") {
    auto graph = engine::TopologyBuilder::rebuild(
        {test::makeDevice(1, "10.0.10.1", 10, "core-sw1"), test::makeDevice(2, "10.0.10.2", 10)});

    auto j = infra::api::topologyToJson(graph);
    REQUIRE(j["nodes"].size() == 2);
    REQUIRE(j["nodes"][0]["label"] == "core-sw1");
    REQUIRE(j["edges"].size() == 1);
    REQUIRE(j["edges"][0]["source"] == 1);
    REQUIRE(j["edges"][0]["target"] == 2);
    REQUIRE(j["edges"][0]["kind"] == "same-vlan");
    REQUIRE(j["edges"][0]["confidence"] == "low");

    auto analysis = infra::api::analysisToJson(engine::TopologyBuilder::analyze(graph));
    REQUIRE(analysis["node_count"] == 2);
    REQUIRE(analysis["component_count"] == 1);
    REQUIRE(analysis["devices_by_vlan"]["10"] == 2);
}

TEST_CASE("VLAN group JSON", "[ApiJson]") {
    core::VlanGroup group;
    group.vlanId = 20;
    group.members = {4, 7};

    auto j = infra::api::vlanGroupsToJson({group});
    REQUIRE(j["count"] == 1);
    REQUIRE(j["vlans"][0]["vlan_id"] == 20);
    REQUIRE(j["vlans"][0]["device_ids"] == json::array({4, 7}));
    REQUIRE(j["vlans"][0]["device_count"] == 2);
}

TEST_CASE("Technique parsing", "[ApiJson]") {
    REQUIRE(infra::api::techniquesFromJson(json::array({"snmp", "icmp"})) ==
            std::vector<core::ProbeTechnique>{core::ProbeTechnique::Snmp, core::ProbeTechnique::Icmp});
    REQUIRE(infra::api::techniquesFromJson(json::array()).empty());
    REQUIRE_THROWS_AS(infra::api::techniquesFromJson(json::array({"telnet"})), std::invalid_argument);
    REQUIRE_THROWS_AS(infra::api::techniquesFromJson(json::array({1})), std::invalid_argument);
    REQUIRE_THROWS_AS(infra::api::techniquesFromJson(json("snmp")), std::invalid_argument);
}
