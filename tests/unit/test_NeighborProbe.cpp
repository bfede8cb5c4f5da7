#include <catch2/catch_test_macros.hpp>

#include "infrastructure/network/NeighborProbe.hpp"
#include "support/ProbeFixtures.hpp"

#include <algorithm>

using namespace vlanvision;
using infra::NeighborProbe;
using test::integerVarBind;
using test::octetVarBind;

namespace {

std::string cdp(uint32_t column, const std::string& index) {
    return std::string(core::SnmpOids::CDP_CACHE_ENTRY) + "." + std::to_string(column) + "." + index;
}

std::string lldp(uint32_t column, const std::string& index) {
    return std::string(core::SnmpOids::LLDP_REM_ENTRY) + "." + std::to_string(column) + "." + index;
}

const core::LinkNeighbor* byDeviceId(const std::vector<core::LinkNeighbor>& neighbors, const std::string& id) {
    auto it = std::find_if(neighbors.begin(), neighbors.end(),
                           [&](const core::LinkNeighbor& n) { return n.remoteDeviceId == id; });
    return it != neighbors.end() ? &*it : nullptr;
}

std::vector<core::SnmpVarBind> cdpRows() {
    return {
        octetVarBind(cdp(4, "10.1"), std::string{'\x0a', '\x00', '\x00', '\x02'}),
        octetVarBind(cdp(6, "10.1"), "dist-sw1"),
        octetVarBind(cdp(7, "10.1"), "GigabitEthernet0/1"),
        octetVarBind(cdp(8, "10.1"), "cisco WS-C3850-48P"),
        octetVarBind(cdp(8, "12.3"), "cisco AIR-AP2802I"),
    };
}

} // namespace

TEST_CASE("CDP cache parsing", "[NeighborProbe]") {
    SECTION("Columns are joined per cache entry") {
        auto neighbors = NeighborProbe::parseCdpCache(cdpRows(), {{10, "Gi1/0/48"}});

        REQUIRE(neighbors.size() == 1);
        const auto& n = neighbors.front();
        REQUIRE(n.protocol == core::NeighborProtocol::Cdp);
        REQUIRE(n.localPort == "Gi1/0/48");
        REQUIRE(n.remoteDeviceId == "dist-sw1");
        REQUIRE(n.remotePort == "GigabitEthernet0/1");
        REQUIRE(n.remoteAddress == "10.0.0.2");
        REQUIRE(n.remotePlatform == "cisco WS-C3850-48P");
    }

    SECTION("Local port falls back to the ifIndex") {
        auto neighbors = NeighborProbe::parseCdpCache(cdpRows());
        REQUIRE(neighbors.front().localPort == "ifIndex 10");
    }

    SECTION("Rows outside the cache entry are ignored") {
        auto neighbors = NeighborProbe::parseCdpCache({octetVarBind(core::SnmpOids::SYS_NAME, "sw")});
        REQUIRE(neighbors.empty());
    }
}

TEST_CASE("LLDP remote table parsing", "[NeighborProbe]") {
    std::string chassisMac{'\x00', '\x1c', '\x73', '\x01', '\x02', '\x03'};
    std::string portMac{'\x00', '\x1c', '\x73', '\x0a', '\x0b', '\x0c'};

    std::vector<core::SnmpVarBind> rows = {
        // Named neighbor on local port 5
        integerVarBind(lldp(4, "0.5.1"), 4),
        octetVarBind(lldp(5, "0.5.1"), chassisMac),
        octetVarBind(lldp(7, "0.5.1"), "Ethernet1"),
        octetVarBind(lldp(9, "0.5.1"), "arista-leaf1"),
        // Anonymous neighbor on local port 6 with a MAC port id
        integerVarBind(lldp(4, "0.6.2"), 4),
        octetVarBind(lldp(5, "0.6.2"), std::string{'\x00', '\x50', '\x56', '\x11', '\x22', '\x33'}),
        octetVarBind(lldp(7, "0.6.2"), portMac),
        octetVarBind(lldp(8, "0.6.2"), "uplink to core"),
        // Chassis id carrying an IPv4 network address
        integerVarBind(lldp(4, "0.7.3"), 5),
        octetVarBind(lldp(5, "0.7.3"), std::string{'\x01', '\x0a', '\x00', '\x00', '\x07'}),
    };

    std::vector<core::SnmpVarBind> manAddr = {
        integerVarBind(std::string(core::SnmpOids::LLDP_REM_MAN_ADDR_IF_SUBTYPE) + ".0.5.1.1.4.10.0.0.9", 2),
    };

    auto neighbors = NeighborProbe::parseLldpRemote(rows, manAddr, {{6, "Te1/1/1"}});
    REQUIRE(neighbors.size() == 3);

    SECTION("System name, MAC chassis and management address") {
        const auto* leaf = byDeviceId(neighbors, "arista-leaf1");
        REQUIRE(leaf != nullptr);
        REQUIRE(leaf->protocol == core::NeighborProtocol::Lldp);
        REQUIRE(leaf->localPort == "ifIndex 5");
        REQUIRE(leaf->remotePort == "Ethernet1");
        REQUIRE(leaf->remoteChassisMac == "00:1C:73:01:02:03");
        REQUIRE(leaf->remoteAddress == "10.0.0.9");
    }

    SECTION("Chassis MAC identifies an unnamed neighbor") {
        const auto* anon = byDeviceId(neighbors, "00:50:56:11:22:33");
        REQUIRE(anon != nullptr);
        REQUIRE(anon->localPort == "Te1/1/1");
        REQUIRE(anon->remotePort == "uplink to core");
        REQUIRE(anon->remoteAddress.empty());
    }

    SECTION("Network-address chassis id yields the remote address") {
        auto it = std::find_if(neighbors.begin(), neighbors.end(),
                               [](const core::LinkNeighbor& n) { return n.localPort == "ifIndex 7"; });
        REQUIRE(it != neighbors.end());
        REQUIRE(it->remoteAddress == "10.0.0.7");
        REQUIRE(it->remoteChassisMac.empty());
    }
}

TEST_CASE("NeighborProbe over SNMP", "[NeighborProbe]") {
    auto client = std::make_shared<test::CannedSnmpClient>();
    NeighborProbe probe(client);
    REQUIRE(probe.technique() == core::ProbeTechnique::Neighbor);

    SECTION("Combines CDP and LLDP neighbors") {
        client->tables[core::SnmpOids::CDP_CACHE_ENTRY] = cdpRows();
        client->tables[core::SnmpOids::LLDP_REM_ENTRY] = {
            octetVarBind(lldp(9, "0.3.1"), "leaf2"),
            octetVarBind(lldp(7, "0.3.1"), "Ethernet49"),
        };

        auto outcome = probe.probe("10.0.0.1", std::chrono::milliseconds(500));
        REQUIRE(core::isSuccess(outcome));
        const auto& result = std::get<core::ProbeResult>(outcome);
        REQUIRE(result.technique == core::ProbeTechnique::Neighbor);
        REQUIRE(result.neighbors.has_value());
        REQUIRE(result.neighbors->size() == 2);
        REQUIRE_FALSE(result.macAddress.has_value());

        auto walked = client->walkedRoots();
        REQUIRE(std::find(walked.begin(), walked.end(), core::SnmpOids::LLDP_REM_MAN_ADDR_IF_SUBTYPE) !=
                walked.end());
    }

    SECTION("Agent without neighbor MIBs reports no neighbors") {
        auto outcome = probe.probe("10.0.0.1", std::chrono::milliseconds(500));
        REQUIRE(core::isSuccess(outcome));
        REQUIRE(std::get<core::ProbeResult>(outcome).neighbors->empty());
    }

    SECTION("Transport failures become probe errors") {
        client->failure = core::SnmpErrorKind::Timeout;
        auto outcome = probe.probe("10.0.0.1", std::chrono::milliseconds(500));
        REQUIRE_FALSE(core::isSuccess(outcome));
        REQUIRE(std::get<core::ProbeError>(outcome).kind == core::ProbeErrorKind::Timeout);
    }
}
