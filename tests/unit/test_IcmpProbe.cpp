#include <catch2/catch_test_macros.hpp>

#include "infrastructure/network/IcmpProbe.hpp"

using namespace vlanvision;
using infra::IcmpProbe;

TEST_CASE("ICMP checksum", "[IcmpProbe]") {
    SECTION("RFC 1071 sample") {
        const uint8_t data[] = {0x00, 0x01, 0xF2, 0x03, 0xF4, 0xF5, 0xF6, 0xF7};
        REQUIRE(IcmpProbe::calculateChecksum(data, sizeof(data)) == 0x220D);
    }

    SECTION("Odd length pads with zero") {
        const uint8_t data[] = {0x01, 0x02, 0x03};
        REQUIRE(IcmpProbe::calculateChecksum(data, sizeof(data)) == static_cast<uint16_t>(~0x0402));
    }
}

TEST_CASE("ICMP echo request", "[IcmpProbe]") {
    auto packet = IcmpProbe::buildEchoRequest(0x1234, 7);

    REQUIRE(packet.size() >= 8);
    REQUIRE(packet[0] == 8);
    REQUIRE(packet[1] == 0);
    REQUIRE(packet[4] == 0x12);
    REQUIRE(packet[5] == 0x34);
    REQUIRE(packet[6] == 0x00);
    REQUIRE(packet[7] == 0x07);

    // A packet carrying its own checksum sums to zero
    REQUIRE(IcmpProbe::calculateChecksum(packet.data(), packet.size()) == 0);
}

TEST_CASE("IcmpProbe rejects invalid addresses", "[IcmpProbe]") {
    IcmpProbe probe;
    REQUIRE(probe.technique() == core::ProbeTechnique::Icmp);

    auto outcome = probe.probe("not-an-address", std::chrono::milliseconds(100));
    REQUIRE_FALSE(core::isSuccess(outcome));
    REQUIRE(std::get<core::ProbeError>(outcome).kind == core::ProbeErrorKind::Unreachable);
}
