#include <catch2/catch_test_macros.hpp>

#include "infrastructure/network/ArpProbe.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace vlanvision;
using infra::ArpProbe;

namespace {

const char* ARP_HEADER = "IP address       HW type     Flags       HW address            Mask     Device\n";

class TempArpTable {
public:
    explicit TempArpTable(const std::string& contents)
        : path_(std::filesystem::temp_directory_path() / "vlanvision_arp_test") {
        std::ofstream out(path_);
        out << contents;
    }

    ~TempArpTable() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    [[nodiscard]] std::string path() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

} // namespace

TEST_CASE("ARP table lookup", "[ArpProbe]") {
    std::istringstream table(std::string(ARP_HEADER) +
                             "10.0.0.1         0x1         0x2         aa:bb:cc:00:00:01     *        eth0\n"
                             "10.0.0.2         0x1         0x0         00:00:00:00:00:00     *        eth0\n"
                             "10.0.0.3         0x1         0x6         aa:bb:cc:00:00:03     *        eth0\n"
                             "garbage\n");

    SECTION("Complete entries resolve to a normalized MAC") {
        REQUIRE(ArpProbe::lookup(table, "10.0.0.1") == "AA:BB:CC:00:00:01");
    }

    SECTION("Incomplete entries are ignored") {
        REQUIRE_FALSE(ArpProbe::lookup(table, "10.0.0.2").has_value());
    }

    SECTION("Flags are a hex bit set") {
        REQUIRE(ArpProbe::lookup(table, "10.0.0.3") == "AA:BB:CC:00:00:03");
    }

    SECTION("Unknown address") {
        REQUIRE_FALSE(ArpProbe::lookup(table, "10.0.0.99").has_value());
    }

    SECTION("The header line is never an entry") {
        std::istringstream headerOnly(ARP_HEADER);
        REQUIRE_FALSE(ArpProbe::lookup(headerOnly, "IP").has_value());
        std::istringstream empty;
        REQUIRE_FALSE(ArpProbe::lookup(empty, "10.0.0.1").has_value());
    }
}

TEST_CASE("ArpProbe probing", "[ArpProbe]") {
    SECTION("Cached entry answers immediately") {
        TempArpTable table(std::string(ARP_HEADER) +
                           "127.0.0.1        0x1         0x2         00:11:22:33:44:55     *        lo\n");
        ArpProbe probe(table.path(), std::chrono::milliseconds(10));
        REQUIRE(probe.technique() == core::ProbeTechnique::Arp);

        auto outcome = probe.probe("127.0.0.1", std::chrono::milliseconds(200));
        REQUIRE(core::isSuccess(outcome));
        const auto& result = std::get<core::ProbeResult>(outcome);
        REQUIRE(result.technique == core::ProbeTechnique::Arp);
        REQUIRE(result.macAddress == "00:11:22:33:44:55");
        REQUIRE_FALSE(result.hostname.has_value());
    }

    SECTION("No entry before the timeout") {
        TempArpTable table(ARP_HEADER);
        ArpProbe probe(table.path(), std::chrono::milliseconds(10));

        auto outcome = probe.probe("127.0.0.1", std::chrono::milliseconds(100));
        REQUIRE_FALSE(core::isSuccess(outcome));
        REQUIRE(std::get<core::ProbeError>(outcome).kind == core::ProbeErrorKind::Timeout);
    }

    SECTION("Invalid address") {
        ArpProbe probe("/nonexistent/arp");
        auto outcome = probe.probe("10.0.0.300", std::chrono::milliseconds(100));
        REQUIRE(std::get<core::ProbeError>(outcome).kind == core::ProbeErrorKind::Unreachable);
    }
}
