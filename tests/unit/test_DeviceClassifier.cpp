#include <catch2/catch_test_macros.hpp>

#include "core/types/DeviceClassifier.hpp"

using namespace vlanvision::core;

TEST_CASE("DeviceClassifier device classes", "[DeviceClassifier]") {
    SECTION("Switches") {
        auto result = DeviceClassifier::classify(
            "Cisco IOS Software, Catalyst 4500 L3 Switch Software (cat4500e-UNIVERSALK9-M)", "", "");
        REQUIRE(result.deviceClass == DeviceClass::Switch);
        REQUIRE(result.vendor == "Cisco");

        REQUIRE(DeviceClassifier::classify("Juniper Networks, Inc. ex4300-48t Ethernet Switch", "", "").deviceClass ==
                DeviceClass::Switch);
        REQUIRE(DeviceClassifier::classify("Arista Networks EOS version 4.28", "", "").deviceClass ==
                DeviceClass::Switch);
    }

    SECTION("Routers") {
        REQUIRE(DeviceClassifier::classify("Cisco IOS XR Software, Version 7.3.2", "", "").deviceClass ==
                DeviceClass::Router);
        REQUIRE(DeviceClassifier::classify("Juniper Networks, Inc. mx204 internet router, kernel JUNOS 21.2", "",
                                           "")
                    .deviceClass == DeviceClass::Router);
        REQUIRE(DeviceClassifier::classify("RouterOS CCR1036-8G-2S+", "", "").vendor == "MikroTik");
    }

    SECTION("Firewalls take precedence over routers") {
        REQUIRE(DeviceClassifier::classify("Cisco Adaptive Security Appliance Version 9.8", "", "").deviceClass ==
                DeviceClass::Firewall);
        REQUIRE(DeviceClassifier::classify("Juniper srx300 router, kernel JUNOS 19.4", "", "").deviceClass ==
                DeviceClass::Firewall);
        REQUIRE(DeviceClassifier::classify("", "1.3.6.1.4.1.12356.101.1.3004", "").deviceClass ==
                DeviceClass::Firewall);
    }

    SECTION("Access points and servers") {
        REQUIRE(DeviceClassifier::classify("Cisco AIRONET 2800 Series", "", "").deviceClass ==
                DeviceClass::AccessPoint);
        REQUIRE(DeviceClassifier::classify("Linux web01 5.15.0-91-generic #101-Ubuntu SMP x86_64", "", "")
                    .deviceClass == DeviceClass::Server);
    }

    SECTION("Hostname conventions when sysDescr is silent") {
        REQUIRE(DeviceClassifier::classify("", "", "bld2-sw-03").deviceClass == DeviceClass::Switch);
        REQUIRE(DeviceClassifier::classify("", "", "dc1-fw1").deviceClass == DeviceClass::Firewall);
        REQUIRE(DeviceClassifier::classify("", "", "branch-rtr").deviceClass == DeviceClass::Router);
    }

    SECTION("Unrecognized input stays unknown") {
        auto result = DeviceClassifier::classify("Acme Widget OS 1.0", "1.3.6.1.4.1.99999.1", "printer-lobby");
        REQUIRE(result.deviceClass == DeviceClass::Unknown);
        REQUIRE(result.vendor.empty());
    }
}

TEST_CASE("DeviceClassifier vendor detection", "[DeviceClassifier]") {
    REQUIRE(DeviceClassifier::detectVendor("", "1.3.6.1.4.1.9.1.1208") == "Cisco");
    REQUIRE(DeviceClassifier::detectVendor("", ".1.3.6.1.4.1.2636.1.1.1.2.29") == "Juniper");
    REQUIRE(DeviceClassifier::detectVendor("ProCurve J9280A Switch 2510G-48", "") == "HP");
    REQUIRE(DeviceClassifier::detectVendor("", "1.3.6.1.2.1.1").empty());
}

TEST_CASE("DeviceClassifier roles", "[DeviceClassifier]") {
    REQUIRE(DeviceClassifier::roleFor("core-sw1", DeviceClass::Switch) == DeviceRole::Core);
    REQUIRE(DeviceClassifier::roleFor("dist-sw2", DeviceClass::Switch) == DeviceRole::Distribution);
    REQUIRE(DeviceClassifier::roleFor("acc-sw-floor3", DeviceClass::Switch) == DeviceRole::Access);
    REQUIRE(DeviceClassifier::roleFor("wan-gw", DeviceClass::Router) == DeviceRole::Edge);
    REQUIRE(DeviceClassifier::roleFor("", DeviceClass::Router) == DeviceRole::Edge);
    REQUIRE(DeviceClassifier::roleFor("", DeviceClass::Switch) == DeviceRole::Access);
    REQUIRE(DeviceClassifier::roleFor("db01", DeviceClass::Server) == DeviceRole::Server);
    REQUIRE(DeviceClassifier::roleFor("laptop-42", DeviceClass::Unknown) == DeviceRole::Endpoint);
}
