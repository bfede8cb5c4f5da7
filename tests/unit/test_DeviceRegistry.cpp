#include <catch2/catch_test_macros.hpp>

#include <set>
#include <thread>

#include "engine/DeviceRegistry.hpp"
#include "support/ProbeFixtures.hpp"

using namespace vlanvision;
using core::Reachability;
using test::snmpResult;

namespace {

core::Interface interfaceSample(int32_t index, uint64_t inOctets, uint64_t outOctets) {
    core::Interface iface;
    iface.index = index;
    iface.name = "Gi1/0/" + std::to_string(index);
    iface.speedBps = 1000000;
    iface.inOctets = inOctets;
    iface.outOctets = outOctets;
    return iface;
}

} // namespace

TEST_CASE("Reconciliation keeps one record per MAC", "[DeviceRegistry]") {
    engine::DeviceRegistry registry;

    auto first = registry.reconcile(snmpResult("10.0.0.5", "aa:bb:cc:00:00:01", 10, "sw1"));
    REQUIRE(first.id == 1);
    REQUIRE(first.macAddress == "AA:BB:CC:00:00:01");
    REQUIRE(first.reachability == Reachability::Up);

    SECTION("Same MAC in another notation updates the record") {
        auto again = registry.reconcile(snmpResult("10.0.0.5", "aabb.cc00.0001"));
        REQUIRE(again.id == first.id);
        REQUIRE(registry.snapshot().size() == 1);
        REQUIRE(again.hostname == "sw1");
        REQUIRE(again.vlanId == 10);
    }

    SECTION("Address change is tracked in the history") {
        auto moved = registry.reconcile(snmpResult("10.0.0.99", "AA:BB:CC:00:00:01"));
        REQUIRE(moved.id == first.id);
        REQUIRE(moved.ipAddress == "10.0.0.99");
        REQUIRE(moved.ipHistory.size() == 1);
        REQUIRE(moved.ipHistory.front().address == "10.0.0.5");
        REQUIRE_FALSE(registry.findByIp("10.0.0.5").has_value());
        REQUIRE(registry.findByIp("10.0.0.99")->id == first.id);
    }

    SECTION("Result without MAC matches by address") {
        auto byIp = registry.reconcile(snmpResult("10.0.0.5", std::nullopt, std::nullopt, "sw1-renamed"));
        REQUIRE(byIp.id == first.id);
        REQUIRE(byIp.hostname == "sw1-renamed");
        REQUIRE(byIp.macAddress == "AA:BB:CC:00:00:01");
    }

    SECTION("Different MAC on the same address is a different device") {
        auto other = registry.reconcile(snmpResult("10.0.0.5", "aa:bb:cc:00:00:02"));
        REQUIRE(other.id != first.id);
        REQUIRE(registry.activeCount() == 2);

        auto displaced = registry.find(first.id);
        REQUIRE(displaced->ipAddress.empty());
        REQUIRE(displaced->ipHistory.back().address == "10.0.0.5");
        REQUIRE(displaced->reachability == Reachability::Unknown);
        REQUIRE(registry.findByIp("10.0.0.5")->id == other.id);
    }

    SECTION("Lookups") {
        REQUIRE(registry.findByMac("aa-bb-cc-00-00-01")->id == first.id);
        REQUIRE_FALSE(registry.findByMac("not a mac").has_value());
        REQUIRE_FALSE(registry.find(42).has_value());
    }
}

TEST_CASE("A MAC-less record is merged when its address gains a MAC", "[DeviceRegistry]") {
    engine::DeviceRegistry registry;

    auto known = registry.reconcile(snmpResult("10.0.0.8", "00:11:22:33:44:55"));
    auto anonymous = registry.reconcile(snmpResult("10.0.0.9", std::nullopt, std::nullopt, "printer"));
    REQUIRE(registry.activeCount() == 2);

    auto merged = registry.reconcile(snmpResult("10.0.0.9", "00:11:22:33:44:55"));
    REQUIRE(merged.id == known.id);
    REQUIRE(merged.ipAddress == "10.0.0.9");
    REQUIRE(merged.hostname == "printer");
    REQUIRE(registry.activeCount() == 1);

    auto retired = registry.find(anonymous.id);
    REQUIRE(retired->reachability == Reachability::Retired);
    REQUIRE(retired->mergedInto == known.id);
}

TEST_CASE("Out-of-order results do not move the address back", "[DeviceRegistry]") {
    engine::DeviceRegistry registry;
    auto now = std::chrono::system_clock::now();

    auto current = snmpResult("10.0.0.10", "aa:bb:cc:00:00:10");
    current.observedAt = now;
    registry.reconcile(current);

    auto stale = snmpResult("10.0.0.11", "aa:bb:cc:00:00:10");
    stale.observedAt = now - std::chrono::minutes(5);
    auto device = registry.reconcile(stale);

    REQUIRE(device.ipAddress == "10.0.0.10");
    REQUIRE(device.ipHistory.back().address == "10.0.0.11");
    REQUIRE(device.lastSeen == now);
}

TEST_CASE("Out-of-order results do not overwrite newer attributes", "[DeviceRegistry]") {
    engine::DeviceRegistry registry;
    auto now = std::chrono::system_clock::now();

    auto current = snmpResult("10.0.0.12", "aa:bb:cc:00:00:12", 20, "core-new");
    current.observedAt = now;
    current.interfaces = std::vector<core::Interface>{interfaceSample(1, 1000, 2000)};
    auto fresh = registry.reconcile(current);

    auto stale = snmpResult("10.0.0.12", "aa:bb:cc:00:00:12", 10, "core-old");
    stale.observedAt = now - std::chrono::minutes(5);
    stale.interfaces = std::vector<core::Interface>{interfaceSample(1, 10, 20), interfaceSample(2, 10, 20)};
    auto device = registry.reconcile(stale);

    REQUIRE(device.id == fresh.id);
    REQUIRE(device.hostname == "core-new");
    REQUIRE(device.vlanId == 20);
    REQUIRE(device.interfaces.size() == 1);
    REQUIRE(device.interfaces.front().inOctets == 1000);
    REQUIRE(device.lastSeen == now);

    auto groups = registry.vlanGroups();
    REQUIRE(groups.size() == 1);
    REQUIRE(groups.front().vlanId == 20);
    REQUIRE(groups.front().members == std::set<core::DeviceId>{fresh.id});

    SECTION("Utilization is computed against the newest sample") {
        auto next = snmpResult("10.0.0.12", "aa:bb:cc:00:00:12");
        next.observedAt = now + std::chrono::seconds(10);
        next.interfaces = std::vector<core::Interface>{interfaceSample(1, 1000 + 12500, 2000)};
        auto updated = registry.reconcile(next);
        REQUIRE(updated.interfaces.front().inOctets == 13500);
        REQUIRE(updated.hostname == "core-new");
        REQUIRE(updated.lastSeen == next.observedAt);
    }
}

TEST_CASE("A device displaced from its address is not reported up", "[DeviceRegistry]") {
    engine::DeviceRegistry registry(3);

    auto arp = snmpResult("10.0.0.5", "00:00:00:00:00:0a");
    arp.technique = core::ProbeTechnique::Arp;
    auto original = registry.reconcile(arp);
    auto claimant = registry.reconcile(snmpResult("10.0.0.5", "00:00:00:00:00:0b"));
    REQUIRE(claimant.id != original.id);

    auto displaced = registry.find(original.id);
    REQUIRE(displaced->ipAddress.empty());
    REQUIRE(displaced->reachability == Reachability::Unknown);

    SECTION("Misses on the address go to its current holder") {
        for (int i = 0; i < 5; ++i) {
            auto charged = registry.recordMiss("10.0.0.5", test::timeoutError());
            REQUIRE(charged->id == claimant.id);
        }
        REQUIRE(registry.find(claimant.id)->reachability == Reachability::Down);
        for (const auto& device : registry.snapshot()) {
            REQUIRE_FALSE((device.ipAddress.empty() && device.reachability == Reachability::Up));
        }
    }

    SECTION("Misses on an address nobody holds go to the displaced device") {
        registry.reconcile(snmpResult("10.0.0.6", "00:00:00:00:00:0b"));
        REQUIRE_FALSE(registry.findByIp("10.0.0.5").has_value());

        auto first = registry.recordMiss("10.0.0.5", test::timeoutError());
        REQUIRE(first->id == original.id);
        REQUIRE(first->reachability == Reachability::Degraded);
        registry.recordMiss("10.0.0.5", test::timeoutError());
        auto down = registry.recordMiss("10.0.0.5", test::timeoutError());
        REQUIRE(down->id == original.id);
        REQUIRE(down->reachability == Reachability::Down);
        REQUIRE(down->consecutiveMisses == 3);
    }

    SECTION("Answering at a new address brings it back up") {
        auto back = registry.reconcile(snmpResult("10.0.0.7", "00:00:00:00:00:0a"));
        REQUIRE(back.id == original.id);
        REQUIRE(back.ipAddress == "10.0.0.7");
        REQUIRE(back.reachability == Reachability::Up);
    }
}

TEST_CASE("Missed probes degrade and then down a device", "[DeviceRegistry]") {
    engine::DeviceRegistry registry(3);
    registry.reconcile(snmpResult("10.0.0.2", "aa:bb:cc:00:00:02"));

    auto miss = [&registry] { return registry.recordMiss("10.0.0.2", test::timeoutError()); };

    REQUIRE(miss()->reachability == Reachability::Degraded);
    REQUIRE(miss()->reachability == Reachability::Degraded);
    auto down = miss();
    REQUIRE(down->reachability == Reachability::Down);
    REQUIRE(down->consecutiveMisses == 3);

    SECTION("Authentication failures are not misses") {
        auto unchanged = registry.recordMiss("10.0.0.2", test::probeError(core::ProbeErrorKind::AuthFailure));
        REQUIRE(unchanged->consecutiveMisses == 3);
    }

    SECTION("A success restores the device") {
        auto up = registry.reconcile(snmpResult("10.0.0.2"));
        REQUIRE(up.reachability == Reachability::Up);
        REQUIRE(up.consecutiveMisses == 0);
    }

    SECTION("Misses for unknown addresses are ignored") {
        REQUIRE_FALSE(registry.recordMiss("10.0.0.3", test::timeoutError()).has_value());
    }

    SECTION("Lower threshold takes effect on the next miss") {
        registry.setMissThreshold(0);
        REQUIRE(registry.missThreshold() == 1);
    }
}

TEST_CASE("Interleaved misses are counted per device", "[DeviceRegistry]") {
    engine::DeviceRegistry registry(3);
    auto a = registry.reconcile(snmpResult("10.0.1.1", "aa:bb:cc:00:01:01"));
    auto b = registry.reconcile(snmpResult("10.0.1.2", "aa:bb:cc:00:01:02"));
    auto c = registry.reconcile(snmpResult("10.0.1.3", "aa:bb:cc:00:01:03"));

    auto missA = [&registry] { return registry.recordMiss("10.0.1.1", test::timeoutError()); };
    auto missB = [&registry] { return registry.recordMiss("10.0.1.2", test::timeoutError()); };

    REQUIRE(missA()->reachability == Reachability::Degraded);
    REQUIRE(missB()->reachability == Reachability::Degraded);
    registry.reconcile(snmpResult("10.0.1.3", "aa:bb:cc:00:01:03"));
    REQUIRE(missB()->reachability == Reachability::Degraded);
    REQUIRE(missA()->reachability == Reachability::Degraded);
    registry.recordMiss("10.0.1.3", test::timeoutError());

    auto downA = missA();
    REQUIRE(downA->id == a.id);
    REQUIRE(downA->reachability == Reachability::Down);
    REQUIRE(downA->consecutiveMisses == 3);
    REQUIRE(registry.find(b.id)->reachability == Reachability::Degraded);
    REQUIRE(registry.find(b.id)->consecutiveMisses == 2);

    auto downB = missB();
    REQUIRE(downB->reachability == Reachability::Down);
    REQUIRE(downB->consecutiveMisses == 3);

    auto third = registry.find(c.id);
    REQUIRE(third->reachability == Reachability::Degraded);
    REQUIRE(third->consecutiveMisses == 1);

    SECTION("Concurrent misses land on the right device") {
        engine::DeviceRegistry shared(5);
        std::vector<std::string> addresses{"10.0.2.1", "10.0.2.2", "10.0.2.3", "10.0.2.4"};
        for (size_t i = 0; i < addresses.size(); ++i) {
            shared.reconcile(snmpResult(addresses[i], "aa:bb:cc:00:02:0" + std::to_string(i + 1)));
        }

        std::vector<std::thread> workers;
        for (size_t i = 0; i < addresses.size(); ++i) {
            workers.emplace_back([&shared, address = addresses[i], count = static_cast<int>(i) + 2] {
                for (int n = 0; n < count; ++n) {
                    shared.recordMiss(address, test::timeoutError());
                }
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }

        for (size_t i = 0; i < addresses.size(); ++i) {
            auto device = shared.findByIp(addresses[i]);
            int expected = static_cast<int>(i) + 2;
            REQUIRE(device->consecutiveMisses == expected);
            REQUIRE(device->reachability == (expected >= 5 ? Reachability::Down : Reachability::Degraded));
        }
    }
}

TEST_CASE("Retirement", "[DeviceRegistry]") {
    engine::DeviceRegistry registry;
    auto old = snmpResult("10.0.0.20", "aa:bb:cc:00:00:20");
    old.observedAt = std::chrono::system_clock::now() - std::chrono::hours(48);
    auto stale = registry.reconcile(old);
    auto fresh = registry.reconcile(snmpResult("10.0.0.21", "aa:bb:cc:00:00:21"));

    SECTION("Devices unseen since the cutoff are retired") {
        auto retired = registry.markUnseen(std::chrono::system_clock::now() - std::chrono::hours(24));
        REQUIRE(retired == std::vector<core::DeviceId>{stale.id});
        REQUIRE(registry.snapshot().size() == 1);
        REQUIRE(registry.snapshot(true).size() == 2);
    }

    SECTION("Operator retirement") {
        auto retired = registry.retire(fresh.id);
        REQUIRE(retired->reachability == Reachability::Retired);
        REQUIRE_FALSE(registry.retire(fresh.id).has_value());
        REQUIRE_FALSE(registry.findByIp("10.0.0.21").has_value());

        // The MAC is free again and yields a new record
        auto reborn = registry.reconcile(snmpResult("10.0.0.21", "aa:bb:cc:00:00:21"));
        REQUIRE(reborn.id != fresh.id);
    }
}

TEST_CASE("Restore from persisted records", "[DeviceRegistry]") {
    engine::DeviceRegistry registry;

    auto up = test::makeDevice(4, "10.0.0.4", 10);
    auto retired = test::makeDevice(9, "10.0.0.9");
    retired.reachability = Reachability::Retired;
    registry.restore({up, retired});

    REQUIRE(registry.find(4)->reachability == Reachability::Unknown);
    REQUIRE(registry.find(9)->reachability == Reachability::Retired);
    REQUIRE(registry.activeCount() == 1);

    auto next = registry.reconcile(snmpResult("10.0.0.50", "aa:bb:cc:00:00:50"));
    REQUIRE(next.id == 10);
}

TEST_CASE("VLAN groups", "[DeviceRegistry]") {
    engine::DeviceRegistry registry;
    registry.reconcile(snmpResult("10.0.10.1", "aa:bb:cc:00:10:01", 10));
    registry.reconcile(snmpResult("10.0.10.2", "aa:bb:cc:00:10:02", 10));
    registry.reconcile(snmpResult("10.0.20.1", "aa:bb:cc:00:20:01", 20));
    registry.reconcile(snmpResult("10.0.30.1", "aa:bb:cc:00:30:01"));

    auto groups = registry.vlanGroups();
    REQUIRE(groups.size() == 2);
    REQUIRE(groups[0].vlanId == 10);
    REQUIRE(groups[0].members.size() == 2);
    REQUIRE(groups[1].vlanId == 20);

    SECTION("Invalid VLAN ids are ignored") {
        auto device = registry.reconcile(snmpResult("10.0.30.1", std::nullopt, 5000));
        REQUIRE_FALSE(device.vlanId.has_value());
    }
}

TEST_CASE("Interface utilization from successive samples", "[DeviceRegistry]") {
    engine::DeviceRegistry registry;
    auto start = std::chrono::system_clock::now() - std::chrono::seconds(20);

    auto first = snmpResult("10.0.0.1", "aa:bb:cc:00:00:01");
    first.observedAt = start;
    first.interfaces = std::vector<core::Interface>{interfaceSample(1, 1000, 0)};
    auto device = registry.reconcile(first);
    REQUIRE_FALSE(device.interfaces.front().utilizationPercent.has_value());

    // 625000 bytes in 10 s on a 1 Mbit/s link
    auto second = snmpResult("10.0.0.1", "aa:bb:cc:00:00:01");
    second.observedAt = start + std::chrono::seconds(10);
    second.interfaces = std::vector<core::Interface>{interfaceSample(1, 626000, 0)};
    device = registry.reconcile(second);
    REQUIRE(device.interfaces.front().utilizationPercent.has_value());
    REQUIRE(*device.interfaces.front().utilizationPercent == 50.0);

    SECTION("Counter reset yields no figure") {
        auto third = snmpResult("10.0.0.1", "aa:bb:cc:00:00:01");
        third.observedAt = start + std::chrono::seconds(20);
        third.interfaces = std::vector<core::Interface>{interfaceSample(1, 10, 0)};
        device = registry.reconcile(third);
        REQUIRE_FALSE(device.interfaces.front().utilizationPercent.has_value());
    }
}

TEST_CASE("Registry version tracks mutations", "[DeviceRegistry]") {
    engine::DeviceRegistry registry;
    auto before = registry.version();
    registry.reconcile(snmpResult("10.0.0.1"));
    REQUIRE(registry.version() > before);

    auto afterReconcile = registry.version();
    (void)registry.snapshot();
    REQUIRE(registry.version() == afterReconcile);
}
