#include <catch2/catch_test_macros.hpp>

#include "infrastructure/network/ProberPool.hpp"
#include "support/ProbeFixtures.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>

using namespace vlanvision;
using core::ProbeTechnique;
using core::UnitResolution;

namespace {

std::vector<std::string> addresses(int count) {
    std::vector<std::string> result;
    for (int i = 1; i <= count; ++i) {
        result.push_back("10.0.0." + std::to_string(i));
    }
    return result;
}

std::vector<core::UnitOutcome> drain(infra::ProbeRun& run) {
    std::vector<core::UnitOutcome> outcomes;
    while (auto outcome = run.outcomes().next()) {
        outcomes.push_back(std::move(*outcome));
    }
    return outcomes;
}

size_t countResolution(const std::vector<core::UnitOutcome>& outcomes, UnitResolution resolution) {
    return static_cast<size_t>(std::count_if(outcomes.begin(), outcomes.end(),
                                             [resolution](const auto& o) { return o.resolution == resolution; }));
}

auto succeed() {
    return [](const std::string& address) -> core::ProbeOutcome { return test::snmpResult(address); };
}

auto in(std::chrono::milliseconds ms) {
    return std::chrono::steady_clock::now() + ms;
}

} // namespace

TEST_CASE("ProberPool fan-out", "[ProberPool]") {
    infra::AsioContext context("probe-test", 8);
    context.start();
    infra::ProberPool pool(context, {4, std::chrono::seconds(1), std::chrono::milliseconds(10)});

    auto snmp = std::make_shared<test::ScriptedProbe>(ProbeTechnique::Snmp, succeed());
    auto arp = std::make_shared<test::ScriptedProbe>(ProbeTechnique::Arp, [](const std::string&) {
        return core::ProbeOutcome{test::timeoutError()};
    });
    pool.registerProbe(snmp);
    pool.registerProbe(arp);

    SECTION("Registered techniques") {
        REQUIRE(pool.hasProbe(ProbeTechnique::Snmp));
        REQUIRE_FALSE(pool.hasProbe(ProbeTechnique::Icmp));
        REQUIRE(pool.techniques().size() == 2);
    }

    SECTION("Every unit resolves exactly once") {
        auto run = pool.run(addresses(6), {ProbeTechnique::Snmp, ProbeTechnique::Arp}, in(std::chrono::seconds(5)));
        REQUIRE(run->unitCount() == 12);

        auto outcomes = drain(*run);
        REQUIRE(outcomes.size() == 12);
        REQUIRE(run->isFinished());
        REQUIRE(run->resolvedCount() == 12);

        std::set<std::pair<std::string, ProbeTechnique>> seen;
        for (const auto& outcome : outcomes) {
            REQUIRE(outcome.resolution == UnitResolution::Completed);
            seen.emplace(outcome.address, outcome.technique);
            REQUIRE(outcome.succeeded() == (outcome.technique == ProbeTechnique::Snmp));
        }
        REQUIRE(seen.size() == 12);
    }

    SECTION("Unregistered technique is rejected") {
        REQUIRE_THROWS_AS(pool.run(addresses(1), {ProbeTechnique::Icmp}, in(std::chrono::seconds(1))),
                          std::invalid_argument);
    }

    SECTION("Empty run finishes immediately") {
        auto run = pool.run({}, {ProbeTechnique::Snmp}, in(std::chrono::seconds(1)));
        REQUIRE(run->isFinished());
        REQUIRE(run->outcomes().isExhausted());
    }
}

TEST_CASE("ProberPool bounds concurrency", "[ProberPool]") {
    infra::AsioContext context("probe-test", 8);
    context.start();
    infra::ProberPool pool(context, {3, std::chrono::seconds(1), std::chrono::milliseconds(10)});

    auto slow = std::make_shared<test::ScriptedProbe>(ProbeTechnique::Snmp, succeed(), std::chrono::milliseconds(20));
    pool.registerProbe(slow);

    auto run = pool.run(addresses(15), {ProbeTechnique::Snmp}, in(std::chrono::seconds(10)));
    run->wait();

    REQUIRE(slow->completed() == 15);
    REQUIRE(slow->maxInFlight() <= 3);
    REQUIRE(slow->maxInFlight() >= 1);
}

TEST_CASE("ProberPool contains probe exceptions", "[ProberPool]") {
    infra::AsioContext context("probe-test", 2);
    context.start();
    infra::ProberPool pool(context, {2, std::chrono::seconds(1), std::chrono::milliseconds(10)});

    pool.registerProbe(std::make_shared<test::ScriptedProbe>(
        ProbeTechnique::Snmp, [](const std::string&) -> core::ProbeOutcome { throw std::runtime_error("boom"); }));

    auto run = pool.run(addresses(1), {ProbeTechnique::Snmp}, in(std::chrono::seconds(2)));
    auto outcomes = drain(*run);

    REQUIRE(outcomes.size() == 1);
    const auto& error = std::get<core::ProbeError>(outcomes.front().outcome);
    REQUIRE(error.kind == core::ProbeErrorKind::MalformedResponse);
    REQUIRE(error.message == "probe failed: boom");
}

TEST_CASE("ProberPool cancellation", "[ProberPool]") {
    infra::AsioContext context("probe-test", 4);
    context.start();
    infra::ProberPool pool(context, {1, std::chrono::seconds(2), std::chrono::milliseconds(10)});

    auto slow = std::make_shared<test::ScriptedProbe>(ProbeTechnique::Snmp, succeed(), std::chrono::milliseconds(100));
    pool.registerProbe(slow);

    auto run = pool.run(addresses(10), {ProbeTechnique::Snmp}, in(std::chrono::seconds(10)));
    while (slow->calls() == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    run->cancel();
    REQUIRE(run->isCancelled());

    auto outcomes = drain(*run);
    REQUIRE(outcomes.size() == 10);

    // The in-flight probe still reports its result
    auto completed = countResolution(outcomes, UnitResolution::Completed);
    REQUIRE(completed >= 1);
    REQUIRE(completed <= 2);
    REQUIRE(countResolution(outcomes, UnitResolution::Skipped) == 10 - completed);
    REQUIRE(slow->calls() == completed);
}

TEST_CASE("ProberPool job deadline", "[ProberPool]") {
    infra::AsioContext context("probe-test", 4);
    context.start();
    infra::ProberPool pool(context, {2, std::chrono::seconds(5), std::chrono::milliseconds(10)});

    auto stuck = std::make_shared<test::ScriptedProbe>(ProbeTechnique::Snmp, succeed(), std::chrono::milliseconds(400));
    pool.registerProbe(stuck);

    auto started = std::chrono::steady_clock::now();
    auto run = pool.run(addresses(4), {ProbeTechnique::Snmp}, in(std::chrono::milliseconds(100)));
    auto outcomes = drain(*run);

    REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::milliseconds(350));
    REQUIRE(outcomes.size() == 4);
    REQUIRE(countResolution(outcomes, UnitResolution::DeadlineExceeded) == 4);
    for (const auto& outcome : outcomes) {
        REQUIRE(std::get<core::ProbeError>(outcome.outcome).kind == core::ProbeErrorKind::Timeout);
    }
    REQUIRE(core::aggregateTargetOutcome({outcomes.front()}) == core::TargetOutcome::Timeout);
}
