#include <catch2/catch_test_macros.hpp>

#include "core/types/DiscoveryJob.hpp"

using namespace vlanvision::core;

namespace {

UnitOutcome completed(ProbeOutcome outcome) {
    return UnitOutcome{"10.0.0.1", ProbeTechnique::Snmp, UnitResolution::Completed, std::move(outcome)};
}

UnitOutcome failed(ProbeErrorKind kind) {
    return completed(ProbeError{kind, "failure", {}});
}

UnitOutcome skipped() {
    return UnitOutcome{"10.0.0.1", ProbeTechnique::Arp, UnitResolution::Skipped,
                       ProbeError{ProbeErrorKind::Timeout, "skipped", {}}};
}

} // namespace

TEST_CASE("Target outcome aggregation", "[DiscoveryJob]") {
    ProbeResult ok;
    ok.address = "10.0.0.1";

    SECTION("Any success wins") {
        REQUIRE(aggregateTargetOutcome({failed(ProbeErrorKind::AuthFailure), completed(ok)}) ==
                TargetOutcome::Success);
    }

    SECTION("All timeouts") {
        REQUIRE(aggregateTargetOutcome({failed(ProbeErrorKind::Timeout), failed(ProbeErrorKind::Timeout)}) ==
                TargetOutcome::Timeout);
    }

    SECTION("Unreachable beats timeout") {
        REQUIRE(aggregateTargetOutcome({failed(ProbeErrorKind::Timeout), failed(ProbeErrorKind::Unreachable)}) ==
                TargetOutcome::Unreachable);
    }

    SECTION("Auth and parse failures report an error") {
        REQUIRE(aggregateTargetOutcome({failed(ProbeErrorKind::Unreachable), failed(ProbeErrorKind::AuthFailure)}) ==
                TargetOutcome::Error);
        REQUIRE(aggregateTargetOutcome({failed(ProbeErrorKind::MalformedResponse)}) == TargetOutcome::Error);
    }

    SECTION("Skipped only when every unit was skipped") {
        REQUIRE(aggregateTargetOutcome({skipped(), skipped()}) == TargetOutcome::Skipped);
        REQUIRE(aggregateTargetOutcome({skipped(), failed(ProbeErrorKind::Timeout)}) == TargetOutcome::Timeout);
        REQUIRE(aggregateTargetOutcome({}) == TargetOutcome::Skipped);
    }

    SECTION("Deadline-expired units count as timeouts") {
        UnitOutcome expired{"10.0.0.1", ProbeTechnique::Snmp, UnitResolution::DeadlineExceeded,
                            ProbeError{ProbeErrorKind::Timeout, "deadline", {}}};
        REQUIRE_FALSE(expired.succeeded());
        REQUIRE(aggregateTargetOutcome({expired}) == TargetOutcome::Timeout);
    }
}

TEST_CASE("DiscoveryJob state helpers", "[DiscoveryJob]") {
    DiscoveryJob job;
    job.outcomes["10.0.0.1"] = TargetOutcome::Success;
    job.outcomes["10.0.0.2"] = TargetOutcome::Timeout;
    job.outcomes["10.0.0.3"] = TargetOutcome::Timeout;

    REQUIRE(job.isActive());
    REQUIRE(job.countOutcomes(TargetOutcome::Timeout) == 2);
    REQUIRE(job.countOutcomes(TargetOutcome::Skipped) == 0);

    job.state = JobState::Completed;
    REQUIRE(job.isFinished());
    REQUIRE(job.stateToString() == "completed");
    REQUIRE(jobStateToString(JobState::Failed) == "failed");
    REQUIRE(DiscoveryJob::stateFromString("running") == JobState::Running);
    REQUIRE(DiscoveryJob::originFromString("periodic") == JobOrigin::Periodic);
    REQUIRE(targetOutcomeFromString(targetOutcomeToString(TargetOutcome::Unreachable)) ==
            TargetOutcome::Unreachable);
}
