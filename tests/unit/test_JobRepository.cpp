#include <catch2/catch_test_macros.hpp>

#include "infrastructure/database/JobRepository.hpp"
#include "support/TestDatabase.hpp"

using namespace vlanvision;
using core::JobState;
using core::TargetOutcome;
using infra::JobRepository;

namespace {

core::DiscoveryJob finishedJob(core::JobId id, std::chrono::system_clock::time_point createdAt) {
    core::DiscoveryJob job;
    job.id = id;
    job.range = "10.0.0.0/30";
    job.techniques = {core::ProbeTechnique::Snmp, core::ProbeTechnique::Icmp};
    job.origin = core::JobOrigin::Periodic;
    job.state = JobState::Completed;
    job.createdAt = createdAt;
    job.startedAt = createdAt;
    job.finishedAt = createdAt + std::chrono::seconds(4);
    job.outcomes = {{"10.0.0.1", TargetOutcome::Success}, {"10.0.0.2", TargetOutcome::Timeout}};
    job.targetCount = 2;
    job.unitsTotal = 4;
    job.unitsResolved = 4;
    job.devicesUpdated = 1;
    return job;
}

} // namespace

TEST_CASE("JobRepository operations", "[Database][JobRepository]") {
    test::TestDatabase testDb;
    JobRepository repo(testDb.get());
    auto now = test::storedNow();

    SECTION("Save and retrieve a finished job") {
        auto job = finishedJob(1, now);
        job.warnings = {"10.0.0.2: authentication failed"};
        job.coalescedRequests = 2;
        repo.save(job);

        auto loaded = repo.findById(1);
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->techniques == job.techniques);
        REQUIRE(loaded->outcomes.at("10.0.0.2") == TargetOutcome::Timeout);
        REQUIRE(loaded->warnings == job.warnings);
        REQUIRE(*loaded == job);
    }

    SECTION("Pending job has no start or finish time") {
        core::DiscoveryJob job;
        job.id = 2;
        job.range = "192.168.1.0/24";
        job.techniques = {core::ProbeTechnique::Arp};
        job.createdAt = now;
        repo.save(job);

        auto loaded = repo.findById(2);
        REQUIRE(loaded->state == JobState::Pending);
        REQUIRE_FALSE(loaded->startedAt.has_value());
        REQUIRE_FALSE(loaded->finishedAt.has_value());
        REQUIRE(loaded->outcomes.empty());
    }

    SECTION("Saving again replaces the outcomes") {
        auto job = finishedJob(3, now);
        repo.save(job);
        job.outcomes = {{"10.0.0.1", TargetOutcome::Skipped}};
        job.cancelled = true;
        repo.save(job);

        auto loaded = repo.findById(3);
        REQUIRE(loaded->cancelled);
        REQUIRE(loaded->outcomes.size() == 1);
        REQUIRE(repo.count() == 1);
    }

    SECTION("Recent jobs newest first and highest id") {
        REQUIRE(repo.maxId() == 0);
        for (core::JobId id = 1; id <= 5; ++id) {
            repo.save(finishedJob(id, now));
        }
        auto recent = repo.findRecent(3);
        REQUIRE(recent.size() == 3);
        REQUIRE(recent[0].id == 5);
        REQUIRE(recent[2].id == 3);
        REQUIRE(repo.maxId() == 5);
    }
}

TEST_CASE("Job retention", "[Database][JobRepository]") {
    test::TestDatabase testDb;
    JobRepository repo(testDb.get());
    auto now = test::storedNow();

    repo.save(finishedJob(1, now - std::chrono::hours(72)));
    repo.save(finishedJob(2, now - std::chrono::hours(48)));
    auto failed = finishedJob(3, now - std::chrono::hours(1));
    failed.state = JobState::Failed;
    failed.errorMessage = "probe pool stopped";
    repo.save(failed);
    auto running = finishedJob(4, now - std::chrono::hours(96));
    running.state = JobState::Running;
    running.finishedAt.reset();
    repo.save(running);

    SECTION("Finished jobs older than the cutoff are deleted") {
        REQUIRE(repo.deleteFinishedBefore(now - std::chrono::hours(24)) == 2);
        REQUIRE(repo.count() == 2);
        REQUIRE(repo.findById(3)->errorMessage == "probe pool stopped");
        REQUIRE(repo.findById(4).has_value());

        // Outcomes of deleted jobs go with them
        auto rows = testDb.get()->query("SELECT COUNT(*) AS n FROM job_outcomes WHERE job_id IN (1, 2)");
        REQUIRE(rows[0]["n"] == 0);
    }

    SECTION("Only the newest finished jobs are kept") {
        REQUIRE(repo.trimFinished(1) == 2);
        REQUIRE_FALSE(repo.findById(1).has_value());
        REQUIRE_FALSE(repo.findById(2).has_value());
        REQUIRE(repo.findById(3).has_value());
        REQUIRE(repo.findById(4).has_value());
    }
}
