#include "infrastructure/database/JobRepository.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <sstream>

namespace vlanvision::infra {

namespace {

constexpr const char* SELECT_JOB = R"(
    SELECT id, network_range, techniques, origin, state, cancelled, created_at, started_at,
           finished_at, error_message, warnings, target_count, units_total, units_resolved,
           devices_updated, coalesced_requests
    FROM discovery_jobs
)";

std::string joinTechniques(const std::vector<core::ProbeTechnique>& techniques) {
    std::string joined;
    for (auto technique : techniques) {
        if (!joined.empty()) {
            joined += ',';
        }
        joined += core::probeTechniqueToString(technique);
    }
    return joined;
}

std::vector<core::ProbeTechnique> splitTechniques(const std::string& text) {
    std::vector<core::ProbeTechnique> techniques;
    std::istringstream stream(text);
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (auto technique = core::probeTechniqueFromString(item)) {
            techniques.push_back(*technique);
        }
    }
    return techniques;
}

void bindOptionalTime(Statement& stmt, int index,
                      const std::optional<std::chrono::system_clock::time_point>& tp) {
    if (tp) {
        stmt.bind(index, Database::formatTimestamp(*tp));
    } else {
        stmt.bindNull(index);
    }
}

} // namespace

JobRepository::JobRepository(std::shared_ptr<Database> db) : db_(std::move(db)) {}

void JobRepository::save(const core::DiscoveryJob& job) {
    db_->transaction([this, &job] {
        auto stmt = db_->prepare(R"(
            INSERT OR REPLACE INTO discovery_jobs (id, network_range, techniques, origin, state, cancelled,
                                                   created_at, started_at, finished_at, error_message,
                                                   warnings, target_count, units_total, units_resolved,
                                                   devices_updated, coalesced_requests)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
        )");

        stmt.bind(1, job.id);
        stmt.bind(2, job.range);
        stmt.bind(3, joinTechniques(job.techniques));
        stmt.bind(4, static_cast<int>(job.origin));
        stmt.bind(5, static_cast<int>(job.state));
        stmt.bind(6, job.cancelled ? 1 : 0);
        stmt.bind(7, Database::formatTimestamp(job.createdAt));
        bindOptionalTime(stmt, 8, job.startedAt);
        bindOptionalTime(stmt, 9, job.finishedAt);
        stmt.bind(10, job.errorMessage);
        stmt.bind(11, nlohmann::json(job.warnings).dump());
        stmt.bind(12, job.targetCount);
        stmt.bind(13, job.unitsTotal);
        stmt.bind(14, job.unitsResolved);
        stmt.bind(15, job.devicesUpdated);
        stmt.bind(16, job.coalescedRequests);
        stmt.step();

        auto clearStmt = db_->prepare("DELETE FROM job_outcomes WHERE job_id = ?");
        clearStmt.bind(1, job.id);
        clearStmt.step();

        auto outStmt = db_->prepare("INSERT INTO job_outcomes (job_id, address, outcome) VALUES (?, ?, ?)");
        for (const auto& [address, outcome] : job.outcomes) {
            outStmt.bind(1, job.id);
            outStmt.bind(2, address);
            outStmt.bind(3, static_cast<int>(outcome));
            outStmt.step();
            outStmt.reset();
        }
    });
    spdlog::debug("Saved discovery job {} ({})", job.id, job.stateToString());
}

std::optional<core::DiscoveryJob> JobRepository::findById(core::JobId id) {
    std::optional<core::DiscoveryJob> job;
    {
        auto stmt = db_->prepare(std::string(SELECT_JOB) + " WHERE id = ?");
        stmt.bind(1, id);
        if (stmt.step()) {
            job = rowToJob(stmt);
        }
    }
    if (job) {
        loadOutcomes(*job);
    }
    return job;
}

std::vector<core::DiscoveryJob> JobRepository::findRecent(int limit) {
    std::vector<core::DiscoveryJob> jobs;
    {
        auto stmt = db_->prepare(std::string(SELECT_JOB) + " ORDER BY id DESC LIMIT ?");
        stmt.bind(1, limit);
        while (stmt.step()) {
            jobs.push_back(rowToJob(stmt));
        }
    }
    for (auto& job : jobs) {
        loadOutcomes(job);
    }
    return jobs;
}

core::JobId JobRepository::maxId() {
    auto stmt = db_->prepare("SELECT MAX(id) FROM discovery_jobs");
    if (stmt.step() && !stmt.columnIsNull(0)) {
        return stmt.columnInt64(0);
    }
    return 0;
}

int JobRepository::deleteFinishedBefore(std::chrono::system_clock::time_point cutoff) {
    auto stmt = db_->prepare("DELETE FROM discovery_jobs WHERE state IN (?, ?) AND created_at < ?");
    stmt.bind(1, static_cast<int>(core::JobState::Completed));
    stmt.bind(2, static_cast<int>(core::JobState::Failed));
    stmt.bind(3, Database::formatTimestamp(cutoff));
    stmt.step();

    int deleted = db_->changes();
    if (deleted > 0) {
        spdlog::debug("Deleted {} discovery jobs older than retention", deleted);
    }
    return deleted;
}

int JobRepository::trimFinished(int keep) {
    auto stmt = db_->prepare(R"(
        DELETE FROM discovery_jobs WHERE state IN (?, ?) AND id NOT IN (
            SELECT id FROM discovery_jobs WHERE state IN (?, ?) ORDER BY id DESC LIMIT ?
        )
    )");
    stmt.bind(1, static_cast<int>(core::JobState::Completed));
    stmt.bind(2, static_cast<int>(core::JobState::Failed));
    stmt.bind(3, static_cast<int>(core::JobState::Completed));
    stmt.bind(4, static_cast<int>(core::JobState::Failed));
    stmt.bind(5, keep);
    stmt.step();
    return db_->changes();
}

int JobRepository::count() {
    auto stmt = db_->prepare("SELECT COUNT(*) FROM discovery_jobs");
    stmt.step();
    return stmt.columnInt(0);
}

void JobRepository::loadOutcomes(core::DiscoveryJob& job) {
    auto stmt = db_->prepare("SELECT address, outcome FROM job_outcomes WHERE job_id = ?");
    stmt.bind(1, job.id);
    while (stmt.step()) {
        job.outcomes[stmt.columnText(0)] = static_cast<core::TargetOutcome>(stmt.columnInt(1));
    }
}

core::DiscoveryJob JobRepository::rowToJob(Statement& stmt) {
    core::DiscoveryJob job;
    job.id = stmt.columnInt64(0);
    job.range = stmt.columnText(1);
    job.techniques = splitTechniques(stmt.columnText(2));
    job.origin = static_cast<core::JobOrigin>(stmt.columnInt(3));
    job.state = static_cast<core::JobState>(stmt.columnInt(4));
    job.cancelled = stmt.columnInt(5) != 0;
    job.createdAt = Database::parseTimestamp(stmt.columnText(6));
    if (!stmt.columnIsNull(7)) {
        job.startedAt = Database::parseTimestamp(stmt.columnText(7));
    }
    if (!stmt.columnIsNull(8)) {
        job.finishedAt = Database::parseTimestamp(stmt.columnText(8));
    }
    job.errorMessage = stmt.columnText(9);

    auto warnings = nlohmann::json::parse(stmt.columnText(10), nullptr, false);
    if (warnings.is_array()) {
        for (const auto& warning : warnings) {
            if (warning.is_string()) {
                job.warnings.push_back(warning.get<std::string>());
            }
        }
    }

    job.targetCount = stmt.columnInt(11);
    job.unitsTotal = stmt.columnInt(12);
    job.unitsResolved = stmt.columnInt(13);
    job.devicesUpdated = stmt.columnInt(14);
    job.coalescedRequests = stmt.columnInt(15);
    return job;
}

} // namespace vlanvision::infra
