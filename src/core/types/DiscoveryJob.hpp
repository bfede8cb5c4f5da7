/**
 * @file DiscoveryJob.hpp
 * @brief Discovery job, per-unit probe outcomes and scheduler events.
 *
 * A job scans one CIDR range with one or more probe techniques. Its state moves
 * pending -> running -> completed | failed; cancellation is a flag on a job that
 * still completes, with undispatched targets recorded as skipped.
 */

#pragma once

#include "core/types/Alert.hpp"
#include "core/types/ProbeResult.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace vlanvision::core {

using JobId = int64_t;

enum class JobState : int {
    Pending = 0,   ///< Accepted, worker not started yet
    Running = 1,   ///< Probes are being dispatched or awaited
    Completed = 2, ///< All units resolved (possibly after cancellation or deadline)
    Failed = 3     ///< Job aborted by an internal error
};

enum class JobOrigin : int {
    Periodic = 0, ///< Started by the interval timer
    OnDemand = 1  ///< Submitted through the API or CLI
};

/**
 * @brief Aggregated result for one target address of a job.
 */
enum class TargetOutcome : int {
    Success = 0,     ///< At least one technique returned data
    Timeout = 1,     ///< Every technique timed out
    Unreachable = 2, ///< At least one technique found the target unreachable
    Error = 3,       ///< Auth failure or malformed response, nothing succeeded
    Skipped = 4      ///< Never dispatched because the job was cancelled
};

/**
 * @brief How a single target x technique unit was resolved by the prober pool.
 */
enum class UnitResolution : int {
    Completed = 0,       ///< The probe returned (success or typed error)
    DeadlineExceeded = 1, ///< Still pending or in flight when the job deadline elapsed
    Skipped = 2          ///< Dropped from dispatch by cancellation
};

struct UnitOutcome {
    std::string address;
    ProbeTechnique technique{ProbeTechnique::Snmp};
    UnitResolution resolution{UnitResolution::Completed};
    ProbeOutcome outcome{ProbeError{}}; ///< Timeout error for deadline and skipped units

    [[nodiscard]] bool succeeded() const {
        return resolution == UnitResolution::Completed && isSuccess(outcome);
    }
    [[nodiscard]] const ProbeResult* result() const { return std::get_if<ProbeResult>(&outcome); }
    [[nodiscard]] const ProbeError* error() const { return std::get_if<ProbeError>(&outcome); }
};

struct DiscoveryJob {
    JobId id{0};
    std::string range; ///< Canonical CIDR
    std::vector<ProbeTechnique> techniques;
    JobOrigin origin{JobOrigin::OnDemand};
    JobState state{JobState::Pending};
    bool cancelled{false};
    std::chrono::system_clock::time_point createdAt;
    std::optional<std::chrono::system_clock::time_point> startedAt;
    std::optional<std::chrono::system_clock::time_point> finishedAt;
    std::map<std::string, TargetOutcome> outcomes; ///< Keyed by target address
    std::vector<std::string> warnings;             ///< Auth failures and similar job-level notes
    std::string errorMessage;                      ///< Set when the job failed
    int targetCount{0};
    int unitsTotal{0};
    int unitsResolved{0};
    int devicesUpdated{0};
    int coalescedRequests{0}; ///< Later submissions folded into this job

    [[nodiscard]] bool isActive() const { return state == JobState::Pending || state == JobState::Running; }
    [[nodiscard]] bool isFinished() const { return !isActive(); }
    [[nodiscard]] int countOutcomes(TargetOutcome outcome) const;

    [[nodiscard]] std::string stateToString() const;
    [[nodiscard]] std::string originToString() const;
    static JobState stateFromString(const std::string& str);
    static JobOrigin originFromString(const std::string& str);

    bool operator==(const DiscoveryJob& other) const = default;
};

/**
 * @brief Returned by DiscoveryScheduler::submit.
 */
struct SubmitResult {
    JobId jobId{0};
    JobState state{JobState::Pending};
    bool coalesced{false}; ///< True when the request joined an overlapping active job
};

enum class DiscoveryEventKind : int { JobCompleted = 0, Alert = 1 };

/**
 * @brief Item published on scheduler subscription channels.
 */
struct DiscoveryEvent {
    DiscoveryEventKind kind{DiscoveryEventKind::JobCompleted};
    std::optional<DiscoveryJob> job;
    std::optional<AlertDelta> alert;
};

std::string jobStateToString(JobState state);

std::string targetOutcomeToString(TargetOutcome outcome);
TargetOutcome targetOutcomeFromString(const std::string& str);

/**
 * @brief Folds all unit outcomes of one target into a target outcome.
 *
 * Success wins over everything. Skipped is reported only when every unit was
 * skipped. Otherwise an auth or parse error yields Error, an unreachable unit
 * yields Unreachable, and the remainder is Timeout.
 */
TargetOutcome aggregateTargetOutcome(const std::vector<UnitOutcome>& units);

} // namespace vlanvision::core
