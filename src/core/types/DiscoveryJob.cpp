#include "core/types/DiscoveryJob.hpp"

#include <algorithm>

namespace vlanvision::core {

int DiscoveryJob::countOutcomes(TargetOutcome outcome) const {
    return static_cast<int>(std::count_if(outcomes.begin(), outcomes.end(),
                                          [outcome](const auto& entry) { return entry.second == outcome; }));
}

std::string DiscoveryJob::stateToString() const {
    return jobStateToString(state);
}

std::string jobStateToString(JobState state) {
    switch (state) {
    case JobState::Pending:
        return "pending";
    case JobState::Running:
        return "running";
    case JobState::Completed:
        return "completed";
    case JobState::Failed:
        return "failed";
    }
    return "unknown";
}

std::string DiscoveryJob::originToString() const {
    return origin == JobOrigin::Periodic ? "periodic" : "on-demand";
}

JobState DiscoveryJob::stateFromString(const std::string& str) {
    if (str == "running")
        return JobState::Running;
    if (str == "completed")
        return JobState::Completed;
    if (str == "failed")
        return JobState::Failed;
    return JobState::Pending;
}

JobOrigin DiscoveryJob::originFromString(const std::string& str) {
    return str == "periodic" ? JobOrigin::Periodic : JobOrigin::OnDemand;
}

std::string targetOutcomeToString(TargetOutcome outcome) {
    switch (outcome) {
    case TargetOutcome::Success:
        return "success";
    case TargetOutcome::Timeout:
        return "timeout";
    case TargetOutcome::Unreachable:
        return "unreachable";
    case TargetOutcome::Error:
        return "error";
    case TargetOutcome::Skipped:
        return "skipped";
    }
    return "error";
}

TargetOutcome targetOutcomeFromString(const std::string& str) {
    if (str == "success")
        return TargetOutcome::Success;
    if (str == "timeout")
        return TargetOutcome::Timeout;
    if (str == "unreachable")
        return TargetOutcome::Unreachable;
    if (str == "skipped")
        return TargetOutcome::Skipped;
    return TargetOutcome::Error;
}

TargetOutcome aggregateTargetOutcome(const std::vector<UnitOutcome>& units) {
    if (units.empty()) {
        return TargetOutcome::Skipped;
    }

    bool allSkipped = true;
    bool anyError = false;
    bool anyUnreachable = false;

    for (const auto& unit : units) {
        if (unit.succeeded()) {
            return TargetOutcome::Success;
        }
        if (unit.resolution != UnitResolution::Skipped) {
            allSkipped = false;
        }
        if (unit.resolution != UnitResolution::Completed) {
            continue;
        }
        if (const auto* error = unit.error()) {
            switch (error->kind) {
            case ProbeErrorKind::AuthFailure:
            case ProbeErrorKind::MalformedResponse:
                anyError = true;
                break;
            case ProbeErrorKind::Unreachable:
                anyUnreachable = true;
                break;
            case ProbeErrorKind::Timeout:
                break;
            }
        }
    }

    if (allSkipped)
        return TargetOutcome::Skipped;
    if (anyError)
        return TargetOutcome::Error;
    if (anyUnreachable)
        return TargetOutcome::Unreachable;
    return TargetOutcome::Timeout;
}

} // namespace vlanvision::core
