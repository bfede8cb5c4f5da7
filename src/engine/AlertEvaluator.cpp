#include "engine/AlertEvaluator.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>

namespace vlanvision::engine {

namespace {

core::AlertSeverity gradeAbove(double value, double critical) {
    return value >= critical ? core::AlertSeverity::Critical : core::AlertSeverity::Warning;
}

} // namespace

AlertEvaluator::AlertEvaluator(core::AlertThresholds thresholds) : thresholds_(thresholds) {}

void AlertEvaluator::setThresholds(const core::AlertThresholds& thresholds) {
    std::lock_guard lock(mutex_);
    thresholds_ = thresholds;
}

core::AlertThresholds AlertEvaluator::thresholds() const {
    std::lock_guard lock(mutex_);
    return thresholds_;
}

std::optional<AlertEvaluator::Violation> AlertEvaluator::checkErrorRate(const core::Device& device,
                                                                       std::chrono::system_clock::time_point now) {
    auto window = static_cast<size_t>(std::max(2, thresholds_.errorRateWindowSamples));
    std::optional<Violation> worst;
    double worstRate = 0.0;

    for (const auto& iface : device.interfaces) {
        auto& samples = errorSamples_[{device.id, iface.index}];
        auto errors = iface.totalErrors();
        // Counter reset: start a fresh window
        if (!samples.empty() && errors < samples.back().errors) {
            samples.clear();
        }
        if (samples.empty() || samples.back().at < now) {
            samples.push_back({now, errors});
        }
        while (samples.size() > window) {
            samples.pop_front();
        }
        if (samples.size() < 2) {
            continue;
        }

        double seconds = std::chrono::duration<double>(samples.back().at - samples.front().at).count();
        if (seconds <= 0.0) {
            continue;
        }
        double rate = static_cast<double>(samples.back().errors - samples.front().errors) / seconds;
        if (rate < thresholds_.errorRateWarningPerSecond || rate <= worstRate) {
            continue;
        }

        worstRate = rate;
        Violation violation;
        violation.severity = gradeAbove(rate, thresholds_.errorRateCriticalPerSecond);
        violation.interfaceIndex = iface.index;
        violation.interfaceName = iface.name;
        auto label = iface.name.empty() ? "ifIndex " + std::to_string(iface.index) : iface.name;
        violation.message = fmt::format("Interface {} on {} has {:.2f} errors/s", label, device.displayName(), rate);
        worst = std::move(violation);
    }
    return worst;
}

std::optional<AlertEvaluator::Violation> AlertEvaluator::checkUtilization(const core::Device& device) const {
    const core::Interface* busiest = nullptr;
    for (const auto& iface : device.interfaces) {
        if (iface.utilizationPercent && (!busiest || *iface.utilizationPercent > *busiest->utilizationPercent)) {
            busiest = &iface;
        }
    }
    if (!busiest || *busiest->utilizationPercent < thresholds_.utilizationWarningPercent) {
        return std::nullopt;
    }

    double percent = *busiest->utilizationPercent;
    Violation violation;
    violation.severity = gradeAbove(percent, thresholds_.utilizationCriticalPercent);
    violation.interfaceIndex = busiest->index;
    violation.interfaceName = busiest->name;
    violation.message = fmt::format("Interface {} on {} at {:.1f}% utilization", busiest->name,
                                    device.displayName(), percent);
    return violation;
}

std::map<core::AlertRule, std::optional<AlertEvaluator::Violation>>
AlertEvaluator::checkDevice(const core::Device& device, std::chrono::system_clock::time_point now) {
    std::map<core::AlertRule, std::optional<Violation>> results;

    if (device.reachability == core::Reachability::Down) {
        results[core::AlertRule::DeviceUnreachable] = Violation{
            core::AlertSeverity::Critical,
            fmt::format("Device {} is unreachable ({} consecutive missed probes)", device.displayName(),
                        device.consecutiveMisses),
            std::nullopt,
            {}};
    } else {
        results[core::AlertRule::DeviceUnreachable] = std::nullopt;
    }

    if (thresholds_.degradedAlertsEnabled) {
        if (device.reachability == core::Reachability::Degraded) {
            results[core::AlertRule::DeviceDegraded] = Violation{
                core::AlertSeverity::Warning,
                fmt::format("Device {} missed {} probe(s)", device.displayName(), device.consecutiveMisses),
                std::nullopt,
                {}};
        } else {
            results[core::AlertRule::DeviceDegraded] = std::nullopt;
        }
    }

    // Metric data of an unreachable device is stale, leave those alerts as they are
    if (device.reachability == core::Reachability::Down) {
        return results;
    }

    if (device.cpuPercent && *device.cpuPercent >= thresholds_.cpuWarningPercent) {
        results[core::AlertRule::HighCpu] = Violation{
            gradeAbove(*device.cpuPercent, thresholds_.cpuCriticalPercent),
            fmt::format("CPU load on {} is {:.0f}%", device.displayName(), *device.cpuPercent),
            std::nullopt,
            {}};
    } else {
        results[core::AlertRule::HighCpu] = std::nullopt;
    }

    results[core::AlertRule::InterfaceErrorRate] = checkErrorRate(device, now);
    results[core::AlertRule::HighUtilization] = checkUtilization(device);
    return results;
}

void AlertEvaluator::closeLocked(const Key& key, std::chrono::system_clock::time_point now,
                                 std::vector<core::AlertDelta>& deltas) {
    auto it = open_.find(key);
    if (it == open_.end()) {
        return;
    }
    auto alert = it->second.alert;
    alert.resolvedAt = now;
    open_.erase(it);

    spdlog::info("Alert {} resolved: {}", alert.id, alert.message);
    closed_.push_back(alert);
    while (closed_.size() > MAX_HISTORY) {
        closed_.pop_front();
    }
    deltas.push_back({core::AlertDeltaKind::Closed, std::move(alert)});
}

std::vector<core::AlertDelta> AlertEvaluator::evaluate(const std::vector<core::Device>& devices,
                                                       std::chrono::system_clock::time_point now) {
    std::lock_guard lock(mutex_);

    std::vector<const core::Device*> active;
    for (const auto& device : devices) {
        if (device.isActive()) {
            active.push_back(&device);
        }
    }
    std::sort(active.begin(), active.end(),
              [](const core::Device* lhs, const core::Device* rhs) { return lhs->id < rhs->id; });

    std::vector<core::AlertDelta> deltas;
    std::set<core::DeviceId> present;

    for (const auto* device : active) {
        present.insert(device->id);

        for (auto& [rule, violation] : checkDevice(*device, now)) {
            Key key{rule, device->id};
            auto it = open_.find(key);

            if (violation) {
                if (it == open_.end()) {
                    core::Alert alert;
                    alert.id = nextId_++;
                    alert.deviceId = device->id;
                    alert.rule = rule;
                    alert.severity = violation->severity;
                    alert.message = violation->message;
                    alert.interfaceIndex = violation->interfaceIndex;
                    alert.interfaceName = violation->interfaceName;
                    alert.firstFired = now;
                    alert.lastSeen = now;
                    open_.emplace(key, OpenAlert{alert, 0});

                    spdlog::warn("Alert {} opened [{}]: {}", alert.id, alert.severityToString(), alert.message);
                    deltas.push_back({core::AlertDeltaKind::Opened, std::move(alert)});
                } else {
                    auto& entry = it->second;
                    entry.cleanStreak = 0;
                    if (violation->severity > entry.alert.severity) {
                        entry.alert.severity = violation->severity;
                        spdlog::warn("Alert {} escalated to {}", entry.alert.id, entry.alert.severityToString());
                    }
                    entry.alert.message = violation->message;
                    entry.alert.interfaceIndex = violation->interfaceIndex;
                    entry.alert.interfaceName = violation->interfaceName;
                    entry.alert.lastSeen = now;
                    deltas.push_back({core::AlertDeltaKind::Refreshed, entry.alert});
                }
            } else if (it != open_.end()) {
                if (++it->second.cleanStreak >= std::max(1, thresholds_.clearAfterEvaluations)) {
                    closeLocked(key, now, deltas);
                }
            }
        }
    }

    // Devices no longer active take their alerts with them
    std::vector<Key> orphaned;
    for (const auto& [key, entry] : open_) {
        if (!present.contains(key.second)) {
            orphaned.push_back(key);
        }
    }
    for (const auto& key : orphaned) {
        closeLocked(key, now, deltas);
    }
    for (auto it = errorSamples_.begin(); it != errorSamples_.end();) {
        it = present.contains(it->first.first) ? std::next(it) : errorSamples_.erase(it);
    }

    return deltas;
}

std::optional<core::Alert> AlertEvaluator::acknowledge(int64_t alertId) {
    std::lock_guard lock(mutex_);

    for (auto& [key, entry] : open_) {
        if (entry.alert.id == alertId) {
            entry.alert.acknowledged = true;
            spdlog::info("Alert {} acknowledged", alertId);
            return entry.alert;
        }
    }
    for (auto& alert : closed_) {
        if (alert.id == alertId) {
            alert.acknowledged = true;
            return alert;
        }
    }
    return std::nullopt;
}

std::vector<core::Alert> AlertEvaluator::activeAlerts() const {
    std::lock_guard lock(mutex_);

    std::vector<core::Alert> alerts;
    alerts.reserve(open_.size());
    for (const auto& [key, entry] : open_) {
        alerts.push_back(entry.alert);
    }
    std::sort(alerts.begin(), alerts.end(), [](const auto& lhs, const auto& rhs) { return lhs.id < rhs.id; });
    return alerts;
}

std::vector<core::Alert> AlertEvaluator::history(size_t limit) const {
    std::lock_guard lock(mutex_);

    std::vector<core::Alert> alerts(closed_.begin(), closed_.end());
    for (const auto& [key, entry] : open_) {
        alerts.push_back(entry.alert);
    }
    std::sort(alerts.begin(), alerts.end(), [](const auto& lhs, const auto& rhs) { return lhs.id > rhs.id; });
    if (alerts.size() > limit) {
        alerts.resize(limit);
    }
    return alerts;
}

std::optional<core::Alert> AlertEvaluator::find(int64_t alertId) const {
    std::lock_guard lock(mutex_);

    for (const auto& [key, entry] : open_) {
        if (entry.alert.id == alertId) {
            return entry.alert;
        }
    }
    for (const auto& alert : closed_) {
        if (alert.id == alertId) {
            return alert;
        }
    }
    return std::nullopt;
}

void AlertEvaluator::restore(std::vector<core::Alert> openAlerts, int64_t lastId) {
    std::lock_guard lock(mutex_);

    open_.clear();
    closed_.clear();
    errorSamples_.clear();
    nextId_ = lastId + 1;
    for (auto& alert : openAlerts) {
        if (!alert.isOpen()) {
            continue;
        }
        nextId_ = std::max(nextId_, alert.id + 1);
        Key key{alert.rule, alert.deviceId};
        open_[key] = OpenAlert{std::move(alert), 0};
    }
    spdlog::info("Restored {} open alerts", open_.size());
}

} // namespace vlanvision::engine
