#pragma once

#include "core/types/Alert.hpp"
#include "core/types/Device.hpp"

#include <chrono>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace vlanvision::engine {

/**
 * @brief Threshold rules over device snapshots with hysteresis.
 *
 * At most one alert is open per rule and device. An open alert is refreshed
 * while the violation persists, may escalate in severity, and closes only
 * after clearAfterEvaluations consecutive clean evaluations, so a flapping
 * condition keeps a single alert. Alerts of devices that left the active
 * snapshot close on the next evaluation.
 */
class AlertEvaluator {
public:
    static constexpr size_t MAX_HISTORY = 1000;

    explicit AlertEvaluator(core::AlertThresholds thresholds = {});

    AlertEvaluator(const AlertEvaluator&) = delete;
    AlertEvaluator& operator=(const AlertEvaluator&) = delete;

    /**
     * @brief Evaluates every rule against a snapshot of active devices.
     * @return Deltas ordered by device id, then rule.
     */
    std::vector<core::AlertDelta> evaluate(const std::vector<core::Device>& devices,
                                           std::chrono::system_clock::time_point now);

    /**
     * @brief Marks an alert as acknowledged.
     * @return The updated alert, or nullopt if the id is unknown.
     */
    std::optional<core::Alert> acknowledge(int64_t alertId);

    /// Open alerts ordered by id.
    [[nodiscard]] std::vector<core::Alert> activeAlerts() const;

    /// Open and closed alerts, newest first.
    [[nodiscard]] std::vector<core::Alert> history(size_t limit = 100) const;

    [[nodiscard]] std::optional<core::Alert> find(int64_t alertId) const;

    /**
     * @brief Reinstates persisted open alerts after a restart.
     * @param lastId Highest alert id ever issued, so ids are never reused.
     */
    void restore(std::vector<core::Alert> openAlerts, int64_t lastId);

    void setThresholds(const core::AlertThresholds& thresholds);
    [[nodiscard]] core::AlertThresholds thresholds() const;

private:
    struct Violation {
        core::AlertSeverity severity{core::AlertSeverity::Warning};
        std::string message;
        std::optional<int32_t> interfaceIndex;
        std::string interfaceName;
    };

    struct OpenAlert {
        core::Alert alert;
        int cleanStreak{0};
    };

    struct ErrorSample {
        std::chrono::system_clock::time_point at;
        uint64_t errors{0};
    };

    using Key = std::pair<core::AlertRule, core::DeviceId>;

    /// Rule results for one device; rules absent from the map were not evaluable.
    std::map<core::AlertRule, std::optional<Violation>> checkDevice(const core::Device& device,
                                                                    std::chrono::system_clock::time_point now);
    std::optional<Violation> checkErrorRate(const core::Device& device, std::chrono::system_clock::time_point now);
    std::optional<Violation> checkUtilization(const core::Device& device) const;

    void closeLocked(const Key& key, std::chrono::system_clock::time_point now, std::vector<core::AlertDelta>& deltas);

    mutable std::mutex mutex_;
    core::AlertThresholds thresholds_;
    std::map<Key, OpenAlert> open_;
    std::deque<core::Alert> closed_;
    std::map<std::pair<core::DeviceId, int32_t>, std::deque<ErrorSample>> errorSamples_;
    int64_t nextId_{1};
};

} // namespace vlanvision::engine
