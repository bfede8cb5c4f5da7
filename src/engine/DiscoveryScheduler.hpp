#pragma once

#include "core/Channel.hpp"
#include "core/types/DiscoveryJob.hpp"
#include "engine/AlertEvaluator.hpp"
#include "engine/DeviceRegistry.hpp"
#include "engine/TopologyBuilder.hpp"
#include "infrastructure/database/AlertRepository.hpp"
#include "infrastructure/database/DeviceRepository.hpp"
#include "infrastructure/database/JobRepository.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/network/ProberPool.hpp"

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace vlanvision::engine {

/**
 * @brief Optional persistence targets; null members are skipped.
 */
struct DiscoveryStores {
    std::shared_ptr<infra::DeviceRepository> devices;
    std::shared_ptr<infra::JobRepository> jobs;
    std::shared_ptr<infra::AlertRepository> alerts;
};

/**
 * @brief Runs discovery jobs and keeps the derived state up to date.
 *
 * Jobs are queued by submit() or by the periodic timer and executed by a
 * fixed number of worker threads. A submission whose range overlaps a
 * pending or running job is folded into that job instead of starting a new
 * one. Every successful probe result is reconciled as soon as it arrives;
 * once all units of a job resolved, the scheduler accounts misses, rebuilds
 * the topology, evaluates alerts, persists, applies retention and finally
 * publishes a completion event to all subscribers.
 */
class DiscoveryScheduler {
public:
    static constexpr int MIN_PREFIX_LENGTH = 16;

    struct Options {
        std::vector<std::string> periodicRanges;
        bool periodicEnabled{true};
        std::chrono::seconds interval{std::chrono::seconds(300)};
        std::chrono::seconds jobTimeout{std::chrono::seconds(120)};
        std::vector<core::ProbeTechnique> techniques{core::ProbeTechnique::Snmp, core::ProbeTechnique::Arp,
                                                     core::ProbeTechnique::Neighbor};
        size_t workerCount{2};
        size_t jobRetentionCount{100};
        std::chrono::hours jobRetentionAge{std::chrono::hours(168)};
        std::chrono::hours unseenRetireAfter{std::chrono::hours(0)}; ///< Zero disables the sweep
    };

    DiscoveryScheduler(infra::AsioContext& timerContext, infra::ProberPool& pool, DeviceRegistry& registry,
                       TopologyBuilder& topology, AlertEvaluator& alerts, Options options,
                       DiscoveryStores stores = {});
    ~DiscoveryScheduler();

    DiscoveryScheduler(const DiscoveryScheduler&) = delete;
    DiscoveryScheduler& operator=(const DiscoveryScheduler&) = delete;

    /**
     * @brief Queues discovery of @p cidr.
     * @param techniques Empty selects the configured techniques.
     * @throws std::invalid_argument for a malformed or too large range, or a
     *         technique without a registered probe.
     */
    core::SubmitResult submit(const std::string& cidr, const std::vector<core::ProbeTechnique>& techniques = {},
                              core::JobOrigin origin = core::JobOrigin::OnDemand);

    /**
     * @brief Requests cancellation of a pending or running job.
     * @return False if the job is unknown or already finished.
     */
    bool cancel(core::JobId jobId);

    [[nodiscard]] std::optional<core::DiscoveryJob> job(core::JobId jobId) const;

    /// Retained jobs, newest first.
    [[nodiscard]] std::vector<core::DiscoveryJob> jobs() const;

    /**
     * @brief Blocks until the job finished or @p timeout elapsed.
     * @return The finished job, or nullopt on timeout or unknown id.
     */
    std::optional<core::DiscoveryJob> wait(core::JobId jobId, std::chrono::milliseconds timeout) const;

    /**
     * @brief Opens a subscription for job completions and alert deltas.
     *
     * The channel is bounded and drops its oldest events when the consumer
     * falls behind. Releasing the pointer ends the subscription.
     */
    std::shared_ptr<core::Channel<core::DiscoveryEvent>> subscribe(size_t capacity = 256);

    /**
     * @brief Reinstates persisted jobs after a restart.
     *
     * Jobs that were still pending or running are marked failed.
     */
    void restoreJobs(std::vector<core::DiscoveryJob> jobs);

    /// Writes one device through the configured store, serialized with job persistence.
    void persistDevice(const core::Device& device);

    /// Writes one alert through the configured store, serialized with job persistence.
    void persistAlert(const core::Alert& alert);

    /// Jobs currently pending or running.
    [[nodiscard]] size_t activeJobCount() const;

    /// Starts the workers and, if enabled, the periodic timer.
    void start();

    /// Cancels running jobs, fails queued ones and joins the workers.
    void stop();

    [[nodiscard]] bool isRunning() const { return running_; }
    [[nodiscard]] const Options& options() const { return options_; }

private:
    struct JobEntry {
        core::DiscoveryJob job;
        std::shared_ptr<infra::ProbeRun> run;
    };

    void workerLoop(size_t index);
    void runJob(core::JobId jobId);
    void executeJob(core::JobId jobId);
    void finishJob(core::JobId jobId, const std::map<std::string, std::vector<core::UnitOutcome>>& units);

    void scheduleNextRun(std::chrono::steady_clock::duration delay);
    void runPeriodic();

    void publish(const core::DiscoveryEvent& event);
    void persistJob(const core::DiscoveryJob& job);
    void persistState(const std::vector<core::Device>& devices, const std::vector<core::AlertDelta>& deltas);
    void applyRetention();

    std::vector<core::ProbeTechnique> resolveTechniques(const std::vector<core::ProbeTechnique>& requested) const;

    infra::AsioContext& timerContext_;
    infra::ProberPool& pool_;
    DeviceRegistry& registry_;
    TopologyBuilder& topology_;
    AlertEvaluator& alerts_;
    Options options_;
    DiscoveryStores stores_;

    mutable std::mutex mutex_;
    mutable std::condition_variable jobsCv_;
    std::map<core::JobId, JobEntry> jobs_;
    std::deque<core::JobId> queue_;
    core::JobId nextJobId_{1};

    std::mutex subscribersMutex_;
    std::vector<std::weak_ptr<core::Channel<core::DiscoveryEvent>>> subscribers_;

    mutable std::mutex persistMutex_;

    std::mutex timerMutex_;
    asio::steady_timer timer_;

    std::vector<std::thread> workers_;
    std::atomic<bool> running_{false};
    bool stopping_{false}; ///< Guarded by mutex_
};

} // namespace vlanvision::engine
