#pragma once

#include "core/Channel.hpp"
#include "core/services/IProbe.hpp"
#include "core/types/DiscoveryJob.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <semaphore>
#include <string>
#include <thread>
#include <vector>

namespace vlanvision::infra {

/**
 * @brief One fan-out of targets x techniques started by ProberPool::run().
 *
 * Outcomes are streamed through outcomes() as units resolve; the channel is
 * closed once every unit has been resolved exactly once. Destroying the run
 * cancels it and waits for the dispatcher, but not for probes already handed
 * to the pool.
 */
class ProbeRun {
    struct State;

public:
    /// Restricts construction to ProberPool::run().
    class Key {
        friend class ProberPool;
        Key() = default;
    };

    ProbeRun(Key, std::shared_ptr<State> state);
    ~ProbeRun();

    ProbeRun(const ProbeRun&) = delete;
    ProbeRun& operator=(const ProbeRun&) = delete;

    /// Finite stream of unit outcomes, closed after the last unit.
    core::Channel<core::UnitOutcome>& outcomes() { return state_->channel; }

    /**
     * @brief Stops dispatching new units within one dispatcher tick.
     *
     * Units not yet dispatched resolve as Skipped; in-flight probes finish
     * and are streamed normally.
     */
    void cancel();

    /// Blocks until every unit has resolved.
    void wait();

    [[nodiscard]] bool isCancelled() const { return state_->cancelled; }
    [[nodiscard]] bool isFinished() const;
    [[nodiscard]] size_t unitCount() const { return state_->units.size(); }
    [[nodiscard]] size_t resolvedCount() const { return state_->resolvedCount; }

private:
    friend class ProberPool;

    struct Unit {
        std::string address;
        core::ProbeTechnique technique{core::ProbeTechnique::Snmp};
        std::atomic<bool> resolved{false};
    };

    struct State {
        std::vector<std::unique_ptr<Unit>> units;
        core::Channel<core::UnitOutcome> channel;
        std::atomic<bool> cancelled{false};
        std::atomic<size_t> resolvedCount{0};
        std::chrono::steady_clock::time_point deadline;
        std::mutex mutex;
        std::condition_variable cv;

        /// Resolves a unit once; later attempts are dropped and return false.
        bool resolve(Unit& unit, core::UnitResolution resolution, core::ProbeOutcome outcome);
        [[nodiscard]] bool allResolved() const { return resolvedCount == units.size(); }
    };

    std::shared_ptr<State> state_;
    std::thread dispatcher_;
};

/**
 * @brief Bounded concurrent executor for discovery probes.
 *
 * Probes run on the threads of a dedicated AsioContext. A counting semaphore
 * shared by all runs bounds the number of probes in flight, so concurrent
 * jobs together never exceed max_concurrent_probes.
 *
 * @note The pool must outlive every ProbeRun it returns.
 */
class ProberPool {
public:
    struct Options {
        size_t maxConcurrentProbes{50};
        std::chrono::milliseconds probeTimeout{std::chrono::milliseconds(2000)}; ///< Per-unit upper bound
        std::chrono::milliseconds dispatchTick{std::chrono::milliseconds(50)};
    };

    ProberPool(AsioContext& context, Options options);

    ProberPool(const ProberPool&) = delete;
    ProberPool& operator=(const ProberPool&) = delete;

    /// Registers the probe for its technique, replacing any previous one.
    void registerProbe(std::shared_ptr<core::IProbe> probe);

    [[nodiscard]] bool hasProbe(core::ProbeTechnique technique) const;
    [[nodiscard]] std::vector<core::ProbeTechnique> techniques() const;
    [[nodiscard]] const Options& options() const { return options_; }

    /**
     * @brief Starts probing every target with every technique.
     * @param deadline Units unresolved at this point resolve as Timeout.
     * @throws std::invalid_argument if a technique has no registered probe.
     */
    std::unique_ptr<ProbeRun> run(const std::vector<std::string>& targets,
                                  const std::vector<core::ProbeTechnique>& techniques,
                                  std::chrono::steady_clock::time_point deadline);

private:
    void dispatch(std::shared_ptr<ProbeRun::State> state);
    void launch(const std::shared_ptr<ProbeRun::State>& state, ProbeRun::Unit& unit,
                std::shared_ptr<core::IProbe> probe);

    static core::ProbeOutcome runProbe(core::IProbe& probe, const std::string& address,
                                       std::chrono::milliseconds timeout);

    AsioContext& context_;
    Options options_;
    std::shared_ptr<std::counting_semaphore<>> semaphore_;

    mutable std::mutex mutex_;
    std::map<core::ProbeTechnique, std::shared_ptr<core::IProbe>> probes_;
};

} // namespace vlanvision::infra
