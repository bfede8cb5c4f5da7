#include "infrastructure/network/ProberPool.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace vlanvision::infra {

namespace {

core::ProbeError deadlineError() {
    return core::ProbeError{core::ProbeErrorKind::Timeout, "Job deadline exceeded", {}};
}

core::ProbeError skippedError() {
    return core::ProbeError{core::ProbeErrorKind::Timeout, "Skipped after cancellation", {}};
}

} // namespace

bool ProbeRun::State::resolve(Unit& unit, core::UnitResolution resolution, core::ProbeOutcome outcome) {
    if (unit.resolved.exchange(true)) {
        return false;
    }

    channel.push(core::UnitOutcome{unit.address, unit.technique, resolution, std::move(outcome)});

    if (++resolvedCount == units.size()) {
        channel.close();
        std::lock_guard lock(mutex);
        cv.notify_all();
    }
    return true;
}

ProbeRun::ProbeRun(Key, std::shared_ptr<State> state) : state_(std::move(state)) {}

ProbeRun::~ProbeRun() {
    cancel();
    if (dispatcher_.joinable()) {
        dispatcher_.join();
    }
}

void ProbeRun::cancel() {
    if (!state_->cancelled.exchange(true)) {
        std::lock_guard lock(state_->mutex);
        state_->cv.notify_all();
    }
}

void ProbeRun::wait() {
    std::unique_lock lock(state_->mutex);
    state_->cv.wait(lock, [this] { return state_->allResolved(); });
}

bool ProbeRun::isFinished() const {
    return state_->allResolved();
}

ProberPool::ProberPool(AsioContext& context, Options options)
    : context_(context),
      options_(options),
      semaphore_(std::make_shared<std::counting_semaphore<>>(
          static_cast<std::ptrdiff_t>(std::max<size_t>(1, options.maxConcurrentProbes)))) {}

void ProberPool::registerProbe(std::shared_ptr<core::IProbe> probe) {
    std::lock_guard lock(mutex_);
    auto technique = probe->technique();
    probes_[technique] = std::move(probe);
    spdlog::debug("Registered {} probe", core::probeTechniqueToString(technique));
}

bool ProberPool::hasProbe(core::ProbeTechnique technique) const {
    std::lock_guard lock(mutex_);
    return probes_.contains(technique);
}

std::vector<core::ProbeTechnique> ProberPool::techniques() const {
    std::lock_guard lock(mutex_);
    std::vector<core::ProbeTechnique> result;
    for (const auto& [technique, probe] : probes_) {
        result.push_back(technique);
    }
    return result;
}

std::unique_ptr<ProbeRun> ProberPool::run(const std::vector<std::string>& targets,
                                          const std::vector<core::ProbeTechnique>& techniques,
                                          std::chrono::steady_clock::time_point deadline) {
    {
        std::lock_guard lock(mutex_);
        for (auto technique : techniques) {
            if (!probes_.contains(technique)) {
                throw std::invalid_argument("No probe registered for technique " +
                                            core::probeTechniqueToString(technique));
            }
        }
    }

    auto state = std::make_shared<ProbeRun::State>();
    state->deadline = deadline;
    state->units.reserve(targets.size() * techniques.size());
    for (const auto& address : targets) {
        for (auto technique : techniques) {
            auto unit = std::make_unique<ProbeRun::Unit>();
            unit->address = address;
            unit->technique = technique;
            state->units.push_back(std::move(unit));
        }
    }

    auto probeRun = std::make_unique<ProbeRun>(ProbeRun::Key{}, state);
    if (state->units.empty()) {
        state->channel.close();
        return probeRun;
    }

    spdlog::debug("Dispatching {} probe units over {} targets", state->units.size(), targets.size());
    probeRun->dispatcher_ = std::thread([this, state] { dispatch(state); });
    return probeRun;
}

void ProberPool::dispatch(std::shared_ptr<ProbeRun::State> state) {
    using Clock = std::chrono::steady_clock;

    size_t next = 0;
    bool deadlineReached = false;

    while (next < state->units.size()) {
        if (state->cancelled) {
            break;
        }
        auto now = Clock::now();
        if (now >= state->deadline) {
            deadlineReached = true;
            break;
        }

        auto wait = std::min<Clock::duration>(options_.dispatchTick, state->deadline - now);
        if (!semaphore_->try_acquire_for(wait)) {
            continue;
        }
        if (state->cancelled) {
            semaphore_->release();
            break;
        }

        auto& unit = *state->units[next++];
        std::shared_ptr<core::IProbe> probe;
        {
            std::lock_guard lock(mutex_);
            probe = probes_.at(unit.technique);
        }
        launch(state, unit, std::move(probe));
    }

    if (!deadlineReached && next < state->units.size()) {
        size_t skipped = 0;
        for (size_t i = next; i < state->units.size(); ++i) {
            if (state->resolve(*state->units[i], core::UnitResolution::Skipped, skippedError())) {
                ++skipped;
            }
        }
        spdlog::info("Probe run cancelled, {} units skipped", skipped);
    }

    // In-flight units complete normally unless the deadline passes first
    {
        std::unique_lock lock(state->mutex);
        state->cv.wait_until(lock, state->deadline, [&state] { return state->allResolved(); });
    }

    size_t expired = 0;
    for (auto& unit : state->units) {
        if (state->resolve(*unit, core::UnitResolution::DeadlineExceeded, deadlineError())) {
            ++expired;
        }
    }
    if (expired > 0) {
        spdlog::debug("{} probe units resolved as timeout at the job deadline", expired);
    }
}

void ProberPool::launch(const std::shared_ptr<ProbeRun::State>& state, ProbeRun::Unit& unit,
                        std::shared_ptr<core::IProbe> probe) {
    auto semaphore = semaphore_;
    auto timeout = options_.probeTimeout;
    auto* unitPtr = &unit;

    context_.post([state, unitPtr, probe = std::move(probe), semaphore, timeout]() {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            state->deadline - std::chrono::steady_clock::now());

        // Queued past the deadline: the dispatcher resolves the unit
        if (unitPtr->resolved || remaining.count() <= 0) {
            semaphore->release();
            return;
        }

        auto outcome = runProbe(*probe, unitPtr->address, std::min(timeout, remaining));
        semaphore->release();

        if (!state->resolve(*unitPtr, core::UnitResolution::Completed, std::move(outcome))) {
            spdlog::debug("Dropping late {} result for {}", core::probeTechniqueToString(unitPtr->technique),
                          unitPtr->address);
        }
    });
}

core::ProbeOutcome ProberPool::runProbe(core::IProbe& probe, const std::string& address,
                                        std::chrono::milliseconds timeout) {
    try {
        return probe.probe(address, timeout);
    } catch (const std::exception& e) {
        spdlog::warn("{} probe of {} threw: {}", core::probeTechniqueToString(probe.technique()), address, e.what());
        return core::ProbeError{core::ProbeErrorKind::MalformedResponse, std::string("probe failed: ") + e.what(), {}};
    }
}

} // namespace vlanvision::infra
