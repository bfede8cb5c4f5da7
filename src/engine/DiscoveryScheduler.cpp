#include "engine/DiscoveryScheduler.hpp"

#include "core/types/Ipv4Network.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>
#include <stdexcept>

namespace vlanvision::engine {

namespace {

std::string techniqueList(const std::vector<core::ProbeTechnique>& techniques) {
    std::string result;
    for (auto technique : techniques) {
        if (!result.empty()) {
            result += ",";
        }
        result += core::probeTechniqueToString(technique);
    }
    return result;
}

/// A target counts as missed only if every technique timed out or found it unreachable.
bool isMiss(const std::vector<core::UnitOutcome>& units) {
    return !units.empty() && std::all_of(units.begin(), units.end(), [](const core::UnitOutcome& unit) {
               const auto* error = unit.error();
               return unit.resolution != core::UnitResolution::Skipped && error && error->countsAsMiss();
           });
}

} // namespace

DiscoveryScheduler::DiscoveryScheduler(infra::AsioContext& timerContext, infra::ProberPool& pool,
                                       DeviceRegistry& registry, TopologyBuilder& topology, AlertEvaluator& alerts,
                                       Options options, DiscoveryStores stores)
    : timerContext_(timerContext), pool_(pool), registry_(registry), topology_(topology), alerts_(alerts),
      options_(std::move(options)), stores_(std::move(stores)), timer_(timerContext.getContext()) {
    spdlog::debug("DiscoveryScheduler initialized with {} workers", options_.workerCount);
}

DiscoveryScheduler::~DiscoveryScheduler() {
    stop();

    std::lock_guard lock(subscribersMutex_);
    for (auto& weak : subscribers_) {
        if (auto channel = weak.lock()) {
            channel->close();
        }
    }
    subscribers_.clear();
}

std::vector<core::ProbeTechnique>
DiscoveryScheduler::resolveTechniques(const std::vector<core::ProbeTechnique>& requested) const {
    const auto& source = requested.empty() ? options_.techniques : requested;

    std::vector<core::ProbeTechnique> result;
    for (auto technique : source) {
        if (std::find(result.begin(), result.end(), technique) != result.end()) {
            continue;
        }
        if (!pool_.hasProbe(technique)) {
            throw std::invalid_argument("No probe available for technique '" +
                                        core::probeTechniqueToString(technique) + "'");
        }
        result.push_back(technique);
    }
    if (result.empty()) {
        throw std::invalid_argument("No discovery technique selected");
    }
    return result;
}

core::SubmitResult DiscoveryScheduler::submit(const std::string& cidr,
                                              const std::vector<core::ProbeTechnique>& techniques,
                                              core::JobOrigin origin) {
    auto network = core::Ipv4Network::parse(cidr);
    if (network.prefixLength() < MIN_PREFIX_LENGTH) {
        throw std::invalid_argument("Range " + network.toString() + " is larger than /" +
                                    std::to_string(MIN_PREFIX_LENGTH));
    }
    auto selected = resolveTechniques(techniques);

    core::DiscoveryJob created;
    {
        std::lock_guard lock(mutex_);
        if (stopping_) {
            throw std::runtime_error("Discovery scheduler is shutting down");
        }

        for (auto& [id, entry] : jobs_) {
            auto& job = entry.job;
            if (job.isActive() && core::Ipv4Network::parse(job.range).overlaps(network)) {
                ++job.coalescedRequests;
                spdlog::info("Discovery request for {} joined job {} ({})", network.toString(), id, job.range);
                return {id, job.state, true};
            }
        }

        auto targets = network.hostCount();
        created.id = nextJobId_++;
        created.range = network.toString();
        created.techniques = selected;
        created.origin = origin;
        created.state = core::JobState::Pending;
        created.createdAt = std::chrono::system_clock::now();
        created.targetCount = static_cast<int>(targets);
        created.unitsTotal = static_cast<int>(targets * selected.size());

        jobs_[created.id] = JobEntry{created, nullptr};
        queue_.push_back(created.id);
    }
    jobsCv_.notify_all();

    spdlog::info("Discovery job {} queued: {} via {} ({})", created.id, created.range, techniqueList(selected),
                 created.originToString());
    persistJob(created);
    return {created.id, created.state, false};
}

bool DiscoveryScheduler::cancel(core::JobId jobId) {
    std::shared_ptr<infra::ProbeRun> run;
    std::optional<core::DiscoveryJob> finishedPending;
    {
        std::lock_guard lock(mutex_);
        auto it = jobs_.find(jobId);
        if (it == jobs_.end() || !it->second.job.isActive()) {
            return false;
        }

        auto& job = it->second.job;
        job.cancelled = true;
        run = it->second.run;

        auto queued = std::find(queue_.begin(), queue_.end(), jobId);
        if (queued != queue_.end()) {
            // Never started: every target is skipped
            queue_.erase(queued);
            for (const auto& address : core::Ipv4Network::parse(job.range).hosts()) {
                job.outcomes[address] = core::TargetOutcome::Skipped;
            }
            job.state = core::JobState::Completed;
            job.finishedAt = std::chrono::system_clock::now();
            finishedPending = job;
        }
    }

    spdlog::info("Discovery job {} cancelled", jobId);
    if (run) {
        run->cancel();
    }
    if (finishedPending) {
        jobsCv_.notify_all();
        persistJob(*finishedPending);
        publish({core::DiscoveryEventKind::JobCompleted, finishedPending, std::nullopt});
    }
    return true;
}

std::optional<core::DiscoveryJob> DiscoveryScheduler::job(core::JobId jobId) const {
    {
        std::lock_guard lock(mutex_);
        auto it = jobs_.find(jobId);
        if (it != jobs_.end()) {
            return it->second.job;
        }
    }

    if (stores_.jobs) {
        std::lock_guard lock(persistMutex_);
        return stores_.jobs->findById(jobId);
    }
    return std::nullopt;
}

std::vector<core::DiscoveryJob> DiscoveryScheduler::jobs() const {
    std::lock_guard lock(mutex_);

    std::vector<core::DiscoveryJob> result;
    result.reserve(jobs_.size());
    for (auto it = jobs_.rbegin(); it != jobs_.rend(); ++it) {
        result.push_back(it->second.job);
    }
    return result;
}

std::optional<core::DiscoveryJob> DiscoveryScheduler::wait(core::JobId jobId,
                                                           std::chrono::milliseconds timeout) const {
    std::unique_lock lock(mutex_);
    jobsCv_.wait_for(lock, timeout, [this, jobId] {
        auto it = jobs_.find(jobId);
        return it == jobs_.end() || it->second.job.isFinished();
    });

    auto it = jobs_.find(jobId);
    if (it == jobs_.end() || it->second.job.isActive()) {
        return std::nullopt;
    }
    return it->second.job;
}

std::shared_ptr<core::Channel<core::DiscoveryEvent>> DiscoveryScheduler::subscribe(size_t capacity) {
    auto channel = std::make_shared<core::Channel<core::DiscoveryEvent>>(capacity);

    std::lock_guard lock(subscribersMutex_);
    subscribers_.push_back(channel);
    return channel;
}

void DiscoveryScheduler::publish(const core::DiscoveryEvent& event) {
    std::lock_guard lock(subscribersMutex_);

    std::erase_if(subscribers_, [](const auto& weak) { return weak.expired(); });
    for (auto& weak : subscribers_) {
        if (auto channel = weak.lock()) {
            channel->push(event);
        }
    }
}

void DiscoveryScheduler::restoreJobs(std::vector<core::DiscoveryJob> jobs) {
    auto now = std::chrono::system_clock::now();
    std::vector<core::DiscoveryJob> interrupted;

    {
        std::lock_guard lock(mutex_);
        for (auto& job : jobs) {
            if (job.isActive()) {
                job.state = core::JobState::Failed;
                job.errorMessage = "Interrupted by daemon restart";
                job.finishedAt = now;
                interrupted.push_back(job);
            }
            nextJobId_ = std::max(nextJobId_, job.id + 1);
            jobs_[job.id] = JobEntry{std::move(job), nullptr};
        }

        if (stores_.jobs) {
            std::lock_guard persistLock(persistMutex_);
            nextJobId_ = std::max(nextJobId_, stores_.jobs->maxId() + 1);
        }
    }

    for (const auto& job : interrupted) {
        persistJob(job);
    }
    spdlog::info("Restored {} discovery jobs ({} interrupted)", jobs.size(), interrupted.size());
}

void DiscoveryScheduler::start() {
    if (running_.exchange(true)) {
        return;
    }

    {
        std::lock_guard lock(mutex_);
        stopping_ = false;
    }

    auto count = std::max<size_t>(1, options_.workerCount);
    for (size_t i = 0; i < count; ++i) {
        workers_.emplace_back(&DiscoveryScheduler::workerLoop, this, i);
    }

    if (options_.periodicEnabled && !options_.periodicRanges.empty()) {
        if (!timerContext_.isRunning()) {
            spdlog::warn("Timer context '{}' is not running, periodic discovery waits for it", timerContext_.name());
        }
        std::lock_guard lock(timerMutex_);
        scheduleNextRun(std::chrono::seconds(0));
        spdlog::info("Periodic discovery of {} range(s) every {}s", options_.periodicRanges.size(),
                     options_.interval.count());
    }

    spdlog::info("DiscoveryScheduler started with {} workers", count);
}

void DiscoveryScheduler::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    {
        std::lock_guard lock(timerMutex_);
        timer_.cancel();
    }

    std::vector<std::shared_ptr<infra::ProbeRun>> runs;
    std::vector<core::DiscoveryJob> dropped;
    {
        std::lock_guard lock(mutex_);
        stopping_ = true;

        auto now = std::chrono::system_clock::now();
        for (auto id : queue_) {
            auto& job = jobs_.at(id).job;
            job.state = core::JobState::Failed;
            job.errorMessage = "Scheduler stopped before the job started";
            job.finishedAt = now;
            dropped.push_back(job);
        }
        queue_.clear();

        for (auto& [id, entry] : jobs_) {
            if (entry.run) {
                runs.push_back(entry.run);
            }
        }
    }
    jobsCv_.notify_all();

    for (auto& run : runs) {
        run->cancel();
    }
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();

    for (const auto& job : dropped) {
        persistJob(job);
        publish({core::DiscoveryEventKind::JobCompleted, job, std::nullopt});
    }

    spdlog::info("DiscoveryScheduler stopped");
}

void DiscoveryScheduler::scheduleNextRun(std::chrono::steady_clock::duration delay) {
    timer_.expires_after(delay);
    timer_.async_wait([this](const asio::error_code& ec) {
        if (ec || !running_) {
            return;
        }

        runPeriodic();

        std::lock_guard lock(timerMutex_);
        if (running_) {
            scheduleNextRun(options_.interval);
        }
    });
}

void DiscoveryScheduler::runPeriodic() {
    for (const auto& range : options_.periodicRanges) {
        try {
            auto result = submit(range, {}, core::JobOrigin::Periodic);
            if (result.coalesced) {
                spdlog::debug("Periodic discovery of {} folded into job {}", range, result.jobId);
            }
        } catch (const std::exception& e) {
            spdlog::error("Periodic discovery of {} not started: {}", range, e.what());
        }
    }
}

void DiscoveryScheduler::workerLoop(size_t index) {
    spdlog::debug("Discovery worker {} started", index);

    while (true) {
        core::JobId jobId = 0;
        {
            std::unique_lock lock(mutex_);
            jobsCv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (stopping_) {
                break;
            }
            jobId = queue_.front();
            queue_.pop_front();
        }
        runJob(jobId);
    }

    spdlog::debug("Discovery worker {} stopped", index);
}

void DiscoveryScheduler::runJob(core::JobId jobId) {
    try {
        executeJob(jobId);
    } catch (const std::exception& e) {
        spdlog::error("Discovery job {} failed: {}", jobId, e.what());

        core::DiscoveryJob failed;
        {
            std::lock_guard lock(mutex_);
            auto& entry = jobs_.at(jobId);
            entry.job.state = core::JobState::Failed;
            entry.job.errorMessage = e.what();
            entry.job.finishedAt = std::chrono::system_clock::now();
            entry.run.reset();
            failed = entry.job;
        }
        jobsCv_.notify_all();

        persistJob(failed);
        publish({core::DiscoveryEventKind::JobCompleted, failed, std::nullopt});
    }
}

void DiscoveryScheduler::executeJob(core::JobId jobId) {
    std::string range;
    std::vector<core::ProbeTechnique> techniques;
    {
        std::lock_guard lock(mutex_);
        auto& job = jobs_.at(jobId).job;
        job.state = core::JobState::Running;
        job.startedAt = std::chrono::system_clock::now();
        range = job.range;
        techniques = job.techniques;
    }
    jobsCv_.notify_all();

    spdlog::info("Discovery job {} started: {} via {}", jobId, range, techniqueList(techniques));

    auto targets = core::Ipv4Network::parse(range).hosts();
    auto deadline = std::chrono::steady_clock::now() + options_.jobTimeout;
    std::shared_ptr<infra::ProbeRun> run = pool_.run(targets, techniques, deadline);

    {
        std::lock_guard lock(mutex_);
        auto& entry = jobs_.at(jobId);
        entry.run = run;
        if (entry.job.cancelled || stopping_) {
            run->cancel();
        }
    }

    std::map<std::string, std::vector<core::UnitOutcome>> units;
    std::set<core::DeviceId> updatedDevices;
    std::set<std::string> authFailures;

    while (auto outcome = run->outcomes().next()) {
        std::optional<std::string> warning;

        if (outcome->succeeded()) {
            auto device = registry_.reconcile(*outcome->result());
            updatedDevices.insert(device.id);
        } else if (const auto* error = outcome->error()) {
            if (error->kind == core::ProbeErrorKind::AuthFailure && authFailures.insert(outcome->address).second) {
                warning = fmt::format("{} authentication failed for {}: {}",
                                      core::probeTechniqueToString(outcome->technique), outcome->address,
                                      error->message);
                spdlog::warn("Discovery job {}: {}", jobId, *warning);
            } else if (error->kind == core::ProbeErrorKind::Timeout) {
                spdlog::debug("{} probe of {} timed out", core::probeTechniqueToString(outcome->technique),
                              outcome->address);
            }
        }

        {
            std::lock_guard lock(mutex_);
            auto& job = jobs_.at(jobId).job;
            ++job.unitsResolved;
            job.devicesUpdated = static_cast<int>(updatedDevices.size());
            if (warning) {
                job.warnings.push_back(*warning);
            }
        }

        auto address = outcome->address;
        units[address].push_back(std::move(*outcome));
    }

    finishJob(jobId, units);
}

void DiscoveryScheduler::finishJob(core::JobId jobId,
                                   const std::map<std::string, std::vector<core::UnitOutcome>>& units) {
    std::map<std::string, core::TargetOutcome> outcomes;
    int misses = 0;
    for (const auto& [address, list] : units) {
        outcomes[address] = core::aggregateTargetOutcome(list);
        if (isMiss(list)) {
            if (registry_.recordMiss(address, *list.front().error())) {
                ++misses;
            }
        }
    }

    auto now = std::chrono::system_clock::now();
    if (options_.unseenRetireAfter.count() > 0) {
        registry_.markUnseen(now - options_.unseenRetireAfter);
    }

    auto devices = registry_.snapshot();
    topology_.update(devices);
    auto deltas = alerts_.evaluate(devices, now);
    persistState(registry_.snapshot(true), deltas);

    core::DiscoveryJob finished;
    {
        std::lock_guard lock(mutex_);
        auto& entry = jobs_.at(jobId);
        entry.job.outcomes = std::move(outcomes);
        entry.job.state = core::JobState::Completed;
        entry.job.finishedAt = now;
        entry.run.reset();
        finished = entry.job;
    }
    jobsCv_.notify_all();

    spdlog::info("Discovery job {} completed{}: {} targets, {} success, {} timeout, {} unreachable, {} error, "
                 "{} skipped, {} devices updated, {} known devices missed",
                 jobId, finished.cancelled ? " (cancelled)" : "", finished.targetCount,
                 finished.countOutcomes(core::TargetOutcome::Success),
                 finished.countOutcomes(core::TargetOutcome::Timeout),
                 finished.countOutcomes(core::TargetOutcome::Unreachable),
                 finished.countOutcomes(core::TargetOutcome::Error),
                 finished.countOutcomes(core::TargetOutcome::Skipped), finished.devicesUpdated, misses);

    persistJob(finished);
    applyRetention();

    for (const auto& delta : deltas) {
        publish({core::DiscoveryEventKind::Alert, std::nullopt, delta});
    }
    publish({core::DiscoveryEventKind::JobCompleted, finished, std::nullopt});
}

void DiscoveryScheduler::persistJob(const core::DiscoveryJob& job) {
    if (!stores_.jobs) {
        return;
    }

    std::lock_guard lock(persistMutex_);
    try {
        stores_.jobs->save(job);
    } catch (const std::exception& e) {
        spdlog::error("Failed to persist discovery job {}: {}", job.id, e.what());
    }
}

void DiscoveryScheduler::persistDevice(const core::Device& device) {
    if (!stores_.devices) {
        return;
    }

    std::lock_guard lock(persistMutex_);
    try {
        stores_.devices->save(device);
    } catch (const std::exception& e) {
        spdlog::error("Failed to persist device {}: {}", device.id, e.what());
    }
}

void DiscoveryScheduler::persistAlert(const core::Alert& alert) {
    if (!stores_.alerts) {
        return;
    }

    std::lock_guard lock(persistMutex_);
    try {
        stores_.alerts->save(alert);
    } catch (const std::exception& e) {
        spdlog::error("Failed to persist alert {}: {}", alert.id, e.what());
    }
}

size_t DiscoveryScheduler::activeJobCount() const {
    std::lock_guard lock(mutex_);
    return static_cast<size_t>(std::count_if(jobs_.begin(), jobs_.end(),
                                             [](const auto& entry) { return entry.second.job.isActive(); }));
}

void DiscoveryScheduler::persistState(const std::vector<core::Device>& devices,
                                      const std::vector<core::AlertDelta>& deltas) {
    std::lock_guard lock(persistMutex_);

    if (stores_.devices) {
        try {
            stores_.devices->saveSnapshot(devices);
        } catch (const std::exception& e) {
            spdlog::error("Failed to persist device snapshot: {}", e.what());
        }
    }

    if (stores_.alerts) {
        try {
            for (const auto& delta : deltas) {
                stores_.alerts->save(delta.alert);
            }
        } catch (const std::exception& e) {
            spdlog::error("Failed to persist alerts: {}", e.what());
        }
    }
}

void DiscoveryScheduler::applyRetention() {
    auto cutoff = std::chrono::system_clock::now() - options_.jobRetentionAge;
    size_t evicted = 0;

    {
        std::lock_guard lock(mutex_);

        std::vector<core::JobId> finished;
        for (const auto& [id, entry] : jobs_) {
            if (entry.job.isFinished()) {
                finished.push_back(id);
            }
        }

        // Oldest first, jobs_ is ordered by id
        size_t excess = finished.size() > options_.jobRetentionCount ? finished.size() - options_.jobRetentionCount
                                                                      : 0;
        for (size_t i = 0; i < finished.size(); ++i) {
            auto& job = jobs_.at(finished[i]).job;
            if (i < excess || job.createdAt < cutoff) {
                jobs_.erase(finished[i]);
                ++evicted;
            }
        }
    }

    if (stores_.jobs) {
        std::lock_guard lock(persistMutex_);
        try {
            stores_.jobs->deleteFinishedBefore(cutoff);
            stores_.jobs->trimFinished(static_cast<int>(options_.jobRetentionCount));
        } catch (const std::exception& e) {
            spdlog::error("Job retention cleanup failed: {}", e.what());
        }
    }

    if (evicted > 0) {
        spdlog::debug("Evicted {} finished discovery jobs", evicted);
    }
}

} // namespace vlanvision::engine
