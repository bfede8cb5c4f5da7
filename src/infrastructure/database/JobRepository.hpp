#pragma once

#include "core/types/DiscoveryJob.hpp"
#include "infrastructure/database/Database.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <vector>

namespace vlanvision::infra {

/**
 * @brief Audit trail of discovery jobs and their per-target outcomes.
 */
class JobRepository {
public:
    explicit JobRepository(std::shared_ptr<Database> db);

    /**
     * @brief Inserts or replaces a job together with its outcomes.
     */
    void save(const core::DiscoveryJob& job);

    std::optional<core::DiscoveryJob> findById(core::JobId id);

    /**
     * @brief Most recent jobs first.
     * @param limit Maximum number of jobs returned.
     */
    std::vector<core::DiscoveryJob> findRecent(int limit = 100);

    /// Highest stored job id, 0 if there are none.
    core::JobId maxId();

    /**
     * @brief Deletes finished jobs created before @p cutoff.
     * @return Number of deleted jobs.
     */
    int deleteFinishedBefore(std::chrono::system_clock::time_point cutoff);

    /**
     * @brief Keeps only the newest @p keep finished jobs.
     * @return Number of deleted jobs.
     */
    int trimFinished(int keep);

    int count();

private:
    core::DiscoveryJob rowToJob(Statement& stmt);
    void loadOutcomes(core::DiscoveryJob& job);

    std::shared_ptr<Database> db_;
};

} // namespace vlanvision::infra
