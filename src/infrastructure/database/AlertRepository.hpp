#pragma once

#include "core/types/Alert.hpp"
#include "infrastructure/database/Database.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace vlanvision::infra {

/**
 * @brief Records alert opens, refreshes, closes and acknowledgements.
 */
class AlertRepository {
public:
    explicit AlertRepository(std::shared_ptr<Database> db);

    /**
     * @brief Inserts the alert or updates the stored row with the same id.
     */
    void save(const core::Alert& alert);

    std::vector<core::Alert> findOpen();
    std::vector<core::Alert> findRecent(int limit = 100);
    std::vector<core::Alert> findByDevice(core::DeviceId deviceId);

    /// Highest stored alert id, 0 if there are none.
    int64_t maxId();

    /**
     * @brief Deletes alerts resolved before @p cutoff.
     * @return Number of deleted alerts.
     */
    int deleteResolvedBefore(std::chrono::system_clock::time_point cutoff);

private:
    core::Alert rowToAlert(Statement& stmt);
    std::vector<core::Alert> select(const std::string& where, const std::function<void(Statement&)>& bind);

    std::shared_ptr<Database> db_;
};

} // namespace vlanvision::infra
