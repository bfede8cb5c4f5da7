#pragma once

#include "core/types/Device.hpp"
#include "infrastructure/database/Database.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace vlanvision::infra {

/**
 * @brief Persists registry snapshots: devices with their interfaces,
 *        link-layer neighbors and IP history.
 *
 * Retired and merged records are stored too, so that device ids are never
 * handed out again after a restart.
 */
class DeviceRepository {
public:
    explicit DeviceRepository(std::shared_ptr<Database> db);

    /**
     * @brief Replaces the stored snapshot with @p devices in one transaction.
     */
    void saveSnapshot(const std::vector<core::Device>& devices);

    /**
     * @brief Inserts or replaces a single device and its owned rows.
     */
    void save(const core::Device& device);

    void remove(core::DeviceId id);

    std::optional<core::Device> findById(core::DeviceId id);

    /**
     * @brief Loads every stored device, ordered by id.
     */
    std::vector<core::Device> findAll();

    int count();

private:
    void insertDevice(const core::Device& device);
    void loadOwnedRows(core::Device& device);
    core::Device rowToDevice(Statement& stmt);

    std::shared_ptr<Database> db_;
};

} // namespace vlanvision::infra
