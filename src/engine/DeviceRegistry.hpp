#pragma once

#include "core/types/Device.hpp"
#include "core/types/ProbeResult.hpp"
#include "core/types/Topology.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace vlanvision::engine {

/**
 * @brief Authoritative store of discovered devices.
 *
 * All mutation goes through reconcile(), recordMiss(), markUnseen(), retire()
 * and restore(); readers get value copies. A single writer holds the lock at
 * a time while readers may proceed concurrently.
 *
 * Reconciliation matches an active record by MAC, then by IP, and creates a
 * new record otherwise. IP matches are refused when both sides carry
 * different MACs. When a record moves to an IP held by another active record,
 * a MAC-less holder is merged into the mover and retired; a holder with its
 * own MAC is displaced, becomes unknown and keeps no current IP until it is
 * observed again. Misses of its last address still count against it while no
 * other device holds that address.
 *
 * A result observed before the device's last sighting never changes the
 * device; its address is only recorded in the history.
 */
class DeviceRegistry {
public:
    static constexpr size_t MAX_IP_HISTORY = 16;

    /**
     * @param missThreshold Consecutive misses after which a device is down.
     */
    explicit DeviceRegistry(int missThreshold = 3);

    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    /**
     * @brief Merges a successful probe result into the registry.
     * @return Copy of the updated or created device.
     */
    core::Device reconcile(const core::ProbeResult& result);

    /**
     * @brief Records a failed probe of @p address.
     *
     * Timeouts and unreachable errors count as misses; other errors leave the
     * device untouched. An address no active device holds is attributed to a
     * device displaced from it.
     *
     * @return The device charged with the miss, or nullopt if there is none.
     */
    std::optional<core::Device> recordMiss(const std::string& address, const core::ProbeError& error);

    /**
     * @brief Retires every active device last seen before @p cutoff.
     * @return Ids of the retired devices.
     */
    std::vector<core::DeviceId> markUnseen(std::chrono::system_clock::time_point cutoff);

    /**
     * @brief Retires a device on operator request.
     * @return The retired device, or nullopt if it is unknown or already retired.
     */
    std::optional<core::Device> retire(core::DeviceId id);

    /**
     * @brief Replaces the registry contents with persisted devices.
     *
     * Active records restart in the unknown state. Id assignment continues
     * after the highest restored id.
     */
    void restore(std::vector<core::Device> devices);

    /// Devices ordered by id; retired records only on request.
    [[nodiscard]] std::vector<core::Device> snapshot(bool includeRetired = false) const;

    [[nodiscard]] std::optional<core::Device> find(core::DeviceId id) const;
    [[nodiscard]] std::optional<core::Device> findByIp(const std::string& address) const;
    [[nodiscard]] std::optional<core::Device> findByMac(const std::string& mac) const;

    /// VLAN membership of active devices, ordered by VLAN id.
    [[nodiscard]] std::vector<core::VlanGroup> vlanGroups() const;

    [[nodiscard]] size_t activeCount() const;

    /// Incremented on every mutation.
    [[nodiscard]] uint64_t version() const { return version_; }

    [[nodiscard]] int missThreshold() const { return missThreshold_; }
    void setMissThreshold(int threshold);

private:
    core::Device* findActiveByIpLocked(const std::string& address, core::DeviceId except = 0);
    core::Device* findActiveByMacLocked(const std::string& mac);
    /// Active device without a current address whose last address was @p address.
    core::Device* findDisplacedFromLocked(const std::string& address);
    void moveAddressLocked(core::Device& device, const std::string& address);
    void applyAttributes(core::Device& device, const core::ProbeResult& result,
                         std::chrono::system_clock::time_point observedAt);
    void updateInterfaces(core::Device& device, std::vector<core::Interface> interfaces,
                          std::chrono::system_clock::time_point observedAt);
    static void addHistory(core::Device& device, const std::string& address,
                           std::chrono::system_clock::time_point lastSeen);

    mutable std::shared_mutex mutex_;
    std::map<core::DeviceId, core::Device> devices_;
    std::map<core::DeviceId, std::chrono::system_clock::time_point> interfaceSampleTimes_;
    core::DeviceId nextId_{1};
    int missThreshold_;
    std::atomic<uint64_t> version_{0};
};

} // namespace vlanvision::engine
