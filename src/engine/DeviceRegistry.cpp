#include "engine/DeviceRegistry.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>

namespace vlanvision::engine {

namespace {

using TimePoint = std::chrono::system_clock::time_point;

/// Utilization of the busier direction in percent of ifSpeed.
std::optional<double> utilizationBetween(const core::Interface& previous, const core::Interface& current,
                                         double seconds) {
    if (seconds <= 0.0 || current.speedBps == 0) {
        return std::nullopt;
    }
    // Counter wrap or agent restart
    if (current.inOctets < previous.inOctets || current.outOctets < previous.outOctets) {
        return std::nullopt;
    }
    auto delta = std::max(current.inOctets - previous.inOctets, current.outOctets - previous.outOctets);
    double bitsPerSecond = static_cast<double>(delta) * 8.0 / seconds;
    double percent = bitsPerSecond / static_cast<double>(current.speedBps) * 100.0;
    return std::clamp(percent, 0.0, 100.0);
}

} // namespace

DeviceRegistry::DeviceRegistry(int missThreshold) : missThreshold_(std::max(1, missThreshold)) {}

void DeviceRegistry::setMissThreshold(int threshold) {
    std::unique_lock lock(mutex_);
    missThreshold_ = std::max(1, threshold);
}

core::Device* DeviceRegistry::findActiveByIpLocked(const std::string& address, core::DeviceId except) {
    if (address.empty()) {
        return nullptr;
    }
    for (auto& [id, device] : devices_) {
        if (id != except && device.isActive() && device.ipAddress == address) {
            return &device;
        }
    }
    return nullptr;
}

core::Device* DeviceRegistry::findDisplacedFromLocked(const std::string& address) {
    if (address.empty()) {
        return nullptr;
    }
    for (auto& [id, device] : devices_) {
        if (device.isActive() && device.ipAddress.empty() && !device.ipHistory.empty() &&
            device.ipHistory.back().address == address) {
            return &device;
        }
    }
    return nullptr;
}

core::Device* DeviceRegistry::findActiveByMacLocked(const std::string& mac) {
    if (mac.empty()) {
        return nullptr;
    }
    for (auto& [id, device] : devices_) {
        if (device.isActive() && device.macAddress == mac) {
            return &device;
        }
    }
    return nullptr;
}

void DeviceRegistry::addHistory(core::Device& device, const std::string& address, TimePoint lastSeen) {
    if (address.empty()) {
        return;
    }
    auto& history = device.ipHistory;
    history.erase(std::remove_if(history.begin(), history.end(),
                                 [&address](const core::IpHistoryEntry& entry) { return entry.address == address; }),
                  history.end());
    history.push_back({address, lastSeen});
    if (history.size() > MAX_IP_HISTORY) {
        history.erase(history.begin(), history.begin() + static_cast<std::ptrdiff_t>(history.size() - MAX_IP_HISTORY));
    }
}

void DeviceRegistry::moveAddressLocked(core::Device& device, const std::string& address) {
    if (device.ipAddress == address) {
        return;
    }

    if (auto* holder = findActiveByIpLocked(address, device.id)) {
        if (!holder->hasMac()) {
            // Same host seen first without a MAC
            spdlog::info("Merging device {} into {} ({} now identified by MAC {})", holder->id, device.id, address,
                         device.macAddress);
            for (const auto& entry : holder->ipHistory) {
                addHistory(device, entry.address, entry.lastSeen);
            }
            if (device.hostname.empty()) {
                device.hostname = holder->hostname;
            }
            holder->reachability = core::Reachability::Retired;
            holder->mergedInto = device.id;
            interfaceSampleTimes_.erase(holder->id);
        } else {
            spdlog::info("Address {} moved from device {} ({}) to device {} ({})", address, holder->id,
                         holder->macAddress, device.id, device.macAddress);
            addHistory(*holder, holder->ipAddress, holder->lastSeen);
            holder->ipAddress.clear();
            // Nothing is known about the displaced device until it answers somewhere again
            holder->reachability = core::Reachability::Unknown;
        }
    }

    if (!device.ipAddress.empty()) {
        addHistory(device, device.ipAddress, device.lastSeen);
    }
    device.ipAddress = address;
}

void DeviceRegistry::updateInterfaces(core::Device& device, std::vector<core::Interface> interfaces,
                                      TimePoint observedAt) {
    auto previousTime = interfaceSampleTimes_.find(device.id);
    if (previousTime != interfaceSampleTimes_.end()) {
        double seconds = std::chrono::duration<double>(observedAt - previousTime->second).count();
        for (auto& iface : interfaces) {
            if (const auto* previous = device.findInterface(iface.index)) {
                iface.utilizationPercent = utilizationBetween(*previous, iface, seconds);
            }
        }
    }
    interfaceSampleTimes_[device.id] = observedAt;
    device.interfaces = std::move(interfaces);
}

void DeviceRegistry::applyAttributes(core::Device& device, const core::ProbeResult& result, TimePoint observedAt) {
    if (result.hostname && !result.hostname->empty()) {
        device.hostname = *result.hostname;
    }
    if (result.sysDescr) {
        device.sysDescr = *result.sysDescr;
    }
    if (result.sysObjectId) {
        device.sysObjectId = *result.sysObjectId;
    }
    if (result.location) {
        device.location = *result.location;
    }
    if (result.vendor && !result.vendor->empty()) {
        device.vendor = *result.vendor;
    }
    // An unclassifiable answer does not erase an earlier classification
    if (result.deviceClass &&
        (*result.deviceClass != core::DeviceClass::Unknown || device.deviceClass == core::DeviceClass::Unknown)) {
        device.deviceClass = *result.deviceClass;
    }
    if (result.vlanId && *result.vlanId >= 1 && *result.vlanId <= 4094) {
        device.vlanId = result.vlanId;
    }
    if (result.cpuPercent) {
        device.cpuPercent = result.cpuPercent;
    }
    if (result.uptimeTicks) {
        device.uptimeTicks = result.uptimeTicks;
    }
    if (result.interfaces) {
        updateInterfaces(device, *result.interfaces, observedAt);
    }
    if (result.neighbors) {
        device.neighbors = *result.neighbors;
    }
}

core::Device DeviceRegistry::reconcile(const core::ProbeResult& result) {
    auto observedAt = result.observedAt == TimePoint{} ? std::chrono::system_clock::now() : result.observedAt;
    std::optional<std::string> mac;
    if (result.macAddress) {
        mac = core::normalizeMac(*result.macAddress);
    }

    std::unique_lock lock(mutex_);

    core::Device* device = nullptr;
    if (mac) {
        device = findActiveByMacLocked(*mac);
    }
    if (!device) {
        auto* byIp = findActiveByIpLocked(result.address);
        if (byIp && !(mac && byIp->hasMac() && byIp->macAddress != *mac)) {
            device = byIp;
        }
    }

    bool created = false;
    if (!device) {
        core::Device fresh;
        fresh.id = nextId_++;
        fresh.firstSeen = observedAt;
        fresh.lastSeen = observedAt;
        device = &devices_.emplace(fresh.id, std::move(fresh)).first->second;
        created = true;
    }

    if (mac && device->macAddress != *mac) {
        device->macAddress = *mac;
    }

    // A result older than the last sighting only contributes its address to the history
    if (!created && observedAt < device->lastSeen) {
        if (device->ipAddress != result.address) {
            addHistory(*device, result.address, observedAt);
            ++version_;
        }
        spdlog::debug("Ignoring attributes of stale result for device {} from {}", device->id, result.address);
        return *device;
    }

    if (device->ipAddress != result.address) {
        moveAddressLocked(*device, result.address);
    }

    applyAttributes(*device, result, observedAt);

    device->reachability = core::Reachability::Up;
    device->consecutiveMisses = 0;
    device->lastSeen = observedAt;
    ++version_;

    if (created) {
        spdlog::info("New device {} at {} ({})", device->id, device->ipAddress,
                     device->macAddress.empty() ? "no MAC" : device->macAddress);
    }
    return *device;
}

std::optional<core::Device> DeviceRegistry::recordMiss(const std::string& address, const core::ProbeError& error) {
    std::unique_lock lock(mutex_);

    auto* device = findActiveByIpLocked(address);
    if (!device) {
        device = findDisplacedFromLocked(address);
    }
    if (!device) {
        return std::nullopt;
    }
    if (!error.countsAsMiss()) {
        return *device;
    }

    ++device->consecutiveMisses;
    auto previous = device->reachability;
    device->reachability =
        device->consecutiveMisses >= missThreshold_ ? core::Reachability::Down : core::Reachability::Degraded;
    ++version_;

    if (previous != device->reachability) {
        spdlog::info("Device {} ({}) is now {} after {} missed probes", device->id, address,
                     core::reachabilityToString(device->reachability), device->consecutiveMisses);
    }
    return *device;
}

std::vector<core::DeviceId> DeviceRegistry::markUnseen(TimePoint cutoff) {
    std::unique_lock lock(mutex_);

    std::vector<core::DeviceId> retired;
    for (auto& [id, device] : devices_) {
        if (device.isActive() && device.lastSeen < cutoff) {
            device.reachability = core::Reachability::Retired;
            interfaceSampleTimes_.erase(id);
            retired.push_back(id);
        }
    }
    if (!retired.empty()) {
        ++version_;
        spdlog::info("Retired {} devices not seen since cutoff", retired.size());
    }
    return retired;
}

std::optional<core::Device> DeviceRegistry::retire(core::DeviceId id) {
    std::unique_lock lock(mutex_);

    auto it = devices_.find(id);
    if (it == devices_.end() || !it->second.isActive()) {
        return std::nullopt;
    }
    it->second.reachability = core::Reachability::Retired;
    interfaceSampleTimes_.erase(id);
    ++version_;
    spdlog::info("Device {} retired by operator", id);
    return it->second;
}

void DeviceRegistry::restore(std::vector<core::Device> devices) {
    std::unique_lock lock(mutex_);

    devices_.clear();
    interfaceSampleTimes_.clear();
    nextId_ = 1;
    for (auto& device : devices) {
        if (device.isActive()) {
            device.reachability = core::Reachability::Unknown;
            device.consecutiveMisses = 0;
        }
        nextId_ = std::max(nextId_, device.id + 1);
        devices_[device.id] = std::move(device);
    }
    ++version_;
    spdlog::info("Restored {} device records, next id {}", devices_.size(), nextId_);
}

std::vector<core::Device> DeviceRegistry::snapshot(bool includeRetired) const {
    std::shared_lock lock(mutex_);

    std::vector<core::Device> result;
    result.reserve(devices_.size());
    for (const auto& [id, device] : devices_) {
        if (includeRetired || device.isActive()) {
            result.push_back(device);
        }
    }
    return result;
}

std::optional<core::Device> DeviceRegistry::find(core::DeviceId id) const {
    std::shared_lock lock(mutex_);
    auto it = devices_.find(id);
    if (it == devices_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<core::Device> DeviceRegistry::findByIp(const std::string& address) const {
    std::shared_lock lock(mutex_);
    for (const auto& [id, device] : devices_) {
        if (device.isActive() && !address.empty() && device.ipAddress == address) {
            return device;
        }
    }
    return std::nullopt;
}

std::optional<core::Device> DeviceRegistry::findByMac(const std::string& mac) const {
    auto normalized = core::normalizeMac(mac);
    if (!normalized) {
        return std::nullopt;
    }

    std::shared_lock lock(mutex_);
    for (const auto& [id, device] : devices_) {
        if (device.isActive() && device.macAddress == *normalized) {
            return device;
        }
    }
    return std::nullopt;
}

std::vector<core::VlanGroup> DeviceRegistry::vlanGroups() const {
    std::shared_lock lock(mutex_);

    std::map<int, core::VlanGroup> groups;
    for (const auto& [id, device] : devices_) {
        if (device.isActive() && device.vlanId) {
            auto& group = groups[*device.vlanId];
            group.vlanId = *device.vlanId;
            group.members.insert(id);
        }
    }

    std::vector<core::VlanGroup> result;
    result.reserve(groups.size());
    for (auto& [vlan, group] : groups) {
        result.push_back(std::move(group));
    }
    return result;
}

size_t DeviceRegistry::activeCount() const {
    std::shared_lock lock(mutex_);
    return static_cast<size_t>(std::count_if(devices_.begin(), devices_.end(),
                                             [](const auto& entry) { return entry.second.isActive(); }));
}

} // namespace vlanvision::engine
