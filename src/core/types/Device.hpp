/**
 * @file Device.hpp
 * @brief Discovered device, interface and neighbor types.
 *
 * A Device is the registry's unit of identity. Interfaces and link-layer
 * neighbors are owned by their Device and travel with it in snapshots.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vlanvision::core {

using DeviceId = int64_t;

/**
 * @brief Closed set of device classes exposed as `device_type`.
 */
enum class DeviceClass : int {
    Unknown = 0,     ///< Classification failed or no data
    Switch = 1,      ///< Layer 2/3 switch
    Router = 2,      ///< Router
    Firewall = 3,    ///< Firewall or security appliance
    Server = 4,      ///< General purpose host
    AccessPoint = 5  ///< Wireless access point
};

/**
 * @brief Reachability state of a device record.
 *
 * Retired is terminal: a retired record is never matched again.
 */
enum class Reachability : int {
    Unknown = 0,  ///< Never probed since creation or restore
    Up = 1,       ///< Last probe succeeded
    Degraded = 2, ///< Missed at least one probe, below the down threshold
    Down = 3,     ///< Missed the configured number of consecutive probes
    Retired = 4   ///< Removed by an operator or the unseen sweep
};

/**
 * @brief ifOperStatus / ifAdminStatus values (IF-MIB numbering).
 */
enum class InterfaceStatus : int {
    Up = 1,
    Down = 2,
    Testing = 3,
    Unknown = 4,
    Dormant = 5,
    NotPresent = 6,
    LowerLayerDown = 7
};

/**
 * @brief Network interface owned by a device.
 */
struct Interface {
    int32_t index{0};                                   ///< ifIndex
    std::string name;                                   ///< ifDescr
    std::string macAddress;                             ///< Normalized ifPhysAddress, may be empty
    InterfaceStatus adminStatus{InterfaceStatus::Unknown}; ///< Administrative status
    InterfaceStatus operStatus{InterfaceStatus::Unknown};  ///< Operational status
    uint64_t speedBps{0};                               ///< ifSpeed in bits per second
    uint64_t inOctets{0};                               ///< ifInOctets
    uint64_t outOctets{0};                              ///< ifOutOctets
    uint64_t inErrors{0};                               ///< ifInErrors
    uint64_t outErrors{0};                              ///< ifOutErrors
    std::optional<double> utilizationPercent;           ///< Derived from successive octet samples

    [[nodiscard]] uint64_t totalErrors() const { return inErrors + outErrors; }
    [[nodiscard]] bool isOperational() const { return operStatus == InterfaceStatus::Up; }

    bool operator==(const Interface& other) const = default;
};

enum class NeighborProtocol : int { Cdp = 0, Lldp = 1 };

/**
 * @brief Link-layer neighbor reported by CDP or LLDP.
 */
struct LinkNeighbor {
    NeighborProtocol protocol{NeighborProtocol::Cdp};
    std::string localPort;        ///< Local port name or "ifIndex N"
    std::string remoteDeviceId;   ///< CDP device id or LLDP system name
    std::string remotePort;       ///< Remote port identifier
    std::string remoteAddress;    ///< Remote management IPv4 address, may be empty
    std::string remoteChassisMac; ///< LLDP chassis id when it is a MAC address
    std::string remotePlatform;   ///< CDP platform string

    bool operator==(const LinkNeighbor& other) const = default;
};

/**
 * @brief Previously held IP address of a device.
 */
struct IpHistoryEntry {
    std::string address;
    std::chrono::system_clock::time_point lastSeen;

    bool operator==(const IpHistoryEntry& other) const = default;
};

struct Device {
    DeviceId id{0};
    std::string ipAddress;   ///< Current address; empty only after displacement by another device
    std::string macAddress;  ///< Normalized MAC, empty when unknown
    std::string hostname;
    DeviceClass deviceClass{DeviceClass::Unknown};
    std::string vendor;
    std::string sysDescr;
    std::string sysObjectId;
    std::string location;
    std::optional<int> vlanId;
    std::optional<double> cpuPercent;
    std::optional<uint64_t> uptimeTicks;
    Reachability reachability{Reachability::Unknown};
    int consecutiveMisses{0};
    std::optional<DeviceId> mergedInto; ///< Set when this record was absorbed by a MAC match
    std::chrono::system_clock::time_point firstSeen;
    std::chrono::system_clock::time_point lastSeen;
    std::vector<Interface> interfaces;
    std::vector<LinkNeighbor> neighbors;
    std::vector<IpHistoryEntry> ipHistory;

    [[nodiscard]] bool isActive() const { return reachability != Reachability::Retired; }
    [[nodiscard]] bool hasMac() const { return !macAddress.empty(); }
    [[nodiscard]] std::string displayName() const { return hostname.empty() ? ipAddress : hostname; }
    [[nodiscard]] const Interface* findInterface(int32_t index) const;

    [[nodiscard]] std::string classToString() const;
    [[nodiscard]] std::string reachabilityToString() const;

    bool operator==(const Device& other) const = default;
};

std::string deviceClassToString(DeviceClass deviceClass);
DeviceClass deviceClassFromString(const std::string& str);

std::string reachabilityToString(Reachability reachability);
Reachability reachabilityFromString(const std::string& str);

std::string interfaceStatusToString(InterfaceStatus status);
InterfaceStatus interfaceStatusFromInt(int64_t value);

std::string neighborProtocolToString(NeighborProtocol protocol);

/**
 * @brief Normalizes a MAC address to upper-case colon notation.
 *
 * Accepts `aa:bb:cc:dd:ee:ff`, `aa-bb-cc-dd-ee-ff`, `aabb.ccdd.eeff` and bare hex.
 * All-zero and broadcast addresses are rejected.
 *
 * @return The normalized form, or std::nullopt if the input is not a usable MAC.
 */
std::optional<std::string> normalizeMac(const std::string& mac);

/**
 * @brief Formats six raw bytes (e.g. an ifPhysAddress octet string) as a MAC.
 */
std::optional<std::string> macFromBytes(const std::string& bytes);

} // namespace vlanvision::core
