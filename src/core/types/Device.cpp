#include "core/types/Device.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace vlanvision::core {

const Interface* Device::findInterface(int32_t index) const {
    for (const auto& iface : interfaces) {
        if (iface.index == index) {
            return &iface;
        }
    }
    return nullptr;
}

std::string Device::classToString() const {
    return deviceClassToString(deviceClass);
}

std::string Device::reachabilityToString() const {
    return core::reachabilityToString(reachability);
}

std::string deviceClassToString(DeviceClass deviceClass) {
    switch (deviceClass) {
    case DeviceClass::Switch:
        return "switch";
    case DeviceClass::Router:
        return "router";
    case DeviceClass::Firewall:
        return "firewall";
    case DeviceClass::Server:
        return "server";
    case DeviceClass::AccessPoint:
        return "access_point";
    case DeviceClass::Unknown:
        return "unknown";
    }
    return "unknown";
}

DeviceClass deviceClassFromString(const std::string& str) {
    if (str == "switch")
        return DeviceClass::Switch;
    if (str == "router")
        return DeviceClass::Router;
    if (str == "firewall")
        return DeviceClass::Firewall;
    if (str == "server")
        return DeviceClass::Server;
    if (str == "access_point")
        return DeviceClass::AccessPoint;
    return DeviceClass::Unknown;
}

std::string reachabilityToString(Reachability reachability) {
    switch (reachability) {
    case Reachability::Unknown:
        return "unknown";
    case Reachability::Up:
        return "up";
    case Reachability::Degraded:
        return "degraded";
    case Reachability::Down:
        return "down";
    case Reachability::Retired:
        return "retired";
    }
    return "unknown";
}

Reachability reachabilityFromString(const std::string& str) {
    if (str == "up")
        return Reachability::Up;
    if (str == "degraded")
        return Reachability::Degraded;
    if (str == "down")
        return Reachability::Down;
    if (str == "retired")
        return Reachability::Retired;
    return Reachability::Unknown;
}

std::string interfaceStatusToString(InterfaceStatus status) {
    switch (status) {
    case InterfaceStatus::Up:
        return "up";
    case InterfaceStatus::Down:
        return "down";
    case InterfaceStatus::Testing:
        return "testing";
    case InterfaceStatus::Unknown:
        return "unknown";
    case InterfaceStatus::Dormant:
        return "dormant";
    case InterfaceStatus::NotPresent:
        return "not_present";
    case InterfaceStatus::LowerLayerDown:
        return "lower_layer_down";
    }
    return "unknown";
}

InterfaceStatus interfaceStatusFromInt(int64_t value) {
    if (value >= 1 && value <= 7) {
        return static_cast<InterfaceStatus>(value);
    }
    return InterfaceStatus::Unknown;
}

std::string neighborProtocolToString(NeighborProtocol protocol) {
    return protocol == NeighborProtocol::Lldp ? "lldp" : "cdp";
}

std::optional<std::string> normalizeMac(const std::string& mac) {
    std::string hex;
    hex.reserve(12);
    for (char c : mac) {
        if (std::isxdigit(static_cast<unsigned char>(c))) {
            hex.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        } else if (c != ':' && c != '-' && c != '.' && c != ' ') {
            return std::nullopt;
        }
    }

    if (hex.size() != 12) {
        return std::nullopt;
    }
    if (hex == "000000000000" || hex == "FFFFFFFFFFFF") {
        return std::nullopt;
    }

    std::string normalized;
    normalized.reserve(17);
    for (size_t i = 0; i < 12; i += 2) {
        if (!normalized.empty()) {
            normalized.push_back(':');
        }
        normalized.append(hex, i, 2);
    }
    return normalized;
}

std::optional<std::string> macFromBytes(const std::string& bytes) {
    if (bytes.size() != 6) {
        return std::nullopt;
    }

    char buffer[18];
    std::snprintf(buffer, sizeof(buffer), "%02X:%02X:%02X:%02X:%02X:%02X",
                  static_cast<unsigned char>(bytes[0]), static_cast<unsigned char>(bytes[1]),
                  static_cast<unsigned char>(bytes[2]), static_cast<unsigned char>(bytes[3]),
                  static_cast<unsigned char>(bytes[4]), static_cast<unsigned char>(bytes[5]));
    return normalizeMac(buffer);
}

} // namespace vlanvision::core
