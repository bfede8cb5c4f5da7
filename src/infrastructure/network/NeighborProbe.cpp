#include "infrastructure/network/NeighborProbe.hpp"

#include "infrastructure/network/SnmpClient.hpp"
#include "infrastructure/network/SnmpCodec.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace vlanvision::infra {

namespace {

constexpr uint32_t CDP_COL_ADDRESS = 4;
constexpr uint32_t CDP_COL_DEVICE_ID = 6;
constexpr uint32_t CDP_COL_DEVICE_PORT = 7;
constexpr uint32_t CDP_COL_PLATFORM = 8;

constexpr uint32_t LLDP_COL_CHASSIS_SUBTYPE = 4;
constexpr uint32_t LLDP_COL_CHASSIS_ID = 5;
constexpr uint32_t LLDP_COL_PORT_ID = 7;
constexpr uint32_t LLDP_COL_PORT_DESC = 8;
constexpr uint32_t LLDP_COL_SYS_NAME = 9;

constexpr int64_t LLDP_CHASSIS_MAC = 4;
constexpr int64_t LLDP_CHASSIS_NETWORK_ADDRESS = 5;
constexpr uint32_t IANA_FAMILY_IPV4 = 1;

bool isPrintable(const std::string& text) {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](char c) {
        return std::isprint(static_cast<unsigned char>(c)) != 0;
    });
}

std::string formatIpv4(const std::string& bytes) {
    return std::to_string(static_cast<uint8_t>(bytes[0])) + "." + std::to_string(static_cast<uint8_t>(bytes[1])) +
           "." + std::to_string(static_cast<uint8_t>(bytes[2])) + "." +
           std::to_string(static_cast<uint8_t>(bytes[3]));
}

std::string indexKey(const std::vector<uint32_t>& suffix, size_t from, size_t count) {
    std::vector<uint32_t> index(suffix.begin() + static_cast<std::ptrdiff_t>(from),
                                suffix.begin() + static_cast<std::ptrdiff_t>(std::min(suffix.size(), from + count)));
    return SnmpCodec::oidVectorToString(index);
}

std::string localPortName(uint32_t ifIndex, const std::map<int32_t, std::string>& ifNames) {
    auto it = ifNames.find(static_cast<int32_t>(ifIndex));
    if (it != ifNames.end() && !it->second.empty()) {
        return it->second;
    }
    return "ifIndex " + std::to_string(ifIndex);
}

} // namespace

NeighborProbe::NeighborProbe(std::shared_ptr<core::ISnmpClient> client) : client_(std::move(client)) {}

core::ProbeOutcome NeighborProbe::probe(const std::string& address, std::chrono::milliseconds timeout) {
    auto deadline = core::ISnmpClient::Clock::now() + timeout;

    auto cdp = client_->walk(address, core::SnmpOids::CDP_CACHE_ENTRY, deadline);
    if (cdp.errorKind != core::SnmpErrorKind::None) {
        return SnmpClient::toProbeError(cdp);
    }

    auto lldp = client_->walk(address, core::SnmpOids::LLDP_REM_ENTRY, deadline);
    core::SnmpResult manAddr;
    if (lldp.errorKind == core::SnmpErrorKind::None && !lldp.varbinds.empty()) {
        manAddr = client_->walk(address, core::SnmpOids::LLDP_REM_MAN_ADDR_IF_SUBTYPE, deadline);
    }

    core::ProbeResult result;
    result.address = address;
    result.technique = core::ProbeTechnique::Neighbor;
    result.observedAt = std::chrono::system_clock::now();

    auto neighbors = parseCdpCache(cdp.varbinds);
    auto lldpNeighbors = parseLldpRemote(lldp.varbinds, manAddr.varbinds);
    neighbors.insert(neighbors.end(), lldpNeighbors.begin(), lldpNeighbors.end());
    result.neighbors = std::move(neighbors);

    spdlog::debug("Neighbor probe on {} found {} CDP/LLDP neighbors", address, result.neighbors->size());
    return result;
}

std::vector<core::LinkNeighbor> NeighborProbe::parseCdpCache(const std::vector<core::SnmpVarBind>& rows,
                                                             const std::map<int32_t, std::string>& ifNames) {
    // Index is cdpCacheIfIndex.cdpCacheDeviceIndex
    std::map<std::string, core::LinkNeighbor> entries;

    for (const auto& vb : rows) {
        auto suffix = SnmpCodec::oidSuffix(core::SnmpOids::CDP_CACHE_ENTRY, vb.oid);
        if (suffix.size() < 3) {
            continue;
        }

        auto& neighbor = entries[indexKey(suffix, 1, 2)];
        neighbor.protocol = core::NeighborProtocol::Cdp;
        neighbor.localPort = localPortName(suffix[1], ifNames);

        switch (suffix[0]) {
        case CDP_COL_ADDRESS:
            if (vb.value.size() == 4) {
                neighbor.remoteAddress = formatIpv4(vb.value);
            }
            break;
        case CDP_COL_DEVICE_ID:
            neighbor.remoteDeviceId = vb.value;
            break;
        case CDP_COL_DEVICE_PORT:
            neighbor.remotePort = vb.value;
            break;
        case CDP_COL_PLATFORM:
            neighbor.remotePlatform = vb.value;
            break;
        default:
            break;
        }
    }

    std::vector<core::LinkNeighbor> neighbors;
    for (auto& [key, neighbor] : entries) {
        if (neighbor.remoteDeviceId.empty() && neighbor.remoteAddress.empty()) {
            continue;
        }
        neighbors.push_back(std::move(neighbor));
    }
    return neighbors;
}

std::vector<core::LinkNeighbor> NeighborProbe::parseLldpRemote(const std::vector<core::SnmpVarBind>& rows,
                                                               const std::vector<core::SnmpVarBind>& manAddrRows,
                                                               const std::map<int32_t, std::string>& ifNames) {
    struct RemoteEntry {
        core::LinkNeighbor neighbor;
        int64_t chassisSubtype{0};
        std::string chassisId;
        std::string portId;
        std::string portDesc;
    };

    // Index is lldpRemTimeMark.lldpRemLocalPortNum.lldpRemIndex
    std::map<std::string, RemoteEntry> entries;

    for (const auto& vb : rows) {
        auto suffix = SnmpCodec::oidSuffix(core::SnmpOids::LLDP_REM_ENTRY, vb.oid);
        if (suffix.size() < 4) {
            continue;
        }

        auto& entry = entries[indexKey(suffix, 1, 3)];
        entry.neighbor.protocol = core::NeighborProtocol::Lldp;
        entry.neighbor.localPort = localPortName(suffix[2], ifNames);

        switch (suffix[0]) {
        case LLDP_COL_CHASSIS_SUBTYPE:
            entry.chassisSubtype = vb.intValue.value_or(0);
            break;
        case LLDP_COL_CHASSIS_ID:
            entry.chassisId = vb.value;
            break;
        case LLDP_COL_PORT_ID:
            entry.portId = vb.value;
            break;
        case LLDP_COL_PORT_DESC:
            entry.portDesc = vb.value;
            break;
        case LLDP_COL_SYS_NAME:
            entry.neighbor.remoteDeviceId = vb.value;
            break;
        default:
            break;
        }
    }

    // lldpRemManAddrTable index: timeMark.localPort.remIndex.addrSubtype.addrLen.addr...
    for (const auto& vb : manAddrRows) {
        auto suffix = SnmpCodec::oidSuffix(core::SnmpOids::LLDP_REM_MAN_ADDR_IF_SUBTYPE, vb.oid);
        if (suffix.size() < 9 || suffix[3] != IANA_FAMILY_IPV4 || suffix[4] != 4) {
            continue;
        }
        auto it = entries.find(indexKey(suffix, 0, 3));
        if (it == entries.end() || !it->second.neighbor.remoteAddress.empty()) {
            continue;
        }
        it->second.neighbor.remoteAddress = std::to_string(suffix[5]) + "." + std::to_string(suffix[6]) + "." +
                                            std::to_string(suffix[7]) + "." + std::to_string(suffix[8]);
    }

    std::vector<core::LinkNeighbor> neighbors;
    for (auto& [key, entry] : entries) {
        auto& neighbor = entry.neighbor;

        if (entry.chassisSubtype == LLDP_CHASSIS_MAC) {
            if (auto mac = core::macFromBytes(entry.chassisId)) {
                neighbor.remoteChassisMac = *mac;
            }
        } else if (entry.chassisSubtype == LLDP_CHASSIS_NETWORK_ADDRESS && entry.chassisId.size() == 5 &&
                   static_cast<uint8_t>(entry.chassisId[0]) == IANA_FAMILY_IPV4 && neighbor.remoteAddress.empty()) {
            neighbor.remoteAddress = formatIpv4(entry.chassisId.substr(1));
        }

        if (neighbor.remoteDeviceId.empty()) {
            if (!neighbor.remoteChassisMac.empty()) {
                neighbor.remoteDeviceId = neighbor.remoteChassisMac;
            } else if (isPrintable(entry.chassisId)) {
                neighbor.remoteDeviceId = entry.chassisId;
            }
        }

        if (isPrintable(entry.portId)) {
            neighbor.remotePort = entry.portId;
        } else if (!entry.portDesc.empty()) {
            neighbor.remotePort = entry.portDesc;
        } else if (auto mac = core::macFromBytes(entry.portId)) {
            neighbor.remotePort = *mac;
        }

        if (neighbor.remoteDeviceId.empty() && neighbor.remoteAddress.empty() && neighbor.remoteChassisMac.empty()) {
            continue;
        }
        neighbors.push_back(std::move(neighbor));
    }
    return neighbors;
}

} // namespace vlanvision::infra
