#include "infrastructure/network/SnmpProbe.hpp"

#include "core/types/DeviceClassifier.hpp"
#include "infrastructure/network/NeighborProbe.hpp"
#include "infrastructure/network/SnmpClient.hpp"
#include "infrastructure/network/SnmpCodec.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <charconv>

namespace vlanvision::infra {

namespace {

constexpr int MIN_VLAN = 1;
constexpr int MAX_VLAN = 4094;
constexpr int64_t VTP_VLAN_OPERATIONAL = 1;

bool isValidVlan(int64_t vlan) {
    return vlan >= MIN_VLAN && vlan <= MAX_VLAN;
}

// Cisco reserves 1002-1005 for FDDI/Token Ring defaults
bool isReservedVtpVlan(int64_t vlan) {
    return vlan >= 1002 && vlan <= 1005;
}

std::string trim(const std::string& text) {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

/// Parses SVI names such as "Vlan10" or "vlan 20".
std::optional<int> vlanFromInterfaceName(const std::string& name) {
    if (name.size() < 5) {
        return std::nullopt;
    }
    std::string prefix = name.substr(0, 4);
    for (auto& c : prefix) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (prefix != "vlan") {
        return std::nullopt;
    }

    size_t start = 4;
    while (start < name.size() && name[start] == ' ') {
        ++start;
    }
    int vlan = 0;
    auto [ptr, ec] = std::from_chars(name.data() + start, name.data() + name.size(), vlan);
    if (ec != std::errc() || ptr != name.data() + name.size() || !isValidVlan(vlan)) {
        return std::nullopt;
    }
    return vlan;
}

} // namespace

const std::vector<core::SnmpVarBind>& SnmpInventory::table(const std::string& rootOid) const {
    static const std::vector<core::SnmpVarBind> empty;
    auto it = tables.find(rootOid);
    return it != tables.end() ? it->second : empty;
}

SnmpProbe::SnmpProbe(std::shared_ptr<core::ISnmpClient> client) : client_(std::move(client)) {}

const std::vector<std::string>& SnmpProbe::walkedTables() {
    using namespace core::SnmpOids;
    static const std::vector<std::string> tables = {
        IF_DESCR,     IF_OPER_STATUS, IF_ADMIN_STATUS, IF_SPEED,           IF_PHYS_ADDRESS, IF_IN_OCTETS,
        IF_OUT_OCTETS, IF_IN_ERRORS,  IF_OUT_ERRORS,   IP_AD_ENT_IF_INDEX, HR_PROCESSOR_LOAD, DOT1Q_PVID,
        VTP_VLAN_STATE, CDP_CACHE_ENTRY, LLDP_REM_ENTRY, LLDP_REM_MAN_ADDR_IF_SUBTYPE,
    };
    return tables;
}

core::ProbeOutcome SnmpProbe::probe(const std::string& address, std::chrono::milliseconds timeout) {
    using Clock = core::ISnmpClient::Clock;
    auto deadline = Clock::now() + timeout;

    const std::vector<std::string> systemOids = {
        core::SnmpOids::SYS_DESCR, core::SnmpOids::SYS_OBJECT_ID, core::SnmpOids::SYS_NAME,
        core::SnmpOids::SYS_LOCATION, core::SnmpOids::SYS_UPTIME,
    };

    auto system = client_->get(address, systemOids, deadline);
    if (system.errorKind != core::SnmpErrorKind::None) {
        return SnmpClient::toProbeError(system);
    }

    SnmpInventory inventory;
    if (system.success) {
        inventory.system = std::move(system.varbinds);
    } else {
        // v1 agents fail the whole GET when a single OID is missing
        spdlog::debug("SNMP system GET on {} returned '{}', retrying per OID", address, system.errorMessage);
        for (const auto& oid : systemOids) {
            if (Clock::now() >= deadline) {
                break;
            }
            auto single = client_->get(address, {oid}, deadline);
            if (single.errorKind != core::SnmpErrorKind::None) {
                break;
            }
            if (single.success) {
                inventory.system.insert(inventory.system.end(), single.varbinds.begin(), single.varbinds.end());
            }
        }
    }

    for (const auto& root : walkedTables()) {
        if (Clock::now() >= deadline) {
            spdlog::debug("SNMP probe of {} reached its deadline before walking {}", address, root);
            break;
        }

        auto rows = client_->walk(address, root, deadline);
        if (rows.errorKind == core::SnmpErrorKind::Malformed) {
            spdlog::warn("Malformed SNMP response from {} while walking {}: {} [{}]", address, root,
                         rows.errorMessage, rows.rawExcerpt);
            continue;
        }
        if (rows.errorKind != core::SnmpErrorKind::None) {
            spdlog::debug("SNMP walk of {} on {} failed: {}", root, address, rows.errorMessage);
            if (rows.errorKind == core::SnmpErrorKind::Timeout) {
                break;
            }
            continue;
        }
        inventory.tables[root] = std::move(rows.varbinds);
    }

    return interpret(address, inventory);
}

core::ProbeResult SnmpProbe::interpret(const std::string& address, const SnmpInventory& inventory) {
    using namespace core::SnmpOids;

    core::ProbeResult result;
    result.address = address;
    result.technique = core::ProbeTechnique::Snmp;
    result.observedAt = std::chrono::system_clock::now();

    for (const auto& vb : inventory.system) {
        if (vb.isException()) {
            continue;
        }
        auto value = trim(vb.value);
        if (vb.oid == SYS_DESCR && !value.empty()) {
            result.sysDescr = value;
        } else if (vb.oid == SYS_OBJECT_ID && !value.empty()) {
            result.sysObjectId = value;
        } else if (vb.oid == SYS_NAME && !value.empty()) {
            result.hostname = value;
        } else if (vb.oid == SYS_LOCATION && !value.empty()) {
            result.location = value;
        } else if (vb.oid == SYS_UPTIME && vb.counterValue) {
            result.uptimeTicks = vb.counterValue;
        }
    }

    // Interface table, one column at a time
    std::map<int32_t, core::Interface> interfaces;
    auto column = [&](const char* root, auto&& apply) {
        for (const auto& vb : inventory.table(root)) {
            auto suffix = SnmpCodec::oidSuffix(root, vb.oid);
            if (suffix.size() != 1 || vb.isException()) {
                continue;
            }
            auto index = static_cast<int32_t>(suffix[0]);
            auto& iface = interfaces[index];
            iface.index = index;
            apply(iface, vb);
        }
    };

    column(IF_DESCR, [](core::Interface& iface, const core::SnmpVarBind& vb) { iface.name = trim(vb.value); });
    column(IF_SPEED, [](core::Interface& iface, const core::SnmpVarBind& vb) {
        iface.speedBps = vb.unsignedValue().value_or(0);
    });
    column(IF_PHYS_ADDRESS, [](core::Interface& iface, const core::SnmpVarBind& vb) {
        iface.macAddress = core::macFromBytes(vb.value).value_or("");
    });
    column(IF_ADMIN_STATUS, [](core::Interface& iface, const core::SnmpVarBind& vb) {
        iface.adminStatus = core::interfaceStatusFromInt(vb.intValue.value_or(4));
    });
    column(IF_OPER_STATUS, [](core::Interface& iface, const core::SnmpVarBind& vb) {
        iface.operStatus = core::interfaceStatusFromInt(vb.intValue.value_or(4));
    });
    column(IF_IN_OCTETS, [](core::Interface& iface, const core::SnmpVarBind& vb) {
        iface.inOctets = vb.unsignedValue().value_or(0);
    });
    column(IF_OUT_OCTETS, [](core::Interface& iface, const core::SnmpVarBind& vb) {
        iface.outOctets = vb.unsignedValue().value_or(0);
    });
    column(IF_IN_ERRORS, [](core::Interface& iface, const core::SnmpVarBind& vb) {
        iface.inErrors = vb.unsignedValue().value_or(0);
    });
    column(IF_OUT_ERRORS, [](core::Interface& iface, const core::SnmpVarBind& vb) {
        iface.outErrors = vb.unsignedValue().value_or(0);
    });

    std::map<int32_t, std::string> ifNames;
    for (const auto& [index, iface] : interfaces) {
        ifNames[index] = iface.name;
    }

    // ipAdEntIfIndex.<address> names the interface that owns the probed IP
    std::optional<int32_t> ownIfIndex;
    const std::string ownIndexOid = std::string(IP_AD_ENT_IF_INDEX) + "." + address;
    for (const auto& vb : inventory.table(IP_AD_ENT_IF_INDEX)) {
        if (vb.oid == ownIndexOid && vb.intValue) {
            ownIfIndex = static_cast<int32_t>(*vb.intValue);
            break;
        }
    }

    const core::Interface* ownInterface = nullptr;
    if (ownIfIndex) {
        auto it = interfaces.find(*ownIfIndex);
        if (it != interfaces.end()) {
            ownInterface = &it->second;
        }
    }

    // Another interface's MAC would not match what ARP reports for this address
    if (ownInterface && !ownInterface->macAddress.empty()) {
        result.macAddress = ownInterface->macAddress;
    }

    const auto& loads = inventory.table(HR_PROCESSOR_LOAD);
    if (!loads.empty()) {
        double total = 0.0;
        int count = 0;
        for (const auto& vb : loads) {
            if (auto value = vb.unsignedValue()) {
                total += static_cast<double>(*value);
                ++count;
            }
        }
        if (count > 0) {
            result.cpuPercent = total / count;
        }
    }

    // VLAN: SVI owning the address, then the dominant port VLAN, then VTP
    if (ownInterface) {
        result.vlanId = vlanFromInterfaceName(ownInterface->name);
    }
    if (!result.vlanId) {
        std::map<int, int> pvidCounts;
        for (const auto& vb : inventory.table(DOT1Q_PVID)) {
            if (auto pvid = vb.unsignedValue(); pvid && isValidVlan(static_cast<int64_t>(*pvid))) {
                ++pvidCounts[static_cast<int>(*pvid)];
            }
        }
        int bestCount = 0;
        for (const auto& [vlan, count] : pvidCounts) {
            if (count > bestCount) {
                bestCount = count;
                result.vlanId = vlan;
            }
        }
    }
    if (!result.vlanId) {
        for (const auto& vb : inventory.table(VTP_VLAN_STATE)) {
            auto suffix = SnmpCodec::oidSuffix(VTP_VLAN_STATE, vb.oid);
            if (suffix.size() != 2 || vb.intValue.value_or(0) != VTP_VLAN_OPERATIONAL) {
                continue;
            }
            auto vlan = static_cast<int64_t>(suffix[1]);
            if (isValidVlan(vlan) && !isReservedVtpVlan(vlan)) {
                result.vlanId = static_cast<int>(vlan);
                break;
            }
        }
    }

    if (!interfaces.empty()) {
        std::vector<core::Interface> list;
        list.reserve(interfaces.size());
        for (auto& [index, iface] : interfaces) {
            list.push_back(iface);
        }
        result.interfaces = std::move(list);
    }

    bool walkedNeighbors = inventory.tables.contains(CDP_CACHE_ENTRY) || inventory.tables.contains(LLDP_REM_ENTRY);
    if (walkedNeighbors) {
        auto neighbors = NeighborProbe::parseCdpCache(inventory.table(CDP_CACHE_ENTRY), ifNames);
        auto lldp = NeighborProbe::parseLldpRemote(inventory.table(LLDP_REM_ENTRY),
                                                   inventory.table(LLDP_REM_MAN_ADDR_IF_SUBTYPE), ifNames);
        neighbors.insert(neighbors.end(), lldp.begin(), lldp.end());
        result.neighbors = std::move(neighbors);
    }

    auto classification = core::DeviceClassifier::classify(result.sysDescr.value_or(""),
                                                           result.sysObjectId.value_or(""),
                                                           result.hostname.value_or(""));
    result.deviceClass = classification.deviceClass;
    if (!classification.vendor.empty()) {
        result.vendor = classification.vendor;
    }

    return result;
}

} // namespace vlanvision::infra
