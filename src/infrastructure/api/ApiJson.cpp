#include "infrastructure/api/ApiJson.hpp"

#include <stdexcept>

namespace vlanvision::infra::api {

namespace {

template <typename T>
nlohmann::json optionalToJson(const std::optional<T>& value) {
    if (value) {
        return *value;
    }
    return nullptr;
}

nlohmann::json optionalTimeToJson(const std::optional<std::chrono::system_clock::time_point>& tp) {
    if (tp) {
        return toUnixSeconds(*tp);
    }
    return nullptr;
}

} // namespace

int64_t toUnixSeconds(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

nlohmann::json deviceSummaryToJson(const core::Device& device) {
    nlohmann::json j;
    j["id"] = device.id;
    j["hostname"] = device.hostname;
    j["ip_address"] = device.ipAddress;
    j["mac_address"] = device.macAddress.empty() ? nlohmann::json(nullptr) : nlohmann::json(device.macAddress);
    j["device_type"] = device.classToString();
    j["vlan_id"] = optionalToJson(device.vlanId);
    j["status"] = device.reachabilityToString();
    return j;
}

nlohmann::json interfaceToJson(const core::Interface& iface) {
    nlohmann::json j;
    j["index"] = iface.index;
    j["name"] = iface.name;
    j["mac_address"] = iface.macAddress;
    j["admin_status"] = core::interfaceStatusToString(iface.adminStatus);
    j["oper_status"] = core::interfaceStatusToString(iface.operStatus);
    j["speed_bps"] = iface.speedBps;
    j["in_octets"] = iface.inOctets;
    j["out_octets"] = iface.outOctets;
    j["in_errors"] = iface.inErrors;
    j["out_errors"] = iface.outErrors;
    j["utilization_percent"] = optionalToJson(iface.utilizationPercent);
    return j;
}

nlohmann::json neighborToJson(const core::LinkNeighbor& neighbor) {
    return {{"protocol", core::neighborProtocolToString(neighbor.protocol)},
            {"local_port", neighbor.localPort},
            {"remote_device_id", neighbor.remoteDeviceId},
            {"remote_port", neighbor.remotePort},
            {"remote_address", neighbor.remoteAddress},
            {"remote_chassis_mac", neighbor.remoteChassisMac},
            {"remote_platform", neighbor.remotePlatform}};
}

nlohmann::json deviceToJson(const core::Device& device) {
    auto j = deviceSummaryToJson(device);
    j["vendor"] = device.vendor;
    j["sys_descr"] = device.sysDescr;
    j["sys_object_id"] = device.sysObjectId;
    j["location"] = device.location;
    j["cpu_percent"] = optionalToJson(device.cpuPercent);
    j["uptime_ticks"] = optionalToJson(device.uptimeTicks);
    j["consecutive_misses"] = device.consecutiveMisses;
    j["merged_into"] = optionalToJson(device.mergedInto);
    j["first_seen"] = toUnixSeconds(device.firstSeen);
    j["last_seen"] = toUnixSeconds(device.lastSeen);

    j["interfaces"] = nlohmann::json::array();
    for (const auto& iface : device.interfaces) {
        j["interfaces"].push_back(interfaceToJson(iface));
    }
    j["neighbors"] = nlohmann::json::array();
    for (const auto& neighbor : device.neighbors) {
        j["neighbors"].push_back(neighborToJson(neighbor));
    }
    j["ip_history"] = nlohmann::json::array();
    for (const auto& entry : device.ipHistory) {
        j["ip_history"].push_back({{"ip_address", entry.address}, {"last_seen", toUnixSeconds(entry.lastSeen)}});
    }
    return j;
}

nlohmann::json jobToJson(const core::DiscoveryJob& job, bool includeOutcomes) {
    nlohmann::json j;
    j["job_id"] = job.id;
    j["network_range"] = job.range;
    j["techniques"] = nlohmann::json::array();
    for (auto technique : job.techniques) {
        j["techniques"].push_back(core::probeTechniqueToString(technique));
    }
    j["origin"] = job.originToString();
    j["status"] = job.stateToString();
    j["cancelled"] = job.cancelled;
    j["created_at"] = toUnixSeconds(job.createdAt);
    j["started_at"] = optionalTimeToJson(job.startedAt);
    j["finished_at"] = optionalTimeToJson(job.finishedAt);
    j["target_count"] = job.targetCount;
    j["units_total"] = job.unitsTotal;
    j["units_resolved"] = job.unitsResolved;
    j["devices_updated"] = job.devicesUpdated;
    j["coalesced_requests"] = job.coalescedRequests;
    j["warnings"] = job.warnings;
    if (!job.errorMessage.empty()) {
        j["error"] = job.errorMessage;
    }

    nlohmann::json summary = nlohmann::json::object();
    for (auto outcome : {core::TargetOutcome::Success, core::TargetOutcome::Timeout, core::TargetOutcome::Unreachable,
                         core::TargetOutcome::Error, core::TargetOutcome::Skipped}) {
        summary[core::targetOutcomeToString(outcome)] = job.countOutcomes(outcome);
    }
    j["summary"] = summary;

    if (includeOutcomes) {
        nlohmann::json outcomes = nlohmann::json::object();
        for (const auto& [address, outcome] : job.outcomes) {
            outcomes[address] = core::targetOutcomeToString(outcome);
        }
        j["outcomes"] = outcomes;
    }
    return j;
}

nlohmann::json alertToJson(const core::Alert& alert) {
    nlohmann::json j;
    j["id"] = alert.id;
    j["device_id"] = alert.deviceId;
    j["interface_index"] = optionalToJson(alert.interfaceIndex);
    j["interface_name"] = alert.interfaceName;
    j["rule"] = alert.ruleToString();
    j["severity"] = alert.severityToString();
    j["message"] = alert.message;
    j["first_fired"] = toUnixSeconds(alert.firstFired);
    j["last_seen"] = toUnixSeconds(alert.lastSeen);
    j["resolved_at"] = optionalTimeToJson(alert.resolvedAt);
    j["acknowledged"] = alert.acknowledged;
    j["open"] = alert.isOpen();
    return j;
}

nlohmann::json vlanGroupsToJson(const std::vector<core::VlanGroup>& groups) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& group : groups) {
        list.push_back({{"vlan_id", group.vlanId},
                        {"device_ids", std::vector<core::DeviceId>(group.members.begin(), group.members.end())},
                        {"device_count", group.members.size()}});
    }
    return {{"vlans", list}, {"count", groups.size()}};
}

nlohmann::json topologyToJson(const core::TopologyGraph& graph) {
    nlohmann::json nodes = nlohmann::json::array();
    for (const auto& node : graph.nodes) {
        nodes.push_back({{"id", node.id},
                         {"label", node.label},
                         {"ip_address", node.ipAddress},
                         {"device_type", core::deviceClassToString(node.deviceClass)},
                         {"role", core::deviceRoleToString(node.role)},
                         {"vlan_id", optionalToJson(node.vlanId)},
                         {"status", core::reachabilityToString(node.reachability)}});
    }

    nlohmann::json edges = nlohmann::json::array();
    for (const auto& edge : graph.edges) {
        edges.push_back({{"source", edge.a},
                         {"target", edge.b},
                         {"kind", edge.kindToString()},
                         {"evidence", edge.source},
                         {"confidence", edge.confidenceToString()}});
    }

    return {{"nodes", nodes}, {"edges", edges}, {"built_at", toUnixSeconds(graph.builtAt)}};
}

nlohmann::json analysisToJson(const core::TopologyAnalysis& analysis) {
    nlohmann::json j;
    j["node_count"] = analysis.nodeCount;
    j["edge_count"] = analysis.edgeCount;
    j["link_layer_edge_count"] = analysis.linkLayerEdgeCount;
    j["component_count"] = analysis.componentCount;
    j["articulation_points"] = analysis.articulationPoints;
    j["isolated_nodes"] = analysis.isolatedNodes;

    nlohmann::json degree = nlohmann::json::object();
    for (const auto& [id, count] : analysis.degree) {
        degree[std::to_string(id)] = count;
    }
    j["degree"] = degree;

    nlohmann::json byClass = nlohmann::json::object();
    for (const auto& [deviceClass, count] : analysis.devicesByClass) {
        byClass[core::deviceClassToString(deviceClass)] = count;
    }
    j["devices_by_type"] = byClass;

    nlohmann::json byRole = nlohmann::json::object();
    for (const auto& [role, count] : analysis.devicesByRole) {
        byRole[core::deviceRoleToString(role)] = count;
    }
    j["devices_by_role"] = byRole;

    nlohmann::json byVlan = nlohmann::json::object();
    for (const auto& [vlan, count] : analysis.devicesByVlan) {
        byVlan[std::to_string(vlan)] = count;
    }
    j["devices_by_vlan"] = byVlan;
    return j;
}

std::vector<core::ProbeTechnique> techniquesFromJson(const nlohmann::json& j) {
    if (!j.is_array()) {
        throw std::invalid_argument("'techniques' must be an array of strings");
    }

    std::vector<core::ProbeTechnique> techniques;
    for (const auto& item : j) {
        if (!item.is_string()) {
            throw std::invalid_argument("'techniques' must be an array of strings");
        }
        auto technique = core::probeTechniqueFromString(item.get<std::string>());
        if (!technique) {
            throw std::invalid_argument("Unknown technique '" + item.get<std::string>() + "'");
        }
        techniques.push_back(*technique);
    }
    return techniques;
}

} // namespace vlanvision::infra::api
