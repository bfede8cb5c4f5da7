/**
 * @file ApiJson.hpp
 * @brief JSON representations served by the REST API.
 *
 * Field names are snake_case; timestamps are Unix seconds; absent optional
 * values are serialized as null.
 */

#pragma once

#include "core/types/Alert.hpp"
#include "core/types/Device.hpp"
#include "core/types/DiscoveryJob.hpp"
#include "core/types/Topology.hpp"

#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <vector>

namespace vlanvision::infra::api {

int64_t toUnixSeconds(std::chrono::system_clock::time_point tp);

/// Summary used by the device list: id, hostname, ip_address, mac_address, device_type, vlan_id, status.
nlohmann::json deviceSummaryToJson(const core::Device& device);

/// Summary plus interfaces, neighbors, IP history and SNMP system data.
nlohmann::json deviceToJson(const core::Device& device);

nlohmann::json interfaceToJson(const core::Interface& iface);
nlohmann::json neighborToJson(const core::LinkNeighbor& neighbor);

/**
 * @brief Serializes a job.
 * @param includeOutcomes Adds the per-target outcome map.
 */
nlohmann::json jobToJson(const core::DiscoveryJob& job, bool includeOutcomes);

nlohmann::json alertToJson(const core::Alert& alert);

nlohmann::json vlanGroupsToJson(const std::vector<core::VlanGroup>& groups);

/// Nodes and edges for graph rendering.
nlohmann::json topologyToJson(const core::TopologyGraph& graph);

nlohmann::json analysisToJson(const core::TopologyAnalysis& analysis);

/**
 * @brief Parses a technique list such as ["snmp", "arp"].
 * @throws std::invalid_argument for an unknown technique or a non-array value.
 */
std::vector<core::ProbeTechnique> techniquesFromJson(const nlohmann::json& j);

} // namespace vlanvision::infra::api
