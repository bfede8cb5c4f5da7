/**
 * @file Topology.hpp
 * @brief Derived topology graph, VLAN groups and analysis results.
 *
 * These are pure data artifacts: they are rebuilt from registry snapshots and
 * never mutated in place by consumers.
 */

#pragma once

#include "core/types/Device.hpp"

#include <chrono>
#include <compare>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace vlanvision::core {

enum class EdgeKind : int {
    SameVlan = 0,         ///< Both devices are members of the same VLAN
    LinkLayerNeighbor = 1 ///< CDP or LLDP reported direct adjacency
};

enum class EdgeConfidence : int { Low = 0, High = 1 };

/**
 * @brief Unordered device pair plus edge kind.
 *
 * The pair is stored with `a < b`. Ordering and equality consider only the
 * pair and the kind, so an edge set holds at most one edge per pair and kind.
 */
struct TopologyEdge {
    DeviceId a{0};
    DeviceId b{0};
    EdgeKind kind{EdgeKind::SameVlan};
    std::string source; ///< "vlan:<id>", "cdp" or "lldp"
    EdgeConfidence confidence{EdgeConfidence::Low};

    static TopologyEdge make(DeviceId first, DeviceId second, EdgeKind kind, std::string source,
                             EdgeConfidence confidence);

    [[nodiscard]] bool connects(DeviceId x, DeviceId y) const {
        return (a == x && b == y) || (a == y && b == x);
    }

    [[nodiscard]] std::string kindToString() const;
    [[nodiscard]] std::string confidenceToString() const;

    bool operator==(const TopologyEdge& other) const {
        return a == other.a && b == other.b && kind == other.kind;
    }
    std::strong_ordering operator<=>(const TopologyEdge& other) const {
        if (auto cmp = a <=> other.a; cmp != 0)
            return cmp;
        if (auto cmp = b <=> other.b; cmp != 0)
            return cmp;
        return static_cast<int>(kind) <=> static_cast<int>(other.kind);
    }
};

/**
 * @brief Hierarchy role inferred from the hostname.
 */
enum class DeviceRole : int { Core = 0, Distribution = 1, Access = 2, Edge = 3, Server = 4, Endpoint = 5 };

struct TopologyNode {
    DeviceId id{0};
    std::string label;
    std::string ipAddress;
    DeviceClass deviceClass{DeviceClass::Unknown};
    DeviceRole role{DeviceRole::Endpoint};
    std::optional<int> vlanId;
    Reachability reachability{Reachability::Unknown};

    bool operator==(const TopologyNode& other) const = default;
};

struct TopologyGraph {
    std::vector<TopologyNode> nodes; ///< Sorted by id
    std::set<TopologyEdge> edges;
    std::chrono::system_clock::time_point builtAt;

    [[nodiscard]] const TopologyNode* findNode(DeviceId id) const;
    [[nodiscard]] bool hasEdge(DeviceId x, DeviceId y, EdgeKind kind) const;
    [[nodiscard]] size_t countEdges(EdgeKind kind) const;
    [[nodiscard]] std::vector<DeviceId> neighborsOf(DeviceId id) const;
};

/**
 * @brief VLAN id and its current members, derived from Device::vlanId.
 */
struct VlanGroup {
    int vlanId{0};
    std::set<DeviceId> members;

    bool operator==(const VlanGroup& other) const = default;
};

struct TopologyAnalysis {
    size_t nodeCount{0};
    size_t edgeCount{0};
    size_t linkLayerEdgeCount{0};
    size_t componentCount{0};
    std::vector<DeviceId> articulationPoints; ///< Single points of failure, ascending
    std::vector<DeviceId> isolatedNodes;      ///< Nodes without any edge
    std::map<DeviceId, size_t> degree;
    std::map<DeviceClass, size_t> devicesByClass;
    std::map<DeviceRole, size_t> devicesByRole;
    std::map<int, size_t> devicesByVlan;
};

std::string edgeKindToString(EdgeKind kind);
std::string deviceRoleToString(DeviceRole role);

} // namespace vlanvision::core
