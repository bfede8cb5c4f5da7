#include "core/types/Topology.hpp"

#include <algorithm>

namespace vlanvision::core {

TopologyEdge TopologyEdge::make(DeviceId first, DeviceId second, EdgeKind kind, std::string source,
                                EdgeConfidence confidence) {
    TopologyEdge edge;
    edge.a = std::min(first, second);
    edge.b = std::max(first, second);
    edge.kind = kind;
    edge.source = std::move(source);
    edge.confidence = confidence;
    return edge;
}

std::string TopologyEdge::kindToString() const {
    return edgeKindToString(kind);
}

std::string TopologyEdge::confidenceToString() const {
    return confidence == EdgeConfidence::High ? "high" : "low";
}

const TopologyNode* TopologyGraph::findNode(DeviceId id) const {
    auto it = std::lower_bound(nodes.begin(), nodes.end(), id,
                               [](const TopologyNode& node, DeviceId value) { return node.id < value; });
    if (it != nodes.end() && it->id == id) {
        return &*it;
    }
    return nullptr;
}

bool TopologyGraph::hasEdge(DeviceId x, DeviceId y, EdgeKind kind) const {
    TopologyEdge probe;
    probe.a = std::min(x, y);
    probe.b = std::max(x, y);
    probe.kind = kind;
    return edges.contains(probe);
}

size_t TopologyGraph::countEdges(EdgeKind kind) const {
    return static_cast<size_t>(std::count_if(edges.begin(), edges.end(),
                                             [kind](const TopologyEdge& e) { return e.kind == kind; }));
}

std::vector<DeviceId> TopologyGraph::neighborsOf(DeviceId id) const {
    std::set<DeviceId> result;
    for (const auto& edge : edges) {
        if (edge.a == id) {
            result.insert(edge.b);
        } else if (edge.b == id) {
            result.insert(edge.a);
        }
    }
    return {result.begin(), result.end()};
}

std::string edgeKindToString(EdgeKind kind) {
    switch (kind) {
    case EdgeKind::SameVlan:
        return "same-vlan";
    case EdgeKind::LinkLayerNeighbor:
        return "link-layer-neighbor";
    }
    return "unknown";
}

std::string deviceRoleToString(DeviceRole role) {
    switch (role) {
    case DeviceRole::Core:
        return "core";
    case DeviceRole::Distribution:
        return "distribution";
    case DeviceRole::Access:
        return "access";
    case DeviceRole::Edge:
        return "edge";
    case DeviceRole::Server:
        return "server";
    case DeviceRole::Endpoint:
        return "endpoint";
    }
    return "endpoint";
}

} // namespace vlanvision::core
