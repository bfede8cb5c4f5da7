#include "engine/TopologyBuilder.hpp"

#include "core/types/DeviceClassifier.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <map>
#include <set>
#include <string>

namespace vlanvision::engine {

namespace {

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

/// CDP device ids often carry a serial number in parentheses or a domain suffix.
std::vector<std::string> hostnameKeys(const std::string& name) {
    std::vector<std::string> keys;
    auto base = lower(name);
    auto paren = base.find('(');
    if (paren != std::string::npos) {
        base = base.substr(0, paren);
    }
    while (!base.empty() && std::isspace(static_cast<unsigned char>(base.back()))) {
        base.pop_back();
    }
    if (base.empty()) {
        return keys;
    }
    keys.push_back(base);
    auto dot = base.find('.');
    if (dot != std::string::npos && dot > 0) {
        keys.push_back(base.substr(0, dot));
    }
    return keys;
}

class NeighborResolver {
public:
    explicit NeighborResolver(const std::vector<const core::Device*>& devices) {
        for (const auto* device : devices) {
            if (!device->ipAddress.empty()) {
                byIp_.emplace(device->ipAddress, device->id);
            }
            for (const auto& iface : device->interfaces) {
                if (!iface.macAddress.empty()) {
                    byMac_.emplace(iface.macAddress, device->id);
                }
            }
            if (device->hasMac()) {
                byMac_.emplace(device->macAddress, device->id);
            }
            for (const auto& key : hostnameKeys(device->hostname)) {
                byName_.emplace(key, device->id);
            }
        }
    }

    [[nodiscard]] std::optional<core::DeviceId> resolve(const core::LinkNeighbor& neighbor) const {
        if (auto it = byIp_.find(neighbor.remoteAddress); !neighbor.remoteAddress.empty() && it != byIp_.end()) {
            return it->second;
        }
        for (const auto& key : hostnameKeys(neighbor.remoteDeviceId)) {
            if (auto it = byName_.find(key); it != byName_.end()) {
                return it->second;
            }
        }
        if (auto mac = core::normalizeMac(neighbor.remoteChassisMac)) {
            if (auto it = byMac_.find(*mac); it != byMac_.end()) {
                return it->second;
            }
        }
        return std::nullopt;
    }

private:
    // emplace keeps the lowest id on collisions since devices arrive sorted
    std::map<std::string, core::DeviceId> byIp_;
    std::map<std::string, core::DeviceId> byMac_;
    std::map<std::string, core::DeviceId> byName_;
};

struct ArticulationSearch {
    const std::map<core::DeviceId, std::vector<core::DeviceId>>& adjacency;
    std::map<core::DeviceId, int> discovery;
    std::map<core::DeviceId, int> low;
    std::set<core::DeviceId> points;
    int time{0};

    /// Iterative Tarjan walk of the component containing @p root.
    void run(core::DeviceId root) {
        struct Frame {
            core::DeviceId node;
            core::DeviceId parent;
            size_t next;
        };

        int rootChildren = 0;
        std::vector<Frame> stack{{root, root, 0}};
        discovery[root] = low[root] = ++time;

        while (!stack.empty()) {
            auto& frame = stack.back();
            const auto& edges = adjacency.at(frame.node);
            if (frame.next < edges.size()) {
                auto peer = edges[frame.next++];
                if (!discovery.contains(peer)) {
                    discovery[peer] = low[peer] = ++time;
                    if (frame.node == root) {
                        ++rootChildren;
                    }
                    stack.push_back({peer, frame.node, 0});
                } else if (peer != frame.parent) {
                    low[frame.node] = std::min(low[frame.node], discovery[peer]);
                }
                continue;
            }

            auto finished = frame;
            stack.pop_back();
            if (stack.empty()) {
                break;
            }
            auto parent = finished.parent;
            low[parent] = std::min(low[parent], low[finished.node]);
            if (parent != root && low[finished.node] >= discovery[parent]) {
                points.insert(parent);
            }
        }

        if (rootChildren > 1) {
            points.insert(root);
        }
    }
};

} // namespace

core::TopologyGraph TopologyBuilder::rebuild(const std::vector<core::Device>& devices) {
    std::vector<const core::Device*> active;
    for (const auto& device : devices) {
        if (device.isActive()) {
            active.push_back(&device);
        }
    }
    std::sort(active.begin(), active.end(),
              [](const core::Device* lhs, const core::Device* rhs) { return lhs->id < rhs->id; });

    core::TopologyGraph graph;
    graph.builtAt = std::chrono::system_clock::now();

    std::map<int, std::vector<core::DeviceId>> vlans;
    for (const auto* device : active) {
        core::TopologyNode node;
        node.id = device->id;
        node.label = device->displayName();
        node.ipAddress = device->ipAddress;
        node.deviceClass = device->deviceClass;
        node.role = core::DeviceClassifier::roleFor(device->hostname, device->deviceClass);
        node.vlanId = device->vlanId;
        node.reachability = device->reachability;
        graph.nodes.push_back(std::move(node));

        if (device->vlanId) {
            vlans[*device->vlanId].push_back(device->id);
        }
    }

    for (const auto& [vlan, members] : vlans) {
        for (size_t i = 0; i < members.size(); ++i) {
            for (size_t j = i + 1; j < members.size(); ++j) {
                graph.edges.insert(core::TopologyEdge::make(members[i], members[j], core::EdgeKind::SameVlan,
                                                            "vlan:" + std::to_string(vlan),
                                                            core::EdgeConfidence::Low));
            }
        }
    }

    NeighborResolver resolver(active);
    for (const auto* device : active) {
        for (const auto& neighbor : device->neighbors) {
            auto peer = resolver.resolve(neighbor);
            if (!peer || *peer == device->id) {
                continue;
            }
            graph.edges.insert(core::TopologyEdge::make(device->id, *peer, core::EdgeKind::LinkLayerNeighbor,
                                                        core::neighborProtocolToString(neighbor.protocol),
                                                        core::EdgeConfidence::High));
        }
    }

    return graph;
}

core::TopologyAnalysis TopologyBuilder::analyze(const core::TopologyGraph& graph) {
    core::TopologyAnalysis analysis;
    analysis.nodeCount = graph.nodes.size();
    analysis.edgeCount = graph.edges.size();
    analysis.linkLayerEdgeCount = graph.countEdges(core::EdgeKind::LinkLayerNeighbor);

    std::map<core::DeviceId, std::set<core::DeviceId>> peers;
    for (const auto& node : graph.nodes) {
        peers[node.id];
        ++analysis.devicesByClass[node.deviceClass];
        ++analysis.devicesByRole[node.role];
        if (node.vlanId) {
            ++analysis.devicesByVlan[*node.vlanId];
        }
    }
    for (const auto& edge : graph.edges) {
        // Edges to nodes outside the graph are ignored
        if (!peers.contains(edge.a) || !peers.contains(edge.b)) {
            continue;
        }
        peers[edge.a].insert(edge.b);
        peers[edge.b].insert(edge.a);
    }

    std::map<core::DeviceId, std::vector<core::DeviceId>> adjacency;
    for (const auto& [id, set] : peers) {
        analysis.degree[id] = set.size();
        adjacency[id] = {set.begin(), set.end()};
        if (set.empty()) {
            analysis.isolatedNodes.push_back(id);
        }
    }

    ArticulationSearch search{adjacency, {}, {}, {}, 0};
    for (const auto& [id, edges] : adjacency) {
        if (!search.discovery.contains(id)) {
            ++analysis.componentCount;
            search.run(id);
        }
    }
    analysis.articulationPoints.assign(search.points.begin(), search.points.end());

    return analysis;
}

std::shared_ptr<const core::TopologyGraph> TopologyBuilder::update(const std::vector<core::Device>& devices) {
    auto graph = std::make_shared<const core::TopologyGraph>(rebuild(devices));
    spdlog::debug("Topology rebuilt: {} nodes, {} edges ({} link-layer)", graph->nodes.size(), graph->edges.size(),
                  graph->countEdges(core::EdgeKind::LinkLayerNeighbor));

    std::lock_guard lock(mutex_);
    current_ = graph;
    return graph;
}

std::shared_ptr<const core::TopologyGraph> TopologyBuilder::current() const {
    std::lock_guard lock(mutex_);
    return current_;
}

} // namespace vlanvision::engine
