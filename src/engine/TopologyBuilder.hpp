#pragma once

#include "core/types/Device.hpp"
#include "core/types/Topology.hpp"

#include <memory>
#include <mutex>
#include <vector>

namespace vlanvision::engine {

/**
 * @brief Derives the topology graph from registry snapshots.
 *
 * Rebuilds are pure: the same snapshot always yields the same node list and
 * edge set. Only active devices become nodes. Same-VLAN edges link every pair
 * of members of a VLAN; link-layer edges come from CDP/LLDP neighbors that
 * resolve to a known device.
 */
class TopologyBuilder {
public:
    TopologyBuilder() = default;

    TopologyBuilder(const TopologyBuilder&) = delete;
    TopologyBuilder& operator=(const TopologyBuilder&) = delete;

    /**
     * @brief Builds a graph from a device snapshot.
     */
    [[nodiscard]] static core::TopologyGraph rebuild(const std::vector<core::Device>& devices);

    /**
     * @brief Structural statistics of a graph.
     *
     * Articulation points are nodes whose removal splits their component.
     */
    [[nodiscard]] static core::TopologyAnalysis analyze(const core::TopologyGraph& graph);

    /// Rebuilds and publishes a new current graph.
    std::shared_ptr<const core::TopologyGraph> update(const std::vector<core::Device>& devices);

    /// Last published graph; an empty graph before the first update.
    [[nodiscard]] std::shared_ptr<const core::TopologyGraph> current() const;

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const core::TopologyGraph> current_{std::make_shared<const core::TopologyGraph>()};
};

} // namespace vlanvision::engine
