#pragma once

#include "core/services/IProbe.hpp"
#include "core/services/ISnmpClient.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace vlanvision::infra {

/**
 * @brief Reads CDP and LLDP neighbor tables from an agent over SNMP.
 *
 * The result carries only link-layer neighbors. An agent that supports
 * neither MIB yields a successful result with no neighbors.
 */
class NeighborProbe : public core::IProbe {
public:
    explicit NeighborProbe(std::shared_ptr<core::ISnmpClient> client);

    [[nodiscard]] core::ProbeTechnique technique() const override { return core::ProbeTechnique::Neighbor; }

    core::ProbeOutcome probe(const std::string& address, std::chrono::milliseconds timeout) override;

    /**
     * @brief Builds neighbors from a walk of cdpCacheEntry.
     * @param rows Varbinds under CISCO-CDP-MIB cdpCacheEntry.
     * @param ifNames ifIndex to interface name, used to name the local port.
     */
    static std::vector<core::LinkNeighbor> parseCdpCache(const std::vector<core::SnmpVarBind>& rows,
                                                         const std::map<int32_t, std::string>& ifNames = {});

    /**
     * @brief Builds neighbors from walks of lldpRemEntry and lldpRemManAddrIfSubtype.
     *
     * Management addresses are recovered from the lldpRemManAddrTable index.
     */
    static std::vector<core::LinkNeighbor> parseLldpRemote(const std::vector<core::SnmpVarBind>& rows,
                                                           const std::vector<core::SnmpVarBind>& manAddrRows,
                                                           const std::map<int32_t, std::string>& ifNames = {});

private:
    std::shared_ptr<core::ISnmpClient> client_;
};

} // namespace vlanvision::infra
