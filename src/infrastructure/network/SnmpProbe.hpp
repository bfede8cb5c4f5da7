#pragma once

#include "core/services/IProbe.hpp"
#include "core/services/ISnmpClient.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace vlanvision::infra {

/**
 * @brief Raw SNMP data collected from one agent.
 */
struct SnmpInventory {
    std::vector<core::SnmpVarBind> system;                        ///< sysDescr, sysObjectID, sysName, ...
    std::map<std::string, std::vector<core::SnmpVarBind>> tables; ///< Walk results keyed by root OID

    [[nodiscard]] const std::vector<core::SnmpVarBind>& table(const std::string& rootOid) const;
};

/**
 * @brief Full SNMP discovery of one device.
 *
 * Reads the system group, walks the interface table, the ipAddrTable, the
 * processor load table, the VLAN tables and the CDP/LLDP neighbor tables,
 * and classifies the device. Walks stop once the probe deadline is reached;
 * whatever was collected until then is reported.
 */
class SnmpProbe : public core::IProbe {
public:
    explicit SnmpProbe(std::shared_ptr<core::ISnmpClient> client);

    [[nodiscard]] core::ProbeTechnique technique() const override { return core::ProbeTechnique::Snmp; }

    core::ProbeOutcome probe(const std::string& address, std::chrono::milliseconds timeout) override;

    /**
     * @brief Turns collected SNMP data into a probe result.
     *
     * The MAC is the physical address of the interface that owns @p address
     * in the ipAddrTable. Without such an interface no MAC is reported, so the
     * registry correlates the device by address only. The VLAN comes from an SVI named "VlanN" owning the address, then
     * the most common dot1qPvid, then the first active VTP VLAN.
     */
    static core::ProbeResult interpret(const std::string& address, const SnmpInventory& inventory);

    /// Root OIDs walked after the system group, in walk order.
    static const std::vector<std::string>& walkedTables();

private:
    std::shared_ptr<core::ISnmpClient> client_;
};

} // namespace vlanvision::infra
