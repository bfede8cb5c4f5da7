/**
 * @file DeviceClassifier.hpp
 * @brief Maps SNMP system data to a closed device class, vendor and role.
 */

#pragma once

#include "core/types/Device.hpp"
#include "core/types/Topology.hpp"

#include <string>

namespace vlanvision::core {

struct Classification {
    DeviceClass deviceClass{DeviceClass::Unknown};
    std::string vendor; ///< Empty when no vendor pattern matched

    bool operator==(const Classification& other) const = default;
};

/**
 * @brief Keyword classifier over sysDescr, sysObjectID and hostname.
 *
 * Keyword groups are tried in a fixed order (firewall, router, switch,
 * access point, server) so that e.g. "Cisco ASA firewall software" never
 * falls through to a generic router rule. Unrecognized input always maps
 * to DeviceClass::Unknown.
 */
class DeviceClassifier {
public:
    [[nodiscard]] static Classification classify(const std::string& sysDescr,
                                                 const std::string& sysObjectId,
                                                 const std::string& hostname);

    /**
     * @brief Vendor name from sysDescr keywords, falling back to the
     *        enterprise number in sysObjectID.
     */
    [[nodiscard]] static std::string detectVendor(const std::string& sysDescr,
                                                  const std::string& sysObjectId);

    /**
     * @brief Hierarchy role from hostname naming conventions.
     *
     * Hostname patterns win; otherwise routers count as edge, switches as
     * access, servers as server and everything else as endpoint.
     */
    [[nodiscard]] static DeviceRole roleFor(const std::string& hostname, DeviceClass deviceClass);
};

} // namespace vlanvision::core
