/**
 * @file ISnmpClient.hpp
 * @brief Interface for synchronous SNMP queries used by the SNMP-based probes.
 */

#pragma once

#include "core/types/SnmpTypes.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace vlanvision::core {

/**
 * @brief Blocking SNMP GET / GET-NEXT / WALK against one agent.
 *
 * Every call is bounded by an absolute deadline; per-request timeouts and
 * retries come from the SnmpAgentConfig. Transport failures are reported in
 * SnmpResult::errorKind, never thrown.
 */
class ISnmpClient {
public:
    using Clock = std::chrono::steady_clock;

    virtual ~ISnmpClient() = default;

    /**
     * @brief Performs a GET request for the given OIDs.
     * @param address IPv4 address of the agent.
     * @param oids OIDs to retrieve.
     * @param deadline The call returns a timeout result once this passes.
     */
    virtual SnmpResult get(const std::string& address, const std::vector<std::string>& oids,
                           Clock::time_point deadline) = 0;

    /**
     * @brief Performs a GET-NEXT request.
     */
    virtual SnmpResult getNext(const std::string& address, const std::vector<std::string>& oids,
                               Clock::time_point deadline) = 0;

    /**
     * @brief Walks the subtree under @p rootOid with repeated GET-NEXT.
     *
     * Stops at the end of the subtree, an end-of-MIB exception, noSuchName
     * (v1), the row limit or the deadline. A walk that hits the deadline after
     * collecting rows is still reported as successful with the rows so far.
     */
    virtual SnmpResult walk(const std::string& address, const std::string& rootOid,
                            Clock::time_point deadline) = 0;
};

} // namespace vlanvision::core
