/**
 * @file IProbe.hpp
 * @brief Interface for a single discovery technique.
 */

#pragma once

#include "core/types/ProbeResult.hpp"

#include <chrono>
#include <string>

namespace vlanvision::core {

/**
 * @brief One discovery technique applied to one address.
 *
 * Implementations are read-only towards the target and must return within
 * the timeout, reporting failures as a ProbeError value rather than throwing.
 * A probe may be called concurrently from several pool threads.
 */
class IProbe {
public:
    virtual ~IProbe() = default;

    /**
     * @brief Technique implemented by this probe.
     */
    [[nodiscard]] virtual ProbeTechnique technique() const = 0;

    /**
     * @brief Probes @p address, blocking for at most @p timeout.
     * @param address IPv4 address in dotted notation.
     * @param timeout Upper bound for the whole probe, retries included.
     * @return Observed attributes or a typed error.
     */
    virtual ProbeOutcome probe(const std::string& address, std::chrono::milliseconds timeout) = 0;
};

} // namespace vlanvision::core
