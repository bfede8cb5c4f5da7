#pragma once

#include "core/services/IProbe.hpp"

#include <atomic>
#include <cstdint>
#include <vector>

namespace vlanvision::infra {

/**
 * @brief ICMP echo reachability check.
 *
 * Tries an unprivileged ICMP datagram socket first and falls back to a raw
 * socket. A reply yields a result carrying only the latency; a destination
 * unreachable message or a socket that cannot be opened yields Unreachable.
 *
 * @note The raw socket fallback requires CAP_NET_RAW.
 */
class IcmpProbe : public core::IProbe {
public:
    IcmpProbe();

    [[nodiscard]] core::ProbeTechnique technique() const override { return core::ProbeTechnique::Icmp; }

    core::ProbeOutcome probe(const std::string& address, std::chrono::milliseconds timeout) override;

    static uint16_t calculateChecksum(const uint8_t* data, size_t length);
    static std::vector<uint8_t> buildEchoRequest(uint16_t identifier, uint16_t sequence);

private:
    std::atomic<uint16_t> sequenceNumber_{0};
    uint16_t identifier_;
};

} // namespace vlanvision::infra
