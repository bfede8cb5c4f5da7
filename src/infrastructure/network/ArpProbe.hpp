#pragma once

#include "core/services/IProbe.hpp"

#include <chrono>
#include <istream>
#include <optional>
#include <string>

namespace vlanvision::infra {

/**
 * @brief Resolves the MAC address of an on-link host from the kernel neighbor table.
 *
 * A single UDP datagram to the discard port makes the kernel start ARP
 * resolution; the neighbor table is then polled until a complete entry for
 * the address appears or the timeout passes. Only the MAC is reported.
 *
 * @note Linux only: reads /proc/net/arp.
 */
class ArpProbe : public core::IProbe {
public:
    static constexpr const char* DEFAULT_TABLE_PATH = "/proc/net/arp";

    explicit ArpProbe(std::string tablePath = DEFAULT_TABLE_PATH,
                      std::chrono::milliseconds pollInterval = std::chrono::milliseconds(50));

    [[nodiscard]] core::ProbeTechnique technique() const override { return core::ProbeTechnique::Arp; }

    core::ProbeOutcome probe(const std::string& address, std::chrono::milliseconds timeout) override;

    /**
     * @brief Finds a complete entry for @p address in a /proc/net/arp listing.
     * @return The normalized MAC, or std::nullopt if there is no complete entry.
     */
    static std::optional<std::string> lookup(std::istream& table, const std::string& address);

    [[nodiscard]] const std::string& tablePath() const { return tablePath_; }

private:
    std::optional<std::string> readTable(const std::string& address) const;
    static bool triggerResolution(const std::string& address, std::string& error);

    std::string tablePath_;
    std::chrono::milliseconds pollInterval_;
};

} // namespace vlanvision::infra
