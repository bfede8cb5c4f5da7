#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vlanvision::core {

/**
 * @brief IPv4 CIDR block used as a discovery target range.
 *
 * Host bits in the textual form are masked off, so "10.0.0.7/24" parses
 * to 10.0.0.0/24. A bare address parses as a /32.
 */
class Ipv4Network {
public:
    Ipv4Network() = default;
    Ipv4Network(uint32_t address, int prefixLength);

    /**
     * @brief Parses CIDR notation.
     * @throws std::invalid_argument if the text is not a valid IPv4 CIDR.
     */
    static Ipv4Network parse(const std::string& cidr);

    static std::optional<Ipv4Network> tryParse(const std::string& cidr);

    static std::optional<uint32_t> parseAddress(const std::string& address);
    static std::string formatAddress(uint32_t address);

    [[nodiscard]] uint32_t networkAddress() const { return network_; }
    [[nodiscard]] uint32_t broadcastAddress() const;
    [[nodiscard]] int prefixLength() const { return prefix_; }

    /// Number of probe targets; /31 and /32 have no network/broadcast exclusion.
    [[nodiscard]] uint64_t hostCount() const;

    /// Usable host addresses in ascending order.
    [[nodiscard]] std::vector<std::string> hosts() const;

    [[nodiscard]] bool contains(uint32_t address) const;
    [[nodiscard]] bool contains(const std::string& address) const;
    [[nodiscard]] bool overlaps(const Ipv4Network& other) const;

    [[nodiscard]] std::string toString() const;

    bool operator==(const Ipv4Network& other) const = default;

private:
    [[nodiscard]] uint32_t mask() const;

    uint32_t network_{0};
    int prefix_{32};
};

} // namespace vlanvision::core
