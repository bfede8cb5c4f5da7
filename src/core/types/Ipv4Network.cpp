#include "core/types/Ipv4Network.hpp"

#include <charconv>
#include <stdexcept>

namespace vlanvision::core {

namespace {

std::optional<int> parseNumber(const std::string& text, int maxValue) {
    if (text.empty() || text.size() > 3) {
        return std::nullopt;
    }
    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() || value < 0 || value > maxValue) {
        return std::nullopt;
    }
    return value;
}

} // namespace

Ipv4Network::Ipv4Network(uint32_t address, int prefixLength) : prefix_(prefixLength) {
    if (prefixLength < 0 || prefixLength > 32) {
        throw std::invalid_argument("Prefix length out of range: " + std::to_string(prefixLength));
    }
    network_ = address & mask();
}

Ipv4Network Ipv4Network::parse(const std::string& cidr) {
    auto network = tryParse(cidr);
    if (!network) {
        throw std::invalid_argument("Invalid CIDR: '" + cidr + "'");
    }
    return *network;
}

std::optional<Ipv4Network> Ipv4Network::tryParse(const std::string& cidr) {
    auto slash = cidr.find('/');
    auto address = parseAddress(cidr.substr(0, slash));
    if (!address) {
        return std::nullopt;
    }

    int prefix = 32;
    if (slash != std::string::npos) {
        auto parsed = parseNumber(cidr.substr(slash + 1), 32);
        if (!parsed) {
            return std::nullopt;
        }
        prefix = *parsed;
    }

    return Ipv4Network(*address, prefix);
}

std::optional<uint32_t> Ipv4Network::parseAddress(const std::string& address) {
    uint32_t result = 0;
    int octets = 0;
    size_t start = 0;

    while (start <= address.size()) {
        auto dot = address.find('.', start);
        auto part = address.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        auto value = parseNumber(part, 255);
        if (!value) {
            return std::nullopt;
        }
        result = (result << 8) | static_cast<uint32_t>(*value);
        ++octets;

        if (dot == std::string::npos) {
            break;
        }
        start = dot + 1;
    }

    if (octets != 4) {
        return std::nullopt;
    }
    return result;
}

std::string Ipv4Network::formatAddress(uint32_t address) {
    return std::to_string((address >> 24) & 0xFF) + "." + std::to_string((address >> 16) & 0xFF) +
           "." + std::to_string((address >> 8) & 0xFF) + "." + std::to_string(address & 0xFF);
}

uint32_t Ipv4Network::mask() const {
    return prefix_ == 0 ? 0u : (0xFFFFFFFFu << (32 - prefix_));
}

uint32_t Ipv4Network::broadcastAddress() const {
    return network_ | ~mask();
}

uint64_t Ipv4Network::hostCount() const {
    uint64_t size = uint64_t{1} << (32 - prefix_);
    return prefix_ >= 31 ? size : size - 2;
}

std::vector<std::string> Ipv4Network::hosts() const {
    std::vector<std::string> result;
    result.reserve(static_cast<size_t>(hostCount()));

    uint64_t first = network_;
    uint64_t last = broadcastAddress();
    if (prefix_ < 31) {
        ++first;
        --last;
    }

    for (uint64_t address = first; address <= last; ++address) {
        result.push_back(formatAddress(static_cast<uint32_t>(address)));
    }
    return result;
}

bool Ipv4Network::contains(uint32_t address) const {
    return (address & mask()) == network_;
}

bool Ipv4Network::contains(const std::string& address) const {
    auto parsed = parseAddress(address);
    return parsed && contains(*parsed);
}

bool Ipv4Network::overlaps(const Ipv4Network& other) const {
    // Two CIDR blocks overlap only if one contains the other.
    return contains(other.network_) || other.contains(network_);
}

std::string Ipv4Network::toString() const {
    return formatAddress(network_) + "/" + std::to_string(prefix_);
}

} // namespace vlanvision::core
