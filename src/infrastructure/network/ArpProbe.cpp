#include "infrastructure/network/ArpProbe.hpp"

#include "core/types/Ipv4Network.hpp"

#include <spdlog/spdlog.h>

#include <asio.hpp>

#include <algorithm>
#include <array>
#include <charconv>
#include <fstream>
#include <sstream>
#include <thread>

namespace vlanvision::infra {

namespace {

constexpr uint16_t DISCARD_PORT = 9;
constexpr unsigned long ATF_COMPLETE = 0x2;

std::optional<unsigned long> parseHexFlags(const std::string& text) {
    std::string digits = text;
    if (digits.rfind("0x", 0) == 0 || digits.rfind("0X", 0) == 0) {
        digits = digits.substr(2);
    }
    unsigned long value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value, 16);
    if (ec != std::errc() || ptr != digits.data() + digits.size()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

ArpProbe::ArpProbe(std::string tablePath, std::chrono::milliseconds pollInterval)
    : tablePath_(std::move(tablePath)), pollInterval_(pollInterval) {}

std::optional<std::string> ArpProbe::lookup(std::istream& table, const std::string& address) {
    std::string line;
    // Header: "IP address  HW type  Flags  HW address  Mask  Device"
    if (!std::getline(table, line)) {
        return std::nullopt;
    }

    while (std::getline(table, line)) {
        std::istringstream row(line);
        std::string ip, hwType, flags, mac;
        if (!(row >> ip >> hwType >> flags >> mac)) {
            continue;
        }
        if (ip != address) {
            continue;
        }
        auto flagValue = parseHexFlags(flags);
        if (!flagValue || (*flagValue & ATF_COMPLETE) == 0) {
            continue;
        }
        if (auto normalized = core::normalizeMac(mac)) {
            return normalized;
        }
    }
    return std::nullopt;
}

std::optional<std::string> ArpProbe::readTable(const std::string& address) const {
    std::ifstream file(tablePath_);
    if (!file) {
        return std::nullopt;
    }
    return lookup(file, address);
}

bool ArpProbe::triggerResolution(const std::string& address, std::string& error) {
    asio::io_context io;
    asio::ip::udp::socket socket(io);
    asio::error_code ec;

    auto target = asio::ip::make_address_v4(address, ec);
    if (ec) {
        error = "Invalid address: " + address;
        return false;
    }

    socket.open(asio::ip::udp::v4(), ec);
    if (ec) {
        error = "Failed to open UDP socket: " + ec.message();
        return false;
    }

    std::array<uint8_t, 1> payload{0};
    socket.send_to(asio::buffer(payload), asio::ip::udp::endpoint(target, DISCARD_PORT), 0, ec);
    if (ec == asio::error::network_unreachable || ec == asio::error::host_unreachable) {
        error = ec.message();
        return false;
    }
    if (ec) {
        // The kernel may still have queued resolution; keep polling
        spdlog::debug("ARP trigger datagram to {} failed: {}", address, ec.message());
    }
    return true;
}

core::ProbeOutcome ArpProbe::probe(const std::string& address, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;

    if (!core::Ipv4Network::parseAddress(address)) {
        return core::ProbeError{core::ProbeErrorKind::Unreachable, "Invalid address: " + address, {}};
    }

    // An entry cached from earlier traffic needs no datagram
    auto mac = readTable(address);
    if (!mac) {
        std::string error;
        if (!triggerResolution(address, error)) {
            return core::ProbeError{core::ProbeErrorKind::Unreachable, error, {}};
        }
    }

    while (!mac) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            spdlog::debug("ARP probe of {} timed out", address);
            return core::ProbeError{core::ProbeErrorKind::Timeout, "No ARP entry for " + address, {}};
        }
        std::this_thread::sleep_for(
            std::min(pollInterval_, std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now)));
        mac = readTable(address);
    }

    core::ProbeResult result;
    result.address = address;
    result.technique = core::ProbeTechnique::Arp;
    result.observedAt = std::chrono::system_clock::now();
    result.macAddress = *mac;
    return result;
}

} // namespace vlanvision::infra
