#include "infrastructure/network/IcmpProbe.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <random>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace vlanvision::infra {

namespace {

constexpr uint8_t ICMP_ECHO_REPLY = 0;
constexpr uint8_t ICMP_DEST_UNREACHABLE = 3;
constexpr uint8_t ICMP_ECHO_REQUEST = 8;
constexpr size_t ICMP_HEADER_SIZE = 8;
constexpr size_t ECHO_PACKET_SIZE = 64;

/// Closes the descriptor on scope exit.
class SocketGuard {
public:
    explicit SocketGuard(int fd) : fd_(fd) {}
    ~SocketGuard() {
        if (fd_ >= 0) {
            close(fd_);
        }
    }
    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;

    [[nodiscard]] int get() const { return fd_; }

private:
    int fd_;
};

uint16_t readU16(const uint8_t* data) {
    return static_cast<uint16_t>((static_cast<uint16_t>(data[0]) << 8) | data[1]);
}

core::ProbeError unreachable(const std::string& message) {
    return core::ProbeError{core::ProbeErrorKind::Unreachable, message, {}};
}

} // namespace

IcmpProbe::IcmpProbe() {
    std::random_device rd;
    identifier_ = static_cast<uint16_t>(rd() & 0xFFFF);
}

uint16_t IcmpProbe::calculateChecksum(const uint8_t* data, size_t length) {
    uint32_t sum = 0;

    while (length > 1) {
        sum += (static_cast<uint16_t>(data[0]) << 8) | data[1];
        data += 2;
        length -= 2;
    }
    if (length == 1) {
        sum += static_cast<uint16_t>(data[0]) << 8;
    }
    while (sum >> 16) {
        sum = (sum & 0xFFFF) + (sum >> 16);
    }
    return static_cast<uint16_t>(~sum);
}

std::vector<uint8_t> IcmpProbe::buildEchoRequest(uint16_t identifier, uint16_t sequence) {
    std::vector<uint8_t> packet(ECHO_PACKET_SIZE, 0);
    packet[0] = ICMP_ECHO_REQUEST;
    packet[4] = static_cast<uint8_t>(identifier >> 8);
    packet[5] = static_cast<uint8_t>(identifier & 0xFF);
    packet[6] = static_cast<uint8_t>(sequence >> 8);
    packet[7] = static_cast<uint8_t>(sequence & 0xFF);

    auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    std::memcpy(&packet[ICMP_HEADER_SIZE], &now, sizeof(now));

    uint16_t checksum = calculateChecksum(packet.data(), packet.size());
    packet[2] = static_cast<uint8_t>(checksum >> 8);
    packet[3] = static_cast<uint8_t>(checksum & 0xFF);
    return packet;
}

core::ProbeOutcome IcmpProbe::probe(const std::string& address, std::chrono::milliseconds timeout) {
    using Clock = std::chrono::steady_clock;
    auto deadline = Clock::now() + timeout;

    sockaddr_in dest{};
    dest.sin_family = AF_INET;
    if (inet_pton(AF_INET, address.c_str(), &dest.sin_addr) != 1) {
        return unreachable("Invalid address: " + address);
    }

    // Datagram ICMP sockets deliver the reply without the IP header and
    // rewrite the identifier, so only the sequence number can be matched
    bool raw = false;
    int fd = socket(AF_INET, SOCK_DGRAM, IPPROTO_ICMP);
    if (fd < 0) {
        fd = socket(AF_INET, SOCK_RAW, IPPROTO_ICMP);
        raw = true;
    }
    if (fd < 0) {
        auto message = std::string("Failed to create ICMP socket: ") + std::strerror(errno);
        spdlog::warn("ICMP probe of {} failed: {}", address, message);
        return unreachable(message);
    }
    SocketGuard guard(fd);

    uint16_t seq = sequenceNumber_++;
    auto packet = buildEchoRequest(identifier_, seq);

    auto sendTime = Clock::now();
    ssize_t sent = sendto(fd, packet.data(), packet.size(), 0, reinterpret_cast<sockaddr*>(&dest), sizeof(dest));
    if (sent < 0) {
        return unreachable(std::string("Failed to send echo request: ") + std::strerror(errno));
    }

    std::array<uint8_t, 1500> buffer{};
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (remaining.count() <= 0) {
            break;
        }

        pollfd pfd{fd, POLLIN, 0};
        int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            return unreachable(std::string("poll failed: ") + std::strerror(errno));
        }
        if (ready == 0) {
            break;
        }

        sockaddr_in from{};
        socklen_t fromLen = sizeof(from);
        ssize_t received = recvfrom(fd, buffer.data(), buffer.size(), 0, reinterpret_cast<sockaddr*>(&from), &fromLen);
        auto recvTime = Clock::now();
        if (received < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            return unreachable(std::string("Receive failed: ") + std::strerror(errno));
        }

        const uint8_t* icmp = buffer.data();
        size_t length = static_cast<size_t>(received);
        if (raw) {
            if (length < 20) {
                continue;
            }
            size_t ipHeaderLen = static_cast<size_t>((buffer[0] & 0x0F) * 4);
            if (length < ipHeaderLen + ICMP_HEADER_SIZE) {
                continue;
            }
            icmp += ipHeaderLen;
            length -= ipHeaderLen;
        }
        if (length < ICMP_HEADER_SIZE) {
            continue;
        }

        if (icmp[0] == ICMP_ECHO_REPLY && from.sin_addr.s_addr == dest.sin_addr.s_addr) {
            if (readU16(icmp + 6) != seq || (raw && readU16(icmp + 4) != identifier_)) {
                continue;
            }

            core::ProbeResult result;
            result.address = address;
            result.technique = core::ProbeTechnique::Icmp;
            result.observedAt = std::chrono::system_clock::now();
            result.latency = std::chrono::duration_cast<std::chrono::microseconds>(recvTime - sendTime);
            spdlog::debug("ICMP reply from {} in {}us", address, result.latency->count());
            return result;
        }

        // Destination unreachable quotes our IP header and the first 8 bytes of the echo
        if (raw && icmp[0] == ICMP_DEST_UNREACHABLE && length >= ICMP_HEADER_SIZE + 20 + ICMP_HEADER_SIZE) {
            const uint8_t* quoted = icmp + ICMP_HEADER_SIZE;
            size_t quotedIpLen = static_cast<size_t>((quoted[0] & 0x0F) * 4);
            if (length < ICMP_HEADER_SIZE + quotedIpLen + ICMP_HEADER_SIZE) {
                continue;
            }
            const uint8_t* quotedEcho = quoted + quotedIpLen;
            if (quotedEcho[0] == ICMP_ECHO_REQUEST && readU16(quotedEcho + 4) == identifier_ &&
                readU16(quotedEcho + 6) == seq) {
                return unreachable("Destination unreachable (code " + std::to_string(icmp[1]) + ")");
            }
        }
    }

    spdlog::debug("ICMP probe of {} timed out", address);
    return core::ProbeError{core::ProbeErrorKind::Timeout, "No echo reply from " + address, {}};
}

} // namespace vlanvision::infra
