#pragma once

#include "core/services/ISnmpClient.hpp"
#include "core/types/ProbeResult.hpp"
#include "infrastructure/network/SnmpCodec.hpp"

#include <asio.hpp>
#include <atomic>
#include <map>
#include <mutex>
#include <optional>

namespace vlanvision::infra {

/**
 * @brief Blocking SNMP v1/v2c/v3 client over UDP.
 *
 * Each request runs on a private io_context with a connected UDP socket, so
 * an ICMP port-unreachable for the agent surfaces as connection_refused and is
 * reported as SnmpErrorKind::Unreachable. Datagrams whose request id does not
 * match the outstanding request are discarded. SNMPv3 is limited to
 * noAuthNoPriv; the authoritative engine id is discovered once per agent and
 * cached.
 *
 * Thread-safe: concurrent calls use independent sockets.
 */
class SnmpClient : public core::ISnmpClient {
public:
    /// Upper bound on rows returned by walk().
    static constexpr int MAX_WALK_ROWS = 1000;

    explicit SnmpClient(core::SnmpAgentConfig config);

    SnmpClient(const SnmpClient&) = delete;
    SnmpClient& operator=(const SnmpClient&) = delete;

    core::SnmpResult get(const std::string& address, const std::vector<std::string>& oids,
                         Clock::time_point deadline) override;

    core::SnmpResult getNext(const std::string& address, const std::vector<std::string>& oids,
                             Clock::time_point deadline) override;

    core::SnmpResult walk(const std::string& address, const std::string& rootOid,
                          Clock::time_point deadline) override;

    [[nodiscard]] const core::SnmpAgentConfig& config() const { return config_; }

    /**
     * @brief Maps a failed SnmpResult to the probe error taxonomy.
     *
     * A result carrying a non-zero error-status other than authorizationError
     * still means the agent answered; callers decide whether that is a failure.
     */
    static core::ProbeError toProbeError(const core::SnmpResult& result);

private:
    struct EngineInfo {
        std::string engineId;
        int32_t boots{0};
        int32_t time{0};
    };

    struct Exchange {
        core::SnmpErrorKind error{core::SnmpErrorKind::None};
        std::string message;
        std::string rawExcerpt;
        std::optional<SnmpMessage> response;
    };

    core::SnmpResult request(const std::string& address, PduType pduType,
                             const std::vector<std::string>& oids, Clock::time_point deadline);

    Exchange exchange(asio::io_context& io, asio::ip::udp::socket& socket, const SnmpMessage& message,
                      Clock::time_point deadline);

    std::optional<EngineInfo> discoverEngine(asio::io_context& io, asio::ip::udp::socket& socket,
                                             const std::string& address, Clock::time_point deadline,
                                             Exchange& failure);

    SnmpMessage buildMessage(PduType pduType, const std::vector<std::string>& oids,
                             const std::optional<EngineInfo>& engine);

    int32_t nextRequestId();

    core::SnmpAgentConfig config_;
    std::atomic<int32_t> requestIdCounter_;

    std::mutex engineMutex_;
    std::map<std::string, EngineInfo> engines_; ///< Keyed by agent address
};

} // namespace vlanvision::infra
