#include "infrastructure/network/SnmpClient.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <random>

namespace vlanvision::infra {

namespace {

constexpr const char* USM_NOT_IN_TIME_WINDOWS = "1.3.6.1.6.3.15.1.1.2";
constexpr const char* USM_UNKNOWN_ENGINE_IDS = "1.3.6.1.6.3.15.1.1.4";

constexpr uint8_t FLAG_REPORTABLE = 0x04;

bool isTransportUnreachable(const asio::error_code& ec) {
    return ec == asio::error::connection_refused || ec == asio::error::host_unreachable ||
           ec == asio::error::network_unreachable;
}

bool reportsResync(const SnmpMessage& report) {
    return std::any_of(report.varbinds.begin(), report.varbinds.end(), [](const core::SnmpVarBind& vb) {
        return SnmpCodec::isOidPrefix(USM_NOT_IN_TIME_WINDOWS, vb.oid) ||
               SnmpCodec::isOidPrefix(USM_UNKNOWN_ENGINE_IDS, vb.oid);
    });
}

std::string describeReport(const SnmpMessage& report) {
    for (const auto& vb : report.varbinds) {
        if (SnmpCodec::isOidPrefix(core::SnmpOids::USM_STATS_PREFIX, vb.oid)) {
            return "SNMPv3 report " + vb.oid;
        }
    }
    return "SNMPv3 report";
}

bool oidGreater(const std::string& lhs, const std::string& rhs) {
    return SnmpCodec::parseOidString(lhs) > SnmpCodec::parseOidString(rhs);
}

} // anonymous namespace

SnmpClient::SnmpClient(core::SnmpAgentConfig config) : config_(std::move(config)) {
    // Start request ids at a random value
    std::random_device rd;
    requestIdCounter_ = static_cast<int32_t>(rd() & 0x3FFFFFFF);
    spdlog::debug("SnmpClient initialized ({} port {}, timeout {}ms, {} retries)",
                  core::snmpVersionToString(config_.version), config_.port, config_.timeoutMs, config_.retries);
}

int32_t SnmpClient::nextRequestId() {
    int32_t id = requestIdCounter_.fetch_add(1) & 0x7FFFFFFF;
    return id == 0 ? 1 : id;
}

core::SnmpResult SnmpClient::get(const std::string& address, const std::vector<std::string>& oids,
                                 Clock::time_point deadline) {
    return request(address, PduType::GetRequest, oids, deadline);
}

core::SnmpResult SnmpClient::getNext(const std::string& address, const std::vector<std::string>& oids,
                                     Clock::time_point deadline) {
    return request(address, PduType::GetNextRequest, oids, deadline);
}

core::SnmpResult SnmpClient::walk(const std::string& address, const std::string& rootOid,
                                  Clock::time_point deadline) {
    core::SnmpResult result;
    result.timestamp = std::chrono::system_clock::now();
    result.version = config_.version;
    auto startTime = Clock::now();

    std::string currentOid = rootOid;
    while (result.varbinds.size() < static_cast<size_t>(MAX_WALK_ROWS)) {
        auto step = request(address, PduType::GetNextRequest, {currentOid}, deadline);

        if (step.errorKind != core::SnmpErrorKind::None) {
            if (result.varbinds.empty()) {
                return step;
            }
            spdlog::debug("SNMP walk of {} on {} stopped after {} rows: {}", rootOid, address,
                          result.varbinds.size(), step.errorMessage);
            break;
        }

        if (!step.success) {
            // v1 agents answer noSuchName past the end of the MIB
            if (step.errorStatus == SnmpCodec::ERR_NO_SUCH_NAME || !result.varbinds.empty()) {
                break;
            }
            return step;
        }

        if (step.varbinds.empty()) {
            break;
        }

        const auto& vb = step.varbinds.front();
        if (!SnmpCodec::isOidPrefix(rootOid, vb.oid) || vb.isException()) {
            break;
        }
        if (!oidGreater(vb.oid, currentOid)) {
            spdlog::warn("SNMP agent {} returned non-increasing OID {} during walk", address, vb.oid);
            break;
        }

        currentOid = vb.oid;
        result.varbinds.push_back(vb);
    }

    if (result.varbinds.size() >= static_cast<size_t>(MAX_WALK_ROWS)) {
        spdlog::debug("SNMP walk of {} on {} truncated at {} rows", rootOid, address, MAX_WALK_ROWS);
    }

    result.success = true;
    result.responseTime = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - startTime);
    return result;
}

core::SnmpResult SnmpClient::request(const std::string& address, PduType pduType,
                                     const std::vector<std::string>& oids, Clock::time_point deadline) {
    core::SnmpResult result;
    result.timestamp = std::chrono::system_clock::now();
    result.version = config_.version;

    auto startTime = Clock::now();
    auto fail = [&](core::SnmpErrorKind kind, std::string message, std::string raw = {}) {
        result.success = false;
        result.errorKind = kind;
        result.errorMessage = std::move(message);
        result.rawExcerpt = std::move(raw);
        result.responseTime = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - startTime);
        return result;
    };

    if (config_.version == core::SnmpVersion::V3) {
        const auto* v3 = std::get_if<core::SnmpV3Credentials>(&config_.credentials);
        if (!v3) {
            return fail(core::SnmpErrorKind::AuthFailure, "SNMPv3 requires user credentials");
        }
        if (v3->securityLevel != core::SnmpSecurityLevel::NoAuthNoPriv) {
            return fail(core::SnmpErrorKind::AuthFailure,
                        "Unsupported security level " + core::snmpSecurityLevelToString(v3->securityLevel));
        }
    }

    asio::io_context io;
    asio::error_code ec;
    asio::ip::udp::endpoint endpoint;

    auto ip = asio::ip::make_address_v4(address, ec);
    if (!ec) {
        endpoint = asio::ip::udp::endpoint(ip, config_.port);
    } else {
        asio::ip::udp::resolver resolver(io);
        auto endpoints = resolver.resolve(asio::ip::udp::v4(), address, std::to_string(config_.port), ec);
        if (ec || endpoints.empty()) {
            return fail(core::SnmpErrorKind::Unreachable, "Failed to resolve address: " + address);
        }
        endpoint = *endpoints.begin();
    }

    asio::ip::udp::socket socket(io);
    socket.open(asio::ip::udp::v4(), ec);
    if (!ec) {
        socket.connect(endpoint, ec);
    }
    if (ec) {
        return fail(core::SnmpErrorKind::Unreachable, "Socket error: " + ec.message());
    }

    std::optional<EngineInfo> engine;
    if (config_.version == core::SnmpVersion::V3) {
        {
            std::lock_guard lock(engineMutex_);
            auto it = engines_.find(address);
            if (it != engines_.end()) {
                engine = it->second;
            }
        }
        if (!engine) {
            Exchange failure;
            engine = discoverEngine(io, socket, address, deadline, failure);
            if (!engine) {
                return fail(failure.error, failure.message, failure.rawExcerpt);
            }
        }
    }

    int attempts = 1 + std::max(0, config_.retries);
    bool resynced = false;

    for (int attempt = 0; attempt < attempts; ++attempt) {
        auto now = Clock::now();
        if (now >= deadline) {
            break;
        }
        auto window = std::min(deadline, now + std::chrono::milliseconds(config_.timeoutMs));

        SnmpMessage message;
        try {
            message = buildMessage(pduType, oids, engine);
        } catch (const std::invalid_argument& e) {
            return fail(core::SnmpErrorKind::Malformed, std::string("Invalid request: ") + e.what());
        }

        auto outcome = exchange(io, socket, message, window);
        if (outcome.error == core::SnmpErrorKind::Timeout) {
            spdlog::trace("SNMP request to {} timed out (attempt {}/{})", address, attempt + 1, attempts);
            continue;
        }
        if (outcome.error != core::SnmpErrorKind::None) {
            return fail(outcome.error, outcome.message, outcome.rawExcerpt);
        }

        auto& response = *outcome.response;
        if (response.pduType == PduType::Report) {
            if (!resynced && response.v3 && reportsResync(response)) {
                engine = EngineInfo{response.v3->engineId, response.v3->engineBoots, response.v3->engineTime};
                {
                    std::lock_guard lock(engineMutex_);
                    engines_[address] = *engine;
                }
                resynced = true;
                ++attempts;
                continue;
            }
            return fail(core::SnmpErrorKind::AuthFailure, describeReport(response));
        }

        if (response.errorStatus == SnmpCodec::ERR_AUTHORIZATION) {
            return fail(core::SnmpErrorKind::AuthFailure, SnmpCodec::errorStatusToString(response.errorStatus));
        }

        result.errorStatus = response.errorStatus;
        result.errorIndex = response.errorIndex;
        result.varbinds = std::move(response.varbinds);
        result.success = response.errorStatus == 0;
        if (!result.success) {
            result.errorMessage = SnmpCodec::errorStatusToString(response.errorStatus);
        }
        result.responseTime = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - startTime);
        return result;
    }

    return fail(core::SnmpErrorKind::Timeout, "Request timed out");
}

SnmpClient::Exchange SnmpClient::exchange(asio::io_context& io, asio::ip::udp::socket& socket,
                                          const SnmpMessage& message, Clock::time_point deadline) {
    Exchange out;
    auto packet = SnmpCodec::encode(message);

    asio::error_code ec;
    socket.send(asio::buffer(packet), 0, ec);
    if (ec) {
        out.error = core::SnmpErrorKind::Unreachable;
        out.message = "Send failed: " + ec.message();
        return out;
    }

    std::vector<uint8_t> buffer(65535);
    for (;;) {
        auto now = Clock::now();
        if (now >= deadline) {
            out.error = core::SnmpErrorKind::Timeout;
            out.message = "Request timed out";
            return out;
        }

        std::optional<asio::error_code> recvError;
        size_t received = 0;
        socket.async_receive(asio::buffer(buffer), [&](const asio::error_code& error, size_t bytes) {
            recvError = error;
            received = bytes;
        });

        io.restart();
        io.run_for(deadline - now);

        if (!recvError) {
            socket.cancel(ec);
            if (ec) {
                spdlog::debug("Failed to cancel SNMP receive: {}", ec.message());
            }
            io.restart();
            io.run();
            out.error = core::SnmpErrorKind::Timeout;
            out.message = "Request timed out";
            return out;
        }

        if (*recvError) {
            out.error = core::SnmpErrorKind::Unreachable;
            out.message = isTransportUnreachable(*recvError) ? "Agent unreachable: " + recvError->message()
                                                             : "Receive error: " + recvError->message();
            return out;
        }

        std::vector<uint8_t> datagram(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(received));
        SnmpMessage response;
        try {
            response = SnmpCodec::decode(datagram);
        } catch (const MalformedPacket& e) {
            out.error = core::SnmpErrorKind::Malformed;
            out.message = std::string("Parse error: ") + e.what();
            out.rawExcerpt = SnmpCodec::hexExcerpt(datagram);
            return out;
        }

        bool matches = message.version == core::SnmpVersion::V3
                           ? (response.v3 && message.v3 && response.v3->msgId == message.v3->msgId)
                           : response.requestId == message.requestId;
        if (!matches) {
            spdlog::debug("Discarding SNMP datagram with unexpected request id {}", response.requestId);
            continue;
        }

        out.response = std::move(response);
        return out;
    }
}

std::optional<SnmpClient::EngineInfo> SnmpClient::discoverEngine(asio::io_context& io,
                                                                 asio::ip::udp::socket& socket,
                                                                 const std::string& address,
                                                                 Clock::time_point deadline, Exchange& failure) {
    int attempts = 1 + std::max(0, config_.retries);
    for (int attempt = 0; attempt < attempts; ++attempt) {
        auto now = Clock::now();
        if (now >= deadline) {
            break;
        }
        auto window = std::min(deadline, now + std::chrono::milliseconds(config_.timeoutMs));

        auto probe = SnmpCodec::makeRequest(PduType::GetRequest, nextRequestId(), {});
        probe.version = core::SnmpVersion::V3;
        SnmpV3Header header;
        header.msgId = probe.requestId;
        header.flags = FLAG_REPORTABLE;
        probe.v3 = header;

        auto outcome = exchange(io, socket, probe, window);
        if (outcome.error == core::SnmpErrorKind::Timeout) {
            continue;
        }
        if (outcome.error != core::SnmpErrorKind::None) {
            failure = std::move(outcome);
            return std::nullopt;
        }

        const auto& response = *outcome.response;
        if (!response.v3 || response.v3->engineId.empty()) {
            failure.error = core::SnmpErrorKind::Malformed;
            failure.message = "Engine discovery returned no engine id";
            return std::nullopt;
        }

        EngineInfo engine{response.v3->engineId, response.v3->engineBoots, response.v3->engineTime};
        std::lock_guard lock(engineMutex_);
        engines_[address] = engine;
        spdlog::debug("Discovered SNMPv3 engine for {} (boots {})", address, engine.boots);
        return engine;
    }

    failure.error = core::SnmpErrorKind::Timeout;
    failure.message = "SNMPv3 engine discovery timed out";
    return std::nullopt;
}

SnmpMessage SnmpClient::buildMessage(PduType pduType, const std::vector<std::string>& oids,
                                     const std::optional<EngineInfo>& engine) {
    auto message = SnmpCodec::makeRequest(pduType, nextRequestId(), oids);
    message.version = config_.version;

    if (config_.version == core::SnmpVersion::V3) {
        const auto* v3 = std::get_if<core::SnmpV3Credentials>(&config_.credentials);
        SnmpV3Header header;
        header.msgId = message.requestId;
        header.flags = FLAG_REPORTABLE;
        if (engine) {
            header.engineId = engine->engineId;
            header.engineBoots = engine->boots;
            header.engineTime = engine->time;
            header.contextEngineId = engine->engineId;
        }
        if (v3) {
            header.userName = v3->username;
            header.contextName = v3->contextName;
        }
        message.v3 = std::move(header);
    } else if (const auto* community = std::get_if<core::SnmpCommunityCredentials>(&config_.credentials)) {
        message.community = community->community;
    } else {
        message.community = "public";
    }

    // Encode once up front so bad OIDs surface as invalid_argument here
    (void)SnmpCodec::encode(message);
    return message;
}

core::ProbeError SnmpClient::toProbeError(const core::SnmpResult& result) {
    core::ProbeError error;
    error.message = result.errorMessage;

    switch (result.errorKind) {
    case core::SnmpErrorKind::Timeout:
        error.kind = core::ProbeErrorKind::Timeout;
        break;
    case core::SnmpErrorKind::Unreachable:
        error.kind = core::ProbeErrorKind::Unreachable;
        break;
    case core::SnmpErrorKind::AuthFailure:
        error.kind = core::ProbeErrorKind::AuthFailure;
        break;
    case core::SnmpErrorKind::Malformed:
        error.kind = core::ProbeErrorKind::MalformedResponse;
        error.payloadContext = result.rawExcerpt;
        break;
    case core::SnmpErrorKind::None:
        error.kind = core::ProbeErrorKind::MalformedResponse;
        if (error.message.empty()) {
            error.message = SnmpCodec::errorStatusToString(result.errorStatus);
        }
        break;
    }
    return error;
}

} // namespace vlanvision::infra
