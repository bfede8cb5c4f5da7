#pragma once

#include "core/services/IProbe.hpp"
#include "core/services/ISnmpClient.hpp"
#include "core/types/Device.hpp"
#include "core/types/ProbeResult.hpp"
#include "core/types/SnmpTypes.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace vlanvision::test {

/// Successful SNMP-style result for @p address.
inline core::ProbeResult snmpResult(const std::string& address, std::optional<std::string> mac = std::nullopt,
                                    std::optional<int> vlan = std::nullopt,
                                    std::optional<std::string> hostname = std::nullopt) {
    core::ProbeResult result;
    result.address = address;
    result.technique = core::ProbeTechnique::Snmp;
    result.observedAt = std::chrono::system_clock::now();
    result.macAddress = std::move(mac);
    result.vlanId = vlan;
    result.hostname = std::move(hostname);
    return result;
}

inline core::ProbeError probeError(core::ProbeErrorKind kind, const std::string& message = "scripted failure") {
    return core::ProbeError{kind, message, {}};
}

inline core::ProbeError timeoutError() {
    return probeError(core::ProbeErrorKind::Timeout, "No response");
}

inline core::SnmpVarBind octetVarBind(const std::string& oid, const std::string& value) {
    core::SnmpVarBind vb;
    vb.oid = oid;
    vb.type = core::SnmpDataType::OctetString;
    vb.value = value;
    return vb;
}

inline core::SnmpVarBind integerVarBind(const std::string& oid, int64_t value) {
    core::SnmpVarBind vb;
    vb.oid = oid;
    vb.type = core::SnmpDataType::Integer;
    vb.value = std::to_string(value);
    vb.intValue = value;
    return vb;
}

inline core::SnmpVarBind gaugeVarBind(const std::string& oid, uint64_t value) {
    core::SnmpVarBind vb;
    vb.oid = oid;
    vb.type = core::SnmpDataType::Gauge32;
    vb.value = std::to_string(value);
    vb.counterValue = value;
    return vb;
}

/// Active device record as the registry would hold it.
inline core::Device makeDevice(core::DeviceId id, const std::string& ip, std::optional<int> vlan = std::nullopt,
                               const std::string& hostname = {}) {
    core::Device device;
    device.id = id;
    device.ipAddress = ip;
    device.hostname = hostname;
    device.vlanId = vlan;
    device.reachability = core::Reachability::Up;
    device.firstSeen = std::chrono::system_clock::now();
    device.lastSeen = device.firstSeen;
    return device;
}

/**
 * @brief Probe whose answers come from a callback.
 *
 * Records every call and the peak number of concurrent invocations. An
 * optional delay is slept before the callback runs, independent of the
 * timeout passed by the pool.
 */
class ScriptedProbe : public core::IProbe {
public:
    using Script = std::function<core::ProbeOutcome(const std::string& address)>;

    ScriptedProbe(core::ProbeTechnique technique, Script script,
                  std::chrono::milliseconds delay = std::chrono::milliseconds(0))
        : technique_(technique), script_(std::move(script)), delay_(delay) {}

    [[nodiscard]] core::ProbeTechnique technique() const override { return technique_; }

    core::ProbeOutcome probe(const std::string& address, std::chrono::milliseconds /*timeout*/) override {
        auto current = ++inFlight_;
        auto peak = maxInFlight_.load();
        while (current > peak && !maxInFlight_.compare_exchange_weak(peak, current)) {
        }
        {
            std::lock_guard lock(mutex_);
            addresses_.push_back(address);
        }

        if (delay_.count() > 0) {
            std::this_thread::sleep_for(delay_);
        }

        auto outcome = script_(address);
        --inFlight_;
        ++completed_;
        return outcome;
    }

    [[nodiscard]] size_t calls() const {
        std::lock_guard lock(mutex_);
        return addresses_.size();
    }

    [[nodiscard]] std::vector<std::string> addresses() const {
        std::lock_guard lock(mutex_);
        return addresses_;
    }

    [[nodiscard]] int maxInFlight() const { return maxInFlight_; }
    [[nodiscard]] int completed() const { return completed_; }

private:
    core::ProbeTechnique technique_;
    Script script_;
    std::chrono::milliseconds delay_;
    std::atomic<int> inFlight_{0};
    std::atomic<int> maxInFlight_{0};
    std::atomic<int> completed_{0};
    mutable std::mutex mutex_;
    std::vector<std::string> addresses_;
};

/**
 * @brief SNMP client answering from canned tables.
 *
 * GET answers from @c values; WALK returns @c tables[root] or an empty
 * successful walk. When @c failure is set every call fails with that kind.
 */
class CannedSnmpClient : public core::ISnmpClient {
public:
    std::map<std::string, core::SnmpVarBind> values;
    std::map<std::string, std::vector<core::SnmpVarBind>> tables;
    std::optional<core::SnmpErrorKind> failure;
    std::string rawExcerpt;

    core::SnmpResult get(const std::string& /*address*/, const std::vector<std::string>& oids,
                         Clock::time_point /*deadline*/) override {
        std::lock_guard lock(mutex_);
        ++gets_;
        if (failure) {
            return failed();
        }
        core::SnmpResult result;
        result.success = true;
        for (const auto& oid : oids) {
            auto it = values.find(oid);
            if (it != values.end()) {
                result.varbinds.push_back(it->second);
            } else {
                core::SnmpVarBind missing;
                missing.oid = oid;
                missing.type = core::SnmpDataType::NoSuchObject;
                result.varbinds.push_back(missing);
            }
        }
        return result;
    }

    core::SnmpResult getNext(const std::string& address, const std::vector<std::string>& oids,
                             Clock::time_point deadline) override {
        return get(address, oids, deadline);
    }

    core::SnmpResult walk(const std::string& /*address*/, const std::string& rootOid,
                          Clock::time_point /*deadline*/) override {
        std::lock_guard lock(mutex_);
        walked_.push_back(rootOid);
        if (failure) {
            return failed();
        }
        core::SnmpResult result;
        result.success = true;
        auto it = tables.find(rootOid);
        if (it != tables.end()) {
            result.varbinds = it->second;
        }
        return result;
    }

    [[nodiscard]] std::vector<std::string> walkedRoots() const {
        std::lock_guard lock(mutex_);
        return walked_;
    }

    [[nodiscard]] int getCount() const {
        std::lock_guard lock(mutex_);
        return gets_;
    }

private:
    core::SnmpResult failed() const {
        core::SnmpResult result;
        result.errorKind = *failure;
        result.errorMessage = "canned failure";
        result.rawExcerpt = rawExcerpt;
        return result;
    }

    mutable std::mutex mutex_;
    std::vector<std::string> walked_;
    int gets_{0};
};

} // namespace vlanvision::test
