#include "infrastructure/config/ConfigManager.hpp"

#include "core/types/Ipv4Network.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <fstream>

namespace vlanvision::infra {

namespace {

template <typename T>
void clamp(T& value, T low, T high, const char* name) {
    if (value < low || value > high) {
        T clamped = std::clamp(value, low, high);
        spdlog::warn("Config value {}={} out of range, using {}", name, value, clamped);
        value = clamped;
    }
}

std::optional<std::string> environment(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

} // namespace

ConfigManager::ConfigManager(const std::filesystem::path& configDir) : configDir_(configDir) {
    if (!std::filesystem::exists(configDir_)) {
        std::filesystem::create_directories(configDir_);
    }

    configPath_ = configDir_ / "config.json";
    secureStorage_ = std::make_unique<SecureStorage>(configDir_ / ".key");
}

bool ConfigManager::load() {
    if (!std::filesystem::exists(configPath_)) {
        spdlog::info("Config file not found, writing defaults to {}", configPath_.string());
        applyEnvironment();
        return save();
    }

    try {
        std::ifstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file: {}", configPath_.string());
            return false;
        }

        nlohmann::json j;
        file >> j;
        fromJson(j);
        applyEnvironment();

        spdlog::info("Loaded configuration from {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load config: {}", e.what());
        return false;
    }
}

bool ConfigManager::save() {
    try {
        auto j = toJson();

        std::ofstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file for writing: {}", configPath_.string());
            return false;
        }

        file << j.dump(2);
        spdlog::debug("Saved configuration to {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save config: {}", e.what());
        return false;
    }
}

nlohmann::json ConfigManager::toJson() const {
    nlohmann::json j;

    // SNMP
    j["snmp"]["version"] = core::snmpVersionToString(config_.snmp.version);
    j["snmp"]["port"] = config_.snmp.port;
    j["snmp"]["timeout_ms"] = config_.snmp.timeoutMs;
    j["snmp"]["retries"] = config_.snmp.retries;
    j["snmp"]["v3_username"] = config_.snmp.v3Username;
    j["snmp"]["v3_security_level"] = core::snmpSecurityLevelToString(config_.snmp.v3SecurityLevel);
    j["snmp"]["v3_context_name"] = config_.snmp.v3ContextName;

    // Discovery
    const auto& d = config_.discovery;
    j["discovery"]["default_range"] = d.defaultRange;
    j["discovery"]["periodic_ranges"] = d.periodicRanges;
    j["discovery"]["periodic_enabled"] = d.periodicEnabled;
    j["discovery"]["interval_seconds"] = d.intervalSeconds;
    j["discovery"]["timeout_seconds"] = d.timeoutSeconds;
    j["discovery"]["max_concurrent_probes"] = d.maxConcurrentProbes;
    j["discovery"]["probe_timeout_ms"] = d.probeTimeoutMs;
    auto techniques = nlohmann::json::array();
    for (auto technique : d.techniques) {
        techniques.push_back(core::probeTechniqueToString(technique));
    }
    j["discovery"]["techniques"] = techniques;
    j["discovery"]["miss_threshold"] = d.missThreshold;
    j["discovery"]["unseen_retire_hours"] = d.unseenRetireHours;
    j["discovery"]["job_retention_count"] = d.jobRetentionCount;
    j["discovery"]["job_retention_hours"] = d.jobRetentionHours;
    j["discovery"]["worker_count"] = d.workerCount;
    j["discovery"]["arp_table_path"] = d.arpTablePath;

    // Alerts
    const auto& a = config_.alerts;
    j["alerts"]["clear_after"] = a.clearAfterEvaluations;
    j["alerts"]["cpu_warning_percent"] = a.cpuWarningPercent;
    j["alerts"]["cpu_critical_percent"] = a.cpuCriticalPercent;
    j["alerts"]["error_rate_warning_per_second"] = a.errorRateWarningPerSecond;
    j["alerts"]["error_rate_critical_per_second"] = a.errorRateCriticalPerSecond;
    j["alerts"]["error_rate_window"] = a.errorRateWindowSamples;
    j["alerts"]["utilization_warning_percent"] = a.utilizationWarningPercent;
    j["alerts"]["utilization_critical_percent"] = a.utilizationCriticalPercent;
    j["alerts"]["degraded_alerts"] = a.degradedAlertsEnabled;

    // REST API
    j["api"]["enabled"] = config_.api.enabled;
    j["api"]["bind_address"] = config_.api.bindAddress;
    j["api"]["port"] = config_.api.port;

    // Logging
    j["logging"]["level"] = config_.logging.level;
    j["logging"]["file"] = config_.logging.file;
    j["logging"]["max_size_mb"] = config_.logging.maxSizeMb;
    j["logging"]["max_files"] = config_.logging.maxFiles;

    // Database
    j["database"]["enabled"] = config_.database.enabled;
    j["database"]["path"] = config_.database.path;

    // Encrypted values
    if (!secureValues_.empty()) {
        j["secure"] = secureValues_;
    }

    return j;
}

void ConfigManager::fromJson(const nlohmann::json& j) {
    AppConfig defaults;

    if (j.contains("snmp")) {
        const auto& s = j["snmp"];
        config_.snmp.version = core::snmpVersionFromString(s.value("version", std::string("v2c")));
        config_.snmp.port = s.value("port", defaults.snmp.port);
        config_.snmp.timeoutMs = s.value("timeout_ms", defaults.snmp.timeoutMs);
        config_.snmp.retries = s.value("retries", defaults.snmp.retries);
        config_.snmp.v3Username = s.value("v3_username", std::string());
        config_.snmp.v3SecurityLevel =
            core::snmpSecurityLevelFromString(s.value("v3_security_level", std::string("noAuthNoPriv")));
        config_.snmp.v3ContextName = s.value("v3_context_name", std::string());
    }

    if (j.contains("discovery")) {
        const auto& d = j["discovery"];
        auto& out = config_.discovery;
        out.defaultRange = d.value("default_range", defaults.discovery.defaultRange);
        out.periodicRanges = d.value("periodic_ranges", std::vector<std::string>{});
        out.periodicEnabled = d.value("periodic_enabled", defaults.discovery.periodicEnabled);
        out.intervalSeconds = d.value("interval_seconds", defaults.discovery.intervalSeconds);
        out.timeoutSeconds = d.value("timeout_seconds", defaults.discovery.timeoutSeconds);
        out.maxConcurrentProbes = d.value("max_concurrent_probes", defaults.discovery.maxConcurrentProbes);
        out.probeTimeoutMs = d.value("probe_timeout_ms", defaults.discovery.probeTimeoutMs);
        if (d.contains("techniques") && d["techniques"].is_array()) {
            out.techniques.clear();
            for (const auto& item : d["techniques"]) {
                if (!item.is_string()) {
                    continue;
                }
                auto technique = core::probeTechniqueFromString(item.get<std::string>());
                if (!technique) {
                    spdlog::warn("Ignoring unknown probe technique '{}'", item.get<std::string>());
                } else if (std::find(out.techniques.begin(), out.techniques.end(), *technique) ==
                           out.techniques.end()) {
                    out.techniques.push_back(*technique);
                }
            }
        }
        out.missThreshold = d.value("miss_threshold", defaults.discovery.missThreshold);
        out.unseenRetireHours = d.value("unseen_retire_hours", defaults.discovery.unseenRetireHours);
        out.jobRetentionCount = d.value("job_retention_count", defaults.discovery.jobRetentionCount);
        out.jobRetentionHours = d.value("job_retention_hours", defaults.discovery.jobRetentionHours);
        out.workerCount = d.value("worker_count", defaults.discovery.workerCount);
        out.arpTablePath = d.value("arp_table_path", defaults.discovery.arpTablePath);
    }

    if (j.contains("alerts")) {
        const auto& a = j["alerts"];
        auto& out = config_.alerts;
        out.clearAfterEvaluations = a.value("clear_after", defaults.alerts.clearAfterEvaluations);
        out.cpuWarningPercent = a.value("cpu_warning_percent", defaults.alerts.cpuWarningPercent);
        out.cpuCriticalPercent = a.value("cpu_critical_percent", defaults.alerts.cpuCriticalPercent);
        out.errorRateWarningPerSecond =
            a.value("error_rate_warning_per_second", defaults.alerts.errorRateWarningPerSecond);
        out.errorRateCriticalPerSecond =
            a.value("error_rate_critical_per_second", defaults.alerts.errorRateCriticalPerSecond);
        out.errorRateWindowSamples = a.value("error_rate_window", defaults.alerts.errorRateWindowSamples);
        out.utilizationWarningPercent =
            a.value("utilization_warning_percent", defaults.alerts.utilizationWarningPercent);
        out.utilizationCriticalPercent =
            a.value("utilization_critical_percent", defaults.alerts.utilizationCriticalPercent);
        out.degradedAlertsEnabled = a.value("degraded_alerts", defaults.alerts.degradedAlertsEnabled);
    }

    if (j.contains("api")) {
        const auto& api = j["api"];
        config_.api.enabled = api.value("enabled", defaults.api.enabled);
        config_.api.bindAddress = api.value("bind_address", defaults.api.bindAddress);
        config_.api.port = api.value("port", defaults.api.port);
    }

    if (j.contains("logging")) {
        const auto& l = j["logging"];
        config_.logging.level = l.value("level", defaults.logging.level);
        config_.logging.file = l.value("file", defaults.logging.file);
        config_.logging.maxSizeMb = l.value("max_size_mb", defaults.logging.maxSizeMb);
        config_.logging.maxFiles = l.value("max_files", defaults.logging.maxFiles);
    }

    if (j.contains("database")) {
        const auto& db = j["database"];
        config_.database.enabled = db.value("enabled", defaults.database.enabled);
        config_.database.path = db.value("path", defaults.database.path);
    }

    if (j.contains("secure") && j["secure"].is_object()) {
        secureValues_ = j["secure"];
    }

    validate();
}

void ConfigManager::validate() {
    auto& d = config_.discovery;
    clamp(d.maxConcurrentProbes, 1, 1024, "discovery.max_concurrent_probes");
    clamp(d.missThreshold, 1, 100, "discovery.miss_threshold");
    clamp(d.intervalSeconds, 10, 86400, "discovery.interval_seconds");
    clamp(d.timeoutSeconds, 1, 86400, "discovery.timeout_seconds");
    clamp(d.probeTimeoutMs, 100, 60000, "discovery.probe_timeout_ms");
    clamp(d.jobRetentionCount, 1, 100000, "discovery.job_retention_count");
    clamp(d.jobRetentionHours, 1, 24 * 365, "discovery.job_retention_hours");
    clamp(d.unseenRetireHours, 0, 24 * 365, "discovery.unseen_retire_hours");
    clamp(d.workerCount, 1, 16, "discovery.worker_count");
    if (d.techniques.empty()) {
        spdlog::warn("No probe techniques configured, using snmp");
        d.techniques = {core::ProbeTechnique::Snmp};
    }
    if (!core::Ipv4Network::tryParse(d.defaultRange)) {
        spdlog::warn("Invalid discovery.default_range '{}', using 192.168.1.0/24", d.defaultRange);
        d.defaultRange = "192.168.1.0/24";
    }

    auto& a = config_.alerts;
    clamp(a.clearAfterEvaluations, 1, 1000, "alerts.clear_after");
    clamp(a.errorRateWindowSamples, 2, 1000, "alerts.error_rate_window");

    clamp(config_.snmp.timeoutMs, 100, 60000, "snmp.timeout_ms");
    clamp(config_.snmp.retries, 0, 10, "snmp.retries");
    clamp(config_.logging.maxSizeMb, 1, 1024, "logging.max_size_mb");
    clamp(config_.logging.maxFiles, 1, 100, "logging.max_files");
}

void ConfigManager::applyEnvironment() {
    if (auto community = environment("VLANVISION_SNMP_COMMUNITY")) {
        communityOverride_ = *community;
    }
    if (auto range = environment("VLANVISION_DEFAULT_RANGE")) {
        if (core::Ipv4Network::tryParse(*range)) {
            config_.discovery.defaultRange = *range;
        } else {
            spdlog::warn("Ignoring invalid VLANVISION_DEFAULT_RANGE '{}'", *range);
        }
    }
    if (auto port = environment("VLANVISION_API_PORT")) {
        try {
            int value = std::stoi(*port);
            if (value > 0 && value < 65536) {
                config_.api.port = static_cast<uint16_t>(value);
            }
        } catch (const std::exception&) {
            spdlog::warn("Ignoring invalid VLANVISION_API_PORT '{}'", *port);
        }
    }
}

bool ConfigManager::setSecureValue(const std::string& key, const std::string& value) {
    auto encrypted = secureStorage_->encrypt(value);
    if (!encrypted) {
        spdlog::error("Could not encrypt secure value '{}'", key);
        return false;
    }
    secureValues_[key] = *encrypted;
    return save();
}

std::optional<std::string> ConfigManager::getSecureValue(const std::string& key) const {
    if (!secureValues_.contains(key) || !secureValues_[key].is_string()) {
        return std::nullopt;
    }
    return secureStorage_->decrypt(secureValues_[key].get<std::string>());
}

std::string ConfigManager::snmpCommunity() const {
    if (communityOverride_) {
        return *communityOverride_;
    }
    return getSecureValue(SNMP_COMMUNITY_KEY).value_or(DEFAULT_COMMUNITY);
}

core::SnmpAgentConfig ConfigManager::snmpAgentConfig() const {
    core::SnmpAgentConfig agent;
    agent.version = config_.snmp.version;
    agent.port = config_.snmp.port;
    agent.timeoutMs = config_.snmp.timeoutMs;
    agent.retries = config_.snmp.retries;
    if (agent.version == core::SnmpVersion::V3) {
        core::SnmpV3Credentials credentials;
        credentials.username = config_.snmp.v3Username;
        credentials.securityLevel = config_.snmp.v3SecurityLevel;
        credentials.contextName = config_.snmp.v3ContextName;
        agent.credentials = credentials;
    } else {
        agent.credentials = core::SnmpCommunityCredentials{snmpCommunity()};
    }
    return agent;
}

std::filesystem::path ConfigManager::databasePath() const {
    if (config_.database.path.empty()) {
        return configDir_ / "vlanvision.db";
    }
    std::filesystem::path path(config_.database.path);
    return path.is_absolute() ? path : configDir_ / path;
}

std::filesystem::path ConfigManager::logFilePath() const {
    std::filesystem::path path(config_.logging.file);
    return path.is_absolute() ? path : configDir_ / path;
}

} // namespace vlanvision::infra
