#pragma once

#include "core/types/Alert.hpp"
#include "core/types/ProbeResult.hpp"
#include "core/types/SnmpTypes.hpp"
#include "infrastructure/crypto/SecureStorage.hpp"

#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace vlanvision::infra {

struct SnmpSettings {
    core::SnmpVersion version{core::SnmpVersion::V2c};
    uint16_t port{161};
    int timeoutMs{2000};
    int retries{1};
    std::string v3Username;                                                 ///< Used with version 3
    core::SnmpSecurityLevel v3SecurityLevel{core::SnmpSecurityLevel::NoAuthNoPriv};
    std::string v3ContextName;
};

struct DiscoverySettings {
    std::string defaultRange{"192.168.1.0/24"};
    std::vector<std::string> periodicRanges; ///< Empty: periodic discovery uses defaultRange
    bool periodicEnabled{true};
    int intervalSeconds{300};
    int timeoutSeconds{120};       ///< Job deadline
    int maxConcurrentProbes{50};
    int probeTimeoutMs{3000};      ///< Per-unit timeout
    std::vector<core::ProbeTechnique> techniques{core::ProbeTechnique::Snmp, core::ProbeTechnique::Arp,
                                                 core::ProbeTechnique::Neighbor};
    int missThreshold{3};
    int unseenRetireHours{0};      ///< 0 disables the long-unseen sweep
    int jobRetentionCount{100};
    int jobRetentionHours{168};
    int workerCount{2};            ///< Jobs run concurrently
    std::string arpTablePath{"/proc/net/arp"};
};

struct ApiSettings {
    bool enabled{true};
    std::string bindAddress{"127.0.0.1"};
    uint16_t port{8080};
};

struct LoggingSettings {
    std::string level{"info"};
    std::string file{"vlanvision.log"}; ///< Relative paths resolve against the config directory
    int maxSizeMb{10};
    int maxFiles{3};
};

struct DatabaseSettings {
    bool enabled{true};
    std::string path; ///< Empty: vlanvision.db in the config directory
};

/**
 * @brief Daemon configuration, one member per section of config.json.
 */
struct AppConfig {
    SnmpSettings snmp;
    DiscoverySettings discovery;
    core::AlertThresholds alerts;
    ApiSettings api;
    LoggingSettings logging;
    DatabaseSettings database;
};

/**
 * @brief Loads and saves config.json and the encrypted secrets stored in it.
 *
 * Missing keys keep their defaults; out-of-range values are clamped with a
 * warning. A few environment variables override the file after loading:
 * VLANVISION_SNMP_COMMUNITY, VLANVISION_DEFAULT_RANGE and VLANVISION_API_PORT.
 */
class ConfigManager {
public:
    static constexpr const char* SNMP_COMMUNITY_KEY = "snmp_community";
    static constexpr const char* DEFAULT_COMMUNITY = "public";

    /**
     * @brief Constructs a ConfigManager for the specified config directory.
     *
     * The directory is created if it does not exist.
     */
    explicit ConfigManager(const std::filesystem::path& configDir);

    /**
     * @brief Loads configuration from disk, writing defaults if the file is missing.
     * @return True if loaded successfully, false otherwise.
     */
    bool load();

    /**
     * @brief Saves configuration to disk.
     * @return True if saved successfully, false otherwise.
     */
    bool save();

    AppConfig& config() { return config_; }
    const AppConfig& config() const { return config_; }

    /**
     * @brief Encrypts and stores a secret under the "secure" section, then saves.
     * @return False if encryption or saving failed.
     */
    bool setSecureValue(const std::string& key, const std::string& value);

    /**
     * @brief Decrypts a secret stored with setSecureValue().
     */
    std::optional<std::string> getSecureValue(const std::string& key) const;

    /// Community from the environment override, secure storage, or "public".
    [[nodiscard]] std::string snmpCommunity() const;

    /// SNMP agent settings with credentials resolved.
    [[nodiscard]] core::SnmpAgentConfig snmpAgentConfig() const;

    [[nodiscard]] std::filesystem::path configPath() const { return configPath_; }
    [[nodiscard]] std::filesystem::path databasePath() const;
    [[nodiscard]] std::filesystem::path logFilePath() const;
    [[nodiscard]] const std::filesystem::path& configDir() const { return configDir_; }

    nlohmann::json toJson() const;
    void fromJson(const nlohmann::json& j);

private:
    void applyEnvironment();
    void validate();

    std::filesystem::path configDir_;
    std::filesystem::path configPath_;
    AppConfig config_;
    std::unique_ptr<SecureStorage> secureStorage_;
    nlohmann::json secureValues_ = nlohmann::json::object();
    std::optional<std::string> communityOverride_;
};

} // namespace vlanvision::infra
