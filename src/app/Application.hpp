#pragma once

#include "engine/AlertEvaluator.hpp"
#include "engine/DeviceRegistry.hpp"
#include "engine/DiscoveryScheduler.hpp"
#include "engine/TopologyBuilder.hpp"
#include "infrastructure/api/RestApiServer.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/database/AlertRepository.hpp"
#include "infrastructure/database/Database.hpp"
#include "infrastructure/database/DeviceRepository.hpp"
#include "infrastructure/database/JobRepository.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/network/ProberPool.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace vlanvision::app {

/**
 * @brief Parsed command line of the daemon.
 */
struct CommandLine {
    std::filesystem::path configDir;          ///< --config-dir, defaults to $XDG_CONFIG_HOME/vlanvision
    std::optional<std::string> discoverRange; ///< --discover CIDR: run one job, print it and exit
    std::optional<std::string> logLevel;      ///< --log-level overrides logging.level
    bool showHelp{false};
};

/**
 * @brief Wires configuration, persistence, probes and the engine together.
 *
 * Probes run on a dedicated context with one thread per concurrent probe;
 * timers, the REST API and signal handling share a small control context.
 */
class Application {
public:
    static constexpr const char* VERSION = "1.0.0";

    explicit Application(CommandLine commandLine);
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    /**
     * @brief Runs until SIGINT/SIGTERM, or until the one-shot discovery finished.
     * @return Process exit code.
     */
    int run();

    /**
     * @brief Parses argv.
     * @throws std::invalid_argument for unknown options or missing values.
     */
    static CommandLine parseCommandLine(int argc, char** argv);

    static std::string usage(const std::string& program);

    static std::filesystem::path defaultConfigDir();

    infra::ConfigManager& config() { return *config_; }
    engine::DeviceRegistry& registry() { return *registry_; }
    engine::DiscoveryScheduler& scheduler() { return *scheduler_; }

private:
    void initializeLogging();
    void initializeComponents();
    void registerProbes();
    void restoreState();
    int runOnce(const std::string& range);
    void waitForShutdownSignal();

    CommandLine commandLine_;
    std::unique_ptr<infra::ConfigManager> config_;

    std::shared_ptr<infra::Database> database_;
    std::shared_ptr<infra::DeviceRepository> deviceRepo_;
    std::shared_ptr<infra::JobRepository> jobRepo_;
    std::shared_ptr<infra::AlertRepository> alertRepo_;

    std::unique_ptr<infra::AsioContext> probeContext_;
    std::unique_ptr<infra::AsioContext> controlContext_;
    std::unique_ptr<infra::ProberPool> proberPool_;

    std::unique_ptr<engine::DeviceRegistry> registry_;
    std::unique_ptr<engine::TopologyBuilder> topology_;
    std::unique_ptr<engine::AlertEvaluator> alerts_;
    std::unique_ptr<engine::DiscoveryScheduler> scheduler_;
    std::shared_ptr<infra::RestApiServer> restApiServer_;
};

} // namespace vlanvision::app
