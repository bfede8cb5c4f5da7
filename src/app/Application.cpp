#include "app/Application.hpp"

#include "infrastructure/api/ApiJson.hpp"
#include "infrastructure/network/ArpProbe.hpp"
#include "infrastructure/network/IcmpProbe.hpp"
#include "infrastructure/network/NeighborProbe.hpp"
#include "infrastructure/network/SnmpClient.hpp"
#include "infrastructure/network/SnmpProbe.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <csignal>
#include <cstdlib>
#include <future>
#include <iostream>
#include <stdexcept>

namespace vlanvision::app {

Application::Application(CommandLine commandLine) : commandLine_(std::move(commandLine)) {
    if (commandLine_.configDir.empty()) {
        commandLine_.configDir = defaultConfigDir();
    }

    config_ = std::make_unique<infra::ConfigManager>(commandLine_.configDir);
    if (!config_->load()) {
        spdlog::warn("Continuing with default configuration");
    }

    initializeLogging();
    initializeComponents();
}

Application::~Application() {
    spdlog::info("Application shutting down...");

    if (restApiServer_) {
        restApiServer_->stop();
    }
    if (scheduler_) {
        scheduler_->stop();
    }
    if (controlContext_) {
        controlContext_->stop();
    }
    if (probeContext_) {
        probeContext_->stop();
    }

    spdlog::info("Shutdown complete");
    spdlog::default_logger()->flush();
}

std::filesystem::path Application::defaultConfigDir() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "vlanvision";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".config" / "vlanvision";
    }
    return std::filesystem::current_path() / "vlanvision";
}

CommandLine Application::parseCommandLine(int argc, char** argv) {
    CommandLine result;

    auto value = [&](int& i, const std::string& option) -> std::string {
        if (i + 1 >= argc) {
            throw std::invalid_argument("Option " + option + " requires a value");
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            result.showHelp = true;
        } else if (arg == "-c" || arg == "--config-dir") {
            result.configDir = value(i, arg);
        } else if (arg == "-d" || arg == "--discover") {
            result.discoverRange = value(i, arg);
        } else if (arg == "--log-level") {
            result.logLevel = value(i, arg);
        } else {
            throw std::invalid_argument("Unknown option: " + arg);
        }
    }
    return result;
}

std::string Application::usage(const std::string& program) {
    return "Usage: " + program +
           " [options]\n"
           "\n"
           "Network discovery and VLAN topology daemon.\n"
           "\n"
           "Options:\n"
           "  -c, --config-dir DIR   Configuration and data directory\n"
           "  -d, --discover CIDR    Discover one range, print the job as JSON and exit\n"
           "      --log-level LEVEL  trace, debug, info, warn, error or critical\n"
           "  -h, --help             Show this help\n";
}

void Application::initializeLogging() {
    const auto& settings = config_->config().logging;
    auto logPath = config_->logFilePath();
    std::filesystem::create_directories(logPath.parent_path());

    auto level = spdlog::level::from_str(commandLine_.logLevel.value_or(settings.level));

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(level);

    auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        logPath.string(), static_cast<size_t>(settings.maxSizeMb) * 1024 * 1024,
        static_cast<size_t>(settings.maxFiles));
    fileSink->set_level(spdlog::level::debug);

    auto logger = std::make_shared<spdlog::logger>("vlanvision", spdlog::sinks_init_list{consoleSink, fileSink});
    logger->set_level(std::min(level, spdlog::level::debug));
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    spdlog::info("vlanvision {} starting...", VERSION);
    spdlog::info("Config directory: {}", config_->configDir().string());
    spdlog::info("Log file: {}", logPath.string());
}

void Application::initializeComponents() {
    const auto& cfg = config_->config();

    // Persistence
    if (cfg.database.enabled) {
        database_ = std::make_shared<infra::Database>(config_->databasePath().string());
        database_->runMigrations();
        deviceRepo_ = std::make_shared<infra::DeviceRepository>(database_);
        jobRepo_ = std::make_shared<infra::JobRepository>(database_);
        alertRepo_ = std::make_shared<infra::AlertRepository>(database_);
    }

    // One probe thread per concurrent probe, so a blocking probe never waits for a thread
    auto probeThreads = static_cast<size_t>(cfg.discovery.maxConcurrentProbes);
    probeContext_ = std::make_unique<infra::AsioContext>("probes", probeThreads);
    probeContext_->start();
    controlContext_ = std::make_unique<infra::AsioContext>("control", 2);
    controlContext_->start();

    infra::ProberPool::Options poolOptions;
    poolOptions.maxConcurrentProbes = probeThreads;
    poolOptions.probeTimeout = std::chrono::milliseconds(cfg.discovery.probeTimeoutMs);
    proberPool_ = std::make_unique<infra::ProberPool>(*probeContext_, poolOptions);
    registerProbes();

    // Engine
    registry_ = std::make_unique<engine::DeviceRegistry>(cfg.discovery.missThreshold);
    topology_ = std::make_unique<engine::TopologyBuilder>();
    alerts_ = std::make_unique<engine::AlertEvaluator>(cfg.alerts);

    engine::DiscoveryScheduler::Options schedulerOptions;
    schedulerOptions.periodicRanges = cfg.discovery.periodicRanges;
    if (schedulerOptions.periodicRanges.empty()) {
        schedulerOptions.periodicRanges.push_back(cfg.discovery.defaultRange);
    }
    schedulerOptions.periodicEnabled = cfg.discovery.periodicEnabled && !commandLine_.discoverRange;
    schedulerOptions.interval = std::chrono::seconds(cfg.discovery.intervalSeconds);
    schedulerOptions.jobTimeout = std::chrono::seconds(cfg.discovery.timeoutSeconds);
    schedulerOptions.techniques = cfg.discovery.techniques;
    schedulerOptions.workerCount = static_cast<size_t>(cfg.discovery.workerCount);
    schedulerOptions.jobRetentionCount = static_cast<size_t>(cfg.discovery.jobRetentionCount);
    schedulerOptions.jobRetentionAge = std::chrono::hours(cfg.discovery.jobRetentionHours);
    schedulerOptions.unseenRetireAfter = std::chrono::hours(cfg.discovery.unseenRetireHours);

    scheduler_ = std::make_unique<engine::DiscoveryScheduler>(
        *controlContext_, *proberPool_, *registry_, *topology_, *alerts_, schedulerOptions,
        engine::DiscoveryStores{deviceRepo_, jobRepo_, alertRepo_});

    restoreState();

    // REST API server, not needed for a one-shot run
    if (cfg.api.enabled && !commandLine_.discoverRange) {
        restApiServer_ = std::make_shared<infra::RestApiServer>(
            *controlContext_, infra::ApiBackends{*registry_, *topology_, *alerts_, *scheduler_},
            cfg.api.bindAddress, cfg.api.port);
        restApiServer_->start();
    }

    spdlog::info("Application components initialized");
}

void Application::registerProbes() {
    const auto& cfg = config_->config();
    auto snmpClient = std::make_shared<infra::SnmpClient>(config_->snmpAgentConfig());

    proberPool_->registerProbe(std::make_shared<infra::SnmpProbe>(snmpClient));
    proberPool_->registerProbe(std::make_shared<infra::NeighborProbe>(snmpClient));
    proberPool_->registerProbe(std::make_shared<infra::ArpProbe>(cfg.discovery.arpTablePath));
    proberPool_->registerProbe(std::make_shared<infra::IcmpProbe>());

    spdlog::info("Registered {} probe techniques", proberPool_->techniques().size());
}

void Application::restoreState() {
    if (!database_) {
        return;
    }

    registry_->restore(deviceRepo_->findAll());
    alerts_->restore(alertRepo_->findOpen(), alertRepo_->maxId());
    scheduler_->restoreJobs(jobRepo_->findRecent(config_->config().discovery.jobRetentionCount));
    topology_->update(registry_->snapshot());
}

int Application::run() {
    if (commandLine_.discoverRange) {
        return runOnce(*commandLine_.discoverRange);
    }

    scheduler_->start();
    waitForShutdownSignal();
    return 0;
}

int Application::runOnce(const std::string& range) {
    scheduler_->start();

    core::SubmitResult submitted;
    try {
        submitted = scheduler_->submit(range);
    } catch (const std::invalid_argument& e) {
        spdlog::error("Cannot discover {}: {}", range, e.what());
        return 2;
    }

    auto timeout = std::chrono::seconds(config_->config().discovery.timeoutSeconds) + std::chrono::seconds(30);
    auto job = scheduler_->wait(submitted.jobId, std::chrono::duration_cast<std::chrono::milliseconds>(timeout));
    if (!job) {
        spdlog::error("Discovery job {} did not finish in time", submitted.jobId);
        return 1;
    }

    nlohmann::json output = infra::api::jobToJson(*job, true);
    output["devices"] = nlohmann::json::array();
    for (const auto& device : registry_->snapshot()) {
        output["devices"].push_back(infra::api::deviceSummaryToJson(device));
    }
    std::cout << output.dump(2) << std::endl;

    return job->state == core::JobState::Completed ? 0 : 1;
}

void Application::waitForShutdownSignal() {
    std::promise<int> signalled;
    auto done = signalled.get_future();

    asio::signal_set signals(controlContext_->getContext(), SIGINT, SIGTERM);
    signals.async_wait([&signalled](const asio::error_code& ec, int signalNumber) {
        if (!ec) {
            signalled.set_value(signalNumber);
        }
    });

    spdlog::info("vlanvision running, press Ctrl+C to stop");
    auto signalNumber = done.get();
    spdlog::info("Received signal {}, stopping", signalNumber);
}

} // namespace vlanvision::app
