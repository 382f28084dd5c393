#include "app/Application.hpp"

#include "app/CycleLock.hpp"
#include "infrastructure/notifications/StatusChangePayload.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <csignal>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace hostwatch::app {

namespace {

constexpr const char* VERSION = "1.0.0";

std::vector<std::pair<core::Host, core::Status>> sortedHosts(const core::HostsMap& hosts) {
    std::vector<std::pair<core::Host, core::Status>> sorted(hosts.begin(), hosts.end());
    std::sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) {
        if (a.first.address != b.first.address) {
            return a.first.address < b.first.address;
        }
        return a.first.port < b.first.port;
    });
    return sorted;
}

} // namespace

Application::Application(const std::filesystem::path& dataDir, bool verbose)
    : dataDir_(dataDir), verbose_(verbose) {
    initializeLogging();
    initializeComponents();
}

Application::~Application() {
    spdlog::debug("Application shutting down...");

    if (scheduler_) {
        scheduler_->stop();
    }

    if (webhookNotifier_) {
        webhookNotifier_->detach();
    }

    if (asioContext_) {
        asioContext_->stop();
    }
}

void Application::initializeLogging() {
    std::filesystem::create_directories(dataDir_);

    auto logPath = dataDir_ / "hostwatch.log";

    consoleSink_ = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    consoleSink_->set_level(verbose_ ? spdlog::level::debug : spdlog::level::info);

    auto fileSink =
        std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logPath.string(), 5 * 1024 * 1024, 3);
    fileSink->set_level(spdlog::level::debug);

    auto logger = std::make_shared<spdlog::logger>(
        "hostwatch", spdlog::sinks_init_list{consoleSink_, fileSink});
    logger->set_level(spdlog::level::debug);
    spdlog::set_default_logger(logger);

    spdlog::debug("HostWatch {} starting...", VERSION);
    spdlog::debug("Log file: {}", logPath.string());
}

void Application::initializeComponents() {
    // Configuration
    config_ = std::make_shared<infra::ConfigManager>(dataDir_);
    if (!config_->load()) {
        throw std::runtime_error("Failed to load configuration from " +
                                 config_->configPath().string());
    }

    if (!verbose_) {
        consoleSink_->set_level(spdlog::level::from_str(config_->config().logLevel));
    }

    // Database
    database_ = std::make_shared<infra::Database>(config_->databasePath().string());
    database_->runMigrations();
    hosts_ = std::make_shared<infra::HostStatusRepository>(database_);

    // Asio context; one thread keeps cycles sequential
    asioContext_ = std::make_unique<infra::AsioContext>(1);

    // Monitoring
    prober_ = std::make_shared<infra::HttpProber>();
    connectivity_ = std::make_shared<infra::ConnectivityService>();
    store_ = std::make_shared<infra::MonitorConfigStore>(config_, hosts_);
    broadcaster_ = std::make_shared<infra::StatusBroadcaster>();
    monitor_ = std::make_unique<core::HostMonitor>(store_, prober_, connectivity_, broadcaster_);

    // Webhook notifications follow the configuration loaded by each cycle
    webhookNotifier_ = std::make_unique<infra::WebhookNotifier>(
        broadcaster_, std::vector<std::string>{},
        std::chrono::milliseconds(config_->config().webhookTimeoutMs));
    store_->setLoadListener(
        [this](const infra::AppConfig& settings) { webhookNotifier_->configure(settings); });

    spdlog::debug("Application components initialized");
}

int Application::run() {
    const auto& settings = config_->config();

    scheduler_ = std::make_unique<CheckScheduler>(
        *asioContext_,
        [this](std::optional<core::ConnectionType> connectionType) {
            auto report = connectionType ? monitor_->runCycle(*connectionType)
                                         : monitor_->runCycle();
            if (!report.skipped()) {
                spdlog::info("Checked {} hosts via {}: {} changed", report.hostsChecked,
                             core::connectionTypeToString(report.connectionType),
                             report.changes.size());
            }
        },
        std::chrono::seconds(settings.checkIntervalSeconds), config_->lockPath(),
        std::chrono::milliseconds(settings.lockWaitMs));

    asioContext_->start();
    scheduler_->start();

    // Signals are handled on the main thread while cycles run on the worker.
    asio::io_context signalContext;
    asio::signal_set signals(signalContext, SIGINT, SIGTERM, SIGUSR1);

    std::function<void(const asio::error_code&, int)> onSignal;
    onSignal = [&](const asio::error_code& ec, int signal) {
        if (ec) {
            return;
        }

        if (signal == SIGUSR1) {
            spdlog::info("Received SIGUSR1, checking hosts now");
            scheduler_->startCheck();
            signals.async_wait(onSignal);
            return;
        }

        spdlog::info("Received signal {}, shutting down...", signal);
        signalContext.stop();
    };
    signals.async_wait(onSignal);

    spdlog::info("HostWatch {} monitoring hosts (data directory: {})", VERSION,
                 dataDir_.string());
    signalContext.run();

    scheduler_->stop();
    asioContext_->stop();
    return 0;
}

int Application::check(std::optional<core::ConnectionType> connectionType) {
    const auto& settings = config_->config();

    CycleLock lock(config_->lockPath(), std::chrono::milliseconds(settings.lockWaitMs));
    if (!lock.acquired()) {
        spdlog::error("Another check cycle is running");
        return 1;
    }

    auto subscription = broadcaster_->subscribe(
        settings.notificationChannel,
        [](const std::string& channel, const core::HostStatusChange& change) {
            std::cout << infra::toJson(channel, change).dump() << std::endl;
        });

    int status = 0;
    try {
        auto report = connectionType ? monitor_->runCycle(*connectionType) : monitor_->runCycle();
        if (report.skipped()) {
            spdlog::info("No hosts configured");
        } else {
            spdlog::info("Checked {} hosts via {}: {} changed", report.hostsChecked,
                         core::connectionTypeToString(report.connectionType),
                         report.changes.size());
        }
    } catch (const std::exception& e) {
        spdlog::error("Check cycle aborted: {}", e.what());
        status = 1;
    }

    broadcaster_->unsubscribe(subscription);
    return status;
}

int Application::addHost(const core::Host& host) {
    if (!host.isValid()) {
        spdlog::error("Invalid host {}: port must be between 1 and 65535", host.toString());
        return 1;
    }

    if (!hosts_->insert(host)) {
        spdlog::warn("Host {} is already monitored", host.toString());
        return 0;
    }

    spdlog::info("Monitoring {} ({})", host.toString(), host.canonicalUrl());
    return 0;
}

int Application::removeHost(const core::Host& host) {
    if (!hosts_->remove(host)) {
        spdlog::error("Host {} is not monitored", host.toString());
        return 1;
    }

    spdlog::info("Stopped monitoring {}", host.toString());
    return 0;
}

int Application::listHosts() {
    auto hosts = hosts_->findAll();
    if (hosts.empty()) {
        spdlog::info("No hosts configured");
        return 0;
    }

    for (const auto& [host, status] : sortedHosts(hosts)) {
        std::cout << host.toString() << '\t' << status.toString() << '\n';
    }
    std::cout.flush();
    return 0;
}

int Application::resetHosts() {
    int count = hosts_->count();
    hosts_->clear();
    spdlog::info("Removed {} hosts", count);
    return 0;
}

int Application::setOption(const std::string& key, const std::string& value) {
    if (!config_->set(key, value)) {
        return 1;
    }

    spdlog::info("{} set to {}", key, value);
    return 0;
}

int Application::showStatus() {
    auto iface = connectivity_->defaultRouteInterface();
    auto type = connectivity_->activeConnectionType();

    std::cout << core::connectionTypeToString(type);
    if (iface) {
        std::cout << " (" << *iface << ")";
    }
    std::cout << std::endl;

    spdlog::debug("{} hosts configured", hosts_->count());
    return 0;
}

} // namespace hostwatch::app
