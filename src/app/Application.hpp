#pragma once

#include "app/CheckScheduler.hpp"
#include "core/monitor/HostMonitor.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/config/MonitorConfigStore.hpp"
#include "infrastructure/database/Database.hpp"
#include "infrastructure/database/HostStatusRepository.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/network/ConnectivityService.hpp"
#include "infrastructure/network/HttpProber.hpp"
#include "infrastructure/notifications/StatusBroadcaster.hpp"
#include "infrastructure/notifications/WebhookNotifier.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <string>

namespace hostwatch::app {

/**
 * @brief Owns every component and implements the command-line commands.
 *
 * Each command returns the process exit status: 0 on success, 1 on failure.
 */
class Application {
public:
    /**
     * @brief Sets up logging, loads the configuration and opens the database.
     * @param dataDir Directory holding config.json, the database and the logs.
     * @param verbose Log debug messages to the console.
     * @throws std::runtime_error if the configuration or database cannot be opened.
     */
    Application(const std::filesystem::path& dataDir, bool verbose);
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    /**
     * @brief Runs check cycles until SIGINT or SIGTERM.
     *
     * SIGUSR1 triggers an immediate cycle.
     */
    int run();

    /**
     * @brief Runs one check cycle and prints every status change as a JSON line.
     * @param connectionType Connection type to use instead of querying the system.
     */
    int check(std::optional<core::ConnectionType> connectionType);

    int addHost(const core::Host& host);
    int removeHost(const core::Host& host);
    int listHosts();
    int resetHosts();
    int setOption(const std::string& key, const std::string& value);
    int showStatus();

    // Accessors
    infra::ConfigManager& config() { return *config_; }
    infra::Database& database() { return *database_; }
    infra::StatusBroadcaster& broadcaster() { return *broadcaster_; }

private:
    void initializeLogging();
    void initializeComponents();

    std::filesystem::path dataDir_;
    bool verbose_;
    std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> consoleSink_;

    std::shared_ptr<infra::ConfigManager> config_;
    std::shared_ptr<infra::Database> database_;
    std::shared_ptr<infra::HostStatusRepository> hosts_;
    std::unique_ptr<infra::AsioContext> asioContext_;
    std::shared_ptr<infra::HttpProber> prober_;
    std::shared_ptr<infra::ConnectivityService> connectivity_;
    std::shared_ptr<infra::MonitorConfigStore> store_;
    std::shared_ptr<infra::StatusBroadcaster> broadcaster_;
    std::unique_ptr<infra::WebhookNotifier> webhookNotifier_;
    std::unique_ptr<core::HostMonitor> monitor_;
    std::unique_ptr<CheckScheduler> scheduler_;
};

} // namespace hostwatch::app
