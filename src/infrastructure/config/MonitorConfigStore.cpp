#include "infrastructure/config/MonitorConfigStore.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace hostwatch::infra {

MonitorConfigStore::MonitorConfigStore(std::shared_ptr<ConfigManager> config,
                                       std::shared_ptr<HostStatusRepository> hosts)
    : config_(std::move(config)), hosts_(std::move(hosts)) {}

core::MonitorConfig MonitorConfigStore::load() {
    if (!config_->load()) {
        throw std::runtime_error("Failed to load configuration from " +
                                 config_->configPath().string());
    }

    const auto& settings = config_->config();
    if (listener_) {
        listener_(settings);
    }

    core::MonitorConfig config;
    config.hosts = hosts_->findAll();
    config.socketTimeout = std::chrono::milliseconds(settings.socketTimeoutMs);
    config.maxAttempts = settings.maxAttempts;
    config.notificationChannel = settings.notificationChannel;

    spdlog::debug("Loaded {} hosts (timeout {} ms, {} attempts)", config.hosts.size(),
                  settings.socketTimeoutMs, settings.maxAttempts);
    return config;
}

void MonitorConfigStore::saveHostsMap(const core::HostsMap& hosts) {
    hosts_->updateStatuses(hosts);
}

} // namespace hostwatch::infra
