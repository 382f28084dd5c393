#pragma once

#include "core/services/IMonitorConfigStore.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/database/HostStatusRepository.hpp"

#include <functional>
#include <memory>

namespace hostwatch::infra {

/**
 * @brief Monitoring configuration backed by config.json and the hosts table.
 *
 * Every load() rereads the configuration file, so a setting changed by
 * another process is picked up at the next check cycle.
 */
class MonitorConfigStore : public core::IMonitorConfigStore {
public:
    /// Called with the full configuration after every successful load.
    using LoadListener = std::function<void(const AppConfig&)>;

    MonitorConfigStore(std::shared_ptr<ConfigManager> config,
                       std::shared_ptr<HostStatusRepository> hosts);

    core::MonitorConfig load() override;
    void saveHostsMap(const core::HostsMap& hosts) override;

    void setLoadListener(LoadListener listener) { listener_ = std::move(listener); }

private:
    std::shared_ptr<ConfigManager> config_;
    LoadListener listener_;
    std::shared_ptr<HostStatusRepository> hosts_;
};

} // namespace hostwatch::infra
