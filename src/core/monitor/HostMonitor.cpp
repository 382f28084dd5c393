#include "core/monitor/HostMonitor.hpp"

#include <spdlog/spdlog.h>

namespace hostwatch::core {

HostMonitor::HostMonitor(std::shared_ptr<IMonitorConfigStore> store,
                         std::shared_ptr<IReachabilityProber> prober,
                         std::shared_ptr<IConnectivityService> connectivity,
                         std::shared_ptr<IStatusChangeSink> sink)
    : store_(std::move(store)), prober_(std::move(prober)), connectivity_(std::move(connectivity)),
      sink_(std::move(sink)) {}

CycleReport HostMonitor::runCycle() {
    return run(std::nullopt);
}

CycleReport HostMonitor::runCycle(ConnectionType connectionType) {
    return run(connectionType);
}

CycleReport HostMonitor::run(std::optional<ConnectionType> suppliedType) {
    CycleReport report;
    MonitorConfig config = store_->load();

    if (config.hosts.empty()) {
        spdlog::debug("No hosts to check at this moment");
        return report;
    }

    report.connectionType = suppliedType ? *suppliedType : queryConnectionType();
    const ConnectionType connectionType = report.connectionType;

    if (connectionType == ConnectionType::None) {
        spdlog::debug("No active connection. Marking all {} hosts as unreachable",
                      config.hosts.size());
    } else {
        spdlog::debug("Starting reachability check of {} hosts via {}", config.hosts.size(),
                      connectionTypeToString(connectionType));
    }

    for (auto& [host, storedStatus] : config.hosts) {
        // Never touch the network without an active connection.
        Status newStatus{false, ConnectionType::None};
        if (connectionType != ConnectionType::None) {
            newStatus = Status{isReachable(host, config), connectionType};
        }
        ++report.hostsChecked;

        if (newStatus == storedStatus) {
            continue;
        }

        spdlog::debug("Host {} is currently {} on port {} via {}", host.address,
                      newStatus.reachable ? "reachable" : "unreachable", host.port,
                      connectionTypeToString(connectionType));

        auto change = HostStatusChange::between(host, storedStatus, newStatus);
        storedStatus = newStatus;
        report.changes.push_back(change);
        notifyStatus(config.notificationChannel, change);
    }

    store_->saveHostsMap(config.hosts);
    report.persisted = true;

    spdlog::debug("Reachability check finished: {} hosts, {} changes", report.hostsChecked,
                  report.changes.size());
    return report;
}

ConnectionType HostMonitor::queryConnectionType() {
    try {
        return connectivity_->activeConnectionType();
    } catch (const std::exception& e) {
        spdlog::error("Connectivity query failed: {}. Assuming no connection", e.what());
        return ConnectionType::None;
    }
}

bool HostMonitor::isReachable(const Host& host, const MonitorConfig& config) {
    try {
        return prober_->probeWithRetry(host, config.socketTimeout, config.maxAttempts);
    } catch (const std::exception& e) {
        spdlog::debug("Probe of {} failed: {}", host.toString(), e.what());
        return false;
    }
}

void HostMonitor::notifyStatus(const std::string& channel, const HostStatusChange& change) {
    spdlog::debug("Broadcast on channel {}: {}", channel, change.toString());
    try {
        sink_->publish(channel, change);
    } catch (const std::exception& e) {
        spdlog::error("Failed to publish status change of {}:{}: {}", change.host, change.port,
                      e.what());
    }
}

} // namespace hostwatch::core
