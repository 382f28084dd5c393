/**
 * @file HostMonitor.hpp
 * @brief Check cycle orchestration.
 *
 * This file defines the HostMonitor which runs one check cycle over every
 * configured host, detects status transitions and publishes them.
 */

#pragma once

#include "core/services/IConnectivityService.hpp"
#include "core/services/IMonitorConfigStore.hpp"
#include "core/services/IReachabilityProber.hpp"
#include "core/services/IStatusChangeSink.hpp"
#include "core/types/HostStatusChange.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

namespace hostwatch::core {

/**
 * @brief Outcome of one check cycle.
 */
struct CycleReport {
    ConnectionType connectionType{ConnectionType::None}; ///< Attachment used for the cycle
    std::size_t hostsChecked{0};                         ///< Hosts whose status was resolved
    std::vector<HostStatusChange> changes;               ///< Events published, in order
    bool persisted{false};                               ///< Whether the hosts map was saved

    /**
     * @brief Tells whether the cycle ended early because no host is configured.
     */
    [[nodiscard]] bool skipped() const { return hostsChecked == 0; }
};

/**
 * @brief Runs check cycles over the configured hosts.
 *
 * Each cycle loads a fresh configuration, resolves the connection type,
 * probes every host (or marks every host unreachable when there is no
 * connection), publishes an event for each host whose status changed and
 * saves the whole hosts map once at the end.
 *
 * The monitor keeps no state between cycles. Callers must not run two
 * cycles concurrently.
 */
class HostMonitor {
public:
    /**
     * @brief Constructs a HostMonitor over its collaborators.
     * @param store Configuration store the hosts map is loaded from and saved to.
     * @param prober Prober used when a connection is active.
     * @param connectivity Connectivity query used when no type is supplied.
     * @param sink Receiver of status change events.
     */
    HostMonitor(std::shared_ptr<IMonitorConfigStore> store,
                std::shared_ptr<IReachabilityProber> prober,
                std::shared_ptr<IConnectivityService> connectivity,
                std::shared_ptr<IStatusChangeSink> sink);

    /**
     * @brief Runs a cycle using the live connection type.
     * @return Report of the cycle.
     * @throws std::runtime_error if the configuration cannot be loaded or saved.
     */
    CycleReport runCycle();

    /**
     * @brief Runs a cycle with a connection type already known to the caller.
     * @param connectionType Attachment to use instead of querying the platform.
     * @return Report of the cycle.
     * @throws std::runtime_error if the configuration cannot be loaded or saved.
     */
    CycleReport runCycle(ConnectionType connectionType);

private:
    CycleReport run(std::optional<ConnectionType> suppliedType);
    ConnectionType queryConnectionType();
    bool isReachable(const Host& host, const MonitorConfig& config);
    void notifyStatus(const std::string& channel, const HostStatusChange& change);

    std::shared_ptr<IMonitorConfigStore> store_;
    std::shared_ptr<IReachabilityProber> prober_;
    std::shared_ptr<IConnectivityService> connectivity_;
    std::shared_ptr<IStatusChangeSink> sink_;
};

} // namespace hostwatch::core
