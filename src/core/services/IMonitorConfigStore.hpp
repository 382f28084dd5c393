/**
 * @file IMonitorConfigStore.hpp
 * @brief Interface for the durable monitoring configuration.
 */

#pragma once

#include "core/types/MonitorConfig.hpp"

namespace hostwatch::core {

/**
 * @brief Durable storage of the monitored hosts, their statuses and settings.
 *
 * Both operations throw std::runtime_error when the underlying storage
 * cannot be read or written.
 */
class IMonitorConfigStore {
public:
    virtual ~IMonitorConfigStore() = default;

    /**
     * @brief Loads a fresh configuration snapshot.
     * @return Current hosts map and scalar settings. An empty hosts map means
     *         nothing is configured.
     */
    virtual MonitorConfig load() = 0;

    /**
     * @brief Persists the status of every host in the map.
     * @param hosts Host to status map produced by a check cycle.
     */
    virtual void saveHostsMap(const HostsMap& hosts) = 0;
};

} // namespace hostwatch::core
