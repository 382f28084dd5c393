/**
 * @file MonitorConfig.hpp
 * @brief Snapshot of the monitoring configuration used by one check cycle.
 */

#pragma once

#include "core/types/Host.hpp"
#include "core/types/Status.hpp"

#include <chrono>
#include <string>
#include <unordered_map>

namespace hostwatch::core {

inline constexpr int DEFAULT_SOCKET_TIMEOUT_MS = 30000;
inline constexpr int DEFAULT_MAX_ATTEMPTS = 3;
inline constexpr int DEFAULT_CHECK_INTERVAL_SECONDS = 900;
inline constexpr const char* DEFAULT_NOTIFICATION_CHANNEL = "hostwatch.status";

/**
 * @brief Last known status of every configured host.
 */
using HostsMap = std::unordered_map<Host, Status>;

/**
 * @brief Configuration loaded fresh at the start of every check cycle.
 *
 * The hosts map is mutated in place while the cycle resolves each host and
 * is written back once when the cycle completes.
 */
struct MonitorConfig {
    HostsMap hosts;                                                ///< Host to last known status
    std::chrono::milliseconds socketTimeout{DEFAULT_SOCKET_TIMEOUT_MS}; ///< Connect and read timeout
    int maxAttempts{DEFAULT_MAX_ATTEMPTS};                         ///< Probe attempts per host
    std::string notificationChannel{DEFAULT_NOTIFICATION_CHANNEL}; ///< Channel change events go to
};

} // namespace hostwatch::core
