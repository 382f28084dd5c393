/**
 * @file HostStatusChange.hpp
 * @brief Payload emitted when the status of a host changes.
 */

#pragma once

#include "core/types/Host.hpp"
#include "core/types/Status.hpp"

#include <string>

namespace hostwatch::core {

/**
 * @brief Notification payload describing one host status transition.
 *
 * Carries the host identity together with the previously stored and the
 * newly observed status. Only produced when the two statuses differ.
 */
struct HostStatusChange {
    std::string host;                                          ///< Host address as configured
    int port{0};                                               ///< Host port
    bool previousReachable{false};                             ///< Reachability before the check
    ConnectionType previousConnectionType{ConnectionType::None}; ///< Attachment before the check
    bool reachable{false};                                     ///< Reachability after the check
    ConnectionType connectionType{ConnectionType::None};       ///< Attachment after the check

    /**
     * @brief Builds the payload for a transition of a host.
     * @param host The host whose status changed.
     * @param previous Status stored before the check.
     * @param current Status observed by the check.
     * @return The populated payload.
     */
    static HostStatusChange between(const Host& host, const Status& previous,
                                    const Status& current);

    [[nodiscard]] Status previousStatus() const { return {previousReachable, previousConnectionType}; }
    [[nodiscard]] Status currentStatus() const { return {reachable, connectionType}; }

    /**
     * @brief Formats the transition for log output.
     * @return e.g. "example.com:443 unreachable via none -> reachable via wifi".
     */
    [[nodiscard]] std::string toString() const;

    bool operator==(const HostStatusChange& other) const = default;
};

} // namespace hostwatch::core
