/**
 * @file IStatusChangeSink.hpp
 * @brief Interface for publishing host status change events.
 */

#pragma once

#include "core/types/HostStatusChange.hpp"

#include <string>

namespace hostwatch::core {

/**
 * @brief Receiver of host status change events.
 *
 * Delivery is fire-and-forget: publishers do not wait for any acknowledgment.
 */
class IStatusChangeSink {
public:
    virtual ~IStatusChangeSink() = default;

    /**
     * @brief Publishes one status change.
     * @param channel Identifier of the channel the event is addressed to.
     * @param change The status transition.
     */
    virtual void publish(const std::string& channel, const HostStatusChange& change) = 0;
};

} // namespace hostwatch::core
