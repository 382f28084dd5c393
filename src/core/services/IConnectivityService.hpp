/**
 * @file IConnectivityService.hpp
 * @brief Interface for querying the active network attachment.
 */

#pragma once

#include "core/types/Status.hpp"

namespace hostwatch::core {

/**
 * @brief Platform connectivity query.
 */
class IConnectivityService {
public:
    virtual ~IConnectivityService() = default;

    /**
     * @brief Classifies the network attachment currently in use.
     *
     * Attachments that cannot be classified are reported as None.
     *
     * @return The active connection type.
     */
    virtual ConnectionType activeConnectionType() = 0;
};

} // namespace hostwatch::core
