/**
 * @file IReachabilityProber.hpp
 * @brief Interface for endpoint reachability probing.
 *
 * This file defines the abstract single-attempt probe used by the host
 * monitor and the bounded retry loop built on top of it.
 */

#pragma once

#include "core/types/Host.hpp"

#include <algorithm>
#include <chrono>

namespace hostwatch::core {

/**
 * @brief Interface for reachability probing of a single host.
 */
class IReachabilityProber {
public:
    virtual ~IReachabilityProber() = default;

    /**
     * @brief Performs one connection attempt against the host.
     *
     * Connects to the canonical URL of the host using the timeout for both the
     * connect and the read phase. Any error or timeout is reported as false.
     *
     * @param host The endpoint to probe.
     * @param timeout Connect and read timeout.
     * @return True if a response was received.
     */
    virtual bool probe(const Host& host, std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Probes the host up to maxAttempts times, stopping at the first success.
     *
     * Attempts run back to back with no delay between them.
     *
     * @param host The endpoint to probe.
     * @param timeout Connect and read timeout of each attempt.
     * @param maxAttempts Number of attempts; values below 1 are treated as 1.
     * @return False only if every attempt failed.
     */
    bool probeWithRetry(const Host& host, std::chrono::milliseconds timeout, int maxAttempts) {
        const int attempts = std::max(maxAttempts, 1);
        for (int attempt = 0; attempt < attempts; ++attempt) {
            if (probe(host, timeout)) {
                return true;
            }
        }
        return false;
    }
};

} // namespace hostwatch::core
