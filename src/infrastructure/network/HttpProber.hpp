#pragma once

#include "core/services/IReachabilityProber.hpp"
#include "infrastructure/network/HttpClient.hpp"

namespace hostwatch::infra {

/**
 * @brief Reachability prober issuing one HTTP request per attempt.
 *
 * An endpoint is reachable when a GET of its canonical URL completes with
 * any HTTP status. For https endpoints the TLS handshake and certificate
 * check must succeed as well. Implements core::IReachabilityProber.
 */
class HttpProber : public core::IReachabilityProber {
public:
    /**
     * @brief Performs a single probe. Never throws.
     * @param host The endpoint to probe.
     * @param timeout Connect and read timeout.
     * @return True if the endpoint answered.
     */
    bool probe(const core::Host& host, std::chrono::milliseconds timeout) override;

private:
    HttpClient client_;
};

} // namespace hostwatch::infra
