#include "infrastructure/network/HttpProber.hpp"

#include <spdlog/spdlog.h>

namespace hostwatch::infra {

bool HttpProber::probe(const core::Host& host, std::chrono::milliseconds timeout) {
    const std::string url = host.canonicalUrl();

    try {
        HttpResponse response = client_.get(url, timeout);
        if (!response.completed) {
            spdlog::debug("Probe of {} failed: {}", url, response.errorMessage);
            return false;
        }

        spdlog::debug("Probe of {} answered (status {})", url, response.statusCode);
        return true;
    } catch (const std::exception& e) {
        spdlog::debug("Probe of {} failed: {}", url, e.what());
        return false;
    }
}

} // namespace hostwatch::infra
