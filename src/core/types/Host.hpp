/**
 * @file Host.hpp
 * @brief Monitored endpoint definition.
 *
 * This file defines the Host value which identifies a monitored network
 * endpoint by address and port, and the hash used to key status maps by it.
 */

#pragma once

#include <cstddef>
#include <functional>
#include <string>

namespace hostwatch::core {

/**
 * @brief A monitored network endpoint.
 *
 * Two hosts are the same endpoint when both the address and the port match.
 * The address may be a bare hostname, an IP literal, or a URL carrying an
 * http/https scheme and an optional path.
 */
struct Host {
    std::string address; ///< Hostname, IP address or http(s) URL
    int port{0};         ///< TCP port to probe

    /**
     * @brief Validates the endpoint.
     * @return True if the address is non-empty and the port is in 1..65535.
     */
    [[nodiscard]] bool isValid() const;

    /**
     * @brief Builds the URL used to probe this endpoint.
     *
     * A scheme already present in the address is kept together with its path.
     * Otherwise https is chosen for port 443 and http for every other port.
     * The configured port always replaces any port found in the address.
     *
     * @return Canonical probe URL, e.g. "http://example.com:8080/".
     */
    [[nodiscard]] std::string canonicalUrl() const;

    /**
     * @brief Formats the endpoint for log and console output.
     * @return "address:port".
     */
    [[nodiscard]] std::string toString() const;

    bool operator==(const Host& other) const = default;
};

} // namespace hostwatch::core

namespace std {

template <>
struct hash<hostwatch::core::Host> {
    size_t operator()(const hostwatch::core::Host& host) const noexcept {
        size_t seed = hash<string>{}(host.address);
        seed ^= hash<int>{}(host.port) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        return seed;
    }
};

} // namespace std
