#pragma once

#include "core/services/IConnectivityService.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace hostwatch::infra {

/**
 * @brief Linux connectivity query based on the kernel routing table and sysfs.
 *
 * The active attachment is the interface carrying the IPv4 default route with
 * the lowest metric. It is classified as:
 * - Wifi for wireless interfaces and for wired Ethernet,
 * - Mobile for WWAN devices and PPP or raw-IP links,
 * - None when there is no default route or the interface is down.
 *
 * Any other interface kind is logged as an error and reported as None.
 * Implements core::IConnectivityService.
 */
class ConnectivityService : public core::IConnectivityService {
public:
    /**
     * @brief Constructs a ConnectivityService reading the given kernel files.
     * @param sysfsNetRoot Directory holding one entry per network interface.
     * @param routeTable IPv4 routing table in /proc/net/route format.
     */
    explicit ConnectivityService(std::filesystem::path sysfsNetRoot = "/sys/class/net",
                                 std::filesystem::path routeTable = "/proc/net/route");

    /**
     * @brief Classifies the interface carrying the default route.
     * @return The active connection type.
     */
    core::ConnectionType activeConnectionType() override;

    /**
     * @brief Finds the interface carrying the IPv4 default route.
     * @return Interface name, or std::nullopt if there is no default route.
     */
    std::optional<std::string> defaultRouteInterface() const;

private:
    bool isOperational(const std::string& iface) const;
    core::ConnectionType classify(const std::string& iface) const;
    std::optional<std::string> readAttribute(const std::string& iface,
                                             const std::string& attribute) const;

    std::filesystem::path sysfsNetRoot_;
    std::filesystem::path routeTable_;
};

} // namespace hostwatch::infra
