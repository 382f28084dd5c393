#include "infrastructure/network/ConnectivityService.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <limits>
#include <sstream>

namespace hostwatch::infra {

namespace {

constexpr unsigned long RTF_UP_FLAG = 0x0001;

// ARPHRD_* values from <linux/if_arp.h>
constexpr int ARP_TYPE_ETHER = 1;
constexpr int ARP_TYPE_PPP = 512;
constexpr int ARP_TYPE_RAWIP = 519;

std::string trim(const std::string& value) {
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

} // namespace

ConnectivityService::ConnectivityService(std::filesystem::path sysfsNetRoot,
                                         std::filesystem::path routeTable)
    : sysfsNetRoot_(std::move(sysfsNetRoot)), routeTable_(std::move(routeTable)) {}

core::ConnectionType ConnectivityService::activeConnectionType() {
    auto iface = defaultRouteInterface();
    if (!iface) {
        spdlog::debug("No default route, no active connection");
        return core::ConnectionType::None;
    }

    if (!isOperational(*iface)) {
        spdlog::debug("Default route interface {} is not up", *iface);
        return core::ConnectionType::None;
    }

    return classify(*iface);
}

std::optional<std::string> ConnectivityService::defaultRouteInterface() const {
    std::ifstream file(routeTable_);
    if (!file) {
        spdlog::warn("Failed to open routing table: {}", routeTable_.string());
        return std::nullopt;
    }

    std::string line;
    std::getline(file, line); // header

    std::optional<std::string> best;
    long bestMetric = std::numeric_limits<long>::max();

    while (std::getline(file, line)) {
        std::istringstream fields(line);
        std::string iface, destination, gateway, flagsHex;
        long refCount = 0, use = 0, metric = 0;

        if (!(fields >> iface >> destination >> gateway >> flagsHex >> refCount >> use >> metric)) {
            continue;
        }

        unsigned long flags = 0;
        try {
            flags = std::stoul(flagsHex, nullptr, 16);
        } catch (const std::exception&) {
            continue;
        }

        if (destination != "00000000" || (flags & RTF_UP_FLAG) == 0) {
            continue;
        }

        if (metric < bestMetric) {
            bestMetric = metric;
            best = iface;
        }
    }

    return best;
}

bool ConnectivityService::isOperational(const std::string& iface) const {
    auto state = readAttribute(iface, "operstate");
    // Point-to-point links commonly report "unknown" while passing traffic.
    return state && (*state == "up" || *state == "unknown");
}

core::ConnectionType ConnectivityService::classify(const std::string& iface) const {
    const auto dir = sysfsNetRoot_ / iface;
    std::error_code ec;

    if (std::filesystem::exists(dir / "wireless", ec) ||
        std::filesystem::exists(dir / "phy80211", ec)) {
        return core::ConnectionType::Wifi;
    }

    if (auto uevent = readAttribute(iface, "uevent")) {
        std::istringstream lines(*uevent);
        std::string entry;
        while (std::getline(lines, entry)) {
            if (trim(entry) == "DEVTYPE=wwan") {
                return core::ConnectionType::Mobile;
            }
        }
    }

    auto typeText = readAttribute(iface, "type");
    int arpType = -1;
    if (typeText) {
        try {
            arpType = std::stoi(*typeText);
        } catch (const std::exception&) {
            arpType = -1;
        }
    }

    if (arpType == ARP_TYPE_PPP || arpType == ARP_TYPE_RAWIP) {
        return core::ConnectionType::Mobile;
    }
    if (arpType == ARP_TYPE_ETHER) {
        return core::ConnectionType::Wifi;
    }

    spdlog::error("Unsupported connection type: {} (interface {}). Returning NONE",
                  typeText.value_or("unknown"), iface);
    return core::ConnectionType::None;
}

std::optional<std::string> ConnectivityService::readAttribute(const std::string& iface,
                                                             const std::string& attribute) const {
    std::ifstream file(sysfsNetRoot_ / iface / attribute);
    if (!file) {
        return std::nullopt;
    }

    std::stringstream content;
    content << file.rdbuf();
    return trim(content.str());
}

} // namespace hostwatch::infra
