#include "core/types/Status.hpp"

#include <algorithm>
#include <cctype>

namespace hostwatch::core {

std::string connectionTypeToString(ConnectionType type) {
    switch (type) {
    case ConnectionType::None:
        return "none";
    case ConnectionType::Wifi:
        return "wifi";
    case ConnectionType::Mobile:
        return "mobile";
    }
    return "none";
}

std::optional<ConnectionType> connectionTypeFromString(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "none")
        return ConnectionType::None;
    if (lower == "wifi")
        return ConnectionType::Wifi;
    if (lower == "mobile")
        return ConnectionType::Mobile;
    return std::nullopt;
}

std::string Status::toString() const {
    return std::string(reachable ? "reachable" : "unreachable") + " via " +
           connectionTypeToString(connectionType);
}

} // namespace hostwatch::core
