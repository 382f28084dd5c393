/**
 * @file Status.hpp
 * @brief Reachability status and connection type definitions.
 */

#pragma once

#include <optional>
#include <string>

namespace hostwatch::core {

/**
 * @brief Network attachment in effect while a check runs.
 *
 * Persisted and transported by name ("none", "wifi", "mobile"), never by
 * numeric value.
 */
enum class ConnectionType : int {
    None = 0,  ///< No active network attachment
    Wifi = 1,  ///< Wireless or wired local network
    Mobile = 2 ///< Cellular / WWAN link
};

/**
 * @brief Converts a connection type to its serialized name.
 * @param type The connection type.
 * @return "none", "wifi" or "mobile".
 */
std::string connectionTypeToString(ConnectionType type);

/**
 * @brief Parses a serialized connection type name (case-insensitive).
 * @param str The name to parse.
 * @return The connection type, or std::nullopt for an unknown name.
 */
std::optional<ConnectionType> connectionTypeFromString(const std::string& str);

/**
 * @brief Last known or newly observed state of a monitored host.
 */
struct Status {
    bool reachable{false};                            ///< Whether the host answered
    ConnectionType connectionType{ConnectionType::None}; ///< Attachment used for the check

    /**
     * @brief Formats the status for log output.
     * @return e.g. "reachable via wifi".
     */
    [[nodiscard]] std::string toString() const;

    bool operator==(const Status& other) const = default;
};

} // namespace hostwatch::core
