#pragma once

#include "core/types/HostStatusChange.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace hostwatch::infra {

/**
 * @brief Serializes a status change for subscribers outside the process.
 *
 * Keys: host, port, previous_reachable, previous_connection_type, reachable,
 * connection_type. Connection types are written by name.
 */
nlohmann::json toJson(const core::HostStatusChange& change);

/**
 * @brief Same as toJson() with an added "channel" key.
 */
nlohmann::json toJson(const std::string& channel, const core::HostStatusChange& change);

} // namespace hostwatch::infra
