#include "infrastructure/notifications/StatusChangePayload.hpp"

namespace hostwatch::infra {

nlohmann::json toJson(const core::HostStatusChange& change) {
    nlohmann::json j;
    j["host"] = change.host;
    j["port"] = change.port;
    j["previous_reachable"] = change.previousReachable;
    j["previous_connection_type"] = core::connectionTypeToString(change.previousConnectionType);
    j["reachable"] = change.reachable;
    j["connection_type"] = core::connectionTypeToString(change.connectionType);
    return j;
}

nlohmann::json toJson(const std::string& channel, const core::HostStatusChange& change) {
    auto j = toJson(change);
    j["channel"] = channel;
    return j;
}

} // namespace hostwatch::infra
