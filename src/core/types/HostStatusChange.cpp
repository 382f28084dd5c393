#include "core/types/HostStatusChange.hpp"

namespace hostwatch::core {

HostStatusChange HostStatusChange::between(const Host& host, const Status& previous,
                                           const Status& current) {
    HostStatusChange change;
    change.host = host.address;
    change.port = host.port;
    change.previousReachable = previous.reachable;
    change.previousConnectionType = previous.connectionType;
    change.reachable = current.reachable;
    change.connectionType = current.connectionType;
    return change;
}

std::string HostStatusChange::toString() const {
    return host + ":" + std::to_string(port) + " " + previousStatus().toString() + " -> " +
           currentStatus().toString();
}

} // namespace hostwatch::core
