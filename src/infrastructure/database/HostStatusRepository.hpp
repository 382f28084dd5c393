#pragma once

#include "core/types/Host.hpp"
#include "core/types/MonitorConfig.hpp"
#include "core/types/Status.hpp"
#include "infrastructure/database/Database.hpp"

#include <memory>
#include <optional>

namespace hostwatch::infra {

/**
 * @brief Repository for the monitored hosts and their last known status.
 *
 * Connection types are stored by name. A host added through insert() starts
 * as unreachable with no connection.
 */
class HostStatusRepository {
public:
    /**
     * @brief Constructs a HostStatusRepository with the given database.
     * @param db Shared pointer to the Database instance.
     */
    explicit HostStatusRepository(std::shared_ptr<Database> db);

    /**
     * @brief Adds a host to the monitored set.
     * @param host Host to add.
     * @return True if added, false if the host was already configured.
     */
    bool insert(const core::Host& host);

    /**
     * @brief Removes a host from the monitored set.
     * @param host Host to remove.
     * @return True if the host was configured.
     */
    bool remove(const core::Host& host);

    /**
     * @brief Removes every host.
     */
    void clear();

    /**
     * @brief Loads every configured host with its status.
     * @return Host to status map; empty when nothing is configured.
     */
    core::HostsMap findAll();

    /**
     * @brief Looks up the stored status of one host.
     * @param host Host to look up.
     * @return Status if the host is configured, nullopt otherwise.
     */
    std::optional<core::Status> findStatus(const core::Host& host);

    /**
     * @brief Writes the status of every host in the map in one transaction.
     *
     * Only hosts that are still configured are updated: a host removed while
     * a check cycle was running is not brought back.
     *
     * @param hosts Host to status map.
     * @throws std::runtime_error if the transaction fails; nothing is written then.
     */
    void updateStatuses(const core::HostsMap& hosts);

    /**
     * @brief Returns the number of configured hosts.
     */
    int count();

private:
    std::shared_ptr<Database> db_;
};

} // namespace hostwatch::infra
