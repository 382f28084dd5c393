#include "infrastructure/database/HostStatusRepository.hpp"

#include <spdlog/spdlog.h>

namespace hostwatch::infra {

namespace {

core::Status rowToStatus(Statement& stmt, int reachableColumn, int typeColumn) {
    core::Status status;
    status.reachable = stmt.columnInt(reachableColumn) != 0;

    auto typeName = stmt.columnText(typeColumn);
    auto type = core::connectionTypeFromString(typeName);
    if (!type) {
        spdlog::warn("Unknown stored connection type '{}', using none", typeName);
    }
    status.connectionType = type.value_or(core::ConnectionType::None);
    return status;
}

} // namespace

HostStatusRepository::HostStatusRepository(std::shared_ptr<Database> db) : db_(std::move(db)) {}

bool HostStatusRepository::insert(const core::Host& host) {
    auto stmt = db_->prepare(R"(
        INSERT OR IGNORE INTO hosts (address, port, reachable, connection_type)
        VALUES (?, ?, 0, ?)
    )");

    stmt.bind(1, host.address);
    stmt.bind(2, host.port);
    stmt.bind(3, core::connectionTypeToString(core::ConnectionType::None));
    stmt.step();

    if (db_->changes() == 0) {
        spdlog::debug("Host {} already configured", host.toString());
        return false;
    }

    spdlog::debug("Inserted host {}", host.toString());
    return true;
}

bool HostStatusRepository::remove(const core::Host& host) {
    db_->execute("DELETE FROM hosts WHERE address = ? AND port = ?", host.address, host.port);
    bool removed = db_->changes() > 0;
    spdlog::debug("Removed host {}: {}", host.toString(), removed);
    return removed;
}

void HostStatusRepository::clear() {
    db_->execute("DELETE FROM hosts");
    spdlog::debug("Removed all hosts");
}

core::HostsMap HostStatusRepository::findAll() {
    core::HostsMap hosts;
    auto stmt = db_->prepare("SELECT address, port, reachable, connection_type FROM hosts");

    while (stmt.step()) {
        core::Host host{stmt.columnText(0), stmt.columnInt(1)};
        hosts.emplace(std::move(host), rowToStatus(stmt, 2, 3));
    }
    return hosts;
}

std::optional<core::Status> HostStatusRepository::findStatus(const core::Host& host) {
    auto stmt = db_->prepare(
        "SELECT reachable, connection_type FROM hosts WHERE address = ? AND port = ?");
    stmt.bind(1, host.address);
    stmt.bind(2, host.port);

    if (stmt.step()) {
        return rowToStatus(stmt, 0, 1);
    }
    return std::nullopt;
}

void HostStatusRepository::updateStatuses(const core::HostsMap& hosts) {
    db_->transaction([this, &hosts]() {
        auto stmt = db_->prepare(R"(
            UPDATE hosts SET reachable = ?, connection_type = ?, last_checked = CURRENT_TIMESTAMP
            WHERE address = ? AND port = ?
        )");

        for (const auto& [host, status] : hosts) {
            stmt.bind(1, status.reachable ? 1 : 0);
            stmt.bind(2, core::connectionTypeToString(status.connectionType));
            stmt.bind(3, host.address);
            stmt.bind(4, host.port);
            stmt.step();
            stmt.reset();
        }
    });

    spdlog::debug("Saved status of {} hosts", hosts.size());
}

int HostStatusRepository::count() {
    auto stmt = db_->prepare("SELECT COUNT(*) FROM hosts");
    if (stmt.step()) {
        return stmt.columnInt(0);
    }
    return 0;
}

} // namespace hostwatch::infra
