#include <catch2/catch_test_macros.hpp>

#include "helpers/TestHelpers.hpp"
#include "infrastructure/database/Database.hpp"
#include "infrastructure/database/HostStatusRepository.hpp"

#include <memory>

using namespace hostwatch::infra;
using namespace hostwatch::core;
using hostwatch::test::TempDir;

namespace {

class TestDatabase {
public:
    TestDatabase() : dir_("hoststatus_repo") {
        db_ = std::make_shared<Database>((dir_ / "hosts.db").string());
        db_->runMigrations();
    }

    ~TestDatabase() { db_.reset(); }

    std::shared_ptr<Database> get() { return db_; }

private:
    TempDir dir_;
    std::shared_ptr<Database> db_;
};

const Host HOST_A{"a.example", 443};
const Host HOST_B{"b.example", 80};

} // namespace

TEST_CASE("HostStatusRepository insert operations", "[HostStatusRepository][CRUD]") {
    TestDatabase testDb;
    HostStatusRepository repo(testDb.get());

    SECTION("New host starts unreachable with no connection") {
        REQUIRE(repo.insert(HOST_A));

        auto status = repo.findStatus(HOST_A);
        REQUIRE(status.has_value());
        REQUIRE(*status == Status{false, ConnectionType::None});
    }

    SECTION("Inserting the same host twice keeps one entry") {
        REQUIRE(repo.insert(HOST_A));
        REQUIRE_FALSE(repo.insert(HOST_A));
        REQUIRE(repo.count() == 1);
    }

    SECTION("Same address on another port is another host") {
        REQUIRE(repo.insert(HOST_A));
        REQUIRE(repo.insert(Host{"a.example", 8443}));
        REQUIRE(repo.count() == 2);
    }

    SECTION("Insert does not reset a known status") {
        repo.insert(HOST_A);
        repo.updateStatuses({{HOST_A, Status{true, ConnectionType::Wifi}}});

        REQUIRE_FALSE(repo.insert(HOST_A));
        REQUIRE(*repo.findStatus(HOST_A) == Status{true, ConnectionType::Wifi});
    }
}

TEST_CASE("HostStatusRepository remove operations", "[HostStatusRepository][CRUD]") {
    TestDatabase testDb;
    HostStatusRepository repo(testDb.get());
    repo.insert(HOST_A);
    repo.insert(HOST_B);

    SECTION("remove deletes one host") {
        REQUIRE(repo.remove(HOST_A));
        REQUIRE_FALSE(repo.findStatus(HOST_A).has_value());
        REQUIRE(repo.findStatus(HOST_B).has_value());
    }

    SECTION("remove of an unknown host returns false") {
        REQUIRE_FALSE(repo.remove(Host{"c.example", 80}));
        REQUIRE(repo.count() == 2);
    }

    SECTION("clear deletes every host") {
        repo.clear();
        REQUIRE(repo.count() == 0);
        REQUIRE(repo.findAll().empty());
    }
}

TEST_CASE("HostStatusRepository findAll", "[HostStatusRepository]") {
    TestDatabase testDb;
    HostStatusRepository repo(testDb.get());

    SECTION("Empty when nothing is configured") {
        REQUIRE(repo.findAll().empty());
    }

    SECTION("Returns every host with its status") {
        repo.insert(HOST_A);
        repo.insert(HOST_B);
        repo.updateStatuses({{HOST_B, Status{true, ConnectionType::Mobile}}});

        auto hosts = repo.findAll();

        REQUIRE(hosts.size() == 2);
        REQUIRE(hosts.at(HOST_A) == Status{false, ConnectionType::None});
        REQUIRE(hosts.at(HOST_B) == Status{true, ConnectionType::Mobile});
    }

    SECTION("Unknown stored connection type reads as none") {
        testDb.get()->execute(
            "INSERT INTO hosts (address, port, reachable, connection_type) VALUES (?, ?, 1, ?)",
            std::string("odd.example"), 80, std::string("satellite"));

        auto status = repo.findStatus(Host{"odd.example", 80});
        REQUIRE(status.has_value());
        REQUIRE(status->reachable);
        REQUIRE(status->connectionType == ConnectionType::None);
    }
}

TEST_CASE("HostStatusRepository updateStatuses", "[HostStatusRepository]") {
    TestDatabase testDb;
    HostStatusRepository repo(testDb.get());
    repo.insert(HOST_A);
    repo.insert(HOST_B);

    SECTION("Writes every status in the map") {
        repo.updateStatuses({{HOST_A, Status{true, ConnectionType::Wifi}},
                             {HOST_B, Status{false, ConnectionType::Wifi}}});

        REQUIRE(*repo.findStatus(HOST_A) == Status{true, ConnectionType::Wifi});
        REQUIRE(*repo.findStatus(HOST_B) == Status{false, ConnectionType::Wifi});
    }

    SECTION("Does not bring back a removed host") {
        auto snapshot = repo.findAll();
        repo.remove(HOST_A);

        snapshot[HOST_A] = Status{true, ConnectionType::Wifi};
        repo.updateStatuses(snapshot);

        REQUIRE_FALSE(repo.findStatus(HOST_A).has_value());
        REQUIRE(repo.count() == 1);
    }

    SECTION("Does not add hosts that were never configured") {
        repo.updateStatuses({{Host{"new.example", 80}, Status{true, ConnectionType::Wifi}}});

        REQUIRE(repo.count() == 2);
    }

    SECTION("Leaves hosts missing from the map untouched") {
        repo.updateStatuses({{HOST_A, Status{true, ConnectionType::Mobile}}});

        REQUIRE(*repo.findStatus(HOST_B) == Status{false, ConnectionType::None});
    }

    SECTION("Records when the host was last checked") {
        repo.updateStatuses({{HOST_A, Status{true, ConnectionType::Wifi}}});

        auto stmt = testDb.get()->prepare(
            "SELECT last_checked FROM hosts WHERE address = 'a.example'");
        REQUIRE(stmt.step());
        REQUIRE_FALSE(stmt.columnIsNull(0));
    }
}
