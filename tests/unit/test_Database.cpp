#include <catch2/catch_test_macros.hpp>

#include "infrastructure/database/Database.hpp"

#include <filesystem>
#include <stdexcept>

using namespace hostwatch::infra;

namespace {

class TestDatabase {
public:
    TestDatabase() : dbPath_(std::filesystem::temp_directory_path() / "hostwatch_test.db") {
        removeFiles();
        db_ = std::make_shared<Database>(dbPath_.string());
        db_->runMigrations();
    }

    ~TestDatabase() {
        db_.reset();
        removeFiles();
    }

    std::shared_ptr<Database> get() { return db_; }
    const std::filesystem::path& path() const { return dbPath_; }

private:
    void removeFiles() {
        for (const auto* suffix : {"", "-wal", "-shm"}) {
            std::filesystem::remove(dbPath_.string() + suffix);
        }
    }

    std::filesystem::path dbPath_;
    std::shared_ptr<Database> db_;
};

bool tableExists(Database& db, const std::string& name) {
    auto stmt = db.prepare("SELECT name FROM sqlite_master WHERE type = 'table' AND name = ?");
    stmt.bind(1, name);
    return stmt.step();
}

} // namespace

TEST_CASE("Database operations", "[Database]") {
    TestDatabase testDb;
    auto db = testDb.get();

    SECTION("Execute simple SQL") {
        REQUIRE_NOTHROW(db->execute("SELECT 1"));
    }

    SECTION("Prepare and execute statement") {
        auto stmt = db->prepare("SELECT 1 + 1");
        REQUIRE(stmt.step());
        REQUIRE(stmt.columnInt(0) == 2);
    }

    SECTION("Execute with bound parameters") {
        db->execute("CREATE TABLE test_params (id INTEGER, name TEXT)");
        db->execute("INSERT INTO test_params (id, name) VALUES (?, ?)", 7, std::string("seven"));

        auto stmt = db->prepare("SELECT name FROM test_params WHERE id = 7");
        REQUIRE(stmt.step());
        REQUIRE(stmt.columnText(0) == "seven");
        REQUIRE(db->changes() == 1);
    }

    SECTION("Invalid SQL throws") {
        REQUIRE_THROWS_AS(db->execute("NOT SQL"), std::runtime_error);
        REQUIRE_THROWS_AS(db->prepare("SELECT * FROM missing_table"), std::runtime_error);
    }
}

TEST_CASE("Database transactions", "[Database]") {
    TestDatabase testDb;
    auto db = testDb.get();
    db->execute("CREATE TABLE test_tx (id INTEGER PRIMARY KEY, value TEXT)");

    SECTION("Transaction commit") {
        db->beginTransaction();
        db->execute("INSERT INTO test_tx (value) VALUES ('test')");
        db->commit();

        auto stmt = db->prepare("SELECT value FROM test_tx");
        REQUIRE(stmt.step());
        REQUIRE(stmt.columnText(0) == "test");
    }

    SECTION("Transaction rollback") {
        db->beginTransaction();
        db->execute("INSERT INTO test_tx (value) VALUES ('test')");
        db->rollback();

        auto stmt = db->prepare("SELECT COUNT(*) FROM test_tx");
        REQUIRE(stmt.step());
        REQUIRE(stmt.columnInt(0) == 0);
    }

    SECTION("transaction() rolls back and rethrows on exception") {
        REQUIRE_THROWS_AS(db->transaction([&]() {
            db->execute("INSERT INTO test_tx (value) VALUES ('lost')");
            throw std::runtime_error("abort");
        }),
                          std::runtime_error);

        auto stmt = db->prepare("SELECT COUNT(*) FROM test_tx");
        REQUIRE(stmt.step());
        REQUIRE(stmt.columnInt(0) == 0);
    }
}

TEST_CASE("Database migrations", "[Database]") {
    TestDatabase testDb;
    auto db = testDb.get();

    SECTION("Creates the hosts table") {
        REQUIRE(tableExists(*db, "hosts"));
        REQUIRE(db->schemaVersion() == 1);
    }

    SECTION("Running migrations again is a no-op") {
        REQUIRE_NOTHROW(db->runMigrations());
        REQUIRE(db->schemaVersion() == 1);
    }

    SECTION("Schema survives reopening") {
        db->execute("INSERT INTO hosts (address, port) VALUES ('example.com', 80)");

        Database reopened(testDb.path().string());
        reopened.runMigrations();

        auto stmt = reopened.prepare("SELECT reachable, connection_type FROM hosts");
        REQUIRE(stmt.step());
        REQUIRE(stmt.columnInt(0) == 0);
        REQUIRE(stmt.columnText(1) == "none");
    }
}
