#include <catch2/catch_test_macros.hpp>
#include "storage/database.hpp"
#include "storage/migrations.hpp"

using namespace tally;
using namespace tally::storage;

TEST_CASE("Database basic operations", "[storage]") {
    auto db_result = Database::open_memory();
    REQUIRE(db_result.is_ok());
    auto db = std::move(db_result).unwrap();

    REQUIRE(db.execute("CREATE TABLE test (id INTEGER, name TEXT);").is_ok());

    SECTION("Prepare, bind and step") {
        auto insert = db.prepare("INSERT INTO test VALUES (?, ?);").unwrap();
        REQUIRE(insert.bind_int(1, 1).is_ok());
        REQUIRE(insert.bind_text(2, "Alice").is_ok());
        REQUIRE(insert.step().unwrap() == false);

        auto stmt = db.prepare("SELECT id, name FROM test;").unwrap();
        REQUIRE(stmt.step().unwrap() == true);
        REQUIRE(stmt.column_int(0) == 1);
        REQUIRE(stmt.column_text(1) == "Alice");
        REQUIRE(stmt.step().unwrap() == false);
    }

    SECTION("Binding out of range is an error") {
        auto stmt = db.prepare("SELECT * FROM test WHERE id = ?;").unwrap();
        auto bound = stmt.bind_int(5, 1);
        REQUIRE(bound.is_err());
        REQUIRE(bound.unwrap_err().kind == ErrorKind::Durability);
    }

    SECTION("Transaction commit") {
        auto result = db.transaction([&]() {
            return db.execute("INSERT INTO test VALUES (1, 'a');")
                .and_then([&] { return db.execute("INSERT INTO test VALUES (2, 'b');"); });
        });
        REQUIRE(result.is_ok());

        auto stmt = db.prepare("SELECT COUNT(*) FROM test;").unwrap();
        REQUIRE(stmt.step().unwrap());
        REQUIRE(stmt.column_int(0) == 2);
    }

    SECTION("Transaction rollback on error") {
        auto result = db.transaction([&]() -> Result<void, Error> {
            auto inserted = db.execute("INSERT INTO test VALUES (1, 'a');");
            if (inserted.is_err()) return inserted;
            return Result<void, Error>::err(Error{"abort"});
        });
        REQUIRE(result.is_err());

        auto stmt = db.prepare("SELECT COUNT(*) FROM test;").unwrap();
        REQUIRE(stmt.step().unwrap());
        REQUIRE(stmt.column_int(0) == 0);
    }

    SECTION("Invalid SQL is reported") {
        auto result = db.execute("NOT SQL;");
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ErrorKind::Durability);
    }

    SECTION("Checkpoint succeeds without a WAL") {
        REQUIRE(db.checkpoint().is_ok());
    }
}

TEST_CASE("Migrations create the queue schema", "[storage][migrations]") {
    auto db = Database::open_memory().unwrap();
    MigrationRunner runner(db);

    REQUIRE(runner.current_version().unwrap() == 0);
    REQUIRE(runner.migrate().is_ok());
    REQUIRE(runner.current_version().unwrap() == MigrationRunner::latest_version());

    SECTION("migrate is idempotent") {
        REQUIRE(runner.migrate().is_ok());
        REQUIRE(runner.current_version().unwrap() == MigrationRunner::latest_version());
    }

    SECTION("retry scheduling columns exist") {
        REQUIRE(db.execute(
            "SELECT next_attempt_at, last_error_kind FROM expense_queue;").is_ok());
    }

    SECTION("rollback to version 1 drops the retry columns") {
        REQUIRE(runner.rollback_to(1).is_ok());
        REQUIRE(runner.current_version().unwrap() == 1);
        REQUIRE(db.execute("SELECT next_attempt_at FROM expense_queue;").is_err());
        REQUIRE(runner.migrate().is_ok());
        REQUIRE(db.execute("SELECT next_attempt_at FROM expense_queue;").is_ok());
    }
}
