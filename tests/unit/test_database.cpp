#include <catch2/catch_test_macros.hpp>
#include "storage/database.hpp"
#include "storage/migrations.hpp"

using namespace nom;
using namespace nom::storage;

TEST_CASE("Database basic operations", "[storage]") {
    auto db_result = Database::open_memory();
    REQUIRE(db_result.is_ok());
    auto db = std::move(db_result).unwrap();

    SECTION("Execute creates table") {
        auto result = db.execute("CREATE TABLE test (id INTEGER PRIMARY KEY);");
        REQUIRE(result.is_ok());
    }

    SECTION("Prepare, bind and step") {
        REQUIRE(db.execute("CREATE TABLE test (id INTEGER, name TEXT, flag INTEGER);").is_ok());

        auto insert = db.prepare("INSERT INTO test VALUES (?, ?, ?);").unwrap();
        REQUIRE(all_ok({insert.bind_int64(1, 1), insert.bind_text(2, "Alice"), insert.bind_bool(3, true)}).is_ok());
        REQUIRE(insert.step().unwrap() == false);
        REQUIRE(insert.reset().is_ok());
        REQUIRE(all_ok({insert.bind_int64(1, 2), insert.bind_text(2, "Bob"), insert.bind_bool(3, false)}).is_ok());
        REQUIRE(insert.step().unwrap() == false);

        auto stmt = db.prepare("SELECT id, name, flag FROM test ORDER BY id;").unwrap();

        REQUIRE(stmt.step().unwrap() == true);
        REQUIRE(stmt.column_int64(0) == 1);
        REQUIRE(stmt.column_text(1) == "Alice");
        REQUIRE(stmt.column_bool(2));

        REQUIRE(stmt.step().unwrap() == true);
        REQUIRE(stmt.column_int(0) == 2);
        REQUIRE(stmt.column_text(1) == "Bob");
        REQUIRE_FALSE(stmt.column_bool(2));

        REQUIRE(stmt.step().unwrap() == false);
    }

    SECTION("Invalid SQL reports a persistence error") {
        auto result = db.prepare("SELEKT nothing;");
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().is_persistence());
        REQUIRE(result.unwrap_err().code != 0);
    }

    SECTION("changes counts matched rows") {
        REQUIRE(db.execute("CREATE TABLE test (id INTEGER, v INTEGER);").is_ok());
        REQUIRE(db.execute("INSERT INTO test VALUES (1, 0), (2, 0);").is_ok());
        REQUIRE(db.execute("UPDATE test SET v = 0 WHERE id = 1;").is_ok());
        REQUIRE(db.changes() == 1);
        REQUIRE(db.execute("UPDATE test SET v = 1 WHERE id = 99;").is_ok());
        REQUIRE(db.changes() == 0);
    }

    SECTION("Transaction commit") {
        REQUIRE(db.execute("CREATE TABLE test (id INTEGER);").is_ok());

        auto result = db.transaction([&]() -> VoidResult {
            return all_ok({db.execute("INSERT INTO test VALUES (1);"),
                           db.execute("INSERT INTO test VALUES (2);")});
        });

        REQUIRE(result.is_ok());
        REQUIRE_FALSE(db.in_transaction());

        auto stmt = db.prepare("SELECT COUNT(*) FROM test;").unwrap();
        REQUIRE(stmt.step().unwrap());
        REQUIRE(stmt.column_int(0) == 2);
    }

    SECTION("Transaction rollback on error") {
        REQUIRE(db.execute("CREATE TABLE test (id INTEGER);").is_ok());
        REQUIRE(db.execute("INSERT INTO test VALUES (1);").is_ok());

        auto result = db.transaction([&]() -> VoidResult {
            REQUIRE(db.execute("INSERT INTO test VALUES (2);").is_ok());
            return VoidResult::err(Error{"forced error"});
        });

        REQUIRE(result.is_err());
        REQUIRE_FALSE(db.in_transaction());

        auto stmt = db.prepare("SELECT COUNT(*) FROM test;").unwrap();
        REQUIRE(stmt.step().unwrap());
        REQUIRE(stmt.column_int(0) == 1);  // Rollback happened
    }

    SECTION("TransactionGuard rolls back unless committed") {
        REQUIRE(db.execute("CREATE TABLE test (id INTEGER);").is_ok());
        {
            TransactionGuard guard(db);
            REQUIRE(guard.status().is_ok());
            REQUIRE(guard.is_active());
            REQUIRE(db.in_transaction());
            REQUIRE(db.execute("INSERT INTO test VALUES (1);").is_ok());
        }
        REQUIRE_FALSE(db.in_transaction());

        {
            TransactionGuard guard(db);
            REQUIRE(db.execute("INSERT INTO test VALUES (2);").is_ok());
            REQUIRE(guard.commit().is_ok());
            REQUIRE_FALSE(guard.is_active());
        }

        auto stmt = db.prepare("SELECT COUNT(*), MAX(id) FROM test;").unwrap();
        REQUIRE(stmt.step().unwrap());
        REQUIRE(stmt.column_int(0) == 1);
        REQUIRE(stmt.column_int(1) == 2);
    }

    SECTION("Nested begin is rejected by SQLite") {
        REQUIRE(db.begin_transaction().is_ok());
        REQUIRE(db.begin_transaction().is_err());
        REQUIRE(db.rollback().is_ok());
    }
}

TEST_CASE("Migrations", "[storage]") {
    auto db = Database::open_memory().unwrap();
    MigrationRunner runner(db);

    SECTION("Initial version is 0") {
        auto version = runner.current_version();
        REQUIRE(version.is_ok());
        REQUIRE(version.unwrap() == 0);
    }

    SECTION("Migrate to latest") {
        auto result = runner.migrate();
        REQUIRE(result.is_ok());

        auto version = runner.current_version();
        REQUIRE(version.unwrap() == MigrationRunner::latest_version());
    }

    SECTION("Migrate is idempotent") {
        REQUIRE(runner.migrate().is_ok());
        REQUIRE(runner.migrate().is_ok());
        REQUIRE(runner.current_version().unwrap() == MigrationRunner::latest_version());
    }

    SECTION("Items table enforces the GUID dedup index") {
        REQUIRE(initialize_database(db).is_ok());

        const char* insert =
            "INSERT INTO items (feed_url, guid, title, created_at) VALUES ('u', 'g', 't', 1);";
        REQUIRE(db.execute(insert).is_ok());
        REQUIRE(db.execute(insert).is_err());

        // Items without a GUID are outside the index.
        const char* no_guid =
            "INSERT INTO items (feed_url, guid, title, created_at) VALUES ('u', '', 't', 1);";
        REQUIRE(db.execute(no_guid).is_ok());
        REQUIRE(db.execute(no_guid).is_ok());
    }

    SECTION("Deleted ids are not handed out again") {
        REQUIRE(initialize_database(db).is_ok());
        REQUIRE(db.execute("INSERT INTO items (feed_url, created_at) VALUES ('u', 1);").is_ok());
        REQUIRE(db.execute("INSERT INTO items (feed_url, created_at) VALUES ('u', 1);").is_ok());
        REQUIRE(db.execute("DELETE FROM items;").is_ok());
        REQUIRE(db.execute("INSERT INTO items (feed_url, created_at) VALUES ('u', 1);").is_ok());
        REQUIRE(db.last_insert_rowid() == 3);
    }
}
