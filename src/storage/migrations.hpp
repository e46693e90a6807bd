#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include <string>
#include <vector>

namespace nom::storage {

/**
 * Migration - One forward step of the items schema.
 */
struct Migration {
    int version;
    std::string name;
    std::string up_sql;
};

/**
 * All migrations in order.
 *
 * AUTOINCREMENT keeps item ids from being reused after deletion. The
 * partial unique index is the (feed_url, guid) dedup index; items without
 * a GUID are not part of it.
 */
inline const std::vector<Migration> ALL_MIGRATIONS = {
    {
        .version = 1,
        .name = "items",
        .up_sql = R"SQL(
            CREATE TABLE IF NOT EXISTS items (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                feed_url TEXT NOT NULL DEFAULT '',
                guid TEXT NOT NULL DEFAULT '',
                link TEXT NOT NULL DEFAULT '',
                title TEXT NOT NULL DEFAULT '',
                author TEXT NOT NULL DEFAULT '',
                content TEXT NOT NULL DEFAULT '',
                favourite INTEGER NOT NULL DEFAULT 0,
                read_at INTEGER NOT NULL DEFAULT 0,
                published_at INTEGER NOT NULL DEFAULT 0,
                updated_at INTEGER NOT NULL DEFAULT 0,
                created_at INTEGER NOT NULL
            );
            CREATE UNIQUE INDEX IF NOT EXISTS idx_items_feed_guid
                ON items(feed_url, guid) WHERE guid <> '';
            CREATE INDEX IF NOT EXISTS idx_items_published
                ON items(published_at, id);
        )SQL"
    },
    {
        .version = 2,
        .name = "unread_index",
        .up_sql = R"SQL(
            CREATE INDEX IF NOT EXISTS idx_items_unread
                ON items(read_at) WHERE read_at = 0;
        )SQL"
    }
};

/**
 * MigrationRunner - Brings a database up to the latest schema version.
 *
 * Applied versions are recorded in `schema_migrations`. Pending
 * migrations run inside one transaction.
 */
class MigrationRunner {
public:
    explicit MigrationRunner(Database& db) : db_(db) {}

    [[nodiscard]] Result<int, Error> current_version();

    [[nodiscard]] static int latest_version() {
        return ALL_MIGRATIONS.empty() ? 0 : ALL_MIGRATIONS.back().version;
    }

    [[nodiscard]] VoidResult migrate();

private:
    Database& db_;

    [[nodiscard]] VoidResult ensure_migrations_table();
    [[nodiscard]] VoidResult run_migration(const Migration& m);
};

/**
 * Create or upgrade the items schema.
 */
[[nodiscard]] inline VoidResult initialize_database(Database& db) {
    MigrationRunner runner(db);
    return runner.migrate();
}

} // namespace nom::storage
