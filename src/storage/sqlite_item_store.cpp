#include "storage/sqlite_item_store.hpp"
#include "storage/migrations.hpp"
#include "storage/store_log.hpp"

#include <QString>

namespace nom::storage {

namespace {

constexpr const char* ITEM_COLUMNS = R"SQL(
    id, author, title, favourite, feed_url, link, guid, content,
    read_at, published_at, updated_at, created_at
)SQL";

Error missing_item(const char* operation, ItemId id) {
    return Error::not_found(std::string(operation) + ": no item with id " + std::to_string(id));
}

} // namespace

// ============================================================================
// Lifecycle
// ============================================================================

Result<std::unique_ptr<SqliteItemStore>, Error> SqliteItemStore::open(const std::string& path) {
    return from_database(Database::open(path));
}

Result<std::unique_ptr<SqliteItemStore>, Error> SqliteItemStore::open_memory() {
    return from_database(Database::open_memory());
}

Result<std::unique_ptr<SqliteItemStore>, Error> SqliteItemStore::from_database(
    Result<Database, Error> opened
) {
    using Ret = Result<std::unique_ptr<SqliteItemStore>, Error>;
    if (opened.is_err()) {
        return Ret::err(opened.unwrap_err());
    }

    auto db = std::move(opened).unwrap();
    auto migrated = initialize_database(db);
    if (migrated.is_err()) {
        return Ret::err(migrated.unwrap_err());
    }

    qCInfo(nomStoreLog) << "opened sqlite store" << QString::fromStdString(db.path());
    return Ret::ok(std::unique_ptr<SqliteItemStore>(new SqliteItemStore(std::move(db))));
}

SqliteItemStore::~SqliteItemStore() {
    if (batch_open_) {
        qCWarning(nomStoreLog) << "discarding uncommitted batch on close"
                               << QString::fromStdString(db_.path());
        abort_batch();
    }
}

// ============================================================================
// Batches
// ============================================================================

VoidResult SqliteItemStore::begin_batch() {
    if (batch_open_) {
        return VoidResult::err(Error::invalid_state("begin_batch: a batch is already open"));
    }
    auto result = db_.begin_transaction();
    if (result.is_err()) {
        return result;
    }
    batch_open_ = true;
    qCInfo(nomStoreLog) << "batch begin";
    return VoidResult::ok();
}

VoidResult SqliteItemStore::end_batch() {
    if (!batch_open_) {
        return VoidResult::err(Error::invalid_state("end_batch: no batch is open"));
    }
    auto result = db_.commit();
    if (result.is_err()) {
        qCWarning(nomStoreLog) << "batch commit failed:"
                               << QString::fromStdString(result.unwrap_err().message);
        abort_batch();
        return result;
    }
    batch_open_ = false;
    qCInfo(nomStoreLog) << "batch committed";
    return VoidResult::ok();
}

void SqliteItemStore::abort_batch() {
    if (!batch_open_) return;
    batch_open_ = false;
    if (!db_.in_transaction()) return;

    auto result = db_.rollback();
    if (result.is_err()) {
        qCWarning(nomStoreLog) << "batch rollback failed:"
                               << QString::fromStdString(result.unwrap_err().message);
    } else {
        qCInfo(nomStoreLog) << "batch rolled back";
    }
}

// ============================================================================
// Upsert
// ============================================================================

VoidResult SqliteItemStore::upsert_item(const Item& candidate) {
    if (batch_open_) {
        return write_item(candidate);
    }

    TransactionGuard tx(db_);
    if (tx.status().is_err()) {
        return tx.status();
    }

    auto result = write_item(candidate);
    if (result.is_err()) {
        return result;
    }
    return tx.commit();
}

VoidResult SqliteItemStore::write_item(const Item& candidate) {
    if (candidate.has_guid()) {
        auto existing = find_by_key(candidate.feed_url, candidate.guid);
        if (existing.is_err()) {
            return VoidResult::err(existing.unwrap_err());
        }
        if (auto id = existing.unwrap()) {
            return update_fetched(*id, candidate);
        }
    }
    return insert_item(candidate);
}

Result<std::optional<ItemId>, Error> SqliteItemStore::find_by_key(
    const std::string& feed_url,
    const std::string& guid
) {
    using Ret = Result<std::optional<ItemId>, Error>;

    auto stmt_result = db_.prepare(
        "SELECT id FROM items WHERE feed_url = ? AND guid = ? AND guid <> '';");
    if (stmt_result.is_err()) {
        return Ret::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = all_ok({stmt.bind_text(1, feed_url), stmt.bind_text(2, guid)});
    if (bound.is_err()) {
        return Ret::err(bound.unwrap_err());
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Ret::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return Ret::ok(std::nullopt);
    }
    return Ret::ok(stmt.column_int64(0));
}

VoidResult SqliteItemStore::insert_item(const Item& candidate) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO items (feed_url, guid, link, title, author, content,
                           favourite, read_at, published_at, updated_at, created_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
    )SQL");
    if (stmt_result.is_err()) {
        return VoidResult::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = all_ok({
        stmt.bind_text(1, candidate.feed_url),
        stmt.bind_text(2, candidate.guid),
        stmt.bind_text(3, candidate.link),
        stmt.bind_text(4, candidate.title),
        stmt.bind_text(5, candidate.author),
        stmt.bind_text(6, candidate.content),
        stmt.bind_bool(7, candidate.favourite),
        stmt.bind_int64(8, candidate.read_at.millis()),
        stmt.bind_int64(9, candidate.published_at.millis()),
        stmt.bind_int64(10, candidate.updated_at.millis()),
        stmt.bind_int64(11, Timestamp::now().millis())
    });
    if (bound.is_err()) {
        return bound;
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return VoidResult::err(step_result.unwrap_err());
    }
    return VoidResult::ok();
}

VoidResult SqliteItemStore::update_fetched(ItemId id, const Item& candidate) {
    auto stmt_result = db_.prepare(R"SQL(
        UPDATE items SET
            title = ?, author = ?, content = ?, link = ?,
            published_at = ?, updated_at = ?
        WHERE id = ?;
    )SQL");
    if (stmt_result.is_err()) {
        return VoidResult::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = all_ok({
        stmt.bind_text(1, candidate.title),
        stmt.bind_text(2, candidate.author),
        stmt.bind_text(3, candidate.content),
        stmt.bind_text(4, candidate.link),
        stmt.bind_int64(5, candidate.published_at.millis()),
        stmt.bind_int64(6, candidate.updated_at.millis()),
        stmt.bind_int64(7, id)
    });
    if (bound.is_err()) {
        return bound;
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return VoidResult::err(step_result.unwrap_err());
    }
    return VoidResult::ok();
}

// ============================================================================
// Queries
// ============================================================================

Item SqliteItemStore::row_to_item(const Statement& stmt) {
    Item item;
    item.id = stmt.column_int64(0);
    item.author = stmt.column_text(1);
    item.title = stmt.column_text(2);
    item.favourite = stmt.column_bool(3);
    item.feed_url = stmt.column_text(4);
    item.link = stmt.column_text(5);
    item.guid = stmt.column_text(6);
    item.content = stmt.column_text(7);
    item.read_at = Timestamp(stmt.column_int64(8));
    item.published_at = Timestamp(stmt.column_int64(9));
    item.updated_at = Timestamp(stmt.column_int64(10));
    item.created_at = Timestamp(stmt.column_int64(11));
    return item;
}

Result<std::vector<Item>, Error> SqliteItemStore::get_all_items(Ordering ordering) {
    using Ret = Result<std::vector<Item>, Error>;

    std::string sql = std::string("SELECT ") + ITEM_COLUMNS + " FROM items ORDER BY ";
    sql += ordering == Ordering::Descending
        ? "published_at DESC, id DESC;"
        : "published_at ASC, id ASC;";

    std::vector<Item> items;
    auto result = db_.query(sql, [&](Statement& stmt) {
        items.push_back(row_to_item(stmt));
    });
    if (result.is_err()) {
        return Ret::err(result.unwrap_err());
    }
    return Ret::ok(std::move(items));
}

Result<Item, Error> SqliteItemStore::get_item_by_id(ItemId id) {
    auto stmt_result = db_.prepare(
        std::string("SELECT ") + ITEM_COLUMNS + " FROM items WHERE id = ?;");
    if (stmt_result.is_err()) {
        return Result<Item, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_int64(1, id);
    if (bound.is_err()) {
        return Result<Item, Error>::err(bound.unwrap_err());
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<Item, Error>::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return Result<Item, Error>::err(missing_item("get_item_by_id", id));
    }
    return Result<Item, Error>::ok(row_to_item(stmt));
}

Result<std::vector<std::string>, Error> SqliteItemStore::get_all_feed_urls() {
    using Ret = Result<std::vector<std::string>, Error>;

    std::vector<std::string> urls;
    auto result = db_.query(
        "SELECT feed_url FROM items GROUP BY feed_url ORDER BY MIN(id);",
        [&](Statement& stmt) { urls.push_back(stmt.column_text(0)); });
    if (result.is_err()) {
        return Ret::err(result.unwrap_err());
    }
    return Ret::ok(std::move(urls));
}

Result<int, Error> SqliteItemStore::count_unread() {
    int count = 0;
    auto result = db_.query(
        "SELECT COUNT(*) FROM items WHERE read_at = 0;",
        [&](Statement& stmt) { count = stmt.column_int(0); });
    if (result.is_err()) {
        return Result<int, Error>::err(result.unwrap_err());
    }
    return Result<int, Error>::ok(count);
}

// ============================================================================
// State changes
// ============================================================================

VoidResult SqliteItemStore::update_by_id(
    const char* operation,
    const std::string& sql,
    ItemId id,
    std::optional<Timestamp> now
) {
    auto stmt_result = db_.prepare(sql);
    if (stmt_result.is_err()) {
        return VoidResult::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = now
        ? all_ok({stmt.bind_int64(1, now->millis()), stmt.bind_int64(2, id)})
        : stmt.bind_int64(1, id);
    if (bound.is_err()) {
        return bound;
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return VoidResult::err(step_result.unwrap_err());
    }

    // SQLite counts every row the WHERE clause matched, changed or not.
    if (db_.changes() == 0) {
        return VoidResult::err(missing_item(operation, id));
    }
    return VoidResult::ok();
}

VoidResult SqliteItemStore::toggle_read(ItemId id) {
    return update_by_id("toggle_read",
        "UPDATE items SET read_at = CASE WHEN read_at = 0 THEN ? ELSE 0 END WHERE id = ?;",
        id, Timestamp::now());
}

VoidResult SqliteItemStore::mark_read(ItemId id) {
    return update_by_id("mark_read",
        "UPDATE items SET read_at = CASE WHEN read_at = 0 THEN ? ELSE read_at END WHERE id = ?;",
        id, Timestamp::now());
}

VoidResult SqliteItemStore::mark_unread(ItemId id) {
    return update_by_id("mark_unread",
        "UPDATE items SET read_at = 0 WHERE id = ?;", id);
}

VoidResult SqliteItemStore::toggle_favourite(ItemId id) {
    return update_by_id("toggle_favourite",
        "UPDATE items SET favourite = 1 - favourite WHERE id = ?;", id);
}

VoidResult SqliteItemStore::mark_all_read() {
    auto stmt_result = db_.prepare("UPDATE items SET read_at = ? WHERE read_at = 0;");
    if (stmt_result.is_err()) {
        return VoidResult::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_int64(1, Timestamp::now().millis());
    if (bound.is_err()) {
        return bound;
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return VoidResult::err(step_result.unwrap_err());
    }
    qCInfo(nomStoreLog) << "mark_all_read updated" << db_.changes() << "items";
    return VoidResult::ok();
}

VoidResult SqliteItemStore::delete_by_feed_url(const std::string& feed_url, bool include_favourites) {
    auto stmt_result = db_.prepare(include_favourites
        ? "DELETE FROM items WHERE feed_url = ?;"
        : "DELETE FROM items WHERE feed_url = ? AND favourite = 0;");
    if (stmt_result.is_err()) {
        return VoidResult::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_text(1, feed_url);
    if (bound.is_err()) {
        return bound;
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return VoidResult::err(step_result.unwrap_err());
    }
    qCInfo(nomStoreLog) << "deleted" << db_.changes() << "items of"
                        << QString::fromStdString(feed_url);
    return VoidResult::ok();
}

} // namespace nom::storage
