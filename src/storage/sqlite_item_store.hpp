#pragma once

#include "storage/item_store.hpp"
#include "storage/database.hpp"
#include <memory>
#include <optional>
#include <string>

namespace nom::storage {

/**
 * SqliteItemStore - Durable ItemStore backed by one SQLite file.
 *
 * Deduplication goes through the unique (feed_url, guid) index, so the
 * lookup stays consistent with inserts, updates and deletes without any
 * in-process cache. Outside a batch every upsert commits on its own;
 * begin_batch() opens a single transaction that end_batch() commits. A
 * batch still open when the store is destroyed is rolled back.
 */
class SqliteItemStore final : public ItemStore {
public:
    /**
     * Open (creating and migrating if needed) the store at `path`.
     */
    [[nodiscard]] static Result<std::unique_ptr<SqliteItemStore>, Error> open(
        const std::string& path);

    /**
     * Open a private in-memory SQLite store, mainly for tests.
     */
    [[nodiscard]] static Result<std::unique_ptr<SqliteItemStore>, Error> open_memory();

    ~SqliteItemStore() override;

    [[nodiscard]] VoidResult upsert_item(const Item& candidate) override;

    [[nodiscard]] VoidResult begin_batch() override;
    [[nodiscard]] VoidResult end_batch() override;
    void abort_batch() override;
    [[nodiscard]] bool in_batch() const override { return batch_open_; }

    [[nodiscard]] Result<std::vector<Item>, Error> get_all_items(Ordering ordering) override;
    [[nodiscard]] Result<Item, Error> get_item_by_id(ItemId id) override;
    [[nodiscard]] Result<std::vector<std::string>, Error> get_all_feed_urls() override;

    [[nodiscard]] VoidResult toggle_read(ItemId id) override;
    [[nodiscard]] VoidResult mark_read(ItemId id) override;
    [[nodiscard]] VoidResult mark_unread(ItemId id) override;
    [[nodiscard]] VoidResult mark_all_read() override;
    [[nodiscard]] VoidResult toggle_favourite(ItemId id) override;

    [[nodiscard]] VoidResult delete_by_feed_url(
        const std::string& feed_url, bool include_favourites) override;

    [[nodiscard]] Result<int, Error> count_unread() override;

    [[nodiscard]] const std::string& path() const { return db_.path(); }

private:
    explicit SqliteItemStore(Database db) : db_(std::move(db)) {}

    [[nodiscard]] static Result<std::unique_ptr<SqliteItemStore>, Error> from_database(
        Result<Database, Error> opened);

    [[nodiscard]] Result<std::optional<ItemId>, Error> find_by_key(
        const std::string& feed_url, const std::string& guid);

    [[nodiscard]] VoidResult write_item(const Item& candidate);
    [[nodiscard]] VoidResult insert_item(const Item& candidate);
    [[nodiscard]] VoidResult update_fetched(ItemId id, const Item& candidate);

    /**
     * Run a single-row UPDATE keyed by id; NotFound when no row matched.
     * `now`, when given, is bound as the first parameter and id as the last.
     */
    [[nodiscard]] VoidResult update_by_id(
        const char* operation,
        const std::string& sql,
        ItemId id,
        std::optional<Timestamp> now = std::nullopt);

    [[nodiscard]] static Item row_to_item(const Statement& stmt);

    Database db_;
    bool batch_open_ = false;
};

} // namespace nom::storage
