#pragma once

#include "core/item.hpp"
#include "core/ordering.hpp"
#include "core/result.hpp"
#include <string>
#include <vector>

namespace nom::storage {

/**
 * ItemStore - Backend-agnostic access to the item collection.
 *
 * Items are deduplicated on (feed_url, guid). Re-upserting a known key
 * refreshes the feed-supplied fields and keeps id, created_at, favourite
 * and read state. Items without a GUID are always inserted as new.
 *
 * Failures are ErrorKind::Persistence (medium unavailable),
 * ErrorKind::NotFound (unknown id) or ErrorKind::InvalidState (batch
 * misuse). Operations that fail leave the collection unchanged.
 *
 * Instances are single-session: one writer, no internal locking.
 */
class ItemStore {
public:
    virtual ~ItemStore() = default;

    ItemStore(const ItemStore&) = delete;
    ItemStore& operator=(const ItemStore&) = delete;

    /**
     * Insert a candidate or merge it into the stored item with the same key.
     * id and created_at of the candidate are ignored.
     */
    [[nodiscard]] virtual VoidResult upsert_item(const Item& candidate) = 0;

    /**
     * Open a batch. Upserts until end_batch() become visible atomically.
     * Fails with InvalidState if a batch is already open.
     */
    [[nodiscard]] virtual VoidResult begin_batch() = 0;

    /**
     * Commit the open batch. Fails with InvalidState if none is open.
     */
    [[nodiscard]] virtual VoidResult end_batch() = 0;

    /**
     * Discard the open batch where the backend can; no-op without one.
     */
    virtual void abort_batch() = 0;

    [[nodiscard]] virtual bool in_batch() const = 0;

    [[nodiscard]] virtual Result<std::vector<Item>, Error> get_all_items(
        Ordering ordering = DEFAULT_ORDERING) = 0;

    [[nodiscard]] virtual Result<Item, Error> get_item_by_id(ItemId id) = 0;

    /**
     * Distinct feed URLs in first-seen order.
     */
    [[nodiscard]] virtual Result<std::vector<std::string>, Error> get_all_feed_urls() = 0;

    [[nodiscard]] virtual VoidResult toggle_read(ItemId id) = 0;
    [[nodiscard]] virtual VoidResult mark_read(ItemId id) = 0;
    [[nodiscard]] virtual VoidResult mark_unread(ItemId id) = 0;

    /**
     * Mark every unread item read now. Items already read keep their read_at.
     */
    [[nodiscard]] virtual VoidResult mark_all_read() = 0;

    [[nodiscard]] virtual VoidResult toggle_favourite(ItemId id) = 0;

    /**
     * Remove the items of one feed. Favourites survive unless
     * `include_favourites` is set. Matching nothing is not an error.
     */
    [[nodiscard]] virtual VoidResult delete_by_feed_url(
        const std::string& feed_url, bool include_favourites) = 0;

    [[nodiscard]] virtual Result<int, Error> count_unread() = 0;

protected:
    ItemStore() = default;
};

/**
 * BatchScope - RAII wrapper around begin_batch()/end_batch().
 *
 * A scope destroyed without commit() aborts the batch.
 */
class BatchScope {
public:
    explicit BatchScope(ItemStore& store)
        : store_(store), begin_status_(store.begin_batch()) {}

    ~BatchScope() {
        if (begin_status_.is_ok() && !committed_) {
            store_.abort_batch();
        }
    }

    BatchScope(const BatchScope&) = delete;
    BatchScope& operator=(const BatchScope&) = delete;

    [[nodiscard]] const VoidResult& status() const { return begin_status_; }

    [[nodiscard]] VoidResult commit() {
        if (begin_status_.is_err()) {
            return begin_status_;
        }
        if (committed_) {
            return VoidResult::err(Error::invalid_state("Batch already committed"));
        }
        auto result = store_.end_batch();
        if (result.is_ok()) {
            committed_ = true;
        }
        return result;
    }

private:
    ItemStore& store_;
    VoidResult begin_status_;
    bool committed_ = false;
};

} // namespace nom::storage
