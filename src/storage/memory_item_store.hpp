#pragma once

#include "storage/item_store.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace nom::storage {

/**
 * MemoryItemStore - ItemStore kept entirely in process memory.
 *
 * Used for preview sessions. Items live in insertion order; two hash maps
 * index them by (feed_url, guid) and by id and are updated on every
 * mutation. Batches only enforce call sequencing since there is nothing
 * to recover.
 */
class MemoryItemStore final : public ItemStore {
public:
    MemoryItemStore() = default;

    [[nodiscard]] VoidResult upsert_item(const Item& candidate) override;

    [[nodiscard]] VoidResult begin_batch() override;
    [[nodiscard]] VoidResult end_batch() override;
    void abort_batch() override { batch_open_ = false; }
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

    [[nodiscard]] size_t size() const noexcept { return items_.size(); }

private:
    struct GuidKey {
        std::string feed_url;
        std::string guid;

        bool operator==(const GuidKey&) const = default;
    };

    struct GuidKeyHash {
        size_t operator()(const GuidKey& key) const noexcept;
    };

    // Pointer into items_ for `id`, or nullptr.
    [[nodiscard]] Item* find(ItemId id);

    // Rebuild position_ after items_ was compacted.
    void reindex_positions();

    std::vector<Item> items_;
    std::unordered_map<GuidKey, ItemId, GuidKeyHash> guid_index_;
    std::unordered_map<ItemId, size_t> position_;
    ItemId next_id_ = 1;
    bool batch_open_ = false;
};

} // namespace nom::storage
