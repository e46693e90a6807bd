#pragma once

#include <QString>
#include <vector>

#include "app/config.hpp"
#include "core/item.hpp"
#include "core/item_views.hpp"
#include "core/ordering.hpp"
#include "core/result.hpp"

namespace nom::storage {
class ItemStore;
}

namespace nom::app {

struct ItemListOptions {
    Ordering ordering = DEFAULT_ORDERING;
    ItemFilter filter;
    bool groupByFeed = false;
    bool json = false;
    FeedNames feedNames;
};

// Text output, one line per item:
//   "   12 ✓ * 2024-03-01 Title [Feed]"
// Grouped output prints a header per feed and indents its items.
[[nodiscard]] QString format_item_list(const std::vector<Item>& items, bool groupByFeed);

// JSON output: [{ "id", "guid", "feedUrl", "feedName", "title", ... }]
[[nodiscard]] QString format_item_list_json(const std::vector<Item>& items);

[[nodiscard]] QString format_item_detail(const Item& item);

[[nodiscard]] Result<QString> list_items(storage::ItemStore& store, const ItemListOptions& options);
[[nodiscard]] Result<QString> show_item(storage::ItemStore& store, const QString& id, const FeedNames& names);
[[nodiscard]] Result<QString> list_feed_urls(storage::ItemStore& store, const FeedNames& names);
[[nodiscard]] Result<QString> count_unread(storage::ItemStore& store);

// Parses a positive decimal item id.
[[nodiscard]] Result<ItemId> parse_item_id(const QString& text);

} // namespace nom::app
