#pragma once

#include "core/item.hpp"
#include <algorithm>
#include <iterator>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace nom {

/**
 * ItemFilter - Presentation-side view options over an ordered item list.
 */
struct ItemFilter {
    bool show_read = true;
    bool favourites_only = false;
    std::optional<std::string> feed_url;
};

/**
 * FeedGroup - Items sharing one feed URL, in listing order.
 */
struct FeedGroup {
    std::string feed_url;
    std::vector<Item> items;
};

/**
 * Whether an item is visible under `filter`. Favourites stay visible when
 * read items are hidden.
 */
[[nodiscard]] inline bool matches(const Item& item, const ItemFilter& filter) {
    if (filter.favourites_only && !item.favourite) return false;
    if (filter.feed_url && item.feed_url != *filter.feed_url) return false;
    if (!filter.show_read && item.is_read() && !item.favourite) return false;
    return true;
}

/**
 * Keep the items visible under `filter`, preserving their order.
 */
[[nodiscard]] inline std::vector<Item> filter_items(
    const std::vector<Item>& items,
    const ItemFilter& filter
) {
    std::vector<Item> out;
    std::copy_if(items.begin(), items.end(), std::back_inserter(out),
        [&](const Item& item) { return matches(item, filter); });
    return out;
}

/**
 * Group items by feed URL. Groups appear in first-seen order and keep the
 * input order of their items.
 */
[[nodiscard]] inline std::vector<FeedGroup> group_by_feed(const std::vector<Item>& items) {
    std::vector<FeedGroup> groups;
    std::unordered_map<std::string, size_t> index;

    for (const auto& item : items) {
        auto [it, inserted] = index.try_emplace(item.feed_url, groups.size());
        if (inserted) {
            groups.push_back(FeedGroup{item.feed_url, {}});
        }
        groups[it->second].items.push_back(item);
    }
    return groups;
}

/**
 * Join configured display names onto items by feed URL.
 */
[[nodiscard]] inline std::vector<Item> apply_feed_names(
    std::vector<Item> items,
    const std::unordered_map<std::string, std::string>& names
) {
    for (auto& item : items) {
        auto it = names.find(item.feed_url);
        if (it != names.end()) {
            item.feed_name = it->second;
        }
    }
    return items;
}

} // namespace nom
