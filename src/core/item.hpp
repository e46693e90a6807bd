#pragma once

#include "core/types.hpp"
#include <string>
#include <utility>

namespace nom {

/**
 * Item - One feed entry as tracked locally.
 *
 * The ingestion side fills guid, feed_url, title, author, content, link,
 * published_at and updated_at. The store assigns id and created_at.
 * feed_name is joined in by the presentation layer and never persisted.
 */
struct Item {
    ItemId id{0};
    std::string author;
    std::string title;
    bool favourite{false};
    std::string feed_url;
    std::string feed_name;
    std::string link;
    std::string guid;
    std::string content;
    Timestamp read_at;        // Zero means unread
    Timestamp published_at;
    Timestamp updated_at;
    Timestamp created_at;

    /**
     * Read state is derived from read_at; there is no separate flag.
     */
    [[nodiscard]] bool is_read() const noexcept { return !read_at.is_zero(); }

    /**
     * Whether this item takes part in (feed_url, guid) deduplication.
     */
    [[nodiscard]] bool has_guid() const noexcept { return !guid.empty(); }

    bool operator==(const Item&) const = default;
};

// ============================================================================
// Pure transformation functions
// ============================================================================

/**
 * Build a candidate item as the ingestion side would hand it to the store.
 */
[[nodiscard]] inline Item make_candidate(
    std::string feed_url,
    std::string guid,
    std::string title,
    Timestamp published_at = Timestamp{}
) {
    Item item;
    item.feed_url = std::move(feed_url);
    item.guid = std::move(guid);
    item.title = std::move(title);
    item.published_at = published_at;
    item.updated_at = published_at;
    return item;
}

/**
 * Refresh the feed-supplied fields of a stored item from a re-fetched
 * candidate. Identity, created_at, favourite and read state are kept.
 */
[[nodiscard]] inline Item merge_fetched(Item stored, const Item& candidate) {
    stored.title = candidate.title;
    stored.author = candidate.author;
    stored.content = candidate.content;
    stored.link = candidate.link;
    stored.published_at = candidate.published_at;
    stored.updated_at = candidate.updated_at;
    return stored;
}

/**
 * Stamp a candidate as a newly stored record.
 */
[[nodiscard]] inline Item as_inserted(Item candidate, ItemId id, Timestamp now) {
    candidate.id = id;
    candidate.created_at = now;
    candidate.feed_name.clear();
    return candidate;
}

[[nodiscard]] inline Item with_read_at(Item item, Timestamp read_at) {
    item.read_at = read_at;
    return item;
}

/**
 * Flip read state: unread becomes read at `now`, read becomes unread.
 */
[[nodiscard]] inline Item with_read_toggled(Item item, Timestamp now) {
    item.read_at = item.is_read() ? Timestamp{} : now;
    return item;
}

[[nodiscard]] inline Item with_favourite(Item item, bool favourite) {
    item.favourite = favourite;
    return item;
}

} // namespace nom
