#include "app/cli/mutations.hpp"

#include "app/cli/item_list.hpp"
#include "storage/item_store.hpp"

namespace nom::app {

Result<void> apply_item_action(storage::ItemStore& store, const ItemActionOptions& options) {
    auto id = parse_item_id(options.itemId);
    if (id.is_err()) {
        return Result<void>::err(id.unwrap_err());
    }

    switch (options.action) {
        case ItemAction::MarkRead: return store.mark_read(id.unwrap());
        case ItemAction::MarkUnread: return store.mark_unread(id.unwrap());
        case ItemAction::ToggleRead: return store.toggle_read(id.unwrap());
        case ItemAction::ToggleFavourite: return store.toggle_favourite(id.unwrap());
    }
    return Result<void>::err(Error::invalid_input("Unknown item action"));
}

Result<void> mark_all_read(storage::ItemStore& store) {
    return store.mark_all_read();
}

Result<void> delete_feed(storage::ItemStore& store, const DeleteFeedOptions& options) {
    const auto url = options.feedUrl.trimmed();
    if (url.isEmpty()) {
        return Result<void>::err(Error::invalid_input("Feed URL is required"));
    }
    return store.delete_by_feed_url(url.toStdString(), options.includeFavourites);
}

} // namespace nom::app
