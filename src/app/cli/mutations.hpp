#pragma once

#include <QString>

#include "core/result.hpp"

namespace nom::storage {
class ItemStore;
}

namespace nom::app {

enum class ItemAction {
    MarkRead,
    MarkUnread,
    ToggleRead,
    ToggleFavourite
};

struct ItemActionOptions {
    QString itemId;
    ItemAction action = ItemAction::ToggleRead;
};

struct DeleteFeedOptions {
    QString feedUrl;
    bool includeFavourites = false;
};

[[nodiscard]] Result<void> apply_item_action(storage::ItemStore& store, const ItemActionOptions& options);
[[nodiscard]] Result<void> mark_all_read(storage::ItemStore& store);
[[nodiscard]] Result<void> delete_feed(storage::ItemStore& store, const DeleteFeedOptions& options);

} // namespace nom::app
