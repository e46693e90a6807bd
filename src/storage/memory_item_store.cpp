#include "storage/memory_item_store.hpp"
#include "storage/store_log.hpp"

#include <QString>
#include <algorithm>
#include <functional>

namespace nom::storage {

namespace {

Error missing_item(const char* operation, ItemId id) {
    return Error::not_found(std::string(operation) + ": no item with id " + std::to_string(id));
}

} // namespace

size_t MemoryItemStore::GuidKeyHash::operator()(const GuidKey& key) const noexcept {
    size_t h = std::hash<std::string>{}(key.feed_url);
    h ^= std::hash<std::string>{}(key.guid) + 0x9e3779b9 + (h << 6) + (h >> 2);
    return h;
}

Item* MemoryItemStore::find(ItemId id) {
    auto it = position_.find(id);
    if (it == position_.end()) {
        return nullptr;
    }
    return &items_[it->second];
}

void MemoryItemStore::reindex_positions() {
    position_.clear();
    position_.reserve(items_.size());
    for (size_t i = 0; i < items_.size(); ++i) {
        position_.emplace(items_[i].id, i);
    }
}

VoidResult MemoryItemStore::upsert_item(const Item& candidate) {
    if (candidate.has_guid()) {
        auto it = guid_index_.find(GuidKey{candidate.feed_url, candidate.guid});
        if (it != guid_index_.end()) {
            Item* stored = find(it->second);
            if (stored) {
                *stored = merge_fetched(std::move(*stored), candidate);
                return VoidResult::ok();
            }
            // Unreachable while index and collection agree.
            qCWarning(nomStoreLog) << "stale guid index entry for id" << it->second;
            guid_index_.erase(it);
        }
    }

    const ItemId id = next_id_++;
    items_.push_back(as_inserted(candidate, id, Timestamp::now()));
    position_.emplace(id, items_.size() - 1);
    if (candidate.has_guid()) {
        guid_index_.emplace(GuidKey{candidate.feed_url, candidate.guid}, id);
    }
    return VoidResult::ok();
}

VoidResult MemoryItemStore::begin_batch() {
    if (batch_open_) {
        return VoidResult::err(Error::invalid_state("begin_batch: a batch is already open"));
    }
    batch_open_ = true;
    return VoidResult::ok();
}

VoidResult MemoryItemStore::end_batch() {
    if (!batch_open_) {
        return VoidResult::err(Error::invalid_state("end_batch: no batch is open"));
    }
    batch_open_ = false;
    return VoidResult::ok();
}

Result<std::vector<Item>, Error> MemoryItemStore::get_all_items(Ordering ordering) {
    std::vector<Item> items = items_;
    sort_items(items, ordering);
    return Result<std::vector<Item>, Error>::ok(std::move(items));
}

Result<Item, Error> MemoryItemStore::get_item_by_id(ItemId id) {
    const Item* item = find(id);
    if (!item) {
        return Result<Item, Error>::err(missing_item("get_item_by_id", id));
    }
    return Result<Item, Error>::ok(*item);
}

Result<std::vector<std::string>, Error> MemoryItemStore::get_all_feed_urls() {
    std::vector<std::string> urls;
    for (const auto& item : items_) {
        if (std::find(urls.begin(), urls.end(), item.feed_url) == urls.end()) {
            urls.push_back(item.feed_url);
        }
    }
    return Result<std::vector<std::string>, Error>::ok(std::move(urls));
}

VoidResult MemoryItemStore::toggle_read(ItemId id) {
    Item* item = find(id);
    if (!item) {
        return VoidResult::err(missing_item("toggle_read", id));
    }
    *item = with_read_toggled(std::move(*item), Timestamp::now());
    return VoidResult::ok();
}

VoidResult MemoryItemStore::mark_read(ItemId id) {
    Item* item = find(id);
    if (!item) {
        return VoidResult::err(missing_item("mark_read", id));
    }
    if (!item->is_read()) {
        *item = with_read_at(std::move(*item), Timestamp::now());
    }
    return VoidResult::ok();
}

VoidResult MemoryItemStore::mark_unread(ItemId id) {
    Item* item = find(id);
    if (!item) {
        return VoidResult::err(missing_item("mark_unread", id));
    }
    *item = with_read_at(std::move(*item), Timestamp{});
    return VoidResult::ok();
}

VoidResult MemoryItemStore::mark_all_read() {
    const auto now = Timestamp::now();
    for (auto& item : items_) {
        if (!item.is_read()) {
            item.read_at = now;
        }
    }
    return VoidResult::ok();
}

VoidResult MemoryItemStore::toggle_favourite(ItemId id) {
    Item* item = find(id);
    if (!item) {
        return VoidResult::err(missing_item("toggle_favourite", id));
    }
    const bool favourite = !item->favourite;
    *item = with_favourite(std::move(*item), favourite);
    return VoidResult::ok();
}

VoidResult MemoryItemStore::delete_by_feed_url(const std::string& feed_url, bool include_favourites) {
    auto doomed = [&](const Item& item) {
        return item.feed_url == feed_url && (include_favourites || !item.favourite);
    };

    for (const auto& item : items_) {
        if (doomed(item) && item.has_guid()) {
            guid_index_.erase(GuidKey{item.feed_url, item.guid});
        }
    }

    auto first = std::remove_if(items_.begin(), items_.end(), doomed);
    const auto removed = static_cast<size_t>(std::distance(first, items_.end()));
    items_.erase(first, items_.end());
    if (removed > 0) {
        reindex_positions();
    }

    qCInfo(nomStoreLog) << "deleted" << removed << "items of" << QString::fromStdString(feed_url);
    return VoidResult::ok();
}

Result<int, Error> MemoryItemStore::count_unread() {
    auto count = std::count_if(items_.begin(), items_.end(),
        [](const Item& item) { return !item.is_read(); });
    return Result<int, Error>::ok(static_cast<int>(count));
}

} // namespace nom::storage
