#pragma once

#include "storage/item_store.hpp"
#include <memory>
#include <string>

namespace nom::storage {

/**
 * StoreOptions - What the session boundary decided about persistence.
 */
struct StoreOptions {
    std::string path;      // SQLite file; ignored in preview
    bool preview = false;  // Preview sessions never touch disk
};

/**
 * Construct the backend for a session: MemoryItemStore when previewing,
 * otherwise a SqliteItemStore at `options.path`.
 */
[[nodiscard]] Result<std::unique_ptr<ItemStore>, Error> open_store(const StoreOptions& options);

} // namespace nom::storage
