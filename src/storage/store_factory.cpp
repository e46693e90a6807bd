#include "storage/store_factory.hpp"
#include "storage/memory_item_store.hpp"
#include "storage/sqlite_item_store.hpp"
#include "storage/store_log.hpp"

namespace nom::storage {

Result<std::unique_ptr<ItemStore>, Error> open_store(const StoreOptions& options) {
    using Ret = Result<std::unique_ptr<ItemStore>, Error>;

    if (options.preview) {
        qCInfo(nomStoreLog) << "preview session, using in-memory store";
        return Ret::ok(std::make_unique<MemoryItemStore>());
    }

    if (options.path.empty()) {
        return Ret::err(Error::persistence("No database path configured"));
    }

    auto opened = SqliteItemStore::open(options.path);
    if (opened.is_err()) {
        return Ret::err(opened.unwrap_err());
    }
    return Ret::ok(std::move(opened).unwrap());
}

} // namespace nom::storage
