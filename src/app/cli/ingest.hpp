#pragma once

#include <QByteArray>
#include <QString>
#include <QStringList>
#include <vector>

#include "core/item.hpp"
#include "core/result.hpp"

namespace nom::storage {
class ItemStore;
}

namespace nom::app {

// Input: a JSON array of already-parsed feed entries
// [{ "guid", "feedUrl", "title", "author", "content", "link",
//    "publishedAt", "updatedAt" }]
// Timestamps are ISO 8601 and read as UTC when they carry no offset;
// missing or unparsable ones stay unset.
// A non-empty `only_feeds` drops entries of any other feed URL.
[[nodiscard]] Result<std::vector<Item>> parse_candidates(const QByteArray& json,
                                                         const QStringList& only_feeds = {});

// Upserts all candidates inside one batch; a failed upsert aborts the batch,
// which the durable store rolls back. Returns the number of candidates written.
[[nodiscard]] Result<int> ingest_candidates(storage::ItemStore& store, const std::vector<Item>& candidates);

[[nodiscard]] Result<int> ingest_file(storage::ItemStore& store,
                                      const QString& path,
                                      const QStringList& only_feeds = {});

} // namespace nom::app
