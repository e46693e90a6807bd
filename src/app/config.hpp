#pragma once

#include "core/ordering.hpp"
#include "core/result.hpp"
#include "storage/store_factory.hpp"

#include <QString>
#include <QStringList>
#include <string>
#include <unordered_map>

namespace nom::app {

using FeedNames = std::unordered_map<std::string, std::string>;

/**
 * AppConfig - Session settings resolved at startup.
 */
struct AppConfig {
    storage::StoreOptions store;
    Ordering ordering = DEFAULT_ORDERING;
    FeedNames feed_names;
    QStringList preview_feeds;
    bool verbose = false;
};

// Database file: explicit override, else NOM_DB_PATH, else
// <AppConfigLocation>/nom.db. The parent directory is created on demand.
[[nodiscard]] QString resolve_database_path(const QString& override_path = {});

// Ordering token: explicit value, else NOM_ORDERING, else ascending.
[[nodiscard]] Ordering resolve_ordering(const QString& override_token = {});

// Parses repeated "url=Name" entries. The last '=' separates URL and name.
[[nodiscard]] Result<FeedNames, Error> parse_feed_names(const QStringList& entries);

// Preview sessions (any --feed given) run on the in-memory store.
[[nodiscard]] Result<AppConfig, Error> build_config(const QString& db_path,
                                                    const QString& ordering,
                                                    const QStringList& name_entries,
                                                    const QStringList& preview_feeds,
                                                    bool verbose);

} // namespace nom::app
