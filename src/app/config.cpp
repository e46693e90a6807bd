#include "app/config.hpp"

#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>

namespace nom::app {

namespace {

constexpr auto DEFAULT_DATABASE_NAME = "nom.db";

QString ensure_parent_dir(const QString& path) {
    QFileInfo info(path);
    QDir dir(info.absolutePath());
    if (!dir.exists()) {
        dir.mkpath(QStringLiteral("."));
    }
    return info.absoluteFilePath();
}

} // namespace

QString resolve_database_path(const QString& override_path) {
    if (!override_path.isEmpty()) {
        return ensure_parent_dir(override_path);
    }

    const auto env_path = qEnvironmentVariable("NOM_DB_PATH");
    if (!env_path.isEmpty()) {
        return ensure_parent_dir(env_path);
    }

    const auto config_dir = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    return ensure_parent_dir(QDir(config_dir).filePath(QString::fromLatin1(DEFAULT_DATABASE_NAME)));
}

Ordering resolve_ordering(const QString& override_token) {
    auto token = override_token;
    if (token.isEmpty()) {
        token = qEnvironmentVariable("NOM_ORDERING");
    }
    return parse_ordering(token.trimmed().toStdString());
}

Result<FeedNames, Error> parse_feed_names(const QStringList& entries) {
    FeedNames names;
    for (const auto& entry : entries) {
        const auto split = entry.lastIndexOf(QLatin1Char('='));
        if (split <= 0 || split == entry.size() - 1) {
            return Result<FeedNames, Error>::err(Error::invalid_input(
                "Feed name must look like url=Name, got: " + entry.toStdString()));
        }
        names[entry.left(split).trimmed().toStdString()] = entry.mid(split + 1).trimmed().toStdString();
    }
    return Result<FeedNames, Error>::ok(std::move(names));
}

Result<AppConfig, Error> build_config(const QString& db_path,
                                      const QString& ordering,
                                      const QStringList& name_entries,
                                      const QStringList& preview_feeds,
                                      bool verbose) {
    auto names = parse_feed_names(name_entries);
    if (names.is_err()) {
        return Result<AppConfig, Error>::err(names.unwrap_err());
    }

    AppConfig config;
    config.preview_feeds = preview_feeds;
    config.store.preview = !preview_feeds.isEmpty();
    if (!config.store.preview) {
        config.store.path = resolve_database_path(db_path).toStdString();
    }
    config.ordering = resolve_ordering(ordering);
    config.feed_names = std::move(names).unwrap();
    config.verbose = verbose;
    return Result<AppConfig, Error>::ok(std::move(config));
}

} // namespace nom::app
