#include "app/cli/ingest.hpp"

#include <QDateTime>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTimeZone>

#include "app/logging.hpp"
#include "storage/item_store.hpp"

namespace nom::app {

namespace {

[[nodiscard]] std::string text_field(const QJsonObject& obj, const char* key) {
    return obj.value(QLatin1String(key)).toString().toStdString();
}

[[nodiscard]] Timestamp time_field(const QJsonObject& obj, const char* key) {
    const auto raw = obj.value(QLatin1String(key)).toString();
    if (raw.isEmpty()) return Timestamp{};

    auto parsed = QDateTime::fromString(raw, Qt::ISODateWithMs);
    if (!parsed.isValid()) {
        qCWarning(nomCliLog) << "ignoring unparsable" << key << "value" << raw;
        return Timestamp{};
    }
    if (parsed.timeSpec() == Qt::LocalTime) {
        parsed = QDateTime(parsed.date(), parsed.time(), QTimeZone::utc());
    }
    return Timestamp(parsed.toMSecsSinceEpoch());
}

} // namespace

Result<std::vector<Item>> parse_candidates(const QByteArray& json, const QStringList& only_feeds) {
    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(json, &err);
    if (err.error != QJsonParseError::NoError) {
        return Result<std::vector<Item>>::err(
            Error::invalid_input("Ingest input is not valid JSON: " + err.errorString().toStdString()));
    }
    if (!doc.isArray()) {
        return Result<std::vector<Item>>::err(
            Error::invalid_input("Ingest input must be a JSON array of items"));
    }

    std::vector<Item> candidates;
    const auto arr = doc.array();
    candidates.reserve(static_cast<size_t>(arr.size()));
    for (qsizetype i = 0; i < arr.size(); ++i) {
        if (!arr.at(i).isObject()) {
            return Result<std::vector<Item>>::err(
                Error::invalid_input("Ingest entry " + std::to_string(i) + " is not an object"));
        }
        const auto obj = arr.at(i).toObject();
        const auto feed_url = obj.value(QLatin1String("feedUrl")).toString();
        if (!only_feeds.isEmpty() && !only_feeds.contains(feed_url)) {
            continue;
        }

        Item item;
        item.guid = text_field(obj, "guid");
        item.feed_url = feed_url.toStdString();
        item.title = text_field(obj, "title");
        item.author = text_field(obj, "author");
        item.content = text_field(obj, "content");
        item.link = text_field(obj, "link");
        item.published_at = time_field(obj, "publishedAt");
        item.updated_at = time_field(obj, "updatedAt");
        candidates.push_back(std::move(item));
    }
    return Result<std::vector<Item>>::ok(std::move(candidates));
}

Result<int> ingest_candidates(storage::ItemStore& store, const std::vector<Item>& candidates) {
    storage::BatchScope batch(store);
    if (batch.status().is_err()) {
        return Result<int>::err(batch.status().unwrap_err());
    }

    int written = 0;
    for (const auto& candidate : candidates) {
        auto result = store.upsert_item(candidate);
        if (result.is_err()) {
            qCWarning(nomCliLog) << "ingest aborted at entry" << written
                                 << QString::fromStdString(result.unwrap_err().message);
            return Result<int>::err(result.unwrap_err());
        }
        ++written;
    }

    auto committed = batch.commit();
    if (committed.is_err()) {
        return Result<int>::err(committed.unwrap_err());
    }
    return Result<int>::ok(written);
}

Result<int> ingest_file(storage::ItemStore& store, const QString& path, const QStringList& only_feeds) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return Result<int>::err(Error::invalid_input(
            "Cannot read " + path.toStdString() + ": " + file.errorString().toStdString()));
    }

    auto candidates = parse_candidates(file.readAll(), only_feeds);
    if (candidates.is_err()) {
        return Result<int>::err(candidates.unwrap_err());
    }
    qCInfo(nomCliLog) << "read" << candidates.unwrap().size() << "candidate(s) from" << path;
    return ingest_candidates(store, candidates.unwrap());
}

} // namespace nom::app
