#include "app/cli/item_list.hpp"

#include <QDateTime>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStringList>

#include "storage/item_store.hpp"

namespace nom::app {

namespace {

const QString READ_ICON = QStringLiteral("✓");

[[nodiscard]] QString qs(const std::string& s) {
    return QString::fromStdString(s);
}

[[nodiscard]] QString render_date(Timestamp ts) {
    if (ts.is_zero()) return QStringLiteral("----------");
    return QDateTime::fromMSecsSinceEpoch(ts.millis()).toUTC().toString(QStringLiteral("yyyy-MM-dd"));
}

[[nodiscard]] QString render_iso(Timestamp ts) {
    if (ts.is_zero()) return QString{};
    return QDateTime::fromMSecsSinceEpoch(ts.millis()).toUTC().toString(Qt::ISODateWithMs);
}

[[nodiscard]] QString feed_label(const Item& item) {
    return item.feed_name.empty() ? qs(item.feed_url) : qs(item.feed_name);
}

[[nodiscard]] QString render_item_line(const Item& item, int indent, bool withFeed) {
    auto line = QString(indent, QLatin1Char(' '))
        + QStringLiteral("%1 %2 %3 %4 %5")
              .arg(static_cast<qlonglong>(item.id), 5)
              .arg(item.is_read() ? READ_ICON : QStringLiteral(" "))
              .arg(item.favourite ? QStringLiteral("*") : QStringLiteral(" "))
              .arg(render_date(item.published_at))
              .arg(qs(item.title));
    if (withFeed) {
        line += QStringLiteral(" [") + feed_label(item) + QStringLiteral("]");
    }
    return line;
}

[[nodiscard]] QJsonObject item_to_json(const Item& item) {
    QJsonObject obj;
    obj.insert(QStringLiteral("id"), static_cast<qint64>(item.id));
    obj.insert(QStringLiteral("guid"), qs(item.guid));
    obj.insert(QStringLiteral("feedUrl"), qs(item.feed_url));
    obj.insert(QStringLiteral("feedName"), qs(item.feed_name));
    obj.insert(QStringLiteral("title"), qs(item.title));
    obj.insert(QStringLiteral("author"), qs(item.author));
    obj.insert(QStringLiteral("link"), qs(item.link));
    obj.insert(QStringLiteral("content"), qs(item.content));
    obj.insert(QStringLiteral("favourite"), item.favourite);
    obj.insert(QStringLiteral("read"), item.is_read());
    obj.insert(QStringLiteral("readAt"), render_iso(item.read_at));
    obj.insert(QStringLiteral("publishedAt"), render_iso(item.published_at));
    obj.insert(QStringLiteral("updatedAt"), render_iso(item.updated_at));
    obj.insert(QStringLiteral("createdAt"), render_iso(item.created_at));
    return obj;
}

} // namespace

QString format_item_list(const std::vector<Item>& items, bool groupByFeed) {
    QStringList out;
    if (groupByFeed) {
        for (const auto& group : group_by_feed(items)) {
            out.append(group.items.empty() ? qs(group.feed_url) : feed_label(group.items.front()));
            for (const auto& item : group.items) {
                out.append(render_item_line(item, 2, false));
            }
        }
    } else {
        for (const auto& item : items) {
            out.append(render_item_line(item, 0, true));
        }
    }
    if (out.isEmpty()) return QString{};
    return out.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

QString format_item_list_json(const std::vector<Item>& items) {
    QJsonArray arr;
    for (const auto& item : items) {
        arr.append(item_to_json(item));
    }
    return QString::fromUtf8(QJsonDocument(arr).toJson(QJsonDocument::Indented));
}

QString format_item_detail(const Item& item) {
    QStringList out;
    out.append(qs(item.title));
    out.append(QStringLiteral("Feed: ") + feed_label(item));
    if (!item.author.empty()) out.append(QStringLiteral("Author: ") + qs(item.author));
    if (!item.link.empty()) out.append(QStringLiteral("Link: ") + qs(item.link));
    out.append(QStringLiteral("Published: ") + render_iso(item.published_at));
    out.append(QStringLiteral("Read: ") + (item.is_read() ? render_iso(item.read_at) : QStringLiteral("no")));
    out.append(QStringLiteral("Favourite: ") + (item.favourite ? QStringLiteral("yes") : QStringLiteral("no")));
    if (!item.content.empty()) {
        out.append(QString{});
        out.append(qs(item.content));
    }
    return out.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

Result<ItemId> parse_item_id(const QString& text) {
    bool ok = false;
    const auto id = text.trimmed().toLongLong(&ok);
    if (!ok || id <= 0) {
        return Result<ItemId>::err(Error::invalid_input("Invalid item id: " + text.toStdString()));
    }
    return Result<ItemId>::ok(id);
}

Result<QString> list_items(storage::ItemStore& store, const ItemListOptions& options) {
    auto all = store.get_all_items(options.ordering);
    if (all.is_err()) {
        return Result<QString>::err(all.unwrap_err());
    }

    auto visible = apply_feed_names(filter_items(all.unwrap(), options.filter), options.feedNames);
    if (options.json) {
        return Result<QString>::ok(format_item_list_json(visible));
    }
    return Result<QString>::ok(format_item_list(visible, options.groupByFeed));
}

Result<QString> show_item(storage::ItemStore& store, const QString& id, const FeedNames& names) {
    auto parsed = parse_item_id(id);
    if (parsed.is_err()) {
        return Result<QString>::err(parsed.unwrap_err());
    }

    auto item = store.get_item_by_id(parsed.unwrap());
    if (item.is_err()) {
        return Result<QString>::err(item.unwrap_err());
    }

    auto named = apply_feed_names({item.unwrap()}, names);
    return Result<QString>::ok(format_item_detail(named.front()));
}

Result<QString> list_feed_urls(storage::ItemStore& store, const FeedNames& names) {
    auto urls = store.get_all_feed_urls();
    if (urls.is_err()) {
        return Result<QString>::err(urls.unwrap_err());
    }

    QString out;
    for (const auto& url : urls.unwrap()) {
        out += qs(url);
        auto it = names.find(url);
        if (it != names.end()) {
            out += QStringLiteral(" (") + qs(it->second) + QStringLiteral(")");
        }
        out += QLatin1Char('\n');
    }
    return Result<QString>::ok(out);
}

Result<QString> count_unread(storage::ItemStore& store) {
    return store.count_unread().map([](int count) {
        return QString::number(count) + QLatin1Char('\n');
    });
}

} // namespace nom::app
