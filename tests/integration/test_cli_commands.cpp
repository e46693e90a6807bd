#include <catch2/catch_test_macros.hpp>

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>

#include "app/cli/ingest.hpp"
#include "app/cli/item_list.hpp"
#include "app/cli/mutations.hpp"
#include "app/config.hpp"
#include "storage/memory_item_store.hpp"
#include "storage/sqlite_item_store.hpp"

using namespace nom;

namespace {

const QByteArray SAMPLE_FEED = R"JSON([
    {
        "guid": "post-1",
        "feedUrl": "https://a.example/feed",
        "title": "First post",
        "author": "Ann",
        "link": "https://a.example/1",
        "content": "<p>hello</p>",
        "publishedAt": "2024-03-01T08:00:00Z",
        "updatedAt": "2024-03-01T09:30:00.250Z"
    },
    {
        "guid": "post-2",
        "feedUrl": "https://a.example/feed",
        "title": "Second post",
        "publishedAt": "2024-03-02T08:00:00Z"
    },
    {
        "guid": "x-1",
        "feedUrl": "https://b.example/atom",
        "title": "Other feed",
        "publishedAt": "2024-02-28T08:00:00Z"
    }
])JSON";

Timestamp utc(const char* iso) {
    return Timestamp(QDateTime::fromString(QString::fromLatin1(iso), Qt::ISODateWithMs).toMSecsSinceEpoch());
}

void seed(storage::ItemStore& store) {
    auto candidates = app::parse_candidates(SAMPLE_FEED);
    REQUIRE(candidates.is_ok());
    REQUIRE(app::ingest_candidates(store, candidates.unwrap()).unwrap() == 3);
}

} // namespace

// ============================================================================
// Ingest
// ============================================================================

TEST_CASE("CLI: parse_candidates reads feed entries", "[cli][ingest]") {
    auto parsed = app::parse_candidates(SAMPLE_FEED);
    REQUIRE(parsed.is_ok());

    const auto& items = parsed.unwrap();
    REQUIRE(items.size() == 3);
    REQUIRE(items[0].guid == "post-1");
    REQUIRE(items[0].feed_url == "https://a.example/feed");
    REQUIRE(items[0].author == "Ann");
    REQUIRE(items[0].content == "<p>hello</p>");
    REQUIRE(items[0].published_at == utc("2024-03-01T08:00:00Z"));
    REQUIRE(items[0].updated_at.millis() == utc("2024-03-01T09:30:00Z").millis() + 250);
    REQUIRE(items[1].author.empty());
    REQUIRE(items[1].updated_at.is_zero());
    REQUIRE(items[0].id == 0);
}

TEST_CASE("CLI: parse_candidates rejects malformed input", "[cli][ingest]") {
    REQUIRE(app::parse_candidates("not json").unwrap_err().kind == ErrorKind::InvalidInput);
    REQUIRE(app::parse_candidates(R"({"guid": "x"})").unwrap_err().kind == ErrorKind::InvalidInput);
    REQUIRE(app::parse_candidates(R"([{"guid": "x"}, 7])").unwrap_err().kind == ErrorKind::InvalidInput);
    REQUIRE(app::parse_candidates("[]").unwrap().empty());
}

TEST_CASE("CLI: unparsable timestamps stay unset", "[cli][ingest]") {
    auto parsed = app::parse_candidates(R"([{"guid": "g", "publishedAt": "yesterday"}])");
    REQUIRE(parsed.is_ok());
    REQUIRE(parsed.unwrap()[0].published_at.is_zero());
}

TEST_CASE("CLI: timestamps without an offset are read as UTC", "[cli][ingest]") {
    auto parsed = app::parse_candidates(R"([
        {"guid": "plain", "publishedAt": "2024-03-01T10:00:00"},
        {"guid": "zulu", "publishedAt": "2024-03-01T10:00:00Z"},
        {"guid": "offset", "publishedAt": "2024-03-01T12:00:00+02:00"}
    ])");
    REQUIRE(parsed.is_ok());

    const auto& items = parsed.unwrap();
    REQUIRE(items.size() == 3);
    for (const auto& item : items) {
        REQUIRE(item.published_at == Timestamp(1709287200000));
    }
}

TEST_CASE("CLI: ingest can be limited to some feeds", "[cli][ingest]") {
    const QStringList only{QStringLiteral("https://b.example/atom")};

    auto parsed = app::parse_candidates(SAMPLE_FEED, only);
    REQUIRE(parsed.is_ok());
    REQUIRE(parsed.unwrap().size() == 1);
    REQUIRE(parsed.unwrap()[0].guid == "x-1");

    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto path = QDir(dir.path()).filePath(QStringLiteral("items.json"));
    QFile file(path);
    REQUIRE(file.open(QIODevice::WriteOnly));
    REQUIRE(file.write(SAMPLE_FEED) == SAMPLE_FEED.size());
    file.close();

    storage::MemoryItemStore store;
    REQUIRE(app::ingest_file(store, path, only).unwrap() == 1);
    REQUIRE(store.get_all_feed_urls().unwrap() == std::vector<std::string>{"https://b.example/atom"});

    SECTION("An empty list keeps every feed") {
        REQUIRE(app::parse_candidates(SAMPLE_FEED, {}).unwrap().size() == 3);
    }
}

TEST_CASE("CLI: ingesting twice does not duplicate items", "[cli][ingest]") {
    storage::MemoryItemStore store;
    seed(store);
    seed(store);

    REQUIRE(store.size() == 3);
    REQUIRE_FALSE(store.in_batch());
}

TEST_CASE("CLI: ingest_file reads a JSON file", "[cli][ingest]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto path = QDir(dir.path()).filePath(QStringLiteral("items.json"));

    QFile file(path);
    REQUIRE(file.open(QIODevice::WriteOnly));
    REQUIRE(file.write(SAMPLE_FEED) == SAMPLE_FEED.size());
    file.close();

    auto store = storage::SqliteItemStore::open_memory().unwrap();
    REQUIRE(app::ingest_file(*store, path).unwrap() == 3);
    REQUIRE(store->count_unread().unwrap() == 3);

    auto missing = app::ingest_file(*store, QDir(dir.path()).filePath(QStringLiteral("absent.json")));
    REQUIRE(missing.is_err());
    REQUIRE(missing.unwrap_err().kind == ErrorKind::InvalidInput);
}

TEST_CASE("CLI: ingest refuses to run inside an open batch", "[cli][ingest]") {
    storage::MemoryItemStore store;
    REQUIRE(store.begin_batch().is_ok());

    auto result = app::ingest_candidates(store, {make_candidate("u", "g", "t")});
    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().is_invalid_state());
    REQUIRE(store.size() == 0);
    REQUIRE(store.end_batch().is_ok());
}

// ============================================================================
// Listing
// ============================================================================

TEST_CASE("CLI: item lines show id, state, date, title and feed", "[cli][list]") {
    auto item = as_inserted(make_candidate("https://a.example/feed", "g", "Title", utc("2024-03-01T08:00:00Z")),
                            12, Timestamp(1));
    item.read_at = Timestamp(5);
    item.favourite = true;
    item.feed_name = "Feed";

    REQUIRE(app::format_item_list({item}, false) == QStringLiteral("   12 ✓ * 2024-03-01 Title [Feed]\n"));

    item.read_at = Timestamp{};
    item.favourite = false;
    item.feed_name.clear();
    REQUIRE(app::format_item_list({item}, false)
            == QStringLiteral("   12     2024-03-01 Title [https://a.example/feed]\n"));
}

TEST_CASE("CLI: grouped listing prints one header per feed", "[cli][list]") {
    storage::MemoryItemStore store;
    seed(store);

    app::ItemListOptions options;
    options.groupByFeed = true;
    options.feedNames = {{"https://b.example/atom", "Bee"}};

    const auto output = app::list_items(store, options).unwrap();
    const auto lines = output.split(QLatin1Char('\n'), Qt::SkipEmptyParts);

    REQUIRE(lines.size() == 5);
    REQUIRE(lines[0] == QStringLiteral("Bee"));
    REQUIRE(lines[1].contains(QStringLiteral("Other feed")));
    REQUIRE(lines[2] == QStringLiteral("https://a.example/feed"));
    REQUIRE(lines[3].startsWith(QStringLiteral("      1 ")));
    REQUIRE(lines[4].contains(QStringLiteral("Second post")));
}

TEST_CASE("CLI: JSON listing follows the ordering and filter", "[cli][list]") {
    storage::MemoryItemStore store;
    seed(store);
    REQUIRE(store.mark_read(2).is_ok());

    app::ItemListOptions options;
    options.ordering = Ordering::Descending;
    options.filter.show_read = false;
    options.json = true;
    options.feedNames = {{"https://a.example/feed", "Ay"}};

    const auto doc = QJsonDocument::fromJson(app::list_items(store, options).unwrap().toUtf8());
    REQUIRE(doc.isArray());

    const auto arr = doc.array();
    REQUIRE(arr.size() == 2);
    REQUIRE(arr.at(0).toObject().value(QStringLiteral("id")).toInteger() == 1);
    REQUIRE(arr.at(0).toObject().value(QStringLiteral("feedName")).toString() == QStringLiteral("Ay"));
    REQUIRE(arr.at(0).toObject().value(QStringLiteral("read")).toBool() == false);
    REQUIRE(arr.at(0).toObject().value(QStringLiteral("publishedAt")).toString()
            == QStringLiteral("2024-03-01T08:00:00.000Z"));
    REQUIRE(arr.at(1).toObject().value(QStringLiteral("id")).toInteger() == 3);
}

TEST_CASE("CLI: show prints one item or reports NotFound", "[cli][show]") {
    storage::MemoryItemStore store;
    seed(store);

    const auto shown = app::show_item(store, QStringLiteral("1"), {});
    REQUIRE(shown.is_ok());
    REQUIRE(shown.unwrap().startsWith(QStringLiteral("First post\n")));
    REQUIRE(shown.unwrap().contains(QStringLiteral("Author: Ann")));
    REQUIRE(shown.unwrap().contains(QStringLiteral("<p>hello</p>")));

    REQUIRE(app::show_item(store, QStringLiteral("99"), {}).unwrap_err().is_not_found());
    REQUIRE(app::show_item(store, QStringLiteral("abc"), {}).unwrap_err().kind == ErrorKind::InvalidInput);
}

TEST_CASE("CLI: feeds and unread count", "[cli][list]") {
    storage::MemoryItemStore store;
    seed(store);

    const auto feeds = app::list_feed_urls(store, {{"https://a.example/feed", "Ay"}});
    REQUIRE(feeds.unwrap() == QStringLiteral("https://a.example/feed (Ay)\nhttps://b.example/atom\n"));

    REQUIRE(app::count_unread(store).unwrap() == QStringLiteral("3\n"));
}

TEST_CASE("CLI: parse_item_id accepts positive integers only", "[cli]") {
    REQUIRE(app::parse_item_id(QStringLiteral(" 42 ")).unwrap() == 42);
    REQUIRE(app::parse_item_id(QStringLiteral("0")).is_err());
    REQUIRE(app::parse_item_id(QStringLiteral("-3")).is_err());
    REQUIRE(app::parse_item_id(QStringLiteral("4x")).is_err());
}

// ============================================================================
// Mutations
// ============================================================================

TEST_CASE("CLI: item actions change read and favourite state", "[cli][mutations]") {
    storage::MemoryItemStore store;
    seed(store);

    using app::ItemAction;
    REQUIRE(app::apply_item_action(store, {QStringLiteral("1"), ItemAction::MarkRead}).is_ok());
    REQUIRE(app::apply_item_action(store, {QStringLiteral("2"), ItemAction::ToggleRead}).is_ok());
    REQUIRE(app::apply_item_action(store, {QStringLiteral("2"), ItemAction::MarkUnread}).is_ok());
    REQUIRE(app::apply_item_action(store, {QStringLiteral("3"), ItemAction::ToggleFavourite}).is_ok());

    REQUIRE(store.get_item_by_id(1).unwrap().is_read());
    REQUIRE_FALSE(store.get_item_by_id(2).unwrap().is_read());
    REQUIRE(store.get_item_by_id(3).unwrap().favourite);

    REQUIRE(app::apply_item_action(store, {QStringLiteral("77"), ItemAction::MarkRead}).unwrap_err().is_not_found());
    REQUIRE(app::apply_item_action(store, {QStringLiteral(""), ItemAction::MarkRead}).unwrap_err().kind
            == ErrorKind::InvalidInput);
}

TEST_CASE("CLI: mark-all-read and delete-feed", "[cli][mutations]") {
    auto store = storage::SqliteItemStore::open_memory().unwrap();
    seed(*store);
    REQUIRE(store->toggle_favourite(2).is_ok());

    REQUIRE(app::mark_all_read(*store).is_ok());
    REQUIRE(store->count_unread().unwrap() == 0);

    REQUIRE(app::delete_feed(*store, {QStringLiteral("https://a.example/feed"), false}).is_ok());
    REQUIRE(store->get_item_by_id(1).is_err());
    REQUIRE(store->get_item_by_id(2).is_ok());

    REQUIRE(app::delete_feed(*store, {QStringLiteral("https://a.example/feed"), true}).is_ok());
    REQUIRE(store->get_item_by_id(2).is_err());

    REQUIRE(app::delete_feed(*store, {QStringLiteral("  "), true}).unwrap_err().kind == ErrorKind::InvalidInput);
}

// ============================================================================
// Configuration
// ============================================================================

TEST_CASE("CLI: feed names parse from url=Name", "[cli][config]") {
    auto names = app::parse_feed_names({QStringLiteral("https://a.example/feed?x=1=Ay Feed"),
                                        QStringLiteral("https://b.example=Bee")});
    REQUIRE(names.is_ok());
    REQUIRE(names.unwrap().at("https://a.example/feed?x=1") == "Ay Feed");
    REQUIRE(names.unwrap().at("https://b.example") == "Bee");

    REQUIRE(app::parse_feed_names({QStringLiteral("no-separator")}).is_err());
    REQUIRE(app::parse_feed_names({QStringLiteral("=Name")}).is_err());
    REQUIRE(app::parse_feed_names({QStringLiteral("https://c.example=")}).is_err());
}

TEST_CASE("CLI: ordering resolves from flag, then environment", "[cli][config]") {
    qputenv("NOM_ORDERING", "desc");
    REQUIRE(app::resolve_ordering() == Ordering::Descending);
    REQUIRE(app::resolve_ordering(QStringLiteral("asc")) == Ordering::Ascending);
    qunsetenv("NOM_ORDERING");
    REQUIRE(app::resolve_ordering() == Ordering::Ascending);
    REQUIRE(app::resolve_ordering(QStringLiteral("sideways")) == Ordering::Ascending);
}

TEST_CASE("CLI: database path resolves from flag, then environment", "[cli][config]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto fromEnv = QDir(dir.path()).filePath(QStringLiteral("env/nom.db"));
    const auto fromFlag = QDir(dir.path()).filePath(QStringLiteral("flag/nom.db"));

    qputenv("NOM_DB_PATH", fromEnv.toUtf8());
    REQUIRE(app::resolve_database_path() == fromEnv);
    REQUIRE(QDir(QDir(dir.path()).filePath(QStringLiteral("env"))).exists());
    REQUIRE(app::resolve_database_path(fromFlag) == fromFlag);
    qunsetenv("NOM_DB_PATH");
}

TEST_CASE("CLI: build_config selects preview from --feed", "[cli][config]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto dbPath = QDir(dir.path()).filePath(QStringLiteral("nom.db"));

    auto durable = app::build_config(dbPath, QStringLiteral("desc"), {}, {}, false);
    REQUIRE(durable.is_ok());
    REQUIRE_FALSE(durable.unwrap().store.preview);
    REQUIRE(durable.unwrap().store.path == dbPath.toStdString());
    REQUIRE(durable.unwrap().ordering == Ordering::Descending);

    auto preview = app::build_config(dbPath, {}, {QStringLiteral("https://a=A")},
                                     {QStringLiteral("https://a")}, true);
    REQUIRE(preview.is_ok());
    REQUIRE(preview.unwrap().store.preview);
    REQUIRE(preview.unwrap().store.path.empty());
    REQUIRE(preview.unwrap().feed_names.at("https://a") == "A");
    REQUIRE(preview.unwrap().verbose);

    auto bad = app::build_config(dbPath, {}, {QStringLiteral("broken")}, {}, false);
    REQUIRE(bad.unwrap_err().kind == ErrorKind::InvalidInput);
}
