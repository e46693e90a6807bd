#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTextStream>

#include "app/cli/ingest.hpp"
#include "app/cli/item_list.hpp"
#include "app/cli/mutations.hpp"
#include "app/config.hpp"
#include "app/logging.hpp"
#include "storage/store_factory.hpp"

namespace {

constexpr int EXIT_FAILED = 1;
constexpr int EXIT_USAGE = 2;

int fail(const nom::Error& error) {
    QTextStream(stderr) << QString::fromStdString(error.message) << QLatin1Char('\n');
    return error.kind == nom::ErrorKind::InvalidInput ? EXIT_USAGE : EXIT_FAILED;
}

int usage(const QString& message) {
    QTextStream(stderr) << message << QLatin1Char('\n');
    return EXIT_USAGE;
}

int print(const nom::Result<QString>& result) {
    if (result.is_err()) {
        return fail(result.unwrap_err());
    }
    QTextStream(stdout) << result.unwrap();
    return 0;
}

int done(const nom::Result<void>& result) {
    return result.is_err() ? fail(result.unwrap_err()) : 0;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("nom");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("nom");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("nom feed reader"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption dbPathOption(
        QStringList{QStringLiteral("db")},
        QStringLiteral("Override database path (default: NOM_DB_PATH or the app config dir)."),
        QStringLiteral("path"));
    parser.addOption(dbPathOption);

    const QCommandLineOption feedOption(
        QStringList{QStringLiteral("f"), QStringLiteral("feed")},
        QStringLiteral("Preview a feed URL without touching the database (repeatable)."),
        QStringLiteral("url"));
    parser.addOption(feedOption);

    const QCommandLineOption inputOption(
        QStringList{QStringLiteral("input")},
        QStringLiteral("Load candidate items from a JSON file before running the command."),
        QStringLiteral("file"));
    parser.addOption(inputOption);

    const QCommandLineOption orderingOption(
        QStringList{QStringLiteral("ordering")},
        QStringLiteral("Item ordering: 'asc' or 'desc' (default: NOM_ORDERING or asc)."),
        QStringLiteral("order"));
    parser.addOption(orderingOption);

    const QCommandLineOption nameOption(
        QStringList{QStringLiteral("name")},
        QStringLiteral("Display name for a feed, as url=Name (repeatable)."),
        QStringLiteral("url=name"));
    parser.addOption(nameOption);

    const QCommandLineOption jsonOption(
        QStringList{QStringLiteral("json")},
        QStringLiteral("Output JSON (for 'items')."));
    parser.addOption(jsonOption);

    const QCommandLineOption groupOption(
        QStringList{QStringLiteral("group")},
        QStringLiteral("Group 'items' output by feed."));
    parser.addOption(groupOption);

    const QCommandLineOption unreadOnlyOption(
        QStringList{QStringLiteral("unread-only")},
        QStringLiteral("Hide read items (favourites stay visible)."));
    parser.addOption(unreadOnlyOption);

    const QCommandLineOption favouritesOption(
        QStringList{QStringLiteral("favourites")},
        QStringLiteral("Show favourite items only."));
    parser.addOption(favouritesOption);

    const QCommandLineOption feedUrlOption(
        QStringList{QStringLiteral("feed-url")},
        QStringLiteral("Restrict 'items' to one feed URL."),
        QStringLiteral("url"));
    parser.addOption(feedUrlOption);

    const QCommandLineOption includeFavouritesOption(
        QStringList{QStringLiteral("include-favourites")},
        QStringLiteral("Let 'delete-feed' remove favourite items too."));
    parser.addOption(includeFavouritesOption);

    const QCommandLineOption verboseOption(
        QStringList{QStringLiteral("verbose")},
        QStringLiteral("Log info lines of the nom.* categories (same as NOM_DEBUG_STORE=1)."));
    parser.addOption(verboseOption);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("unread | items | feeds | show <id> | read <id> | unread-item <id> | "
                                                "toggle-read <id> | favourite <id> | mark-all-read | "
                                                "delete-feed <url> | ingest <file>"));
    parser.process(app);

    const bool verbose = parser.isSet(verboseOption) || qEnvironmentVariableIsSet("NOM_DEBUG_STORE");
    if (verbose) {
        nom::app::enable_verbose_logging();
    }

    std::unique_ptr<nom::app::FileLogSink> logSink;
    const auto logPath = nom::app::default_log_file_path();
    if (!logPath.isEmpty()) {
        auto installed = nom::app::FileLogSink::install(logPath);
        if (installed.is_err()) {
            QTextStream(stderr) << QStringLiteral("nom: logging to file disabled: ")
                                << QString::fromStdString(installed.unwrap_err().message) << QLatin1Char('\n');
        } else {
            logSink = std::move(installed).unwrap();
            qCInfo(nomCliLog) << "logging to" << logSink->path();
        }
    }

    const auto positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        return usage(parser.helpText());
    }
    const auto command = positional.first();
    const auto argument = positional.size() > 1 ? positional.at(1) : QString{};

    static const QStringList needsArgument{
        QStringLiteral("show"), QStringLiteral("read"), QStringLiteral("unread-item"),
        QStringLiteral("toggle-read"), QStringLiteral("favourite"), QStringLiteral("delete-feed"),
        QStringLiteral("ingest")};
    static const QStringList known = needsArgument + QStringList{
        QStringLiteral("unread"), QStringLiteral("items"), QStringLiteral("feeds"), QStringLiteral("mark-all-read")};

    if (!known.contains(command)) {
        return usage(QStringLiteral("Unknown command: ") + command);
    }
    if (needsArgument.contains(command) && argument.isEmpty()) {
        return usage(QStringLiteral("Command '") + command + QStringLiteral("' needs an argument"));
    }

    auto config = nom::app::build_config(parser.value(dbPathOption),
                                         parser.value(orderingOption),
                                         parser.values(nameOption),
                                         parser.values(feedOption),
                                         verbose);
    if (config.is_err()) {
        return usage(QString::fromStdString(config.unwrap_err().message));
    }
    const auto& cfg = config.unwrap();

    auto opened = nom::storage::open_store(cfg.store);
    if (opened.is_err()) {
        return fail(opened.unwrap_err());
    }
    auto store = std::move(opened).unwrap();

    if (parser.isSet(inputOption)) {
        // Preview sessions keep only entries of the previewed feeds.
        auto loaded = nom::app::ingest_file(*store, parser.value(inputOption), cfg.preview_feeds);
        if (loaded.is_err()) {
            return fail(loaded.unwrap_err());
        }
    }

    if (command == QStringLiteral("unread")) {
        return print(nom::app::count_unread(*store));
    }

    if (command == QStringLiteral("items")) {
        nom::app::ItemListOptions options;
        options.ordering = cfg.ordering;
        options.filter.show_read = !parser.isSet(unreadOnlyOption);
        options.filter.favourites_only = parser.isSet(favouritesOption);
        if (parser.isSet(feedUrlOption)) {
            options.filter.feed_url = parser.value(feedUrlOption).toStdString();
        }
        options.groupByFeed = parser.isSet(groupOption);
        options.json = parser.isSet(jsonOption);
        options.feedNames = cfg.feed_names;
        return print(nom::app::list_items(*store, options));
    }

    if (command == QStringLiteral("feeds")) {
        return print(nom::app::list_feed_urls(*store, cfg.feed_names));
    }

    if (command == QStringLiteral("show")) {
        return print(nom::app::show_item(*store, argument, cfg.feed_names));
    }

    if (command == QStringLiteral("mark-all-read")) {
        return done(nom::app::mark_all_read(*store));
    }

    if (command == QStringLiteral("delete-feed")) {
        nom::app::DeleteFeedOptions options;
        options.feedUrl = argument;
        options.includeFavourites = parser.isSet(includeFavouritesOption);
        return done(nom::app::delete_feed(*store, options));
    }

    if (command == QStringLiteral("ingest")) {
        auto written = nom::app::ingest_file(*store, argument);
        if (written.is_err()) {
            return fail(written.unwrap_err());
        }
        QTextStream(stdout) << QStringLiteral("Ingested %1 item(s)\n").arg(written.unwrap());
        return 0;
    }

    nom::app::ItemActionOptions options;
    options.itemId = argument;
    if (command == QStringLiteral("read")) {
        options.action = nom::app::ItemAction::MarkRead;
    } else if (command == QStringLiteral("unread-item")) {
        options.action = nom::app::ItemAction::MarkUnread;
    } else if (command == QStringLiteral("toggle-read")) {
        options.action = nom::app::ItemAction::ToggleRead;
    } else {
        options.action = nom::app::ItemAction::ToggleFavourite;
    }
    return done(nom::app::apply_item_action(*store, options));
}
