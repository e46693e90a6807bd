#include "app/logging.hpp"

#include <QDir>
#include <QFileInfo>
#include <QMutex>
#include <QStandardPaths>
#include <QTextStream>

Q_LOGGING_CATEGORY(nomCliLog, "nom.cli", QtWarningMsg)

namespace nom::app {
namespace {

QMutex g_sink_mutex;
FileLogSink* g_sink = nullptr;

QLatin1String level_name(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return QLatin1String("DEBUG");
        case QtInfoMsg: return QLatin1String("INFO");
        case QtWarningMsg: return QLatin1String("WARN");
        case QtCriticalMsg: return QLatin1String("ERROR");
        case QtFatalMsg: return QLatin1String("FATAL");
    }
    return QLatin1String("?");
}

void route_to_sink(QtMsgType type, const QMessageLogContext& ctx, const QString& msg) {
    QMutexLocker lock(&g_sink_mutex);
    if (g_sink) {
        g_sink->write(type, ctx.category, msg);
    }
}

} // namespace

QString format_log_line(const QDateTime& when,
                        QtMsgType type,
                        const char* category,
                        const QString& message) {
    const auto cat = category ? QString::fromLatin1(category) : QStringLiteral("default");
    return QStringLiteral("%1 %2 %3: %4\n")
        .arg(when.toUTC().toString(Qt::ISODateWithMs), level_name(type), cat, message);
}

Result<std::unique_ptr<FileLogSink>> FileLogSink::install(const QString& path) {
    using Ret = Result<std::unique_ptr<FileLogSink>>;

    if (path.isEmpty()) {
        return Ret::err(Error::invalid_input("No log file path"));
    }

    const auto dir = QFileInfo(path).absolutePath();
    if (!QDir().mkpath(dir)) {
        return Ret::err(Error::persistence("Cannot create log directory " + dir.toStdString()));
    }

    std::unique_ptr<FileLogSink> sink(new FileLogSink(path));
    if (!sink->file_.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        return Ret::err(Error::persistence(
            "Cannot open log file " + path.toStdString() + ": " + sink->file_.errorString().toStdString()));
    }

    QMutexLocker lock(&g_sink_mutex);
    if (g_sink) {
        return Ret::err(Error::invalid_state("A log sink is already installed at "
                                             + g_sink->path().toStdString()));
    }
    g_sink = sink.get();
    sink->previous_ = qInstallMessageHandler(route_to_sink);
    return Ret::ok(std::move(sink));
}

FileLogSink::~FileLogSink() {
    QMutexLocker lock(&g_sink_mutex);
    if (g_sink == this) {
        qInstallMessageHandler(previous_);
        g_sink = nullptr;
    }
}

void FileLogSink::write(QtMsgType type, const char* category, const QString& message) {
    const auto line = format_log_line(QDateTime::currentDateTimeUtc(), type, category, message);
    file_.write(line.toUtf8());
    file_.flush();

    if (type != QtDebugMsg && type != QtInfoMsg) {
        QTextStream(stderr) << QStringLiteral("nom: ") << message << QLatin1Char('\n');
    }
}

QString default_log_file_path() {
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) {
        return QString{};
    }
    return QDir(base).filePath(QStringLiteral("logs/nom.log"));
}

void enable_verbose_logging() {
    QLoggingCategory::setFilterRules(QStringLiteral("nom.*.info=true"));
}

} // namespace nom::app
