#pragma once

#include <QDateTime>
#include <QFile>
#include <QLoggingCategory>
#include <QString>

#include <memory>

#include "core/result.hpp"

// "nom.cli": command-level messages (ingest progress, skipped input).
Q_DECLARE_LOGGING_CATEGORY(nomCliLog)

namespace nom::app {

/**
 * Formats one log line: "<utc iso time> <LEVEL> <category>: <message>\n".
 */
[[nodiscard]] QString format_log_line(const QDateTime& when,
                                      QtMsgType type,
                                      const char* category,
                                      const QString& message);

/**
 * FileLogSink - Routes Qt messages of this process into a log file.
 *
 * While a sink is alive it is the process message handler. Warnings and
 * worse are also mirrored to stderr so stdout stays clean for command
 * output. Destroying the sink restores the handler that was active before.
 * Only one sink may be installed at a time.
 */
class FileLogSink {
public:
    ~FileLogSink();

    FileLogSink(const FileLogSink&) = delete;
    FileLogSink& operator=(const FileLogSink&) = delete;

    /**
     * Creates the parent directory if needed and opens `path` for append.
     * Fails with InvalidState if another sink is already installed.
     */
    [[nodiscard]] static Result<std::unique_ptr<FileLogSink>> install(const QString& path);

    [[nodiscard]] const QString& path() const { return path_; }

    void write(QtMsgType type, const char* category, const QString& message);

private:
    explicit FileLogSink(const QString& path) : path_(path), file_(path) {}

    QString path_;
    QFile file_;
    QtMessageHandler previous_ = nullptr;
};

// <AppLocalDataLocation>/logs/nom.log, or empty if Qt reports no location.
[[nodiscard]] QString default_log_file_path();

// Enables info lines of every nom.* category.
void enable_verbose_logging();

} // namespace nom::app
