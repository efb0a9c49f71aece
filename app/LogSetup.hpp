// Routes Qt logging to the run's log file and, when verbose, to stdout.
#pragma once
#include <QDateTime>
#include <QString>
#include <QtGlobal>
#include <optional>

namespace fetchsync {

struct LogOptions {
    QString file;                      // empty: console only
    QString level = QStringLiteral("INFO"); // DEBUG|INFO|WARNING|ERROR|CRITICAL
    bool verbose = false;
    bool datestamp = false;
};

std::optional<QtMsgType> parseLogLevel(const QString &level);

// "dir/run.log" -> "dir/run.202401021530.log"
QString datestampedLogName(const QString &file, const QDateTime &now);

// Category filter rules hiding everything below level.
QString filterRulesFor(QtMsgType minLevel);

// Opens the log file (creating its directory, or falling back to the working
// directory), installs the message handler and filter rules. Returns the
// path actually used, empty when logging to the console only.
QString installLogging(const LogOptions &opt, QString &err);

// Restores Qt's default handler and closes the log file.
void shutdownLogging();

} // namespace fetchsync
