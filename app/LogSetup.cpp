#include "LogSetup.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>
#include <cstdio>
#include <mutex>

namespace fetchsync {

namespace {

struct LogSink {
    std::mutex mutex;
    QFile file;
    QtMsgType minLevel = QtInfoMsg;
    bool verbose = false;
    bool installed = false;
};

LogSink &sink() {
    static LogSink s;
    return s;
}

int severity(QtMsgType t) {
    switch (t) {
    case QtDebugMsg:
        return 0;
    case QtInfoMsg:
        return 1;
    case QtWarningMsg:
        return 2;
    case QtCriticalMsg:
        return 3;
    case QtFatalMsg:
        return 4;
    }
    return 1;
}

const char *levelName(QtMsgType t) {
    switch (t) {
    case QtDebugMsg:
        return "DEBUG";
    case QtInfoMsg:
        return "INFO";
    case QtWarningMsg:
        return "WARNING";
    case QtCriticalMsg:
    case QtFatalMsg:
        return "CRITICAL";
    }
    return "INFO";
}

void messageHandler(QtMsgType type, const QMessageLogContext &,
                    const QString &msg) {
    LogSink &s = sink();
    std::lock_guard<std::mutex> lk(s.mutex);
    if (severity(type) < severity(s.minLevel))
        return;
    const QDateTime now = QDateTime::currentDateTime();
    if (s.file.isOpen()) {
        const QString line =
            QStringLiteral("%1: %2 %3\n")
                .arg(now.toString(QStringLiteral("yyyy-MM-dd HH:mm:ss")),
                     QLatin1String(levelName(type)), msg);
        s.file.write(line.toUtf8());
        s.file.flush();
    }
    if (s.verbose || !s.file.isOpen()) {
        const QString line =
            QStringLiteral("%1: %2 %3\n")
                .arg(now.toString(QStringLiteral("HH:mm:ss")),
                     QLatin1String(levelName(type)), msg);
        std::FILE *out = s.verbose ? stdout : stderr;
        std::fputs(line.toLocal8Bit().constData(), out);
        std::fflush(out);
    }
}

} // namespace

std::optional<QtMsgType> parseLogLevel(const QString &level) {
    const QString l = level.trimmed().toUpper();
    if (l == "DEBUG" || l == "NOTSET")
        return QtDebugMsg;
    if (l == "INFO")
        return QtInfoMsg;
    if (l == "WARNING" || l == "WARN")
        return QtWarningMsg;
    if (l == "ERROR" || l == "CRITICAL")
        return QtCriticalMsg;
    return std::nullopt;
}

QString datestampedLogName(const QString &file, const QDateTime &now) {
    const QFileInfo fi(file);
    const QString stamp = now.toString(QStringLiteral("yyyyMMddHHmm"));
    QString name = fi.completeBaseName() + "." + stamp;
    if (!fi.suffix().isEmpty())
        name += "." + fi.suffix();
    return file.contains(QLatin1Char('/')) ? QDir(fi.path()).filePath(name)
                                           : name;
}

QString filterRulesFor(QtMsgType minLevel) {
    QString rules;
    const int min = severity(minLevel);
    rules += QStringLiteral("fetchsync.*.debug=%1\n")
                 .arg(QLatin1String(min <= 0 ? "true" : "false"));
    rules += QStringLiteral("fetchsync.*.info=%1\n")
                 .arg(QLatin1String(min <= 1 ? "true" : "false"));
    rules += QStringLiteral("fetchsync.*.warning=%1\n")
                 .arg(QLatin1String(min <= 2 ? "true" : "false"));
    return rules;
}

QString installLogging(const LogOptions &opt, QString &err) {
    LogSink &s = sink();
    const auto level = parseLogLevel(opt.level);
    if (!level)
        err = QStringLiteral("Unknown log level %1, using INFO").arg(opt.level);

    QString path;
    {
        std::lock_guard<std::mutex> lk(s.mutex);
        s.minLevel = level.value_or(QtInfoMsg);
        s.verbose = opt.verbose;
        if (s.file.isOpen())
            s.file.close();

        if (!opt.file.isEmpty()) {
            path = opt.datestamp
                       ? datestampedLogName(opt.file,
                                            QDateTime::currentDateTime())
                       : opt.file;
            const QFileInfo fi(path);
            if (!QDir().mkpath(fi.absolutePath()))
                path = QDir::current().filePath(fi.fileName());
            s.file.setFileName(path);
            if (!s.file.open(QIODevice::WriteOnly | QIODevice::Truncate |
                             QIODevice::Text)) {
                err = QStringLiteral("Cannot open log file %1: %2")
                          .arg(path, s.file.errorString());
                path.clear();
            }
        }
    }

    QLoggingCategory::setFilterRules(filterRulesFor(s.minLevel));
    if (!s.installed) {
        qInstallMessageHandler(messageHandler);
        s.installed = true;
    }
    return path;
}

void shutdownLogging() {
    LogSink &s = sink();
    if (s.installed) {
        qInstallMessageHandler(nullptr);
        s.installed = false;
    }
    std::lock_guard<std::mutex> lk(s.mutex);
    if (s.file.isOpen())
        s.file.close();
}

} // namespace fetchsync
