#include "AppConfig.hpp"
#include "fetchsync/RuntimeLogging.hpp"
#include <QDir>
#include <QFileInfo>
#include <QSettings>

namespace fetchsync {

bool configFlag(const QString &value, bool fallback) {
    const QString v = value.trimmed().toLower();
    if (v.isEmpty())
        return fallback;
    return isTruthy(v.toStdString());
}

namespace {

QString text(const QSettings &s, const QString &key,
             const QString &fallback = QString()) {
    const QVariant v = s.value(key);
    if (!v.isValid())
        return fallback;
    // Unquoted values containing commas come back as lists.
    const QString joined = v.toStringList().join(QStringLiteral(", "));
    return joined.trimmed().isEmpty() ? fallback : joined.trimmed();
}

bool flag(const QSettings &s, const QString &key, bool fallback) {
    return configFlag(text(s, key), fallback);
}

QStringList list(const QSettings &s, const QString &key) {
    QStringList out;
    for (const QString &item : s.value(key).toStringList()) {
        const QString t = item.trimmed();
        if (!t.isEmpty())
            out << t;
    }
    return out;
}

} // namespace

bool loadAppConfig(const QString &path, AppConfig &out, QString &err) {
    if (!QFileInfo::exists(path)) {
        err = QStringLiteral("Configuration file not found: %1").arg(path);
        return false;
    }
    QSettings s(path, QSettings::IniFormat);
    if (s.status() != QSettings::NoError) {
        err = QStringLiteral("Unable to parse configuration file %1").arg(path);
        return false;
    }

    AppConfig c;
    c.registered = flag(s, "Options/Registered", false);
    c.protocol = text(s, "Options/Protocol", c.protocol).toLower();
    c.archive = flag(s, "Options/Archive", false);

    c.datFile = text(s, "Files/DatFile");
    c.newDatFile = flag(s, "Files/NewDatFile", false);
    c.destination = text(s, "Files/Destination");
    c.scriptFile = text(s, "Files/FTPScript");
    c.archiveDir = text(s, "Files/ArchiveDir");
    c.archiveDateFormat =
        text(s, "Files/ArchiveDateFormat", c.archiveDateFormat);
    c.archiveTimestamp = flag(s, "Files/ArchiveTimestamp", true);
    c.archiveDatFile = text(s, "Files/ArchiveDatFile");
    c.lockFile = text(s, "Files/LockFile",
                      QDir::temp().filePath(QStringLiteral("fetchsync.lock")));

    c.logFile = text(s, "Logging/LogFile");
    c.logLevel = text(s, "Logging/LogLevel", c.logLevel).toUpper();
    c.verbose = flag(s, "Logging/Verbose", false);
    c.datestamp = flag(s, "Logging/Datestamp", false);

    const QString defaultOrigin = text(s, "Defaults/OriginDir");
    for (const QString &name : list(s, "Archive/Categories")) {
        ArchiveCategory cat;
        cat.name = name;
        cat.originDir = text(s, name + "/OriginDir", defaultOrigin);
        cat.fileSpecs = list(s, name + "/FileSpecs");
        c.categories.push_back(cat);
    }

    if (c.datFile.isEmpty()) {
        err = QStringLiteral("[Files] DatFile is required");
        return false;
    }
    if (c.scriptFile.isEmpty()) {
        err = QStringLiteral("[Files] FTPScript is required");
        return false;
    }
    out = c;
    return true;
}

} // namespace fetchsync
