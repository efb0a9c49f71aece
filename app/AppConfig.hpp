// Run configuration read from an INI file.
#pragma once
#include <QString>
#include <QStringList>
#include <QVector>

namespace fetchsync {

struct ArchiveCategory {
    QString name;
    QString originDir; // falls back to [Defaults] OriginDir
    QStringList fileSpecs;
};

struct AppConfig {
    // [Options]
    bool registered = false;
    QString protocol = QStringLiteral("sftp");
    bool archive = false;

    // [Files]
    QString datFile;
    bool newDatFile = false;
    QString destination;
    QString scriptFile;
    QString archiveDir;
    QString archiveDateFormat = QStringLiteral("%Y%m%d%H%M");
    bool archiveTimestamp = true;
    QString archiveDatFile;
    QString lockFile;

    // [Logging]
    QString logFile;
    QString logLevel = QStringLiteral("INFO");
    bool verbose = false;
    bool datestamp = false;

    QVector<ArchiveCategory> categories;
};

// Returns false (with err) when the file is missing or a required key
// (DatFile, FTPScript) is absent.
bool loadAppConfig(const QString &path, AppConfig &out, QString &err);

// "yes"/"true"/"on"/"1" style flag; anything else is false.
bool configFlag(const QString &value, bool fallback);

} // namespace fetchsync
