// fetchsync: run a transfer script against an FTP or SFTP server, fetching
// only files whose listing changed since the last run, then optionally
// archive processed local files.
#include "AppConfig.hpp"
#include "ArchiveManager.hpp"
#include "LogSetup.hpp"
#include "ProcessedRegistry.hpp"
#include "ScriptInterpreter.hpp"
#include "TransferEngine.hpp"
#include "fetchsync/CurlFtpClient.hpp"
#include "fetchsync/Libssh2RemoteClient.hpp"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QLockFile>
#include <QLoggingCategory>
#include <memory>

Q_LOGGING_CATEGORY(fsApp, "fetchsync.app")

namespace {

enum ExitCode { ExitOk = 0, ExitFailure = 1, ExitLocked = 2 };

std::unique_ptr<fetchsync::RemoteClient> makePrototype(const QString &proto) {
    if (proto == "ftp")
        return std::make_unique<fetchsync::CurlFtpClient>();
    if (proto == "sftp")
        return std::make_unique<fetchsync::Libssh2RemoteClient>();
    return nullptr;
}

// False only when the archive directory is unusable.
bool runArchivePass(const fetchsync::AppConfig &cfg) {
    fetchsync::ArchiveLedger ledger;
    if (cfg.archiveDatFile.isEmpty())
        qCWarning(fsApp) << "No ArchiveDatFile configured; archived files "
                            "will not be remembered";
    else
        ledger.load(cfg.archiveDatFile);

    fetchsync::ArchiveManager archiver(ledger);
    std::string err;
    if (!archiver.setArchiveDir(cfg.archiveDir, err)) {
        qCCritical(fsApp) << "Archive pass skipped:" << err.c_str();
        return false;
    }
    archiver.setDateFormat(cfg.archiveDateFormat.toStdString());
    archiver.setTimestamp(cfg.archiveTimestamp);

    for (const auto &cat : cfg.categories) {
        if (cat.originDir.isEmpty()) {
            qCWarning(fsApp) << "Category" << cat.name
                             << "has no OriginDir; skipping";
            continue;
        }
        const std::string name = cat.name.toStdString();
        archiver.expandFileSpecs(cat.originDir, cat.fileSpecs, name);
        archiver.processCategory(name);
    }
    return true;
}

} // namespace

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("fetchsync"));
    QCoreApplication::setApplicationVersion(
        QString::fromLatin1(FETCHSYNC_VERSION));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral(
        "Fetch new and changed files from an FTP or SFTP server"));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption configOpt(
        {QStringLiteral("c"), QStringLiteral("config")},
        QStringLiteral("Configuration file."), QStringLiteral("file"));
    const QCommandLineOption verboseOpt(
        {QStringLiteral("v"), QStringLiteral("verbose")},
        QStringLiteral("Echo log messages to standard output."));
    const QCommandLineOption resyncOpt(
        QStringLiteral("resync"),
        QStringLiteral("Forget all processed files and fetch everything."));
    const QCommandLineOption protocolOpt(
        QStringLiteral("protocol"),
        QStringLiteral("Override [Options] Protocol (sftp or ftp)."),
        QStringLiteral("name"));
    parser.addOption(configOpt);
    parser.addOption(verboseOpt);
    parser.addOption(resyncOpt);
    parser.addOption(protocolOpt);
    parser.process(app);

    if (!parser.isSet(configOpt)) {
        qCCritical(fsApp) << "No configuration file given (use -c <file>)";
        return ExitFailure;
    }

    fetchsync::AppConfig cfg;
    QString err;
    if (!fetchsync::loadAppConfig(parser.value(configOpt), cfg, err)) {
        qCCritical(fsApp).noquote() << err;
        return ExitFailure;
    }
    if (parser.isSet(verboseOpt))
        cfg.verbose = true;
    if (parser.isSet(protocolOpt))
        cfg.protocol = parser.value(protocolOpt).toLower();

    fetchsync::LogOptions logOpt;
    logOpt.file = cfg.logFile;
    logOpt.level = cfg.logLevel;
    logOpt.verbose = cfg.verbose;
    logOpt.datestamp = cfg.datestamp;
    QString logErr;
    const QString logPath = fetchsync::installLogging(logOpt, logErr);
    if (!logErr.isEmpty())
        qCWarning(fsApp).noquote() << logErr;
    qCInfo(fsApp) << "Started log file" << logPath << "(detail level"
                  << cfg.logLevel << ")";
    qCInfo(fsApp) << "Running" << QCoreApplication::applicationFilePath()
                  << "(pid" << QCoreApplication::applicationPid() << ")";
    qCInfo(fsApp) << "Program version" << FETCHSYNC_VERSION;

    QLockFile lock(cfg.lockFile);
    lock.setStaleLockTime(0);
    if (!lock.tryLock(0)) {
        qCCritical(fsApp) << "Another instance holds" << cfg.lockFile
                          << "- exiting";
        fetchsync::shutdownLogging();
        return ExitLocked;
    }

    auto prototype = makePrototype(cfg.protocol);
    if (!prototype) {
        qCCritical(fsApp) << "Unknown protocol" << cfg.protocol;
        fetchsync::shutdownLogging();
        return ExitFailure;
    }

    fetchsync::ProcessedRegistry registry;
    registry.load(cfg.datFile);
    fetchsync::TransferEngine engine(registry);
    if (parser.isSet(resyncOpt)) {
        if (!registry.reset())
            qCWarning(fsApp) << "Unable to reset the ledger" << cfg.datFile;
    } else if (cfg.newDatFile) {
        if (registry.restartLog())
            engine.setRerecordSkipped(true);
    }

    if (!cfg.destination.isEmpty()) {
        if (!QDir().mkpath(cfg.destination)) {
            qCCritical(fsApp) << "Cannot create destination" << cfg.destination;
            fetchsync::shutdownLogging();
            return ExitFailure;
        }
        engine.setLocalDirectory(cfg.destination);
        qCInfo(fsApp) << "Saving files to" << cfg.destination;
    }
    engine.setRegistered(cfg.registered);

    bool ok = false;
    {
        fetchsync::ScriptInterpreter interp(*prototype, engine);
        ok = interp.runFile(cfg.scriptFile);
    }

    if (ok && cfg.archive)
        ok = runArchivePass(cfg);

    qCInfo(fsApp) << "Completed" << (ok ? "successfully" : "with errors");
    fetchsync::shutdownLogging();
    return ok ? ExitOk : ExitFailure;
}
