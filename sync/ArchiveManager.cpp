#include "ArchiveManager.hpp"
#include "LedgerFile.hpp"
#include "TimeUtils.hpp"
#include "TransferEngine.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>
Q_LOGGING_CATEGORY(fsArchive, "fetchsync.archive")

namespace fetchsync {

namespace {

bool hasWildcard(const QString &part) {
    return part.contains(QLatin1Char('*')) || part.contains(QLatin1Char('?')) ||
           part.contains(QLatin1Char('['));
}

// Directories matched by dirPath, whose components may hold wildcards.
QStringList matchingDirectories(const QString &dirPath) {
    QStringList dirs{dirPath.startsWith(QLatin1Char('/')) ? QStringLiteral("/")
                                                          : QStringLiteral(".")};
    const QStringList parts =
        dirPath.split(QLatin1Char('/'), Qt::SkipEmptyParts);
    for (const QString &part : parts) {
        QStringList next;
        for (const QString &d : dirs) {
            const QDir base(d);
            if (!hasWildcard(part)) {
                if (base.exists(part))
                    next << base.filePath(part);
                continue;
            }
            const QStringList names = base.entryList(
                QStringList{part},
                QDir::Dirs | QDir::NoDotAndDotDot | QDir::CaseSensitive,
                QDir::Name);
            for (const QString &name : names)
                next << base.filePath(name);
        }
        dirs = next;
    }
    return dirs;
}

} // namespace

bool ArchiveLedger::load(const QString &path) {
    path_ = path;
    records_.clear();
    QString err;
    int malformed = 0;
    const bool ok = readLedgerLines(
        path,
        [this, &malformed](int, const std::string &line) {
            const auto f = splitLedgerLine(line);
            if (f.size() != 4) {
                ++malformed;
                return;
            }
            records_[{f[0], f[1]}] = Entry{f[2], f[3]};
        },
        err);
    if (!ok) {
        qCWarning(fsArchive) << "Couldn't open archive ledger" << path << ":"
                             << err;
        return false;
    }
    if (malformed)
        qCDebug(fsArchive) << malformed << "malformed archive ledger lines in"
                           << path;
    qCInfo(fsArchive) << records_.size() << "archived files loaded from"
                      << path;
    return true;
}

bool ArchiveLedger::record(const std::string &directory,
                           const std::string &name, const std::string &moddate,
                           const std::string &md5) {
    QString err;
    if (!appendLedgerLine(path_,
                          joinLedgerFields({directory, name, moddate, md5}),
                          err)) {
        qCWarning(fsArchive) << "Failed writing archive ledger" << path_ << ":"
                             << err;
        return false;
    }
    records_[{directory, name}] = Entry{moddate, md5};
    return true;
}

std::optional<std::string> ArchiveLedger::lookup(const std::string &directory,
                                                 const std::string &name,
                                                 Attribute attribute) const {
    auto it = records_.find({directory, name});
    if (it == records_.end())
        return std::nullopt;
    return attribute == Attribute::ModDate ? it->second.moddate
                                           : it->second.md5;
}

bool ArchiveLedger::alreadyProcessed(const std::string &directory,
                                     const std::string &name,
                                     Attribute attribute,
                                     const std::string &value) const {
    const auto stored = lookup(directory, name, attribute);
    return stored && *stored == value;
}

bool ArchiveLedger::reset() {
    records_.clear();
    QString err;
    if (!removeLedgerFile(path_, err)) {
        qCWarning(fsArchive) << "Unable to delete archive ledger" << path_
                             << ":" << err;
        return false;
    }
    return true;
}

ArchiveManager::ArchiveManager(ArchiveLedger &ledger) : ledger_(ledger) {}

bool ArchiveManager::statFile(const QString &path, LocalFileStat &out) {
    const QFileInfo fi(path);
    if (!fi.exists() || !fi.isFile())
        return false;
    out.directory = fi.absolutePath().toStdString();
    out.name = fi.fileName().toStdString();
    out.md5 = fileMd5(fi.absoluteFilePath());
    out.moddate = isoModDate(fi.lastModified());
    return !out.md5.empty();
}

bool ArchiveManager::setArchiveDir(const QString &dir, std::string &err) {
    if (dir.isEmpty()) {
        err = "Archive directory is empty";
        return false;
    }
    if (!QDir().mkpath(dir)) {
        err = "Cannot create archive directory " + dir.toStdString();
        qCCritical(fsArchive) << "Cannot create" << dir;
        return false;
    }
    archiveDir_ = dir;
    return true;
}

int ArchiveManager::expandFileSpec(const QString &originDir,
                                   const QString &glob,
                                   const std::string &category) {
    QStringList &list = pending_[category];
    const QFileInfo spec(QDir(originDir).filePath(glob));
    QFileInfoList matches;
    for (const QString &d : matchingDirectories(spec.path()))
        matches += QDir(d).entryInfoList(QStringList{spec.fileName()},
                                         QDir::Files | QDir::CaseSensitive,
                                         QDir::Name);
    qCInfo(fsArchive) << matches.size() << spec.filePath()
                      << "files to be processed";
    int added = 0;
    for (const QFileInfo &fi : matches) {
        if (fi.size() == 0)
            continue;
        const QString path = fi.absoluteFilePath();
        if (list.contains(path))
            continue;
        list.append(path);
        ++added;
    }
    return added;
}

int ArchiveManager::expandFileSpecs(const QString &originDir,
                                    const QStringList &globs,
                                    const std::string &category) {
    int added = 0;
    for (const QString &g : globs)
        added += expandFileSpec(originDir, g, category);
    return added;
}

QStringList ArchiveManager::pending(const std::string &category) const {
    auto it = pending_.find(category);
    return it == pending_.end() ? QStringList() : it->second;
}

QString ArchiveManager::archiveName(const QString &path) const {
    const QFileInfo fi(path);
    QString base = fi.completeBaseName();
    QString ext = fi.suffix();
    if (base.isEmpty()) { // dot file such as ".profile"
        base = fi.fileName();
        ext.clear();
    }

    QString name = base;
    if (timestamp_) {
        const std::string stamp =
            formatLocalTime(fi.lastModified().toSecsSinceEpoch(), dateFormat_);
        if (!stamp.empty())
            name += "." + QString::fromStdString(stamp);
    }
    if (!ext.isEmpty())
        name += "." + ext;
    return archiveDir_.isEmpty() ? name : QDir(archiveDir_).filePath(name);
}

bool ArchiveManager::archiveFile(const QString &path, std::string &err) {
    if (!archiveDir_.isEmpty() && !QDir().mkpath(archiveDir_)) {
        err = "Cannot create archive directory " + archiveDir_.toStdString();
        qCCritical(fsArchive) << "Cannot create" << archiveDir_;
        return false;
    }
    const QString target = archiveName(path);
    qCDebug(fsArchive) << "Archiving" << path << "to" << target;
    if (QFile::exists(target) && !QFile::remove(target)) {
        err = "Cannot replace " + target.toStdString();
        qCWarning(fsArchive) << "Error moving" << path << "to" << target
                             << ": existing file cannot be replaced";
        return false;
    }
    QFile f(path);
    // QFile::rename falls back to copy and remove across file systems.
    if (!f.rename(target)) {
        err = "Error moving " + path.toStdString() + " to " +
              target.toStdString() + ": " + f.errorString().toStdString();
        qCWarning(fsArchive) << "Error moving" << path << "to" << target << ":"
                             << f.errorString();
        return false;
    }
    return true;
}

bool ArchiveManager::isRecorded(const LocalFileStat &st) const {
    return ledger_.alreadyProcessed(st.directory, st.name,
                                    ArchiveLedger::Attribute::Checksum,
                                    st.md5) &&
           ledger_.alreadyProcessed(st.directory, st.name,
                                    ArchiveLedger::Attribute::ModDate,
                                    st.moddate);
}

bool ArchiveManager::alreadyProcessed(const QString &path) const {
    LocalFileStat st;
    if (!statFile(path, st))
        return false;
    return isRecorded(st);
}

bool ArchiveManager::markProcessed(const QString &path) {
    LocalFileStat st;
    if (!statFile(path, st)) {
        qCWarning(fsArchive) << "Cannot read" << path;
        return false;
    }
    return ledger_.record(st.directory, st.name, st.moddate, st.md5);
}

ArchiveSummary ArchiveManager::processCategory(const std::string &category) {
    ArchiveSummary s;
    const QStringList files = pending(category);
    s.pending = files.size();
    for (const QString &path : files) {
        LocalFileStat st;
        if (!statFile(path, st)) {
            qCWarning(fsArchive) << "Cannot read" << path << "- skipping";
            ++s.failed;
            continue;
        }
        if (isRecorded(st)) {
            qCInfo(fsArchive) << path << "already processed";
            ++s.skipped;
            continue;
        }
        std::string err;
        if (!archiveFile(path, err)) {
            ++s.failed;
            continue;
        }
        // Recorded under its origin path so the next run recognises it.
        if (!ledger_.record(st.directory, st.name, st.moddate, st.md5))
            qCWarning(fsArchive) << path << "archived but not recorded";
        ++s.archived;
    }
    pending_.erase(category);
    qCInfo(fsArchive) << "Category" << category.c_str() << ":" << s.archived
                      << "archived," << s.skipped << "skipped," << s.failed
                      << "failed";
    return s;
}

} // namespace fetchsync
