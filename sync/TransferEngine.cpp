#include "TransferEngine.hpp"
#include "TimeUtils.hpp"
#include "fetchsync/RemoteClient.hpp"
#include <QCryptographicHash>
#include <QDir>
#include <QFile>
#include <QLoggingCategory>
#include <QRegularExpression>
Q_LOGGING_CATEGORY(fsTransfer, "fetchsync.transfer")

namespace fetchsync {

std::string fileMd5(const QString &path) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly))
        return {};
    QCryptographicHash h(QCryptographicHash::Md5);
    if (!h.addData(&f))
        return {};
    return h.result().toHex().toStdString();
}

TransferEngine::TransferEngine(ProcessedRegistry &registry)
    : registry_(registry) {}

void TransferEngine::setClient(RemoteClient *client) {
    client_ = client;
    cache_.setClient(client);
    cache_.resetAll();
    cwd_.reset();
}

bool TransferEngine::changeDirectory(const std::string &path) {
    if (path.empty()) {
        qCWarning(fsTransfer) << "cd requires a directory";
        return false;
    }
    if (!client_) {
        qCWarning(fsTransfer) << "Not connected; cannot cd to" << path.c_str();
        return false;
    }
    std::string err;
    if (!client_->changeDirectory(path, err)) {
        qCWarning(fsTransfer) << "Unable to cd to" << path.c_str() << ":"
                              << err.c_str();
        return false;
    }
    qCInfo(fsTransfer) << "Changed remote directory to" << path.c_str();
    cache_.resetAll();
    cwd_.reset();
    return true;
}

std::string TransferEngine::currentDirectory() {
    if (registered_)
        return ".";
    if (cwd_)
        return *cwd_;
    std::string out, err;
    if (!client_ || !client_->currentDirectory(out, err)) {
        qCWarning(fsTransfer) << "Unable to read the remote working directory:"
                              << (client_ ? err.c_str() : "not connected");
        return ".";
    }
    cwd_ = out;
    return out;
}

QString TransferEngine::localPathFor(const std::string &name) const {
    const QString file = QString::fromStdString(name);
    if (localDir_.isEmpty())
        return file;
    return QDir(localDir_).filePath(file);
}

void TransferEngine::recordFetched(const std::string &directory,
                                   const std::optional<RemoteEntry> &entry,
                                   const QString &localPath) {
    if (!entry) {
        qCInfo(fsTransfer) << "No listing entry for the fetched file;"
                              " not recording"
                           << localPath;
        return;
    }
    if (!registry_.record(directory, entry->name, Direction::Get,
                          isoModDate(entry->mtime), entry->longname,
                          fileMd5(localPath)))
        qCWarning(fsTransfer) << "Fetched" << entry->name.c_str()
                              << "but could not record it";
}

GetResult TransferEngine::get(const std::string &filename,
                              const std::string &localName) {
    if (filename.empty()) {
        qCWarning(fsTransfer) << "get requires a file name";
        return GetResult::Failed;
    }
    if (!client_) {
        qCWarning(fsTransfer) << "Not connected; cannot get" << filename.c_str();
        return GetResult::Failed;
    }

    const std::string directory = currentDirectory();
    if (!cache_.isWarm(directory))
        cache_.warm(directory);

    const auto entry = cache_.get(directory, filename);
    const auto prior = registry_.lookup(directory, filename, Direction::Get,
                                        ProcessedRegistry::Attribute::RawEntry);
    const QString localPath =
        localPathFor(localName.empty() ? filename : localName);

    if (entry && prior && *prior == entry->longname) {
        qCInfo(fsTransfer) << "Already fetched" << filename.c_str()
                           << "- skipping";
        if (rerecordSkipped_ &&
            !registry_.record(directory, filename, Direction::Get,
                              isoModDate(entry->mtime), entry->longname,
                              fileMd5(localPath)))
            qCWarning(fsTransfer) << "Unable to re-record" << filename.c_str();
        return GetResult::Skipped;
    }

    qCInfo(fsTransfer) << "Fetching" << filename.c_str() << "to" << localPath
                       << "(" << transferModeName(mode_) << ")";
    std::string err;
    if (!client_->retrieve(filename, localPath.toStdString(), mode_, err)) {
        qCWarning(fsTransfer) << "Failed to fetch" << filename.c_str() << ":"
                              << err.c_str();
        if (QFile::exists(localPath) && !QFile::remove(localPath))
            qCWarning(fsTransfer) << "Unable to remove partial file"
                                  << localPath;
        return GetResult::Failed;
    }
    recordFetched(directory, entry, localPath);
    return GetResult::Fetched;
}

MgetSummary TransferEngine::mget(const std::string &pattern, bool recursive,
                                 const std::string &localName) {
    std::string glob = pattern;
    const auto slash = pattern.find_last_of('/');
    if (slash != std::string::npos) {
        const std::string prefix = slash == 0 ? "/" : pattern.substr(0, slash);
        glob = pattern.substr(slash + 1);
        if (!changeDirectory(prefix))
            return {};
    }
    if (glob.empty()) {
        qCWarning(fsTransfer) << "mget requires a file pattern";
        return {};
    }
    const MgetSummary s = mgetHere(glob, recursive, localName);
    qCInfo(fsTransfer) << "mget" << pattern.c_str() << ":" << s.matched
                       << "matched," << s.fetched << "fetched," << s.skipped
                       << "skipped," << s.failed << "failed";
    return s;
}

MgetSummary TransferEngine::mgetHere(const std::string &glob, bool recursive,
                                     const std::string &localName) {
    MgetSummary s;
    const std::string directory = currentDirectory();
    // Always list: the directory may have changed since it was cached.
    const std::vector<RemoteEntry> entries = cache_.warm(directory);

    for (const auto &e : entries) {
        if (e.isFile()) {
            if (!fileMatch(glob, e.name, caseInsensitiveGlob_))
                continue;
            ++s.matched;
            switch (get(e.name, localName)) {
            case GetResult::Fetched:
                ++s.fetched;
                break;
            case GetResult::Skipped:
                ++s.skipped;
                break;
            case GetResult::Failed:
                ++s.failed;
                break;
            }
        } else if (e.isDir() && recursive) {
            if (!changeDirectory(e.name))
                continue;
            const QString parentLocal = localDir_;
            const QString childLocal = localPathFor(e.name);
            if (!QDir().mkpath(childLocal))
                qCWarning(fsTransfer) << "Unable to create local directory"
                                      << childLocal;
            localDir_ = childLocal;
            try {
                s += mgetHere(glob, recursive, localName);
            } catch (...) {
                localDir_ = parentLocal;
                throw;
            }
            localDir_ = parentLocal;
            if (!changeDirectory("..")) {
                qCCritical(fsTransfer) << "Unable to return from"
                                       << e.name.c_str() << "- stopping mget in"
                                       << directory.c_str();
                break;
            }
        }
    }
    return s;
}

std::optional<std::uint64_t> TransferEngine::size(const std::string &filename) {
    if (!client_) {
        qCWarning(fsTransfer) << "Not connected; cannot size" << filename.c_str();
        return std::nullopt;
    }
    std::uint64_t n = 0;
    std::string err;
    if (!client_->size(filename, n, err)) {
        qCWarning(fsTransfer) << "Size of" << filename.c_str()
                              << "unavailable:" << err.c_str();
        return std::nullopt;
    }
    qCInfo(fsTransfer) << "Size of" << filename.c_str() << "is" << n;
    return n;
}

bool TransferEngine::fileMatch(const std::string &pattern,
                               const std::string &name, bool caseInsensitive) {
    const QRegularExpression re(
        QRegularExpression::wildcardToRegularExpression(
            QString::fromStdString(pattern)),
        caseInsensitive ? QRegularExpression::CaseInsensitiveOption
                        : QRegularExpression::NoPatternOption);
    return re.isValid() && re.match(QString::fromStdString(name)).hasMatch();
}

} // namespace fetchsync
