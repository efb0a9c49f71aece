#include "DirectoryCache.hpp"
#include "SyncErrors.hpp"
#include "fetchsync/RemoteClient.hpp"
#include <QLoggingCategory>
Q_LOGGING_CATEGORY(fsCache, "fetchsync.cache")

namespace fetchsync {

void DirectoryCache::resetAll() { dirs_.clear(); }

void DirectoryCache::set(const std::string &dir, const std::string &name,
                         const RemoteEntry &entry) {
    dirs_[dir][name] = entry;
}

std::optional<RemoteEntry> DirectoryCache::get(const std::string &dir,
                                               const std::string &name) const {
    auto d = dirs_.find(dir);
    if (d == dirs_.end())
        return std::nullopt;
    auto e = d->second.find(name);
    if (e == d->second.end()) {
        qCDebug(fsCache) << "No directory entry for" << dir.c_str() << ":"
                         << name.c_str();
        return std::nullopt;
    }
    return e->second;
}

bool DirectoryCache::isWarm(const std::string &dir) const {
    return dirs_.find(dir) != dirs_.end();
}

std::vector<RemoteEntry> DirectoryCache::warm(const std::string &dir) {
    std::vector<RemoteEntry> entries;
    std::string err;
    if (!client_) {
        recordFailure(dir, "no connection");
        return entries;
    }
    if (!client_->list(dir, entries, err)) {
        recordFailure(dir, err);
        return {};
    }
    if (entries.empty()) {
        recordFailure(dir, "empty listing");
        return entries;
    }

    qCInfo(fsCache) << "Caching directory listing for" << dir.c_str() << "("
                    << entries.size() << "entries)";
    auto &slot = dirs_[dir];
    slot.clear();
    for (auto &e : entries) {
        e.directory = dir;
        qCDebug(fsCache).noquote() << QString::fromStdString(e.longname);
        slot[e.name] = e;
    }
    return entries;
}

void DirectoryCache::recordFailure(const std::string &dir,
                                   const std::string &why) {
    failed_.insert(dir);
    const int count = static_cast<int>(failed_.size());
    if (count >= kMaxFailedDirectories) {
        qCCritical(fsCache) << "Directory" << dir.c_str()
                            << "is empty or does not exist (" << why.c_str()
                            << "); giving up after" << count
                            << "unavailable directories";
        throw SyncAborted("Too many empty or unavailable remote directories (" +
                          std::to_string(count) + "), last: " + dir);
    }
    qCWarning(fsCache) << "Directory" << dir.c_str()
                       << "is empty or does not exist (" << why.c_str()
                       << ")";
}

} // namespace fetchsync
