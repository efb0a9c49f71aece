// Change-aware download engine on top of a RemoteClient.
#pragma once
#include "DirectoryCache.hpp"
#include "ProcessedRegistry.hpp"
#include "fetchsync/RemoteTypes.hpp"
#include <QString>
#include <cstdint>
#include <optional>
#include <string>

namespace fetchsync {

class RemoteClient;

enum class GetResult { Fetched, Skipped, Failed };

struct MgetSummary {
    int matched = 0;
    int fetched = 0;
    int skipped = 0;
    int failed = 0;

    MgetSummary &operator+=(const MgetSummary &o) {
        matched += o.matched;
        fetched += o.fetched;
        skipped += o.skipped;
        failed += o.failed;
        return *this;
    }
};

// A file is fetched only when its current listing line differs from the one
// recorded in the registry at its last successful download. Listings are
// cached per directory and dropped on every directory change.
//
// SyncAborted from the directory cache propagates out of get() and mget().
class TransferEngine {
public:
    explicit TransferEngine(ProcessedRegistry &registry);

    // Not owned. Replacing the client drops all cached state.
    void setClient(RemoteClient *client);
    RemoteClient *client() const { return client_; }

    void setTransferMode(TransferMode m) { mode_ = m; }
    TransferMode transferMode() const { return mode_; }

    // Local destination; empty means the process working directory.
    void setLocalDirectory(const QString &dir) { localDir_ = dir; }
    const QString &localDirectory() const { return localDir_; }

    // Registered sessions key everything under "." instead of the server PWD.
    void setRegistered(bool on) { registered_ = on; }
    bool registered() const { return registered_; }

    // Ledger is being rewritten: record skipped files again.
    void setRerecordSkipped(bool on) { rerecordSkipped_ = on; }
    void setCaseInsensitiveGlob(bool on) { caseInsensitiveGlob_ = on; }

    bool changeDirectory(const std::string &path);
    std::string currentDirectory();

    GetResult get(const std::string &filename,
                  const std::string &localName = std::string());

    // pattern may carry a directory prefix ("pub/data/*.csv").
    MgetSummary mget(const std::string &pattern, bool recursive = false,
                     const std::string &localName = std::string());

    std::optional<std::uint64_t> size(const std::string &filename);

    static bool fileMatch(const std::string &pattern, const std::string &name,
                          bool caseInsensitive = true);

    const DirectoryCache &cache() const { return cache_; }

private:
    ProcessedRegistry &registry_;
    DirectoryCache cache_;
    RemoteClient *client_ = nullptr;

    TransferMode mode_ = TransferMode::Binary;
    QString localDir_;
    bool registered_ = false;
    bool rerecordSkipped_ = false;
    bool caseInsensitiveGlob_ = true;
    std::optional<std::string> cwd_; // cached until the next cd

    MgetSummary mgetHere(const std::string &glob, bool recursive,
                         const std::string &localName);
    QString localPathFor(const std::string &name) const;
    void recordFetched(const std::string &directory,
                       const std::optional<RemoteEntry> &entry,
                       const QString &localPath);
};

// Hex MD5 of a local file, empty when it cannot be read.
std::string fileMd5(const QString &path);

} // namespace fetchsync
