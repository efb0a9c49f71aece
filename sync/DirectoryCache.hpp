// Per-session cache of remote directory listings.
#pragma once
#include "fetchsync/RemoteTypes.hpp"
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace fetchsync {

class RemoteClient;

// Listings are keyed by the directory string the engine uses (the server's
// working directory, or "." for registered sessions). A listing that fails or
// comes back empty counts against the directory; once kMaxFailedDirectories
// distinct directories have failed, warm() throws SyncAborted.
class DirectoryCache {
public:
    static constexpr int kMaxFailedDirectories = 3;

    // Not owned.
    void setClient(RemoteClient *c) { client_ = c; }

    // Drops every cached listing. Failure counts are kept for the whole run.
    void resetAll();

    void set(const std::string &dir, const std::string &name,
             const RemoteEntry &entry);
    std::optional<RemoteEntry> get(const std::string &dir,
                                   const std::string &name) const;
    bool isWarm(const std::string &dir) const;

    // Lists dir (exactly one round trip), caches and returns the entries.
    std::vector<RemoteEntry> warm(const std::string &dir);

    const std::set<std::string> &failedDirectories() const { return failed_; }

private:
    RemoteClient *client_ = nullptr;
    std::unordered_map<std::string,
                       std::unordered_map<std::string, RemoteEntry>>
        dirs_;
    std::set<std::string> failed_;

    void recordFailure(const std::string &dir, const std::string &why);
};

} // namespace fetchsync
