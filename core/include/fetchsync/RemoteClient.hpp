// Abstract interface for a remote file session. Concrete backends (libssh2
// SFTP, libcurl FTP, mock) implement it so the sync engine stays protocol
// agnostic.
#pragma once
#include "RemoteTypes.hpp"
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace fetchsync {

class RemoteClient {
public:
    virtual ~RemoteClient() = default;

    // Open the transport and authenticate with the credentials in opt.
    virtual bool connect(const SessionOptions &opt, std::string &err) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // Working directory on the server. Relative paths resolve against it.
    virtual bool changeDirectory(const std::string &path, std::string &err) = 0;
    virtual bool currentDirectory(std::string &out, std::string &err) = 0;

    // One round trip. "." and ".." are never returned.
    virtual bool list(const std::string &remote_path,
                      std::vector<RemoteEntry> &out,
                      std::string &err) = 0;

    // Download remote to local. On failure the local file may hold a partial
    // copy; removing it is up to the caller.
    virtual bool retrieve(const std::string &remote,
                          const std::string &local,
                          TransferMode mode,
                          std::string &err) = 0;

    // Fails (leaving out untouched) when the server cannot report a size.
    virtual bool size(const std::string &remote, std::uint64_t &out,
                      std::string &err) = 0;

    // Create a new, connected client of the same kind.
    virtual std::unique_ptr<RemoteClient>
    newConnectionLike(const SessionOptions &opt, std::string &err) = 0;
};

// Join a remote directory and a name with exactly one separator.
inline std::string joinRemotePath(const std::string &base,
                                  const std::string &name) {
    if (name.empty())
        return base;
    if (name.front() == '/')
        return name;
    if (base.empty())
        return name;
    if (base.back() == '/')
        return base + name;
    return base + "/" + name;
}

// Resolve path against the absolute directory cwd, folding "." and ".."
// segments. The result is absolute and has no trailing slash (except "/").
inline std::string resolveRemotePath(const std::string &cwd,
                                     const std::string &path) {
    const std::string joined = joinRemotePath(cwd.empty() ? "/" : cwd, path);
    std::vector<std::string> parts;
    std::istringstream in(joined);
    std::string seg;
    while (std::getline(in, seg, '/')) {
        if (seg.empty() || seg == ".")
            continue;
        if (seg == "..") {
            if (!parts.empty())
                parts.pop_back();
            continue;
        }
        parts.push_back(seg);
    }
    std::string out;
    for (const auto &p : parts)
        out += "/" + p;
    return out.empty() ? "/" : out;
}

} // namespace fetchsync
