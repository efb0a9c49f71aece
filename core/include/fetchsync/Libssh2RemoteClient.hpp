#pragma once
#include "RemoteClient.hpp"
#include <string>
#include <vector>

// Forward declarations of libssh2's internal (underscore) types.
struct _LIBSSH2_SESSION;
struct _LIBSSH2_SFTP;

namespace fetchsync {

// SFTP backend: owns the TCP socket, the SSH session and the SFTP channel.
// SFTP has no server-side working directory, so it is tracked here.
class Libssh2RemoteClient : public RemoteClient {
public:
    Libssh2RemoteClient();
    ~Libssh2RemoteClient() override;

    Libssh2RemoteClient(const Libssh2RemoteClient &) = delete;
    Libssh2RemoteClient &operator=(const Libssh2RemoteClient &) = delete;

    bool connect(const SessionOptions &opt, std::string &err) override;
    void disconnect() override;
    bool isConnected() const override { return connected_; }

    bool changeDirectory(const std::string &path, std::string &err) override;
    bool currentDirectory(std::string &out, std::string &err) override;

    bool list(const std::string &remote_path, std::vector<RemoteEntry> &out,
              std::string &err) override;

    bool retrieve(const std::string &remote, const std::string &local,
                  TransferMode mode, std::string &err) override;

    bool size(const std::string &remote, std::uint64_t &out,
              std::string &err) override;

    std::unique_ptr<RemoteClient>
    newConnectionLike(const SessionOptions &opt, std::string &err) override;

private:
    bool connected_ = false;
    int sock_ = -1;
    _LIBSSH2_SESSION *session_ = nullptr;
    _LIBSSH2_SFTP *sftp_ = nullptr;
    std::string cwd_;

    bool tcpConnect(const std::string &host, std::uint16_t port,
                    std::string &err);
    bool sshHandshakeAuth(const SessionOptions &opt, std::string &err);
    bool verifyHostKey(const SessionOptions &opt, std::string &err);
    bool authenticate(const SessionOptions &opt, std::string &err);
    bool authWithAgent(const std::string &user);
    bool canonicalPath(const std::string &path, std::string &out);
    std::string absolute(const std::string &path) const;
    std::string lastSessionError() const;
};

} // namespace fetchsync
