#pragma once
#include "RemoteClient.hpp"
#include <string>
#include <vector>

typedef void CURL;

namespace fetchsync {

// FTP backend on a single libcurl easy handle, so the control connection is
// reused across requests. libcurl has no persistent CWD, so the working
// directory is tracked here and every request carries an absolute path.
class CurlFtpClient : public RemoteClient {
public:
    CurlFtpClient();
    ~CurlFtpClient() override;

    CurlFtpClient(const CurlFtpClient &) = delete;
    CurlFtpClient &operator=(const CurlFtpClient &) = delete;

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
    CURL *curl_ = nullptr;
    bool connected_ = false;
    std::string baseUrl_; // ftp://host:port
    std::string cwd_;

    // ftp://host:port/%2F<escaped absolute path>[/]
    std::string urlFor(const std::string &absPath, bool asDirectory) const;
    // Reset per-request options left over from the previous transfer.
    void prepare(const std::string &url);
    bool perform(std::string &err);
};

} // namespace fetchsync
