#pragma once
#include "RemoteClient.hpp"
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace fetchsync {

// Simulated remote tree. Shared between a MockRemoteClient and the clients it
// creates through newConnectionLike so tests can inspect and mutate it.
struct MockRemoteFs {
    struct Node {
        std::string name;
        bool is_dir = false;
        std::string content;
        std::string stamp = "Apr 28 23:24"; // date column of the listing line
        std::string longname() const;
    };

    // absolute directory -> entries
    std::map<std::string, std::vector<Node>> dirs;
    std::set<std::string> failRetrieve; // absolute paths whose download breaks
    std::set<std::string> noSize;       // absolute paths without SIZE support
    std::string home = "/";

    int listCalls = 0;
    int retrieveCalls = 0;
    int connectCalls = 0;
    std::vector<std::string> retrieved; // absolute paths, in order

    void addDir(const std::string &parent, const std::string &name);
    void addFile(const std::string &dir, const std::string &name,
                 const std::string &content,
                 const std::string &stamp = "Apr 28 23:24");
    Node *find(const std::string &dir, const std::string &name);

    // The default tree used by the unit tests.
    static std::shared_ptr<MockRemoteFs> sample();
};

class MockRemoteClient : public RemoteClient {
public:
    MockRemoteClient();
    explicit MockRemoteClient(std::shared_ptr<MockRemoteFs> fs);

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

    MockRemoteFs &fs() { return *fs_; }
    const SessionOptions &lastOptions() const { return lastOpt_; }

private:
    std::shared_ptr<MockRemoteFs> fs_;
    bool connected_ = false;
    SessionOptions lastOpt_{};
    std::string cwd_ = "/";

    std::string resolve(const std::string &path) const;
};

} // namespace fetchsync
