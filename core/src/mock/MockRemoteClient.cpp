#include "fetchsync/MockRemoteClient.hpp"
#include <algorithm>
#include <cstdio>
#include <fstream>

namespace fetchsync {

std::string MockRemoteFs::Node::longname() const {
    char head[96];
    std::snprintf(head, sizeof(head), "%s   1 owner    group    %10zu ",
                  is_dir ? "drwxr-xr-x" : "-rw-r--r--",
                  is_dir ? static_cast<std::size_t>(4096) : content.size());
    return std::string(head) + stamp + " " + name;
}

void MockRemoteFs::addDir(const std::string &parent, const std::string &name) {
    Node n;
    n.name = name;
    n.is_dir = true;
    dirs[parent].push_back(n);
    dirs[joinRemotePath(parent, name)]; // make it listable, even when empty
}

void MockRemoteFs::addFile(const std::string &dir, const std::string &name,
                           const std::string &content,
                           const std::string &stamp) {
    Node n;
    n.name = name;
    n.content = content;
    n.stamp = stamp;
    dirs[dir].push_back(n);
}

MockRemoteFs::Node *MockRemoteFs::find(const std::string &dir,
                                       const std::string &name) {
    auto it = dirs.find(dir);
    if (it == dirs.end())
        return nullptr;
    for (auto &n : it->second) {
        if (n.name == name)
            return &n;
    }
    return nullptr;
}

std::shared_ptr<MockRemoteFs> MockRemoteFs::sample() {
    auto fs = std::make_shared<MockRemoteFs>();
    fs->dirs["/"];
    fs->addDir("/", "pub");
    fs->addDir("/", "incoming");
    fs->addFile("/", "readme.txt", "welcome\n");
    fs->addDir("/pub", "data");
    fs->addFile("/pub", "report.txt", "report body\n");
    fs->addFile("/pub", "report.TXT.bak", "old report\n");
    fs->addFile("/pub", "notes.md", "notes\n");
    fs->addFile("/pub/data", "obs_0100.csv", "t,p\n1,2\n");
    fs->addFile("/pub/data", "obs_0200.csv", "t,p\n3,4\n");
    // /incoming exists but is empty
    return fs;
}

MockRemoteClient::MockRemoteClient() : fs_(MockRemoteFs::sample()) {}

MockRemoteClient::MockRemoteClient(std::shared_ptr<MockRemoteFs> fs)
    : fs_(std::move(fs)) {}

bool MockRemoteClient::connect(const SessionOptions &opt, std::string &err) {
    ++fs_->connectCalls;
    if (opt.host.empty() || opt.username.empty()) {
        err = "Host and user are required";
        return false;
    }
    connected_ = true;
    lastOpt_ = opt;
    cwd_ = fs_->home;
    return true;
}

void MockRemoteClient::disconnect() { connected_ = false; }

std::string MockRemoteClient::resolve(const std::string &path) const {
    return resolveRemotePath(cwd_, path);
}

bool MockRemoteClient::changeDirectory(const std::string &path,
                                       std::string &err) {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    const std::string target = resolve(path);
    if (fs_->dirs.find(target) == fs_->dirs.end()) {
        err = "550 " + path + ": No such directory";
        return false;
    }
    cwd_ = target;
    return true;
}

bool MockRemoteClient::currentDirectory(std::string &out, std::string &err) {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    out = cwd_;
    return true;
}

bool MockRemoteClient::list(const std::string &remote_path,
                            std::vector<RemoteEntry> &out, std::string &err) {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    ++fs_->listCalls;
    const std::string path = resolve(remote_path.empty() ? "." : remote_path);
    auto it = fs_->dirs.find(path);
    if (it == fs_->dirs.end()) {
        err = "Remote path not found in mock: " + path;
        return false;
    }
    out.clear();
    for (const auto &n : it->second) {
        RemoteEntry e;
        e.directory = remote_path;
        e.name = n.name;
        e.longname = n.longname();
        e.type = n.is_dir ? EntryType::Directory : EntryType::File;
        e.size = n.is_dir ? 0 : n.content.size();
        out.push_back(std::move(e));
    }
    std::sort(out.begin(), out.end(),
              [](const RemoteEntry &a, const RemoteEntry &b) {
                  if (a.isDir() != b.isDir())
                      return a.isDir() > b.isDir(); // dirs first
                  return a.name < b.name;
              });
    return true;
}

bool MockRemoteClient::retrieve(const std::string &remote,
                                const std::string &local, TransferMode mode,
                                std::string &err) {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    ++fs_->retrieveCalls;
    const std::string path = resolve(remote);
    const auto slash = path.find_last_of('/');
    const std::string dir = slash == 0 ? "/" : path.substr(0, slash);
    const MockRemoteFs::Node *node = fs_->find(dir, path.substr(slash + 1));
    if (!node || node->is_dir) {
        err = "550 Failed to open file.";
        return false;
    }

    std::string payload = node->content;
    if (mode == TransferMode::Ascii)
        payload.erase(std::remove(payload.begin(), payload.end(), '\r'),
                      payload.end());

    std::ofstream f(local, std::ios::binary | std::ios::trunc);
    if (!f.is_open()) {
        err = "Could not open local file for writing: " + local;
        return false;
    }
    if (fs_->failRetrieve.count(path)) {
        f << payload.substr(0, payload.size() / 2);
        err = "426 Connection closed; transfer aborted.";
        return false;
    }
    f << payload;
    fs_->retrieved.push_back(path);
    return true;
}

bool MockRemoteClient::size(const std::string &remote, std::uint64_t &out,
                            std::string &err) {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    const std::string path = resolve(remote);
    const auto slash = path.find_last_of('/');
    const std::string dir = slash == 0 ? "/" : path.substr(0, slash);
    const MockRemoteFs::Node *node = fs_->find(dir, path.substr(slash + 1));
    if (!node || node->is_dir || fs_->noSize.count(path)) {
        err = "550 Could not get file size.";
        return false;
    }
    out = node->content.size();
    return true;
}

std::unique_ptr<RemoteClient>
MockRemoteClient::newConnectionLike(const SessionOptions &opt,
                                    std::string &err) {
    auto ptr = std::make_unique<MockRemoteClient>(fs_);
    if (!ptr->connect(opt, err))
        return nullptr;
    return ptr;
}

} // namespace fetchsync
