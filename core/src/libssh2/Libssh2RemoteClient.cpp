// libssh2 backend: TCP socket, SSH session and SFTP channel, with keepalive,
// known_hosts validation and password/keyboard-interactive/agent/key auth.
#include "fetchsync/Libssh2RemoteClient.hpp"
#include <libssh2.h>
#include <libssh2_sftp.h>

#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <thread>
#include <vector>

// POSIX sockets
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace fetchsync {

// Global libssh2 initialisation (once per process).
static bool g_libssh2_inited = false;

namespace {

struct KbdIntCtx {
    const char *user;
    const char *pass;
};

char *dupResponse(const char *src, std::size_t len) {
    char *buf = static_cast<char *>(std::malloc(len + 1));
    if (!buf)
        return nullptr;
    std::memcpy(buf, src, len);
    buf[len] = '\0';
    return buf;
}

// Answers keyboard-interactive prompts: prompts mentioning "user"/"name" get
// the user name, everything else the password.
void kbdintCallback(const char *, int, const char *, int, int num_prompts,
                    const LIBSSH2_USERAUTH_KBDINT_PROMPT *prompts,
                    LIBSSH2_USERAUTH_KBDINT_RESPONSE *responses,
                    void **abstract) {
    if (!abstract || !*abstract)
        return;
    const auto *ctx = static_cast<const KbdIntCtx *>(*abstract);
    for (int i = 0; i < num_prompts; ++i) {
        std::string prompt;
        if (prompts && prompts[i].text)
            prompt.assign(reinterpret_cast<const char *>(prompts[i].text),
                          prompts[i].length);
        for (char &c : prompt)
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        const bool wantUser = prompt.find("user") != std::string::npos ||
                              prompt.find("name") != std::string::npos;
        const char *ans = wantUser ? ctx->user : ctx->pass;
        const std::size_t alen = ans ? std::strlen(ans) : 0;
        responses[i].text = alen ? dupResponse(ans, alen) : nullptr;
        responses[i].length =
            responses[i].text ? static_cast<unsigned int>(alen) : 0;
    }
}

int knownHostKeyAlg(int keytype) {
    switch (keytype) {
    case LIBSSH2_HOSTKEY_TYPE_RSA:
        return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
    case LIBSSH2_HOSTKEY_TYPE_DSS:
        return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
    case LIBSSH2_HOSTKEY_TYPE_ED25519:
        return LIBSSH2_KNOWNHOST_KEY_ED25519;
#endif
    default:
        return 0;
    }
}

template <typename Fn> int retryEagain(Fn fn) {
    int rc;
    for (;;) {
        rc = fn();
        if (rc != LIBSSH2_ERROR_EAGAIN)
            break;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return rc;
}

} // namespace

Libssh2RemoteClient::Libssh2RemoteClient() {
    if (!g_libssh2_inited) {
        if (libssh2_init(0) == 0)
            g_libssh2_inited = true;
    }
}

Libssh2RemoteClient::~Libssh2RemoteClient() { disconnect(); }

std::string Libssh2RemoteClient::lastSessionError() const {
    if (!session_)
        return {};
    char *msg = nullptr;
    int len = 0;
    (void)libssh2_session_last_error(session_, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, static_cast<std::size_t>(len))
                            : std::string();
}

bool Libssh2RemoteClient::tcpConnect(const std::string &host,
                                     std::uint16_t port, std::string &err) {
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char portStr[16];
    std::snprintf(portStr, sizeof(portStr), "%u", static_cast<unsigned>(port));

    struct addrinfo *res = nullptr;
    const int gai = getaddrinfo(host.c_str(), portStr, &hints, &res);
    if (gai != 0) {
        err = std::string("getaddrinfo: ") + gai_strerror(gai);
        return false;
    }

    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1)
            continue;
        // SO_RCVTIMEO is left alone during auth; libssh2's own session
        // timeout covers it.
        int on = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &on, sizeof(on));
#if defined(__linux__)
        int idle = 60, intvl = 10, cnt = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
        if (::connect(s, rp->ai_addr, rp->ai_addrlen) == 0) {
            sock_ = s;
            freeaddrinfo(res);
            return true;
        }
        ::close(s);
    }
    freeaddrinfo(res);
    err = "Could not connect to " + host + ":" + portStr;
    return false;
}

bool Libssh2RemoteClient::verifyHostKey(const SessionOptions &opt,
                                        std::string &err) {
    if (opt.known_hosts_policy == KnownHostsPolicy::Off)
        return true;

    LIBSSH2_KNOWNHOSTS *nh = libssh2_knownhost_init(session_);
    if (!nh) {
        err = "Could not initialise known_hosts";
        return false;
    }

    std::string khPath;
    if (opt.known_hosts_path.has_value()) {
        khPath = *opt.known_hosts_path;
    } else if (const char *home = std::getenv("HOME")) {
        khPath = std::string(home) + "/.ssh/known_hosts";
    }

    const bool khLoaded =
        !khPath.empty() &&
        libssh2_knownhost_readfile(nh, khPath.c_str(),
                                   LIBSSH2_KNOWNHOST_FILE_OPENSSH) >= 0;
    if (!khLoaded && opt.known_hosts_policy == KnownHostsPolicy::Strict) {
        libssh2_knownhost_free(nh);
        err = "known_hosts missing or unreadable (strict policy)";
        return false;
    }

    size_t keylen = 0;
    int keytype = 0;
    const char *hostkey = libssh2_session_hostkey(session_, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        libssh2_knownhost_free(nh);
        err = "Could not obtain the server host key";
        return false;
    }

    const int alg = knownHostKeyAlg(keytype);
    const int port = opt.port ? opt.port : 22;
    struct libssh2_knownhost *host = nullptr;
    int check = libssh2_knownhost_checkp(
        nh, opt.host.c_str(), port, hostkey, keylen,
        LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg,
        &host);
    if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        check = libssh2_knownhost_checkp(
            nh, opt.host.c_str(), port, hostkey, keylen,
            LIBSSH2_KNOWNHOST_TYPE_SHA1 | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg,
            &host);
    }

    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        libssh2_knownhost_free(nh);
        return true;
    }
    if (opt.known_hosts_policy == KnownHostsPolicy::AcceptNew &&
        check == LIBSSH2_KNOWNHOST_CHECK_NOTFOUND) {
        // Unattended TOFU: record the new host and carry on.
        if (khPath.empty()) {
            libssh2_knownhost_free(nh);
            err = "known_hosts path is not defined";
            return false;
        }
        const int addrc = libssh2_knownhost_addc(
            nh, opt.host.c_str(), nullptr, hostkey, keylen, nullptr, 0,
            LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg,
            nullptr);
        const bool ok = addrc == 0 &&
                        libssh2_knownhost_writefile(
                            nh, khPath.c_str(),
                            LIBSSH2_KNOWNHOST_FILE_OPENSSH) == 0;
        libssh2_knownhost_free(nh);
        if (!ok)
            err = "Could not write new host to known_hosts";
        return ok;
    }
    libssh2_knownhost_free(nh);
    err = check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH
              ? "Host key does not match known_hosts"
              : "Host not found in known_hosts";
    return false;
}

bool Libssh2RemoteClient::authWithAgent(const std::string &user) {
    LIBSSH2_AGENT *agent = libssh2_agent_init(session_);
    bool authed = false;
    if (agent && libssh2_agent_connect(agent) == 0 &&
        libssh2_agent_list_identities(agent) == 0) {
        struct libssh2_agent_publickey *identity = nullptr;
        struct libssh2_agent_publickey *prev = nullptr;
        const int kMaxAgentTries = 3;
        int tries = 0;
        while (tries < kMaxAgentTries &&
               libssh2_agent_get_identity(agent, &identity, prev) == 0) {
            prev = identity;
            ++tries;
            const int rc = retryEagain([&] {
                return libssh2_agent_userauth(agent, user.c_str(), identity);
            });
            if (rc == 0) {
                authed = true;
                break;
            }
        }
    }
    if (agent) {
        libssh2_agent_disconnect(agent);
        libssh2_agent_free(agent);
    }
    return authed;
}

// Order: explicit private key, then password (keyboard-interactive as the
// fallback), then ssh-agent as last resort.
bool Libssh2RemoteClient::authenticate(const SessionOptions &opt,
                                       std::string &err) {
    const std::string &user = opt.username;
    if (opt.private_key_path.has_value()) {
        const char *passphrase = opt.private_key_passphrase
                                     ? opt.private_key_passphrase->c_str()
                                     : nullptr;
        const int rc = retryEagain([&] {
            return libssh2_userauth_publickey_fromfile(
                session_, user.c_str(), nullptr,
                opt.private_key_path->c_str(), passphrase);
        });
        if (rc != 0) {
            err = "Private key authentication failed: " + lastSessionError();
            return false;
        }
        return true;
    }

    auto authMethods = [&]() {
        char *methods = libssh2_userauth_list(
            session_, user.c_str(), static_cast<unsigned>(user.size()));
        return methods ? std::string(methods) : std::string();
    };

    if (opt.password.has_value()) {
        const int rcPw = retryEagain([&] {
            return libssh2_userauth_password(session_, user.c_str(),
                                             opt.password->c_str());
        });
        if (rcPw == 0)
            return true;
        if (rcPw == LIBSSH2_ERROR_SOCKET_DISCONNECT ||
            rcPw == LIBSSH2_ERROR_SOCKET_SEND ||
            rcPw == LIBSSH2_ERROR_SOCKET_RECV) {
            err = "Server closed the connection after the password attempt";
            return false;
        }
        const std::string methods = authMethods();
        if (methods.find("keyboard-interactive") != std::string::npos) {
            KbdIntCtx ctx{user.c_str(), opt.password->c_str()};
            void **abs = libssh2_session_abstract(session_);
            if (abs)
                *abs = &ctx;
            const int rcKbd = retryEagain([&] {
                return libssh2_userauth_keyboard_interactive(
                    session_, user.c_str(), kbdintCallback);
            });
            if (abs)
                *abs = nullptr;
            if (rcKbd == 0)
                return true;
        }
        if (methods.find("publickey") != std::string::npos &&
            authWithAgent(user))
            return true;
        err = "Password authentication failed" +
              (methods.empty() ? std::string()
                               : " (server methods: " + methods + ")");
        const std::string last = lastSessionError();
        if (!last.empty())
            err += ": " + last;
        return false;
    }

    if (authMethods().find("publickey") != std::string::npos &&
        authWithAgent(user))
        return true;
    err = "No credentials: no private key, password or usable agent identity";
    return false;
}

bool Libssh2RemoteClient::sshHandshakeAuth(const SessionOptions &opt,
                                           std::string &err) {
    session_ = libssh2_session_init();
    if (!session_) {
        err = "libssh2_session_init failed";
        return false;
    }
    if (libssh2_session_handshake(session_, sock_) != 0) {
        err = "SSH handshake failed: " + lastSessionError();
        return false;
    }

    libssh2_session_set_blocking(session_, 1);
    libssh2_session_set_timeout(session_, opt.timeout_seconds * 1000L);
    libssh2_keepalive_config(session_, 1, 30);

    if (!verifyHostKey(opt, err))
        return false;
    if (!authenticate(opt, err))
        return false;

    sftp_ = libssh2_sftp_init(session_);
    if (!sftp_) {
        err = "Could not start the SFTP subsystem";
        return false;
    }
    return true;
}

bool Libssh2RemoteClient::connect(const SessionOptions &opt,
                                  std::string &err) {
    if (connected_) {
        err = "Already connected";
        return false;
    }
    if (opt.host.empty() || opt.username.empty()) {
        err = "Host and user are required";
        return false;
    }
    const std::uint16_t port = opt.port ? opt.port : 22;
    if (!tcpConnect(opt.host, port, err) ||
        !sshHandshakeAuth(opt, err)) {
        disconnect();
        return false;
    }
    if (!canonicalPath(".", cwd_))
        cwd_ = "/";
    connected_ = true;
    return true;
}

void Libssh2RemoteClient::disconnect() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        libssh2_session_disconnect(session_, "bye");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != -1) {
        ::close(sock_);
        sock_ = -1;
    }
    connected_ = false;
    cwd_.clear();
}

bool Libssh2RemoteClient::canonicalPath(const std::string &path, std::string &out) {
    char buf[1024];
    const int rc = libssh2_sftp_realpath(sftp_, path.c_str(), buf,
                                         static_cast<unsigned>(sizeof(buf)));
    if (rc <= 0)
        return false;
    out.assign(buf, static_cast<std::size_t>(rc));
    return true;
}

std::string Libssh2RemoteClient::absolute(const std::string &path) const {
    if (path.empty() || path == ".")
        return cwd_;
    return joinRemotePath(cwd_, path);
}

bool Libssh2RemoteClient::changeDirectory(const std::string &path,
                                          std::string &err) {
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }
    std::string target;
    if (!canonicalPath(absolute(path), target)) {
        err = "No such directory: " + path;
        return false;
    }
    LIBSSH2_SFTP_ATTRIBUTES st{};
    if (libssh2_sftp_stat_ex(sftp_, target.c_str(),
                             static_cast<unsigned>(target.size()),
                             LIBSSH2_SFTP_STAT, &st) != 0) {
        err = "Cannot stat directory: " + target;
        return false;
    }
    if ((st.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) &&
        (st.permissions & LIBSSH2_SFTP_S_IFMT) != LIBSSH2_SFTP_S_IFDIR) {
        err = "Not a directory: " + target;
        return false;
    }
    cwd_ = target;
    return true;
}

bool Libssh2RemoteClient::currentDirectory(std::string &out, std::string &err) {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    out = cwd_;
    return true;
}

bool Libssh2RemoteClient::list(const std::string &remote_path,
                               std::vector<RemoteEntry> &out,
                               std::string &err) {
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }
    const std::string path = absolute(remote_path);
    LIBSSH2_SFTP_HANDLE *dir = libssh2_sftp_opendir(sftp_, path.c_str());
    if (!dir) {
        err = "sftp_opendir failed for: " + path;
        return false;
    }

    out.clear();
    char filename[512];
    char longentry[1024];
    LIBSSH2_SFTP_ATTRIBUTES attrs;
    for (;;) {
        std::memset(&attrs, 0, sizeof(attrs));
        const int rc = libssh2_sftp_readdir_ex(dir, filename, sizeof(filename),
                                               longentry, sizeof(longentry),
                                               &attrs);
        if (rc == 0)
            break;
        if (rc < 0) {
            err = "sftp_readdir_ex failed: " + lastSessionError();
            libssh2_sftp_closedir(dir);
            return false;
        }
        RemoteEntry e;
        e.directory = remote_path;
        e.name.assign(filename, static_cast<std::size_t>(rc));
        if (e.name == "." || e.name == "..")
            continue;
        e.longname = longentry;
        if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
            const unsigned long fmt = attrs.permissions & LIBSSH2_SFTP_S_IFMT;
            e.type = fmt == LIBSSH2_SFTP_S_IFDIR   ? EntryType::Directory
                     : fmt == LIBSSH2_SFTP_S_IFREG ? EntryType::File
                                                   : EntryType::Other;
        } else {
            e.type = (!e.longname.empty() && e.longname[0] == 'd')
                         ? EntryType::Directory
                         : EntryType::File;
        }
        if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE)
            e.size = attrs.filesize;
        if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME)
            e.mtime = attrs.mtime;
        out.push_back(std::move(e));
    }
    libssh2_sftp_closedir(dir);
    return true;
}

// SFTP has no text mode: ascii requests are transferred byte for byte.
bool Libssh2RemoteClient::retrieve(const std::string &remote,
                                   const std::string &local, TransferMode,
                                   std::string &err) {
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }
    const std::string path = absolute(remote);
    LIBSSH2_SFTP_HANDLE *rh = libssh2_sftp_open_ex(
        sftp_, path.c_str(), static_cast<unsigned>(path.size()),
        LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
    if (!rh) {
        err = "Could not open remote file for reading: " + path;
        return false;
    }

    FILE *lf = std::fopen(local.c_str(), "wb");
    if (!lf) {
        libssh2_sftp_close(rh);
        err = "Could not open local file for writing: " + local;
        return false;
    }

    std::vector<char> buf(64 * 1024);
    bool ok = true;
    for (;;) {
        const ssize_t n = libssh2_sftp_read(rh, buf.data(), buf.size());
        if (n == 0)
            break;
        if (n < 0) {
            err = "Remote read failed: " + lastSessionError();
            ok = false;
            break;
        }
        if (std::fwrite(buf.data(), 1, static_cast<std::size_t>(n), lf) !=
            static_cast<std::size_t>(n)) {
            err = "Local write failed: " + local;
            ok = false;
            break;
        }
    }
    if (std::fclose(lf) != 0 && ok) {
        err = "Local write failed: " + local;
        ok = false;
    }
    libssh2_sftp_close(rh);
    return ok;
}

bool Libssh2RemoteClient::size(const std::string &remote, std::uint64_t &out,
                               std::string &err) {
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }
    const std::string path = absolute(remote);
    LIBSSH2_SFTP_ATTRIBUTES st{};
    if (libssh2_sftp_stat_ex(sftp_, path.c_str(),
                             static_cast<unsigned>(path.size()),
                             LIBSSH2_SFTP_LSTAT, &st) != 0) {
        err = "Remote stat failed: " + path;
        return false;
    }
    if (!(st.flags & LIBSSH2_SFTP_ATTR_SIZE)) {
        err = "Server did not report a size for " + path;
        return false;
    }
    out = st.filesize;
    return true;
}

std::unique_ptr<RemoteClient>
Libssh2RemoteClient::newConnectionLike(const SessionOptions &opt,
                                       std::string &err) {
    auto ptr = std::make_unique<Libssh2RemoteClient>();
    if (!ptr->connect(opt, err))
        return nullptr;
    return ptr;
}

} // namespace fetchsync
