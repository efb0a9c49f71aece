// Integration tests for the libssh2 SFTP backend and the transfer engine
// against a real server. Skipped (exit code 77) unless the FETCHSYNC_IT_*
// variables are set. FETCHSYNC_IT_REMOTE_DIR must hold at least one
// non-empty regular file; nothing is written on the server.
#include "ProcessedRegistry.hpp"
#include "TransferEngine.hpp"
#include "fetchsync/Libssh2RemoteClient.hpp"

#include <QDir>
#include <QTemporaryDir>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr int kSkipExitCode = 77;

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }
};

std::optional<std::string> envValue(const char *key) {
    const char *raw = std::getenv(key);
    if (!raw || !*raw)
        return std::nullopt;
    return std::string(raw);
}

bool parsePort(const std::optional<std::string> &raw, std::uint16_t &out) {
    if (!raw.has_value()) {
        out = 22;
        return true;
    }
    const std::string &s = *raw;
    if (s.empty() || s.size() > 5 ||
        !std::all_of(s.begin(), s.end(),
                     [](unsigned char c) { return c >= '0' && c <= '9'; }))
        return false;
    const int n = std::stoi(s);
    if (n < 1 || n > 65535)
        return false;
    out = static_cast<std::uint16_t>(n);
    return true;
}

} // namespace

int main() {
    const auto host = envValue("FETCHSYNC_IT_SFTP_HOST");
    const auto user = envValue("FETCHSYNC_IT_SFTP_USER");
    const auto pass = envValue("FETCHSYNC_IT_SFTP_PASS");
    const auto keyPath = envValue("FETCHSYNC_IT_SFTP_KEY");
    const auto keyPassphrase = envValue("FETCHSYNC_IT_SFTP_KEY_PASSPHRASE");
    const auto remoteDir = envValue("FETCHSYNC_IT_REMOTE_DIR");

    if (!host.has_value() || !user.has_value() || !remoteDir.has_value() ||
        (!pass.has_value() && !keyPath.has_value())) {
        std::cout << "[SKIP] fetchsync_sftp_integration_tests requires env "
                     "vars: FETCHSYNC_IT_SFTP_HOST, FETCHSYNC_IT_SFTP_USER, "
                     "FETCHSYNC_IT_REMOTE_DIR and one auth method "
                  << "(FETCHSYNC_IT_SFTP_PASS or FETCHSYNC_IT_SFTP_KEY)\n";
        return kSkipExitCode;
    }
    if (keyPath.has_value() && !fs::exists(*keyPath)) {
        std::cerr << "[FAIL] FETCHSYNC_IT_SFTP_KEY does not exist: "
                  << *keyPath << "\n";
        return EXIT_FAILURE;
    }

    std::uint16_t port = 22;
    if (!parsePort(envValue("FETCHSYNC_IT_SFTP_PORT"), port)) {
        std::cerr << "[FAIL] FETCHSYNC_IT_SFTP_PORT is invalid\n";
        return EXIT_FAILURE;
    }

    TestContext t;
    fetchsync::SessionOptions opt;
    opt.host = *host;
    opt.port = port;
    opt.username = *user;
    if (pass.has_value())
        opt.password = *pass;
    if (keyPath.has_value()) {
        opt.private_key_path = *keyPath;
        if (keyPassphrase.has_value())
            opt.private_key_passphrase = *keyPassphrase;
    }
    opt.known_hosts_policy = fetchsync::KnownHostsPolicy::Off;

    QTemporaryDir tmp;
    if (!tmp.isValid()) {
        std::cerr << "[FAIL] could not create temp dir\n";
        return EXIT_FAILURE;
    }

    fetchsync::Libssh2RemoteClient prototype;
    std::string err;
    auto client = prototype.newConnectionLike(opt, err);
    t.check(static_cast<bool>(client), "connect should succeed: " + err);

    std::string cwd;
    if (t.failures == 0) {
        err.clear();
        t.check(client->changeDirectory(*remoteDir, err),
                "cd to the remote dir should succeed: " + err);
        t.check(client->currentDirectory(cwd, err) && !cwd.empty() &&
                    cwd.front() == '/',
                "the working directory should be absolute");
    }

    std::optional<fetchsync::RemoteEntry> sample;
    if (t.failures == 0) {
        std::vector<fetchsync::RemoteEntry> entries;
        err.clear();
        t.check(client->list(".", entries, err),
                "list of the remote dir should succeed: " + err);
        for (const auto &e : entries) {
            t.check(e.name != "." && e.name != "..",
                    "listing should not contain dot entries");
            t.check(!e.longname.empty(), "entries should carry a longname");
            if (!sample && e.isFile() && e.size > 0)
                sample = e;
        }
        t.check(sample.has_value(),
                "FETCHSYNC_IT_REMOTE_DIR should contain a non-empty file");
    }

    if (t.failures == 0) {
        std::uint64_t n = 0;
        err.clear();
        t.check(client->size(sample->name, n, err),
                "size should succeed: " + err);
        t.check(n == sample->size, "size should match the listing");
    }

    if (t.failures == 0) {
        fetchsync::ProcessedRegistry registry(tmp.filePath("ledger.dat"));
        fetchsync::TransferEngine engine(registry);
        engine.setClient(client.get());
        engine.setLocalDirectory(tmp.path());
        t.check(engine.get(sample->name) == fetchsync::GetResult::Fetched,
                "first engine get should fetch");
        const QString local =
            QDir(tmp.path()).filePath(QString::fromStdString(sample->name));
        std::error_code ec;
        t.check(fs::file_size(local.toStdString(), ec) == sample->size,
                "downloaded size should match the listing");
        t.check(engine.get(sample->name) == fetchsync::GetResult::Skipped,
                "second engine get should skip the unchanged file");
    }

    if (t.failures == 0) {
        err.clear();
        t.check(!client->changeDirectory("fetchsync-no-such-dir", err),
                "cd to a missing directory should fail");
        std::string after;
        t.check(client->currentDirectory(after, err) && after == cwd,
                "a failed cd should not move the working directory");
    }

    if (client)
        client->disconnect();

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] fetchsync_sftp_integration_tests\n";
    return EXIT_SUCCESS;
}
