// Core unit tests without external framework (run via CTest).
#include "fetchsync/ListingParser.hpp"
#include "fetchsync/MockRemoteClient.hpp"
#include "fetchsync/RuntimeLogging.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }

    void checkContains(const std::string &haystack, const std::string &needle,
                       const std::string &msg) {
        check(haystack.find(needle) != std::string::npos, msg);
    }
};

fetchsync::SessionOptions validOptions() {
    fetchsync::SessionOptions opt;
    opt.host = "example.test";
    opt.username = "alice";
    return opt;
}

std::string readFile(const std::string &path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void test_session_defaults(TestContext &t) {
    fetchsync::SessionOptions o;
    t.check(o.port == 0, "default port should be 0 (protocol default)");
    t.check(o.known_hosts_policy == fetchsync::KnownHostsPolicy::Off,
            "default known_hosts_policy should be Off");
    t.check(o.timeout_seconds == 30, "default timeout should be 30 seconds");
    t.check(o.ftp_passive, "FTP should default to passive mode");
    t.check(!o.password.has_value(), "password should be empty by default");
    t.check(!o.private_key_path.has_value(),
            "private_key_path should be empty by default");
}

void test_connect_validation(TestContext &t) {
    fetchsync::MockRemoteClient c;
    std::string err;
    fetchsync::SessionOptions opt;
    opt.username = "user";
    t.check(!c.connect(opt, err), "connect should fail when host is empty");
    t.check(!err.empty(), "connect failure should report an error");

    err.clear();
    opt.host = "example.test";
    opt.username.clear();
    t.check(!c.connect(opt, err), "connect should fail when user is empty");

    err.clear();
    t.check(c.connect(validOptions(), err), "connect should succeed");
    t.check(c.isConnected(), "client should report connected");
}

void test_disconnect_changes_state(TestContext &t) {
    fetchsync::MockRemoteClient c;
    std::string err;
    t.check(c.connect(validOptions(), err), "connect should succeed");
    c.disconnect();
    t.check(!c.isConnected(), "disconnect should clear connected state");
    std::vector<fetchsync::RemoteEntry> out;
    t.check(!c.list("/", out, err), "list after disconnect should fail");
    t.checkContains(err, "Not connected", "error should say not connected");
}

void test_list_sorting_and_known_path(TestContext &t) {
    fetchsync::MockRemoteClient c;
    std::string err;
    t.check(c.connect(validOptions(), err), "connect should succeed");
    std::vector<fetchsync::RemoteEntry> out;
    t.check(c.list("/pub", out, err), "list /pub should succeed");
    t.check(out.size() == 4, "/pub should have 4 entries");
    if (out.size() == 4) {
        t.check(out[0].isDir() && out[0].name == "data",
                "directories should be listed first");
        t.check(out[1].name == "notes.md", "files should be sorted by name");
        t.check(out[0].directory == "/pub",
                "entries should carry the listed directory");
    }
    for (const auto &e : out) {
        t.checkContains(e.longname, e.name,
                        "longname should end with the entry name");
    }
}

void test_change_directory(TestContext &t) {
    fetchsync::MockRemoteClient c;
    std::string err, cwd;
    t.check(c.connect(validOptions(), err), "connect should succeed");
    t.check(c.currentDirectory(cwd, err) && cwd == "/",
            "initial directory should be the home directory");
    t.check(c.changeDirectory("pub/data", err), "relative cd should succeed");
    t.check(c.currentDirectory(cwd, err) && cwd == "/pub/data",
            "cwd should follow relative cd");
    t.check(c.changeDirectory("..", err), "cd .. should succeed");
    t.check(c.currentDirectory(cwd, err) && cwd == "/pub",
            "cd .. should go to the parent");
    err.clear();
    t.check(!c.changeDirectory("missing", err), "cd to missing dir fails");
    t.checkContains(err, "550", "missing dir error should carry a reply code");
    t.check(c.currentDirectory(cwd, err) && cwd == "/pub",
            "failed cd should not move the working directory");

    std::vector<fetchsync::RemoteEntry> out;
    t.check(c.list(".", out, err) && out.size() == 4,
            "list . should list the working directory");
}

void test_retrieve_and_failures(TestContext &t) {
    fetchsync::MockRemoteClient c;
    std::string err;
    t.check(c.connect(validOptions(), err), "connect should succeed");
    const std::string local = "fetchsync_core_retrieve.tmp";

    t.check(c.retrieve("/pub/report.txt", local,
                       fetchsync::TransferMode::Binary, err),
            "retrieve of an existing file should succeed");
    t.check(readFile(local) == "report body\n",
            "retrieved content should match the remote file");
    t.check(c.fs().retrieved.size() == 1 &&
                c.fs().retrieved[0] == "/pub/report.txt",
            "mock should remember retrieved paths");

    c.fs().failRetrieve.insert("/pub/notes.md");
    err.clear();
    t.check(!c.retrieve("/pub/notes.md", local,
                        fetchsync::TransferMode::Binary, err),
            "broken transfer should fail");
    t.checkContains(err, "426", "broken transfer should report 426");

    err.clear();
    t.check(!c.retrieve("/pub/data", local, fetchsync::TransferMode::Binary,
                        err),
            "retrieving a directory should fail");
    std::remove(local.c_str());
}

void test_ascii_mode_strips_cr(TestContext &t) {
    auto fs = fetchsync::MockRemoteFs::sample();
    fs->addFile("/", "dos.txt", "a\r\nb\r\n");
    fetchsync::MockRemoteClient c(fs);
    std::string err;
    t.check(c.connect(validOptions(), err), "connect should succeed");
    const std::string local = "fetchsync_core_ascii.tmp";
    t.check(c.retrieve("dos.txt", local, fetchsync::TransferMode::Ascii, err),
            "ascii retrieve should succeed");
    t.check(readFile(local) == "a\nb\n", "ascii mode should drop CR");
    std::remove(local.c_str());
}

void test_size(TestContext &t) {
    fetchsync::MockRemoteClient c;
    std::string err;
    t.check(c.connect(validOptions(), err), "connect should succeed");
    std::uint64_t n = 0;
    t.check(c.size("/readme.txt", n, err) && n == 8,
            "size should report the content length");
    c.fs().noSize.insert("/readme.txt");
    n = 77;
    t.check(!c.size("/readme.txt", n, err),
            "size should fail when the server cannot report it");
    t.check(n == 77, "failed size should leave the output untouched");
}

void test_new_connection_like(TestContext &t) {
    fetchsync::MockRemoteClient c;
    std::string err;
    auto conn = c.newConnectionLike(validOptions(), err);
    t.check(static_cast<bool>(conn), "newConnectionLike should succeed");
    t.check(conn && conn->isConnected(),
            "newConnectionLike should return a connected client");
    t.check(!c.isConnected(), "the prototype itself stays disconnected");
    t.check(c.fs().connectCalls == 1,
            "the new client should share the prototype's remote tree");

    fetchsync::SessionOptions bad;
    bad.username = "alice";
    err.clear();
    auto none = c.newConnectionLike(bad, err);
    t.check(!none, "newConnectionLike should fail with invalid options");
    t.check(!err.empty(), "newConnectionLike should report validation errors");
}

void test_remote_path_helpers(TestContext &t) {
    t.check(fetchsync::joinRemotePath("/pub", "a.txt") == "/pub/a.txt",
            "join should add one separator");
    t.check(fetchsync::joinRemotePath("/pub/", "a.txt") == "/pub/a.txt",
            "join should not double the separator");
    t.check(fetchsync::joinRemotePath("/pub", "/abs") == "/abs",
            "join should keep absolute names");
    t.check(fetchsync::resolveRemotePath("/pub/data", "../x") == "/pub/x",
            "resolve should fold ..");
    t.check(fetchsync::resolveRemotePath("/pub", ".") == "/pub",
            "resolve should fold .");
    t.check(fetchsync::resolveRemotePath("/", "..") == "/",
            "resolve should not climb above the root");
}

void test_parse_unix_listing_line(TestContext &t) {
    fetchsync::RemoteEntry e;
    const std::string line =
        "-rw-r--r--   1 ftp      ftp        123456 Apr 28 23:24 IDY12345.txt\r";
    t.check(fetchsync::parseListingLine(line, e), "unix file line parses");
    t.check(e.name == "IDY12345.txt", "name is the last token");
    t.check(e.isFile(), "leading - means a file");
    t.check(e.size == 123456, "size comes from the fifth column");
    t.check(e.longname.back() != '\r', "longname drops the line ending");

    t.check(fetchsync::parseListingLine(
                "drwxr-xr-x   2 ftp      ftp          4096 Jan  1  2024 radar",
                e),
            "unix directory line parses");
    t.check(e.isDir() && e.name == "radar", "leading d means a directory");

    t.check(!fetchsync::parseListingLine("total 42", e),
            "summary lines are not entries");
    t.check(!fetchsync::parseListingLine("", e), "blank lines are not entries");
}

void test_parse_dos_listing_line(TestContext &t) {
    fetchsync::RemoteEntry e;
    t.check(fetchsync::parseListingLine(
                "04-28-24  11:24PM       <DIR>          archive", e),
            "DOS directory line parses");
    t.check(e.isDir() && e.name == "archive", "<DIR> marks a directory");
    t.check(fetchsync::parseListingLine(
                "2024-04-28  23:24            1024 data.csv", e),
            "DOS file line with ISO date parses");
    t.check(e.isFile() && e.size == 1024 && e.name == "data.csv",
            "DOS file line gives name and size");
}

void test_parse_oversized_size_column(TestContext &t) {
    fetchsync::RemoteEntry e;
    t.check(fetchsync::parseListingLine(
                "-rw-r--r--   1 owner group 1234567890123456789012345 "
                "Apr 28 23:24 big.dat",
                e),
            "a size column beyond 64 bits still parses");
    t.check(e.isFile() && e.name == "big.dat" && e.size == 0,
            "an unrepresentable size is reported as 0");
    t.check(fetchsync::parseListingLine(
                "2024-04-28  23:24  99999999999999999999999 huge.csv", e),
            "an oversized DOS size still parses");
    t.check(e.name == "huge.csv" && e.size == 0,
            "an oversized DOS size is reported as 0");
}

void test_parse_listing_text(TestContext &t) {
    const std::string text =
        "total 3\r\n"
        "drwxr-xr-x   2 ftp ftp 4096 Apr 28 23:24 .\r\n"
        "drwxr-xr-x   2 ftp ftp 4096 Apr 28 23:24 ..\r\n"
        "-rw-r--r--   1 ftp ftp   10 Apr 28 23:24 a.txt\r\n"
        "-rw-r--r--   1 ftp ftp   20 Apr 28 23:24 b.txt\n";
    const auto entries = fetchsync::parseListing(text, "/pub");
    t.check(entries.size() == 2, "dot entries and summary are dropped");
    if (entries.size() == 2) {
        t.check(entries[0].name == "a.txt" && entries[1].name == "b.txt",
                "entries keep server order");
        t.check(entries[0].directory == "/pub",
                "entries carry the listed directory");
    }
}

void test_mask_secret(TestContext &t) {
    if (fetchsync::sensitiveLoggingEnabled()) {
        std::cout << "[SKIP] test_mask_secret (sensitive logging enabled)\n";
        return;
    }
    t.check(fetchsync::maskSecret("hunter2") == "********",
            "secrets are masked by default");
    t.check(fetchsync::maskSecret("").empty(), "empty secrets stay empty");
    t.check(fetchsync::isTruthy("yes") && !fetchsync::isTruthy("no"),
            "isTruthy should accept yes and reject no");
}

} // namespace

int main() {
    TestContext t;
    test_session_defaults(t);
    test_connect_validation(t);
    test_disconnect_changes_state(t);
    test_list_sorting_and_known_path(t);
    test_change_directory(t);
    test_retrieve_and_failures(t);
    test_ascii_mode_strips_cr(t);
    test_size(t);
    test_new_connection_like(t);
    test_remote_path_helpers(t);
    test_parse_unix_listing_line(t);
    test_parse_dos_listing_line(t);
    test_parse_oversized_size_column(t);
    test_parse_listing_text(t);
    test_mask_secret(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] fetchsync_core_tests\n";
    return EXIT_SUCCESS;
}
