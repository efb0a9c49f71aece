// Basic types shared between the connection backends and the sync engine.
// Kept as plain structs so they cross the std/Qt boundary without adapters.
#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace fetchsync {

// Host key validation policy against known_hosts (SFTP only).
enum class KnownHostsPolicy {
    Strict,    // Requires an exact match in known_hosts.
    AcceptNew, // TOFU: stores unknown hosts, rejects changed keys.
    Off        // No verification.
};

enum class TransferMode { Ascii, Binary };

enum class EntryType { File, Directory, Other };

// One remote directory entry as produced by a listing call.
struct RemoteEntry {
    std::string directory; // directory the listing was taken from
    std::string name;      // base name
    std::string longname;  // raw listing line (ls -l style), change fingerprint
    EntryType type = EntryType::File;
    std::uint64_t size = 0;
    std::uint64_t mtime = 0; // epoch seconds, 0 when the listing has none

    bool isFile() const { return type == EntryType::File; }
    bool isDir() const { return type == EntryType::Directory; }
};

struct SessionOptions {
    std::string host;
    std::uint16_t port = 0; // 0 = protocol default (22 SFTP, 21 FTP)
    std::string username;

    std::optional<std::string> password;
    std::optional<std::string> private_key_path;
    std::optional<std::string> private_key_passphrase;

    std::optional<std::string> known_hosts_path; // default: ~/.ssh/known_hosts
    KnownHostsPolicy known_hosts_policy = KnownHostsPolicy::Off;

    int timeout_seconds = 30;
    bool ftp_passive = true;
};

inline const char *transferModeName(TransferMode m) {
    return m == TransferMode::Ascii ? "ascii" : "binary";
}

} // namespace fetchsync
