// Runtime policy helpers for diagnostics and sensitive logging.
#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace fetchsync {

// Trimmed, lower-cased copy of s.
inline std::string foldToken(const std::string &s) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    auto first = std::find_if(s.begin(), s.end(), notSpace);
    auto last = std::find_if(s.rbegin(), s.rend(), notSpace).base();
    std::string out(first, first < last ? last : first);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

// "1", "true", "yes" or "on" in any case; anything else is false.
inline bool isTruthy(const std::string &v) {
    const std::string f = foldToken(v);
    return f == "1" || f == "true" || f == "yes" || f == "on";
}

inline std::string envToken(const char *name) {
    const char *raw = name ? std::getenv(name) : nullptr;
    return raw ? foldToken(raw) : std::string();
}

// FETCHSYNC_ENV names a developer machine (dev, development, local, debug).
inline bool isDevEnvironment() {
    const std::string env = envToken("FETCHSYNC_ENV");
    return env == "dev" || env == "development" || env == "local" ||
           env == "debug";
}

// Passwords and passphrases only reach the log in a dev environment with
// FETCHSYNC_LOG_SENSITIVE set.
inline bool sensitiveLoggingEnabled() {
    return isDevEnvironment() && isTruthy(envToken("FETCHSYNC_LOG_SENSITIVE"));
}

inline std::string maskSecret(const std::string &secret) {
    if (secret.empty() || sensitiveLoggingEnabled())
        return secret;
    return std::string(8, '*');
}

} // namespace fetchsync
