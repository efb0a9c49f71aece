// libcurl FTP backend. Directory listings are LIST output parsed with
// ListingParser; the raw line is kept as the change fingerprint.
#include "fetchsync/CurlFtpClient.hpp"
#include "fetchsync/ListingParser.hpp"
#include <curl/curl.h>

#include <cstdio>
#include <sstream>

namespace fetchsync {

// Global libcurl initialisation (once per process).
static bool g_curl_inited = false;

namespace {

std::size_t discardCallback(char *, std::size_t size, std::size_t nmemb,
                            void *) {
    return size * nmemb;
}

std::size_t appendCallback(char *ptr, std::size_t size, std::size_t nmemb,
                           void *userdata) {
    auto *out = static_cast<std::string *>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

std::size_t fileCallback(char *ptr, std::size_t size, std::size_t nmemb,
                         void *userdata) {
    return std::fwrite(ptr, size, nmemb, static_cast<FILE *>(userdata)) * size;
}

} // namespace

CurlFtpClient::CurlFtpClient() {
    if (!g_curl_inited) {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK)
            g_curl_inited = true;
    }
}

CurlFtpClient::~CurlFtpClient() { disconnect(); }

std::string CurlFtpClient::urlFor(const std::string &absPath,
                                  bool asDirectory) const {
    // A leading %2F makes libcurl CWD to "/" first, so paths stay absolute
    // rather than relative to the login directory.
    std::string url = baseUrl_ + "/%2F";
    std::istringstream in(absPath);
    std::string seg;
    while (std::getline(in, seg, '/')) {
        if (seg.empty())
            continue;
        char *esc = curl_easy_escape(curl_, seg.c_str(),
                                     static_cast<int>(seg.size()));
        url += "/";
        url += esc ? esc : seg.c_str();
        curl_free(esc);
    }
    if (asDirectory && url.back() != '/')
        url += "/";
    return url;
}

void CurlFtpClient::prepare(const std::string &url) {
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_NOBODY, 0L);
    curl_easy_setopt(curl_, CURLOPT_TRANSFERTEXT, 0L);
    curl_easy_setopt(curl_, CURLOPT_FILETIME, 0L);
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, discardCallback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, nullptr);
}

bool CurlFtpClient::perform(std::string &err) {
    const CURLcode rc = curl_easy_perform(curl_);
    if (rc == CURLE_OK)
        return true;
    long code = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &code);
    err = curl_easy_strerror(rc);
    if (code > 0)
        err += " (reply " + std::to_string(code) + ")";
    return false;
}

bool CurlFtpClient::connect(const SessionOptions &opt, std::string &err) {
    if (connected_) {
        err = "Already connected";
        return false;
    }
    if (opt.host.empty() || opt.username.empty()) {
        err = "Host and user are required";
        return false;
    }
    curl_ = curl_easy_init();
    if (!curl_) {
        err = "curl_easy_init failed";
        return false;
    }
    const unsigned port = opt.port ? opt.port : 21;
    baseUrl_ = "ftp://" + opt.host + ":" + std::to_string(port);

    curl_easy_setopt(curl_, CURLOPT_USERNAME, opt.username.c_str());
    if (opt.password.has_value())
        curl_easy_setopt(curl_, CURLOPT_PASSWORD, opt.password->c_str());
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT,
                     static_cast<long>(opt.timeout_seconds));
    // Stalled transfers: abort below 1 byte/s for timeout_seconds.
    curl_easy_setopt(curl_, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl_, CURLOPT_LOW_SPEED_TIME,
                     static_cast<long>(opt.timeout_seconds));
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    if (!opt.ftp_passive)
        curl_easy_setopt(curl_, CURLOPT_FTPPORT, "-");

    // Log in with a body-less request on the login directory.
    prepare(baseUrl_ + "/");
    curl_easy_setopt(curl_, CURLOPT_NOBODY, 1L);
    if (!perform(err)) {
        err = "FTP login to " + opt.host + " failed: " + err;
        disconnect();
        return false;
    }
    char *entry = nullptr;
    if (curl_easy_getinfo(curl_, CURLINFO_FTP_ENTRY_PATH, &entry) == CURLE_OK &&
        entry && *entry == '/')
        cwd_ = entry;
    else
        cwd_ = "/";
    connected_ = true;
    return true;
}

void CurlFtpClient::disconnect() {
    if (curl_) {
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
    }
    connected_ = false;
    cwd_.clear();
}

bool CurlFtpClient::changeDirectory(const std::string &path,
                                    std::string &err) {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    const std::string target = resolveRemotePath(cwd_, path);
    prepare(urlFor(target, true));
    curl_easy_setopt(curl_, CURLOPT_NOBODY, 1L);
    if (!perform(err)) {
        err = "CWD " + target + " failed: " + err;
        return false;
    }
    cwd_ = target;
    return true;
}

bool CurlFtpClient::currentDirectory(std::string &out, std::string &err) {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    out = cwd_;
    return true;
}

bool CurlFtpClient::list(const std::string &remote_path,
                         std::vector<RemoteEntry> &out, std::string &err) {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    std::string body;
    prepare(urlFor(resolveRemotePath(cwd_, remote_path), true));
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, appendCallback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &body);
    if (!perform(err)) {
        err = "LIST " + remote_path + " failed: " + err;
        return false;
    }
    out = parseListing(body, remote_path);
    return true;
}

bool CurlFtpClient::retrieve(const std::string &remote,
                             const std::string &local, TransferMode mode,
                             std::string &err) {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    FILE *lf = std::fopen(local.c_str(), "wb");
    if (!lf) {
        err = "Could not open local file for writing: " + local;
        return false;
    }
    prepare(urlFor(resolveRemotePath(cwd_, remote), false));
    curl_easy_setopt(curl_, CURLOPT_TRANSFERTEXT,
                     mode == TransferMode::Ascii ? 1L : 0L);
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, fileCallback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, lf);
    bool ok = perform(err);
    if (!ok)
        err = "RETR " + remote + " failed: " + err;
    if (std::fclose(lf) != 0 && ok) {
        err = "Local write failed: " + local;
        ok = false;
    }
    return ok;
}

bool CurlFtpClient::size(const std::string &remote, std::uint64_t &out,
                         std::string &err) {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    prepare(urlFor(resolveRemotePath(cwd_, remote), false));
    curl_easy_setopt(curl_, CURLOPT_NOBODY, 1L);
    if (!perform(err)) {
        err = "SIZE " + remote + " failed: " + err;
        return false;
    }
    curl_off_t len = -1;
    if (curl_easy_getinfo(curl_, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &len) !=
            CURLE_OK ||
        len < 0) {
        err = "Server did not report a size for " + remote;
        return false;
    }
    out = static_cast<std::uint64_t>(len);
    return true;
}

std::unique_ptr<RemoteClient>
CurlFtpClient::newConnectionLike(const SessionOptions &opt, std::string &err) {
    auto ptr = std::make_unique<CurlFtpClient>();
    if (!ptr->connect(opt, err))
        return nullptr;
    return ptr;
}

} // namespace fetchsync
