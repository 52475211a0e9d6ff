#include "remote/FtpStore.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <cctype>
#include <exception>
#include <fmt/core.h>

using namespace dw::remote;
using namespace dw::util;

namespace {

constexpr long FTP_FILE_UNAVAILABLE = 550;

std::string percentEncode(const std::string& segment) {
    static constexpr char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(segment.size());
    for (const char ch : segment) {
        const auto c = static_cast<unsigned char>(ch);
        if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~') out.push_back(ch);
        else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

TransportError::Kind classify(const CURLcode code) {
    switch (code) {
    case CURLE_OPERATION_TIMEDOUT:
        return TransportError::Kind::Timeout;
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_RESOLVE_PROXY:
    case CURLE_COULDNT_CONNECT:
    case CURLE_LOGIN_DENIED:
    case CURLE_SSL_CONNECT_ERROR:
    case CURLE_USE_SSL_FAILED:
    case CURLE_PEER_FAILED_VERIFICATION:
    case CURLE_FTP_WEIRD_SERVER_REPLY:
    case CURLE_FTP_ACCEPT_FAILED:
    case CURLE_FTP_CANT_GET_HOST:
    case CURLE_GOT_NOTHING:
    case CURLE_SEND_ERROR:
    case CURLE_RECV_ERROR:
        return TransportError::Kind::Connection;
    default:
        return TransportError::Kind::Protocol;
    }
}

struct ReadContext {
    std::istream* in;
    std::exception_ptr error;
};

struct WriteContext {
    const Sink* sink;
    std::exception_ptr error;
};

size_t readFromStream(char* buf, const size_t size, const size_t nmemb, void* ud) {
    auto* ctx = static_cast<ReadContext*>(ud);
    try {
        ctx->in->read(buf, static_cast<std::streamsize>(size * nmemb));
        if (ctx->in->bad()) throw std::runtime_error("failed reading upload source");
        return static_cast<size_t>(ctx->in->gcount());
    } catch (...) {
        ctx->error = std::current_exception();
        return CURL_READFUNC_ABORT;
    }
}

size_t writeToSink(char* p, const size_t s, const size_t n, void* ud) {
    auto* ctx = static_cast<WriteContext*>(ud);
    try {
        (*ctx->sink)(p, s * n);
        return s * n;
    } catch (...) {
        ctx->error = std::current_exception();
        return 0;
    }
}

size_t discard(char*, const size_t s, const size_t n, void*) { return s * n; }

}

std::string dw::remote::to_string(const TransportError::Kind k) {
    switch (k) {
    case TransportError::Kind::Connection: return "connection";
    case TransportError::Kind::Timeout: return "timeout";
    case TransportError::Kind::Protocol: return "protocol";
    }
    return "unknown";
}

FtpStore::FtpStore(config::RemoteConfig cfg) : cfg_(std::move(cfg)) {
    if (cfg_.host.empty()) throw std::invalid_argument("FtpStore requires a host");
    ensureCurlGlobalInit();
}

// ##########################################
// ############ Session Handling ############
// ##########################################

std::string FtpStore::absolutePath(const std::string& remotePath) const {
    return joinRemote(cfg_.remote_root, remotePath);
}

std::string FtpStore::url(const std::string& absPath, const bool directory) const {
    // "%2F" makes the path absolute instead of relative to the login directory
    std::string u = fmt::format("ftp://{}:{}/%2F", cfg_.host, cfg_.port);
    const auto rel = normalizeRelPath(absPath);

    size_t start = 0;
    bool first = true;
    while (start <= rel.size() && !rel.empty()) {
        const auto end = rel.find('/', start);
        if (!first) u.push_back('/');
        u += percentEncode(rel.substr(start, end == std::string::npos ? std::string::npos : end - start));
        first = false;
        if (end == std::string::npos) break;
        start = end + 1;
    }

    if (directory && u.back() != '/') u.push_back('/');
    return u;
}

std::string FtpStore::describe(const std::string& remotePath) const {
    return fmt::format("ftp://{}@{}:{}{}", cfg_.user, cfg_.host, cfg_.port, absolutePath(remotePath));
}

void FtpStore::prepare(const std::string& u) {
    curl_.reset();
    curl_easy_setopt(curl_, CURLOPT_URL, u.c_str());
    curl_easy_setopt(curl_, CURLOPT_USERNAME, cfg_.user.c_str());
    curl_easy_setopt(curl_, CURLOPT_PASSWORD, cfg_.password.c_str());
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT, static_cast<long>(cfg_.connect_timeout_seconds));
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT, static_cast<long>(cfg_.timeout_seconds));
    curl_easy_setopt(curl_, CURLOPT_FTP_FILEMETHOD, static_cast<long>(CURLFTPMETHOD_NOCWD));

    if (cfg_.tls) {
        curl_easy_setopt(curl_, CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_ALL));
        curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYPEER, cfg_.verify_peer ? 1L : 0L);
        curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYHOST, cfg_.verify_peer ? 2L : 0L);
    }

    if (!cfg_.passive) curl_easy_setopt(curl_, CURLOPT_FTPPORT, "-");
}

bool FtpStore::isNotFound(const CURLcode code) const {
    if (code == CURLE_REMOTE_FILE_NOT_FOUND) return true;

    long reply = 0;
    curl_easy_getinfo(const_cast<CURL*>(static_cast<const CURL*>(curl_)), CURLINFO_RESPONSE_CODE, &reply);
    return reply == FTP_FILE_UNAVAILABLE &&
           (code == CURLE_FTP_COULDNT_RETR_FILE || code == CURLE_REMOTE_ACCESS_DENIED);
}

void FtpStore::fail(const CURLcode code, const std::string& op, const std::string& absPath) const {
    long reply = 0;
    curl_easy_getinfo(const_cast<CURL*>(static_cast<const CURL*>(curl_)), CURLINFO_RESPONSE_CODE, &reply);

    const auto kind = classify(code);
    const auto msg = fmt::format("FTP {} {} failed: {} (reply {})", op, absPath, curl_easy_strerror(code), reply);
    log::Registry::remote()->error("[FtpStore] {} [{}]", msg, to_string(kind));
    throw TransportError(kind, msg);
}

void FtpStore::connect() {
    const auto root = absolutePath("");
    prepare(url(root, true));
    curl_easy_setopt(curl_, CURLOPT_DIRLISTONLY, 1L);
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, discard);

    if (const auto rc = curl_easy_perform(curl_); rc != CURLE_OK) fail(rc, "connect", root);
    log::Registry::remote()->info("[FtpStore] Connected to {}:{} as {} (root {})",
                                  cfg_.host, cfg_.port, cfg_.user, root);
}

// ##########################################
// ################ Probing #################
// ##########################################

const FtpStore::Probe& FtpStore::probe(const std::string& remotePath) {
    const auto abs = absolutePath(remotePath);
    if (lastProbe_ && lastProbe_->path == abs) return *lastProbe_;

    prepare(url(abs));
    curl_easy_setopt(curl_, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl_, CURLOPT_FILETIME, 1L);

    Probe p{.path = abs};
    if (const auto rc = curl_easy_perform(curl_); rc != CURLE_OK) {
        if (!isNotFound(rc)) fail(rc, "probe", abs);
        p.exists = false;
    } else {
        p.exists = true;

        curl_off_t size = -1;
        if (curl_easy_getinfo(curl_, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &size) == CURLE_OK && size >= 0)
            p.size = static_cast<uintmax_t>(size);

        curl_off_t filetime = -1;
        if (curl_easy_getinfo(curl_, CURLINFO_FILETIME_T, &filetime) == CURLE_OK && filetime >= 0)
            p.modified = static_cast<std::time_t>(filetime);
    }

    log::Registry::remote()->debug("[FtpStore] probe {} -> exists={} size={} mtime={}", abs, p.exists,
                                   p.size ? std::to_string(*p.size) : "?",
                                   p.modified ? std::to_string(*p.modified) : "?");
    lastProbe_ = std::move(p);
    return *lastProbe_;
}

std::optional<uintmax_t> FtpStore::probeSize(const std::string& remotePath) {
    const auto& p = probe(remotePath);
    if (!p.exists) return std::nullopt;
    // an existing object without a size cannot be backed up safely
    if (!p.size) throw TransportError(TransportError::Kind::Protocol,
                                      "FTP server did not report a size for " + p.path);
    return p.size;
}

std::optional<std::time_t> FtpStore::probeModifiedTime(const std::string& remotePath) {
    const auto& p = probe(remotePath);
    return p.exists ? p.modified : std::nullopt;
}

// ##########################################
// ############### Transfers ################
// ##########################################

bool FtpStore::retrieve(const std::string& remotePath, const Sink& sink) {
    const auto abs = absolutePath(remotePath);
    prepare(url(abs));

    WriteContext ctx{&sink, nullptr};
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, writeToSink);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &ctx);

    const auto rc = curl_easy_perform(curl_);
    if (ctx.error) std::rethrow_exception(ctx.error);
    if (rc != CURLE_OK) {
        if (isNotFound(rc)) return false;
        fail(rc, "RETR", abs);
    }

    log::Registry::remote()->debug("[FtpStore] RETR {} ok", abs);
    return true;
}

void FtpStore::store(const std::string& remotePath, std::istream& source) {
    const auto abs = absolutePath(remotePath);
    lastProbe_.reset();
    prepare(url(abs));

    ReadContext ctx{&source, nullptr};
    curl_easy_setopt(curl_, CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(curl_, CURLOPT_READFUNCTION, readFromStream);
    curl_easy_setopt(curl_, CURLOPT_READDATA, &ctx);

    const auto rc = curl_easy_perform(curl_);
    if (ctx.error) std::rethrow_exception(ctx.error);
    if (rc != CURLE_OK) fail(rc, "STOR", abs);

    log::Registry::remote()->info("[FtpStore] STOR {} ok", abs);
}

std::vector<std::string> FtpStore::parentDirectories(const std::string& absPath) {
    std::vector<std::string> dirs;
    const auto rel = normalizeRelPath(absPath);

    size_t pos = 0;
    while ((pos = rel.find('/', pos)) != std::string::npos) {
        dirs.push_back("/" + rel.substr(0, pos));
        ++pos;
    }
    return dirs;
}

void FtpStore::ensureDirectories(const std::string& remotePath) {
    const auto abs = absolutePath(remotePath);
    const auto dirs = parentDirectories(abs);
    if (dirs.empty()) return;

    lastProbe_.reset();

    // "*" tells libcurl to ignore a failing command: existing segments answer 550
    SList quote;
    for (const auto& d : dirs) quote.add("*MKD " + d);

    prepare(url("/", true));
    curl_easy_setopt(curl_, CURLOPT_QUOTE, quote.get());
    curl_easy_setopt(curl_, CURLOPT_NOBODY, 1L);
    if (const auto rc = curl_easy_perform(curl_); rc != CURLE_OK) fail(rc, "MKD", dirs.back());

    // confirm the leaf directory is really there
    prepare(url(dirs.back(), true));
    curl_easy_setopt(curl_, CURLOPT_DIRLISTONLY, 1L);
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, discard);
    if (const auto rc = curl_easy_perform(curl_); rc != CURLE_OK) fail(rc, "ensure directory", dirs.back());

    log::Registry::remote()->debug("[FtpStore] Directories ready for {}", abs);
}
