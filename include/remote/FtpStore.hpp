#pragma once

#include "remote/Store.hpp"
#include "config/Config.hpp"
#include "util/curlWrappers.hpp"

#include <optional>
#include <string>
#include <vector>

namespace dw::remote {

// FTP / explicit FTPS target over a single reused libcurl handle. All paths
// are resolved against remote_root and sent as absolute paths, so no command
// depends on the server-side working directory.
class FtpStore final : public Store {
public:
    explicit FtpStore(config::RemoteConfig cfg);
    ~FtpStore() override = default;

    // Logs in and lists remote_root; throws TransportError on failure.
    void connect();

    std::optional<uintmax_t> probeSize(const std::string& remotePath) override;
    std::optional<std::time_t> probeModifiedTime(const std::string& remotePath) override;
    bool retrieve(const std::string& remotePath, const Sink& sink) override;
    void store(const std::string& remotePath, std::istream& source) override;
    void ensureDirectories(const std::string& remotePath) override;

    [[nodiscard]] std::string describe(const std::string& remotePath) const override;

    [[nodiscard]] std::string absolutePath(const std::string& remotePath) const;

    // "/a/b/c.txt" -> {"/a", "/a/b"}
    static std::vector<std::string> parentDirectories(const std::string& absPath);

private:
    struct Probe {
        std::string path;
        bool exists = false;
        std::optional<uintmax_t> size;
        std::optional<std::time_t> modified;
    };

    config::RemoteConfig cfg_;
    util::CurlEasy curl_;
    std::optional<Probe> lastProbe_;

    [[nodiscard]] std::string url(const std::string& absPath, bool directory = false) const;
    void prepare(const std::string& url);
    const Probe& probe(const std::string& remotePath);

    [[nodiscard]] bool isNotFound(CURLcode code) const;
    [[noreturn]] void fail(CURLcode code, const std::string& op, const std::string& absPath) const;
};

}
