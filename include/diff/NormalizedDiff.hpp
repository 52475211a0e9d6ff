#pragma once

#include "crypto/Fingerprint.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace dw::vcs { class Provider; }

namespace dw::diff {

[[nodiscard]] bool isValidUtf8(std::string_view s);

// Valid UTF-8: every line trimmed of surrounding whitespace, lines joined
// without separators. Anything else: CR and LF bytes removed.
[[nodiscard]] std::string normalizeLines(std::string_view content);

[[nodiscard]] crypto::Fingerprint normalizedFingerprint(std::string_view content);

// Whitespace-insensitive comparison of local files with each other or with
// the version-control reference. Produces one "[MATCH]", "[DIFF ]" or
// "[ERROR]" line per argument.
class NormalizedDiff {
public:
    // vcs may be null when only "A::B" pairs are compared
    NormalizedDiff(std::filesystem::path workingDir, vcs::Provider* vcs, std::string ref = "HEAD");

    // "A::B" compares two local files, anything else compares with the ref.
    std::string compare(const std::string& arg);

    std::vector<std::string> compareAll(const std::vector<std::string>& args);

    // Path relative to the working directory when it lies inside it.
    [[nodiscard]] std::string relativeToWorkingDir(const std::string& path) const;

private:
    std::filesystem::path workingDir_;
    vcs::Provider* vcs_;
    std::string ref_;

    std::string comparePair(const std::string& a, const std::string& b) const;
    std::string compareWithRef(const std::string& path);
};

}
