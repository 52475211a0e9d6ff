#include "diff/NormalizedDiff.hpp"
#include "vcs/Provider.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <optional>
#include <vector>
#include <fmt/core.h>

using namespace dw::diff;
using namespace dw::crypto;
using namespace dw::util;
namespace fs = std::filesystem;

namespace {

constexpr std::string_view PAIR_SEPARATOR = "::";

// Line boundaries and whitespace follow the Unicode definitions, not just ASCII.
bool isLineBreak(const uint32_t cp) {
    return cp == '\n' || cp == '\r' || cp == '\v' || cp == '\f' || (cp >= 0x1C && cp <= 0x1E) ||
           cp == 0x85 || cp == 0x2028 || cp == 0x2029;
}

bool isTrimmable(const uint32_t cp) {
    return cp == ' ' || cp == '\t' || cp == 0x1F || isLineBreak(cp) || cp == 0xA0 || cp == 0x1680 ||
           (cp >= 0x2000 && cp <= 0x200A) || cp == 0x202F || cp == 0x205F || cp == 0x3000;
}

struct CodePoint {
    uint32_t cp;
    size_t len;
};

// Input is known to be valid UTF-8.
CodePoint decodeAt(const std::string_view s, const size_t i) {
    const auto c = static_cast<unsigned char>(s[i]);
    if (c < 0x80) return {c, 1};

    size_t len = (c & 0xE0) == 0xC0 ? 2 : (c & 0xF0) == 0xE0 ? 3 : 4;
    uint32_t cp = c & (len == 2 ? 0x1F : len == 3 ? 0x0F : 0x07);
    for (size_t k = 1; k < len; ++k) cp = (cp << 6) | (static_cast<unsigned char>(s[i + k]) & 0x3F);
    return {cp, len};
}

std::optional<std::string> readLocal(const fs::path& p) {
    std::error_code ec;
    if (!fs::is_regular_file(p, ec)) return std::nullopt;
    return readFileToString(p);
}

}

bool dw::diff::isValidUtf8(const std::string_view s) {
    size_t i = 0;
    while (i < s.size()) {
        const auto c = static_cast<unsigned char>(s[i]);
        size_t len = 0;
        uint32_t cp = 0;

        if (c < 0x80) { ++i; continue; }
        if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else return false;

        if (i + len > s.size()) return false;
        for (size_t k = 1; k < len; ++k) {
            const auto cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }

        // overlong forms, surrogates, out of range
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return false;
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += len;
    }
    return true;
}

std::string dw::diff::normalizeLines(const std::string_view content) {
    std::string out;
    out.reserve(content.size());

    if (!isValidUtf8(content)) {
        for (const char c : content) if (c != '\r' && c != '\n') out.push_back(c);
        return out;
    }

    std::vector<CodePoint> line;
    size_t lineStart = 0;

    auto flush = [&](const size_t lineEnd) {
        size_t b = 0, e = line.size();
        size_t from = lineStart, to = lineEnd;
        while (b < e && isTrimmable(line[b].cp)) from += line[b++].len;
        while (e > b && isTrimmable(line[e - 1].cp)) to -= line[--e].len;
        out.append(content.substr(from, to - from));
        line.clear();
    };

    size_t i = 0;
    while (i < content.size()) {
        const auto cp = decodeAt(content, i);
        if (!isLineBreak(cp.cp)) {
            line.push_back(cp);
            i += cp.len;
            continue;
        }

        flush(i);
        i += cp.len;
        // "\r\n" is one break
        if (cp.cp == '\r' && i < content.size() && content[i] == '\n') ++i;
        lineStart = i;
    }
    flush(content.size());
    return out;
}

Fingerprint dw::diff::normalizedFingerprint(const std::string_view content) {
    return Fingerprinter::of(normalizeLines(content)).fingerprint;
}

NormalizedDiff::NormalizedDiff(fs::path workingDir, vcs::Provider* vcs, std::string ref)
    : workingDir_(std::move(workingDir)), vcs_(vcs), ref_(std::move(ref)) {}

std::string NormalizedDiff::relativeToWorkingDir(const std::string& path) const {
    if (workingDir_.empty()) return normalizeRelPath(path);

    const auto wd = fs::weakly_canonical(fs::absolute(workingDir_));
    const auto abs = fs::weakly_canonical(fs::absolute(path));

    const auto rel = abs.lexically_relative(wd);
    if (rel.empty() || *rel.begin() == "..") return normalizeRelPath(path);
    return normalizeRelPath(rel.generic_string());
}

std::string NormalizedDiff::comparePair(const std::string& a, const std::string& b) const {
    const auto ca = readLocal(a);
    if (!ca) return "[ERROR] File not found: " + a;
    const auto cb = readLocal(b);
    if (!cb) return "[ERROR] File not found: " + b;

    const auto label = fmt::format("{} vs {}", a, b);
    if (normalizedFingerprint(*ca) == normalizedFingerprint(*cb)) return "[MATCH] " + label;
    return "[DIFF ] " + label + " (different hash)";
}

std::string NormalizedDiff::compareWithRef(const std::string& path) {
    const auto local = readLocal(path);
    if (!local) return "[ERROR] Local file not found: " + path;
    if (!vcs_) return "[ERROR] No version-control working tree for " + path;

    const auto rel = relativeToWorkingDir(path);
    const auto atRef = vcs_->readFileAt(rel, ref_);
    if (!atRef) return fmt::format("[ERROR] Reference file not found: {} in {}", rel, ref_);

    const auto label = fmt::format("{} vs {}", path, ref_);
    if (normalizedFingerprint(*local) == normalizedFingerprint(*atRef)) return "[MATCH] " + label;
    return "[DIFF ] " + label + " (different hash)";
}

std::string NormalizedDiff::compare(const std::string& arg) {
    if (const auto sep = arg.find(PAIR_SEPARATOR); sep != std::string::npos)
        return comparePair(arg.substr(0, sep), arg.substr(sep + PAIR_SEPARATOR.size()));
    return compareWithRef(arg);
}

std::vector<std::string> NormalizedDiff::compareAll(const std::vector<std::string>& args) {
    std::vector<std::string> results;
    results.reserve(args.size());
    for (const auto& a : args) {
        results.push_back(compare(a));
        log::Registry::shell()->debug("[NormalizedDiff] {}", results.back());
    }
    return results;
}
