#include "vcs/Git.hpp"
#include "util/files.hpp"
#include "util/timestamp.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

using namespace dw::vcs;
using namespace dw::util;

namespace {

std::vector<std::string> splitZ(const std::string& out) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start < out.size()) {
        const auto end = out.find('\0', start);
        if (end == std::string::npos) {
            parts.push_back(out.substr(start));
            break;
        }
        parts.push_back(out.substr(start, end - start));
        start = end + 1;
    }
    return parts;
}

std::string trim(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) s.pop_back();
    size_t i = 0;
    while (i < s.size() && s[i] == ' ') ++i;
    return s.substr(i);
}

}

Git::Git(std::filesystem::path workTree, std::string binary)
    : workTree_(std::move(workTree)), binary_(std::move(binary)) {
    if (!std::filesystem::is_directory(workTree_))
        throw VcsError("Working directory does not exist: " + workTree_.string());

    const auto res = git({"rev-parse", "--is-inside-work-tree"});
    if (!res.ok() || trim(res.out) != "true")
        throw VcsError(fmt::format("Not a git working tree: {} ({})", workTree_.string(), trim(res.err)));
}

ProcessResult Git::git(const std::vector<std::string>& args) const {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(binary_);
    argv.insert(argv.end(), args.begin(), args.end());

    try {
        auto res = runProcess(argv, workTree_);
        log::Registry::vcs()->debug("[Git] git {} -> exit {}", fmt::join(args, " "), res.exit_code);
        return res;
    } catch (const SpawnError& e) {
        throw VcsError(fmt::format("Failed to run '{}': {}", binary_, e.what()));
    }
}

ProcessResult Git::gitOrThrow(const std::vector<std::string>& args) const {
    auto res = git(args);
    if (!res.ok())
        throw VcsError(fmt::format("git {} failed (exit {}): {}", fmt::join(args, " "), res.exit_code, trim(res.err)));
    return res;
}

std::vector<std::string> Git::parsePorcelainZ(const std::string& out) {
    std::vector<std::string> paths;
    const auto entries = splitZ(out);

    for (size_t i = 0; i < entries.size(); ++i) {
        const auto& e = entries[i];
        if (e.size() < 4) continue;   // "XY <path>"

        const char x = e[0];
        paths.push_back(normalizeRelPath(e.substr(3)));

        // rename/copy: the original path follows as its own entry
        if (x == 'R' || x == 'C') ++i;
    }

    return paths;
}

std::vector<std::string> Git::listDirtyPaths() {
    const auto res = gitOrThrow({"status", "--porcelain", "-z", "-uall"});
    auto paths = parsePorcelainZ(res.out);
    log::Registry::vcs()->info("[Git] {} dirty paths in {}", paths.size(), workTree_.string());
    return paths;
}

std::optional<std::string> Git::readFileAt(const std::string& path, const std::string& ref) {
    auto res = git({"show", ref + ":" + normalizeRelPath(path)});
    if (!res.ok()) return std::nullopt;
    return std::move(res.out);
}

std::optional<std::time_t> Git::lastCommitTimestamp(const std::string& path, const std::string& ref) {
    const auto res = git({"log", "-1", "--format=%aI", ref, "--", normalizeRelPath(path)});
    if (!res.ok()) return std::nullopt;

    const auto iso = trim(res.out);
    if (iso.empty()) return std::nullopt;
    return parseIso8601(iso);
}

std::vector<std::string> Git::changedPathsInCommit(const std::string& commitRef) {
    const auto res = gitOrThrow({"diff-tree", "--no-commit-id", "--name-only", "-r", "-z", "--root", commitRef});

    std::vector<std::string> paths;
    for (auto& p : splitZ(res.out))
        if (auto n = normalizeRelPath(p); !n.empty()) paths.push_back(std::move(n));
    return paths;
}
