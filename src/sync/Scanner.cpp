#include "sync/Scanner.hpp"
#include "vcs/Provider.hpp"
#include "crypto/Fingerprint.hpp"
#include "util/files.hpp"
#include "util/timestamp.hpp"
#include "log/Registry.hpp"

#include <stdexcept>
#include <unordered_set>

using namespace dw::sync;
using namespace dw::record;
using namespace dw::crypto;
using namespace dw::util;

namespace {

std::vector<std::string> dedupe(const std::vector<std::string>& paths) {
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    for (const auto& p : paths) {
        auto n = normalizeRelPath(p);
        if (n.empty() || !seen.insert(n).second) continue;
        out.push_back(std::move(n));
    }
    return out;
}

}

std::string dw::sync::to_string(const ScanMode m) {
    switch (m) {
    case ScanMode::DirtyVsRef: return "dirty-vs-ref";
    case ScanMode::Commit: return "commit";
    case ScanMode::UpdateLocal: return "update-local";
    case ScanMode::LoadOnly: return "load-only";
    }
    return "unknown";
}

Scanner::Scanner(vcs::Provider& vcs, std::filesystem::path workingDir)
    : vcs_(vcs), workingDir_(std::move(workingDir)) {}

std::string Scanner::effectiveRef(const Options& opts) {
    if (!opts.ref.empty()) return opts.ref;
    if (opts.mode == ScanMode::Commit) return opts.commit + "^";
    return "HEAD";
}

void Scanner::refreshLocal(AuthorityRecord& rec) const {
    const auto abs = workingDir_ / rec.path;
    const auto digest = Fingerprinter::ofFile(abs);
    if (!digest) {
        rec.clearLocal();
        return;
    }

    rec.local_fingerprint = digest->fingerprint;
    rec.local_size = digest->raw_size;
    rec.local_timestamp = fileModifiedTime(abs.string());
}

void Scanner::refreshReference(AuthorityRecord& rec, const std::string& ref) const {
    const auto content = vcs_.readFileAt(rec.path, ref);
    if (!content) {
        rec.clearReference();
        return;
    }

    rec.reference_fingerprint = Fingerprinter::of(*content).fingerprint;
    rec.reference_timestamp = vcs_.lastCommitTimestamp(rec.path, ref);
}

Scanner::Result Scanner::scan(const Options& opts) {
    Result res;

    if (auto loaded = Snapshot::load(opts.snapshot_file)) {
        res.snapshot = std::move(*loaded);
    } else if (opts.mode == ScanMode::LoadOnly) {
        throw std::runtime_error("Hash file not found: " + opts.snapshot_file.string());
    }

    const auto ref = effectiveRef(opts);

    switch (opts.mode) {
    case ScanMode::LoadOnly: {
        res.working_set = res.snapshot.paths();

        // records without a usable local digest (older snapshots) are re-read from disk
        size_t refreshed = 0;
        for (const auto& p : res.working_set) {
            auto& rec = *res.snapshot.find(p);
            if (rec.local_fingerprint || !std::filesystem::is_regular_file(workingDir_ / rec.path)) continue;
            refreshLocal(rec);
            ++refreshed;
        }
        if (refreshed) {
            res.snapshot.markDirty();
            log::Registry::sync()->info("[Scanner] Re-fingerprinted {} records with no usable local digest", refreshed);
        }
        break;
    }

    case ScanMode::DirtyVsRef:
    case ScanMode::Commit: {
        if (opts.mode == ScanMode::Commit && opts.commit.empty())
            throw std::invalid_argument("Commit scan requires a commit reference");

        const auto paths = opts.mode == ScanMode::Commit ? vcs_.changedPathsInCommit(opts.commit)
                                                         : vcs_.listDirtyPaths();
        res.working_set = dedupe(paths);
        for (const auto& p : res.working_set) {
            auto& rec = res.snapshot.upsert(p);
            refreshLocal(rec);
            refreshReference(rec, ref);
        }
        res.snapshot.markDirty();
        break;
    }

    case ScanMode::UpdateLocal: {
        for (const auto& p : dedupe(vcs_.listDirtyPaths())) res.snapshot.upsert(p);
        res.working_set = res.snapshot.paths();
        for (const auto& p : res.working_set) refreshLocal(*res.snapshot.find(p));
        res.snapshot.markDirty();
        break;
    }
    }

    log::Registry::sync()->info("[Scanner] {} scan of {}: {} paths in working set, {} records",
                                to_string(opts.mode), workingDir_.string(), res.working_set.size(),
                                res.snapshot.size());
    return res;
}
