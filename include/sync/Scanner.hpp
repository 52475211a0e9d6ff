#pragma once

#include "record/Snapshot.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace dw::vcs { class Provider; }

namespace dw::sync {

enum class ScanMode {
    DirtyVsRef,     // dirty paths, local + reference refreshed
    Commit,         // paths changed by a commit, local + reference refreshed
    UpdateLocal,    // every record plus dirty paths, local fields only
    LoadOnly,       // persisted records, unknown local digests re-read from disk
};

std::string to_string(ScanMode m);

class Scanner {
public:
    struct Options {
        ScanMode mode{ScanMode::DirtyVsRef};
        std::filesystem::path snapshot_file;
        std::string ref;        // empty: HEAD, or COMMIT^ in commit mode
        std::string commit;     // commit mode only
    };

    struct Result {
        record::Snapshot snapshot;
        std::vector<std::string> working_set;   // paths to compare, report order
    };

    Scanner(vcs::Provider& vcs, std::filesystem::path workingDir);

    // Loads the snapshot file first (if present) so last_deploy survives.
    // LoadOnly with no snapshot file throws.
    Result scan(const Options& opts);

    void refreshLocal(record::AuthorityRecord& rec) const;
    void refreshReference(record::AuthorityRecord& rec, const std::string& ref) const;

    [[nodiscard]] static std::string effectiveRef(const Options& opts);

private:
    vcs::Provider& vcs_;
    std::filesystem::path workingDir_;
};

}
