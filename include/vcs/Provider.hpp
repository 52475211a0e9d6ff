#pragma once

#include <ctime>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace dw::vcs {

struct VcsError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Read-only view of the version-control reference and working-copy status.
class Provider {
public:
    virtual ~Provider() = default;

    // Modified and untracked paths, relative, in the order the VCS reports them.
    virtual std::vector<std::string> listDirtyPaths() = 0;

    // nullopt when the path does not exist at ref
    virtual std::optional<std::string> readFileAt(const std::string& path, const std::string& ref) = 0;

    virtual std::optional<std::time_t> lastCommitTimestamp(const std::string& path, const std::string& ref) = 0;

    virtual std::vector<std::string> changedPathsInCommit(const std::string& commitRef) = 0;
};

}
