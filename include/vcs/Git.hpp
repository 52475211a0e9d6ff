#pragma once

#include "vcs/Provider.hpp"
#include "util/process.hpp"

#include <filesystem>

namespace dw::vcs {

class Git final : public Provider {
public:
    explicit Git(std::filesystem::path workTree, std::string binary = "git");

    std::vector<std::string> listDirtyPaths() override;
    std::optional<std::string> readFileAt(const std::string& path, const std::string& ref) override;
    std::optional<std::time_t> lastCommitTimestamp(const std::string& path, const std::string& ref) override;
    std::vector<std::string> changedPathsInCommit(const std::string& commitRef) override;

    [[nodiscard]] const std::filesystem::path& workTree() const { return workTree_; }

    // Splits "git status --porcelain -z" output into paths, new name for renames/copies.
    static std::vector<std::string> parsePorcelainZ(const std::string& out);

private:
    std::filesystem::path workTree_;
    std::string binary_;

    util::ProcessResult git(const std::vector<std::string>& args) const;
    util::ProcessResult gitOrThrow(const std::vector<std::string>& args) const;
};

}
