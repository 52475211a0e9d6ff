#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace dw::util {

struct ProcessResult {
    int exit_code = -1;
    std::string out, err;

    [[nodiscard]] bool ok() const { return exit_code == 0; }
};

// Thrown when the child could not be started at all (fork or exec failure).
struct SpawnError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

ProcessResult runProcess(const std::vector<std::string>& argv, const std::filesystem::path& cwd = {});

}
