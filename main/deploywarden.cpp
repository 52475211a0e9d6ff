#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"
#include "shell/Parser.hpp"
#include "shell/IO.hpp"
#include "shell/PromptDecider.hpp"
#include "sync/Controller.hpp"
#include "vcs/Git.hpp"
#include "remote/FtpStore.hpp"
#include "diff/NormalizedDiff.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <memory>
#include <unordered_set>
#include <nlohmann/json.hpp>

using namespace dw;
using namespace dw::shell;
namespace fs = std::filesystem;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FATAL = 1;
constexpr int EXIT_ABORTED = 2;

constexpr auto USAGE = R"(Usage:
  deploywarden check --working-dir DIR <mode> [--config FILE] [--ref REF] [--size-only] [--deploy]
  deploywarden diff [--ref REF] [--working-dir DIR] PATH... | A::B...
  deploywarden config [--config FILE]
  deploywarden help

Check modes (exactly one):
  --vs-git FILE             record dirty paths vs the reference into FILE
  --vs-commit REF           record paths changed by commit REF (needs --hash-file FILE)
  --update-hash-file FILE   refresh local fields of every record in FILE
  --vs-hash-file FILE       use FILE as it is

Options:
  --config FILE     remote/deploy/logging settings (YAML); without it only the scan runs
  --ref REF         reference to compare with (default HEAD, or REF^ with --vs-commit)
  --size-only       compare sizes only, never deploys
  --deploy          deploy when every remote file is safe or approved

Exit codes: 0 ok, 1 fatal or usage, 2 aborted or remote comparison interrupted, 3 some deploy items failed
)";

const std::unordered_set<std::string> SWITCHES = {
    "size-only", "sizeOnly", "checkSizeOnly", "checksizeonly",
    "deploy", "deployOnClean", "deployonclean",
    "help", "h",
};

int usage(const std::string& error = {}) {
    if (!error.empty()) std::cerr << "Error: " << error << "\n\n";
    std::cerr << USAGE;
    return error.empty() ? EXIT_OK : EXIT_FATAL;
}

std::optional<std::string> requiredValue(const CommandCall& call, const std::vector<std::string>& keys) {
    for (const auto& k : keys) {
        if (!hasKey(call, k)) continue;
        const auto v = optVal(call, k);
        if (!v || v->empty()) throw std::invalid_argument("--" + k + " needs a value");
        return v;
    }
    return std::nullopt;
}

config::Config initRuntime(const std::optional<std::string>& configPath) {
    auto cfg = configPath ? config::loadConfig(*configPath) : config::Config{};
    const auto logDir = cfg.logging.log_dir.empty() ? config::defaultLogDir() : cfg.logging.log_dir;
    config::ConfigRegistry::init(cfg);
    log::Registry::init(logDir);
    return cfg;
}

int runCheck(const CommandCall& call) {
    const auto workingDir = requiredValue(call, {"working-dir", "workingDir", "workingdir"});
    if (!workingDir) return usage("check requires --working-dir");

    sync::Controller::Options opts;
    opts.working_dir = fs::weakly_canonical(fs::absolute(*workingDir));
    if (!fs::is_directory(opts.working_dir))
        throw std::runtime_error("Working directory " + opts.working_dir.string() + " does not exist.");

    const auto vsGit = requiredValue(call, {"vs-git", "vsGit", "vsgit"});
    const auto vsCommit = requiredValue(call, {"vs-commit", "vsCommit", "vscommit"});
    const auto update = requiredValue(call, {"update-hash-file", "updateHashFile", "updatehashfile"});
    const auto load = requiredValue(call, {"vs-hash-file", "vsHashFile", "vshashfile"});

    if (static_cast<int>(vsGit.has_value()) + vsCommit.has_value() + update.has_value() + load.has_value() != 1)
        return usage("check requires exactly one of --vs-git, --vs-commit, --update-hash-file, --vs-hash-file");

    if (vsGit) {
        opts.scan.mode = sync::ScanMode::DirtyVsRef;
        opts.scan.snapshot_file = *vsGit;
    } else if (vsCommit) {
        const auto hashFile = requiredValue(call, {"hash-file", "hashFile"});
        if (!hashFile) return usage("--vs-commit requires --hash-file");
        opts.scan.mode = sync::ScanMode::Commit;
        opts.scan.commit = *vsCommit;
        opts.scan.snapshot_file = *hashFile;
    } else if (update) {
        opts.scan.mode = sync::ScanMode::UpdateLocal;
        opts.scan.snapshot_file = *update;
    } else {
        opts.scan.mode = sync::ScanMode::LoadOnly;
        opts.scan.snapshot_file = *load;
    }

    if (const auto ref = requiredValue(call, {"ref", "vsGitHash"})) opts.scan.ref = *ref;
    opts.size_only = hasFlag(call, std::vector<std::string>{"size-only", "sizeOnly", "checkSizeOnly", "checksizeonly"});
    opts.deploy = hasFlag(call, std::vector<std::string>{"deploy", "deployOnClean", "deployonclean"});

    const auto configPath = requiredValue(call, {"config", "ftpConfig", "ftpconfig"});
    const auto cfg = initRuntime(configPath);

    log::Registry::deploywarden()->info("[deploywarden] check {} in {}", sync::to_string(opts.scan.mode),
                                        opts.working_dir.string());

    opts.backup_root = cfg.deploy.backup_dir;
    opts.project = cfg.deploy.project;

    vcs::Git git(opts.working_dir);
    TerminalIO io;
    PromptDecider decider(io);

    std::unique_ptr<remote::FtpStore> store;
    if (configPath && cfg.remote) {
        log::Registry::deploywarden()->debug("[deploywarden] remote {} deploy {}",
                                             nlohmann::json(*cfg.remote).dump(), nlohmann::json(cfg.deploy).dump());
        store = std::make_unique<remote::FtpStore>(*cfg.remote);
        store->connect();
    }

    sync::Controller controller(std::move(opts), git, store.get(), decider, io);
    return static_cast<int>(controller.run());
}

int runDiff(const CommandCall& call) {
    if (call.positionals.empty()) return usage("diff requires at least one path");

    initRuntime(std::nullopt);

    const auto ref = requiredValue(call, {"ref", "vsGitHash", "vsgit"}).value_or("HEAD");
    const auto workingDir = requiredValue(call, {"working-dir", "workingDir", "workingdir"}).value_or(".");

    const bool needsVcs = std::ranges::any_of(call.positionals, [](const std::string& p) {
        return p.find("::") == std::string::npos;
    });

    std::unique_ptr<vcs::Git> git;
    if (needsVcs) git = std::make_unique<vcs::Git>(fs::absolute(workingDir));

    diff::NormalizedDiff differ(workingDir, git.get(), ref);
    for (const auto& line : differ.compareAll(call.positionals)) std::cout << line << '\n';
    return EXIT_OK;
}

int runConfig(const CommandCall& call) {
    const auto cfg = initRuntime(requiredValue(call, {"config", "ftpConfig", "ftpconfig"}));
    std::cout << config::dumpConfig(cfg);
    return EXIT_OK;
}

}

int main(const int argc, char** argv) {
    int rc = EXIT_FATAL;

    try {
        const auto call = parseArgs(normalizeArgs(argc, argv), SWITCHES);

        if (call.name.empty()) rc = hasFlag(call, std::vector<std::string>{"help", "h"}) ? usage() : usage("missing command");
        else if (call.name == "help") rc = usage();
        else if (call.name == "check") rc = runCheck(call);
        else if (call.name == "diff") rc = runDiff(call);
        else if (call.name == "config") rc = runConfig(call);
        else rc = usage("unknown command '" + call.name + "'");
    } catch (const remote::TransportError& e) {
        std::cerr << "Remote error: " << e.what() << '\n';
        if (log::Registry::isInitialized())
            log::Registry::deploywarden()->error("[deploywarden] Remote error ({}): {}", remote::to_string(e.kind), e.what());
        rc = EXIT_ABORTED;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        if (log::Registry::isInitialized()) log::Registry::deploywarden()->error("[deploywarden] {}", e.what());
        rc = EXIT_FATAL;
    }

    if (log::Registry::isInitialized()) log::Registry::shutdown();
    return rc;
}
