#pragma once

#include "sync/Scanner.hpp"
#include "sync/Classifier.hpp"
#include "sync/model/Classification.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace dw::vcs { class Provider; }
namespace dw::remote { class Store; }
namespace dw::shell { struct IO; }

namespace dw::sync {

class Decider;

enum class ExitCode : int {
    Ok = 0,
    Fatal = 1,
    Aborted = 2,            // plan aborted or remote comparison interrupted
    PartialFailure = 3,     // some deploy items failed
};

// One check run: scan, then (with a remote) classify and report, then
// (when deploying) plan, confirm, execute and record provenance.
class Controller {
public:
    struct Options {
        std::filesystem::path working_dir;
        Scanner::Options scan;
        bool size_only = false;
        bool deploy = false;
        std::filesystem::path backup_root;
        std::string project;
    };

    // store may be null: scan only
    Controller(Options opts, vcs::Provider& vcs, remote::Store* store, Decider& decider, shell::IO& io);

    ExitCode run();

    [[nodiscard]] const std::vector<model::Classification>& classified() const { return classified_; }

private:
    Options opts_;
    vcs::Provider& vcs_;
    remote::Store* store_;
    Decider& decider_;
    shell::IO& io_;

    std::vector<model::Classification> classified_;

    void saveIfDirty(record::Snapshot& snapshot) const;
    ExitCode deploy(record::Snapshot& snapshot);
};

}
