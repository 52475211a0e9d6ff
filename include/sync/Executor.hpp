#pragma once

#include "sync/model/Action.hpp"
#include "sync/model/Outcome.hpp"
#include "crypto/Fingerprint.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace dw::remote { class Store; }

namespace dw::sync {

// Backup size mismatch or verification exhaustion; fails one item only.
struct IntegrityError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

class Executor {
public:
    static constexpr unsigned int MAX_VERIFY_RETRIES = 3;

    struct Options {
        std::filesystem::path working_dir;
        std::filesystem::path backup_root;
        std::string project;
        unsigned int max_verify_retries = MAX_VERIFY_RETRIES;
    };

    Executor(remote::Store& store, Options opts);

    // One outcome per action, in plan order. Integrity failures and timeouts
    // fail a single item; any other transport failure also marks every
    // remaining item as not attempted.
    std::vector<model::Outcome> run(const model::Plan& plan);

    [[nodiscard]] std::filesystem::path backupPath(const model::Action& action) const;

private:
    remote::Store& store_;
    Options opts_;

    void execute(const model::Action& action, model::Outcome& out);

    std::filesystem::path backup(const model::Action& action);
    void upload(const model::Action& action);
    [[nodiscard]] bool verify(const model::Action& action, crypto::Fingerprint& fresh);
};

}
