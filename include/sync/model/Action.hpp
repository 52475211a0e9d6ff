#pragma once

#include "sync/model/Status.hpp"

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

namespace dw::sync::model {

enum class ActionType {
    Create,         // remote missing: upload, no backup
    Overwrite,      // remote matches reference or last deploy: backup, upload
    Replace,        // operator approved overwrite of unknown remote content
    Inspect,        // operator kept the remote: backup copy only
};

std::string to_string(ActionType t);

struct Action {
    ActionType type{ActionType::Create};
    std::string path;
    Status status{Status::MISSING};
    std::optional<std::time_t> remote_timestamp{};   // backup suffix
    std::optional<uintmax_t> remote_size{};          // as classified, checked against the backup

    [[nodiscard]] bool needsBackup() const { return type != ActionType::Create; }
    [[nodiscard]] bool uploads() const { return type != ActionType::Inspect; }
};

// Either every item is safe or approved, or the whole plan is aborted and
// carries no actions.
struct Plan {
    std::vector<Action> actions;
    bool aborted = false;
    std::string aborted_on;

    [[nodiscard]] bool empty() const { return actions.empty(); }
    [[nodiscard]] size_t uploadCount() const;
    [[nodiscard]] size_t inspectCount() const { return actions.size() - uploadCount(); }
};

}
