#pragma once

#include "sync/model/Action.hpp"
#include "record/AuthorityRecord.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace dw::sync::model {

struct Outcome {
    enum class Result { Deployed, Inspected, Failed, NotAttempted };

    std::string path;
    ActionType type{ActionType::Create};
    Result result{Result::NotAttempted};
    std::string reason;

    std::optional<std::filesystem::path> backup;
    unsigned int uploads = 0;
    std::optional<record::Deployment> deployed;   // set only when Deployed

    [[nodiscard]] bool ok() const { return result == Result::Deployed || result == Result::Inspected; }
};

std::string to_string(Outcome::Result r);

}
