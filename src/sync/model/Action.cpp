#include "sync/model/Action.hpp"
#include "sync/model/Outcome.hpp"

#include <algorithm>

using namespace dw::sync::model;

std::string dw::sync::model::to_string(const ActionType t) {
    switch (t) {
    case ActionType::Create: return "create";
    case ActionType::Overwrite: return "overwrite";
    case ActionType::Replace: return "replace";
    case ActionType::Inspect: return "inspect";
    }
    return "unknown";
}

std::string dw::sync::model::to_string(const Outcome::Result r) {
    switch (r) {
    case Outcome::Result::Deployed: return "deployed";
    case Outcome::Result::Inspected: return "inspected";
    case Outcome::Result::Failed: return "failed";
    case Outcome::Result::NotAttempted: return "not attempted";
    }
    return "unknown";
}

size_t Plan::uploadCount() const {
    return static_cast<size_t>(std::ranges::count_if(actions, [](const Action& a) { return a.uploads(); }));
}
