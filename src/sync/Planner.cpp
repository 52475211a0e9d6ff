#include "sync/Planner.hpp"
#include "sync/Decider.hpp"
#include "log/Registry.hpp"

using namespace dw::sync;
using namespace dw::sync::model;

Plan Planner::build(const std::vector<Classification>& classified, Decider& decider) {
    Plan plan;
    plan.actions.reserve(classified.size());

    for (const auto& c : classified) {
        if (isSizeOnly(c.status)) continue;
        if (c.status == Status::MATCH_LOCAL) continue;   // nothing to transfer

        // unknown remote content always needs a decision, even for a locally deleted path
        if (!c.local_exists && c.status != Status::DIFF_HASH) {
            log::Registry::sync()->warn("[Planner] {} has no local file, not planned ({})", c.path, to_string(c.status));
            continue;
        }

        switch (c.status) {
        case Status::MISSING:
            plan.actions.push_back({ActionType::Create, c.path, c.status, std::nullopt, std::nullopt});
            break;
        case Status::MATCH_REFERENCE:
        case Status::MATCH_LAST_DEPLOY:
            plan.actions.push_back({ActionType::Overwrite, c.path, c.status, c.remote_timestamp, c.remote_size});
            break;
        case Status::DIFF_HASH:
            switch (decider.onConflict(c)) {
            case ConflictChoice::Replace:
                if (!c.local_exists) {
                    log::Registry::sync()->warn("[Planner] {} has no local file to replace with, keeping remote", c.path);
                    plan.actions.push_back({ActionType::Inspect, c.path, c.status, c.remote_timestamp, c.remote_size});
                    break;
                }
                plan.actions.push_back({ActionType::Replace, c.path, c.status, c.remote_timestamp, c.remote_size});
                break;
            case ConflictChoice::Keep:
                plan.actions.push_back({ActionType::Inspect, c.path, c.status, c.remote_timestamp, c.remote_size});
                break;
            case ConflictChoice::Abort:
                log::Registry::sync()->warn("[Planner] Plan aborted on {}", c.path);
                plan.actions.clear();
                plan.aborted = true;
                plan.aborted_on = c.path;
                return plan;
            }
            break;
        default:
            break;
        }
    }

    log::Registry::sync()->info("[Planner] {} actions planned ({} uploads)", plan.actions.size(), plan.uploadCount());
    return plan;
}
