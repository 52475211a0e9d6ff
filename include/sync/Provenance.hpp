#pragma once

#include "sync/model/Classification.hpp"
#include "sync/model/Outcome.hpp"

#include <vector>

namespace dw::record { class Snapshot; }

namespace dw::sync {

// Folds deploy results back into the records. Marks the snapshot dirty when
// any last_deploy changed; saving is the caller's business.
struct Provenance {
    // MATCH_LOCAL paths with no last_deploy get the local fingerprint and now.
    // Returns the number of records changed.
    static size_t backfill(record::Snapshot& snapshot, const std::vector<model::Classification>& classified);

    // Deployed outcomes become last_deploy. Returns the number of records changed.
    static size_t apply(record::Snapshot& snapshot, const std::vector<model::Outcome>& outcomes);
};

}
