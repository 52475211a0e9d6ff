#pragma once

#include "sync/model/Action.hpp"
#include "sync/model/Classification.hpp"

#include <vector>

namespace dw::sync {

class Decider;

// Applies the deploy safety policy to classified paths.
struct Planner {
    // Asks the decider about every DIFF_HASH path in report order; the first
    // abort discards everything and stops asking.
    static model::Plan build(const std::vector<model::Classification>& classified, Decider& decider);
};

}
