#pragma once

#include "sync/model/Classification.hpp"
#include "sync/model/Action.hpp"

namespace dw::sync {

enum class ConflictChoice { Replace, Keep, Abort };

// Operator decisions the deploy pipeline cannot make on its own.
class Decider {
public:
    virtual ~Decider() = default;

    // Remote content matches none of the authorities.
    virtual ConflictChoice onConflict(const model::Classification& c) = 0;

    // Final go/no-go for a complete, non-aborted plan.
    virtual bool confirmDeploy(const model::Plan& plan) = 0;
};

}
