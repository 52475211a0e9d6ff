#pragma once

#include "sync/Decider.hpp"

namespace dw::shell {

struct IO;

// Asks the operator through an IO channel. Any conflict answer other than
// replace or keep (empty included) aborts.
class PromptDecider final : public sync::Decider {
public:
    explicit PromptDecider(IO& io) : io_(io) {}

    sync::ConflictChoice onConflict(const sync::model::Classification& c) override;
    bool confirmDeploy(const sync::model::Plan& plan) override;

    static sync::ConflictChoice parseChoice(std::string answer);

private:
    IO& io_;
};

}
