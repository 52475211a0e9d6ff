#include "shell/PromptDecider.hpp"
#include "shell/IO.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <cctype>
#include <fmt/core.h>

using namespace dw::shell;
using namespace dw::sync;

ConflictChoice PromptDecider::parseChoice(std::string answer) {
    std::erase_if(answer, [](const unsigned char c) { return std::isspace(c); });
    std::ranges::transform(answer, answer.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (answer == "r" || answer == "replace") return ConflictChoice::Replace;
    if (answer == "k" || answer == "keep") return ConflictChoice::Keep;
    return ConflictChoice::Abort;
}

ConflictChoice PromptDecider::onConflict(const model::Classification& c) {
    io_.print(fmt::format("\nWARNING: {} differs from local, reference and last deploy. Unknown remote state. {}",
                          c.path, c.details()));
    const auto choice = parseChoice(io_.prompt("[r]eplace remote (with backup), [k]eep remote (backup copy only), [a]bort: ", ""));
    log::Registry::shell()->debug("[PromptDecider] Conflict on {} answered {}", c.path, static_cast<int>(choice));
    return choice;
}

bool PromptDecider::confirmDeploy(const model::Plan& plan) {
    io_.print(fmt::format("\n{} file(s) to upload, {} remote copy(ies) to fetch for inspection.",
                          plan.uploadCount(), plan.inspectCount()));
    return io_.confirm("Proceed with deployment? (Y/n): ", false);
}
