#pragma once

#include "sync/model/Classification.hpp"
#include "sync/model/Outcome.hpp"
#include "sync/Scanner.hpp"

#include <string>
#include <vector>

namespace dw::record { class Snapshot; }

namespace dw::shell {

// Operator-facing text blocks; callers print them through an IO.
struct Report {
    // "path | ref: ts | local: ts" per scanned path
    static std::string scanLines(const record::Snapshot& snapshot, const std::vector<std::string>& paths,
                                 sync::ScanMode mode);

    static std::string classification(const std::vector<sync::model::Classification>& classified);

    // one count per status that occurred, in status order
    static std::string summary(const std::vector<sync::model::Classification>& classified);

    static std::string plan(const sync::model::Plan& plan);

    // itemized failures, or a success line
    static std::string outcomes(const std::vector<sync::model::Outcome>& outcomes);
};

}
