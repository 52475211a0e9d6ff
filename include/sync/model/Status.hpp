#pragma once

#include <array>
#include <string>

namespace dw::sync::model {

// Outcome of comparing the remote object with the three authorities.
// Exactly one per path per run; never persisted.
enum class Status {
    MATCH_LOCAL,
    MATCH_REFERENCE,
    MATCH_LAST_DEPLOY,
    DIFF_HASH,
    MISSING,

    // size-only mode
    MATCH_SIZE,
    DIFF_SIZE,
    UNKNOWN,
};

inline constexpr std::array ALL_STATUSES = {
    Status::MATCH_LOCAL, Status::MATCH_REFERENCE, Status::MATCH_LAST_DEPLOY, Status::DIFF_HASH,
    Status::MISSING,     Status::MATCH_SIZE,      Status::DIFF_SIZE,         Status::UNKNOWN,
};

// local mtime relative to remote mtime; descriptive only
enum class TimeOrder { Newer, Older, Equal, Unknown };

std::string to_string(Status s);
std::string to_string(TimeOrder o);

// ">", "<", "=", "?"
char symbol(TimeOrder o);

[[nodiscard]] bool isSizeOnly(Status s);

}
