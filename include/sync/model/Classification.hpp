#pragma once

#include "sync/model/Status.hpp"
#include "crypto/Fingerprint.hpp"

#include <ctime>
#include <optional>
#include <string>

namespace dw::sync::model {

struct Classification {
    std::string path;
    Status status{Status::UNKNOWN};
    TimeOrder order{TimeOrder::Unknown};

    bool local_exists = false;
    std::optional<uintmax_t> local_size, remote_size;
    std::optional<std::time_t> local_timestamp, remote_timestamp;
    std::optional<crypto::Fingerprint> remote_fingerprint;

    // "[L: 2024-05-01 10:00:00 > R: 2024-04-30 09:00:00]", or the size
    // comparison in size-only mode
    [[nodiscard]] std::string details() const;
};

}
