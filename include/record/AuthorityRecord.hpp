#pragma once

#include "crypto/Fingerprint.hpp"

#include <ctime>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace dw::record {

struct Deployment {
    crypto::Fingerprint fingerprint;
    std::time_t timestamp{};

    friend bool operator==(const Deployment&, const Deployment&) = default;
};

// What is known about one relative path across the three authorities.
// Every field except path is optional: absent means unknown, never an error.
struct AuthorityRecord {
    std::string path;   // forward-slash relative path, unique key

    std::optional<crypto::Fingerprint> local_fingerprint;
    std::optional<uintmax_t> local_size;
    std::optional<std::time_t> local_timestamp;

    std::optional<crypto::Fingerprint> reference_fingerprint;
    std::optional<std::time_t> reference_timestamp;

    std::optional<Deployment> last_deploy;

    AuthorityRecord() = default;
    explicit AuthorityRecord(std::string p) : path(std::move(p)) {}

    [[nodiscard]] bool existsLocally() const { return local_fingerprint.has_value(); }

    void clearLocal();
    void clearReference();

    friend bool operator==(const AuthorityRecord&, const AuthorityRecord&) = default;
};

void to_json(nlohmann::json& j, const AuthorityRecord& r);
void from_json(const nlohmann::json& j, AuthorityRecord& r);

void to_json(nlohmann::json& j, const Deployment& d);
void from_json(const nlohmann::json& j, Deployment& d);

}
