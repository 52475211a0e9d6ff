#include "record/AuthorityRecord.hpp"
#include "util/files.hpp"
#include "util/timestamp.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace dw::record;
using namespace dw::crypto;
using namespace dw::util;

namespace {

// Legacy snapshots wrote "N/A" (or null) for anything unknown.
bool isUnknown(const nlohmann::json& v) {
    return v.is_null() || (v.is_string() && (v.get<std::string>() == "N/A" || v.get<std::string>().empty()));
}

const nlohmann::json* field(const nlohmann::json& j, const char* key, const char* legacyKey = nullptr) {
    if (auto it = j.find(key); it != j.end() && !isUnknown(*it)) return &*it;
    if (legacyKey)
        if (auto it = j.find(legacyKey); it != j.end() && !isUnknown(*it)) return &*it;
    return nullptr;
}

bool isCurrentDigest(const std::string& hex) {
    if (hex.size() != 2 * Fingerprinter::DIGEST_BYTES) return false;
    return std::ranges::all_of(hex, [](const char c) { return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'); });
}

// Digests of another algorithm or length (MD5 from older snapshots) can never
// match a current fingerprint and are read as unknown.
std::optional<Fingerprint> fingerprintField(const nlohmann::json& j, const char* key, const char* legacyKey = nullptr) {
    const auto* v = field(j, key, legacyKey);
    if (!v) return std::nullopt;
    if (!v->is_string()) throw std::invalid_argument(std::string("field '") + key + "' must be a string");

    auto hex = v->get<std::string>();
    if (!isCurrentDigest(hex)) {
        dw::log::Registry::record()->debug("[AuthorityRecord] Ignoring foreign digest '{}' in field '{}'", hex, key);
        return std::nullopt;
    }
    return Fingerprint{std::move(hex)};
}

std::optional<std::time_t> timestampField(const nlohmann::json& j, const char* key, const char* legacyKey = nullptr) {
    const auto* v = field(j, key, legacyKey);
    if (!v) return std::nullopt;
    if (v->is_number_integer()) return static_cast<std::time_t>(v->get<long long>());
    if (!v->is_string()) throw std::invalid_argument(std::string("field '") + key + "' must be a timestamp string");

    const auto parsed = parseIso8601(v->get<std::string>());
    if (!parsed)
        dw::log::Registry::record()->warn("[AuthorityRecord] Unparseable timestamp '{}' in field '{}', treating as unknown",
                                          v->get<std::string>(), key);
    return parsed;
}

std::optional<uintmax_t> sizeField(const nlohmann::json& j, const char* key, const char* legacyKey = nullptr) {
    const auto* v = field(j, key, legacyKey);
    if (!v) return std::nullopt;
    if (!v->is_number_unsigned() && !(v->is_number_integer() && v->get<long long>() >= 0))
        throw std::invalid_argument(std::string("field '") + key + "' must be a non-negative integer");
    return v->get<uintmax_t>();
}

}

void AuthorityRecord::clearLocal() {
    local_fingerprint.reset();
    local_size.reset();
    local_timestamp.reset();
}

void AuthorityRecord::clearReference() {
    reference_fingerprint.reset();
    reference_timestamp.reset();
}

void dw::record::to_json(nlohmann::json& j, const Deployment& d) {
    j = {
        {"hash", d.fingerprint},
        {"ts", timestampToString(d.timestamp)}
    };
}

void dw::record::from_json(const nlohmann::json& j, Deployment& d) {
    const auto fp = fingerprintField(j, "hash");
    if (!fp) throw std::invalid_argument("last_deploy requires 'hash'");
    d.fingerprint = *fp;
    d.timestamp = timestampField(j, "ts").value_or(std::time_t{0});
}

void dw::record::to_json(nlohmann::json& j, const AuthorityRecord& r) {
    j = nlohmann::json::object();
    j["path"] = r.path;

    if (r.local_fingerprint) j["local_hash"] = *r.local_fingerprint;
    if (r.local_size) j["local_size"] = *r.local_size;
    if (r.local_timestamp) j["local_ts"] = timestampToString(*r.local_timestamp);

    if (r.reference_fingerprint) j["git_hash"] = *r.reference_fingerprint;
    if (r.reference_timestamp) j["git_ts"] = timestampToString(*r.reference_timestamp);

    if (r.last_deploy) j["last_deploy"] = *r.last_deploy;
}

void dw::record::from_json(const nlohmann::json& j, AuthorityRecord& r) {
    if (!j.is_object()) throw std::invalid_argument("record must be a JSON object");
    if (!j.contains("path") || !j.at("path").is_string()) throw std::invalid_argument("record requires a string 'path'");

    r.path = normalizeRelPath(j.at("path").get<std::string>());
    if (r.path.empty()) throw std::invalid_argument("record 'path' is empty");

    r.local_fingerprint = fingerprintField(j, "local_hash", "hash");
    r.local_size = sizeField(j, "local_size", "size");
    r.local_timestamp = timestampField(j, "local_ts", "timestamp");

    r.reference_fingerprint = fingerprintField(j, "git_hash");
    r.reference_timestamp = timestampField(j, "git_ts");

    r.last_deploy.reset();
    if (const auto* d = field(j, "last_deploy")) {
        if (d->is_object() && !fingerprintField(*d, "hash"))
            dw::log::Registry::record()->warn("[AuthorityRecord] {}: last_deploy digest unusable, treating as never deployed", r.path);
        else
            r.last_deploy = d->get<Deployment>();
    }
}
