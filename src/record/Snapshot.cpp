#include "record/Snapshot.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace dw::record;
using namespace dw::util;

std::optional<Snapshot> Snapshot::load(const std::filesystem::path& file) {
    if (!std::filesystem::exists(file)) return std::nullopt;

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(readFileToString(file));
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Snapshot " + file.string() + " is not valid JSON: " + e.what());
    }

    try {
        auto snap = fromJson(j);
        log::Registry::record()->debug("[Snapshot] Loaded {} records from {}", snap.size(), file.string());
        return snap;
    } catch (const std::exception& e) {
        throw std::runtime_error("Snapshot " + file.string() + ": " + e.what());
    }
}

Snapshot Snapshot::fromJson(const nlohmann::json& j) {
    Snapshot snap;

    const auto add = [&snap](AuthorityRecord rec) {
        if (snap.contains(rec.path)) {
            log::Registry::record()->warn("[Snapshot] Duplicate record for '{}', keeping the later one", rec.path);
            *snap.find(rec.path) = std::move(rec);
            return;
        }
        snap.append(std::move(rec));
    };

    if (j.is_array()) {
        for (const auto& item : j) add(item.get<AuthorityRecord>());
    } else if (j.is_object()) {
        // keyed layout: {"path": {...}}
        for (const auto& [key, item] : j.items()) {
            auto obj = item;
            if (!obj.is_object()) throw std::invalid_argument("record for '" + key + "' must be an object");
            if (!obj.contains("path")) obj["path"] = key;
            add(obj.get<AuthorityRecord>());
        }
    } else {
        throw std::invalid_argument("snapshot must be a JSON array or object");
    }

    return snap;
}

nlohmann::json Snapshot::toJson() const {
    auto j = nlohmann::json::array();
    for (const auto& r : records_) j.push_back(r);
    return j;
}

void Snapshot::save(const std::filesystem::path& file) {
    writeFileAtomic(file, toJson().dump(4) + "\n");
    dirty_ = false;
    log::Registry::record()->info("[Snapshot] Saved {} records to {}", records_.size(), file.string());
}

AuthorityRecord& Snapshot::upsert(const std::string& path) {
    const auto key = normalizeRelPath(path);
    if (key.empty()) throw std::invalid_argument("Snapshot::upsert: empty path");
    if (const auto it = index_.find(key); it != index_.end()) return records_[it->second];
    append(AuthorityRecord(key));
    return records_.back();
}

AuthorityRecord* Snapshot::find(const std::string& path) {
    const auto it = index_.find(normalizeRelPath(path));
    return it == index_.end() ? nullptr : &records_[it->second];
}

const AuthorityRecord* Snapshot::find(const std::string& path) const {
    const auto it = index_.find(normalizeRelPath(path));
    return it == index_.end() ? nullptr : &records_[it->second];
}

std::vector<std::string> Snapshot::paths() const {
    std::vector<std::string> out;
    out.reserve(records_.size());
    for (const auto& r : records_) out.push_back(r.path);
    return out;
}

void Snapshot::append(AuthorityRecord record) {
    index_.emplace(record.path, records_.size());
    records_.push_back(std::move(record));
}
