#pragma once

#include "record/AuthorityRecord.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace dw::record {

// The persisted record collection. Keeps insertion order (which is report
// order) with constant-time lookup by path, and tracks whether it needs saving.
class Snapshot {
public:
    Snapshot() = default;

    // nullopt if the file does not exist; throws on malformed content
    [[nodiscard]] static std::optional<Snapshot> load(const std::filesystem::path& file);
    static Snapshot fromJson(const nlohmann::json& j);

    void save(const std::filesystem::path& file);
    [[nodiscard]] nlohmann::json toJson() const;

    // Returns the existing record, or appends an empty one for the path.
    AuthorityRecord& upsert(const std::string& path);

    [[nodiscard]] AuthorityRecord* find(const std::string& path);
    [[nodiscard]] const AuthorityRecord* find(const std::string& path) const;
    [[nodiscard]] bool contains(const std::string& path) const { return find(path) != nullptr; }

    [[nodiscard]] const std::vector<AuthorityRecord>& records() const { return records_; }
    [[nodiscard]] std::vector<std::string> paths() const;
    [[nodiscard]] size_t size() const { return records_.size(); }
    [[nodiscard]] bool empty() const { return records_.empty(); }

    void markDirty() { dirty_ = true; }
    [[nodiscard]] bool isDirty() const { return dirty_; }

private:
    std::vector<AuthorityRecord> records_;
    std::unordered_map<std::string, size_t> index_;
    bool dirty_ = false;

    void append(AuthorityRecord record);
};

}
