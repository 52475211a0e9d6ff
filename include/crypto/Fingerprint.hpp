#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <sodium.h>
#include <nlohmann/json_fwd.hpp>

namespace dw::crypto {

// Lowercase hex BLAKE2b digest over content with every '\r' and '\n' removed.
// Equal fingerprints mean equal normalized bytes, not equal raw bytes.
struct Fingerprint {
    std::string hex;

    Fingerprint() = default;
    explicit Fingerprint(std::string h) : hex(std::move(h)) {}

    [[nodiscard]] bool empty() const { return hex.empty(); }
    [[nodiscard]] std::string shortHex() const { return hex.substr(0, 12); }

    friend bool operator==(const Fingerprint&, const Fingerprint&) = default;
};

struct Digest {
    Fingerprint fingerprint;
    uintmax_t raw_size = 0;   // un-normalized byte count
};

// Streaming fingerprinter: feed chunks with update(), then finish().
class Fingerprinter {
public:
    static constexpr size_t DIGEST_BYTES = crypto_generichash_BYTES;

    Fingerprinter();

    void update(const char* data, size_t len);
    void update(std::string_view chunk) { update(chunk.data(), chunk.size()); }

    // Single use; a second call throws.
    [[nodiscard]] Digest finish();

    [[nodiscard]] uintmax_t rawSize() const { return raw_size_; }

    [[nodiscard]] static Digest of(std::string_view bytes);

    // nullopt if the file does not exist; throws on any other read failure
    [[nodiscard]] static std::optional<Digest> ofFile(const std::filesystem::path& path);

private:
    crypto_generichash_state state_{};
    uintmax_t raw_size_ = 0;
    bool finished_ = false;
};

void to_json(nlohmann::json& j, const Fingerprint& f);
void from_json(const nlohmann::json& j, Fingerprint& f);

}
