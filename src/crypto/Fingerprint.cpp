#include "crypto/Fingerprint.hpp"
#include "log/Registry.hpp"

#include <array>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

using namespace dw::crypto;

namespace {

void ensureSodiumInit() {
    static std::once_flag once;
    std::call_once(once, [] {
        if (sodium_init() < 0) throw std::runtime_error("libsodium failed to initialize");
    });
}

constexpr size_t CHUNK_SIZE = 8192;

}

Fingerprinter::Fingerprinter() {
    ensureSodiumInit();
    crypto_generichash_init(&state_, nullptr, 0, DIGEST_BYTES);
}

void Fingerprinter::update(const char* data, const size_t len) {
    if (finished_) throw std::logic_error("Fingerprinter::update() called after finish()");
    raw_size_ += len;

    // hash maximal runs between line-ending bytes, never copying the chunk
    size_t start = 0;
    for (size_t i = 0; i < len; ++i) {
        if (data[i] != '\r' && data[i] != '\n') continue;
        if (i > start)
            crypto_generichash_update(&state_, reinterpret_cast<const unsigned char*>(data + start), i - start);
        start = i + 1;
    }
    if (len > start)
        crypto_generichash_update(&state_, reinterpret_cast<const unsigned char*>(data + start), len - start);
}

Digest Fingerprinter::finish() {
    if (finished_) throw std::logic_error("Fingerprinter::finish() called twice");
    finished_ = true;

    std::array<unsigned char, DIGEST_BYTES> hash{};
    crypto_generichash_final(&state_, hash.data(), hash.size());

    std::ostringstream result;
    for (const auto b : hash)
        result << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);

    return {Fingerprint{result.str()}, raw_size_};
}

Digest Fingerprinter::of(const std::string_view bytes) {
    Fingerprinter fp;
    fp.update(bytes);
    return fp.finish();
}

std::optional<Digest> Fingerprinter::ofFile(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) return std::nullopt;

    std::ifstream file(path, std::ios::binary);
    if (!file) throw std::runtime_error("Failed to open file for hashing: " + path.string());

    Fingerprinter fp;
    char buffer[CHUNK_SIZE];
    while (file.good()) {
        file.read(buffer, sizeof(buffer));
        fp.update(buffer, static_cast<size_t>(file.gcount()));
    }
    if (file.bad()) throw std::runtime_error("Failed to read file for hashing: " + path.string());

    auto digest = fp.finish();
    dw::log::Registry::crypto()->trace("[Fingerprinter] {} -> {} ({} bytes)",
                                       path.string(), digest.fingerprint.shortHex(), digest.raw_size);
    return digest;
}

void dw::crypto::to_json(nlohmann::json& j, const Fingerprint& f) { j = f.hex; }

void dw::crypto::from_json(const nlohmann::json& j, Fingerprint& f) { f.hex = j.get<std::string>(); }
