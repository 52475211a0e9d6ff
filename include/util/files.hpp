#pragma once

#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>
#include <string>

namespace dw::util {

inline std::string readFileToString(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) throw std::runtime_error("Failed to open file: " + path.string());

    const std::streamsize size = in.tellg();
    in.seekg(0, std::ios::beg);

    std::string buffer(static_cast<size_t>(size), '\0');
    if (size > 0 && !in.read(buffer.data(), size))
        throw std::runtime_error("Failed to read file: " + path.string());
    in.close();

    return buffer;
}

inline std::string generate_random_suffix(const size_t length = 8) {
    static constexpr char charset[] =
        "0123456789"
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "abcdefghijklmnopqrstuvwxyz";
    thread_local std::mt19937 rng{std::random_device{}()};
    thread_local std::uniform_int_distribution<> dist(0, sizeof(charset) - 2);

    std::string result;
    result.reserve(length);
    for (size_t i = 0; i < length; ++i) result += charset[dist(rng)];
    return result;
}

// Writes to a sibling temp file, then renames over the target.
inline void writeFileAtomic(const std::filesystem::path& target, const std::string& contents) {
    namespace fs = std::filesystem;

    if (target.has_parent_path()) fs::create_directories(target.parent_path());
    const fs::path tmp = target.string() + ".tmp-" + generate_random_suffix();

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) throw std::runtime_error("Failed to open temp file for writing: " + tmp.string());
        out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
        out.flush();
        if (!out) {
            out.close();
            fs::remove(tmp);
            throw std::runtime_error("Failed to write file: " + tmp.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) {
        fs::remove(tmp);
        throw std::runtime_error("Failed to replace " + target.string() + ": " + ec.message());
    }
}

// Forward slashes, no leading "./" or "/", no empty segments.
inline std::string normalizeRelPath(std::string p) {
    for (auto& c : p) if (c == '\\') c = '/';

    std::string out;
    out.reserve(p.size());
    size_t i = 0;
    while (i < p.size()) {
        const auto next = p.find('/', i);
        const auto seg = p.substr(i, next == std::string::npos ? std::string::npos : next - i);
        if (!seg.empty() && seg != ".") {
            if (!out.empty()) out.push_back('/');
            out += seg;
        }
        if (next == std::string::npos) break;
        i = next + 1;
    }
    return out;
}

// remote_root + "/" + rel, collapsing duplicate separators. Result is absolute.
inline std::string joinRemote(const std::string& root, const std::string& rel) {
    std::string joined = "/" + normalizeRelPath(root);
    const auto tail = normalizeRelPath(rel);
    if (!tail.empty()) {
        if (joined.back() != '/') joined.push_back('/');
        joined += tail;
    }
    return joined;
}

}
