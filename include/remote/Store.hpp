#pragma once

#include <cstdint>
#include <ctime>
#include <functional>
#include <istream>
#include <optional>
#include <stdexcept>
#include <string>

namespace dw::remote {

struct TransportError : std::runtime_error {
    enum class Kind { Connection, Timeout, Protocol };

    Kind kind;

    TransportError(const Kind k, const std::string& what) : std::runtime_error(what), kind(k) {}

    [[nodiscard]] bool isTimeout() const { return kind == Kind::Timeout; }
};

std::string to_string(TransportError::Kind k);

// Receives retrieved content chunk by chunk.
using Sink = std::function<void(const char* data, size_t len)>;

// One remote deployment target. Paths are relative to the target's root.
// Not-found is a normal answer (nullopt / false); everything else that goes
// wrong on the wire is a TransportError.
class Store {
public:
    virtual ~Store() = default;

    virtual std::optional<uintmax_t> probeSize(const std::string& remotePath) = 0;

    // nullopt when missing or when the server cannot say
    virtual std::optional<std::time_t> probeModifiedTime(const std::string& remotePath) = 0;

    // false when the object does not exist
    virtual bool retrieve(const std::string& remotePath, const Sink& sink) = 0;

    virtual void store(const std::string& remotePath, std::istream& source) = 0;

    // Every parent directory of remotePath exists afterwards.
    virtual void ensureDirectories(const std::string& remotePath) = 0;

    [[nodiscard]] virtual std::string describe(const std::string& remotePath) const { return remotePath; }
};

}
