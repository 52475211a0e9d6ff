#pragma once

#include "sync/model/Classification.hpp"
#include "record/AuthorityRecord.hpp"

#include <optional>

namespace dw::remote { class Store; }

namespace dw::sync {

class Classifier {
public:
    enum class Mode { Content, SizeOnly };

    explicit Classifier(remote::Store& store, Mode mode = Mode::Content);

    // Probes the remote object and, in content mode, fetches and fingerprints it.
    // TransportError propagates.
    model::Classification classify(const record::AuthorityRecord& record);

    // First match wins: local, reference, last deploy.
    static model::Status decide(const crypto::Fingerprint& remote, const record::AuthorityRecord& record);

    static model::Status decideBySize(const std::optional<uintmax_t>& local, const std::optional<uintmax_t>& remote);

    static model::TimeOrder order(const std::optional<std::time_t>& local, const std::optional<std::time_t>& remote);

    [[nodiscard]] Mode mode() const { return mode_; }

private:
    remote::Store& store_;
    Mode mode_;
};

}
