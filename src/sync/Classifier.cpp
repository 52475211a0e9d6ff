#include "sync/Classifier.hpp"
#include "remote/Store.hpp"
#include "log/Registry.hpp"

using namespace dw::sync;
using namespace dw::sync::model;
using namespace dw::record;
using namespace dw::crypto;

Classifier::Classifier(remote::Store& store, const Mode mode) : store_(store), mode_(mode) {}

Status Classifier::decide(const Fingerprint& remote, const AuthorityRecord& record) {
    if (record.local_fingerprint && *record.local_fingerprint == remote) return Status::MATCH_LOCAL;
    if (record.reference_fingerprint && *record.reference_fingerprint == remote) return Status::MATCH_REFERENCE;
    if (record.last_deploy && record.last_deploy->fingerprint == remote) return Status::MATCH_LAST_DEPLOY;
    return Status::DIFF_HASH;
}

Status Classifier::decideBySize(const std::optional<uintmax_t>& local, const std::optional<uintmax_t>& remote) {
    if (!local || !remote) return Status::UNKNOWN;
    return *local == *remote ? Status::MATCH_SIZE : Status::DIFF_SIZE;
}

TimeOrder Classifier::order(const std::optional<std::time_t>& local, const std::optional<std::time_t>& remote) {
    if (!local || !remote) return TimeOrder::Unknown;
    if (*local > *remote) return TimeOrder::Newer;
    if (*local < *remote) return TimeOrder::Older;
    return TimeOrder::Equal;
}

Classification Classifier::classify(const AuthorityRecord& record) {
    Classification c{
        .path = record.path,
        .local_exists = record.existsLocally(),
        .local_size = record.local_size,
        .local_timestamp = record.local_timestamp,
    };

    c.remote_size = store_.probeSize(record.path);
    if (!c.remote_size) {
        c.status = Status::MISSING;
        log::Registry::sync()->debug("[Classifier] {} -> MISSING", record.path);
        return c;
    }

    c.remote_timestamp = store_.probeModifiedTime(record.path);
    c.order = order(c.local_timestamp, c.remote_timestamp);

    if (mode_ == Mode::SizeOnly) {
        c.status = decideBySize(c.local_size, c.remote_size);
        return c;
    }

    Fingerprinter fp;
    if (!store_.retrieve(record.path, [&fp](const char* data, const size_t len) { fp.update(data, len); })) {
        // vanished between probe and retrieval
        log::Registry::sync()->warn("[Classifier] {} disappeared after probe", record.path);
        c.remote_size.reset();
        c.remote_timestamp.reset();
        c.order = TimeOrder::Unknown;
        c.status = Status::MISSING;
        return c;
    }

    const auto digest = fp.finish();
    c.remote_fingerprint = digest.fingerprint;
    c.status = decide(digest.fingerprint, record);

    log::Registry::sync()->debug("[Classifier] {} -> {} (remote {})", record.path, to_string(c.status),
                                 digest.fingerprint.shortHex());
    return c;
}
