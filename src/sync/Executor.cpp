#include "sync/Executor.hpp"
#include "remote/Store.hpp"
#include "util/timestamp.hpp"
#include "log/Registry.hpp"

#include <fstream>
#include <fmt/core.h>

using namespace dw::sync;
using namespace dw::sync::model;
using namespace dw::crypto;
using namespace dw::util;
namespace fs = std::filesystem;

Executor::Executor(remote::Store& store, Options opts) : store_(store), opts_(std::move(opts)) {}

fs::path Executor::backupPath(const Action& action) const {
    const auto suffix = action.remote_timestamp ? timestampToSuffix(*action.remote_timestamp)
                                                : compactTimestamp(now());
    return opts_.backup_root / opts_.project / fs::path(action.path + "." + suffix);
}

std::vector<Outcome> Executor::run(const Plan& plan) {
    std::vector<Outcome> outcomes;
    outcomes.reserve(plan.actions.size());

    bool halted = false;
    for (const auto& action : plan.actions) {
        Outcome out{.path = action.path, .type = action.type};

        if (halted) {
            out.reason = "not attempted after connection failure";
            outcomes.push_back(std::move(out));
            continue;
        }

        try {
            execute(action, out);
        } catch (const remote::TransportError& e) {
            out.result = Outcome::Result::Failed;
            out.reason = e.what();
            if (!e.isTimeout()) {
                halted = true;
                log::Registry::sync()->error("[Executor] {} transport error on {}, stopping: {}",
                                             remote::to_string(e.kind), action.path, e.what());
            } else {
                log::Registry::sync()->error("[Executor] Timeout on {}: {}", action.path, e.what());
            }
        } catch (const IntegrityError& e) {
            out.result = Outcome::Result::Failed;
            out.reason = e.what();
            log::Registry::sync()->error("[Executor] Integrity failure on {}: {}", action.path, e.what());
        } catch (const std::exception& e) {
            out.result = Outcome::Result::Failed;
            out.reason = e.what();
            log::Registry::sync()->error("[Executor] Failed to process {}: {}", action.path, e.what());
        }

        outcomes.push_back(std::move(out));
    }

    return outcomes;
}

void Executor::execute(const Action& action, Outcome& out) {
    if (action.needsBackup()) out.backup = backup(action);

    if (!action.uploads()) {
        out.result = Outcome::Result::Inspected;
        log::Registry::sync()->info("[Executor] Kept remote {}, copy at {}", action.path, out.backup->string());
        return;
    }

    store_.ensureDirectories(action.path);

    Fingerprint fresh;
    for (;;) {
        upload(action);
        ++out.uploads;

        if (verify(action, fresh)) break;

        if (out.uploads > opts_.max_verify_retries)
            throw IntegrityError(fmt::format("verification failed after {} uploads", out.uploads));

        log::Registry::sync()->warn("[Executor] Verification failed for {} (attempt {}/{}), retrying upload",
                                    action.path, out.uploads, opts_.max_verify_retries + 1);
    }

    out.result = Outcome::Result::Deployed;
    out.deployed = record::Deployment{fresh, now()};
    log::Registry::sync()->info("[Executor] Deployed {} ({} upload(s), {})", action.path, out.uploads, fresh.shortHex());
}

fs::path Executor::backup(const Action& action) {
    const auto& expected = action.remote_size;
    if (!expected) throw IntegrityError("no remote size recorded for backup check");

    const auto target = backupPath(action);
    fs::create_directories(target.parent_path());

    uintmax_t written = 0;
    bool found = false;
    {
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        if (!out) throw std::runtime_error("Failed to open backup file: " + target.string());

        found = store_.retrieve(action.path, [&](const char* data, const size_t len) {
            out.write(data, static_cast<std::streamsize>(len));
            if (!out) throw std::runtime_error("Failed to write backup file: " + target.string());
            written += len;
        });
    }

    if (!found) throw IntegrityError("remote object disappeared during backup");
    if (written != *expected)
        throw IntegrityError(fmt::format("backup size mismatch: got {} bytes, comparison saw {}", written, *expected));

    log::Registry::sync()->info("[Executor] Backed up {} -> {} ({} bytes, verified)", action.path, target.string(), written);
    return target;
}

void Executor::upload(const Action& action) {
    const auto local = opts_.working_dir / action.path;
    std::ifstream in(local, std::ios::binary);
    if (!in) throw std::runtime_error("Failed to open local file: " + local.string());

    store_.store(action.path, in);
    log::Registry::sync()->debug("[Executor] Uploaded {}", action.path);
}

bool Executor::verify(const Action& action, Fingerprint& fresh) {
    const auto local = Fingerprinter::ofFile(opts_.working_dir / action.path);
    if (!local) throw std::runtime_error("Local file vanished during deploy: " + action.path);
    fresh = local->fingerprint;

    Fingerprinter remote;
    if (!store_.retrieve(action.path, [&remote](const char* data, const size_t len) { remote.update(data, len); }))
        return false;

    return remote.finish().fingerprint == fresh;
}
