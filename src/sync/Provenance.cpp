#include "sync/Provenance.hpp"
#include "record/Snapshot.hpp"
#include "util/timestamp.hpp"
#include "log/Registry.hpp"

using namespace dw::sync;
using namespace dw::sync::model;
using namespace dw::record;

size_t Provenance::backfill(Snapshot& snapshot, const std::vector<Classification>& classified) {
    size_t changed = 0;
    const auto ts = util::now();

    for (const auto& c : classified) {
        if (c.status != Status::MATCH_LOCAL) continue;

        auto* rec = snapshot.find(c.path);
        if (!rec || rec->last_deploy || !rec->local_fingerprint) continue;

        rec->last_deploy = Deployment{*rec->local_fingerprint, ts};
        ++changed;
        log::Registry::sync()->debug("[Provenance] Seeded last deploy for {}", c.path);
    }

    if (changed) {
        snapshot.markDirty();
        log::Registry::sync()->info("[Provenance] Seeded last deploy for {} already matching paths", changed);
    }
    return changed;
}

size_t Provenance::apply(Snapshot& snapshot, const std::vector<Outcome>& outcomes) {
    size_t changed = 0;

    for (const auto& o : outcomes) {
        if (o.result != Outcome::Result::Deployed || !o.deployed) continue;

        auto& rec = snapshot.upsert(o.path);
        if (rec.last_deploy == o.deployed) continue;

        rec.last_deploy = o.deployed;
        ++changed;
    }

    if (changed) {
        snapshot.markDirty();
        log::Registry::sync()->info("[Provenance] Recorded {} deployments", changed);
    }
    return changed;
}
