#include <gtest/gtest.h>
#include "sync/Provenance.hpp"
#include "record/Snapshot.hpp"

using namespace dw::sync;
using namespace dw::sync::model;
using namespace dw::record;
using namespace dw::crypto;

namespace {

Classification classified(const std::string& path, const Status s) {
    Classification c;
    c.path = path;
    c.status = s;
    c.local_exists = true;
    return c;
}

}

TEST(ProvenanceTest, BackfillSeedsOnlyAbsentLastDeploy) {
    Snapshot snap;
    snap.upsert("fresh").local_fingerprint = Fingerprint{"l1"};
    auto& known = snap.upsert("known");
    known.local_fingerprint = Fingerprint{"l2"};
    known.last_deploy = Deployment{Fingerprint{"old"}, 10};
    snap.upsert("other").local_fingerprint = Fingerprint{"l3"};

    const auto changed = Provenance::backfill(snap, {
        classified("fresh", Status::MATCH_LOCAL),
        classified("known", Status::MATCH_LOCAL),
        classified("other", Status::MATCH_REFERENCE),
    });

    EXPECT_EQ(changed, 1u);
    EXPECT_TRUE(snap.isDirty());
    ASSERT_TRUE(snap.find("fresh")->last_deploy);
    EXPECT_EQ(snap.find("fresh")->last_deploy->fingerprint, Fingerprint{"l1"});
    EXPECT_EQ(snap.find("known")->last_deploy->fingerprint, Fingerprint{"old"});
    EXPECT_FALSE(snap.find("other")->last_deploy);
}

TEST(ProvenanceTest, NothingToBackfillLeavesSnapshotClean) {
    Snapshot snap;
    snap.upsert("a").local_fingerprint = Fingerprint{"x"};
    EXPECT_EQ(Provenance::backfill(snap, {classified("a", Status::DIFF_HASH)}), 0u);
    EXPECT_FALSE(snap.isDirty());
}

TEST(ProvenanceTest, ApplyRecordsOnlyDeployedOutcomes) {
    Snapshot snap;
    snap.upsert("ok");
    snap.upsert("failed");
    snap.upsert("kept");

    std::vector<Outcome> outcomes(3);
    outcomes[0] = {.path = "ok", .result = Outcome::Result::Deployed,
                   .deployed = Deployment{Fingerprint{"new"}, 1714557600}};
    outcomes[1] = {.path = "failed", .result = Outcome::Result::Failed, .reason = "boom"};
    outcomes[2] = {.path = "kept", .type = ActionType::Inspect, .result = Outcome::Result::Inspected};

    EXPECT_EQ(Provenance::apply(snap, outcomes), 1u);
    EXPECT_TRUE(snap.isDirty());
    EXPECT_EQ(snap.find("ok")->last_deploy, (Deployment{Fingerprint{"new"}, 1714557600}));
    EXPECT_FALSE(snap.find("failed")->last_deploy);
    EXPECT_FALSE(snap.find("kept")->last_deploy);
}
