#include <gtest/gtest.h>
#include "sync/Controller.hpp"
#include "record/Snapshot.hpp"
#include "FakeVcs.hpp"
#include "MemoryStore.hpp"
#include "ScriptedDecider.hpp"
#include "TempDir.hpp"

using namespace dw::sync;
using namespace dw::sync::model;
using namespace dw::record;
using namespace dw::crypto;

class ControllerTest : public ::testing::Test {
protected:
    dw::test::TempDir work, state;
    dw::test::FakeVcs vcs;
    dw::test::MemoryStore store;
    dw::test::ScriptedDecider decider;
    dw::test::ScriptedIO io;

    void SetUp() override {
        work.write("safe.php", "local v2\n");
        work.write("new.php", "brand new\n");
        work.write("done.php", "already\n");
        vcs.dirty = {"safe.php", "new.php", "done.php"};
        vcs.trees["HEAD"] = {{"safe.php", "v1\n"}, {"done.php", "older\n"}};

        store.put("safe.php", "v1\r\n");
        store.put("done.php", "already");
    }

    Controller::Options options(const bool deploy) const {
        Controller::Options o;
        o.working_dir = work.path();
        o.scan = {.mode = ScanMode::DirtyVsRef, .snapshot_file = state.path() / "hashes.json"};
        o.deploy = deploy;
        o.backup_root = state.path() / "backups";
        o.project = "site";
        return o;
    }

    Controller controller(const bool deploy, dw::remote::Store* s) {
        return Controller(options(deploy), vcs, s, decider, io);
    }
};

TEST_F(ControllerTest, ScanOnlyWithoutRemote) {
    auto c = controller(false, nullptr);
    EXPECT_EQ(c.run(), ExitCode::Ok);
    EXPECT_TRUE(c.classified().empty());
    EXPECT_EQ(store.probes, 0u);

    const auto snap = Snapshot::load(state.path() / "hashes.json");
    ASSERT_TRUE(snap);
    EXPECT_EQ(snap->size(), 3u);
    EXPECT_NE(io.output.find("safe.php"), std::string::npos);
}

TEST_F(ControllerTest, ReportOnlyClassifiesAndBackfills) {
    auto c = controller(false, &store);
    EXPECT_EQ(c.run(), ExitCode::Ok);

    ASSERT_EQ(c.classified().size(), 3u);
    EXPECT_EQ(c.classified()[0].status, Status::MATCH_REFERENCE);
    EXPECT_EQ(c.classified()[1].status, Status::MISSING);
    EXPECT_EQ(c.classified()[2].status, Status::MATCH_LOCAL);
    EXPECT_EQ(store.stores, 0u);
    EXPECT_EQ(decider.confirmations, 0u);

    const auto snap = Snapshot::load(state.path() / "hashes.json");
    EXPECT_TRUE(snap->find("done.php")->last_deploy);
    EXPECT_FALSE(snap->find("safe.php")->last_deploy);
    EXPECT_NE(io.output.find("MATCH_REFERENCE"), std::string::npos);
}

TEST_F(ControllerTest, DeployRecordsProvenance) {
    auto c = controller(true, &store);
    EXPECT_EQ(c.run(), ExitCode::Ok);

    EXPECT_EQ(decider.confirmations, 1u);
    EXPECT_EQ(store.get("safe.php"), "local v2\n");
    EXPECT_EQ(store.get("new.php"), "brand new\n");

    const auto snap = Snapshot::load(state.path() / "hashes.json");
    ASSERT_TRUE(snap->find("safe.php")->last_deploy);
    EXPECT_EQ(snap->find("safe.php")->last_deploy->fingerprint, Fingerprinter::of("local v2").fingerprint);
    EXPECT_TRUE(snap->find("new.php")->last_deploy);
    EXPECT_TRUE(std::filesystem::exists(state.path() / "backups" / "site"));
}

TEST_F(ControllerTest, AbortMeansZeroTransfersAndNothingRecorded) {
    store.put("rogue.php", "edited on the server");
    work.write("rogue.php", "mine");
    vcs.dirty.push_back("rogue.php");
    decider.choices = {ConflictChoice::Abort};

    auto c = controller(true, &store);
    EXPECT_EQ(c.run(), ExitCode::Aborted);

    EXPECT_EQ(store.stores, 0u);
    EXPECT_EQ(decider.confirmations, 0u);
    EXPECT_EQ(c.classified().size(), 4u);

    const auto snap = Snapshot::load(state.path() / "hashes.json");
    EXPECT_FALSE(snap->find("done.php")->last_deploy);
    EXPECT_NE(io.output.find("ABORTED"), std::string::npos);
}

TEST_F(ControllerTest, LocallyDeletedFileWithChangedRemoteAborts) {
    vcs.dirty.push_back("deleted.php");
    vcs.trees["HEAD"]["deleted.php"] = "as committed\n";
    store.put("deleted.php", "changed on the server");
    decider.choices = {ConflictChoice::Abort};

    auto c = controller(true, &store);
    EXPECT_EQ(c.run(), ExitCode::Aborted);

    EXPECT_EQ(decider.asked, std::vector<std::string>{"deleted.php"});
    EXPECT_EQ(store.stores, 0u);
    EXPECT_EQ(decider.confirmations, 0u);
    EXPECT_EQ(store.get("deleted.php"), "changed on the server");
    EXPECT_NE(io.output.find("ABORTED at deleted.php"), std::string::npos);
}

TEST_F(ControllerTest, RemoteChangedAfterClassificationIsNotOverwritten) {
    decider.onConfirm = [this] { store.put("safe.php", "someone else's edit after the report"); };

    auto c = controller(true, &store);
    EXPECT_EQ(c.run(), ExitCode::PartialFailure);

    EXPECT_EQ(store.get("safe.php"), "someone else's edit after the report");
    EXPECT_EQ(store.get("new.php"), "brand new\n");
    EXPECT_NE(io.output.find("backup size mismatch"), std::string::npos);

    const auto snap = Snapshot::load(state.path() / "hashes.json");
    EXPECT_FALSE(snap->find("safe.php")->last_deploy);
    EXPECT_TRUE(snap->find("new.php")->last_deploy);
}

TEST_F(ControllerTest, DeclinedConfirmationStillFetchesKeptCopies) {
    store.put("rogue.php", "edited on the server");
    work.write("rogue.php", "mine");
    vcs.dirty.push_back("rogue.php");
    decider.choices = {ConflictChoice::Keep};
    decider.confirm = false;

    auto c = controller(true, &store);
    EXPECT_EQ(c.run(), ExitCode::Ok);

    EXPECT_EQ(store.stores, 0u);
    EXPECT_EQ(store.get("rogue.php"), "edited on the server");

    bool found = false;
    for (const auto& e : std::filesystem::recursive_directory_iterator(state.path() / "backups"))
        found = found || e.path().filename().string().starts_with("rogue.php.");
    EXPECT_TRUE(found);
}

TEST_F(ControllerTest, FailedItemsGivePartialFailure) {
    store.onStore = [](const std::string& path, const std::string& uploaded) {
        return path == "new.php" ? std::string("corrupt") : uploaded;
    };

    auto c = controller(true, &store);
    EXPECT_EQ(c.run(), ExitCode::PartialFailure);
    EXPECT_NE(io.output.find("new.php"), std::string::npos);
    EXPECT_NE(io.output.find("failed"), std::string::npos);

    const auto snap = Snapshot::load(state.path() / "hashes.json");
    EXPECT_TRUE(snap->find("safe.php")->last_deploy);
    EXPECT_FALSE(snap->find("new.php")->last_deploy);
}

TEST_F(ControllerTest, TransportErrorDuringComparisonInterrupts) {
    store.failures.push_back({.op = "probe", .at = 2, .kind = dw::remote::TransportError::Kind::Connection});

    auto c = controller(true, &store);
    EXPECT_EQ(c.run(), ExitCode::Aborted);
    EXPECT_EQ(c.classified().size(), 1u);
    EXPECT_EQ(store.stores, 0u);
    EXPECT_NE(io.output.find("Remote error"), std::string::npos);
}

TEST_F(ControllerTest, SizeOnlyNeverDeploys) {
    auto o = options(true);
    o.size_only = true;
    Controller c(o, vcs, &store, decider, io);

    EXPECT_EQ(c.run(), ExitCode::Ok);
    EXPECT_EQ(store.retrieves, 0u);
    EXPECT_EQ(store.stores, 0u);
    EXPECT_EQ(decider.confirmations, 0u);
}
