#include <gtest/gtest.h>
#include "sync/Scanner.hpp"
#include "FakeVcs.hpp"
#include "TempDir.hpp"

#include <fstream>
#include <nlohmann/json.hpp>

using namespace dw::sync;
using namespace dw::record;
using namespace dw::crypto;

namespace {

Fingerprint fp(const std::string& content) { return Fingerprinter::of(content).fingerprint; }

}

class ScannerTest : public ::testing::Test {
protected:
    dw::test::TempDir work, state;
    dw::test::FakeVcs vcs;

    [[nodiscard]] std::filesystem::path hashFile() const { return state.path() / "hashes.json"; }

    Scanner::Options opts(const ScanMode mode) const {
        return {.mode = mode, .snapshot_file = hashFile()};
    }
};

TEST_F(ScannerTest, DirtyScanFillsLocalAndReference) {
    work.write("a.php", "new\r\n");
    vcs.dirty = {"a.php", "gone.php", "a.php"};
    vcs.trees["HEAD"] = {{"a.php", "old\n"}, {"gone.php", "was here"}};
    vcs.commitTimes["HEAD"] = {{"a.php", 1714467600}};

    Scanner scanner(vcs, work.path());
    const auto res = scanner.scan(opts(ScanMode::DirtyVsRef));

    EXPECT_EQ(res.working_set, (std::vector<std::string>{"a.php", "gone.php"}));
    EXPECT_TRUE(res.snapshot.isDirty());

    const auto* a = res.snapshot.find("a.php");
    ASSERT_TRUE(a);
    EXPECT_EQ(a->local_fingerprint, Fingerprinter::of("new").fingerprint);
    EXPECT_EQ(a->local_size, 5u);
    EXPECT_TRUE(a->local_timestamp);
    EXPECT_EQ(a->reference_fingerprint, Fingerprinter::of("old").fingerprint);
    EXPECT_EQ(a->reference_timestamp, 1714467600);

    const auto* gone = res.snapshot.find("gone.php");
    ASSERT_TRUE(gone);
    EXPECT_FALSE(gone->existsLocally());
    EXPECT_TRUE(gone->reference_fingerprint);
}

TEST_F(ScannerTest, ExistingLastDeploySurvivesRescan) {
    Snapshot prior;
    auto& r = prior.upsert("a.php");
    r.last_deploy = Deployment{fp("deployed"), 100};
    r.local_fingerprint = fp("stale");
    prior.upsert("untouched.php").local_size = 7;
    prior.save(hashFile());

    work.write("a.php", "x");
    vcs.dirty = {"a.php"};

    Scanner scanner(vcs, work.path());
    const auto res = scanner.scan(opts(ScanMode::DirtyVsRef));

    const auto* a = res.snapshot.find("a.php");
    EXPECT_EQ(a->last_deploy, (Deployment{fp("deployed"), 100}));
    EXPECT_EQ(a->local_fingerprint, Fingerprinter::of("x").fingerprint);
    EXPECT_FALSE(a->reference_fingerprint);   // not in HEAD
    EXPECT_EQ(res.snapshot.find("untouched.php")->local_size, 7u);
    EXPECT_EQ(res.working_set, std::vector<std::string>{"a.php"});
}

TEST_F(ScannerTest, CommitModeDefaultsReferenceToParent) {
    work.write("lib/x.php", "v2");
    vcs.commits["abc123"] = {"lib/x.php"};
    vcs.trees["abc123^"] = {{"lib/x.php", "v1"}};

    auto o = opts(ScanMode::Commit);
    o.commit = "abc123";
    EXPECT_EQ(Scanner::effectiveRef(o), "abc123^");

    Scanner scanner(vcs, work.path());
    const auto res = scanner.scan(o);
    EXPECT_EQ(res.working_set, std::vector<std::string>{"lib/x.php"});
    EXPECT_EQ(res.snapshot.find("lib/x.php")->reference_fingerprint, Fingerprinter::of("v1").fingerprint);

    o.ref = "main";
    EXPECT_EQ(Scanner::effectiveRef(o), "main");
}

TEST_F(ScannerTest, UpdateLocalLeavesReferenceAlone) {
    Snapshot prior;
    auto& r = prior.upsert("a.php");
    r.reference_fingerprint = fp("ref");
    r.local_fingerprint = fp("stale");
    prior.save(hashFile());

    work.write("a.php", "fresh");
    work.write("b.php", "dirty");
    vcs.dirty = {"b.php"};
    vcs.trees["HEAD"] = {{"a.php", "something"}, {"b.php", "base"}};

    Scanner scanner(vcs, work.path());
    const auto res = scanner.scan(opts(ScanMode::UpdateLocal));

    EXPECT_EQ(res.working_set, (std::vector<std::string>{"a.php", "b.php"}));
    EXPECT_EQ(res.snapshot.find("a.php")->reference_fingerprint, fp("ref"));
    EXPECT_EQ(res.snapshot.find("a.php")->local_fingerprint, Fingerprinter::of("fresh").fingerprint);
    EXPECT_FALSE(res.snapshot.find("b.php")->reference_fingerprint);
    EXPECT_TRUE(res.snapshot.find("b.php")->existsLocally());
}

TEST_F(ScannerTest, LoadOnlyRequiresSnapshot) {
    Scanner scanner(vcs, work.path());
    EXPECT_THROW(scanner.scan(opts(ScanMode::LoadOnly)), std::runtime_error);

    Snapshot prior;
    prior.upsert("x").local_fingerprint = fp("1");
    prior.save(hashFile());

    vcs.dirty = {"ignored.php"};
    const auto res = scanner.scan(opts(ScanMode::LoadOnly));
    EXPECT_EQ(res.working_set, std::vector<std::string>{"x"});
    EXPECT_EQ(res.snapshot.find("x")->local_fingerprint, fp("1"));
    EXPECT_FALSE(res.snapshot.isDirty());
}

TEST_F(ScannerTest, LoadOnlyRefingerprintsMd5EraSnapshot) {
    work.write("a.php", "current\r\n");
    std::ofstream(hashFile()) << R"([
        {"path": "a.php", "hash": "0cc175b9c0f1b6a831c399e269772661", "size": 1, "timestamp": "N/A",
         "git_hash": "92eb5ffee6ae2fec3ad71c777531578f"},
        {"path": "deleted.php", "hash": "4a8a08f09d37b73795649038408b5f33", "size": 1, "timestamp": "N/A"}
    ])";

    Scanner scanner(vcs, work.path());
    const auto res = scanner.scan(opts(ScanMode::LoadOnly));

    const auto* a = res.snapshot.find("a.php");
    EXPECT_EQ(a->local_fingerprint, fp("current"));
    EXPECT_EQ(a->local_size, 9u);
    EXPECT_FALSE(a->reference_fingerprint);

    const auto* gone = res.snapshot.find("deleted.php");
    EXPECT_FALSE(gone->local_fingerprint);
    EXPECT_EQ(gone->local_size, 1u);
    EXPECT_TRUE(res.snapshot.isDirty());
}
