#include <gtest/gtest.h>
#include "vcs/Git.hpp"
#include "util/process.hpp"
#include "TempDir.hpp"

#include <algorithm>

using namespace dw::vcs;
using namespace dw::util;

class GitTest : public ::testing::Test {
protected:
    dw::test::TempDir repo;

    void SetUp() override {
        try {
            if (!runProcess({"git", "--version"}).ok()) GTEST_SKIP() << "git not available";
        } catch (const SpawnError&) {
            GTEST_SKIP() << "git not available";
        }
        git({"init", "-q"});
        git({"config", "user.email", "tests@example.com"});
        git({"config", "user.name", "tests"});
        git({"config", "core.autocrlf", "false"});
    }

    void git(const std::vector<std::string>& args) const {
        std::vector<std::string> argv{"git"};
        argv.insert(argv.end(), args.begin(), args.end());
        const auto res = runProcess(argv, repo.path());
        ASSERT_TRUE(res.ok()) << res.err;
    }

    void commitAll(const std::string& msg, const std::string& date) const {
        git({"add", "-A"});
        git({"-c", "user.useConfigOnly=false", "commit", "-q", "-m", msg, "--date", date});
    }
};

TEST_F(GitTest, ReadsCommittedContentAndTimestamps) {
    repo.write("src/a.php", "v1");
    commitAll("first", "2024-05-01T10:00:00Z");
    repo.write("src/a.php", "v2");
    repo.write("src/b.php", "new");
    commitAll("second", "2024-06-01T10:00:00Z");

    Git g(repo.path());
    EXPECT_EQ(g.readFileAt("src/a.php", "HEAD"), "v2");
    EXPECT_EQ(g.readFileAt("src/a.php", "HEAD^"), "v1");
    EXPECT_FALSE(g.readFileAt("src/b.php", "HEAD^"));
    EXPECT_FALSE(g.readFileAt("missing.php", "HEAD"));

    EXPECT_EQ(g.lastCommitTimestamp("src/a.php", "HEAD"), 1717236000);
    EXPECT_EQ(g.lastCommitTimestamp("src/a.php", "HEAD^"), 1714557600);
    EXPECT_FALSE(g.lastCommitTimestamp("missing.php", "HEAD"));

    auto changed = g.changedPathsInCommit("HEAD");
    std::ranges::sort(changed);
    EXPECT_EQ(changed, (std::vector<std::string>{"src/a.php", "src/b.php"}));
    EXPECT_THROW(g.changedPathsInCommit("no-such-ref"), VcsError);
}

TEST_F(GitTest, ListsDirtyAndUntrackedPaths) {
    repo.write("tracked.txt", "x");
    commitAll("init", "2024-05-01T10:00:00Z");

    repo.write("tracked.txt", "y");
    repo.write("dir/untracked.txt", "z");

    Git g(repo.path());
    auto dirty = g.listDirtyPaths();
    std::ranges::sort(dirty);
    EXPECT_EQ(dirty, (std::vector<std::string>{"dir/untracked.txt", "tracked.txt"}));
}

TEST_F(GitTest, RejectsNonRepository) {
    dw::test::TempDir plain;
    EXPECT_THROW(Git{plain.path()}, VcsError);
}

TEST(GitPorcelainTest, RenamesYieldNewName) {
    const std::string out = std::string(" M a.txt\0R  new.txt\0old.txt\0?? dir/u.txt\0", 41);
    EXPECT_EQ(Git::parsePorcelainZ(out), (std::vector<std::string>{"a.txt", "new.txt", "dir/u.txt"}));
}
