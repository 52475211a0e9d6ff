#include <gtest/gtest.h>
#include "util/process.hpp"
#include "TempDir.hpp"

using namespace dw::util;

TEST(ProcessTest, CapturesStdoutAndExitCode) {
    const auto res = runProcess({"/bin/sh", "-c", "printf out; printf err >&2; exit 3"});
    EXPECT_EQ(res.exit_code, 3);
    EXPECT_FALSE(res.ok());
    EXPECT_EQ(res.out, "out");
    EXPECT_EQ(res.err, "err");
}

TEST(ProcessTest, RunsInWorkingDirectory) {
    dw::test::TempDir dir;
    dir.write("marker.txt", "here");
    const auto res = runProcess({"/bin/sh", "-c", "cat marker.txt"}, dir.path());
    EXPECT_TRUE(res.ok());
    EXPECT_EQ(res.out, "here");
}

TEST(ProcessTest, MissingBinaryIsSpawnError) {
    EXPECT_THROW(runProcess({"/nonexistent/deploywarden-no-such-binary"}), SpawnError);
    EXPECT_THROW(runProcess({}), std::invalid_argument);
}
