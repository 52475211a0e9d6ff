#include <gtest/gtest.h>
#include "shell/Report.hpp"
#include "shell/Table.hpp"
#include "record/Snapshot.hpp"

using namespace dw::shell;
using namespace dw::sync;
using namespace dw::sync::model;

namespace {

Classification classified(const std::string& path, const Status s) {
    Classification c;
    c.path = path;
    c.status = s;
    c.local_size = 3;
    c.remote_size = 5;
    return c;
}

}

TEST(TableTest, AlignsColumnsAndClampsPaths) {
    Table t({{.header = "File", .max = 10, .ellipsize_middle = true}, {.header = "Status"}});
    t.add_row({"short", "A"});
    t.add_row({"a/very/long/path/name.php", "B"});

    const auto out = t.render();
    EXPECT_NE(out.find("File       | Status"), std::string::npos);
    EXPECT_NE(out.find("short      | A"), std::string::npos);
    EXPECT_NE(out.find("a/v....php | B"), std::string::npos);
}

TEST(TableTest, EllipsizeMiddle) {
    EXPECT_EQ(Table::ellipsize_middle("abcdefghij", 7), "ab...ij");
    EXPECT_EQ(Table::ellipsize_middle("abc", 7), "abc");
}

TEST(ReportTest, SummaryCountsOnlyOccurringStatuses) {
    const auto out = Report::summary({
        classified("a", Status::MISSING),
        classified("b", Status::MISSING),
        classified("c", Status::MATCH_LOCAL),
    });
    EXPECT_NE(out.find("3 path(s) compared"), std::string::npos);
    EXPECT_NE(out.find("MISSING"), std::string::npos);
    EXPECT_NE(out.find("MATCH_LOCAL"), std::string::npos);
    EXPECT_EQ(out.find("DIFF_HASH"), std::string::npos);
    EXPECT_LT(out.find("MATCH_LOCAL"), out.find("MISSING"));
}

TEST(ReportTest, SizeOnlyDetails) {
    EXPECT_EQ(classified("a", Status::MATCH_SIZE).details(), "Size: 3");
    EXPECT_NE(classified("a", Status::DIFF_SIZE).details().find("Local: 3 vs Remote: 5"), std::string::npos);
    EXPECT_EQ(classified("a", Status::UNKNOWN).details(), "Cannot compare size");
    EXPECT_EQ(classified("a", Status::DIFF_HASH).details(), "[L: N/A ? R: N/A]");
}

TEST(ReportTest, OutcomesListFailures) {
    std::vector<Outcome> outcomes(2);
    outcomes[0] = {.path = "ok.php", .result = Outcome::Result::Deployed};
    outcomes[1] = {.path = "bad.php", .result = Outcome::Result::Failed, .reason = "backup size mismatch"};

    const auto out = Report::outcomes(outcomes);
    EXPECT_NE(out.find(" - bad.php [failed] backup size mismatch"), std::string::npos);
    EXPECT_EQ(out.find("ok.php"), std::string::npos);

    EXPECT_NE(Report::outcomes({outcomes[0]}).find("completed successfully"), std::string::npos);
}

TEST(ReportTest, ScanLinesShowReferenceAndLocal) {
    dw::record::Snapshot snap;
    snap.upsert("a.php");
    const auto out = Report::scanLines(snap, {"a.php", "unknown.php"}, ScanMode::DirtyVsRef);
    EXPECT_NE(out.find("a.php | ref: N/A"), std::string::npos);
    EXPECT_NE(out.find("| local: N/A"), std::string::npos);
    EXPECT_EQ(out.find("unknown.php"), std::string::npos);

    const auto local = Report::scanLines(snap, {"a.php"}, ScanMode::UpdateLocal);
    EXPECT_EQ(local.find("ref:"), std::string::npos);
}
