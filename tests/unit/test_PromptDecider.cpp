#include <gtest/gtest.h>
#include "shell/PromptDecider.hpp"
#include "shell/IO.hpp"

#include <sstream>

using namespace dw::shell;
using namespace dw::sync;

TEST(PromptDeciderTest, ParseChoice) {
    EXPECT_EQ(PromptDecider::parseChoice("r"), ConflictChoice::Replace);
    EXPECT_EQ(PromptDecider::parseChoice(" Replace \n"), ConflictChoice::Replace);
    EXPECT_EQ(PromptDecider::parseChoice("K"), ConflictChoice::Keep);
    EXPECT_EQ(PromptDecider::parseChoice("keep"), ConflictChoice::Keep);
    EXPECT_EQ(PromptDecider::parseChoice("a"), ConflictChoice::Abort);
    EXPECT_EQ(PromptDecider::parseChoice(""), ConflictChoice::Abort);
    EXPECT_EQ(PromptDecider::parseChoice("y"), ConflictChoice::Abort);
}

TEST(PromptDeciderTest, ConflictOverTerminal) {
    std::istringstream in("k\n\n");
    std::ostringstream out;
    TerminalIO io(in, out);
    PromptDecider decider(io);

    model::Classification c;
    c.path = "x.php";
    c.status = model::Status::DIFF_HASH;

    EXPECT_EQ(decider.onConflict(c), ConflictChoice::Keep);
    EXPECT_EQ(decider.onConflict(c), ConflictChoice::Abort);   // empty line
    EXPECT_EQ(decider.onConflict(c), ConflictChoice::Abort);   // EOF
    EXPECT_NE(out.str().find("x.php"), std::string::npos);
}

TEST(PromptDeciderTest, EmptyAnswerConfirmsDeploy) {
    std::istringstream in("\nn\nY\r\nwhatever\n");
    std::ostringstream out;
    TerminalIO io(in, out);
    PromptDecider decider(io);

    const model::Plan plan;
    EXPECT_TRUE(decider.confirmDeploy(plan));
    EXPECT_FALSE(decider.confirmDeploy(plan));
    EXPECT_TRUE(decider.confirmDeploy(plan));
    EXPECT_FALSE(decider.confirmDeploy(plan));
    EXPECT_NE(out.str().find("Proceed with deployment? (Y/n): "), std::string::npos);
}
