#include <gtest/gtest.h>
#include "util/process.hpp"

#include <csignal>

using namespace sv::util;

TEST(ProcessTest, ReportsExitCode) {
    const auto ok = runProcess({"true"});
    EXPECT_TRUE(ok.exited);
    EXPECT_TRUE(ok.success());

    const auto st = runProcess({"sh", "-c", "exit 3"});
    EXPECT_TRUE(st.exited);
    EXPECT_EQ(st.code, 3);
    EXPECT_FALSE(st.success());
    EXPECT_EQ(st.describe(), "exit status 3");
}

TEST(ProcessTest, ReportsTerminatingSignal) {
    const auto st = runProcess({"sh", "-c", "kill -TERM $$"});
    EXPECT_FALSE(st.exited);
    EXPECT_EQ(st.signal, SIGTERM);
    EXPECT_FALSE(st.success());
}

TEST(ProcessTest, UnknownProgramExits127) {
    const auto st = runProcess({"/nonexistent/program"});
    EXPECT_TRUE(st.exited);
    EXPECT_EQ(st.code, 127);
}

TEST(ProcessTest, EmptyArgvIsRejected) {
    EXPECT_THROW(runProcess({}), std::invalid_argument);
}

TEST(ProcessTest, JoinArgsQuotesOnlyWhenNeeded) {
    EXPECT_EQ(joinArgs({"rsync", "-a", "/src/"}), "rsync -a /src/");
    EXPECT_EQ(joinArgs({"ls", "a b", ""}), "ls \"a b\" \"\"");
    EXPECT_EQ(joinArgs({"echo", "say \"hi\""}), "echo \"say \\\"hi\\\"\"");
}
