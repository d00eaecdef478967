#include <gtest/gtest.h>
#include "sync/ProcessExecutor.hpp"
#include "sync/SimulatedExecutor.hpp"
#include "error/Errors.hpp"
#include "FakeVolumes.hpp"

using namespace sv::sync;
using namespace sv::config;
using namespace sv::test;

namespace {

CommandBuilder commandsWith(const std::string& btrfs, const std::string& rsync, const std::string& diffTool) {
    ToolsConfig tools;
    tools.btrfs = btrfs;
    tools.rsync = rsync;
    tools.reflink_diff = diffTool;
    return {tools, TransferConfig{}};
}

}

TEST(SimulatedExecutorTest, ReportsMutationsWithoutRunningThem) {
    const auto delegate = std::make_shared<RecordingExecutor>();
    SimulatedExecutor sim(CommandBuilder::fromConfig(Config{}), delegate);

    sim.clone("/dst/2024-01-01", "/dst/2024-01-10");
    sim.barrier("/dst/2024-01-10");
    sim.transfer("/src/2024-01-10", "/dst/2024-01-10");
    sim.markReadOnly("/dst/2024-01-10");

    ASSERT_EQ(sim.reported().size(), 4u);
    EXPECT_EQ(sim.reported()[0].step, "clone");
    EXPECT_EQ(sim.reported()[1].step, "barrier");
    EXPECT_EQ(sim.reported()[2].step, "content-transfer");
    EXPECT_EQ(sim.reported()[3].step, "mark-readonly");
    EXPECT_TRUE(delegate->ops.empty());
}

TEST(SimulatedExecutorTest, DiffRunsThroughDelegateInSimulateMode) {
    const auto delegate = std::make_shared<RecordingExecutor>();
    SimulatedExecutor sim(CommandBuilder::fromConfig(Config{}), delegate);

    sim.diff({"/src/a", "/src/b", "/dst/a", "/dst/b"}, DiffMode::Apply);

    ASSERT_EQ(delegate->ops.size(), 1u);
    EXPECT_EQ(delegate->ops[0].name, "diff");
    EXPECT_EQ(delegate->ops[0].mode, DiffMode::Simulate);
    EXPECT_TRUE(sim.reported().empty());
}

TEST(SimulatedExecutorTest, RequiresDiffDelegate) {
    EXPECT_THROW(SimulatedExecutor(CommandBuilder::fromConfig(Config{}), nullptr), std::invalid_argument);
}

TEST(ProcessExecutorTest, SucceedsWhenToolsExitZero) {
    ProcessExecutor exec(commandsWith("true", "true", "true"));

    EXPECT_NO_THROW(exec.clone("/dst/a", "/dst/b"));
    EXPECT_NO_THROW(exec.barrier("/dst/b"));
    EXPECT_NO_THROW(exec.diff({"/src/a", "/src/b", "/dst/a", "/dst/b"}, DiffMode::Apply));
    EXPECT_NO_THROW(exec.transfer("/src/b", "/dst/b"));
    EXPECT_NO_THROW(exec.markReadOnly("/dst/b"));
}

TEST(ProcessExecutorTest, NonZeroExitIsExternalToolFailure) {
    ProcessExecutor exec(commandsWith("true", "false", "true"));

    try {
        exec.transfer("/src/2024-01-10", "/dst/2024-01-10");
        FAIL() << "expected ExternalToolFailure";
    } catch (const sv::error::ExternalToolFailure& e) {
        EXPECT_EQ(e.step, "content-transfer");
        EXPECT_NE(e.command.find("/src/2024-01-10/"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("exit status 1"), std::string::npos);
    }
}

TEST(ProcessExecutorTest, MissingToolIsExternalToolFailure) {
    ProcessExecutor exec(commandsWith("/nonexistent/subvolsync-btrfs", "true", "true"));
    EXPECT_THROW(exec.clone("/dst/a", "/dst/b"), sv::error::ExternalToolFailure);
}
