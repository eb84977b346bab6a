#include "MockProcess.hpp"
#include "TestFixtures.hpp"
#include "toolhost/supervisor/Terminator.hpp"

#include <gtest/gtest.h>

using namespace toolhost;
using toolhost::test::MockProcess;

class TerminatorTest : public ::testing::Test {
protected:
  void SetUp() override {
    test::init_test_logger();
    process_ = std::make_shared<MockProcess>();
    auto tool = std::make_shared<ToolConfig>();
    tool->id = "webui";
    record_ = std::make_shared<ProcessRecord>(
        "webui", process_, std::vector<std::string>{"python"}, "/tmp/webui.log",
        tool, std::chrono::steady_clock::now());
    registry_.register_record("webui", record_);
  }

  ProcessRegistry registry_;
  Terminator terminator_{registry_};
  std::shared_ptr<MockProcess> process_;
  std::shared_ptr<ProcessRecord> record_;
};

TEST_F(TerminatorTest, DefaultTimeoutIsTenSeconds) {
  EXPECT_EQ(terminator_.timeout(), std::chrono::seconds(10));
}

TEST_F(TerminatorTest, GracefulStop) {
  EXPECT_TRUE(terminator_.stop("webui"));

  EXPECT_EQ(process_->signal_history(), std::vector<std::string>{"TERM"});
  EXPECT_EQ(record_->status(), ToolStatus::Stopped);
  EXPECT_FALSE(process_->is_alive());
}

TEST_F(TerminatorTest, EscalatesToKillAfterTimeout) {
  process_->set_ignores_terminate(true);

  EXPECT_TRUE(terminator_.stop("webui"));

  EXPECT_EQ(process_->signal_history(),
            (std::vector<std::string>{"TERM", "KILL"}));
  EXPECT_EQ(process_->simulated_wait(), std::chrono::milliseconds(10000));
  EXPECT_EQ(process_->exit_code(), -9);
  EXPECT_EQ(record_->status(), ToolStatus::Stopped);
}

TEST_F(TerminatorTest, UnknownToolIsSuccess) {
  EXPECT_TRUE(terminator_.stop("NonexistentTool"));
}

TEST_F(TerminatorTest, StopIsIdempotent) {
  EXPECT_TRUE(terminator_.stop("webui"));
  EXPECT_TRUE(terminator_.stop("webui"));
  EXPECT_EQ(process_->signal_history().size(), 1u);
  EXPECT_EQ(record_->status(), ToolStatus::Stopped);
}

TEST_F(TerminatorTest, AlreadyExitedIsMarkedStopped) {
  process_->exit(1);
  EXPECT_TRUE(terminator_.stop("webui"));
  EXPECT_TRUE(process_->signal_history().empty());
  EXPECT_EQ(record_->status(), ToolStatus::Stopped);
}

TEST_F(TerminatorTest, SignalsSurvivingChildrenAfterExit) {
  process_->exit_leaving_children(0);
  ASSERT_FALSE(process_->is_alive());
  ASSERT_TRUE(process_->group_alive());

  EXPECT_TRUE(terminator_.stop("webui"));

  EXPECT_EQ(process_->signal_history(), std::vector<std::string>{"TERM"});
  EXPECT_FALSE(process_->group_alive());
  EXPECT_EQ(process_->exit_code(), 0);
  EXPECT_EQ(record_->status(), ToolStatus::Stopped);
}

TEST_F(TerminatorTest, KillsChildrenThatIgnoreTerm) {
  process_->set_ignores_terminate(true);
  process_->exit_leaving_children(0);

  EXPECT_TRUE(terminator_.stop("webui"));

  EXPECT_EQ(process_->signal_history(),
            (std::vector<std::string>{"TERM", "KILL"}));
  EXPECT_EQ(process_->simulated_wait(), std::chrono::milliseconds(10000));
  EXPECT_FALSE(process_->group_alive());
}

TEST_F(TerminatorTest, SignalFailureReportsFalse) {
  process_->set_signal_fails(true);

  EXPECT_FALSE(terminator_.stop("webui"));
  EXPECT_TRUE(process_->is_alive());
  EXPECT_NE(record_->status(), ToolStatus::Stopped);

  // Retry succeeds once signals can be delivered
  process_->set_signal_fails(false);
  EXPECT_TRUE(terminator_.stop("webui"));
  EXPECT_EQ(record_->status(), ToolStatus::Stopped);
}

TEST_F(TerminatorTest, CustomTimeout) {
  Terminator quick(registry_, std::chrono::milliseconds(250));
  process_->set_ignores_terminate(true);

  EXPECT_TRUE(quick.stop(record_));
  EXPECT_EQ(process_->simulated_wait(), std::chrono::milliseconds(250));
}
