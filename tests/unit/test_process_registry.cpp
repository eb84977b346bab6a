#include "MockProcess.hpp"
#include "TestFixtures.hpp"
#include "toolhost/supervisor/ProcessRegistry.hpp"

#include <atomic>
#include <gtest/gtest.h>
#include <thread>

using namespace toolhost;
using toolhost::test::MockProcess;

class ProcessRegistryTest : public ::testing::Test {
protected:
  void SetUp() override { test::init_test_logger(); }

  std::shared_ptr<ProcessRecord> make_record(const std::string &tool_id) {
    auto tool = std::make_shared<ToolConfig>();
    tool->id = tool_id;
    tool->display_name = tool_id;
    return std::make_shared<ProcessRecord>(
        tool_id, std::make_shared<MockProcess>(), std::vector<std::string>{"x"},
        "/tmp/" + tool_id + ".log", tool, std::chrono::steady_clock::now());
  }

  ProcessRegistry registry_;
};

TEST_F(ProcessRegistryTest, GetNonexistent) {
  EXPECT_EQ(registry_.get("NonexistentTool"), nullptr);
  EXPECT_FALSE(registry_.has("NonexistentTool"));
}

TEST_F(ProcessRegistryTest, UpdateNonexistent) {
  EXPECT_FALSE(registry_.update_status("NonexistentTool", ToolStatus::Running));
}

TEST_F(ProcessRegistryTest, RegisterAndGet) {
  auto record = make_record("A1111");
  EXPECT_EQ(registry_.register_record("A1111", record), nullptr);

  EXPECT_TRUE(registry_.has("A1111"));
  EXPECT_EQ(registry_.get("A1111"), record);
  EXPECT_EQ(record->status(), ToolStatus::Starting);
}

TEST_F(ProcessRegistryTest, RegisterReplacesCurrentRecord) {
  auto first = make_record("Forge");
  auto second = make_record("Forge");
  registry_.register_record("Forge", first);

  EXPECT_EQ(registry_.register_record("Forge", second), first);
  EXPECT_EQ(registry_.get("Forge"), second);
  EXPECT_EQ(registry_.size(), 1u);
}

TEST_F(ProcessRegistryTest, UpdateStatus) {
  registry_.register_record("A1111", make_record("A1111"));

  EXPECT_TRUE(registry_.update_status("A1111", ToolStatus::Running));
  EXPECT_EQ(registry_.get("A1111")->status(), ToolStatus::Running);

  EXPECT_TRUE(registry_.update_status("A1111", ToolStatus::Error));
  EXPECT_EQ(registry_.get("A1111")->status(), ToolStatus::Error);

  EXPECT_TRUE(registry_.update_status("A1111", ToolStatus::Running));
  EXPECT_EQ(registry_.get("A1111")->status(), ToolStatus::Running);
}

TEST_F(ProcessRegistryTest, StoppedIsTerminal) {
  auto record = make_record("A1111");
  registry_.register_record("A1111", record);

  registry_.update_status("A1111", ToolStatus::Stopped);
  registry_.update_status("A1111", ToolStatus::Running);
  registry_.update_status("A1111", ToolStatus::Error);
  EXPECT_EQ(record->status(), ToolStatus::Stopped);

  EXPECT_FALSE(record->mark_stopped());
  EXPECT_FALSE(record->promote_if_starting());
}

TEST_F(ProcessRegistryTest, PromoteOnlyFromStarting) {
  auto record = make_record("A1111");
  EXPECT_TRUE(record->promote_if_starting());
  EXPECT_EQ(record->status(), ToolStatus::Running);

  record->apply_transition(ToolStatus::Error);
  EXPECT_FALSE(record->promote_if_starting());
  EXPECT_EQ(record->status(), ToolStatus::Error);
}

TEST_F(ProcessRegistryTest, ListAll) {
  registry_.register_record("A1111", make_record("A1111"));
  registry_.register_record("ComfyUI", make_record("ComfyUI"));
  registry_.register_record("Forge", make_record("Forge"));

  auto entries = registry_.list();
  ASSERT_EQ(entries.size(), 3u);
  EXPECT_EQ(entries[0].first, "A1111");
  EXPECT_EQ(entries[1].first, "ComfyUI");
  EXPECT_EQ(entries[2].first, "Forge");
}

TEST_F(ProcessRegistryTest, ConcurrentWritersAndReaders) {
  const std::vector<std::string> ids = {"A1111", "Forge", "ComfyUI", "Fooocus"};
  for (const auto &id : ids) {
    registry_.register_record(id, make_record(id));
  }

  std::atomic<bool> stop{false};
  std::atomic<int> invalid{0};

  std::vector<std::thread> threads;
  for (const auto &id : ids) {
    threads.emplace_back([&, id]() {
      for (int i = 0; i < 2000; ++i) {
        registry_.update_status(id, i % 2 ? ToolStatus::Running
                                          : ToolStatus::Error);
      }
    });
  }
  threads.emplace_back([&]() {
    while (!stop) {
      for (const auto &[id, record] : registry_.list()) {
        auto s = record->status();
        if (s != ToolStatus::Starting && s != ToolStatus::Running &&
            s != ToolStatus::Error)
          ++invalid;
      }
    }
  });
  threads.emplace_back([&]() {
    for (int i = 0; i < 500; ++i) {
      registry_.register_record("Scratch", make_record("Scratch"));
      registry_.get("Scratch");
    }
  });

  for (size_t i = 0; i < threads.size(); ++i) {
    if (i == ids.size()) {
      continue; // reader joined last
    }
    threads[i].join();
  }
  stop = true;
  threads[ids.size()].join();

  EXPECT_EQ(invalid, 0);
  EXPECT_EQ(registry_.size(), ids.size() + 1);
}
