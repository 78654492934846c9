/**
 * @copyright Copyright The HearthKernel Contributors
 */

#include "keyboard_task.hpp"

#include <gtest/gtest.h>

#include <initializer_list>
#include <vector>

#include "arch_mock.hpp"

namespace {

class RecordingTarget : public IWakeTarget {
 public:
  void Wake(TaskId id) override { woken.push_back(id); }

  std::vector<TaskId> woken;
};

class KeyboardTaskTest : public ::testing::Test {
 protected:
  void SetUp() override { arch_mock::Reset(); }

  void Feed(std::initializer_list<uint8_t> codes) {
    for (auto code : codes) {
      ASSERT_TRUE(queue_.Push(code));
    }
  }

  RecordingTarget target_;
  Waker waker_{7, &target_};
  ScancodeQueue queue_;
  KeyboardTask task_{queue_};
};

}  // namespace

TEST_F(KeyboardTaskTest, EchoesDecodedCharacters) {
  // "Ok\n"
  Feed({0x2A, 0x18, 0x98, 0xAA, 0x25, 0xA5, 0x1C, 0x9C});
  Context cx(waker_);

  EXPECT_EQ(task_.Poll(cx), PollResult::kPending);
  EXPECT_EQ(arch_mock::Get().console, "Ok\n");
  EXPECT_EQ(task_.echoed(), 3);
  EXPECT_TRUE(queue_.empty());
}

TEST_F(KeyboardTaskTest, SilentKeysAreNotEchoed) {
  // 方向键与 Ctrl
  Feed({0xE0, 0x48, 0xE0, 0xC8, 0x1D, 0x9D});
  Context cx(waker_);

  EXPECT_EQ(task_.Poll(cx), PollResult::kPending);
  EXPECT_EQ(task_.echoed(), 0);
  EXPECT_TRUE(queue_.empty());
}

TEST_F(KeyboardTaskTest, WaitsForNextScancode) {
  Context cx(waker_);
  EXPECT_EQ(task_.Poll(cx), PollResult::kPending);
  EXPECT_TRUE(target_.woken.empty());

  // 中断处理程序入队后唤醒任务
  ASSERT_TRUE(queue_.Push(0x1E));
  EXPECT_EQ(target_.woken, std::vector<TaskId>{7});

  EXPECT_EQ(task_.Poll(cx), PollResult::kPending);
  EXPECT_EQ(arch_mock::Get().console, "a");
}

TEST_F(KeyboardTaskTest, KeepsModifierStateAcrossPolls) {
  Context cx(waker_);
  Feed({0x2A});
  EXPECT_EQ(task_.Poll(cx), PollResult::kPending);
  Feed({0x1E, 0xAA, 0x1E});
  EXPECT_EQ(task_.Poll(cx), PollResult::kPending);
  EXPECT_EQ(arch_mock::Get().console, "Aa");
}
