/**
 * @copyright Copyright The HearthKernel Contributors
 */

#include "executor.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

#include "arch_mock.hpp"
#include "kernel_config.hpp"

namespace {

class ExecutorTest : public ::testing::Test {
 protected:
  void SetUp() override { arch_mock::Reset(); }

  /// 每次轮询都挂起，并把 Waker 保存到 slot
  static auto Parked(std::optional<Waker>* slot, int* polls) {
    return [slot, polls](Context& cx) {
      (*polls)++;
      *slot = cx.waker();
      return PollResult::kPending;
    };
  }

  Executor executor_;
};

}  // namespace

TEST_F(ExecutorTest, ReadyTaskRunsOnceAndIsRemoved) {
  int polls = 0;
  auto id = executor_.Spawn(MakeTask("once", [&polls](Context&) {
    polls++;
    return PollResult::kReady;
  }));
  ASSERT_TRUE(id.has_value());
  EXPECT_EQ(executor_.TaskCount(), 1);
  EXPECT_EQ(executor_.ReadyCount(), 1);
  EXPECT_EQ(executor_.GetTaskStatus(*id), TaskStatusId::kReady);

  executor_.RunReadyTasks();
  executor_.RunReadyTasks();

  EXPECT_EQ(polls, 1);
  EXPECT_EQ(executor_.TaskCount(), 0);
  EXPECT_FALSE(executor_.GetTaskStatus(*id).has_value());
  EXPECT_EQ(executor_.stats().polls, 1);
  EXPECT_EQ(executor_.stats().completions, 1);
}

TEST_F(ExecutorTest, NullTaskIsRejected) {
  auto id = executor_.Spawn(etl::unique_ptr<Task>());
  ASSERT_FALSE(id.has_value());
  EXPECT_EQ(id.error().code, ErrorCode::kTaskInvalid);
  EXPECT_EQ(executor_.TaskCount(), 0);
}

TEST_F(ExecutorTest, TaskIdsAreUnique) {
  auto first = executor_.Spawn(
      MakeTask("a", [](Context&) { return PollResult::kReady; }));
  auto second = executor_.Spawn(
      MakeTask("b", [](Context&) { return PollResult::kReady; }));
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_NE(*first, *second);
}

TEST_F(ExecutorTest, PendingTaskWaitsForWake) {
  std::optional<Waker> waker;
  int polls = 0;
  auto id = executor_.Spawn(MakeTask("parked", Parked(&waker, &polls)));
  ASSERT_TRUE(id.has_value());

  executor_.RunReadyTasks();
  EXPECT_EQ(polls, 1);
  EXPECT_EQ(executor_.GetTaskStatus(*id), TaskStatusId::kSuspended);
  EXPECT_EQ(executor_.ReadyCount(), 0);

  // 没有唤醒时不会被轮询
  executor_.RunReadyTasks();
  EXPECT_EQ(polls, 1);

  ASSERT_TRUE(waker.has_value());
  EXPECT_EQ(waker->id(), *id);
  waker->Wake();
  EXPECT_EQ(executor_.GetTaskStatus(*id), TaskStatusId::kReady);
  EXPECT_EQ(executor_.ReadyCount(), 1);

  executor_.RunReadyTasks();
  EXPECT_EQ(polls, 2);
  EXPECT_EQ(executor_.TaskCount(), 1);
}

TEST_F(ExecutorTest, RedundantWakeQueuesOnce) {
  std::optional<Waker> waker;
  int polls = 0;
  ASSERT_TRUE(
      executor_.Spawn(MakeTask("parked", Parked(&waker, &polls))).has_value());
  executor_.RunReadyTasks();

  waker->Wake();
  waker->Wake();
  waker->Wake();
  EXPECT_EQ(executor_.ReadyCount(), 1);
  EXPECT_EQ(executor_.stats().redundant_wakes, 2);

  executor_.RunReadyTasks();
  EXPECT_EQ(polls, 2);
  EXPECT_EQ(executor_.ReadyCount(), 0);
}

TEST_F(ExecutorTest, WakingFinishedOrUnknownTaskIsIgnored) {
  std::optional<Waker> waker;
  auto id = executor_.Spawn(MakeTask("finish", [&waker](Context& cx) {
    waker = cx.waker();
    return PollResult::kReady;
  }));
  ASSERT_TRUE(id.has_value());
  executor_.RunReadyTasks();

  waker->Wake();
  executor_.Wake(0xFFFF'FFFF);
  EXPECT_EQ(executor_.stats().stale_wakes, 2);
  EXPECT_EQ(executor_.ReadyCount(), 0);

  executor_.RunReadyTasks();
  EXPECT_EQ(executor_.stats().polls, 1);
  EXPECT_EQ(executor_.stats().completions, 1);
}

TEST_F(ExecutorTest, SelfWakeRunsInNextRound) {
  int polls = 0;
  auto id = executor_.Spawn(MakeTask("yield", [&polls](Context& cx) {
    polls++;
    if (polls == 3) {
      return PollResult::kReady;
    }
    cx.waker().Wake();
    return PollResult::kPending;
  }));
  ASSERT_TRUE(id.has_value());

  executor_.RunReadyTasks();
  EXPECT_EQ(polls, 1);
  EXPECT_EQ(executor_.ReadyCount(), 1);
  EXPECT_EQ(executor_.GetTaskStatus(*id), TaskStatusId::kSuspended);

  executor_.RunReadyTasks();
  EXPECT_EQ(polls, 2);
  executor_.RunReadyTasks();
  EXPECT_EQ(polls, 3);
  EXPECT_EQ(executor_.TaskCount(), 0);
  EXPECT_EQ(executor_.ReadyCount(), 0);
}

TEST_F(ExecutorTest, PollsInSpawnOrder) {
  std::vector<std::string> order;
  for (const char* name : {"first", "second", "third"}) {
    ASSERT_TRUE(executor_
                    .Spawn(MakeTask(name,
                                    [&order, name](Context&) {
                                      order.emplace_back(name);
                                      return PollResult::kReady;
                                    }))
                    .has_value());
  }
  executor_.RunReadyTasks();
  EXPECT_EQ(order, (std::vector<std::string>{"first", "second", "third"}));
}

TEST_F(ExecutorTest, TaskSpawnedDuringPollRunsNextRound) {
  std::vector<std::string> order;
  ASSERT_TRUE(executor_
                  .Spawn(MakeTask("parent",
                                  [this, &order](Context&) {
                                    order.emplace_back("parent");
                                    auto child = executor_.Spawn(MakeTask(
                                        "child", [&order](Context&) {
                                          order.emplace_back("child");
                                          return PollResult::kReady;
                                        }));
                                    EXPECT_TRUE(child.has_value());
                                    return PollResult::kReady;
                                  }))
                  .has_value());

  executor_.RunReadyTasks();
  EXPECT_EQ(order, std::vector<std::string>{"parent"});
  executor_.RunReadyTasks();
  EXPECT_EQ(order, (std::vector<std::string>{"parent", "child"}));
}

TEST_F(ExecutorTest, FullTableRejectsSpawn) {
  std::optional<Waker> waker;
  int polls = 0;
  for (size_t i = 0; i < kernel::config::kMaxTasks; i++) {
    ASSERT_TRUE(executor_.Spawn(MakeTask("filler", Parked(&waker, &polls)))
                    .has_value());
  }
  auto id = executor_.Spawn(MakeTask("overflow", Parked(&waker, &polls)));
  ASSERT_FALSE(id.has_value());
  EXPECT_EQ(id.error().code, ErrorCode::kTaskTableFull);
  EXPECT_EQ(executor_.TaskCount(), kernel::config::kMaxTasks);
}

TEST_F(ExecutorTest, SleepsOnlyWhenIdle) {
  executor_.SleepIfIdle();
  EXPECT_EQ(arch_mock::Get().halt_count, 1);
  EXPECT_TRUE(arch_mock::Get().interrupts_enabled);

  ASSERT_TRUE(executor_
                  .Spawn(MakeTask("ready",
                                  [](Context&) { return PollResult::kReady; }))
                  .has_value());
  executor_.SleepIfIdle();
  EXPECT_EQ(arch_mock::Get().halt_count, 1);
  EXPECT_TRUE(arch_mock::Get().interrupts_enabled);
}

TEST_F(ExecutorTest, InterruptDuringHaltWakesTask) {
  std::optional<Waker> waker;
  int polls = 0;
  ASSERT_TRUE(
      executor_.Spawn(MakeTask("parked", Parked(&waker, &polls))).has_value());
  executor_.RunReadyTasks();

  // hlt 期间到达的键盘中断唤醒任务
  arch_mock::Get().on_halt = [&waker]() { waker->Wake(); };
  executor_.SleepIfIdle();
  EXPECT_EQ(arch_mock::Get().halt_count, 1);
  EXPECT_EQ(executor_.ReadyCount(), 1);

  executor_.RunReadyTasks();
  EXPECT_EQ(polls, 2);
}

TEST_F(ExecutorTest, FinishedTasksLeaveNoStaleQueueEntries) {
  // 每个任务先唤醒自己再完成，完成时 ID 仍在就绪队列中
  for (size_t i = 0; i < kernel::config::kMaxTasks; i++) {
    ASSERT_TRUE(executor_
                    .Spawn(MakeTask("wake-then-finish",
                                    [](Context& cx) {
                                      cx.waker().Wake();
                                      return PollResult::kReady;
                                    }))
                    .has_value());
  }
  executor_.RunReadyTasks();
  EXPECT_EQ(executor_.TaskCount(), 0);
  EXPECT_EQ(executor_.ReadyCount(), 0);

  // 队列若残留旧 ID，下一批任务会因队列已满被拒绝或丢失唤醒
  std::vector<std::optional<Waker>> wakers(kernel::config::kMaxTasks);
  std::vector<int> polls(kernel::config::kMaxTasks, 0);
  for (size_t i = 0; i < kernel::config::kMaxTasks; i++) {
    ASSERT_TRUE(
        executor_.Spawn(MakeTask("parked", Parked(&wakers[i], &polls[i])))
            .has_value())
        << "spawn " << i;
  }
  executor_.RunReadyTasks();
  for (auto& waker : wakers) {
    ASSERT_TRUE(waker.has_value());
    waker->Wake();
  }
  EXPECT_EQ(executor_.ReadyCount(), kernel::config::kMaxTasks);
  EXPECT_EQ(executor_.stats().dropped_wakes, 0);

  executor_.RunReadyTasks();
  EXPECT_EQ(polls, std::vector<int>(kernel::config::kMaxTasks, 2));
}

TEST_F(ExecutorTest, RemovingTaskKeepsOrderOfOthers) {
  std::vector<std::string> order;
  std::optional<Waker> first_waker;
  std::optional<Waker> second_waker;
  auto parked = [&order](const char* name, std::optional<Waker>* slot) {
    return [&order, name, slot](Context& cx) {
      order.emplace_back(name);
      *slot = cx.waker();
      return PollResult::kPending;
    };
  };
  ASSERT_TRUE(
      executor_.Spawn(MakeTask("first", parked("first", &first_waker)))
          .has_value());
  ASSERT_TRUE(
      executor_.Spawn(MakeTask("second", parked("second", &second_waker)))
          .has_value());
  ASSERT_TRUE(executor_
                  .Spawn(MakeTask("finisher",
                                  [&](Context& cx) {
                                    order.emplace_back("finisher");
                                    // 队列变为 first, finisher, second
                                    first_waker->Wake();
                                    cx.waker().Wake();
                                    second_waker->Wake();
                                    return PollResult::kReady;
                                  }))
                  .has_value());

  executor_.RunReadyTasks();
  EXPECT_EQ(order,
            (std::vector<std::string>{"first", "second", "finisher"}));
  EXPECT_EQ(executor_.ReadyCount(), 2);

  order.clear();
  executor_.RunReadyTasks();
  EXPECT_EQ(order, (std::vector<std::string>{"first", "second"}));
}

TEST_F(ExecutorTest, WakeDuringPollIsNotLost) {
  std::optional<TaskStatusId> status_during_poll;
  int polls = 0;
  TaskId self = 0;
  auto id = executor_.Spawn(MakeTask("wake-in-poll", [&](Context& cx) {
    polls++;
    status_during_poll = executor_.GetTaskStatus(self);
    if (polls == 1) {
      // 返回 Pending 之前被唤醒，相当于事件源在轮询期间就绪
      cx.waker().Wake();
      return PollResult::kPending;
    }
    return PollResult::kReady;
  }));
  ASSERT_TRUE(id.has_value());
  self = *id;

  executor_.RunReadyTasks();
  EXPECT_EQ(polls, 1);
  EXPECT_EQ(status_during_poll, TaskStatusId::kRunning);
  EXPECT_EQ(executor_.GetTaskStatus(*id), TaskStatusId::kSuspended);
  EXPECT_EQ(executor_.ReadyCount(), 1);

  executor_.RunReadyTasks();
  EXPECT_EQ(polls, 2);
  EXPECT_EQ(status_during_poll, TaskStatusId::kRunning);
  EXPECT_EQ(executor_.TaskCount(), 0);
  // Poll 期间锁已释放，任务内调用执行器接口不会重入
  EXPECT_EQ(arch_mock::Get().console.find("recursive lock"), std::string::npos);
}
