/**
 * @copyright Copyright The HearthKernel Contributors
 * @brief 协作式任务执行器
 */

#include "executor.hpp"

#include "arch.h"
#include "kernel_log.hpp"

auto Executor::Spawn(etl::unique_ptr<Task> task) -> Expected<TaskId> {
  if (!task) {
    return std::unexpected(Error(ErrorCode::kTaskInvalid));
  }

  auto id = task->id();
  auto* name = task->name();
  {
    LockGuard<SpinLock> guard(lock_);
    if (tasks_.full() || ready_queue_.full()) {
      klog::Warn("Executor::Spawn: task table full, rejecting '%s'\n", name);
      return std::unexpected(Error(ErrorCode::kTaskTableFull));
    }
    tasks_.insert(etl::make_pair(id, etl::move(task)));
    ready_queue_.push(id);
    queued_.insert(id);
  }

  klog::Debug("Executor::Spawn: task %lu '%s'\n", id, name);
  return id;
}

void Executor::Wake(TaskId id) {
  LockGuard<SpinLock> guard(lock_);
  auto it = tasks_.find(id);
  if (it == tasks_.end()) {
    stats_.stale_wakes++;
    return;
  }
  if (queued_.find(id) != queued_.end()) {
    stats_.redundant_wakes++;
    return;
  }

  if (ready_queue_.full()) {
    stats_.dropped_wakes++;
    klog::Warn("Executor::Wake: ready queue full, dropping wake of task %lu\n",
               id);
    return;
  }

  // 运行中的任务保持 Running，出队时再转换
  auto& task = *it->second;
  if (task.GetStatus() == TaskStatusId::kSuspended) {
    task.Receive(MsgWake());
  }
  ready_queue_.push(id);
  queued_.insert(id);
}

void Executor::BeginPoll(Task& task) {
  if (task.GetStatus() == TaskStatusId::kSuspended) {
    task.Receive(MsgWake());
  }
  task.Receive(MsgPoll());
  stats_.polls++;
}

auto Executor::PollTask(Task& task) -> bool {
  Waker waker(task.id(), this);
  Context cx(waker);
  auto result = task.Poll(cx);

  LockGuard<SpinLock> guard(lock_);
  if (result == PollResult::kReady) {
    task.Receive(MsgComplete());
    return true;
  }
  task.Receive(MsgPending());
  return false;
}

auto Executor::Remove(TaskId id) -> etl::unique_ptr<Task> {
  LockGuard<SpinLock> guard(lock_);
  etl::unique_ptr<Task> task;
  auto it = tasks_.find(id);
  if (it != tasks_.end()) {
    task = etl::move(it->second);
    tasks_.erase(it);
  }
  // 轮询期间的自我唤醒可能已让 ID 重新入队，在此一并移出
  if (queued_.erase(id) != 0) {
    DropFromReadyQueue(id);
  }
  stats_.completions++;
  return task;
}

void Executor::DropFromReadyQueue(TaskId id) {
  for (auto count = ready_queue_.size(); count > 0; count--) {
    auto queued = ready_queue_.front();
    ready_queue_.pop();
    if (queued != id) {
      ready_queue_.push(queued);
    }
  }
}

void Executor::RunReadyTasks() {
  size_t pending = 0;
  {
    LockGuard<SpinLock> guard(lock_);
    pending = ready_queue_.size();
  }

  while (pending-- > 0) {
    Task* task = nullptr;
    {
      LockGuard<SpinLock> guard(lock_);
      if (ready_queue_.empty()) {
        break;
      }
      auto id = ready_queue_.front();
      ready_queue_.pop();
      queued_.erase(id);
      auto it = tasks_.find(id);
      if (it == tasks_.end()) {
        continue;
      }
      task = it->second.get();
      // 出队与转换为 Running 在同一临界区内
      BeginPoll(*task);
    }

    if (PollTask(*task)) {
      auto id = task->id();
      klog::Debug("Executor: task %lu '%s' completed\n", id, task->name());
      // 析构在锁外进行
      auto finished = Remove(id);
    }
  }
}

void Executor::SleepIfIdle() {
  DisableInterrupt();
  bool idle = false;
  {
    LockGuard<SpinLock> guard(lock_);
    idle = ready_queue_.empty();
  }
  if (idle) {
    EnableInterruptAndHalt();
  } else {
    EnableInterrupt();
  }
}

void Executor::Run() {
  klog::Info("Executor: running %zu tasks\n", TaskCount());
  while (true) {
    RunReadyTasks();
    SleepIfIdle();
  }
}

auto Executor::TaskCount() -> size_t {
  LockGuard<SpinLock> guard(lock_);
  return tasks_.size();
}

auto Executor::ReadyCount() -> size_t {
  LockGuard<SpinLock> guard(lock_);
  return ready_queue_.size();
}

auto Executor::GetTaskStatus(TaskId id) -> std::optional<TaskStatusId> {
  LockGuard<SpinLock> guard(lock_);
  auto it = tasks_.find(id);
  if (it == tasks_.end()) {
    return std::nullopt;
  }
  return it->second->GetStatus();
}
