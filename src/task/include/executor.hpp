/**
 * @copyright Copyright The HearthKernel Contributors
 * @brief 协作式任务执行器
 */

#ifndef HEARTHKERNEL_SRC_TASK_INCLUDE_EXECUTOR_HPP_
#define HEARTHKERNEL_SRC_TASK_INCLUDE_EXECUTOR_HPP_

#include <etl/memory.h>
#include <etl/queue.h>
#include <etl/unordered_map.h>
#include <etl/unordered_set.h>

#include <cstddef>
#include <optional>

#include "expected.hpp"
#include "kernel_config.hpp"
#include "once.hpp"
#include "spinlock.hpp"
#include "task.hpp"
#include "waker.hpp"

/**
 * @brief 单线程协作式执行器
 * @details 就绪队列按 FIFO 轮询任务。Wake 可以在中断上下文中调用，
 * 任务表、就绪队列、已入队集合与任务状态机由同一把关中断自旋锁保护。
 * 只有调用 Task::Poll 期间不持锁。
 * 就绪队列中每个存活任务最多出现一次，完成的任务在移除时一并移出队列
 */
class Executor : public IWakeTarget {
 public:
  /// 执行器统计信息
  struct Stats {
    /// 总轮询次数
    size_t polls{0};
    /// 完成的任务数
    size_t completions{0};
    /// 已在就绪队列中的任务再次被唤醒
    size_t redundant_wakes{0};
    /// 唤醒已完成或不存在的任务
    size_t stale_wakes{0};
    /// 就绪队列已满而丢弃的唤醒
    size_t dropped_wakes{0};
  };

  /// @name 构造/析构函数
  /// @{
  Executor() = default;
  Executor(const Executor&) = delete;
  Executor(Executor&&) = delete;
  auto operator=(const Executor&) -> Executor& = delete;
  auto operator=(Executor&&) -> Executor& = delete;
  ~Executor() override = default;
  /// @}

  /**
   * @brief 添加任务，任务以 Ready 状态进入就绪队列
   * @param task 任务，所有权转移给执行器
   * @return Expected<TaskId> 任务表已满返回 kTaskTableFull，
   * 空指针返回 kTaskInvalid
   */
  [[nodiscard]] auto Spawn(etl::unique_ptr<Task> task) -> Expected<TaskId>;

  /**
   * @brief 轮询本轮开始时已就绪的任务，每个最多一次
   * @note 轮询过程中被唤醒的任务留到下一轮
   */
  void RunReadyTasks();

  /**
   * @brief 没有就绪任务时休眠到下一次中断
   * @note 检查就绪队列与 sti; hlt 之间中断保持关闭，
   * 不会错过在检查之后到达的唤醒
   */
  void SleepIfIdle();

  /**
   * @brief 执行器主循环
   */
  [[noreturn]] void Run();

  /**
   * @brief 唤醒任务
   * @param id 任务 ID
   * @note 已在就绪队列中、已完成或不存在的任务忽略并计数，
   * 就绪队列已满时丢弃唤醒并记录警告
   */
  void Wake(TaskId id) override;

  /// 任务表中的任务数
  [[nodiscard]] auto TaskCount() -> size_t;
  /// 就绪队列长度
  [[nodiscard]] auto ReadyCount() -> size_t;
  /// 任务状态，不存在时为空
  [[nodiscard]] auto GetTaskStatus(TaskId id) -> std::optional<TaskStatusId>;

  [[nodiscard]] auto stats() const -> const Stats& { return stats_; }

 private:
  SpinLock lock_{"executor"};

  etl::unordered_map<TaskId, etl::unique_ptr<Task>, kernel::config::kMaxTasks,
                     kernel::config::kMaxTasksBuckets>
      tasks_;
  etl::queue<TaskId, kernel::config::kMaxReadyTasks> ready_queue_;
  /// 已在 ready_queue_ 中的任务，避免重复入队
  etl::unordered_set<TaskId, kernel::config::kMaxTasks,
                     kernel::config::kMaxTasksBuckets>
      queued_;

  Stats stats_;

  /**
   * @brief 将出队的任务转换为 Running
   * @pre 持有 lock_
   */
  void BeginPoll(Task& task);

  /**
   * @brief 轮询单个任务，Poll 返回后在锁内转换状态
   * @param task 任务，调用期间保持在任务表中
   * @return true 任务已完成
   * @pre 任务已由 BeginPoll 转换为 Running，且未持有 lock_
   */
  auto PollTask(Task& task) -> bool;

  /**
   * @brief 从任务表中移除已完成的任务
   * @return etl::unique_ptr<Task> 在锁外析构
   */
  auto Remove(TaskId id) -> etl::unique_ptr<Task>;

  /**
   * @brief 从就绪队列中移出 id，保持其余任务的顺序
   * @pre 持有 lock_
   */
  void DropFromReadyQueue(TaskId id);
};

using ExecutorSingleton = OnceSingleton<Executor>;

#endif  // HEARTHKERNEL_SRC_TASK_INCLUDE_EXECUTOR_HPP_
