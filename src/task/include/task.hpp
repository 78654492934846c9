/**
 * @copyright Copyright The HearthKernel Contributors
 * @brief 协作式任务
 */

#ifndef HEARTHKERNEL_SRC_TASK_INCLUDE_TASK_HPP_
#define HEARTHKERNEL_SRC_TASK_INCLUDE_TASK_HPP_

#include <etl/memory.h>

#include <atomic>
#include <utility>

#include "task_fsm.hpp"
#include "waker.hpp"

/// 轮询结果
enum class PollResult : uint8_t {
  /// 任务已完成
  kReady,
  /// 暂时无法推进，等待 Waker
  kPending,
};

/**
 * @brief 单次轮询的上下文
 */
class Context {
 public:
  explicit Context(const Waker& waker) : waker_(waker) {}

  /// @name 构造/析构函数
  /// @{
  Context() = delete;
  Context(const Context&) = delete;
  Context(Context&&) = delete;
  auto operator=(const Context&) -> Context& = delete;
  auto operator=(Context&&) -> Context& = delete;
  ~Context() = default;
  /// @}

  /// 当前任务的 Waker
  [[nodiscard]] auto waker() const -> const Waker& { return waker_; }

 private:
  const Waker& waker_;
};

/**
 * @brief 任务基类
 * @details 执行器反复调用 Poll 直到返回 kReady。返回 kPending 前，
 * 任务必须已把 Context 中的 Waker 登记到它等待的事件源上
 */
class Task {
 public:
  /**
   * @brief 构造函数
   * @param name 任务名，只保存指针
   */
  explicit Task(const char* name)
      : id_(next_id_.fetch_add(1, std::memory_order_relaxed)), name_(name) {
    fsm_.Start();
  }

  /// @name 构造/析构函数
  /// @{
  Task() = delete;
  Task(const Task&) = delete;
  Task(Task&&) = delete;
  auto operator=(const Task&) -> Task& = delete;
  auto operator=(Task&&) -> Task& = delete;
  virtual ~Task() = default;
  /// @}

  /**
   * @brief 推进任务
   * @param cx 轮询上下文
   * @return PollResult 完成返回 kReady
   */
  virtual auto Poll(Context& cx) -> PollResult = 0;

  [[nodiscard]] auto id() const -> TaskId { return id_; }
  [[nodiscard]] auto name() const -> const char* { return name_; }

  /// 当前状态
  [[nodiscard]] auto GetStatus() const -> TaskStatusId {
    return static_cast<TaskStatusId>(fsm_.GetStateId());
  }

  /// 驱动状态机，仅供执行器使用
  void Receive(const etl::imessage& msg) { fsm_.Receive(msg); }

 private:
  static inline std::atomic<TaskId> next_id_{1};

  TaskId id_;
  const char* name_;
  TaskFsm fsm_;
};

/**
 * @brief 以函数对象实现 Poll 的任务
 * @tparam Func 签名为 PollResult(Context&)
 */
template <typename Func>
class FunctionTask : public Task {
 public:
  FunctionTask(const char* name, Func func)
      : Task(name), func_(std::move(func)) {}

  auto Poll(Context& cx) -> PollResult override { return func_(cx); }

 private:
  Func func_;
};

/**
 * @brief 在堆上创建 FunctionTask
 */
template <typename Func>
auto MakeTask(const char* name, Func func) -> etl::unique_ptr<Task> {
  return etl::unique_ptr<Task>(new FunctionTask<Func>(name, std::move(func)));
}

#endif  // HEARTHKERNEL_SRC_TASK_INCLUDE_TASK_HPP_
