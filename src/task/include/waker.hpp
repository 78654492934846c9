/**
 * @copyright Copyright The HearthKernel Contributors
 * @brief 任务唤醒句柄
 */

#ifndef HEARTHKERNEL_SRC_TASK_INCLUDE_WAKER_HPP_
#define HEARTHKERNEL_SRC_TASK_INCLUDE_WAKER_HPP_

#include <cstdint>
#include <optional>

#include "spinlock.hpp"

/// 任务 ID，在任务生命周期内唯一
using TaskId = uint64_t;

/**
 * @brief 唤醒目标接口
 * @note 由执行器实现，可在中断上下文中调用
 */
class IWakeTarget {
 public:
  virtual ~IWakeTarget() = default;
  virtual void Wake(TaskId id) = 0;
};

/**
 * @brief 唤醒指定任务的句柄
 * @details 值语义，可以复制保存到任意等待点
 */
class Waker {
 public:
  Waker(TaskId id, IWakeTarget* target) : id_(id), target_(target) {}

  /// @name 构造/析构函数
  /// @{
  Waker() = delete;
  Waker(const Waker&) = default;
  Waker(Waker&&) = default;
  auto operator=(const Waker&) -> Waker& = default;
  auto operator=(Waker&&) -> Waker& = default;
  ~Waker() = default;
  /// @}

  /// 将任务放回就绪队列
  void Wake() const {
    if (target_ != nullptr) {
      target_->Wake(id_);
    }
  }

  [[nodiscard]] auto id() const -> TaskId { return id_; }

  [[nodiscard]] auto WillWakeSame(const Waker& other) const -> bool {
    return id_ == other.id_ && target_ == other.target_;
  }

 private:
  TaskId id_;
  IWakeTarget* target_;
};

/**
 * @brief 中断上下文与任务上下文共享的单个 Waker 槽
 * @note 槽由关中断自旋锁保护，Wake 时先取出再调用，锁内不执行唤醒
 */
class AtomicWaker {
 public:
  /// @name 构造/析构函数
  /// @{
  AtomicWaker() = default;
  AtomicWaker(const AtomicWaker&) = delete;
  AtomicWaker(AtomicWaker&&) = delete;
  auto operator=(const AtomicWaker&) -> AtomicWaker& = delete;
  auto operator=(AtomicWaker&&) -> AtomicWaker& = delete;
  ~AtomicWaker() = default;
  /// @}

  /**
   * @brief 登记 Waker，覆盖之前登记的
   */
  void Register(const Waker& waker) {
    LockGuard<SpinLock> guard(lock_);
    waker_ = waker;
  }

  /**
   * @brief 取出已登记的 Waker
   */
  auto Take() -> std::optional<Waker> {
    LockGuard<SpinLock> guard(lock_);
    auto waker = waker_;
    waker_.reset();
    return waker;
  }

  /// 取出并唤醒
  void Wake() {
    if (auto waker = Take()) {
      waker->Wake();
    }
  }

 private:
  SpinLock lock_{"atomic_waker"};
  std::optional<Waker> waker_;
};

#endif  // HEARTHKERNEL_SRC_TASK_INCLUDE_WAKER_HPP_
