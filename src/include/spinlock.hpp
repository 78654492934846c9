/**
 * @copyright Copyright The HearthKernel Contributors
 * @brief 关中断自旋锁
 */

#ifndef HEARTHKERNEL_SRC_INCLUDE_SPINLOCK_HPP_
#define HEARTHKERNEL_SRC_INCLUDE_SPINLOCK_HPP_

#include <atomic>
#include <cstddef>

#include "arch.h"
#include "cpu_state.hpp"
#include "sk_stdio.h"

/**
 * @brief 自旋锁
 * @note 持锁期间中断保持关闭。单核上中断处理程序无法打断持锁者，
 * 因此任务上下文与中断上下文可以共享同一把锁
 */
class SpinLock {
 public:
  /**
   * @brief 构造函数
   * @param  _name            锁名
   */
  explicit SpinLock(const char *_name) : name_(_name) {}

  /// @name 构造/析构函数
  /// @{
  SpinLock() = default;
  SpinLock(const SpinLock &) = delete;
  SpinLock(SpinLock &&) = delete;
  auto operator=(const SpinLock &) -> SpinLock & = delete;
  auto operator=(SpinLock &&) -> SpinLock & = delete;
  virtual ~SpinLock() = default;
  /// @}

  /**
   * @brief 获得锁
   * @return false 重入
   */
  __always_inline auto lock() -> bool {
    DisableInterruptsNested();
    if (IsLocked()) {
      sk_printf("spinlock %s recursive lock.\n", name_);
      RestoreInterruptsNested();
      return false;
    }
    while (locked_.test_and_set(std::memory_order_acquire)) {
      ;
    }
    return true;
  }

  /**
   * @brief 释放锁
   * @return false 未持有
   */
  __always_inline auto unlock() -> bool {
    if (!IsLocked()) {
      sk_printf("spinlock %s not locked.\n", name_);
      return false;
    }
    locked_.clear(std::memory_order_release);
    return RestoreInterruptsNested();
  }

  /**
   * @brief 检查锁是否被持有
   */
  [[nodiscard]] __always_inline auto IsLocked() const -> bool {
    return locked_.test(std::memory_order_relaxed);
  }

 protected:
  /// 自旋锁名称
  const char *name_{"unnamed"};
  /// 是否 lock
  std::atomic_flag locked_{};

  virtual void EnableInterrupt() const { ::EnableInterrupt(); }
  virtual void DisableInterrupt() const { ::DisableInterrupt(); }
  [[nodiscard]] virtual auto GetInterruptStatus() const -> bool {
    return ::GetInterruptStatus();
  }
  [[nodiscard]] virtual auto GetCurrentCore() const -> cpu_state::CpuState & {
    return cpu_state::GetCurrentCore();
  }

  /**
   * @brief 中断嵌套+1
   */
  __always_inline void DisableInterruptsNested() {
    bool old = GetInterruptStatus();

    DisableInterrupt();

    if (GetCurrentCore().noff_ == 0) {
      GetCurrentCore().intr_enable_ = old;
    }
    GetCurrentCore().noff_ += 1;
  }

  /**
   * @brief 中断嵌套-1
   */
  __always_inline auto RestoreInterruptsNested() -> bool {
    if (GetInterruptStatus()) {
      sk_printf("RestoreInterruptsNested - interruptible\n");
      return false;
    }

    if (GetCurrentCore().noff_ < 1) {
      sk_printf("RestoreInterruptsNested\n");
      return false;
    }
    GetCurrentCore().noff_ -= 1;

    if ((GetCurrentCore().noff_ == 0) && (GetCurrentCore().intr_enable_)) {
      EnableInterrupt();
    }
    return true;
  }
};

/**
 * @brief RAII 锁守卫
 * @tparam Lock 需要提供 lock() 与 unlock()
 */
template <typename Lock>
class LockGuard {
 public:
  explicit LockGuard(Lock &lock) : lock_(lock) { locked_ = lock_.lock(); }

  /// @name 构造/析构函数
  /// @{
  LockGuard() = delete;
  LockGuard(const LockGuard &) = delete;
  LockGuard(LockGuard &&) = delete;
  auto operator=(const LockGuard &) -> LockGuard & = delete;
  auto operator=(LockGuard &&) -> LockGuard & = delete;
  ~LockGuard() {
    if (locked_) {
      lock_.unlock();
    }
  }
  /// @}

 private:
  Lock &lock_;
  bool locked_{false};
};

#endif /* HEARTHKERNEL_SRC_INCLUDE_SPINLOCK_HPP_ */
