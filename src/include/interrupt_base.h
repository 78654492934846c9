/**
 * @copyright Copyright The HearthKernel Contributors
 */

#ifndef HEARTHKERNEL_SRC_INCLUDE_INTERRUPT_BASE_H_
#define HEARTHKERNEL_SRC_INCLUDE_INTERRUPT_BASE_H_

#include <cstdint>

#include "expected.hpp"

/// CPU 在中断时压入的栈帧，布局与硬件一致
struct InterruptFrame {
  uint64_t rip;
  uint64_t cs;
  uint64_t rflags;
  uint64_t rsp;
  uint64_t ss;
};

/// 交给处理函数的中断上下文
struct InterruptContext {
  InterruptFrame* frame;
  /// 仅在 has_error_code 为 true 时有效
  uint64_t error_code;
  bool has_error_code;
};

class InterruptBase {
 public:
  /**
   * @brief 中断/异常处理函数指针
   * @param  cause 中断或异常号
   * @param  context 中断上下文
   * @return uint64_t 返回值，0 成功
   */
  typedef uint64_t (*InterruptFunc)(uint64_t cause, InterruptContext* context);

  /// @name 构造/析构函数
  /// @{
  InterruptBase() = default;
  InterruptBase(const InterruptBase&) = delete;
  InterruptBase(InterruptBase&&) = delete;
  auto operator=(const InterruptBase&) -> InterruptBase& = delete;
  auto operator=(InterruptBase&&) -> InterruptBase& = delete;
  virtual ~InterruptBase() = default;
  /// @}

  /**
   * @brief 执行中断处理
   * @param cause 中断号
   * @param context 中断上下文
   */
  virtual void Do(uint64_t cause, InterruptContext* context) = 0;

  /**
   * @brief 注册中断处理函数
   * @param cause 中断号
   * @param func 处理函数
   * @return Expected<void> 中断表加载后返回 kIdtLocked
   */
  virtual auto RegisterInterruptFunc(uint64_t cause, InterruptFunc func)
      -> Expected<void> = 0;
};

#endif /* HEARTHKERNEL_SRC_INCLUDE_INTERRUPT_BASE_H_ */
