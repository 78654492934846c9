/**
 * @copyright Copyright The HearthKernel Contributors
 * @brief 中断处理
 */

#ifndef HEARTHKERNEL_SRC_ARCH_X86_64_INCLUDE_INTERRUPT_H_
#define HEARTHKERNEL_SRC_ARCH_X86_64_INCLUDE_INTERRUPT_H_

#include <cpu_io.h>

#include <array>
#include <cstddef>
#include <cstdint>

#include "expected.hpp"
#include "interrupt_base.h"
#include "once.hpp"

class Interrupt final : public InterruptBase {
 public:
  /// 向量数
  static constexpr size_t kVectorCount =
      cpu_io::detail::register_info::IdtrInfo::kInterruptMaxCount;

  /// @name 异常向量
  /// @{
  static constexpr uint8_t kDivideError = 0;
  static constexpr uint8_t kBreakpoint = 3;
  static constexpr uint8_t kDoubleFault = 8;
  static constexpr uint8_t kGeneralProtection = 13;
  static constexpr uint8_t kPageFault = 14;
  /// @}

  /// 16 字节门描述符，由 cpu_io 编码
  using IdtGate = cpu_io::detail::register_info::IdtrInfo::Idt;
  static_assert(sizeof(IdtGate) == 16);

  /// 入口地址表，由入口桩生成
  using EntryTable = std::array<uint64_t, kVectorCount>;

  Interrupt();

  /// @name 构造/析构函数
  /// @{
  Interrupt(const Interrupt&) = delete;
  Interrupt(Interrupt&&) = delete;
  auto operator=(const Interrupt&) -> Interrupt& = delete;
  auto operator=(Interrupt&&) -> Interrupt& = delete;
  ~Interrupt() override = default;
  /// @}

  /**
   * @brief 执行中断处理
   * @param cause 向量
   * @param context 中断上下文
   * @note 属于 8259A 的向量在处理前后由控制器跟踪 EOI
   */
  void Do(uint64_t cause, InterruptContext* context) override;

  auto RegisterInterruptFunc(uint64_t cause, InterruptFunc func)
      -> Expected<void> override;

  /**
   * @brief 指定向量使用的 IST 栈
   * @param vector 向量
   * @param ist_index TSS 中的 IST 下标 (0-6)
   * @return Expected<void> 已加载返回 kIdtLocked，下标越界返回
   * kIdtInvalidStackIndex
   */
  auto SetStackIndex(uint8_t vector, uint8_t ist_index) -> Expected<void>;

  /**
   * @brief 填写全部门描述符并加载 IDT
   * @param entries 各向量的入口地址
   * @param code_selector 代码段选择子
   * @return Expected<void> 重复加载返回 kIdtLocked，双重错误未指定 IST 返回
   * kIdtMissingStack
   * @post 之后的注册均返回 kIdtLocked
   */
  auto Load(const EntryTable& entries, uint16_t code_selector)
      -> Expected<void>;

  [[nodiscard]] auto gate(uint8_t vector) const -> const IdtGate& {
    return idts_[vector];
  }
  [[nodiscard]] auto locked() const -> bool { return locked_; }

  /// 向量门描述符中的 IST 字段，0 表示不切换栈
  [[nodiscard]] auto stack_index(uint8_t vector) const -> uint8_t {
    return stack_indexes_[vector];
  }

  /// 向量被处理的次数
  [[nodiscard]] auto fired_count(uint8_t vector) const -> uint64_t {
    return fired_counts_[vector];
  }

  /// 向量名
  static auto GetVectorName(uint64_t cause) -> const char*;

 private:
  /// 中断处理函数数组
  std::array<InterruptFunc, kVectorCount> interrupt_handlers_;

  alignas(16) std::array<IdtGate, kVectorCount> idts_{};

  /// 各向量的 IST 字段，加载时写入门描述符
  std::array<uint8_t, kVectorCount> stack_indexes_{};

  std::array<uint64_t, kVectorCount> fired_counts_{};

  bool locked_{false};
};

using InterruptSingleton = OnceSingleton<Interrupt>;

/**
 * @brief 入口桩地址表
 * @note 仅内核镜像提供
 */
auto GetInterruptEntryTable() -> const Interrupt::EntryTable&;

/// @name 中断处理函数
/// @{
auto DivideErrorHandler(uint64_t cause, InterruptContext* context) -> uint64_t;
auto BreakpointHandler(uint64_t cause, InterruptContext* context) -> uint64_t;
auto DoubleFaultHandler(uint64_t cause, InterruptContext* context) -> uint64_t;
auto GeneralProtectionHandler(uint64_t cause, InterruptContext* context)
    -> uint64_t;
auto PageFaultHandler(uint64_t cause, InterruptContext* context) -> uint64_t;
auto TimerHandler(uint64_t cause, InterruptContext* context) -> uint64_t;
auto KeyboardHandler(uint64_t cause, InterruptContext* context) -> uint64_t;
/// @}

/// 时钟中断计数
[[nodiscard]] auto GetTimerTicks() -> uint64_t;

/**
 * @brief 注册所有异常与硬件中断处理函数，并为双重错误指定 IST
 * @param interrupt 尚未加载的中断表
 */
auto RegisterHandlers(Interrupt& interrupt) -> Expected<void>;

#endif  // HEARTHKERNEL_SRC_ARCH_X86_64_INCLUDE_INTERRUPT_H_
