/**
 * @copyright Copyright The HearthKernel Contributors
 * @brief 异常与硬件中断处理函数
 */

#include <atomic>

#include "arch.h"
#include "event_queue.hpp"
#include "interrupt.h"
#include "io.hpp"
#include "kernel.h"
#include "kernel_config.hpp"
#include "kernel_log.hpp"
#include "pic8259a.h"

namespace {

/// 8042 键盘控制器数据端口
constexpr uint16_t kKeyboardDataPort = 0x60;

/// @name 8259A 中断线
/// @{
constexpr uint8_t kTimerIrq = 0;
constexpr uint8_t kKeyboardIrq = 1;
/// @}

std::atomic<uint64_t> timer_ticks{0};

auto MakeEvent(FaultKind kind, const char* reason, uint64_t address,
               const InterruptContext* context) -> PanicEvent {
  const auto* frame = context != nullptr ? context->frame : nullptr;
  return PanicEvent{
      .kind = kind,
      .reason = reason,
      .address = address,
      .error_code = (context != nullptr && context->has_error_code)
                        ? context->error_code
                        : 0,
      .pc = frame != nullptr ? frame->rip : 0,
      .sp = frame != nullptr ? frame->rsp : 0,
  };
}

void SendEndOfInterrupt(uint64_t cause) {
  if (PicSingleton::IsReady()) {
    PicSingleton::Instance().NotifyEndOfInterrupt(static_cast<uint8_t>(cause));
  }
}

}  // namespace

auto DivideErrorHandler(uint64_t cause, InterruptContext* context)
    -> uint64_t {
  Panic(MakeEvent(FaultKind::kDivideError, Interrupt::GetVectorName(cause),
                  cause, context));
}

auto BreakpointHandler(uint64_t cause, InterruptContext* context) -> uint64_t {
  const auto* frame = context != nullptr ? context->frame : nullptr;
  if (frame != nullptr) {
    klog::Info(
        "EXCEPTION: BREAKPOINT\n"
        "  rip 0x%lX cs 0x%lX rflags 0x%lX rsp 0x%lX ss 0x%lX\n",
        frame->rip, frame->cs, frame->rflags, frame->rsp, frame->ss);
  } else {
    klog::Info("EXCEPTION: BREAKPOINT (vector %lu)\n", cause);
  }
  return 0;
}

auto DoubleFaultHandler(uint64_t /*cause*/, InterruptContext* context)
    -> uint64_t {
  // 栈溢出时 rsp 位于保护页附近，以它作为出错地址
  const auto* frame = context != nullptr ? context->frame : nullptr;
  Panic(MakeEvent(FaultKind::kDoubleFault, "double fault",
                  frame != nullptr ? frame->rsp : 0, context));
}

auto GeneralProtectionHandler(uint64_t cause, InterruptContext* context)
    -> uint64_t {
  Panic(MakeEvent(FaultKind::kGeneralProtection,
                  Interrupt::GetVectorName(cause), 0, context));
}

auto PageFaultHandler(uint64_t /*cause*/, InterruptContext* context)
    -> uint64_t {
  auto fault_address = ReadFaultAddress();
  Panic(MakeEvent(FaultKind::kPageFault, "page fault", fault_address, context));
}

auto TimerHandler(uint64_t cause, InterruptContext* /*context*/) -> uint64_t {
  timer_ticks.fetch_add(1, std::memory_order_relaxed);
  SendEndOfInterrupt(cause);
  return 0;
}

auto KeyboardHandler(uint64_t cause, InterruptContext* /*context*/)
    -> uint64_t {
  // 无论队列是否可用都必须读走数据，否则控制器不会再产生中断
  auto scancode = io::In8(kKeyboardDataPort);
  if (!ScancodeQueueSingleton::IsReady()) {
    klog::Warn("KeyboardHandler: scancode queue uninitialized, drop 0x%X\n",
               scancode);
  } else if (!ScancodeQueueSingleton::Instance().Push(scancode)) {
    klog::Warn("KeyboardHandler: scancode queue full, drop 0x%X\n", scancode);
  }
  SendEndOfInterrupt(cause);
  return 0;
}

auto GetTimerTicks() -> uint64_t {
  return timer_ticks.load(std::memory_order_relaxed);
}

auto RegisterHandlers(Interrupt& interrupt) -> Expected<void> {
  using kernel::config::kPicMasterOffset;
  return interrupt
      .RegisterInterruptFunc(Interrupt::kDivideError, DivideErrorHandler)
      .and_then([&interrupt]() {
        return interrupt.RegisterInterruptFunc(Interrupt::kBreakpoint,
                                               BreakpointHandler);
      })
      .and_then([&interrupt]() {
        return interrupt.RegisterInterruptFunc(Interrupt::kDoubleFault,
                                               DoubleFaultHandler);
      })
      .and_then([&interrupt]() {
        return interrupt.SetStackIndex(Interrupt::kDoubleFault,
                                       kernel::config::kDoubleFaultIstIndex);
      })
      .and_then([&interrupt]() {
        return interrupt.RegisterInterruptFunc(Interrupt::kGeneralProtection,
                                               GeneralProtectionHandler);
      })
      .and_then([&interrupt]() {
        return interrupt.RegisterInterruptFunc(Interrupt::kPageFault,
                                               PageFaultHandler);
      })
      .and_then([&interrupt]() {
        return interrupt.RegisterInterruptFunc(kPicMasterOffset + kTimerIrq,
                                               TimerHandler);
      })
      .and_then([&interrupt]() {
        return interrupt.RegisterInterruptFunc(kPicMasterOffset + kKeyboardIrq,
                                               KeyboardHandler);
      });
}
