/**
 * @copyright Copyright The HearthKernel Contributors
 * @brief 致命错误报告
 */

#include <atomic>

#include "arch.h"
#include "kernel.h"
#include "kernel_log.hpp"

namespace {
/// 报告过程中再次出错时直接停机，避免递归
std::atomic<bool> panicking{false};
}  // namespace

void Panic(const PanicEvent& event) {
  DisableInterrupt();

  if (panicking.exchange(true, std::memory_order_acq_rel)) {
    HaltLoop();
  }

  klog::Err("KERNEL PANIC: %s\n", GetFaultKindName(event.kind));
  if (event.reason != nullptr) {
    klog::Err("  reason: %s\n", event.reason);
  }
  klog::Err("  address: 0x%lX, error code: 0x%lX\n", event.address,
            event.error_code);
  klog::Err("  pc: 0x%lX, sp: 0x%lX\n", event.pc, event.sp);

  DumpStack();

  if (PanicNotifierSingleton::is_valid()) {
    PanicNotifierSingleton::instance().notify_observers(event);
  }

  HaltLoop();
}

void Panic(const char* reason) {
  Panic(PanicEvent{
      .kind = FaultKind::kExplicit,
      .reason = reason,
      .address = 0,
      .error_code = 0,
      .pc = reinterpret_cast<uint64_t>(__builtin_return_address(0)),
      .sp = reinterpret_cast<uint64_t>(__builtin_frame_address(0)),
  });
}
