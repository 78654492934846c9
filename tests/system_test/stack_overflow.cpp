/**
 * @copyright Copyright The HearthKernel Contributors
 * @brief 栈溢出必须以 double fault 报告，而不是三重错误重启
 */

#include <cstdint>

#include "arch.h"
#include "boot_info.hpp"
#include "kernel.h"
#include "panic_observer.hpp"
#include "system_test.h"

namespace {

class ExpectDoubleFault : public IPanicObserver {
 public:
  void notification(PanicEvent event) override {
    if (event.kind == FaultKind::kDoubleFault) {
      sk_printf("[ok]\n");
      ExitQemu(QemuExitCode::kSuccess);
    } else {
      sk_printf("[failed]\nexpected double fault, got %s\n",
                GetFaultKindName(event.kind));
      ExitQemu(QemuExitCode::kFailed);
    }
  }
};

ExpectDoubleFault expect_double_fault;

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Winfinite-recursion"
[[gnu::noinline]] auto Overflow(uint64_t depth) -> uint64_t {
  volatile uint64_t frame[16];
  frame[0] = depth;
  return Overflow(depth + 1) + frame[0];
}
#pragma GCC diagnostic pop

[[noreturn]] void StackOverflowMain(void* /*arg*/) {
  InterruptInit();
  PanicNotifierSingleton::instance().add_observer(expect_double_fault);

  sk_printf("stack_overflow::stack_overflow...\t");
  auto result = Overflow(0);

  sk_printf("[failed]\nexecution continued after stack overflow (%lu)\n",
            result);
  ExitQemu(QemuExitCode::kFailed);
  HaltLoop();
}

}  // namespace

void _start(const BootInfo* boot_info) {
  BootForTest(boot_info, StackOverflowMain);
}
