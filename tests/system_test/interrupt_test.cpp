/**
 * @copyright Copyright The HearthKernel Contributors
 */

#include <cstdint>

#include "arch.h"
#include "interrupt.h"
#include "system_test.h"

auto breakpoint_test() -> bool {
  constexpr uint8_t kBreakpoint = 3;
  auto& interrupt = InterruptSingleton::Instance();
  auto before = interrupt.fired_count(kBreakpoint);

  // 断点处理后从下一条指令继续执行
  __asm__ volatile("int3");

  EXPECT_EQ(interrupt.fired_count(kBreakpoint), before + 1,
            "breakpoint not dispatched");
  return true;
}

auto timer_test() -> bool {
  constexpr int kMaxHalts = 100;
  auto start = GetTimerTicks();
  for (int i = 0; i < kMaxHalts && GetTimerTicks() == start; i++) {
    EnableInterruptAndHalt();
  }
  EXPECT_TRUE(GetTimerTicks() > start, "timer never fired");
  EXPECT_TRUE(GetInterruptStatus(), "interrupts left disabled");
  return true;
}
