/**
 * @copyright Copyright The HearthKernel Contributors
 * @brief 中断初始化
 */

#include "arch.h"
#include "gdt.h"
#include "interrupt.h"
#include "kernel_config.hpp"
#include "kernel_log.hpp"
#include "pic8259a.h"
#include "sk_assert.h"

void InterruptInit() {
  auto result =
      InterruptSingleton::Create()
          .and_then([]() {
            return RegisterHandlers(InterruptSingleton::Instance());
          })
          .and_then([]() { return PicSingleton::Create(); })
          .and_then([]() {
            return PicSingleton::Instance().Initialize(
                kernel::config::kPicMasterOffset,
                kernel::config::kPicSlaveOffset);
          })
          .and_then([]() {
            return InterruptSingleton::Instance().Load(
                GetInterruptEntryTable(), gdt::GetCodeSelector());
          });
  sk_assert_msg(result.has_value(), "InterruptInit failed: %s",
                result.error().message());

  // 开启中断
  EnableInterrupt();

  klog::Info("Hello InterruptInit\n");
}
