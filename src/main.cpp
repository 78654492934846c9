/**
 * @copyright Copyright The HearthKernel Contributors
 * @brief 内核入口
 */

#include <cstdint>

#include "arch.h"
#include "boot_info.hpp"
#include "event_queue.hpp"
#include "executor.hpp"
#include "kernel.h"
#include "kernel_log.hpp"
#include "keyboard_task.hpp"
#include "panic_observer.hpp"
#include "sk_assert.h"
#include "sk_libcxx.h"

namespace {

/// 示例任务：一次轮询即完成
auto ExampleTask(Context& /*cx*/) -> PollResult {
  constexpr uint32_t kAsyncNumber = 42;
  klog::Info("async number: %u\n", kAsyncNumber);
  return PollResult::kReady;
}

/// 内核栈上的主函数
[[noreturn]] void KernelMain(void* /*arg*/) {
  InterruptInit();

  auto result =
      ScancodeQueueSingleton::Create()
          .and_then([]() { return ExecutorSingleton::Create(); })
          .and_then([]() {
            return ExecutorSingleton::Instance().Spawn(
                MakeTask("example", ExampleTask));
          })
          .and_then([](TaskId) {
            return ExecutorSingleton::Instance().Spawn(
                etl::unique_ptr<Task>(new KeyboardTask(
                    ScancodeQueueSingleton::Instance())));
          });
  sk_assert_msg(result.has_value(), "spawning initial tasks failed: %s",
                result.error().message());

  klog::Info("Hello HearthKernel\n");
  ExecutorSingleton::Instance().Run();
}

}  // namespace

void _start(const BootInfo* boot_info) {
  CppInit();
  ArchInit(*boot_info);
  PanicNotifierSingleton::create();

  auto result = MemoryInit(*boot_info);
  if (!result) {
    auto kind = result.error().code == ErrorCode::kVmFrameAllocationFailed
                    ? FaultKind::kFrameExhausted
                    : FaultKind::kExplicit;
    Panic(PanicEvent{
        .kind = kind,
        .reason = result.error().message(),
        .address = 0,
        .error_code = static_cast<uint64_t>(result.error().code),
        .pc = reinterpret_cast<uint64_t>(__builtin_return_address(0)),
        .sp = reinterpret_cast<uint64_t>(__builtin_frame_address(0)),
    });
  }

  RunOnKernelStack(KernelMain, nullptr);
}
