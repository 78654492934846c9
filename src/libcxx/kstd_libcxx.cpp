/**
 * @copyright Copyright The HearthKernel Contributors
 */

#include "sk_libcxx.h"

#include <cpu_io.h>

#include <algorithm>
#include <atomic>
#include <cstdint>

#include "kernel.h"

/// 全局构造函数函数指针
using function_t = void (*)();
// 在 link.ld 中定义
/// 全局构造函数函数指针起点地址
extern "C" function_t __init_array_start;
/// 全局构造函数函数指针终点地址
extern "C" function_t __init_array_end;
/// 动态共享对象标识，内核使用静态链接，此变量在内核中没有使用
void* __dso_handle = nullptr;

/**
 * 注册在程序正常终止时调用的析构函数
 * @return 成功返回 0
 * @note 内核只会停机而不会正常退出，全局对象从不析构，因此不记录
 */
extern "C" auto __cxa_atexit(void (*)(void*), void*, void*) -> int {
  return 0;
}

/// @name 静态局部变量初始化守卫
/// @{

/// @note 根据 Itanium C++ ABI，守护变量必须是 64 位
/// @see https://itanium-cxx-abi.github.io/cxx-abi/abi.html#once-ctor
struct GuardType {
  /// 原子守护变量：bit 0 = is_initialized, bit 8 = is_in_use
  std::atomic<uint64_t> guard{0};

  static constexpr uint64_t kInitializedMask = 0x01;
  static constexpr uint64_t kInUseMask = 0x100;
};

static_assert(sizeof(GuardType) == 8, "GuardType must be 64 bits per ABI");

/**
 * 检测静态局部变量是否已经初始化
 * @param guard 锁，一个 64 位变量
 * @return 未初始化返回非零值，已初始化返回 0
 */
extern "C" auto __cxa_guard_acquire(GuardType* guard) -> int {
  uint64_t expected = 0;

  while (!guard->guard.compare_exchange_weak(expected, GuardType::kInUseMask,
                                             std::memory_order_acq_rel,
                                             std::memory_order_acquire)) {
    if ((expected & GuardType::kInitializedMask) != 0U) {
      return 0;
    }
    // 单核上只有中断处理程序可能在初始化途中进入，这是不可恢复的重入
    if ((expected & GuardType::kInUseMask) != 0U) {
      Panic("static local initialization re-entered");
    }
    cpu_io::Pause();
    expected = 0;
  }

  return 1;
}

/**
 * 标记静态局部变量初始化完成
 * @param guard 锁
 */
extern "C" void __cxa_guard_release(GuardType* guard) {
  guard->guard.store(GuardType::kInitializedMask, std::memory_order_release);
}

/**
 * 初始化失败时释放锁而不标记变量为已初始化
 * @param guard 锁
 */
extern "C" void __cxa_guard_abort(GuardType* guard) {
  guard->guard.store(0, std::memory_order_release);
}

/// @}

/**
 * 纯虚函数调用处理
 */
extern "C" void __cxa_pure_virtual() { Panic("pure virtual function call"); }

/**
 * 终止程序
 */
extern "C" void abort() { Panic("abort"); }

/**
 * c++ 全局对象构造
 */
void CppInit() {
  std::for_each(&__init_array_start, &__init_array_end,
                [](function_t func) { (func)(); });
}
