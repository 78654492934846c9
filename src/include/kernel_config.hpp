/** @copyright Copyright The HearthKernel Contributors */

#ifndef HEARTHKERNEL_SRC_INCLUDE_KERNEL_CONFIG_HPP_
#define HEARTHKERNEL_SRC_INCLUDE_KERNEL_CONFIG_HPP_

#include <cstddef>
#include <cstdint>

namespace kernel::config {

// ── 内存布局 ────────────────────────────────────────────────────
/// 页/帧大小
inline constexpr size_t kPageSize = 4096;
/// 堆起始虚拟地址
inline constexpr uint64_t kHeapStart = 0x4444'4444'0000;
/// 堆大小 (100 KiB)
inline constexpr size_t kHeapSize = 100 * 1024;

/// 内核栈起始虚拟地址，其下方一页保持未映射作为保护页
inline constexpr uint64_t kKernelStackStart = 0x5555'5555'0000;
/// 内核栈大小 (64 KiB)
inline constexpr size_t kKernelStackSize = 64 * 1024;

// ── 中断 ───────────────────────────────────────────────────────
/// 双重错误使用的 IST 下标（TSS.ist[0]，门描述符中写入 1）
inline constexpr uint8_t kDoubleFaultIstIndex = 0;
/// IST 栈大小 (20 KiB)
inline constexpr size_t kIstStackSize = 20 * 1024;

/// 主片向量偏移
inline constexpr uint8_t kPicMasterOffset = 32;
/// 从片向量偏移
inline constexpr uint8_t kPicSlaveOffset = kPicMasterOffset + 8;

// ── 事件队列 ───────────────────────────────────────────────────
/// 扫描码队列容量，MPMCQueue 要求 2 的幂
inline constexpr size_t kScancodeQueueCapacity = 128;

// ── 任务管理容量 ────────────────────────────────────────────────
/// 执行器最大任务数
inline constexpr size_t kMaxTasks = 64;
/// 任务表桶数（建议 = 2 × kMaxTasks）
inline constexpr size_t kMaxTasksBuckets = 128;
/// 就绪队列容量，不小于 kMaxTasks
inline constexpr size_t kMaxReadyTasks = kMaxTasks;

// ── 观察者容量 ──────────────────────────────────────────────────
/// panic 观察者数量
inline constexpr size_t kPanicObservers = 4;

static_assert((kScancodeQueueCapacity & (kScancodeQueueCapacity - 1)) == 0,
              "kScancodeQueueCapacity must be a power of 2");
static_assert(kMaxReadyTasks >= kMaxTasks,
              "ready queue must hold every task at once");
static_assert(kHeapStart % kPageSize == 0 && kHeapSize % kPageSize == 0,
              "heap region must be page aligned");

}  // namespace kernel::config

#endif  // HEARTHKERNEL_SRC_INCLUDE_KERNEL_CONFIG_HPP_
