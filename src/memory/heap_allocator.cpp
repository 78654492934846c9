/**
 * @copyright Copyright The HearthKernel Contributors
 * @brief 链表堆分配器
 */

#include "heap_allocator.hpp"

#include <cpu_io.h>

#include "kernel.h"
#include "kernel_config.hpp"
#include "kernel_log.hpp"

namespace {
constexpr auto AlignUp(uint64_t addr, size_t align) -> uint64_t {
  return (addr + align - 1) & ~(static_cast<uint64_t>(align) - 1);
}

constexpr size_t kNodeSize = sizeof(HeapAllocator::ListNode);
constexpr size_t kNodeAlign = alignof(HeapAllocator::ListNode);
}  // namespace

auto HeapAllocator::Init(uint64_t heap_start, size_t heap_size)
    -> Expected<void> {
  LockGuard<SpinLock> guard(lock_);
  if (initialized_) {
    return std::unexpected(Error(ErrorCode::kHeapAlreadyInitialized));
  }
  if (heap_start == 0 || heap_start % kNodeAlign != 0 || heap_size < kNodeSize) {
    return std::unexpected(Error(ErrorCode::kHeapInvalidRegion));
  }
  heap_start_ = heap_start;
  heap_size_ = heap_size;
  initialized_ = true;
  AddFreeRegion(heap_start, heap_size & ~(kNodeAlign - 1));
  return {};
}

auto HeapAllocator::AllocFromRegion(const ListNode& region, size_t size,
                                    size_t align) -> Expected<uint64_t> {
  auto alloc_start = AlignUp(region.start(), align);
  // 前部剩余放不下 ListNode 时，向后推到至少空出一个节点的位置
  if (alloc_start != region.start() &&
      alloc_start - region.start() < kNodeSize) {
    alloc_start = AlignUp(region.start() + kNodeSize, align);
  }

  auto alloc_end = alloc_start + size;
  if (alloc_end < alloc_start || alloc_end > region.end()) {
    return std::unexpected(Error(ErrorCode::kOutOfMemory));
  }

  // 尾部剩余放不下 ListNode 时无法归还链表
  auto excess = region.end() - alloc_end;
  if (excess > 0 && excess < kNodeSize) {
    return std::unexpected(Error(ErrorCode::kOutOfMemory));
  }
  return alloc_start;
}

auto HeapAllocator::Allocate(size_t size, size_t align) -> void* {
  if (align == 0 || (align & (align - 1)) != 0) {
    return nullptr;
  }
  auto [adjusted_size, adjusted_align] = SizeAlign(size, align);

  LockGuard<SpinLock> guard(lock_);
  auto* prev = &head_;
  while (prev->next != nullptr) {
    auto* region = prev->next;
    auto alloc_start = AllocFromRegion(*region, adjusted_size, adjusted_align);
    if (!alloc_start) {
      prev = region;
      continue;
    }

    auto region_start = region->start();
    auto region_end = region->end();
    prev->next = region->next;

    auto alloc_end = *alloc_start + adjusted_size;
    if (*alloc_start > region_start) {
      AddFreeRegion(region_start, *alloc_start - region_start);
    }
    if (region_end > alloc_end) {
      AddFreeRegion(alloc_end, region_end - alloc_end);
    }
    return reinterpret_cast<void*>(*alloc_start);
  }
  return nullptr;
}

void HeapAllocator::Deallocate(void* ptr, size_t size, size_t align) {
  if (ptr == nullptr) {
    return;
  }
  auto [adjusted_size, adjusted_align] = SizeAlign(size, align);
  (void)adjusted_align;

  auto addr = reinterpret_cast<uint64_t>(ptr);
  if (addr < heap_start_ || addr + adjusted_size > heap_start_ + heap_size_) {
    Panic(PanicEvent{
        .kind = FaultKind::kAllocationError,
        .reason = "deallocating a pointer outside the heap",
        .address = addr,
        .error_code = adjusted_size,
        .pc = reinterpret_cast<uint64_t>(__builtin_return_address(0)),
        .sp = reinterpret_cast<uint64_t>(__builtin_frame_address(0)),
    });
  }

  LockGuard<SpinLock> guard(lock_);
  AddFreeRegion(addr, adjusted_size);
}

void HeapAllocator::AddFreeRegion(uint64_t addr, size_t size) {
  auto* prev = &head_;
  while (prev->next != nullptr && prev->next->start() < addr) {
    prev = prev->next;
  }
  auto* next = prev->next;

  // 与相邻空闲块重叠说明重复释放或越界写
  if ((prev != &head_ && prev->end() > addr) ||
      (next != nullptr && addr + size > next->start())) {
    Panic(PanicEvent{
        .kind = FaultKind::kAllocationError,
        .reason = "heap free list corrupted (double free?)",
        .address = addr,
        .error_code = size,
        .pc = reinterpret_cast<uint64_t>(__builtin_return_address(0)),
        .sp = reinterpret_cast<uint64_t>(__builtin_frame_address(0)),
    });
  }

  auto* node = reinterpret_cast<ListNode*>(addr);
  node->size = size;
  node->next = next;
  prev->next = node;

  if (next != nullptr && node->end() == next->start()) {
    node->size += next->size;
    node->next = next->next;
  }
  if (prev != &head_ && prev->end() == node->start()) {
    prev->size += node->size;
    prev->next = node->next;
  }
}

auto HeapAllocator::FreeBytes() -> size_t {
  LockGuard<SpinLock> guard(lock_);
  size_t total = 0;
  for (auto* node = head_.next; node != nullptr; node = node->next) {
    total += node->size;
  }
  return total;
}

auto HeapAllocator::FreeBlocks() -> size_t {
  LockGuard<SpinLock> guard(lock_);
  size_t count = 0;
  for (auto* node = head_.next; node != nullptr; node = node->next) {
    count++;
  }
  return count;
}

auto HeapInit(PageMapper& mapper, FrameAllocator& frame_allocator)
    -> Expected<void> {
  using kernel::config::kHeapSize;
  using kernel::config::kHeapStart;

  return mapper
      .MapRange(kHeapStart, kHeapSize,
                cpu_io::virtual_memory::kValid | cpu_io::virtual_memory::kWrite,
                frame_allocator)
      .and_then([]() { return HeapSingleton::Create(); })
      .and_then([]() {
        return HeapSingleton::Instance().Init(kHeapStart, kHeapSize);
      })
      .and_then([]() -> Expected<void> {
        klog::Info("Heap mapped at 0x%lX, size 0x%lX\n", kHeapStart,
                   kHeapSize);
        return {};
      });
}
