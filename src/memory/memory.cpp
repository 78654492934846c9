/**
 * @copyright Copyright The HearthKernel Contributors
 */

#include <cpu_io.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>

#include "arch.h"
#include "boot_info.hpp"
#include "frame_allocator.hpp"
#include "heap_allocator.hpp"
#include "kernel.h"
#include "kernel_config.hpp"
#include "kernel_log.hpp"
#include "once.hpp"
#include "page_mapper.hpp"
#include "sk_stdlib.h"

using FrameAllocatorSingleton = OnceSingleton<FrameAllocator>;
using PageMapperSingleton = OnceSingleton<PageMapper>;

namespace {

/// 分配头，位于返回给调用者的地址之前
struct AllocationHeader {
  /// 向堆申请的总大小
  size_t total_size;
  /// 向堆申请时使用的对齐，同时也是头部到块起始的距离
  size_t align;
};

constexpr size_t kHeaderSpace = 16;
static_assert(sizeof(AllocationHeader) <= kHeaderSpace);

/// 内核镜像所在物理范围，FrameAllocator 不会交出其中的页帧
std::array<PhysicalRange, 1> reserved_ranges{};

}  // namespace

extern "C" void* aligned_alloc(size_t alignment, size_t size) {
  if (!HeapSingleton::IsReady()) {
    return nullptr;
  }
  if (alignment == 0 || (alignment & (alignment - 1)) != 0) {
    return nullptr;
  }
  auto align = alignment > kHeaderSpace ? alignment : kHeaderSpace;
  if (size > SIZE_MAX - align) {
    return nullptr;
  }
  auto total_size = size + align;

  auto* block = static_cast<uint8_t*>(
      HeapSingleton::Instance().Allocate(total_size, align));
  if (block == nullptr) {
    return nullptr;
  }
  auto* user = block + align;
  auto* header = reinterpret_cast<AllocationHeader*>(user - kHeaderSpace);
  header->total_size = total_size;
  header->align = align;
  return user;
}

extern "C" void* malloc(size_t size) {
  return aligned_alloc(alignof(std::max_align_t), size);
}

extern "C" void* calloc(size_t num, size_t size) {
  if (size != 0 && num > SIZE_MAX / size) {
    return nullptr;
  }
  auto* ptr = malloc(num * size);
  if (ptr != nullptr) {
    std::memset(ptr, 0, num * size);
  }
  return ptr;
}

extern "C" void free(void* ptr) {
  if (ptr == nullptr || !HeapSingleton::IsReady()) {
    return;
  }
  auto* user = static_cast<uint8_t*>(ptr);
  const auto* header =
      reinterpret_cast<const AllocationHeader*>(user - kHeaderSpace);
  HeapSingleton::Instance().Deallocate(user - header->align,
                                       header->total_size, header->align);
}

auto MemoryInit(const BootInfo& boot_info) -> Expected<void> {
  reserved_ranges[0] = PhysicalRange{
      boot_info.kernel_addr,
      cpu_io::virtual_memory::PageAlignUp(boot_info.kernel_addr +
                                          boot_info.kernel_len)};

  size_t usable = 0;
  for (const auto& region : boot_info.Regions()) {
    if (region.kind == MemoryRegionKind::kUsable) {
      usable += region.end - region.start;
    }
  }
  klog::Info("Memory map: %zu regions, %zu KiB usable, offset 0x%lX\n",
             boot_info.memory_region_count, usable / 1024,
             boot_info.physical_memory_offset);

  return FrameAllocatorSingleton::Create(boot_info.Regions(),
                                         std::span{reserved_ranges})
      .and_then([&boot_info]() {
        return PageMapperSingleton::Create(ReadPageTableRoot(),
                                           boot_info.physical_memory_offset);
      })
      .and_then([]() {
        return HeapInit(PageMapperSingleton::Instance(),
                        FrameAllocatorSingleton::Instance());
      })
      .and_then([]() {
        // 栈下方一页不映射，栈溢出时触发缺页
        using kernel::config::kKernelStackSize;
        using kernel::config::kKernelStackStart;
        auto& mapper = PageMapperSingleton::Instance();
        if (mapper.TranslateAddress(kKernelStackStart -
                                    kernel::config::kPageSize)) {
          return Expected<void>(
              std::unexpected(Error(ErrorCode::kVmAlreadyMapped)));
        }
        return mapper.MapRange(
            kKernelStackStart, kKernelStackSize,
            cpu_io::virtual_memory::kValid | cpu_io::virtual_memory::kWrite,
            FrameAllocatorSingleton::Instance());
      })
      .and_then([]() -> Expected<void> {
        klog::Info("Memory initialization completed, %zu frames in use\n",
                   FrameAllocatorSingleton::Instance().allocated_count());
        return {};
      });
}

void RunOnKernelStack(void (*entry)(void*), void* arg) {
  auto stack_top =
      kernel::config::kKernelStackStart + kernel::config::kKernelStackSize;
  klog::Info("Switching to kernel stack [0x%lX, 0x%lX)\n",
             kernel::config::kKernelStackStart, stack_top);
  SwitchStack(stack_top, entry, arg);
}
