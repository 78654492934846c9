/**
 * @copyright Copyright The HearthKernel Contributors
 * @brief 四级页表映射
 */

#include "page_mapper.hpp"

#include <cpu_io.h>

#include <array>

#include "arch.h"
#include "kernel_log.hpp"

namespace {
constexpr uint64_t kPageSize = cpu_io::virtual_memory::kPageSize;
/// 页表级数，0 为叶子级
constexpr size_t kLevels = cpu_io::virtual_memory::kPageTableLevels;
/// 1 GiB 大页偏移掩码
constexpr uint64_t kHugePage1GMask = (1ULL << 30) - 1;
/// 2 MiB 大页偏移掩码
constexpr uint64_t kHugePage2MMask = (1ULL << 21) - 1;

auto IndexOf(uint64_t vaddr, size_t level) -> size_t {
  return cpu_io::virtual_memory::GetVirtualPageNumber(vaddr, level);
}
}  // namespace

PageMapper::PageMapper(uint64_t level4_table_addr,
                       uint64_t physical_memory_offset)
    : level4_table_addr_(cpu_io::virtual_memory::PageAlign(level4_table_addr)),
      physical_memory_offset_(physical_memory_offset) {}

auto PageMapper::TableAt(uint64_t phys_addr) const -> paging::PageTable* {
  return reinterpret_cast<paging::PageTable*>(phys_addr +
                                              physical_memory_offset_);
}

auto PageMapper::Map(paging::Page page, paging::PhysicalFrame frame,
                     uint64_t flags, FrameAllocator& frame_allocator,
                     bool overwrite) -> Expected<void> {
  return MapLeaf(page, frame, flags, frame_allocator, overwrite);
}

auto PageMapper::MapLeaf(paging::Page page,
                         std::optional<paging::PhysicalFrame> frame,
                         uint64_t flags, FrameAllocator& frame_allocator,
                         bool overwrite) -> Expected<void> {
  auto vaddr = page.start_address;
  if (!paging::IsCanonical(vaddr)) {
    return std::unexpected(Error(ErrorCode::kVmInvalidAddress));
  }

  // 第一遍只读遍历，找到第一个缺失的中间表项
  auto* table = TableAt(level4_table_addr_);
  size_t missing_level = 0;
  for (size_t level = kLevels - 1; level > 0; --level) {
    auto& entry = (*table)[IndexOf(vaddr, level)];
    if (!entry.IsPresent()) {
      missing_level = level;
      break;
    }
    if (entry.IsHuge()) {
      return std::unexpected(Error(ErrorCode::kVmHugePage));
    }
    table = TableAt(entry.Address());
  }

  if (missing_level == 0 && (*table)[IndexOf(vaddr, 0)].IsPresent() &&
      !overwrite) {
    return std::unexpected(Error(ErrorCode::kVmAlreadyMapped));
  }

  // 所有检查通过后才分配页帧，且先拿到全部页帧再写表项，失败时页表保持原状
  // 分配器没有释放接口，耗尽前已拿到的页帧随失败一起泄漏
  std::array<paging::PhysicalFrame, kLevels - 1> new_tables{};
  for (size_t i = 0; i < missing_level; i++) {
    auto new_frame = frame_allocator.AllocateFrame();
    if (!new_frame) {
      klog::Warn("PageMapper: no frame for page table level %zu, vaddr 0x%lX\n",
                 missing_level - 1 - i, vaddr);
      return std::unexpected(Error(ErrorCode::kVmFrameAllocationFailed));
    }
    new_tables[i] = *new_frame;
    TableAt(new_frame->start_address)->Zero();
  }
  if (!frame) {
    frame = frame_allocator.AllocateFrame();
    if (!frame) {
      klog::Warn("PageMapper: no frame to back vaddr 0x%lX\n", vaddr);
      return std::unexpected(Error(ErrorCode::kVmFrameAllocationFailed));
    }
  }

  auto parent_flags = cpu_io::virtual_memory::kValid |
                      cpu_io::virtual_memory::kWrite |
                      (flags & cpu_io::virtual_memory::kUser);
  for (size_t i = 0; i < missing_level; i++) {
    auto& entry = (*table)[IndexOf(vaddr, missing_level - i)];
    entry.Set(new_tables[i].start_address, parent_flags);
    table = TableAt(new_tables[i].start_address);
  }

  (*table)[IndexOf(vaddr, 0)].Set(frame->start_address,
                                  flags | cpu_io::virtual_memory::kValid);
  FlushTlbPage(vaddr);
  return {};
}

auto PageMapper::MapRange(uint64_t start, size_t size, uint64_t flags,
                          FrameAllocator& frame_allocator) -> Expected<void> {
  if (!cpu_io::virtual_memory::IsPageAligned(start) ||
      !cpu_io::virtual_memory::IsPageAligned(size)) {
    return std::unexpected(Error(ErrorCode::kInvalidArgument));
  }
  for (uint64_t addr = start; addr < start + size; addr += kPageSize) {
    // 叶子页帧在 MapLeaf 通过全部检查后才分配
    auto ret = MapLeaf(paging::Page{addr}, std::nullopt, flags, frame_allocator,
                       false);
    if (!ret) {
      return ret;
    }
  }
  return {};
}

auto PageMapper::FindLeafEntry(paging::Page page) const
    -> Expected<paging::PageTableEntry*> {
  auto vaddr = page.start_address;
  auto* table = TableAt(level4_table_addr_);
  for (size_t level = kLevels - 1; level > 0; --level) {
    auto& entry = (*table)[IndexOf(vaddr, level)];
    if (!entry.IsPresent()) {
      return std::unexpected(Error(ErrorCode::kVmPageNotMapped));
    }
    if (entry.IsHuge()) {
      return std::unexpected(Error(ErrorCode::kVmHugePage));
    }
    table = TableAt(entry.Address());
  }
  return &(*table)[IndexOf(vaddr, 0)];
}

auto PageMapper::Unmap(paging::Page page) -> Expected<paging::PhysicalFrame> {
  return FindLeafEntry(page).and_then(
      [page](paging::PageTableEntry* leaf) -> Expected<paging::PhysicalFrame> {
        if (!leaf->IsPresent()) {
          return std::unexpected(Error(ErrorCode::kVmPageNotMapped));
        }
        auto frame = leaf->Frame();
        leaf->Clear();
        FlushTlbPage(page.start_address);
        return frame;
      });
}

auto PageMapper::Translate(paging::Page page) const
    -> std::optional<paging::PhysicalFrame> {
  auto leaf = FindLeafEntry(page);
  if (!leaf || !(*leaf)->IsPresent()) {
    return std::nullopt;
  }
  return (*leaf)->Frame();
}

auto PageMapper::TranslateAddress(uint64_t virtual_addr) const
    -> std::optional<uint64_t> {
  auto* table = TableAt(level4_table_addr_);
  for (size_t level = kLevels - 1; level > 0; --level) {
    const auto& entry = (*table)[IndexOf(virtual_addr, level)];
    if (!entry.IsPresent()) {
      return std::nullopt;
    }
    if (entry.IsHuge()) {
      if (level == 2) {
        return (entry.Address() & ~kHugePage1GMask) +
               (virtual_addr & kHugePage1GMask);
      }
      if (level == 1) {
        return (entry.Address() & ~kHugePage2MMask) +
               (virtual_addr & kHugePage2MMask);
      }
      // L4 表项不允许大页
      return std::nullopt;
    }
    table = TableAt(entry.Address());
  }
  const auto& leaf = (*table)[IndexOf(virtual_addr, 0)];
  if (!leaf.IsPresent()) {
    return std::nullopt;
  }
  return leaf.Address() + (virtual_addr & (kPageSize - 1));
}
