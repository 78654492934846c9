/**
 * @copyright Copyright The HearthKernel Contributors
 * @brief x86_64 四级页表格式
 */

#ifndef HEARTHKERNEL_SRC_MEMORY_INCLUDE_PAGE_TABLE_HPP_
#define HEARTHKERNEL_SRC_MEMORY_INCLUDE_PAGE_TABLE_HPP_

#include <cpu_io.h>

#include <array>
#include <cstddef>
#include <cstdint>

#include "kernel_config.hpp"

namespace paging {

/// 每级页表项数
inline constexpr size_t kEntryCount = 512;

static_assert(cpu_io::virtual_memory::kPageSize == kernel::config::kPageSize);

/// 在 L3/L2 表项中表示 1GiB/2MiB 大页（PS 位）
inline constexpr uint64_t kHugePage = 1ULL << 7;

/// 是否为规范地址（高 17 位全部相同）
constexpr auto IsCanonical(uint64_t virtual_addr) -> bool {
  auto high = virtual_addr >> 47;
  return high == 0 || high == 0x1'FFFF;
}

/// 4 KiB 物理页帧，以基址标识
struct PhysicalFrame {
  uint64_t start_address;

  friend constexpr auto operator==(const PhysicalFrame&, const PhysicalFrame&)
      -> bool = default;
};

/// 4 KiB 虚拟页，以基址标识
struct Page {
  uint64_t start_address;

  friend constexpr auto operator==(const Page&, const Page&) -> bool = default;
};

/// 页表项，编码由 cpu_io::virtual_memory 完成
class PageTableEntry {
 public:
  [[nodiscard]] auto IsUnused() const -> bool { return value_ == 0; }
  [[nodiscard]] auto IsPresent() const -> bool {
    return cpu_io::virtual_memory::IsPageTableEntryValid(value_);
  }
  [[nodiscard]] auto IsHuge() const -> bool {
    return (value_ & kHugePage) != 0;
  }
  [[nodiscard]] auto Address() const -> uint64_t {
    return cpu_io::virtual_memory::PageTableEntryToPhysical(value_);
  }
  [[nodiscard]] auto Flags() const -> uint64_t { return value_ & ~Address(); }
  [[nodiscard]] auto Frame() const -> PhysicalFrame { return {Address()}; }

  void Set(uint64_t phys_addr, uint64_t flags) {
    value_ = cpu_io::virtual_memory::PhysicalToPageTableEntry(phys_addr, flags);
  }
  void Clear() { value_ = 0; }

  [[nodiscard]] auto raw() const -> uint64_t { return value_; }

 private:
  uint64_t value_{0};
};

static_assert(sizeof(PageTableEntry) == 8);

/// 一级页表，占一个物理页帧
struct alignas(4096) PageTable {
  std::array<PageTableEntry, kEntryCount> entries;

  void Zero() {
    for (auto& entry : entries) {
      entry.Clear();
    }
  }

  auto operator[](size_t index) -> PageTableEntry& { return entries[index]; }
  auto operator[](size_t index) const -> const PageTableEntry& {
    return entries[index];
  }
};

static_assert(sizeof(PageTable) == kernel::config::kPageSize);

}  // namespace paging

#endif  // HEARTHKERNEL_SRC_MEMORY_INCLUDE_PAGE_TABLE_HPP_
