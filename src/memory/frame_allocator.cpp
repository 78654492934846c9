/**
 * @copyright Copyright The HearthKernel Contributors
 * @brief 物理页帧分配器
 */

#include "frame_allocator.hpp"

#include <cpu_io.h>

#include "kernel_config.hpp"

namespace {
constexpr uint64_t kFrameSize = kernel::config::kPageSize;

constexpr auto Overlaps(uint64_t start, uint64_t end, uint64_t other_start,
                        uint64_t other_end) -> bool {
  return start < other_end && other_start < end;
}
}  // namespace

FrameAllocator::FrameAllocator(std::span<const MemoryRegion> regions,
                               std::span<const PhysicalRange> reserved)
    : regions_(regions), reserved_(reserved) {}

auto FrameAllocator::IsReserved(uint64_t frame_start) const -> bool {
  auto frame_end = frame_start + kFrameSize;
  for (const auto& range : reserved_) {
    if (Overlaps(frame_start, frame_end, range.start, range.end)) {
      return true;
    }
  }
  // 内存映射可能出现重叠项，只要命中任一非可用区域即跳过
  for (const auto& region : regions_) {
    if (region.kind != MemoryRegionKind::kUsable &&
        Overlaps(frame_start, frame_end, region.start, region.end)) {
      return true;
    }
  }
  return false;
}

auto FrameAllocator::CoveredByEarlierRegion(uint64_t frame_start) const
    -> bool {
  // 可用区域之间若有重叠，重叠部分已在前面的区域中交出过
  for (size_t i = 0; i < region_index_; i++) {
    const auto& region = regions_[i];
    if (region.kind == MemoryRegionKind::kUsable &&
        Overlaps(frame_start, frame_start + kFrameSize, region.start,
                 region.end)) {
      return true;
    }
  }
  return false;
}

auto FrameAllocator::AllocateFrame() -> std::optional<paging::PhysicalFrame> {
  while (region_index_ < regions_.size()) {
    const auto& region = regions_[region_index_];
    if (region.kind != MemoryRegionKind::kUsable) {
      region_index_++;
      region_started_ = false;
      continue;
    }

    if (!region_started_) {
      next_ = cpu_io::virtual_memory::PageAlignUp(region.start);
      region_started_ = true;
    }

    while (next_ + kFrameSize <= region.end && next_ >= region.start) {
      auto candidate = next_;
      next_ += kFrameSize;
      // 0 号页帧与空指针无法区分
      if (candidate == 0 || IsReserved(candidate) ||
          CoveredByEarlierRegion(candidate)) {
        continue;
      }
      allocated_++;
      return paging::PhysicalFrame{candidate};
    }

    region_index_++;
    region_started_ = false;
  }
  return std::nullopt;
}
