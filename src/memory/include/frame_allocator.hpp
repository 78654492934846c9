/**
 * @copyright Copyright The HearthKernel Contributors
 * @brief 物理页帧分配器
 */

#ifndef HEARTHKERNEL_SRC_MEMORY_INCLUDE_FRAME_ALLOCATOR_HPP_
#define HEARTHKERNEL_SRC_MEMORY_INCLUDE_FRAME_ALLOCATOR_HPP_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

#include "boot_info.hpp"
#include "page_table.hpp"

/// 物理地址范围 [start, end)
struct PhysicalRange {
  uint64_t start;
  uint64_t end;
};

/**
 * @brief 基于引导内存映射的单调页帧分配器
 * @details 按内存映射给出的顺序遍历可用区域，逐个交出 4 KiB 对齐的页帧。
 * 游标只前进不后退，同一页帧不会交出两次
 * @note 没有释放接口，交出的页帧永久归调用者所有
 */
class FrameAllocator {
 public:
  /**
   * @brief 构造函数
   * @param regions 引导内存映射
   * @param reserved 额外保留的物理范围（如内核镜像），不会被分配
   * @note 两个 span 指向的存储须在分配器生命周期内有效
   */
  explicit FrameAllocator(std::span<const MemoryRegion> regions,
                          std::span<const PhysicalRange> reserved = {});

  /// @name 构造/析构函数
  /// @{
  FrameAllocator() = default;
  FrameAllocator(const FrameAllocator&) = delete;
  FrameAllocator(FrameAllocator&&) = default;
  auto operator=(const FrameAllocator&) -> FrameAllocator& = delete;
  auto operator=(FrameAllocator&&) -> FrameAllocator& = default;
  ~FrameAllocator() = default;
  /// @}

  /**
   * @brief 分配一个页帧
   * @return std::optional<paging::PhysicalFrame> 可用区域耗尽时为空
   */
  [[nodiscard]] auto AllocateFrame() -> std::optional<paging::PhysicalFrame>;

  /// 已交出的页帧数
  [[nodiscard]] auto allocated_count() const -> size_t { return allocated_; }

 private:
  std::span<const MemoryRegion> regions_;
  std::span<const PhysicalRange> reserved_;

  /// 当前区域下标
  size_t region_index_{0};
  /// 当前区域内下一个候选页帧
  uint64_t next_{0};
  /// next_ 是否已对当前区域初始化
  bool region_started_{false};
  size_t allocated_{0};

  /// 页帧是否与保留范围或非可用区域重叠
  [[nodiscard]] auto IsReserved(uint64_t frame_start) const -> bool;

  /// 页帧是否落在之前已遍历过的可用区域内
  [[nodiscard]] auto CoveredByEarlierRegion(uint64_t frame_start) const
      -> bool;
};

#endif  // HEARTHKERNEL_SRC_MEMORY_INCLUDE_FRAME_ALLOCATOR_HPP_
