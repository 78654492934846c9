/**
 * @copyright Copyright The HearthKernel Contributors
 * @brief 四级页表映射
 */

#ifndef HEARTHKERNEL_SRC_MEMORY_INCLUDE_PAGE_MAPPER_HPP_
#define HEARTHKERNEL_SRC_MEMORY_INCLUDE_PAGE_MAPPER_HPP_

#include <cstddef>
#include <cstdint>
#include <optional>

#include "expected.hpp"
#include "frame_allocator.hpp"
#include "page_table.hpp"

/**
 * @brief 通过物理内存偏移映射访问并修改当前页表
 * @details 页表按物理页帧寻址，每级表通过 物理地址 + 偏移 得到可访问的
 * 虚拟地址，不持有任何页表对象
 * @note Unmap 不回收变空的中间页表，这些页帧会一直留在页表中
 */
class PageMapper {
 public:
  /**
   * @brief 构造函数
   * @param level4_table_addr 顶级页表的物理地址（CR3）
   * @param physical_memory_offset 全部物理内存被映射到的虚拟地址偏移
   * @pre 偏移映射已由引导程序建立
   */
  PageMapper(uint64_t level4_table_addr, uint64_t physical_memory_offset);

  /// @name 构造/析构函数
  /// @{
  PageMapper() = default;
  PageMapper(const PageMapper&) = delete;
  PageMapper(PageMapper&&) = default;
  auto operator=(const PageMapper&) -> PageMapper& = delete;
  auto operator=(PageMapper&&) -> PageMapper& = default;
  ~PageMapper() = default;
  /// @}

  /**
   * @brief 将虚拟页映射到物理页帧
   * @param page 虚拟页
   * @param frame 物理页帧
   * @param flags 叶子表项标志，cpu_io::virtual_memory::kValid 会被自动加上
   * @param frame_allocator 用于分配缺失的中间页表
   * @param overwrite 是否允许覆盖已有映射
   * @return Expected<void>
   *  - kVmAlreadyMapped 已映射且 overwrite 为 false
   *  - kVmFrameAllocationFailed 中间页表分配失败，此时不写入任何表项
   *  - kVmHugePage 路径上存在大页
   *  - kVmInvalidAddress 非规范地址
   */
  [[nodiscard]] auto Map(paging::Page page, paging::PhysicalFrame frame,
                         uint64_t flags, FrameAllocator& frame_allocator,
                         bool overwrite = false) -> Expected<void>;

  /**
   * @brief 为 [start, start + size) 的每一页分配新页帧并映射
   * @param start 起始虚拟地址，页对齐
   * @param size 大小，页对齐
   * @param flags 叶子表项标志
   * @param frame_allocator 页帧分配器
   * @return Expected<void> 第一个失败的错误
   * @note 每页的页帧在该页通过全部检查后才分配，已映射等错误不消耗页帧
   */
  [[nodiscard]] auto MapRange(uint64_t start, size_t size, uint64_t flags,
                              FrameAllocator& frame_allocator)
      -> Expected<void>;

  /**
   * @brief 取消映射
   * @param page 虚拟页
   * @return Expected<paging::PhysicalFrame> 原来映射的页帧
   */
  [[nodiscard]] auto Unmap(paging::Page page)
      -> Expected<paging::PhysicalFrame>;

  /**
   * @brief 查询 4 KiB 页映射到的页帧
   * @param page 虚拟页
   * @return std::optional<paging::PhysicalFrame> 未映射或为大页时为空
   */
  [[nodiscard]] auto Translate(paging::Page page) const
      -> std::optional<paging::PhysicalFrame>;

  /**
   * @brief 将虚拟地址翻译为物理地址，支持 1GiB/2MiB 大页
   * @param virtual_addr 虚拟地址
   * @return std::optional<uint64_t> 未映射时为空
   */
  [[nodiscard]] auto TranslateAddress(uint64_t virtual_addr) const
      -> std::optional<uint64_t>;

  /// 物理内存偏移
  [[nodiscard]] auto physical_memory_offset() const -> uint64_t {
    return physical_memory_offset_;
  }

 private:
  uint64_t level4_table_addr_{0};
  uint64_t physical_memory_offset_{0};

  /// 物理地址处页表的可访问指针
  [[nodiscard]] auto TableAt(uint64_t phys_addr) const -> paging::PageTable*;

  /// frame 为空时在写表项前从 frame_allocator 分配叶子页帧
  [[nodiscard]] auto MapLeaf(paging::Page page,
                             std::optional<paging::PhysicalFrame> frame,
                             uint64_t flags, FrameAllocator& frame_allocator,
                             bool overwrite) -> Expected<void>;

  /**
   * @brief 查找叶子页表项
   * @return 任一级缺失时为 kVmPageNotMapped，遇到大页时为 kVmHugePage
   */
  [[nodiscard]] auto FindLeafEntry(paging::Page page) const
      -> Expected<paging::PageTableEntry*>;
};

#endif  // HEARTHKERNEL_SRC_MEMORY_INCLUDE_PAGE_MAPPER_HPP_
