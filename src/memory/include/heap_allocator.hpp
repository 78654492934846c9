/**
 * @copyright Copyright The HearthKernel Contributors
 * @brief 链表堆分配器
 */

#ifndef HEARTHKERNEL_SRC_MEMORY_INCLUDE_HEAP_ALLOCATOR_HPP_
#define HEARTHKERNEL_SRC_MEMORY_INCLUDE_HEAP_ALLOCATOR_HPP_

#include <cstddef>
#include <cstdint>
#include <utility>

#include "expected.hpp"
#include "frame_allocator.hpp"
#include "once.hpp"
#include "page_mapper.hpp"
#include "spinlock.hpp"

/**
 * @brief 首次适配的空闲链表分配器
 * @details 空闲块按地址升序串成链表，每个空闲块头部存放 ListNode。
 * 分配时取第一个能容纳请求的块，前后剩余部分放回链表；释放时与相邻空闲块合并
 * @note 所有请求的大小与对齐都会被提升到能容纳一个 ListNode
 */
class HeapAllocator {
 public:
  /// @name 构造/析构函数
  /// @{
  HeapAllocator() = default;
  HeapAllocator(const HeapAllocator&) = delete;
  HeapAllocator(HeapAllocator&&) = delete;
  auto operator=(const HeapAllocator&) -> HeapAllocator& = delete;
  auto operator=(HeapAllocator&&) -> HeapAllocator& = delete;
  ~HeapAllocator() = default;
  /// @}

  /**
   * @brief 交付堆区域
   * @param heap_start 起始地址
   * @param heap_size 大小
   * @return Expected<void> 重复调用返回 kHeapAlreadyInitialized，
   * 区域过小或未对齐返回 kHeapInvalidRegion
   * @pre [heap_start, heap_start + heap_size) 已完整映射
   */
  [[nodiscard]] auto Init(uint64_t heap_start, size_t heap_size)
      -> Expected<void>;

  /**
   * @brief 分配内存
   * @param size 大小
   * @param align 对齐，必须是 2 的幂
   * @return void* 失败时为 nullptr
   */
  [[nodiscard]] auto Allocate(size_t size, size_t align) -> void*;

  /**
   * @brief 释放内存
   * @param ptr Allocate 返回的地址
   * @param size 与分配时相同
   * @param align 与分配时相同
   */
  void Deallocate(void* ptr, size_t size, size_t align);

  /// 空闲字节数
  [[nodiscard]] auto FreeBytes() -> size_t;
  /// 空闲块数
  [[nodiscard]] auto FreeBlocks() -> size_t;

  [[nodiscard]] auto heap_start() const -> uint64_t { return heap_start_; }
  [[nodiscard]] auto heap_size() const -> size_t { return heap_size_; }
  [[nodiscard]] auto initialized() const -> bool { return initialized_; }

  /// 空闲块头
  struct ListNode {
    size_t size;
    ListNode* next;

    [[nodiscard]] auto start() const -> uint64_t {
      return reinterpret_cast<uint64_t>(this);
    }
    [[nodiscard]] auto end() const -> uint64_t { return start() + size; }
  };

  /**
   * @brief 将请求调整为能容纳 ListNode 的大小与对齐
   * @return std::pair<size_t, size_t> {size, align}
   */
  [[nodiscard]] static constexpr auto SizeAlign(size_t size, size_t align)
      -> std::pair<size_t, size_t> {
    auto adjusted_align = align > alignof(ListNode) ? align : alignof(ListNode);
    auto adjusted_size = size > sizeof(ListNode) ? size : sizeof(ListNode);
    adjusted_size =
        (adjusted_size + alignof(ListNode) - 1) & ~(alignof(ListNode) - 1);
    return {adjusted_size, adjusted_align};
  }

 private:
  /// 哨兵，不在堆内
  ListNode head_{0, nullptr};
  uint64_t heap_start_{0};
  size_t heap_size_{0};
  bool initialized_{false};
  SpinLock lock_{"heap"};

  /**
   * @brief 按地址顺序插入空闲区域并与相邻块合并
   * @param addr 起始地址，按 ListNode 对齐
   * @param size 大小，不小于 sizeof(ListNode)
   */
  void AddFreeRegion(uint64_t addr, size_t size);

  /**
   * @brief 检查空闲块能否容纳请求
   * @return 成功时为分配起始地址
   */
  [[nodiscard]] static auto AllocFromRegion(const ListNode& region,
                                            size_t size, size_t align)
      -> Expected<uint64_t>;
};

using HeapSingleton = OnceSingleton<HeapAllocator>;

/**
 * @brief 映射堆区域并初始化全局堆
 * @param mapper 页表映射器
 * @param frame_allocator 页帧分配器
 * @return Expected<void> 映射或初始化失败时返回错误
 * @post 堆区域内每一页均已映射为 PRESENT|WRITABLE
 */
[[nodiscard]] auto HeapInit(PageMapper& mapper,
                            FrameAllocator& frame_allocator) -> Expected<void>;

#endif  // HEARTHKERNEL_SRC_MEMORY_INCLUDE_HEAP_ALLOCATOR_HPP_
