/**
 * @copyright Copyright The HearthKernel Contributors
 */

#include "heap_allocator.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <tuple>
#include <utility>
#include <vector>

#include "arch_mock.hpp"

namespace {

class HeapAllocatorTest : public ::testing::Test {
 protected:
  static constexpr size_t kHeapBytes = 16 * 1024;

  void SetUp() override {
    arch_mock::Reset();
    ASSERT_TRUE(heap_.Init(Start(), kHeapBytes).has_value());
  }

  auto Start() -> uint64_t {
    return reinterpret_cast<uint64_t>(buffer_.data());
  }

  alignas(4096) std::array<uint8_t, kHeapBytes> buffer_{};
  HeapAllocator heap_;
};

}  // namespace

TEST(HeapAllocatorInitTest, RejectsInvalidRegions) {
  alignas(16) static uint8_t buffer[256];
  HeapAllocator heap;

  auto ret = heap.Init(0, sizeof(buffer));
  ASSERT_FALSE(ret.has_value());
  EXPECT_EQ(ret.error().code, ErrorCode::kHeapInvalidRegion);

  // 起始地址未对齐
  ret = heap.Init(reinterpret_cast<uint64_t>(buffer) + 1, 64);
  ASSERT_FALSE(ret.has_value());
  EXPECT_EQ(ret.error().code, ErrorCode::kHeapInvalidRegion);

  // 放不下一个空闲块头
  ret = heap.Init(reinterpret_cast<uint64_t>(buffer), 8);
  ASSERT_FALSE(ret.has_value());
  EXPECT_EQ(ret.error().code, ErrorCode::kHeapInvalidRegion);

  EXPECT_FALSE(heap.initialized());
  EXPECT_EQ(heap.Allocate(8, 8), nullptr);
}

TEST_F(HeapAllocatorTest, SecondInitIsRejected) {
  auto ret = heap_.Init(Start(), kHeapBytes);
  ASSERT_FALSE(ret.has_value());
  EXPECT_EQ(ret.error().code, ErrorCode::kHeapAlreadyInitialized);
  EXPECT_EQ(heap_.FreeBytes(), kHeapBytes);
}

TEST_F(HeapAllocatorTest, SizeAlignPromotesSmallRequests) {
  auto [size, align] = HeapAllocator::SizeAlign(1, 1);
  EXPECT_EQ(size, sizeof(HeapAllocator::ListNode));
  EXPECT_EQ(align, alignof(HeapAllocator::ListNode));

  std::tie(size, align) = HeapAllocator::SizeAlign(17, 64);
  EXPECT_EQ(size, 24);
  EXPECT_EQ(align, 64);
}

TEST_F(HeapAllocatorTest, AllocationsAreAlignedAndDisjoint) {
  struct Block {
    uint64_t start;
    size_t size;
  };
  std::vector<Block> blocks;
  const std::pair<size_t, size_t> requests[] = {
      {1, 1}, {24, 8}, {100, 64}, {7, 4}, {512, 256}, {33, 16}, {8, 4096},
  };
  for (auto [size, align] : requests) {
    auto* ptr = heap_.Allocate(size, align);
    ASSERT_NE(ptr, nullptr) << "size " << size << " align " << align;
    auto addr = reinterpret_cast<uint64_t>(ptr);
    EXPECT_EQ(addr % align, 0);
    EXPECT_GE(addr, Start());
    EXPECT_LE(addr + size, Start() + kHeapBytes);
    // 写满整块，检查不会覆盖其他分配
    std::memset(ptr, static_cast<int>(blocks.size() + 1), size);
    blocks.push_back({addr, size});
  }

  std::ranges::sort(blocks, {}, &Block::start);
  for (size_t i = 1; i < blocks.size(); i++) {
    EXPECT_LE(blocks[i - 1].start + blocks[i - 1].size, blocks[i].start);
  }
}

TEST_F(HeapAllocatorTest, FreeingEverythingMergesBack) {
  std::vector<std::pair<void*, size_t>> live;
  for (size_t i = 1; i <= 32; i++) {
    auto size = i * 24;
    auto* ptr = heap_.Allocate(size, 8);
    ASSERT_NE(ptr, nullptr);
    live.emplace_back(ptr, size);
  }

  // 先释放奇数位，再释放偶数位，强制双向合并
  for (size_t i = 0; i < live.size(); i += 2) {
    heap_.Deallocate(live[i].first, live[i].second, 8);
  }
  EXPECT_GT(heap_.FreeBlocks(), 1);
  for (size_t i = 1; i < live.size(); i += 2) {
    heap_.Deallocate(live[i].first, live[i].second, 8);
  }

  EXPECT_EQ(heap_.FreeBlocks(), 1);
  EXPECT_EQ(heap_.FreeBytes(), kHeapBytes);
}

TEST_F(HeapAllocatorTest, AlignmentPaddingReturnsToFreeList) {
  auto* small = heap_.Allocate(16, 8);
  ASSERT_NE(small, nullptr);
  auto* aligned = heap_.Allocate(64, 1024);
  ASSERT_NE(aligned, nullptr);
  EXPECT_EQ(reinterpret_cast<uint64_t>(aligned) % 1024, 0);

  heap_.Deallocate(aligned, 64, 1024);
  heap_.Deallocate(small, 16, 8);
  EXPECT_EQ(heap_.FreeBlocks(), 1);
  EXPECT_EQ(heap_.FreeBytes(), kHeapBytes);
}

TEST_F(HeapAllocatorTest, FreedMemoryIsReused) {
  // 反复分配释放远超堆大小的总量
  for (size_t i = 0; i < 1000; i++) {
    auto* ptr = heap_.Allocate(kHeapBytes / 2, 8);
    ASSERT_NE(ptr, nullptr) << "iteration " << i;
    heap_.Deallocate(ptr, kHeapBytes / 2, 8);
  }
  EXPECT_EQ(heap_.FreeBytes(), kHeapBytes);
}

TEST_F(HeapAllocatorTest, ExhaustionReturnsNull) {
  EXPECT_EQ(heap_.Allocate(kHeapBytes + 1, 8), nullptr);

  auto* whole = heap_.Allocate(kHeapBytes, 8);
  ASSERT_NE(whole, nullptr);
  EXPECT_EQ(heap_.FreeBytes(), 0);
  EXPECT_EQ(heap_.Allocate(8, 8), nullptr);

  heap_.Deallocate(whole, kHeapBytes, 8);
  EXPECT_NE(heap_.Allocate(8, 8), nullptr);
}

TEST_F(HeapAllocatorTest, InvalidAlignmentReturnsNull) {
  EXPECT_EQ(heap_.Allocate(16, 0), nullptr);
  EXPECT_EQ(heap_.Allocate(16, 24), nullptr);
  EXPECT_EQ(heap_.FreeBytes(), kHeapBytes);
}

TEST_F(HeapAllocatorTest, DeallocateNullIsIgnored) {
  heap_.Deallocate(nullptr, 16, 8);
  EXPECT_EQ(heap_.FreeBytes(), kHeapBytes);
}

TEST_F(HeapAllocatorTest, DoubleFreePanics) {
  auto* first = heap_.Allocate(64, 8);
  auto* second = heap_.Allocate(64, 8);
  ASSERT_NE(first, nullptr);
  ASSERT_NE(second, nullptr);
  heap_.Deallocate(first, 64, 8);
  EXPECT_THROW(heap_.Deallocate(first, 64, 8), arch_mock::HaltLoopCalled);
}

TEST_F(HeapAllocatorTest, ForeignPointerPanics) {
  alignas(16) uint8_t outside[64];
  EXPECT_THROW(heap_.Deallocate(outside, sizeof(outside), 16),
               arch_mock::HaltLoopCalled);
}
