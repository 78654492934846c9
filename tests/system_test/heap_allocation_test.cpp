/**
 * @copyright Copyright The HearthKernel Contributors
 */

#include <cstddef>
#include <cstdint>
#include <cstring>

#include "heap_allocator.hpp"
#include "kernel_config.hpp"
#include "system_test.h"

auto simple_allocation_test() -> bool {
  auto* heap_value_1 = new uint64_t(41);
  auto* heap_value_2 = new uint64_t(13);
  EXPECT_EQ(*heap_value_1, 41, "first box");
  EXPECT_EQ(*heap_value_2, 13, "second box");
  EXPECT_NE(heap_value_1, heap_value_2, "boxes share storage");
  delete heap_value_1;
  delete heap_value_2;
  return true;
}

auto large_vec_test() -> bool {
  constexpr size_t kCount = 1000;
  size_t capacity = 1;
  size_t size = 0;
  auto* data = new uint64_t[capacity];

  // 按倍数扩容，每次扩容都搬移已有元素
  for (uint64_t i = 0; i < kCount; i++) {
    if (size == capacity) {
      auto* grown = new uint64_t[capacity * 2];
      std::memcpy(grown, data, size * sizeof(uint64_t));
      delete[] data;
      data = grown;
      capacity *= 2;
    }
    data[size++] = i;
  }

  uint64_t sum = 0;
  for (size_t i = 0; i < size; i++) {
    sum += data[i];
  }
  delete[] data;
  EXPECT_EQ(sum, (kCount - 1) * kCount / 2, "vector sum");
  return true;
}

auto bulk_allocation_test() -> bool {
  constexpr size_t kSize = kernel::config::kHeapSize / 2;
  auto* block = new uint8_t[kSize];
  for (size_t i = 0; i < kSize; i++) {
    block[i] = static_cast<uint8_t>(i);
  }
  for (size_t i = 0; i < kSize; i++) {
    if (block[i] != static_cast<uint8_t>(i)) {
      sk_printf("FAIL: bulk block corrupted at %lu.\n", i);
      delete[] block;
      return false;
    }
  }
  delete[] block;
  return true;
}

auto many_boxes_test() -> bool {
  // 总量超过堆大小，只有回收复用才能完成
  for (uint64_t i = 0; i < kernel::config::kHeapSize; i++) {
    auto* x = new uint64_t(i);
    EXPECT_EQ(*x, i, "box value");
    delete x;
  }
  return true;
}

auto many_boxes_long_lived_test() -> bool {
  auto* long_lived = new uint64_t(1);
  for (uint64_t i = 0; i < kernel::config::kHeapSize; i++) {
    auto* x = new uint64_t(i);
    EXPECT_EQ(*x, i, "box value");
    delete x;
  }
  EXPECT_EQ(*long_lived, 1, "long lived box overwritten");
  delete long_lived;
  return true;
}

auto fragmented_heap_test() -> bool {
  constexpr size_t kChunks = 64;
  constexpr size_t kChunkSize = 512;
  auto& heap = HeapSingleton::Instance();
  auto free_before = heap.FreeBytes();

  uint8_t* chunks[kChunks];
  for (auto& chunk : chunks) {
    chunk = new uint8_t[kChunkSize];
  }
  // 先释放间隔的块制造碎片
  for (size_t i = 0; i < kChunks; i += 2) {
    delete[] chunks[i];
  }
  EXPECT_TRUE(heap.FreeBlocks() > 1, "heap not fragmented");
  for (size_t i = 1; i < kChunks; i += 2) {
    delete[] chunks[i];
  }
  EXPECT_EQ(heap.FreeBytes(), free_before, "freed bytes not returned");

  // 相邻空闲块合并后才能放下大块
  auto* large = new uint8_t[kChunks * kChunkSize];
  std::memset(large, 0xA5, kChunks * kChunkSize);
  delete[] large;
  EXPECT_EQ(heap.FreeBytes(), free_before, "large block leaked");
  return true;
}
