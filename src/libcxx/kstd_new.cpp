/**
 * @copyright Copyright The HearthKernel Contributors
 */

#include <cstddef>
#include <cstdint>
#include <new>

#include "kernel.h"
#include "sk_stdlib.h"

namespace {

/// 分配失败不可恢复，报告请求大小与对齐后停机
[[noreturn]] void AllocationError(size_t size, size_t alignment) {
  Panic(PanicEvent{
      .kind = FaultKind::kAllocationError,
      .reason = "heap exhausted",
      .address = size,
      .error_code = alignment,
      .pc = reinterpret_cast<uint64_t>(__builtin_return_address(0)),
      .sp = reinterpret_cast<uint64_t>(__builtin_frame_address(0)),
  });
}

auto AllocateOrPanic(size_t size, size_t alignment) -> void* {
  if (size == 0) {
    size = 1;
  }
  void* ptr = alignment <= alignof(std::max_align_t)
                  ? malloc(size)
                  : aligned_alloc(alignment, size);
  if (ptr == nullptr) {
    AllocationError(size, alignment);
  }
  return ptr;
}

}  // namespace

void* operator new(size_t size) {
  return AllocateOrPanic(size, alignof(std::max_align_t));
}

void* operator new[](size_t size) {
  return AllocateOrPanic(size, alignof(std::max_align_t));
}

void* operator new(size_t size, std::align_val_t alignment) {
  return AllocateOrPanic(size, static_cast<size_t>(alignment));
}

void* operator new[](size_t size, std::align_val_t alignment) {
  return AllocateOrPanic(size, static_cast<size_t>(alignment));
}

void operator delete(void* ptr) noexcept { free(ptr); }

void operator delete(void* ptr, size_t) noexcept { free(ptr); }

void operator delete[](void* ptr) noexcept { free(ptr); }

void operator delete[](void* ptr, size_t) noexcept { free(ptr); }

void operator delete(void* ptr, std::align_val_t) noexcept { free(ptr); }

void operator delete[](void* ptr, std::align_val_t) noexcept { free(ptr); }

void operator delete(void* ptr, size_t, std::align_val_t) noexcept {
  free(ptr);
}

void operator delete[](void* ptr, size_t, std::align_val_t) noexcept {
  free(ptr);
}
