/**
 * @copyright Copyright The HearthKernel Contributors
 */

#ifndef HEARTHKERNEL_SRC_INCLUDE_BOOT_INFO_HPP_
#define HEARTHKERNEL_SRC_INCLUDE_BOOT_INFO_HPP_

#include <cstddef>
#include <cstdint>
#include <span>

// 引用链接脚本中的变量
/// @see http://wiki.osdev.org/Using_Linker_Script_Values
/// 内核开始
extern "C" void* __executable_start[];
/// 代码段结束
extern "C" void* __etext[];
/// 内核结束
extern "C" void* end[];

/// 内存区域类型
enum class MemoryRegionKind : uint32_t {
  /// 可供内核使用
  kUsable = 0,
  /// 固件保留
  kReserved = 1,
  /// 引导程序使用（内核镜像、页表、BootInfo）
  kBootloader = 2,
};

/// 物理内存区域 [start, end)
struct MemoryRegion {
  uint64_t start;
  uint64_t end;
  MemoryRegionKind kind;
};

/**
 * @brief 引导程序交给内核的信息
 * @note 由引导程序构造，内核只读取一次
 */
struct BootInfo {
  /// 内存映射
  const MemoryRegion* memory_regions;
  /// 内存映射项数
  size_t memory_region_count;

  /// 全部物理内存被线性映射到的虚拟地址偏移
  uint64_t physical_memory_offset;

  /// 内核 ELF 镜像物理地址
  uint64_t kernel_addr;
  /// 内核 ELF 镜像大小
  size_t kernel_len;

  [[nodiscard]] auto Regions() const -> std::span<const MemoryRegion> {
    return {memory_regions, memory_region_count};
  }
};

#endif  // HEARTHKERNEL_SRC_INCLUDE_BOOT_INFO_HPP_
