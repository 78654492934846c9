/**
 * @copyright Copyright The HearthKernel Contributors
 * @brief 全局描述符表与任务状态段
 */

#ifndef HEARTHKERNEL_SRC_ARCH_X86_64_INCLUDE_GDT_H_
#define HEARTHKERNEL_SRC_ARCH_X86_64_INCLUDE_GDT_H_

#include <cpu_io.h>

#include <array>
#include <cstddef>
#include <cstdint>

#include "kernel_config.hpp"

namespace gdt {

/// 64 位任务状态段
struct [[gnu::packed]] TaskStateSegment {
  uint32_t reserved0;
  /// 特权级切换时使用的栈
  std::array<uint64_t, 3> privilege_stack_table;
  uint64_t reserved1;
  /// 中断栈表，IDT 门描述符中的 IST 字段为下标 + 1
  std::array<uint64_t, 7> interrupt_stack_table;
  uint64_t reserved2;
  uint16_t reserved3;
  uint16_t iomap_base;
};
static_assert(sizeof(TaskStateSegment) == 104);

/// IST 项数
static constexpr size_t kIstCount = 7;

/// cpu_io 提供的代码/数据段描述符
using SegmentDescriptor =
    cpu_io::detail::register_info::GdtrInfo::SegmentDescriptor;
static_assert(sizeof(SegmentDescriptor) == sizeof(uint64_t));

/// @name 描述符下标，代码/数据段与 cpu_io 的定义一致
/// @{
static constexpr size_t kKernelCodeIndex =
    cpu_io::detail::register_info::GdtrInfo::kKernelCodeIndex;
static constexpr size_t kKernelDataIndex =
    cpu_io::detail::register_info::GdtrInfo::kKernelDataIndex;
/// TSS 描述符紧跟内核数据段，占两项
static constexpr size_t kTssIndex = kKernelDataIndex + 1;
/// @}

/// 段选择子
struct Selectors {
  uint16_t code;
  uint16_t data;
  uint16_t tss;
};

/**
 * @brief 编码 16 字节的 64 位 TSS 描述符
 * @param base TSS 线性地址
 * @param limit TSS 大小 - 1
 * @return std::array<uint64_t, 2> {低 8 字节, 高 8 字节}
 * @note cpu_io 只描述代码/数据段，系统段在这里手工编码
 */
[[nodiscard]] constexpr auto EncodeTssDescriptor(uint64_t base, uint32_t limit)
    -> std::array<uint64_t, 2> {
  uint64_t low = 0;
  low |= static_cast<uint64_t>(limit & 0xFFFF);
  low |= (base & 0xFF'FFFF) << 16;
  // P=1, DPL=0, type=0b1001 (可用的 64 位 TSS)
  low |= static_cast<uint64_t>(0x89) << 40;
  low |= static_cast<uint64_t>((limit >> 16) & 0xF) << 48;
  low |= ((base >> 24) & 0xFF) << 56;
  uint64_t high = base >> 32;
  return {low, high};
}

/**
 * @brief 全局描述符表
 * @details 依次包含空描述符、内核代码段、内核数据段与 TSS 描述符，
 * 前三项由 cpu_io 构造
 */
class GlobalDescriptorTable {
 public:
  /// 表项在内存中的布局，TSS 描述符紧接在段描述符之后
  struct Entries {
    std::array<SegmentDescriptor, kTssIndex> segments;
    std::array<uint64_t, 2> tss;
  };
  static_assert(offsetof(Entries, tss) == kTssIndex * sizeof(uint64_t));
  static_assert(sizeof(Entries) == (kTssIndex + 2) * sizeof(uint64_t));

  /**
   * @brief 构造函数
   * @param tss 描述符指向的 TSS，须在表的生命周期内有效
   */
  explicit GlobalDescriptorTable(const TaskStateSegment& tss);

  /// @name 构造/析构函数
  /// @{
  GlobalDescriptorTable(const GlobalDescriptorTable&) = delete;
  GlobalDescriptorTable(GlobalDescriptorTable&&) = delete;
  auto operator=(const GlobalDescriptorTable&)
      -> GlobalDescriptorTable& = delete;
  auto operator=(GlobalDescriptorTable&&) -> GlobalDescriptorTable& = delete;
  ~GlobalDescriptorTable() = default;
  /// @}

  [[nodiscard]] static constexpr auto selectors() -> Selectors {
    return {
        .code = static_cast<uint16_t>(kKernelCodeIndex * sizeof(uint64_t)),
        .data = static_cast<uint16_t>(kKernelDataIndex * sizeof(uint64_t)),
        .tss = static_cast<uint16_t>(kTssIndex * sizeof(uint64_t)),
    };
  }

  [[nodiscard]] auto entries() const -> const Entries& { return entries_; }

  /// lgdt 使用的描述符表寄存器值
  [[nodiscard]] auto Pointer() -> cpu_io::detail::register_info::GdtrInfo::Gdtr;

 private:
  alignas(16) Entries entries_{};
};

/**
 * @brief 构造带 IST 的 TSS
 * @param ist_stack_tops 各 IST 栈顶，0 表示不使用
 */
[[nodiscard]] auto MakeTaskStateSegment(
    const std::array<uint64_t, kIstCount>& ist_stack_tops) -> TaskStateSegment;

/**
 * @brief 建立并加载 GDT 与 TSS
 * @return Selectors 加载后使用的段选择子
 * @post CS/DS/ES/FS/GS/SS 已重新加载，TR 指向 TSS
 */
auto Init() -> Selectors;

/// 已加载的 TSS
[[nodiscard]] auto GetTaskStateSegment() -> const TaskStateSegment&;

/// 已加载的描述符表
[[nodiscard]] auto GetDescriptorTable() -> const GlobalDescriptorTable&;

/// 已加载的代码段选择子
[[nodiscard]] auto GetCodeSelector() -> uint16_t;

}  // namespace gdt

#endif /* HEARTHKERNEL_SRC_ARCH_X86_64_INCLUDE_GDT_H_ */
