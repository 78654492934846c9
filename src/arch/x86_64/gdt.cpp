/**
 * @copyright Copyright The HearthKernel Contributors
 * @brief 全局描述符表与任务状态段
 */

#include "gdt.h"

#include "arch.h"
#include "kernel_log.hpp"

namespace gdt {

namespace {

using cpu_io::detail::register_info::GdtrInfo;

/// 双重错误专用栈，生命周期与内核相同
alignas(16) std::array<uint8_t, kernel::config::kIstStackSize>
    double_fault_stack{};

TaskStateSegment tss{};
GlobalDescriptorTable table{tss};

/// 内核段描述符，只有类型不同
auto MakeKernelSegment(SegmentDescriptor::Type type) -> SegmentDescriptor {
  return SegmentDescriptor(type, SegmentDescriptor::S::kCodeData,
                           SegmentDescriptor::DPL::kRing0,
                           SegmentDescriptor::P::kPresent,
                           SegmentDescriptor::AVL::kNotAvailable,
                           SegmentDescriptor::L::k64Bit);
}

}  // namespace

GlobalDescriptorTable::GlobalDescriptorTable(const TaskStateSegment& segment) {
  // 第 0 项为空描述符
  entries_.segments[0] = SegmentDescriptor();
  entries_.segments[kKernelCodeIndex] =
      MakeKernelSegment(SegmentDescriptor::Type::kCodeExecuteRead);
  entries_.segments[kKernelDataIndex] =
      MakeKernelSegment(SegmentDescriptor::Type::kDataReadWrite);
  entries_.tss =
      EncodeTssDescriptor(reinterpret_cast<uint64_t>(&segment),
                          static_cast<uint32_t>(sizeof(TaskStateSegment) - 1));
}

auto GlobalDescriptorTable::Pointer() -> GdtrInfo::Gdtr {
  return GdtrInfo::Gdtr{
      .limit = static_cast<uint16_t>(sizeof(Entries) - 1),
      .base = entries_.segments.data(),
  };
}

auto MakeTaskStateSegment(const std::array<uint64_t, kIstCount>& ist_stack_tops)
    -> TaskStateSegment {
  TaskStateSegment segment{};
  segment.interrupt_stack_table = ist_stack_tops;
  // 没有 I/O 许可位图
  segment.iomap_base = sizeof(TaskStateSegment);
  return segment;
}

auto Init() -> Selectors {
  std::array<uint64_t, kIstCount> ist{};
  ist[kernel::config::kDoubleFaultIstIndex] =
      reinterpret_cast<uint64_t>(double_fault_stack.data()) +
      double_fault_stack.size();
  tss = MakeTaskStateSegment(ist);

  auto selectors = GlobalDescriptorTable::selectors();
  LoadGlobalDescriptorTable(table.Pointer(), selectors.code, selectors.data,
                            selectors.tss);

  klog::Info("GDT loaded: code 0x%X, data 0x%X, tss 0x%X, ist[%d] top 0x%lX\n",
             selectors.code, selectors.data, selectors.tss,
             kernel::config::kDoubleFaultIstIndex,
             ist[kernel::config::kDoubleFaultIstIndex]);
  return selectors;
}

auto GetTaskStateSegment() -> const TaskStateSegment& { return tss; }

auto GetDescriptorTable() -> const GlobalDescriptorTable& { return table; }

auto GetCodeSelector() -> uint16_t {
  return GlobalDescriptorTable::selectors().code;
}

}  // namespace gdt
