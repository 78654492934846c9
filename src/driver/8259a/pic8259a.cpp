/**
 * @copyright Copyright The HearthKernel Contributors
 * @brief 8259a 驱动
 */

#include "pic8259a.h"

#include "io.hpp"
#include "kernel_log.hpp"

auto PIC8259A::Initialize(uint8_t offset_master, uint8_t offset_slave)
    -> Expected<void> {
  auto valid = [](uint8_t offset) {
    return offset >= 32 && offset % kLinesPerChip == 0 &&
           offset <= 0xFF - (kLinesPerChip - 1);
  };
  auto overlap = offset_master < offset_slave + kLinesPerChip &&
                 offset_slave < offset_master + kLinesPerChip;
  if (!valid(offset_master) || !valid(offset_slave) || overlap) {
    klog::Err("PIC8259A: invalid offsets %d/%d\n", offset_master,
              offset_slave);
    return std::unexpected(Error(ErrorCode::kPicInvalidOffset));
  }

  auto mask_master = io::In8(kMasterData);
  auto mask_slave = io::In8(kSlaveData);

  // ICW1: 开始初始化，需要 ICW4
  io::Out8(kMasterCommand, kIcw1Init | kIcw1Icw4);
  io::Wait();
  io::Out8(kSlaveCommand, kIcw1Init | kIcw1Icw4);
  io::Wait();

  // ICW2: 向量偏移
  io::Out8(kMasterData, offset_master);
  io::Wait();
  io::Out8(kSlaveData, offset_slave);
  io::Wait();

  // ICW3: 级联方式
  io::Out8(kMasterData, 1 << kCascadeIrq);
  io::Wait();
  io::Out8(kSlaveData, kCascadeIrq);
  io::Wait();

  // ICW4: 8086 模式
  io::Out8(kMasterData, kIcw4Mode8086);
  io::Wait();
  io::Out8(kSlaveData, kIcw4Mode8086);
  io::Wait();

  io::Out8(kMasterData, mask_master);
  io::Out8(kSlaveData, mask_slave);

  offsets_ = {offset_master, offset_slave};
  in_service_.fill(false);
  initialized_ = true;

  klog::Info("PIC8259A remapped to 0x%X/0x%X\n", offset_master, offset_slave);
  return {};
}

auto PIC8259A::IrqOf(uint8_t vector) const -> int {
  if (!initialized_) {
    return -1;
  }
  for (size_t chip = 0; chip < offsets_.size(); chip++) {
    if (vector >= offsets_[chip] && vector < offsets_[chip] + kLinesPerChip) {
      return static_cast<int>(chip * kLinesPerChip + (vector - offsets_[chip]));
    }
  }
  return -1;
}

auto PIC8259A::HandlesInterrupt(uint8_t vector) const -> bool {
  return IrqOf(vector) >= 0;
}

void PIC8259A::BeginInterrupt(uint8_t vector) {
  auto irq = IrqOf(vector);
  if (irq < 0) {
    return;
  }
  // 上一次处理未发送 EOI 时控制器不会再投递同一中断线
  if (in_service_[irq]) {
    missed_eoi_count_++;
    klog::Err("PIC8259A: vector 0x%X delivered while still in service\n",
              vector);
  }
  in_service_[irq] = true;
}

void PIC8259A::NotifyEndOfInterrupt(uint8_t vector) {
  auto irq = IrqOf(vector);
  if (irq < 0) {
    return;
  }
  if (irq >= kLinesPerChip) {
    io::Out8(kSlaveCommand, kEndOfInterrupt);
  }
  io::Out8(kMasterCommand, kEndOfInterrupt);
  in_service_[irq] = false;
}

auto PIC8259A::IsInService(uint8_t vector) const -> bool {
  auto irq = IrqOf(vector);
  return irq >= 0 && in_service_[irq];
}

auto PIC8259A::CheckEndOfInterrupt(uint8_t vector) -> bool {
  if (!IsInService(vector)) {
    return false;
  }
  missed_eoi_count_++;
  klog::Err("PIC8259A: handler for vector 0x%X returned without EOI\n",
            vector);
  NotifyEndOfInterrupt(vector);
  return true;
}

void PIC8259A::SetMask(uint8_t irq) {
  auto port = irq < kLinesPerChip ? kMasterData : kSlaveData;
  auto line = irq % kLinesPerChip;
  io::Out8(port, io::In8(port) | static_cast<uint8_t>(1U << line));
}

void PIC8259A::ClearMask(uint8_t irq) {
  auto port = irq < kLinesPerChip ? kMasterData : kSlaveData;
  auto line = irq % kLinesPerChip;
  io::Out8(port, io::In8(port) & static_cast<uint8_t>(~(1U << line)));
}

void PIC8259A::DisableAll() {
  io::Out8(kMasterData, 0xFF);
  io::Out8(kSlaveData, 0xFF);
}
