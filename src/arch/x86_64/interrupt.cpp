/**
 * @copyright Copyright The HearthKernel Contributors
 * @brief 中断描述符表与分发
 */

#include "interrupt.h"

#include "arch.h"
#include "kernel.h"
#include "kernel_config.hpp"
#include "kernel_log.hpp"
#include "pic8259a.h"

namespace {

using cpu_io::detail::register_info::IdtrInfo;

auto DefaultHandler(uint64_t cause, InterruptContext* context) -> uint64_t {
  auto* frame = context != nullptr ? context->frame : nullptr;
  Panic(PanicEvent{
      .kind = FaultKind::kUnhandledInterrupt,
      .reason = Interrupt::GetVectorName(cause),
      .address = cause,
      .error_code = context != nullptr ? context->error_code : 0,
      .pc = frame != nullptr ? frame->rip : 0,
      .sp = frame != nullptr ? frame->rsp : 0,
  });
}

}  // namespace

Interrupt::Interrupt() { interrupt_handlers_.fill(DefaultHandler); }

auto Interrupt::GetVectorName(uint64_t cause) -> const char* {
  if (cause < kVectorCount) {
    return IdtrInfo::kInterruptNames[cause];
  }
  return "Invalid Vector";
}

void Interrupt::Do(uint64_t cause, InterruptContext* context) {
  if (cause >= kVectorCount) {
    return;
  }
  auto vector = static_cast<uint8_t>(cause);
  fired_counts_[vector]++;

  PIC8259A* pic = nullptr;
  if (PicSingleton::IsReady() &&
      PicSingleton::Instance().HandlesInterrupt(vector)) {
    pic = &PicSingleton::Instance();
    pic->BeginInterrupt(vector);
  }

  interrupt_handlers_[vector](cause, context);

  if (pic != nullptr) {
    pic->CheckEndOfInterrupt(vector);
  }
}

auto Interrupt::RegisterInterruptFunc(uint64_t cause, InterruptFunc func)
    -> Expected<void> {
  if (locked_) {
    klog::Warn("RegisterInterruptFunc [%s] 0x%lX after IDT load\n",
               GetVectorName(cause), cause);
    return std::unexpected(Error(ErrorCode::kIdtLocked));
  }
  if (cause >= kVectorCount || func == nullptr) {
    return std::unexpected(Error(ErrorCode::kInvalidArgument));
  }
  interrupt_handlers_[cause] = func;
  klog::Debug("RegisterInterruptFunc [%s] 0x%lX, 0x%p\n", GetVectorName(cause),
              cause, reinterpret_cast<void*>(func));
  return {};
}

auto Interrupt::SetStackIndex(uint8_t vector, uint8_t ist_index)
    -> Expected<void> {
  if (locked_) {
    return std::unexpected(Error(ErrorCode::kIdtLocked));
  }
  if (ist_index >= 7) {
    return std::unexpected(Error(ErrorCode::kIdtInvalidStackIndex));
  }
  stack_indexes_[vector] = static_cast<uint8_t>(ist_index + 1);
  return {};
}

auto Interrupt::Load(const EntryTable& entries, uint16_t code_selector)
    -> Expected<void> {
  if (locked_) {
    return std::unexpected(Error(ErrorCode::kIdtLocked));
  }
  if (stack_indexes_[kDoubleFault] == 0) {
    klog::Err("IDT: double fault gate has no IST stack\n");
    return std::unexpected(Error(ErrorCode::kIdtMissingStack));
  }

  for (size_t vector = 0; vector < kVectorCount; vector++) {
    idts_[vector] = IdtGate(entries[vector], code_selector,
                            stack_indexes_[vector],
                            IdtGate::Type::k64BitInterruptGate,
                            IdtGate::DPL::kRing0, IdtGate::P::kPresent);
  }
  LoadInterruptTable(IdtrInfo::Idtr{
      .limit = static_cast<uint16_t>(sizeof(IdtGate) * kVectorCount - 1),
      .base = idts_.data(),
  });
  locked_ = true;

  klog::Info("IDT loaded at 0x%p, double fault uses IST %d\n",
             static_cast<const void*>(idts_.data()),
             stack_indexes_[kDoubleFault] - 1);
  return {};
}
