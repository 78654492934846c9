/**
 * @copyright Copyright The HearthKernel Contributors
 * @brief x86_64 CPU 操作
 */

#include <cpu_io.h>

#include "arch.h"
#include "io.hpp"

namespace {
/// isa-debug-exit 设备端口
constexpr uint16_t kQemuExitPort = 0xF4;
/// 未使用的 POST 诊断端口
constexpr uint16_t kUnusedPort = 0x80;
}  // namespace

void EnableInterrupt() { cpu_io::EnableInterrupt(); }

void DisableInterrupt() { cpu_io::DisableInterrupt(); }

auto GetInterruptStatus() -> bool { return cpu_io::GetInterruptStatus(); }

void EnableInterruptAndHalt() { asm volatile("sti; hlt" ::: "memory"); }

void HaltLoop() {
  while (true) {
    asm volatile("cli; hlt" ::: "memory");
  }
}

void LoadGlobalDescriptorTable(
    cpu_io::detail::register_info::GdtrInfo::Gdtr gdtr, uint16_t code_selector,
    uint16_t data_selector, uint16_t tss_selector) {
  cpu_io::Gdtr::Write(gdtr);

  cpu_io::Ds::Write(data_selector);
  cpu_io::Es::Write(data_selector);
  cpu_io::Fs::Write(data_selector);
  cpu_io::Gs::Write(data_selector);
  cpu_io::Ss::Write(data_selector);
  cpu_io::Cs::Write(code_selector);

  // cpu_io 没有 TR 寄存器
  asm volatile("ltr %w0" : : "r"(tss_selector) : "memory");
}

void LoadInterruptTable(cpu_io::detail::register_info::IdtrInfo::Idtr idtr) {
  cpu_io::Idtr::Write(idtr);
}

void FlushTlbPage([[maybe_unused]] uint64_t virtual_addr) {
  cpu_io::virtual_memory::FlushTLBAll();
}

auto ReadPageTableRoot() -> uint64_t {
  return cpu_io::virtual_memory::PageAlign(
      cpu_io::virtual_memory::GetPageDirectory());
}

auto ReadFaultAddress() -> uint64_t { return cpu_io::Cr2::Read(); }

void ExitQemu(QemuExitCode exit_code) {
  io::Out32(kQemuExitPort, static_cast<uint32_t>(exit_code));
}

namespace io {

auto In8(uint16_t port) -> uint8_t { return cpu_io::In<uint8_t>(port); }

void Out8(uint16_t port, uint8_t value) { cpu_io::Out<uint8_t>(port, value); }

void Out32(uint16_t port, uint32_t value) {
  cpu_io::Out<uint32_t>(port, value);
}

void Wait() { cpu_io::Out<uint8_t>(kUnusedPort, 0); }

}  // namespace io
