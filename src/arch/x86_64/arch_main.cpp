/**
 * @copyright Copyright The HearthKernel Contributors
 * @brief arch_main cpp
 */

#include <cpu_io.h>
#include <etl/singleton.h>

#include <cstdint>
#include <span>
#include <utility>

#include "arch.h"
#include "boot_info.hpp"
#include "gdt.h"
#include "kernel_elf.hpp"
#include "kernel_log.hpp"

using SerialSingleton = etl::singleton<cpu_io::Serial>;

namespace {
// 基本输出实现
cpu_io::Serial* serial = nullptr;
}  // namespace

extern "C" void sk_putchar(int c, [[maybe_unused]] void* ctx) {
  if (serial) {
    serial->Write(c);
  }
}

void ArchInit(const BootInfo& boot_info) {
  SerialSingleton::create(cpu_io::kCom1);
  serial = &SerialSingleton::instance();

  klog::Info("Kernel image 0x%lX (%zu bytes), physical memory offset 0x%lX\n",
             boot_info.kernel_addr, boot_info.kernel_len,
             boot_info.physical_memory_offset);

  // 设置 GDT、TSS 和段寄存器
  gdt::Init();

  // 解析内核 elf 信息，失败时回溯只打印地址
  std::span<const uint8_t> image(
      reinterpret_cast<const uint8_t*>(boot_info.physical_memory_offset +
                                       boot_info.kernel_addr),
      boot_info.kernel_len);
  auto result = KernelElf::Parse(image).and_then([](KernelElf elf) {
    return KernelElfSingleton::Create(std::move(elf));
  });
  if (!result) {
    klog::Warn("KernelElf: %s, backtraces will not be symbolized\n",
               result.error().message());
  }

  klog::Info("Hello x86_64 ArchInit\n");
}
