/**
 * @copyright Copyright The HearthKernel Contributors
 * @brief 栈回溯实现
 */

#include <cpu_io.h>

#include <array>
#include <cstdint>

#include "arch.h"
#include "boot_info.hpp"
#include "kernel_elf.hpp"
#include "kernel_log.hpp"

namespace {

auto backtrace(std::array<uint64_t, kMaxFrameCount>& buffer) -> int {
  auto* rbp = reinterpret_cast<uint64_t*>(cpu_io::Rbp::Read());
  size_t count = 0;
  // 返回地址必须落在代码段内，SwitchStack 把 rbp 清零作为终点
  while ((rbp != nullptr) && count < buffer.max_size()) {
    auto rip = *(rbp + 1);
    if (rip < reinterpret_cast<uint64_t>(__executable_start) ||
        rip > reinterpret_cast<uint64_t>(__etext)) {
      break;
    }
    buffer[count++] = rip;
    rbp = reinterpret_cast<uint64_t*>(*rbp);
  }

  return int(count);
}

}  // namespace

void DumpStack() {
  std::array<uint64_t, kMaxFrameCount> buffer{};

  // 获取调用栈中的地址
  auto num_frames = backtrace(buffer);

  for (auto current_frame_idx = 0; current_frame_idx < num_frames;
       current_frame_idx++) {
    auto addr = buffer[current_frame_idx];
    if (!KernelElfSingleton::IsReady()) {
      klog::Err("[%d] 0x%lX\n", current_frame_idx, addr);
      continue;
    }
    // 打印函数名
    if (auto sym = KernelElfSingleton::Instance().LookupSymbol(addr)) {
      klog::Err("[%d] 0x%lX %s+0x%lX\n", current_frame_idx, addr, sym->name,
                sym->offset);
    } else {
      klog::Err("[%d] 0x%lX ???\n", current_frame_idx, addr);
    }
  }
}
