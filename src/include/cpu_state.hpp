/**
 * @copyright Copyright The HearthKernel Contributors
 * @brief 单核 CPU 状态
 */

#ifndef HEARTHKERNEL_SRC_INCLUDE_CPU_STATE_HPP_
#define HEARTHKERNEL_SRC_INCLUDE_CPU_STATE_HPP_

#include <cstddef>
#include <cstdint>

namespace cpu_state {

class CpuState {
 public:
  /// 中断嵌套深度
  int64_t noff_{0};
  /// 第一次关中断前的中断状态
  bool intr_enable_{false};

  /// @name 构造/析构函数
  /// @{
  CpuState() = default;
  CpuState(const CpuState&) = delete;
  CpuState(CpuState&&) = delete;
  auto operator=(const CpuState&) -> CpuState& = delete;
  auto operator=(CpuState&&) -> CpuState& = delete;
  ~CpuState() = default;
  /// @}
};

/// 仅支持单核，全局唯一
inline CpuState g_cpu_state;

__always_inline auto GetCurrentCore() -> CpuState& { return g_cpu_state; }

}  // namespace cpu_state

#endif /* HEARTHKERNEL_SRC_INCLUDE_CPU_STATE_HPP_ */
