/**
 * @copyright Copyright The HearthKernel Contributors
 * @brief 中断入口桩
 */

#include <utility>

#include "interrupt.h"

namespace {

/// CPU 会额外压入错误码的异常向量
constexpr auto HasErrorCode(size_t no) -> bool {
  return no == 8 || (no >= 10 && no <= 14) || no == 17 || no == 21 ||
         no == 29 || no == 30;
}

/**
 * @brief 中断处理函数
 * @tparam no 中断号
 * @param frame CPU 压入的栈帧
 */
template <uint8_t no>
__attribute__((target("general-regs-only"))) __attribute__((interrupt)) void
TarpEntry(InterruptFrame* frame) {
  InterruptContext context{
      .frame = frame, .error_code = 0, .has_error_code = false};
  InterruptSingleton::Instance().Do(no, &context);
}

/**
 * @brief 带错误码的中断处理函数
 * @tparam no 中断号
 * @param frame CPU 压入的栈帧
 * @param error_code CPU 压入的错误码
 */
template <uint8_t no>
__attribute__((target("general-regs-only"))) __attribute__((interrupt)) void
TarpEntryWithErrorCode(InterruptFrame* frame, uint64_t error_code) {
  InterruptContext context{
      .frame = frame, .error_code = error_code, .has_error_code = true};
  InterruptSingleton::Instance().Do(no, &context);
}

template <size_t no>
auto EntryAddress() -> uint64_t {
  if constexpr (HasErrorCode(no)) {
    return reinterpret_cast<uint64_t>(
        TarpEntryWithErrorCode<static_cast<uint8_t>(no)>);
  } else {
    return reinterpret_cast<uint64_t>(TarpEntry<static_cast<uint8_t>(no)>);
  }
}

/// 用 index_sequence 展开，避免递归模板过深
template <size_t... kNos>
auto MakeEntryTable(std::index_sequence<kNos...>) -> Interrupt::EntryTable {
  return {EntryAddress<kNos>()...};
}

}  // namespace

auto GetInterruptEntryTable() -> const Interrupt::EntryTable& {
  static const auto table =
      MakeEntryTable(std::make_index_sequence<Interrupt::kVectorCount>{});
  return table;
}
