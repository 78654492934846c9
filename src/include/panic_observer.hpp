/**
 * @copyright Copyright The HearthKernel Contributors
 * @brief Panic event observer interface (etl::observer pattern)
 */

#ifndef HEARTHKERNEL_SRC_INCLUDE_PANIC_OBSERVER_HPP_
#define HEARTHKERNEL_SRC_INCLUDE_PANIC_OBSERVER_HPP_

#include <etl/observer.h>
#include <etl/singleton.h>

#include <cstdint>

#include "kernel_config.hpp"

/// @brief 致命错误类型
enum class FaultKind : uint8_t {
  kDivideError,
  kDoubleFault,
  kGeneralProtection,
  kPageFault,
  kUnhandledInterrupt,
  kAllocationError,
  kFrameExhausted,
  kAssertion,
  kExplicit,
};

/// 获取致命错误类型名称
constexpr auto GetFaultKindName(FaultKind kind) -> const char* {
  switch (kind) {
    case FaultKind::kDivideError:
      return "DIVIDE ERROR";
    case FaultKind::kDoubleFault:
      return "DOUBLE FAULT";
    case FaultKind::kGeneralProtection:
      return "GENERAL PROTECTION FAULT";
    case FaultKind::kPageFault:
      return "PAGE FAULT";
    case FaultKind::kUnhandledInterrupt:
      return "UNHANDLED INTERRUPT";
    case FaultKind::kAllocationError:
      return "ALLOCATION ERROR";
    case FaultKind::kFrameExhausted:
      return "FRAME EXHAUSTED";
    case FaultKind::kAssertion:
      return "ASSERTION FAILED";
    case FaultKind::kExplicit:
      return "PANIC";
    default:
      return "UNKNOWN";
  }
}

/// @brief Panic event payload
struct PanicEvent {
  FaultKind kind;
  const char* reason;
  /// 出错的地址（缺页时为 CR2，分配失败时为请求大小）
  uint64_t address;
  /// CPU 压入的错误码，没有时为 0
  uint64_t error_code;
  /// 出错指令地址
  uint64_t pc;
  /// 出错时的栈指针
  uint64_t sp;
};

/// @brief Observer interface for panic events
using IPanicObserver = etl::observer<PanicEvent>;

/// @brief Observable base for panic event publishers
using PanicObservable =
    etl::observable<IPanicObserver, kernel::config::kPanicObservers>;

/// @brief 全局 panic 事件发布者
class PanicNotifier : public PanicObservable {};

using PanicNotifierSingleton = etl::singleton<PanicNotifier>;

#endif  // HEARTHKERNEL_SRC_INCLUDE_PANIC_OBSERVER_HPP_
