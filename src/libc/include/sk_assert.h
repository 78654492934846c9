/**
 * @copyright Copyright The HearthKernel Contributors
 */

#ifndef HEARTHKERNEL_SRC_LIBC_INCLUDE_SK_ASSERT_H_
#define HEARTHKERNEL_SRC_LIBC_INCLUDE_SK_ASSERT_H_

#include "kernel.h"
#include "kernel_log.hpp"

/**
 * @brief 运行时断言宏
 * @param expr 断言表达式
 * @note 断言失败时打印错误信息并进入 panic
 */
#define sk_assert(expr)                                                       \
  do {                                                                        \
    if (!(expr)) {                                                            \
      klog::Err("\n[ASSERT FAILED] %s:%d in %s\n Expression: %s\n", __FILE__, \
                __LINE__, __PRETTY_FUNCTION__, #expr);                        \
      Panic(PanicEvent{FaultKind::kAssertion, #expr, 0, 0, 0, 0});            \
    }                                                                         \
  } while (0)

/**
 * @brief 带自定义消息的运行时断言宏（支持变长参数）
 * @param expr 断言表达式
 * @param fmt 格式化字符串
 * @param ... 格式化参数
 */
#define sk_assert_msg(expr, fmt, ...)                                      \
  do {                                                                     \
    if (!(expr)) {                                                         \
      klog::Err(                                                           \
          "\n[ASSERT FAILED] %s:%d in %s\n Expression: %s\n Message: " fmt \
          "\n",                                                            \
          __FILE__, __LINE__, __PRETTY_FUNCTION__, #expr, ##__VA_ARGS__);  \
      Panic(PanicEvent{FaultKind::kAssertion, #expr, 0, 0, 0, 0});         \
    }                                                                      \
  } while (0)

#endif /* HEARTHKERNEL_SRC_LIBC_INCLUDE_SK_ASSERT_H_ */
