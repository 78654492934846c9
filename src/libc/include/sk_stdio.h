/**
 * @copyright Copyright The HearthKernel Contributors
 * @brief sk_stdio 定义
 */

#ifndef HEARTHKERNEL_SRC_LIBC_INCLUDE_SK_STDIO_H_
#define HEARTHKERNEL_SRC_LIBC_INCLUDE_SK_STDIO_H_

#include <stdarg.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

/// 单字符输出，由串口驱动实现
extern void sk_putchar(int c, [[maybe_unused]] void* ctx);

int sk_printf(const char* format, ...) __attribute__((format(printf, 1, 2)));

int sk_snprintf(char* buffer, size_t bufsz, const char* format, ...)
    __attribute__((format(printf, 3, 4)));

int sk_vsnprintf(char* buffer, size_t bufsz, const char* format, va_list vlist)
    __attribute__((format(printf, 3, 0)));

#ifdef __cplusplus
}
#endif

#endif /* HEARTHKERNEL_SRC_LIBC_INCLUDE_SK_STDIO_H_ */
