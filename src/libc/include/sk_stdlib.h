/**
 * @copyright Copyright The HearthKernel Contributors
 */

#ifndef HEARTHKERNEL_SRC_LIBC_INCLUDE_SK_STDLIB_H_
#define HEARTHKERNEL_SRC_LIBC_INCLUDE_SK_STDLIB_H_

#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

void* malloc(size_t size);
void free(void* ptr);
void* calloc(size_t num, size_t size);
void* aligned_alloc(size_t alignment, size_t size);

#ifdef __cplusplus
}
#endif

#endif /* HEARTHKERNEL_SRC_LIBC_INCLUDE_SK_STDLIB_H_ */
