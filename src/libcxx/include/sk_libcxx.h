/**
 * @copyright Copyright The HearthKernel Contributors
 */

#ifndef HEARTHKERNEL_SRC_LIBCXX_INCLUDE_SK_LIBCXX_H_
#define HEARTHKERNEL_SRC_LIBCXX_INCLUDE_SK_LIBCXX_H_

#include <cstdint>

/**
 * @brief 构造 c++ 全局对象
 * @note 必须在任何全局对象被使用前调用
 */
void CppInit();

#endif /* HEARTHKERNEL_SRC_LIBCXX_INCLUDE_SK_LIBCXX_H_ */
