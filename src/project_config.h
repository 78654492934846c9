/**
 * @copyright Copyright The HearthKernel Contributors
 * @brief project_config 头文件，开关由 cmake 以编译定义传入
 */

#ifndef HEARTHKERNEL_SRC_PROJECT_CONFIG_H_
#define HEARTHKERNEL_SRC_PROJECT_CONFIG_H_

#include <cstdint>

#ifdef HEARTHKERNEL_DEBUG
static constexpr const auto kHearthKernelDebugLog = true;
#else
static constexpr const auto kHearthKernelDebugLog = false;
#endif

#endif /* HEARTHKERNEL_SRC_PROJECT_CONFIG_H_ */
