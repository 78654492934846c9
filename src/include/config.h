/**
 * @copyright Copyright The HearthKernel Contributors
 * @brief 配置文件
 */

#ifndef HEARTHKERNEL_SRC_INCLUDE_CONFIG_H_
#define HEARTHKERNEL_SRC_INCLUDE_CONFIG_H_

#include "../project_config.h"

#endif /* HEARTHKERNEL_SRC_INCLUDE_CONFIG_H_ */
