/**
 * @copyright Copyright The HearthKernel Contributors
 * @brief 端口 I/O
 */

#ifndef HEARTHKERNEL_SRC_INCLUDE_IO_HPP_
#define HEARTHKERNEL_SRC_INCLUDE_IO_HPP_

#include <cstdint>

namespace io {

/**
 * @brief 从端口读取一个字节
 * @param port 端口号
 * @return uint8_t 读到的数据
 */
[[nodiscard]] auto In8(uint16_t port) -> uint8_t;

/**
 * @brief 向端口写入一个字节
 * @param port 端口号
 * @param value 数据
 */
void Out8(uint16_t port, uint8_t value);

/**
 * @brief 向端口写入 32 位数据
 * @param port 端口号
 * @param value 数据
 */
void Out32(uint16_t port, uint32_t value);

/// 写未使用的 0x80 端口，给老设备留出处理时间
void Wait();

}  // namespace io

#endif  // HEARTHKERNEL_SRC_INCLUDE_IO_HPP_
