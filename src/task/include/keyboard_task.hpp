/**
 * @copyright Copyright The HearthKernel Contributors
 * @brief 键盘输入任务
 */

#ifndef HEARTHKERNEL_SRC_TASK_INCLUDE_KEYBOARD_TASK_HPP_
#define HEARTHKERNEL_SRC_TASK_INCLUDE_KEYBOARD_TASK_HPP_

#include <cstddef>

#include "event_queue.hpp"
#include "scancode_decoder.h"
#include "task.hpp"

/**
 * @brief 消费扫描码队列，解码后回显字符
 * @note 永不完成，队列为空时挂起等待键盘中断
 */
class KeyboardTask : public Task {
 public:
  explicit KeyboardTask(ScancodeQueue& queue)
      : Task("keyboard"), queue_(queue) {}

  auto Poll(Context& cx) -> PollResult override;

  /// 已回显的字符数
  [[nodiscard]] auto echoed() const -> size_t { return echoed_; }

 private:
  ScancodeQueue& queue_;
  ScancodeDecoder decoder_;
  size_t echoed_{0};
};

#endif  // HEARTHKERNEL_SRC_TASK_INCLUDE_KEYBOARD_TASK_HPP_
