/**
 * @copyright Copyright The HearthKernel Contributors
 * @brief 键盘输入任务
 */

#include "keyboard_task.hpp"

#include "kernel_log.hpp"
#include "sk_stdio.h"

auto KeyboardTask::Poll(Context& cx) -> PollResult {
  while (auto scancode = queue_.PollNext(cx)) {
    auto event = decoder_.Process(*scancode);
    if (!event || !event->pressed) {
      continue;
    }
    if (event->ascii != '\0') {
      sk_putchar(event->ascii, nullptr);
      echoed_++;
    } else {
      klog::Debug("KeyboardTask: key 0x%X%s\n", event->code,
                  event->extended ? " (extended)" : "");
    }
  }
  return PollResult::kPending;
}
