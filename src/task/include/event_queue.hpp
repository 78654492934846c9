/**
 * @copyright Copyright The HearthKernel Contributors
 * @brief 中断到任务的事件队列
 */

#ifndef HEARTHKERNEL_SRC_TASK_INCLUDE_EVENT_QUEUE_HPP_
#define HEARTHKERNEL_SRC_TASK_INCLUDE_EVENT_QUEUE_HPP_

#include <MPMCQueue.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>

#include "kernel_config.hpp"
#include "once.hpp"
#include "task.hpp"
#include "waker.hpp"

/**
 * @brief 有界无锁事件队列
 * @details 中断处理程序调用 Push，任务调用 Pop/PollNext。
 * 队列本身不加锁，只有 Waker 槽由关中断自旋锁保护
 * @tparam T 事件类型
 * @tparam Capacity 容量，必须是 2 的幂
 */
template <typename T, size_t Capacity>
class EventQueue {
 public:
  /// @name 构造/析构函数
  /// @{
  EventQueue() = default;
  EventQueue(const EventQueue&) = delete;
  EventQueue(EventQueue&&) = delete;
  auto operator=(const EventQueue&) -> EventQueue& = delete;
  auto operator=(EventQueue&&) -> EventQueue& = delete;
  ~EventQueue() = default;
  /// @}

  /**
   * @brief 放入事件，只在中断上下文调用
   * @param event 事件
   * @return false 队列已满，事件被丢弃并计数
   * @note 不阻塞，不分配内存
   */
  auto Push(const T& event) -> bool {
    if (!queue_.push(event)) {
      dropped_.fetch_add(1, std::memory_order_relaxed);
      return false;
    }
    waker_.Wake();
    return true;
  }

  /**
   * @brief 取出事件
   * @return std::optional<T> 队列为空时返回空
   */
  auto Pop() -> std::optional<T> {
    T event{};
    if (queue_.pop(event)) {
      return event;
    }
    return std::nullopt;
  }

  /**
   * @brief 异步取出事件
   * @param cx 轮询上下文
   * @return std::optional<T> 为空时已登记 cx 的 Waker，下一次 Push 会唤醒任务
   */
  auto PollNext(Context& cx) -> std::optional<T> {
    if (auto event = Pop()) {
      return event;
    }
    waker_.Register(cx.waker());
    // 登记前后之间可能有 Push 已经错过了 Waker
    if (auto event = Pop()) {
      (void)waker_.Take();
      return event;
    }
    return std::nullopt;
  }

  /// 被丢弃的事件数
  [[nodiscard]] auto DroppedCount() const -> size_t {
    return dropped_.load(std::memory_order_relaxed);
  }

  [[nodiscard]] auto size() const -> size_t { return queue_.size(); }
  [[nodiscard]] auto empty() const -> bool { return queue_.empty(); }
  [[nodiscard]] static constexpr auto capacity() -> size_t { return Capacity; }

 private:
  mpmc_queue::MPMCQueue<T, Capacity> queue_;
  AtomicWaker waker_;
  std::atomic<size_t> dropped_{0};
};

/// 键盘扫描码队列
using ScancodeQueue =
    EventQueue<uint8_t, kernel::config::kScancodeQueueCapacity>;
using ScancodeQueueSingleton = OnceSingleton<ScancodeQueue>;

#endif  // HEARTHKERNEL_SRC_TASK_INCLUDE_EVENT_QUEUE_HPP_
