/**
 * @copyright Copyright The HearthKernel Contributors
 * @brief 一次性初始化的全局单例
 */

#ifndef HEARTHKERNEL_SRC_INCLUDE_ONCE_HPP_
#define HEARTHKERNEL_SRC_INCLUDE_ONCE_HPP_

#include <etl/singleton.h>

#include <atomic>
#include <utility>

#include "expected.hpp"

/**
 * @brief 基于 etl::singleton 的一次性单例
 * @tparam T 对象类型
 * @note 并发的首次 Create 中只有一个会执行构造，其余返回 kAlreadyInitialized
 */
template <typename T>
class OnceSingleton {
 public:
  /// @name 构造/析构函数
  /// @{
  OnceSingleton() = delete;
  OnceSingleton(const OnceSingleton&) = delete;
  OnceSingleton(OnceSingleton&&) = delete;
  auto operator=(const OnceSingleton&) -> OnceSingleton& = delete;
  auto operator=(OnceSingleton&&) -> OnceSingleton& = delete;
  ~OnceSingleton() = delete;
  /// @}

  /**
   * @brief 构造唯一实例
   * @param args 构造参数
   * @return Expected<void> 重复初始化时返回 kAlreadyInitialized
   */
  template <typename... Args>
  static auto Create(Args&&... args) -> Expected<void> {
    bool expected = false;
    if (!claimed_.compare_exchange_strong(expected, true,
                                          std::memory_order_acq_rel)) {
      return std::unexpected(Error(ErrorCode::kAlreadyInitialized));
    }
    etl::singleton<T>::create(std::forward<Args>(args)...);
    ready_.store(true, std::memory_order_release);
    return {};
  }

  /**
   * @brief 获取实例
   * @pre IsReady() == true
   */
  static auto Instance() -> T& { return etl::singleton<T>::instance(); }

  /**
   * @brief 实例是否已构造完成
   */
  [[nodiscard]] static auto IsReady() -> bool {
    return ready_.load(std::memory_order_acquire);
  }

  /**
   * @brief 销毁实例
   * @note 内核从不销毁单例，仅供单元测试复位
   */
  static void Destroy() {
    if (IsReady()) {
      ready_.store(false, std::memory_order_release);
      etl::singleton<T>::destroy();
    }
    claimed_.store(false, std::memory_order_release);
  }

 private:
  static inline std::atomic<bool> claimed_{false};
  static inline std::atomic<bool> ready_{false};
};

#endif /* HEARTHKERNEL_SRC_INCLUDE_ONCE_HPP_ */
