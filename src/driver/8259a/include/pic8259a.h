/**
 * @copyright Copyright The HearthKernel Contributors
 * @brief 8259a 头文件
 */

#ifndef HEARTHKERNEL_SRC_DRIVER_8259A_INCLUDE_PIC8259A_H_
#define HEARTHKERNEL_SRC_DRIVER_8259A_INCLUDE_PIC8259A_H_

#include <array>
#include <cstddef>
#include <cstdint>

#include "expected.hpp"
#include "once.hpp"

/**
 * @brief 级联的两片 8259A 中断控制器
 * @details 主片 IRQ2 连接从片。每次硬件中断处理结束前必须发送 EOI，
 * 否则该中断线不会再次触发
 */
class PIC8259A {
 public:
  /// @name 端口
  /// @{
  static constexpr uint16_t kMasterCommand = 0x20;
  static constexpr uint16_t kMasterData = 0x21;
  static constexpr uint16_t kSlaveCommand = 0xA0;
  static constexpr uint16_t kSlaveData = 0xA1;
  /// @}

  /// @name 命令
  /// @{
  static constexpr uint8_t kIcw1Init = 0x10;
  static constexpr uint8_t kIcw1Icw4 = 0x01;
  static constexpr uint8_t kIcw4Mode8086 = 0x01;
  static constexpr uint8_t kEndOfInterrupt = 0x20;
  /// @}

  /// 每片中断线数
  static constexpr uint8_t kLinesPerChip = 8;
  /// 从片接在主片的 IRQ2
  static constexpr uint8_t kCascadeIrq = 2;

  /// @name 构造/析构函数
  /// @{
  PIC8259A() = default;
  PIC8259A(const PIC8259A&) = delete;
  PIC8259A(PIC8259A&&) = delete;
  auto operator=(const PIC8259A&) -> PIC8259A& = delete;
  auto operator=(PIC8259A&&) -> PIC8259A& = delete;
  ~PIC8259A() = default;
  /// @}

  /**
   * @brief 重映射两片控制器的向量
   * @param offset_master 主片向量起点
   * @param offset_slave 从片向量起点
   * @return Expected<void> 偏移小于 32、不是 8 的倍数或两片重叠时返回
   * kPicInvalidOffset
   * @note 初始化前后屏蔽字保持不变
   */
  [[nodiscard]] auto Initialize(uint8_t offset_master, uint8_t offset_slave)
      -> Expected<void>;

  /**
   * @brief 向量是否属于这两片控制器
   */
  [[nodiscard]] auto HandlesInterrupt(uint8_t vector) const -> bool;

  /**
   * @brief 标记向量开始处理
   * @param vector 中断向量
   * @note 由中断分发器在调用处理函数前调用
   */
  void BeginInterrupt(uint8_t vector);

  /**
   * @brief 发送中断结束信号
   * @param vector 中断向量
   * @note 来自从片的中断先通知从片再通知主片，不属于本控制器的向量被忽略
   */
  void NotifyEndOfInterrupt(uint8_t vector);

  /**
   * @brief 向量是否已开始处理但尚未发送 EOI
   */
  [[nodiscard]] auto IsInService(uint8_t vector) const -> bool;

  /**
   * @brief 处理函数返回后检查 EOI
   * @param vector 中断向量
   * @return true 处理函数遗漏了 EOI，已补发并计数
   */
  auto CheckEndOfInterrupt(uint8_t vector) -> bool;

  /// 遗漏 EOI 的次数
  [[nodiscard]] auto missed_eoi_count() const -> size_t {
    return missed_eoi_count_;
  }

  /// @name 屏蔽
  /// @{
  void SetMask(uint8_t irq);
  void ClearMask(uint8_t irq);
  void DisableAll();
  /// @}

  [[nodiscard]] auto offset_master() const -> uint8_t { return offsets_[0]; }
  [[nodiscard]] auto offset_slave() const -> uint8_t { return offsets_[1]; }

 private:
  std::array<uint8_t, 2> offsets_{0, 0};
  bool initialized_{false};
  /// 以 IRQ 号为下标
  std::array<bool, kLinesPerChip * 2> in_service_{};
  size_t missed_eoi_count_{0};

  /// 向量对应的 IRQ 号，不属于本控制器时为 -1
  [[nodiscard]] auto IrqOf(uint8_t vector) const -> int;
};

using PicSingleton = OnceSingleton<PIC8259A>;

#endif /* HEARTHKERNEL_SRC_DRIVER_8259A_INCLUDE_PIC8259A_H_ */
