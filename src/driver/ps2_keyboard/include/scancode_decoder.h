/**
 * @copyright Copyright The HearthKernel Contributors
 * @brief PS/2 第一套扫描码解码
 */

#ifndef HEARTHKERNEL_SRC_DRIVER_PS2_KEYBOARD_INCLUDE_SCANCODE_DECODER_H_
#define HEARTHKERNEL_SRC_DRIVER_PS2_KEYBOARD_INCLUDE_SCANCODE_DECODER_H_

#include <cstdint>
#include <optional>

/// 一次完整的按键动作
struct KeyEvent {
  /// 去掉释放位后的扫描码
  uint8_t code;
  /// 是否带 0xE0 前缀
  bool extended;
  /// 按下为 true，释放为 false
  bool pressed;
  /// 可打印字符，没有对应字符时为 0
  char ascii;
};

/**
 * @brief 第一套扫描码解码器
 * @details 逐字节输入，记录 Shift/Ctrl/CapsLock 与 0xE0 前缀状态
 */
class ScancodeDecoder {
 public:
  /// @name 扫描码
  /// @{
  static constexpr uint8_t kExtendedPrefix = 0xE0;
  static constexpr uint8_t kReleaseBit = 0x80;
  static constexpr uint8_t kLeftShift = 0x2A;
  static constexpr uint8_t kRightShift = 0x36;
  static constexpr uint8_t kControl = 0x1D;
  static constexpr uint8_t kCapsLock = 0x3A;
  /// @}

  /// @name 构造/析构函数
  /// @{
  ScancodeDecoder() = default;
  ScancodeDecoder(const ScancodeDecoder&) = default;
  ScancodeDecoder(ScancodeDecoder&&) = default;
  auto operator=(const ScancodeDecoder&) -> ScancodeDecoder& = default;
  auto operator=(ScancodeDecoder&&) -> ScancodeDecoder& = default;
  ~ScancodeDecoder() = default;
  /// @}

  /**
   * @brief 输入一个字节
   * @param scancode 从 0x60 端口读到的原始字节
   * @return std::optional<KeyEvent> 前缀字节返回空
   */
  [[nodiscard]] auto Process(uint8_t scancode) -> std::optional<KeyEvent>;

  [[nodiscard]] auto shift() const -> bool {
    return left_shift_ || right_shift_;
  }
  [[nodiscard]] auto control() const -> bool { return control_; }
  [[nodiscard]] auto caps_lock() const -> bool { return caps_lock_; }

 private:
  bool extended_pending_{false};
  bool left_shift_{false};
  bool right_shift_{false};
  bool control_{false};
  bool caps_lock_{false};

  [[nodiscard]] auto Translate(uint8_t code, bool extended) const -> char;
};

#endif /* HEARTHKERNEL_SRC_DRIVER_PS2_KEYBOARD_INCLUDE_SCANCODE_DECODER_H_ */
