/**
 * @copyright Copyright The HearthKernel Contributors
 * @brief PS/2 第一套扫描码解码
 */

#include "scancode_decoder.h"

#include <cstddef>

namespace {

// 下标为扫描码，0 表示不可打印
constexpr char kNormalMap[] =
    "\0\x1B"
    "1234567890-="
    "\b\t"
    "qwertyuiop[]"
    "\n\0"
    "asdfghjkl;'`"
    "\0\\"
    "zxcvbnm,./"
    "\0*\0 ";

constexpr char kShiftMap[] =
    "\0\x1B"
    "!@#$%^&*()_+"
    "\b\t"
    "QWERTYUIOP{}"
    "\n\0"
    "ASDFGHJKL:\"~"
    "\0|"
    "ZXCVBNM<>?"
    "\0*\0 ";

static_assert(sizeof(kNormalMap) == 0x3A + 1);
static_assert(sizeof(kShiftMap) == sizeof(kNormalMap));

constexpr size_t kMapSize = sizeof(kNormalMap) - 1;

/// 扩展键中的小键盘回车与除号
constexpr uint8_t kKeypadEnter = 0x1C;
constexpr uint8_t kKeypadSlash = 0x35;

constexpr auto IsLetter(char c) -> bool {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

constexpr auto ToggleCase(char c) -> char {
  return static_cast<char>(c ^ 0x20);
}

}  // namespace

auto ScancodeDecoder::Process(uint8_t scancode) -> std::optional<KeyEvent> {
  if (scancode == kExtendedPrefix) {
    extended_pending_ = true;
    return std::nullopt;
  }

  auto extended = extended_pending_;
  extended_pending_ = false;
  auto pressed = (scancode & kReleaseBit) == 0;
  auto code = static_cast<uint8_t>(scancode & ~kReleaseBit);

  switch (code) {
    case kLeftShift:
      // E0 2A 是 PrintScreen 的一部分，不是 Shift
      if (!extended) {
        left_shift_ = pressed;
      }
      break;
    case kRightShift:
      if (!extended) {
        right_shift_ = pressed;
      }
      break;
    case kControl:
      control_ = pressed;
      break;
    case kCapsLock:
      if (pressed) {
        caps_lock_ = !caps_lock_;
      }
      break;
    default:
      break;
  }

  return KeyEvent{
      .code = code,
      .extended = extended,
      .pressed = pressed,
      .ascii = pressed ? Translate(code, extended) : '\0',
  };
}

auto ScancodeDecoder::Translate(uint8_t code, bool extended) const -> char {
  if (extended) {
    if (code == kKeypadEnter) {
      return '\n';
    }
    if (code == kKeypadSlash) {
      return '/';
    }
    return '\0';
  }
  if (code >= kMapSize) {
    return '\0';
  }
  auto c = shift() ? kShiftMap[code] : kNormalMap[code];
  if (caps_lock_ && IsLetter(c)) {
    c = ToggleCase(c);
  }
  return c;
}
