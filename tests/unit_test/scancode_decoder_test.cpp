/**
 * @copyright Copyright The HearthKernel Contributors
 */

#include "scancode_decoder.h"

#include <gtest/gtest.h>

#include <initializer_list>
#include <string>

namespace {

/// 输入一串扫描码，拼接所有按下事件的字符
auto Type(ScancodeDecoder& decoder, std::initializer_list<uint8_t> codes)
    -> std::string {
  std::string text;
  for (auto code : codes) {
    auto event = decoder.Process(code);
    if (event && event->pressed && event->ascii != '\0') {
      text.push_back(event->ascii);
    }
  }
  return text;
}

}  // namespace

TEST(ScancodeDecoderTest, PressAndRelease) {
  ScancodeDecoder decoder;
  auto press = decoder.Process(0x1E);
  ASSERT_TRUE(press.has_value());
  EXPECT_EQ(press->code, 0x1E);
  EXPECT_TRUE(press->pressed);
  EXPECT_FALSE(press->extended);
  EXPECT_EQ(press->ascii, 'a');

  auto release = decoder.Process(0x9E);
  ASSERT_TRUE(release.has_value());
  EXPECT_EQ(release->code, 0x1E);
  EXPECT_FALSE(release->pressed);
  EXPECT_EQ(release->ascii, '\0');
}

TEST(ScancodeDecoderTest, TypesDigitsAndPunctuation) {
  ScancodeDecoder decoder;
  // "hi 42!"，感叹号需要 Shift
  EXPECT_EQ(Type(decoder, {0x23, 0x17, 0x39, 0x05, 0x03, 0x2A, 0x02, 0xAA}),
            "hi 42!");
  EXPECT_EQ(Type(decoder, {0x1C, 0x0E, 0x0F}), "\n\b\t");
}

TEST(ScancodeDecoderTest, ShiftSelectsUpperCase) {
  ScancodeDecoder decoder;
  EXPECT_EQ(Type(decoder, {0x36, 0x1E}), "A");
  EXPECT_TRUE(decoder.shift());
  EXPECT_EQ(Type(decoder, {0xB6, 0x1E}), "a");
  EXPECT_FALSE(decoder.shift());

  // 两个 Shift 都松开后才恢复
  Type(decoder, {0x2A, 0x36, 0xAA});
  EXPECT_TRUE(decoder.shift());
  Type(decoder, {0xB6});
  EXPECT_FALSE(decoder.shift());
}

TEST(ScancodeDecoderTest, CapsLockTogglesLettersOnly) {
  ScancodeDecoder decoder;
  Type(decoder, {0x3A, 0xBA});
  EXPECT_TRUE(decoder.caps_lock());
  EXPECT_EQ(Type(decoder, {0x10, 0x02}), "Q1");
  // CapsLock 与 Shift 同时生效时字母恢复小写
  EXPECT_EQ(Type(decoder, {0x2A, 0x10, 0x02, 0xAA}), "q!");

  Type(decoder, {0x3A, 0xBA});
  EXPECT_FALSE(decoder.caps_lock());
  EXPECT_EQ(Type(decoder, {0x10}), "q");
}

TEST(ScancodeDecoderTest, TracksControl) {
  ScancodeDecoder decoder;
  auto event = decoder.Process(0x1D);
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(event->ascii, '\0');
  EXPECT_TRUE(decoder.control());
  decoder.Process(0x9D);
  EXPECT_FALSE(decoder.control());
}

TEST(ScancodeDecoderTest, ExtendedPrefix) {
  ScancodeDecoder decoder;
  EXPECT_FALSE(decoder.Process(ScancodeDecoder::kExtendedPrefix).has_value());

  // 小键盘回车
  auto enter = decoder.Process(0x1C);
  ASSERT_TRUE(enter.has_value());
  EXPECT_TRUE(enter->extended);
  EXPECT_EQ(enter->ascii, '\n');

  // 前缀只作用于下一个字节
  auto plain = decoder.Process(0x1C);
  ASSERT_TRUE(plain.has_value());
  EXPECT_FALSE(plain->extended);

  // 方向键没有字符
  EXPECT_EQ(Type(decoder, {0xE0, 0x48, 0xE0, 0xC8}), "");
  EXPECT_EQ(Type(decoder, {0xE0, 0x35}), "/");
}

TEST(ScancodeDecoderTest, ExtendedShiftCodesAreNotShift) {
  ScancodeDecoder decoder;
  // PrintScreen: E0 2A E0 37
  Type(decoder, {0xE0, 0x2A, 0xE0, 0x37});
  EXPECT_FALSE(decoder.shift());
}

TEST(ScancodeDecoderTest, UnmappedCodesHaveNoCharacter) {
  ScancodeDecoder decoder;
  // F1 与超出表范围的扫描码
  EXPECT_EQ(Type(decoder, {0x3B, 0x58, 0x7F}), "");
}
