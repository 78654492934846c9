/**
 * @copyright Copyright The HearthKernel Contributors
 */

#include "sk_stdio.h"

#include <gtest/gtest.h>

#include <climits>
#include <cstdint>
#include <string>

#include "arch_mock.hpp"

namespace {

template <typename... Args>
auto Format(const char* format, Args... args) -> std::string {
  char buffer[128];
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wformat-nonliteral"
  int len = sk_snprintf(buffer, sizeof(buffer), format, args...);
#pragma GCC diagnostic pop
  EXPECT_EQ(static_cast<size_t>(len), std::string(buffer).size());
  return buffer;
}

}  // namespace

TEST(SkStdioTest, Integers) {
  EXPECT_EQ(Format("%d", 123), "123");
  EXPECT_EQ(Format("%d", -123), "-123");
  EXPECT_EQ(Format("%i", 0), "0");
  EXPECT_EQ(Format("%+d", 5), "+5");
  EXPECT_EQ(Format("%u", 4000000000U), "4000000000");
  EXPECT_EQ(Format("%lld", LLONG_MIN), "-9223372036854775808");
  EXPECT_EQ(Format("%lu", 18446744073709551615UL), "18446744073709551615");
  EXPECT_EQ(Format("%zu", sizeof(uint64_t)), "8");
  EXPECT_EQ(Format("%o", 8), "10");
}

TEST(SkStdioTest, Hexadecimal) {
  EXPECT_EQ(Format("%x", 0xBEEF), "beef");
  EXPECT_EQ(Format("%X", 0xBEEF), "BEEF");
  EXPECT_EQ(Format("%#x", 0x1F), "0x1f");
  EXPECT_EQ(Format("0x%lX", 0x4444'4444'0000UL), "0x444444440000");
  EXPECT_EQ(Format("%08X", 0xAB), "000000AB");
  EXPECT_EQ(Format("%p", reinterpret_cast<void*>(0x1000)), "0x1000");
}

TEST(SkStdioTest, WidthAndPrecision) {
  EXPECT_EQ(Format("[%5d]", 42), "[   42]");
  EXPECT_EQ(Format("[%-5d]", 42), "[42   ]");
  EXPECT_EQ(Format("[%05d]", -42), "[-0042]");
  EXPECT_EQ(Format("[%*d]", 4, 7), "[   7]");
  EXPECT_EQ(Format("[%.3d]", 7), "[007]");
  EXPECT_EQ(Format("[%5s]", "ab"), "[   ab]");
  EXPECT_EQ(Format("[%-5s]", "ab"), "[ab   ]");
  EXPECT_EQ(Format("[%.2s]", "abcdef"), "[ab]");
}

TEST(SkStdioTest, CharactersAndStrings) {
  EXPECT_EQ(Format("%c%c", 'h', 'i'), "hi");
  EXPECT_EQ(Format("%s kernel", "hearth"), "hearth kernel");
  EXPECT_EQ(Format("%s", static_cast<const char*>(nullptr)), "(null)");
  EXPECT_EQ(Format("100%%"), "100%");
}

TEST(SkStdioTest, TruncatesButReportsFullLength) {
  char buffer[6];
  int len = sk_snprintf(buffer, sizeof(buffer), "%s", "truncated");
  EXPECT_EQ(len, 9);
  EXPECT_STREQ(buffer, "trunc");
}

TEST(SkStdioTest, NullBufferOnlyCounts) {
  EXPECT_EQ(sk_snprintf(nullptr, 0, "%d-%s", 12345, "abc"), 9);
}

TEST(SkStdioTest, PrintfWritesThroughPutchar) {
  arch_mock::Reset();
  int len = sk_printf("async number: %u\n", 42U);
  EXPECT_EQ(arch_mock::Get().console, "async number: 42\n");
  EXPECT_EQ(len, 17);
}
