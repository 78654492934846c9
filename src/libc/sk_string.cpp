/**
 * @copyright Copyright The HearthKernel Contributors
 * @brief 编译器依赖的内存与字符串函数
 */

#include <cstddef>
#include <cstdint>

extern "C" {

void* memcpy(void* __restrict dest, const void* __restrict src, size_t count) {
  auto* d = static_cast<uint8_t*>(dest);
  const auto* s = static_cast<const uint8_t*>(src);
  for (size_t i = 0; i < count; i++) {
    d[i] = s[i];
  }
  return dest;
}

void* memmove(void* dest, const void* src, size_t count) {
  auto* d = static_cast<uint8_t*>(dest);
  const auto* s = static_cast<const uint8_t*>(src);
  if (d < s) {
    for (size_t i = 0; i < count; i++) {
      d[i] = s[i];
    }
  } else if (d > s) {
    for (size_t i = count; i > 0; i--) {
      d[i - 1] = s[i - 1];
    }
  }
  return dest;
}

void* memset(void* dest, int ch, size_t count) {
  auto* d = static_cast<uint8_t*>(dest);
  for (size_t i = 0; i < count; i++) {
    d[i] = static_cast<uint8_t>(ch);
  }
  return dest;
}

int memcmp(const void* lhs, const void* rhs, size_t count) {
  const auto* l = static_cast<const uint8_t*>(lhs);
  const auto* r = static_cast<const uint8_t*>(rhs);
  for (size_t i = 0; i < count; i++) {
    if (l[i] != r[i]) {
      return l[i] < r[i] ? -1 : 1;
    }
  }
  return 0;
}

size_t strlen(const char* str) {
  size_t len = 0;
  while (str[len] != '\0') {
    len++;
  }
  return len;
}

int strcmp(const char* lhs, const char* rhs) {
  while (*lhs != '\0' && *lhs == *rhs) {
    lhs++;
    rhs++;
  }
  return static_cast<int>(static_cast<uint8_t>(*lhs)) -
         static_cast<int>(static_cast<uint8_t>(*rhs));
}

}  // extern "C"
