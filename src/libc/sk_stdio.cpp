/**
 * @copyright Copyright The HearthKernel Contributors
 * @brief 格式化输出
 */

#include "sk_stdio.h"

#include <cstddef>
#include <cstdint>

namespace {

/// 输出目标：写入缓冲区或逐字符交给 sk_putchar
struct Sink {
  char* buffer;
  size_t size;
  size_t count;

  void Put(char c) {
    if (buffer == nullptr) {
      sk_putchar(c, nullptr);
    } else if (count + 1 < size) {
      buffer[count] = c;
    }
    count++;
  }
};

struct Conversion {
  bool left = false;
  bool zero = false;
  bool plus = false;
  bool alt = false;
  int width = 0;
  int precision = -1;
};

void PutPadded(Sink& sink, const char* str, size_t len,
               const Conversion& conv) {
  size_t pad = conv.width > 0 && static_cast<size_t>(conv.width) > len
                   ? static_cast<size_t>(conv.width) - len
                   : 0;
  if (!conv.left) {
    for (size_t i = 0; i < pad; i++) {
      sink.Put(' ');
    }
  }
  for (size_t i = 0; i < len; i++) {
    sink.Put(str[i]);
  }
  if (conv.left) {
    for (size_t i = 0; i < pad; i++) {
      sink.Put(' ');
    }
  }
}

void PutNumber(Sink& sink, uint64_t value, bool negative, unsigned base,
               bool upper, const Conversion& conv) {
  const char* digits = upper ? "0123456789ABCDEF" : "0123456789abcdef";
  // 64 位二进制加前缀与符号
  char tmp[72];
  size_t len = 0;

  do {
    tmp[len++] = digits[value % base];
    value /= base;
  } while (value != 0);

  while (conv.precision > 0 && len < static_cast<size_t>(conv.precision)) {
    tmp[len++] = '0';
  }

  char prefix[3] = {};
  size_t prefix_len = 0;
  if (negative) {
    prefix[prefix_len++] = '-';
  } else if (conv.plus) {
    prefix[prefix_len++] = '+';
  }
  if (conv.alt && base == 16) {
    prefix[prefix_len++] = '0';
    prefix[prefix_len++] = upper ? 'X' : 'x';
  }

  size_t total = len + prefix_len;
  size_t pad = conv.width > 0 && static_cast<size_t>(conv.width) > total
                   ? static_cast<size_t>(conv.width) - total
                   : 0;

  if (!conv.left && !conv.zero) {
    for (size_t i = 0; i < pad; i++) {
      sink.Put(' ');
    }
  }
  for (size_t i = 0; i < prefix_len; i++) {
    sink.Put(prefix[i]);
  }
  if (!conv.left && conv.zero) {
    for (size_t i = 0; i < pad; i++) {
      sink.Put('0');
    }
  }
  while (len > 0) {
    sink.Put(tmp[--len]);
  }
  if (conv.left) {
    for (size_t i = 0; i < pad; i++) {
      sink.Put(' ');
    }
  }
}

auto Format(Sink& sink, const char* format, va_list args) -> int {
  for (const char* p = format; *p != '\0'; p++) {
    if (*p != '%') {
      sink.Put(*p);
      continue;
    }
    p++;

    Conversion conv;
    for (;; p++) {
      if (*p == '-') {
        conv.left = true;
      } else if (*p == '0') {
        conv.zero = true;
      } else if (*p == '+') {
        conv.plus = true;
      } else if (*p == '#') {
        conv.alt = true;
      } else {
        break;
      }
    }

    if (*p == '*') {
      conv.width = va_arg(args, int);
      p++;
    } else {
      while (*p >= '0' && *p <= '9') {
        conv.width = conv.width * 10 + (*p - '0');
        p++;
      }
    }

    if (*p == '.') {
      p++;
      conv.precision = 0;
      while (*p >= '0' && *p <= '9') {
        conv.precision = conv.precision * 10 + (*p - '0');
        p++;
      }
    }

    // 0: int, 1: long, 2: long long, 3: size_t
    int length = 0;
    if (*p == 'h') {
      p++;
      if (*p == 'h') {
        p++;
      }
    } else if (*p == 'l') {
      length = 1;
      p++;
      if (*p == 'l') {
        length = 2;
        p++;
      }
    } else if (*p == 'z') {
      length = 3;
      p++;
    }

    switch (*p) {
      case 'd':
      case 'i': {
        int64_t value = 0;
        if (length == 0) {
          value = va_arg(args, int);
        } else if (length == 2) {
          value = va_arg(args, long long);
        } else {
          value = va_arg(args, long);
        }
        bool negative = value < 0;
        auto magnitude = negative ? 0 - static_cast<uint64_t>(value)
                                  : static_cast<uint64_t>(value);
        PutNumber(sink, magnitude, negative, 10, false, conv);
        break;
      }
      case 'u':
      case 'x':
      case 'X':
      case 'o': {
        uint64_t value = 0;
        if (length == 0) {
          value = va_arg(args, unsigned int);
        } else if (length == 2) {
          value = va_arg(args, unsigned long long);
        } else if (length == 3) {
          value = va_arg(args, size_t);
        } else {
          value = va_arg(args, unsigned long);
        }
        unsigned base = *p == 'u' ? 10 : (*p == 'o' ? 8 : 16);
        PutNumber(sink, value, false, base, *p == 'X', conv);
        break;
      }
      case 'p': {
        auto value = reinterpret_cast<uintptr_t>(va_arg(args, void*));
        conv.alt = true;
        PutNumber(sink, value, false, 16, false, conv);
        break;
      }
      case 'c': {
        char c = static_cast<char>(va_arg(args, int));
        PutPadded(sink, &c, 1, conv);
        break;
      }
      case 's': {
        const char* str = va_arg(args, const char*);
        if (str == nullptr) {
          str = "(null)";
        }
        size_t len = 0;
        while (str[len] != '\0' &&
               (conv.precision < 0 || len < static_cast<size_t>(conv.precision))) {
          len++;
        }
        PutPadded(sink, str, len, conv);
        break;
      }
      case '%':
        sink.Put('%');
        break;
      case '\0':
        p--;
        break;
      default:
        sink.Put('%');
        sink.Put(*p);
        break;
    }
  }

  if (sink.buffer != nullptr && sink.size > 0) {
    sink.buffer[sink.count < sink.size ? sink.count : sink.size - 1] = '\0';
  }
  return static_cast<int>(sink.count);
}

}  // namespace

extern "C" int sk_vsnprintf(char* buffer, size_t bufsz, const char* format,
                            va_list vlist) {
  Sink sink{buffer, bufsz, 0};
  if (buffer == nullptr) {
    // 只计算长度
    char dummy = 0;
    sink = Sink{&dummy, 0, 0};
  }
  return Format(sink, format, vlist);
}

extern "C" int sk_snprintf(char* buffer, size_t bufsz, const char* format,
                           ...) {
  va_list args;
  va_start(args, format);
  int ret = sk_vsnprintf(buffer, bufsz, format, args);
  va_end(args);
  return ret;
}

extern "C" int sk_printf(const char* format, ...) {
  va_list args;
  va_start(args, format);
  Sink sink{nullptr, 0, 0};
  int ret = Format(sink, format, args);
  va_end(args);
  return ret;
}
