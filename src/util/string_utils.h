#ifndef YAPP_STRING_UTILS_H
#define YAPP_STRING_UTILS_H

#include <stddef.h>
#include <stdint.h>
#include <string.h>
#include <etl/string.h>
#include <etl/string_view.h>
#include <etl/to_string.h>

namespace yapp {
namespace util {

/**
 * @brief Append a string_view to a fixed-capacity string, truncating at capacity.
 */
inline void append(etl::istring& dst, etl::string_view src) {
  if (!src.empty()) {
    dst.append(src.data(), src.size());
  }
}

inline void append(etl::istring& dst, uint32_t value) {
  etl::to_string(value, dst, true);
}

inline void append_hex_byte(etl::istring& dst, uint8_t value) {
  static const char kDigits[] = "0123456789ABCDEF";
  dst.append("0x");
  dst.push_back(kDigits[(value >> 4) & 0x0F]);
  dst.push_back(kDigits[value & 0x0F]);
}

/**
 * @brief Parse an unsigned decimal field, tolerating surrounding blanks.
 * @return false on empty input, non-digit characters or overflow.
 */
inline bool parse_decimal(etl::string_view text, uint32_t& out) {
  size_t first = 0;
  size_t last = text.size();
  while (first < last && text[first] == ' ') ++first;
  while (last > first && text[last - 1] == ' ') --last;
  if (first == last) {
    return false;
  }
  uint32_t value = 0;
  for (size_t i = first; i < last; ++i) {
    const char c = text[i];
    if (c < '0' || c > '9') {
      return false;
    }
    const uint32_t digit = static_cast<uint32_t>(c - '0');
    if (value > (UINT32_MAX - digit) / 10U) {
      return false;
    }
    value = value * 10U + digit;
  }
  out = value;
  return true;
}

/**
 * @brief Final path component ("dir/sub/a.txt" -> "a.txt").
 *
 * Both separators are honoured; names coming from a remote station may use
 * either convention.
 */
inline etl::string_view path_basename(etl::string_view path) {
  size_t start = 0;
  for (size_t i = 0; i < path.size(); ++i) {
    if (path[i] == '/' || path[i] == '\\') {
      start = i + 1;
    }
  }
  return path.substr(start);
}

inline bool is_usable_filename(etl::string_view name) {
  if (name.empty()) return false;
  if (name == etl::string_view(".") || name == etl::string_view("..")) return false;
  for (size_t i = 0; i < name.size(); ++i) {
    if (name[i] == '\0' || name[i] == '/' || name[i] == '\\') return false;
  }
  return true;
}

}  // namespace util
}  // namespace yapp

#endif
