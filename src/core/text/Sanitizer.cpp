#include "Sanitizer.hpp"

#include <cstdint>

#include <unicode/uchar.h>
#include <unicode/utf8.h>

namespace gb {

namespace {

bool keep_code_point(UChar32 c) {
  if (c == '\n') return true;
  if (c < 0) return false;                 // ill-formed sequence
  if (c < 0x20 || c == 0x7F) return false; // ESC, GS, BEL, ...
  return (U_GET_GC_MASK(c) & U_GC_C_MASK) == 0;
}

} // namespace

std::string sanitize(std::string_view utf8) {
  const auto* s = reinterpret_cast<const uint8_t*>(utf8.data());
  const int64_t length = static_cast<int64_t>(utf8.size());

  std::string out;
  out.reserve(utf8.size());
  int64_t i = 0;
  while (i < length) {
    const int64_t start = i;
    UChar32 c = 0;
    U8_NEXT(s, i, length, c);
    if (keep_code_point(c)) out.append(utf8.data() + start, static_cast<size_t>(i - start));
  }
  return out;
}

std::string trimWhitespace(std::string_view utf8) {
  const auto* s = reinterpret_cast<const uint8_t*>(utf8.data());
  const int64_t length = static_cast<int64_t>(utf8.size());

  // [begin, end) spans first through last non-space code point
  int64_t begin = -1;
  int64_t end = 0;
  int64_t i = 0;
  while (i < length) {
    const int64_t start = i;
    UChar32 c = 0;
    U8_NEXT(s, i, length, c);
    if (c < 0 || !u_isUWhiteSpace(c)) {
      if (begin < 0) begin = start;
      end = i;
    }
  }
  if (begin < 0) return {};
  return std::string(utf8.substr(static_cast<size_t>(begin), static_cast<size_t>(end - begin)));
}

std::size_t codePointCount(std::string_view utf8) {
  const auto* s = reinterpret_cast<const uint8_t*>(utf8.data());
  const int64_t length = static_cast<int64_t>(utf8.size());
  std::size_t n = 0;
  int64_t i = 0;
  while (i < length) {
    U8_FWD_1(s, i, length);
    ++n;
  }
  return n;
}

} // namespace gb
