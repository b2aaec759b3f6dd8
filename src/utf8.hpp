#pragma once
/*
 * utf8
 *
 * Purpose: minimal UTF-8 helpers for cell text and input decoding.
 * Note: code point granularity; no grapheme clustering.
 */
#include <cstddef>
#include <string>
#include <string_view>

namespace utf8 {

// Length of the sequence introduced by lead byte c, 0 when c is not a lead byte.
inline std::size_t sequence_length(unsigned char c) {
  if (c < 0x80) return 1;
  if ((c & 0xE0) == 0xC0) return c >= 0xC2 ? 2 : 0;
  if ((c & 0xF0) == 0xE0) return 3;
  if ((c & 0xF8) == 0xF0) return c <= 0xF4 ? 4 : 0;
  return 0;
}

inline bool is_continuation(unsigned char c) { return (c & 0xC0) == 0x80; }

// Decodes one code point at s[0..n). Returns false on malformed input.
inline bool decode(std::string_view s, char32_t& cp) {
  if (s.empty()) return false;
  std::size_t n = sequence_length(static_cast<unsigned char>(s[0]));
  if (n == 0 || s.size() < n) return false;
  unsigned char c0 = static_cast<unsigned char>(s[0]);
  if (n == 1) { cp = c0; return true; }
  cp = c0 & (0x7F >> n);
  for (std::size_t i = 1; i < n; ++i) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    if (!is_continuation(c)) return false;
    cp = (cp << 6) | (c & 0x3F);
  }
  return true;
}

inline std::string encode(char32_t ch) {
  std::string out;
  if (ch <= 0x7F) {
    out.push_back(static_cast<char>(ch));
  } else if (ch <= 0x7FF) {
    out.push_back(static_cast<char>(0xC0 | ((ch >> 6) & 0x1F)));
    out.push_back(static_cast<char>(0x80 | (ch & 0x3F)));
  } else if (ch <= 0xFFFF) {
    out.push_back(static_cast<char>(0xE0 | ((ch >> 12) & 0x0F)));
    out.push_back(static_cast<char>(0x80 | ((ch >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (ch & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | ((ch >> 18) & 0x07)));
    out.push_back(static_cast<char>(0x80 | ((ch >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((ch >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (ch & 0x3F)));
  }
  return out;
}

} // namespace utf8
