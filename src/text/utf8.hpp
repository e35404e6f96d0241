#pragma once

#include <cstddef>
#include <string>

namespace fixread {
namespace utf8 {

/// Number of bytes in the UTF-8 sequence that starts with `lead`.
/// Continuation or invalid lead bytes count as a single byte so that
/// malformed input is still consumed one byte at a time.
inline std::size_t sequence_length(unsigned char lead) {
  if (lead < 0x80) return 1;
  if ((lead & 0xE0) == 0xC0) return 2;
  if ((lead & 0xF0) == 0xE0) return 3;
  if ((lead & 0xF8) == 0xF0) return 4;
  return 1;
}

/// Decode the code point starting at byte `pos`.
/// `len` receives the number of bytes consumed (never 0 inside the string).
inline char32_t decode(const std::string& s, std::size_t pos, std::size_t& len) {
  const auto lead = static_cast<unsigned char>(s[pos]);
  len = sequence_length(lead);
  if (pos + len > s.size()) {
    len = 1;
    return lead;
  }
  if (len == 1) return lead;

  char32_t cp = lead & (0x7F >> len);
  for (std::size_t i = 1; i < len; ++i) {
    const auto cont = static_cast<unsigned char>(s[pos + i]);
    if ((cont & 0xC0) != 0x80) {
      len = 1;
      return lead;
    }
    cp = (cp << 6) | (cont & 0x3F);
  }
  return cp;
}

/// Number of code points in `s`.
inline std::size_t length(const std::string& s) {
  std::size_t count = 0;
  std::size_t len = 0;
  for (std::size_t pos = 0; pos < s.size(); pos += len) {
    decode(s, pos, len);
    ++count;
  }
  return count;
}

/// Byte offset of the code point at index `index` (or s.size() past the end).
inline std::size_t byte_offset(const std::string& s, std::size_t index) {
  std::size_t pos = 0;
  std::size_t len = 0;
  for (std::size_t i = 0; i < index && pos < s.size(); ++i) {
    decode(s, pos, len);
    pos += len;
  }
  return pos;
}

}  // namespace utf8
}  // namespace fixread
