#include "snotes/core/utf8.h"

#include <cstdint>

namespace snotes::core {

namespace {

constexpr bool is_continuation(const std::uint8_t byte) noexcept {
  return (byte & 0xC0u) == 0x80u;
}

// Length of the well-formed sequence starting at bytes[pos], or 0 if it is malformed.
// Second-byte ranges follow RFC 3629 §4 (Table 3-7 of the Unicode standard).
std::size_t sequence_length(const std::string_view bytes, const std::size_t pos) noexcept {
  const auto lead = static_cast<std::uint8_t>(bytes[pos]);
  const std::size_t remaining = bytes.size() - pos;

  std::size_t len = 0;
  std::uint8_t lo = 0x80u;
  std::uint8_t hi = 0xBFu;

  if (lead <= 0x7Fu) {
    return 1;
  } else if (lead >= 0xC2u && lead <= 0xDFu) {
    len = 2;
  } else if (lead >= 0xE0u && lead <= 0xEFu) {
    len = 3;
    if (lead == 0xE0u) {
      lo = 0xA0u;  // overlong
    } else if (lead == 0xEDu) {
      hi = 0x9Fu;  // surrogates
    }
  } else if (lead >= 0xF0u && lead <= 0xF4u) {
    len = 4;
    if (lead == 0xF0u) {
      lo = 0x90u;  // overlong
    } else if (lead == 0xF4u) {
      hi = 0x8Fu;  // above U+10FFFF
    }
  } else {
    return 0;
  }

  if (remaining < len) {
    return 0;
  }

  const auto second = static_cast<std::uint8_t>(bytes[pos + 1]);
  if (second < lo || second > hi) {
    return 0;
  }
  for (std::size_t i = 2; i < len; ++i) {
    if (!is_continuation(static_cast<std::uint8_t>(bytes[pos + i]))) {
      return 0;
    }
  }
  return len;
}

}  // namespace

bool is_valid_utf8(const std::string_view bytes) {
  std::size_t pos = 0;
  while (pos < bytes.size()) {
    const std::size_t len = sequence_length(bytes, pos);
    if (len == 0) {
      return false;
    }
    pos += len;
  }
  return true;
}

std::size_t utf8_codepoint_count(const std::string_view bytes) {
  std::size_t count = 0;
  std::size_t pos = 0;
  while (pos < bytes.size()) {
    const std::size_t len = sequence_length(bytes, pos);
    pos += len == 0 ? 1 : len;
    ++count;
  }
  return count;
}

}  // namespace snotes::core
