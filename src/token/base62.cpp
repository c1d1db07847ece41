#include "snotes/token/base62.h"

#include <array>
#include <limits>

namespace snotes::token {

namespace {

constexpr std::uint64_t kBase = kBase62Alphabet.size();

static_assert(kBase62Alphabet.size() == 62, "base62 alphabet must have 62 symbols");

// Reverse lookup: byte -> digit value, or -1 for bytes outside the alphabet.
constexpr std::array<int, 256> make_digit_table() {
  std::array<int, 256> table{};
  for (auto& entry : table) {
    entry = -1;
  }
  for (std::size_t i = 0; i < kBase62Alphabet.size(); ++i) {
    table[static_cast<unsigned char>(kBase62Alphabet[i])] = static_cast<int>(i);
  }
  return table;
}

constexpr std::array<int, 256> kDigitTable = make_digit_table();

}  // namespace

std::string encode_base62(std::uint64_t value) {
  std::string out(kTokenWidth, kBase62Alphabet[0]);
  std::size_t pos = kTokenWidth;
  while (value > 0) {
    out[--pos] = kBase62Alphabet[value % kBase];
    value /= kBase;
  }
  return out;
}

std::optional<std::uint64_t> decode_base62(const std::string_view token) {
  if (token.size() != kTokenWidth) {
    return std::nullopt;
  }

  constexpr std::uint64_t kMax = std::numeric_limits<std::uint64_t>::max();
  std::uint64_t value = 0;
  for (const char ch : token) {
    const int digit = kDigitTable[static_cast<unsigned char>(ch)];
    if (digit < 0) {
      return std::nullopt;
    }
    const auto d = static_cast<std::uint64_t>(digit);
    if (value > (kMax - d) / kBase) {
      return std::nullopt;  // exceeds 64 bits
    }
    value = value * kBase + d;
  }
  return value;
}

bool is_well_formed_token(const std::string_view token) {
  if (token.size() != kTokenWidth) {
    return false;
  }
  for (const char ch : token) {
    if (kDigitTable[static_cast<unsigned char>(ch)] < 0) {
      return false;
    }
  }
  return true;
}

}  // namespace snotes::token
