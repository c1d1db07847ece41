#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace snotes::token {

// Ordered base62 alphabet: digits, then lower-case, then upper-case.
// kBase62Alphabet[0] ('0') is the padding symbol.
inline constexpr std::string_view kBase62Alphabet =
    "0123456789abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ";

// Fixed token width. 62^11 ~ 5.2e19 > 2^64 - 1 ~ 1.8e19, so every uint64 fits.
inline constexpr std::size_t kTokenWidth = 11;

// encode_base62 writes value in base 62, most significant digit first, left-padded
// with '0' to exactly kTokenWidth characters. Pure and injective.
[[nodiscard]] std::string encode_base62(std::uint64_t value);

// decode_base62 inverts encode_base62.
// Returns std::nullopt when token is not kTokenWidth long, contains a symbol outside the
// alphabet, or denotes a value above UINT64_MAX.
[[nodiscard]] std::optional<std::uint64_t> decode_base62(std::string_view token);

// is_well_formed_token checks width and alphabet only (no range check).
[[nodiscard]] bool is_well_formed_token(std::string_view token);

}  // namespace snotes::token
