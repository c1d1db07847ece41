#include "snotes/token/base62.h"

#include <catch2/catch.hpp>

#include <cstdint>
#include <limits>
#include <set>
#include <string>

using namespace snotes::token;

TEST_CASE("encode_base62 pads zero to eleven '0' symbols", "[base62]") {
  CHECK(encode_base62(0) == "00000000000");
}

TEST_CASE("encode_base62 orders digits, lower-case, upper-case", "[base62]") {
  CHECK(encode_base62(9) == "00000000009");
  CHECK(encode_base62(10) == "0000000000a");
  CHECK(encode_base62(35) == "0000000000z");
  CHECK(encode_base62(36) == "0000000000A");
  CHECK(encode_base62(61) == "0000000000Z");
  CHECK(encode_base62(62) == "00000000010");
}

TEST_CASE("encode_base62 handles the 64-bit boundaries", "[base62]") {
  CHECK(encode_base62(std::numeric_limits<std::uint64_t>::max()) == "lYGhA16ahyf");
  CHECK(encode_base62(std::uint64_t{0x7FFFFFFFFFFFFFFF}) == "aZl8N0y58M7");
}

TEST_CASE("encode_base62 output is always eleven alphabet symbols", "[base62]") {
  for (std::uint64_t value : {std::uint64_t{1}, std::uint64_t{61}, std::uint64_t{3844},
                              std::uint64_t{1} << 32, std::uint64_t{1} << 63,
                              std::numeric_limits<std::uint64_t>::max() - 1}) {
    const std::string token = encode_base62(value);
    CHECK(token.size() == kTokenWidth);
    CHECK(token.find_first_not_of(kBase62Alphabet) == std::string::npos);
  }
}

TEST_CASE("encode_base62 is injective over a consecutive range", "[base62]") {
  std::set<std::string> seen;
  const std::uint64_t base = std::uint64_t{1} << 40;
  for (std::uint64_t offset = 0; offset < 10000; ++offset) {
    seen.insert(encode_base62(base + offset));
  }
  CHECK(seen.size() == 10000);
}

TEST_CASE("decode_base62 inverts encode_base62 at the boundaries", "[base62]") {
  for (std::uint64_t value :
       {std::uint64_t{0}, std::uint64_t{61}, std::uint64_t{62},
        std::numeric_limits<std::uint64_t>::max()}) {
    const auto decoded = decode_base62(encode_base62(value));
    REQUIRE(decoded.has_value());
    CHECK(decoded.value() == value);
  }
}

TEST_CASE("decode_base62 rejects malformed tokens", "[base62]") {
  CHECK_FALSE(decode_base62("").has_value());
  CHECK_FALSE(decode_base62("0000000000").has_value());    // 10 symbols
  CHECK_FALSE(decode_base62("000000000000").has_value());  // 12 symbols
  CHECK_FALSE(decode_base62("0000000000-").has_value());
  CHECK_FALSE(decode_base62("00000 00000").has_value());
}

TEST_CASE("decode_base62 rejects well-formed tokens above UINT64_MAX", "[base62]") {
  CHECK(is_well_formed_token("ZZZZZZZZZZZ"));
  CHECK_FALSE(decode_base62("ZZZZZZZZZZZ").has_value());
  CHECK_FALSE(decode_base62("lYGhA16ahyg").has_value());  // UINT64_MAX + 1
}

TEST_CASE("is_well_formed_token checks width and alphabet", "[base62]") {
  CHECK(is_well_formed_token("00000000000"));
  CHECK(is_well_formed_token("aZl8N0y58M7"));
  CHECK_FALSE(is_well_formed_token("aZl8N0y58M"));
  CHECK_FALSE(is_well_formed_token("aZl8N0y58M7x"));
  CHECK_FALSE(is_well_formed_token("aZl8N0y58M_"));
}
