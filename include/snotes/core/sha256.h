#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace snotes::core {

// Sha256 is an incremental FIPS 180-4 SHA-256 digest.
// update() may be called any number of times; finish() pads, produces the digest and
// leaves the object unusable until reset().
class Sha256 {
 public:
  using Digest = std::array<std::uint8_t, 32>;

  Sha256() { reset(); }

  void reset();
  void update(std::string_view bytes);
  [[nodiscard]] Digest finish();

 private:
  void compress(const std::uint8_t* block);

  std::array<std::uint32_t, 8> state_{};
  std::array<std::uint8_t, 64> buffer_{};
  std::size_t buffered_{0};
  std::uint64_t total_bytes_{0};
};

// sha256_hex returns the SHA-256 digest of input as a 64-character lower-case hex string.
[[nodiscard]] std::string sha256_hex(std::string_view input);

}  // namespace snotes::core
