#include "snotes/core/sha256.h"

#include <algorithm>
#include <cstring>

namespace snotes::core {

namespace {

// FIPS 180-4 §5.3.3 initial hash value.
constexpr std::array<std::uint32_t, 8> kInitialState = {
    0x6a09e667u, 0xbb67ae85u, 0x3c6ef372u, 0xa54ff53au,
    0x510e527fu, 0x9b05688cu, 0x1f83d9abu, 0x5be0cd19u,
};

// FIPS 180-4 §4.2.2 round constants.
constexpr std::array<std::uint32_t, 64> kRoundConstants = {
    0x428a2f98u, 0x71374491u, 0xb5c0fbcfu, 0xe9b5dba5u, 0x3956c25bu, 0x59f111f1u, 0x923f82a4u,
    0xab1c5ed5u, 0xd807aa98u, 0x12835b01u, 0x243185beu, 0x550c7dc3u, 0x72be5d74u, 0x80deb1feu,
    0x9bdc06a7u, 0xc19bf174u, 0xe49b69c1u, 0xefbe4786u, 0x0fc19dc6u, 0x240ca1ccu, 0x2de92c6fu,
    0x4a7484aau, 0x5cb0a9dcu, 0x76f988dau, 0x983e5152u, 0xa831c66du, 0xb00327c8u, 0xbf597fc7u,
    0xc6e00bf3u, 0xd5a79147u, 0x06ca6351u, 0x14292967u, 0x27b70a85u, 0x2e1b2138u, 0x4d2c6dfcu,
    0x53380d13u, 0x650a7354u, 0x766a0abbu, 0x81c2c92eu, 0x92722c85u, 0xa2bfe8a1u, 0xa81a664bu,
    0xc24b8b70u, 0xc76c51a3u, 0xd192e819u, 0xd6990624u, 0xf40e3585u, 0x106aa070u, 0x19a4c116u,
    0x1e376c08u, 0x2748774cu, 0x34b0bcb5u, 0x391c0cb3u, 0x4ed8aa4au, 0x5b9cca4fu, 0x682e6ff3u,
    0x748f82eeu, 0x78a5636fu, 0x84c87814u, 0x8cc70208u, 0x90befffau, 0xa4506cebu, 0xbef9a3f7u,
    0xc67178f2u,
};

constexpr std::uint32_t rotr(const std::uint32_t x, const unsigned n) noexcept {
  return (x >> n) | (x << (32u - n));
}

constexpr std::uint32_t load_be32(const std::uint8_t* p) noexcept {
  return (static_cast<std::uint32_t>(p[0]) << 24u) | (static_cast<std::uint32_t>(p[1]) << 16u) |
         (static_cast<std::uint32_t>(p[2]) << 8u) | static_cast<std::uint32_t>(p[3]);
}

constexpr char kHexDigits[] = "0123456789abcdef";

}  // namespace

void Sha256::reset() {
  state_ = kInitialState;
  buffer_.fill(0u);
  buffered_ = 0;
  total_bytes_ = 0;
}

void Sha256::compress(const std::uint8_t* block) {
  std::array<std::uint32_t, 64> w{};
  for (unsigned i = 0; i < 16u; ++i) {
    w[i] = load_be32(block + i * 4u);
  }
  for (unsigned i = 16u; i < 64u; ++i) {
    const std::uint32_t s0 = rotr(w[i - 15u], 7u) ^ rotr(w[i - 15u], 18u) ^ (w[i - 15u] >> 3u);
    const std::uint32_t s1 = rotr(w[i - 2u], 17u) ^ rotr(w[i - 2u], 19u) ^ (w[i - 2u] >> 10u);
    w[i] = w[i - 16u] + s0 + w[i - 7u] + s1;
  }

  std::array<std::uint32_t, 8> v = state_;
  for (unsigned i = 0; i < 64u; ++i) {
    const std::uint32_t big_s1 = rotr(v[4], 6u) ^ rotr(v[4], 11u) ^ rotr(v[4], 25u);
    const std::uint32_t choose = (v[4] & v[5]) ^ (~v[4] & v[6]);
    const std::uint32_t t1 = v[7] + big_s1 + choose + kRoundConstants[i] + w[i];
    const std::uint32_t big_s0 = rotr(v[0], 2u) ^ rotr(v[0], 13u) ^ rotr(v[0], 22u);
    const std::uint32_t majority = (v[0] & v[1]) ^ (v[0] & v[2]) ^ (v[1] & v[2]);
    const std::uint32_t t2 = big_s0 + majority;

    v[7] = v[6];
    v[6] = v[5];
    v[5] = v[4];
    v[4] = v[3] + t1;
    v[3] = v[2];
    v[2] = v[1];
    v[1] = v[0];
    v[0] = t1 + t2;
  }

  for (unsigned i = 0; i < 8u; ++i) {
    state_[i] += v[i];
  }
}

void Sha256::update(const std::string_view bytes) {
  const auto* data = reinterpret_cast<const std::uint8_t*>(bytes.data());
  std::size_t len = bytes.size();
  if (len == 0) {
    return;
  }
  total_bytes_ += len;

  if (buffered_ > 0) {
    const std::size_t take = std::min(len, buffer_.size() - buffered_);
    std::memcpy(buffer_.data() + buffered_, data, take);
    buffered_ += take;
    data += take;
    len -= take;
    if (buffered_ < buffer_.size()) {
      return;
    }
    compress(buffer_.data());
    buffered_ = 0;
  }

  while (len >= buffer_.size()) {
    compress(data);
    data += buffer_.size();
    len -= buffer_.size();
  }

  if (len > 0) {
    std::memcpy(buffer_.data(), data, len);
    buffered_ = len;
  }
}

Sha256::Digest Sha256::finish() {
  // FIPS 180-4 §5.1.1: append 0x80, zero-fill to 56 mod 64, then the bit length.
  const std::uint64_t bit_len = total_bytes_ * 8u;

  buffer_[buffered_++] = 0x80u;
  if (buffered_ > 56u) {
    std::memset(buffer_.data() + buffered_, 0, buffer_.size() - buffered_);
    compress(buffer_.data());
    buffered_ = 0;
  }
  std::memset(buffer_.data() + buffered_, 0, 56u - buffered_);
  for (unsigned i = 0; i < 8u; ++i) {
    buffer_[56u + i] = static_cast<std::uint8_t>(bit_len >> ((7u - i) * 8u));
  }
  compress(buffer_.data());

  Digest digest{};
  for (unsigned i = 0; i < 8u; ++i) {
    digest[i * 4u + 0u] = static_cast<std::uint8_t>(state_[i] >> 24u);
    digest[i * 4u + 1u] = static_cast<std::uint8_t>(state_[i] >> 16u);
    digest[i * 4u + 2u] = static_cast<std::uint8_t>(state_[i] >> 8u);
    digest[i * 4u + 3u] = static_cast<std::uint8_t>(state_[i]);
  }
  buffered_ = 0;
  return digest;
}

std::string sha256_hex(const std::string_view input) {
  Sha256 hasher;
  hasher.update(input);
  const auto digest = hasher.finish();

  std::string hex;
  hex.reserve(digest.size() * 2u);
  for (const std::uint8_t byte : digest) {
    hex.push_back(kHexDigits[byte >> 4u]);
    hex.push_back(kHexDigits[byte & 0x0Fu]);
  }
  return hex;
}

}  // namespace snotes::core
