#pragma once

#include "snotes/core/clock.h"
#include "snotes/core/ids.h"
#include "snotes/token/snowflake_generator.h"

#include <cstdint>

namespace snotes::token {

// A freshly minted token together with the numeric id it encodes.
struct GeneratedToken {
  core::PasteToken token;       // NOLINT(readability-identifier-naming)
  std::uint64_t numeric_id{0};  // NOLINT(readability-identifier-naming)
};

// Abstract token source for dependency injection into storage backends.
// Contract: every token returned by one instance is distinct from every other token it
// returned. Backends treat a violation as core::TokenCollisionError.
class ITokenGenerator {
 public:
  virtual ~ITokenGenerator() = default;

  virtual GeneratedToken next() = 0;

 protected:
  ITokenGenerator() = default;
  ITokenGenerator(const ITokenGenerator&) = default;
  ITokenGenerator& operator=(const ITokenGenerator&) = default;
  ITokenGenerator(ITokenGenerator&&) = default;
  ITokenGenerator& operator=(ITokenGenerator&&) = default;
};

// Production generator: one Snowflake id per call, base62-encoded.
// Uniqueness follows from strict monotonicity of the ids and injectivity of the encoding;
// no lookup is needed before issuing a token. Thread-safe.
class SnowflakeTokenGenerator final : public ITokenGenerator {
 public:
  // Throws core::InvalidWorkerIdError. clock must outlive the generator.
  SnowflakeTokenGenerator(int worker_id, core::IClock& clock);
  ~SnowflakeTokenGenerator() override = default;

  SnowflakeTokenGenerator(const SnowflakeTokenGenerator&) = delete;
  SnowflakeTokenGenerator& operator=(const SnowflakeTokenGenerator&) = delete;
  SnowflakeTokenGenerator(SnowflakeTokenGenerator&&) = delete;
  SnowflakeTokenGenerator& operator=(SnowflakeTokenGenerator&&) = delete;

  // Throws core::ClockRegressionError or core::ClockOutOfRangeError.
  GeneratedToken next() override;

  [[nodiscard]] int worker_id() const noexcept { return snowflake_.worker_id(); }

 private:
  SnowflakeGenerator snowflake_;
};

}  // namespace snotes::token
