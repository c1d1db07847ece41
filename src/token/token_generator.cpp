#include "snotes/token/token_generator.h"

#include "snotes/token/base62.h"

namespace snotes::token {

SnowflakeTokenGenerator::SnowflakeTokenGenerator(const int worker_id, core::IClock& clock)
    : snowflake_(worker_id, clock) {}

GeneratedToken SnowflakeTokenGenerator::next() {
  const std::uint64_t id = snowflake_.generate();
  return GeneratedToken{core::PasteToken{encode_base62(id)}, id};
}

}  // namespace snotes::token
