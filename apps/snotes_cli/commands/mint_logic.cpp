#include "mint_logic.h"

#include "snotes/core/time.h"
#include "snotes/token/snowflake_generator.h"

#include <nlohmann/json.hpp>

#include <string>
#include <utility>

int execute_mint(snotes::token::ITokenGenerator& generator, std::size_t count,
                 std::ostream& out) {
  using snotes::token::SnowflakeGenerator;

  nlohmann::json minted = nlohmann::json::array();
  for (std::size_t i = 0; i < count; ++i) {
    const auto generated = generator.next();
    const auto parts = SnowflakeGenerator::decompose(generated.numeric_id);

    nlohmann::json entry;
    entry["token"] = generated.token.value;
    entry["id"] = std::to_string(generated.numeric_id);  // exceeds JSON's safe integer range
    entry["minted_at"] = snotes::core::format_iso8601(
        snotes::core::from_unix_millis(SnowflakeGenerator::kEpochUnixMillis + parts.timestamp_ms));
    entry["worker_id"] = parts.worker_id;
    entry["sequence"] = parts.sequence;
    minted.push_back(std::move(entry));
  }

  out << minted.dump(2) << "\n";
  return 0;
}
