#include "mint.h"

#include "snotes/core/clock.h"
#include "snotes/core/errors.h"
#include "snotes/token/token_generator.h"

#include "mint_logic.h"
#include "shared/arg_parser.h"
#include <charconv>
#include <cstddef>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

namespace {

struct MintCliConfig {
  int worker_id{0};
  std::size_t count{1};
};

constexpr std::size_t kMaxMintCount = 100000;

}  // namespace

int cmd_mint(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<snotes::apps::Option<MintCliConfig>> options = {
      {"--worker-id", true, "Snowflake worker id (0-1023)",
       [](MintCliConfig& c, const std::string& v) -> std::string {
         const auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), c.worker_id);
         if (ec != std::errc{} || ptr != v.data() + v.size()) {
           return "Invalid --worker-id: " + v;
         }
         return "";
       }},
      {"--count", true, "Number of tokens to mint (1-100000)",
       [](MintCliConfig& c, const std::string& v) -> std::string {
         const auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), c.count);
         if (ec != std::errc{} || ptr != v.data() + v.size() || c.count == 0 ||
             c.count > kMaxMintCount) {
           return "Invalid --count: " + v + " (expected 1-100000)";
         }
         return "";
       }},
  };
  auto parsed = snotes::apps::parse_options(argc, argv, options, 2);
  if (!parsed.errors.empty()) {
    std::cerr << "Error: " << parsed.errors.front() << "\n";
    return 1;
  }

  snotes::core::SystemClock clock;
  try {
    snotes::token::SnowflakeTokenGenerator generator(parsed.config.worker_id, clock);
    return execute_mint(generator, parsed.config.count, std::cout);
  } catch (const snotes::core::SnotesError& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
