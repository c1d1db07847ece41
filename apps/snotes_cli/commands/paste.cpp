#include "paste.h"

#include "snotes/app/paste_service.h"
#include "snotes/core/clock.h"
#include "snotes/storage/storage_backend.h"

#include "paste_logic.h"
#include "shared/arg_parser.h"
#include <charconv>
#include <cstdint>
#include <exception>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace {

struct PasteCliConfig {
  std::optional<std::string> db_path;
  std::optional<int> worker_id;  // required by put, unused by get and sweep
  std::optional<std::int64_t> ttl_seconds;
  std::optional<std::string> content_type;
};

template <typename Int>
std::string parse_integer(const std::string& flag, const std::string& v, Int& target) {
  Int parsed{};
  const auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), parsed);
  if (ec != std::errc{} || ptr != v.data() + v.size()) {
    return "Invalid " + flag + ": " + v + " (expected an integer)";
  }
  target = parsed;
  return "";
}

std::vector<snotes::apps::Option<PasteCliConfig>> base_options() {
  return {
      {"--db", true, "Path to SQLite database file (required)",
       [](PasteCliConfig& c, const std::string& v) -> std::string {
         c.db_path = v;
         return "";
       }},
  };
}

// Parse options, require --db and exactly expected_positionals arguments.
// Prints the first problem and returns std::nullopt on failure.
std::optional<snotes::apps::ParsedArgs<PasteCliConfig>> parse_command(
    int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
    const std::vector<snotes::apps::Option<PasteCliConfig>>& options,
    std::size_t expected_positionals, const char* usage) {
  auto parsed = snotes::apps::parse_options(argc, argv, options, 2);
  if (!parsed.errors.empty()) {
    std::cerr << "Error: " << parsed.errors.front() << "\n";
    return std::nullopt;
  }
  if (!parsed.config.db_path.has_value()) {
    std::cerr << "Error: --db <path> is required\n" << usage;
    return std::nullopt;
  }
  if (parsed.positionals.size() != expected_positionals) {
    std::cerr << usage;
    return std::nullopt;
  }
  return parsed;
}

// Open the database, apply the schema and wire a token generator, or print the error.
std::unique_ptr<snotes::storage::IPasteStorage> open_storage(const PasteCliConfig& config,
                                                             snotes::core::IClock& clock) {
  snotes::storage::StorageOptions options;
  options.backend = snotes::storage::StorageBackend::kSqlite;
  options.db_path = config.db_path;
  options.worker_id = config.worker_id.value_or(0);
  try {
    return snotes::storage::create_paste_storage(options, clock);
  } catch (const std::exception& e) {
    std::cerr << "Failed to open storage: " << e.what() << "\n";
    return nullptr;
  }
}

}  // namespace

int cmd_put(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  auto options = base_options();
  options.push_back({"--ttl", true, "Lifetime in seconds (60-604800, default 86400)",
                     [](PasteCliConfig& c, const std::string& v) -> std::string {
                       std::int64_t ttl = 0;
                       auto rejection = parse_integer("--ttl", v, ttl);
                       if (rejection.empty()) {
                         c.ttl_seconds = ttl;
                       }
                       return rejection;
                     }});
  options.push_back({"--worker-id", true,
                     "Snowflake worker id (0-1023, required, distinct from the server's)",
                     [](PasteCliConfig& c, const std::string& v) -> std::string {
                       int worker_id = 0;
                       auto rejection = parse_integer("--worker-id", v, worker_id);
                       if (rejection.empty()) {
                         c.worker_id = worker_id;
                       }
                       return rejection;
                     }});
  options.push_back({"--content-type", true, "Content type (default text/plain; charset=utf-8)",
                     [](PasteCliConfig& c, const std::string& v) -> std::string {
                       c.content_type = v;
                       return "";
                     }});

  auto parsed = parse_command(argc, argv, options, 1,
                              "Usage: snotes_cli put --db <path> --worker-id N [--ttl S] "
                              "[--content-type T] <text|->\n"
                              "       N must differ from the worker id of any server using "
                              "the same database.\n");
  if (!parsed.has_value()) {
    return 1;
  }

  const std::string worker_error = check_put_worker_id(parsed->config.worker_id);
  if (!worker_error.empty()) {
    std::cerr << "Error: " << worker_error << "\n";
    return 1;
  }

  snotes::app::CreatePasteRequest request;
  const std::string& text = parsed->positionals.front();
  if (text == "-") {
    request.content.assign(std::istreambuf_iterator<char>(std::cin),
                           std::istreambuf_iterator<char>());
  } else {
    request.content = text;
  }
  request.expires_in_seconds = parsed->config.ttl_seconds;
  request.content_type = parsed->config.content_type;

  snotes::core::SystemClock clock;
  auto storage = open_storage(parsed->config, clock);
  if (!storage) {
    return 1;
  }

  try {
    return execute_put(request, *storage, std::cout, std::cerr);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}

int cmd_get(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  auto parsed =
      parse_command(argc, argv, base_options(), 1, "Usage: snotes_cli get --db <path> <token>\n");
  if (!parsed.has_value()) {
    return 1;
  }

  snotes::core::SystemClock clock;
  auto storage = open_storage(parsed->config, clock);
  if (!storage) {
    return 1;
  }

  try {
    return execute_get(parsed->positionals.front(), *storage, std::cout, std::cerr);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}

int cmd_sweep(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  auto parsed =
      parse_command(argc, argv, base_options(), 0, "Usage: snotes_cli sweep --db <path>\n");
  if (!parsed.has_value()) {
    return 1;
  }

  snotes::core::SystemClock clock;
  auto storage = open_storage(parsed->config, clock);
  if (!storage) {
    return 1;
  }

  try {
    return execute_sweep(*storage, std::cout);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
