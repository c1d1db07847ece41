#pragma once

#include <functional>
#include <ostream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace snotes::apps {

// Option describes a single command-line flag accepted by an app or subcommand.
// Config is the caller-defined configuration struct that handlers populate.
//
// handler returns an empty string on success, or a message describing why the value
// was rejected.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<std::string(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

template <typename Config>
struct ParsedArgs {
  Config config;                         // NOLINT(readability-identifier-naming)
  std::vector<std::string> positionals;  // non-flag tokens, in order
  std::vector<std::string> errors;       // unknown flags, missing values, rejected values
};

// parse_options iterates argv[start..argc-1], dispatches each recognised flag to its
// handler and collects everything else. It never exits or prints; the caller decides
// how to report ParsedArgs::errors.
template <typename Config>
ParsedArgs<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                 const std::vector<Option<Config>>& options, int start = 1,
                                 Config default_config = {}) {
  ParsedArgs<Config> parsed{std::move(default_config), {}, {}};

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    auto it = option_map.find(arg);
    if (it == option_map.end()) {
      if (arg.size() > 1 && arg[0] == '-') {
        parsed.errors.push_back("Unknown option: " + arg);
      } else {
        parsed.positionals.push_back(std::move(arg));
      }
      continue;
    }

    const Option<Config>* opt = it->second;
    std::string value;
    if (opt->requires_value) {
      if (i + 1 >= argc) {
        parsed.errors.push_back("Option " + arg + " requires a value");
        continue;
      }
      value = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    }

    std::string rejection = opt->handler(parsed.config, value);
    if (!rejection.empty()) {
      parsed.errors.push_back(std::move(rejection));
    }
  }

  return parsed;
}

// print_usage writes one line per option: name, value placeholder, description.
template <typename Config>
void print_usage(std::ostream& out, const std::vector<Option<Config>>& options) {
  for (const auto& opt : options) {
    out << "  " << opt.name << (opt.requires_value ? " <value>" : "") << "\n      "
        << opt.description << "\n";
  }
}

}  // namespace snotes::apps
