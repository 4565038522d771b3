#pragma once

#include <charconv>
#include <cstdint>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <unordered_map>
#include <vector>

namespace uidkit::apps {

// Option describes a single command-line flag accepted by a subcommand.
// Config is the caller-defined configuration struct that handlers populate.
//
// handler returns true on success, false on validation failure. The parser keeps
// processing remaining flags either way so every problem is reported in one run.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

// ParsedArgs is the outcome of parse_options.
// ok is false if any flag was unknown, lacked its value, or was rejected by its handler.
template <typename Config>
struct ParsedArgs {
  Config config;                         // NOLINT(readability-identifier-naming)
  std::vector<std::string> positionals;  // NOLINT(readability-identifier-naming)
  bool ok{true};                         // NOLINT(readability-identifier-naming)
};

// parse_options iterates argv[start..argc-1], dispatches each recognised flag
// to its handler, and collects non-flag tokens as positionals in order.
// Problems are reported to err.
template <typename Config>
ParsedArgs<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                 const std::vector<Option<Config>>& options, int start = 2,
                                 Config default_config = {}, std::ostream& err = std::cerr) {
  ParsedArgs<Config> parsed{std::move(default_config), {}, true};

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    auto it = option_map.find(arg);
    if (it != option_map.end()) {
      const Option<Config>* opt = it->second;
      if (opt->requires_value) {
        if (i + 1 < argc) {
          if (!opt->handler(parsed.config,
                            argv[++i])) {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            parsed.ok = false;
          }
        } else {
          err << "Option " << arg << " requires a value\n";
          parsed.ok = false;
        }
      } else if (!opt->handler(parsed.config, "")) {
        parsed.ok = false;
      }
    } else if (arg.size() > 1 && arg[0] == '-' && (arg[1] < '0' || arg[1] > '9')) {
      // Flag-like tokens are unknown options; "-123" is a negative positional.
      err << "Unknown option: " << arg << "\n";
      parsed.ok = false;
    } else {
      parsed.positionals.push_back(std::move(arg));
    }
  }

  return parsed;
}

// parse_int64 converts a whole decimal token. Returns nullopt on trailing
// garbage, an empty token, or a value outside the int64 range.
inline std::optional<std::int64_t> parse_int64(const std::string& token) {
  std::int64_t value = 0;
  const char* first = token.data();
  const char* last = token.data() + token.size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc{} || ptr != last || token.empty()) {
    return std::nullopt;
  }
  return value;
}

// print_usage lists the options of a subcommand, one per line.
template <typename Config>
void print_usage(std::ostream& out, const std::string& synopsis,
                 const std::vector<Option<Config>>& options) {
  out << "Usage: " << synopsis << "\n";
  for (const auto& opt : options) {
    out << "  " << opt.name << (opt.requires_value ? " <value>" : "") << "\n"
        << "      " << opt.description << "\n";
  }
}

}  // namespace uidkit::apps
