#include "parse.h"

#include "uidkit/snowflake/snowflake_layout.h"

#include "parse_logic.h"
#include "shared/arg_parser.h"
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace {

struct ParseSnowflakeCliConfig {
  std::int64_t epoch_ms{uidkit::snowflake::kDefaultEpochMs};  // NOLINT(readability-identifier-naming)
};

struct ParseUlidCliConfig {};

}  // namespace

int cmd_parse_snowflake(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<uidkit::apps::Option<ParseSnowflakeCliConfig>> options = {
      {"--epoch-ms", true, "Epoch the id was issued under (default: deployment epoch)",
       [](ParseSnowflakeCliConfig& c, const std::string& v) {
         const auto e = uidkit::apps::parse_int64(v);
         if (!e.has_value()) {
           std::cerr << "Invalid --epoch-ms: " << v << "\n";
           return false;
         }
         c.epoch_ms = *e;
         return true;
       }},
  };
  const auto parsed = uidkit::apps::parse_options(argc, argv, options);
  if (!parsed.ok || parsed.positionals.size() != 1) {
    uidkit::apps::print_usage(std::cerr, "uidkit_cli parse-snowflake <id> [options]", options);
    return 1;
  }

  const auto id = uidkit::apps::parse_int64(parsed.positionals.front());
  if (!id.has_value()) {
    std::cerr << "Invalid snowflake id: " << parsed.positionals.front() << "\n";
    return 1;
  }
  return execute_parse_snowflake(id.value(), parsed.config.epoch_ms, std::cout);
}

int cmd_parse_ulid(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<uidkit::apps::Option<ParseUlidCliConfig>> options;
  const auto parsed = uidkit::apps::parse_options(argc, argv, options);
  if (!parsed.ok || parsed.positionals.size() != 1) {
    std::cerr << "Usage: uidkit_cli parse-ulid <ulid>\n";
    return 1;
  }
  return execute_parse_ulid(parsed.positionals.front(), std::cout, std::cerr);
}
