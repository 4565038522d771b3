#include "ulid.h"

#include "uidkit/core/clock.h"
#include "uidkit/entropy/entropy_source.h"
#include "uidkit/ulid/ulid_generator.h"

#include "generate_logic.h"
#include "shared/arg_parser.h"
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace {

struct UlidCliConfig {
  std::int64_t count{1};  // NOLINT(readability-identifier-naming)
};

}  // namespace

int cmd_ulid(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<uidkit::apps::Option<UlidCliConfig>> options = {
      {"--count", true, "Number of ids to generate (default 1)",
       [](UlidCliConfig& c, const std::string& v) {
         const auto n = uidkit::apps::parse_int64(v);
         if (!n.has_value() || *n < 1) {
           std::cerr << "Invalid --count: " << v << " (must be a positive integer)\n";
           return false;
         }
         c.count = *n;
         return true;
       }},
  };
  const auto parsed = uidkit::apps::parse_options(argc, argv, options);
  if (!parsed.ok) {
    uidkit::apps::print_usage(std::cerr, "uidkit_cli ulid [options]", options);
    return 1;
  }

  uidkit::core::SystemClock clock;
  uidkit::entropy::SystemEntropySource source;
  uidkit::ulid::UlidGenerator generator(clock, source);

  return execute_ulid(generator, parsed.config.count, std::cout, std::cerr);
}
