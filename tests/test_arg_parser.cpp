#include "shared/arg_parser.h"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

using uidkit::apps::Option;
using uidkit::apps::parse_int64;
using uidkit::apps::parse_options;

namespace {

struct TestConfig {
  std::optional<std::int64_t> count;  // NOLINT(readability-identifier-naming)
  bool verbose{false};                // NOLINT(readability-identifier-naming)
};

std::vector<Option<TestConfig>> test_options() {
  return {
      {"--count", true, "Number of items",
       [](TestConfig& c, const std::string& v) {
         c.count = parse_int64(v);
         return c.count.has_value();
       }},
      {"--verbose", false, "Chatty output",
       [](TestConfig& c, const std::string&) {
         c.verbose = true;
         return true;
       }},
  };
}

// Owns the strings behind a mutable argv array.
struct Argv {
  explicit Argv(std::vector<std::string> args) : storage(std::move(args)) {
    for (auto& s : storage) {
      pointers.push_back(s.data());
    }
  }
  int argc() const { return static_cast<int>(pointers.size()); }
  char** argv() { return pointers.data(); }

  std::vector<std::string> storage;  // NOLINT(readability-identifier-naming)
  std::vector<char*> pointers;       // NOLINT(readability-identifier-naming)
};

}  // namespace

TEST_CASE("parse_options: flags and positionals after the subcommand", "[cli][args]") {
  Argv args({"uidkit_cli", "parse-snowflake", "12345", "--count", "4", "--verbose"});
  std::ostringstream err;
  const auto parsed = parse_options(args.argc(), args.argv(), test_options(), 2, TestConfig{}, err);

  REQUIRE(parsed.ok);
  REQUIRE(parsed.config.count.has_value());
  CHECK(*parsed.config.count == 4);
  CHECK(parsed.config.verbose);
  CHECK(parsed.positionals == std::vector<std::string>{"12345"});
  CHECK(err.str().empty());
}

TEST_CASE("parse_options: negative numbers are positionals", "[cli][args]") {
  Argv args({"uidkit_cli", "parse-snowflake", "-123"});
  std::ostringstream err;
  const auto parsed = parse_options(args.argc(), args.argv(), test_options(), 2, TestConfig{}, err);

  REQUIRE(parsed.ok);
  CHECK(parsed.positionals == std::vector<std::string>{"-123"});
}

TEST_CASE("parse_options: unknown flag is reported", "[cli][args]") {
  Argv args({"uidkit_cli", "ulid", "--bogus"});
  std::ostringstream err;
  const auto parsed = parse_options(args.argc(), args.argv(), test_options(), 2, TestConfig{}, err);

  CHECK_FALSE(parsed.ok);
  CHECK(err.str() == "Unknown option: --bogus\n");
}

TEST_CASE("parse_options: flag missing its value is reported", "[cli][args]") {
  Argv args({"uidkit_cli", "ulid", "--count"});
  std::ostringstream err;
  const auto parsed = parse_options(args.argc(), args.argv(), test_options(), 2, TestConfig{}, err);

  CHECK_FALSE(parsed.ok);
  CHECK(err.str() == "Option --count requires a value\n");
}

TEST_CASE("parse_options: handler rejection marks the parse failed", "[cli][args]") {
  Argv args({"uidkit_cli", "ulid", "--count", "ten"});
  std::ostringstream err;
  const auto parsed = parse_options(args.argc(), args.argv(), test_options(), 2, TestConfig{}, err);

  CHECK_FALSE(parsed.ok);
  CHECK_FALSE(parsed.config.count.has_value());
}

TEST_CASE("parse_int64: accepts whole decimal tokens only", "[cli][args]") {
  CHECK(parse_int64("0") == std::optional<std::int64_t>{0});
  CHECK(parse_int64("-42") == std::optional<std::int64_t>{-42});
  CHECK(parse_int64("9223372036854775807") == std::optional<std::int64_t>{INT64_MAX});

  CHECK_FALSE(parse_int64("").has_value());
  CHECK_FALSE(parse_int64("12abc").has_value());
  CHECK_FALSE(parse_int64(" 12").has_value());
  CHECK_FALSE(parse_int64("9223372036854775808").has_value());
}
