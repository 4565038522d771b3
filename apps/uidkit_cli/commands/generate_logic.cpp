#include "generate_logic.h"

#include <ostream>

int execute_ulid(uidkit::ulid::UlidGenerator& generator, std::int64_t count, std::ostream& out,
                 std::ostream& err) {
  for (std::int64_t i = 0; i < count; ++i) {
    const auto id = generator.generate();
    if (!id.has_value()) {
      err << "ulid generation failed: " << uidkit::core::to_string(id.error()) << "\n";
      return 1;
    }
    out << id.value() << "\n";
  }
  return 0;
}

int execute_snowflake(uidkit::snowflake::SnowflakeNode& node, std::int64_t count, bool bounded,
                      std::ostream& out, std::ostream& err) {
  for (std::int64_t i = 0; i < count; ++i) {
    if (!bounded) {
      out << node.next_id() << "\n";
      continue;
    }
    const auto id = node.try_next_id();
    if (!id.has_value()) {
      err << "snowflake generation failed: " << uidkit::core::to_string(id.error()) << "\n";
      return 1;
    }
    out << id.value() << "\n";
  }
  return 0;
}
