#pragma once

#include "uidkit/snowflake/snowflake_node.h"
#include "uidkit/ulid/ulid_generator.h"

#include <cstdint>
#include <iosfwd>

// execute_ulid: print count sortable ids, one per line.
// execute_snowflake: print count sequential ids from node, one per line.
// When bounded is true ids are drawn with try_next_id() so a configured rollback
// limit aborts the run instead of blocking.
// Both return the process exit code and report failures on err.
int execute_ulid(uidkit::ulid::UlidGenerator& generator, std::int64_t count, std::ostream& out,
                 std::ostream& err);
int execute_snowflake(uidkit::snowflake::SnowflakeNode& node, std::int64_t count, bool bounded,
                      std::ostream& out, std::ostream& err);
