#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>

// execute_parse_snowflake: decode a sequential id and print its fields as JSON.
// execute_parse_ulid: decode a sortable id and print timestamp and entropy as JSON.
// Both return the process exit code.
int execute_parse_snowflake(std::int64_t id, std::int64_t epoch_ms, std::ostream& out);
int execute_parse_ulid(const std::string& text, std::ostream& out, std::ostream& err);
