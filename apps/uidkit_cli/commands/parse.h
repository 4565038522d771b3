#pragma once

// cmd_parse_snowflake: decode a sequential id (uidkit_cli parse-snowflake <id> [--epoch-ms E])
// cmd_parse_ulid: decode a sortable id (uidkit_cli parse-ulid <ulid>)
int cmd_parse_snowflake(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
int cmd_parse_ulid(int argc, char* argv[]);       // NOLINT(modernize-avoid-c-arrays)
