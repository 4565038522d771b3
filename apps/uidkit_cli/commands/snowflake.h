#pragma once

// cmd_snowflake: generate sequential ids for one worker
// (uidkit_cli snowflake --worker-id W [--count N] [--config PATH] [--max-rollback-wait-ms M])
int cmd_snowflake(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
