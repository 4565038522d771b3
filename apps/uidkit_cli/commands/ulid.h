#pragma once

// cmd_ulid: generate sortable ids (uidkit_cli ulid [--count N])
int cmd_ulid(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
