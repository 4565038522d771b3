#include "uidkit/core/version.h"

#include "commands/parse.h"
#include "commands/snowflake.h"
#include "commands/ulid.h"
#include <iostream>
#include <string>

namespace {

void print_help() {
  std::cerr << "uidkit_cli v" << uidkit::core::kBuildVersion << "\n"
            << "Usage: uidkit_cli <command> [options]\n"
            << "Commands:\n"
            << "  ulid              Generate sortable 26-character ids\n"
            << "  snowflake         Generate 64-bit sequential ids for one worker\n"
            << "  parse-snowflake   Decode a sequential id\n"
            << "  parse-ulid        Decode a sortable id\n"
            << "  version           Print the build version\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_help();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "ulid") {
    return cmd_ulid(argc, argv);
  }
  if (subcommand == "snowflake") {
    return cmd_snowflake(argc, argv);
  }
  if (subcommand == "parse-snowflake") {
    return cmd_parse_snowflake(argc, argv);
  }
  if (subcommand == "parse-ulid") {
    return cmd_parse_ulid(argc, argv);
  }
  if (subcommand == "version") {
    std::cout << uidkit::core::kBuildVersion << "\n";
    return 0;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}
