#include "snowflake.h"

#include "uidkit/config/node_config_json.h"
#include "uidkit/core/clock.h"
#include "uidkit/snowflake/snowflake_node.h"

#include "generate_logic.h"
#include "shared/arg_parser.h"
#include <chrono>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

struct SnowflakeCliConfig {
  std::optional<std::int64_t> worker_id;            // NOLINT(readability-identifier-naming)
  std::optional<std::string> config_path;           // NOLINT(readability-identifier-naming)
  std::optional<std::int64_t> max_rollback_wait_ms;  // NOLINT(readability-identifier-naming)
  std::int64_t count{1};                             // NOLINT(readability-identifier-naming)
};

// Read the node config file, or print an error and return nullopt.
std::optional<uidkit::snowflake::NodeConfig> load_node_config(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    std::cerr << "Failed to open config file: " << path << "\n";
    return std::nullopt;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();

  auto result = uidkit::config::node_config_from_json(buffer.str());
  if (!result.has_value()) {
    std::cerr << "Invalid config file " << path << ": "
              << uidkit::core::to_string(result.error()) << "\n";
    return std::nullopt;
  }
  return result.value();
}

}  // namespace

int cmd_snowflake(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<uidkit::apps::Option<SnowflakeCliConfig>> options = {
      {"--worker-id", true, "Worker id in [0, 1023], unique within the deployment",
       [](SnowflakeCliConfig& c, const std::string& v) {
         c.worker_id = uidkit::apps::parse_int64(v);
         if (!c.worker_id.has_value()) {
           std::cerr << "Invalid --worker-id: " << v << "\n";
           return false;
         }
         return true;
       }},
      {"--config", true, "JSON node config file (worker_id, epoch_ms, max_rollback_wait_ms)",
       [](SnowflakeCliConfig& c, const std::string& v) {
         c.config_path = v;
         return true;
       }},
      {"--max-rollback-wait-ms", true, "Fail instead of waiting out a larger backward clock jump",
       [](SnowflakeCliConfig& c, const std::string& v) {
         c.max_rollback_wait_ms = uidkit::apps::parse_int64(v);
         if (!c.max_rollback_wait_ms.has_value() || *c.max_rollback_wait_ms < 0) {
           std::cerr << "Invalid --max-rollback-wait-ms: " << v << "\n";
           return false;
         }
         return true;
       }},
      {"--count", true, "Number of ids to generate (default 1)",
       [](SnowflakeCliConfig& c, const std::string& v) {
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
    uidkit::apps::print_usage(std::cerr, "uidkit_cli snowflake [options]", options);
    return 1;
  }
  const auto& cli = parsed.config;

  // Flags override the config file.
  uidkit::snowflake::NodeConfig node_config;
  if (cli.config_path.has_value()) {
    auto loaded = load_node_config(cli.config_path.value());
    if (!loaded.has_value()) {
      return 1;
    }
    node_config = loaded.value();
  } else if (!cli.worker_id.has_value()) {
    std::cerr << "Error: --worker-id <id> or --config <path> is required\n";
    return 1;
  }
  if (cli.worker_id.has_value()) {
    node_config.worker_id = cli.worker_id.value();
  }
  if (cli.max_rollback_wait_ms.has_value()) {
    node_config.max_rollback_wait = std::chrono::milliseconds{cli.max_rollback_wait_ms.value()};
  }

  uidkit::core::SystemClock clock;
  auto node = uidkit::snowflake::SnowflakeNode::create(node_config, clock);
  if (!node.has_value()) {
    std::cerr << "Failed to create node: " << uidkit::core::to_string(node.error()) << "\n";
    return 1;
  }

  const bool bounded = node_config.max_rollback_wait.has_value();
  return execute_snowflake(*node.value(), cli.count, bounded, std::cout, std::cerr);
}
