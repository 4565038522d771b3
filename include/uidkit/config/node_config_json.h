#pragma once

#include "uidkit/core/result.h"
#include "uidkit/snowflake/snowflake_node.h"

#include <string>

namespace uidkit::config {

// JSON form of a sequential node's configuration:
//
//   {"epoch_ms": 1759248000000, "max_rollback_wait_ms": 5000, "worker_id": 7}
//
// worker_id is required. epoch_ms defaults to snowflake::kDefaultEpochMs.
// max_rollback_wait_ms is optional; absent means try_next_id() waits without limit.

// to_json serializes a NodeConfig. Keys are sorted alphabetically; output is
// deterministic given the same input. max_rollback_wait_ms is omitted when unset.
[[nodiscard]] std::string to_json(const snowflake::NodeConfig& config);

// node_config_from_json parses a NodeConfig document.
// Errors: kInvalidDocument for malformed JSON, a missing worker_id, wrongly typed
// fields or a negative wait limit; kWorkerIdOutOfRange for a worker_id outside
// [0, 1023]. The epoch is checked later, by SnowflakeNode::create.
[[nodiscard]] core::Result<snowflake::NodeConfig, core::ConfigError> node_config_from_json(
    const std::string& json_str);

}  // namespace uidkit::config
