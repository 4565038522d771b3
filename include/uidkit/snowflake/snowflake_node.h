#pragma once

#include "uidkit/core/clock.h"
#include "uidkit/core/result.h"
#include "uidkit/snowflake/snowflake_layout.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>

namespace uidkit::snowflake {

// NodeConfig holds the construction settings of a SnowflakeNode.
//
// worker_id must be unique among all nodes running concurrently in a deployment.
// Assigning it is the operator's job; nothing here coordinates it.
struct NodeConfig {
  std::int64_t worker_id{0};                 // NOLINT(readability-identifier-naming)
  std::int64_t epoch_ms{kDefaultEpochMs};    // NOLINT(readability-identifier-naming)
  // Upper bound on the rollback wait honoured by try_next_id(). Unset means unbounded.
  std::optional<std::chrono::milliseconds>  // NOLINT(readability-identifier-naming)
      max_rollback_wait;
};

// SnowflakeNode issues 64-bit sequential identifiers for one worker id.
//
// Thread-safety: one mutex per node serializes (last timestamp, sequence) updates.
// Identifiers from one node strictly increase across all calling threads.
//
// Blocking behaviour (inside the lock, no cancellation):
// - clock moved backward: sleeps until the clock catches up with the last
//   issued timestamp, or with the construction reading before the first id.
//   Large NTP steps stall callers for the whole step.
// - 4096 ids in one millisecond: busy-polls the clock until the next millisecond.
class SnowflakeNode {
 public:
  // create validates config and returns a node bound to clock.
  // Errors: kWorkerIdOutOfRange if worker_id is outside [0, kMaxWorkerId];
  // kEpochInFuture if epoch_ms is negative or after the clock's current reading.
  // The clock is held by reference and must outlive the node.
  [[nodiscard]] static core::Result<std::unique_ptr<SnowflakeNode>, core::ConfigError> create(
      const NodeConfig& config, core::IClock& clock);

  ~SnowflakeNode() = default;

  // Disable copy/move (mutex not copyable)
  SnowflakeNode(const SnowflakeNode&) = delete;
  SnowflakeNode& operator=(const SnowflakeNode&) = delete;
  SnowflakeNode(SnowflakeNode&&) = delete;
  SnowflakeNode& operator=(SnowflakeNode&&) = delete;

  // next_id returns the next identifier. Never fails; blocks on clock anomalies.
  [[nodiscard]] std::int64_t next_id();

  // try_next_id is next_id() bounded by max_rollback_wait: once the total rollback
  // wait of this call would exceed the limit it returns kClockRollbackExceeded,
  // leaving the node unchanged. Behaves exactly like next_id() when no limit is
  // configured.
  [[nodiscard]] core::Result<std::int64_t, core::GenerationError> try_next_id();

  [[nodiscard]] std::int64_t worker_id() const { return worker_id_; }
  [[nodiscard]] std::int64_t epoch_ms() const { return epoch_ms_; }

 private:
  SnowflakeNode(const NodeConfig& config, core::IClock& clock, std::int64_t created_at_ms);

  // Core of next_id/try_next_id. Caller holds mutex_.
  // Returns nullopt only when limit is set and the rollback exceeds it.
  std::optional<std::int64_t> next_id_locked(std::optional<std::chrono::milliseconds> limit);

  // Spins until the clock reads past last. Caller holds mutex_.
  std::int64_t wait_next_millis(std::int64_t last);

  core::IClock& clock_;
  const std::int64_t worker_id_;
  const std::int64_t epoch_ms_;
  const std::optional<std::chrono::milliseconds> max_rollback_wait_;
  const std::int64_t created_at_ms_;  // clock reading taken by create()

  std::mutex mutex_;
  std::int64_t last_timestamp_{-1};
  std::int64_t sequence_{0};
};

}  // namespace uidkit::snowflake
