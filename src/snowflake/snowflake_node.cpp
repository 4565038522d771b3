#include "uidkit/snowflake/snowflake_node.h"

#include <algorithm>

namespace uidkit::snowflake {

using CreateResult = core::Result<std::unique_ptr<SnowflakeNode>, core::ConfigError>;
using IdResult = core::Result<std::int64_t, core::GenerationError>;

CreateResult SnowflakeNode::create(const NodeConfig& config, core::IClock& clock) {
  if (config.worker_id < 0 || config.worker_id > kMaxWorkerId) {
    return CreateResult::err(core::ConfigError::kWorkerIdOutOfRange);
  }
  const std::int64_t now = clock.now_unix_millis();
  if (config.epoch_ms < 0 || config.epoch_ms > now) {
    return CreateResult::err(core::ConfigError::kEpochInFuture);
  }
  // Constructor is private, so std::make_unique cannot reach it.
  return CreateResult::ok(std::unique_ptr<SnowflakeNode>(new SnowflakeNode(config, clock, now)));
}

SnowflakeNode::SnowflakeNode(const NodeConfig& config, core::IClock& clock,
                             std::int64_t created_at_ms)
    : clock_(clock),
      worker_id_(config.worker_id),
      epoch_ms_(config.epoch_ms),
      max_rollback_wait_(config.max_rollback_wait),
      created_at_ms_(created_at_ms) {}

std::int64_t SnowflakeNode::next_id() {
  std::lock_guard<std::mutex> lock(mutex_);
  // Without a limit the rollback wait never gives up, so a value is always produced.
  return next_id_locked(std::nullopt).value();
}

IdResult SnowflakeNode::try_next_id() {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto id = next_id_locked(max_rollback_wait_);
  if (!id.has_value()) {
    return IdResult::err(core::GenerationError::kClockRollbackExceeded);
  }
  return IdResult::ok(*id);
}

std::optional<std::int64_t> SnowflakeNode::next_id_locked(
    std::optional<std::chrono::milliseconds> limit) {
  std::int64_t now = clock_.now_unix_millis();

  // Clock moved backward: wait until it reaches the last issued timestamp again.
  // Before the first id the floor is the reading taken by create(), which is
  // never earlier than the epoch.
  const std::int64_t floor = std::max(last_timestamp_, created_at_ms_);
  std::chrono::milliseconds waited{0};
  while (now < floor) {
    const std::chrono::milliseconds behind{floor - now};
    if (limit.has_value() && waited + behind > *limit) {
      return std::nullopt;
    }
    clock_.sleep_for(behind);
    waited += behind;
    now = clock_.now_unix_millis();
  }

  if (now == last_timestamp_) {
    sequence_ = (sequence_ + 1) & kMaxSequence;
    if (sequence_ == 0) {
      // Sequence exhausted for this millisecond.
      now = wait_next_millis(last_timestamp_);
    }
  } else {
    sequence_ = 0;
  }

  last_timestamp_ = now;

  return compose_snowflake_id(SnowflakeParts{last_timestamp_, worker_id_, sequence_}, epoch_ms_);
}

std::int64_t SnowflakeNode::wait_next_millis(std::int64_t last) {
  std::int64_t now = clock_.now_unix_millis();
  while (now <= last) {
    now = clock_.now_unix_millis();
  }
  return now;
}

}  // namespace uidkit::snowflake
