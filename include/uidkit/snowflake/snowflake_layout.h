#pragma once

#include <cstdint>

namespace uidkit::snowflake {

// Bit layout of a sequential identifier, most significant first:
//
//   | 1 unused | 41 timestamp (ms since epoch) | 10 worker id | 12 sequence |
//
// The timestamp field overflows about 69 years after the epoch. This is a known
// limitation: compose_snowflake_id does not check for it.
inline constexpr int kTimestampBits = 41;
inline constexpr int kWorkerIdBits = 10;
inline constexpr int kSequenceBits = 12;

inline constexpr int kWorkerIdShift = kSequenceBits;
inline constexpr int kTimestampShift = kWorkerIdBits + kSequenceBits;

inline constexpr std::int64_t kMaxWorkerId = (std::int64_t{1} << kWorkerIdBits) - 1;
inline constexpr std::int64_t kMaxSequence = (std::int64_t{1} << kSequenceBits) - 1;
inline constexpr std::int64_t kMaxTimestampDelta = (std::int64_t{1} << kTimestampBits) - 1;

// kDefaultEpochMs is the deployment-wide reference instant, 2025-10-01T00:00:00Z.
// Every node of a deployment must use the same epoch; changing it breaks ordering
// between identifiers issued before and after the change.
inline constexpr std::int64_t kDefaultEpochMs = 1759248000000;

// SnowflakeParts is the decoded form of a sequential identifier.
// timestamp_ms is wall-clock milliseconds (epoch already added back).
struct SnowflakeParts {
  std::int64_t timestamp_ms{0};  // NOLINT(readability-identifier-naming)
  std::int64_t worker_id{0};     // NOLINT(readability-identifier-naming)
  std::int64_t sequence{0};      // NOLINT(readability-identifier-naming)

  bool operator==(const SnowflakeParts&) const = default;
};

// compose_snowflake_id packs parts into an identifier.
// Precondition: worker_id in [0, kMaxWorkerId], sequence in [0, kMaxSequence],
// timestamp_ms - epoch_ms in [0, kMaxTimestampDelta].
[[nodiscard]] constexpr std::int64_t compose_snowflake_id(const SnowflakeParts& parts,
                                                          std::int64_t epoch_ms = kDefaultEpochMs) {
  const auto delta = static_cast<std::uint64_t>(parts.timestamp_ms - epoch_ms);
  const auto worker = static_cast<std::uint64_t>(parts.worker_id);
  const auto seq = static_cast<std::uint64_t>(parts.sequence);
  return static_cast<std::int64_t>((delta << kTimestampShift) | (worker << kWorkerIdShift) | seq);
}

// parse_snowflake_id is the exact inverse of compose_snowflake_id.
// Pure; safe to call from any thread.
[[nodiscard]] constexpr SnowflakeParts parse_snowflake_id(std::int64_t id,
                                                          std::int64_t epoch_ms = kDefaultEpochMs) {
  SnowflakeParts parts;
  parts.timestamp_ms = (id >> kTimestampShift) + epoch_ms;
  parts.worker_id = (id >> kWorkerIdShift) & kMaxWorkerId;
  parts.sequence = id & kMaxSequence;
  return parts;
}

}  // namespace uidkit::snowflake
