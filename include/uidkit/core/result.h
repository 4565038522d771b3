#pragma once

#include <string_view>
#include <utility>
#include <variant>

namespace uidkit::core {

// Error enumerations following E.14 (use purpose-designed types as error indicators).
// These domain-specific errors carry semantic meaning beyond built-in error codes.

// ConfigError is returned when a generator cannot be constructed from the given settings.
// Recoverable: the caller fixes its configuration and retries.
enum class ConfigError {
  kWorkerIdOutOfRange,  // worker id outside [0, 1023]
  kEpochInFuture,       // epoch negative or later than the current clock reading
  kInvalidDocument,     // configuration document malformed or missing a required field
};

// GenerationError is returned by a generate call that could not produce an identifier.
enum class GenerationError {
  kEntropyUnavailable,      // secure random source failed to supply bytes
  kEntropyExhausted,        // 80-bit entropy overflowed within a single millisecond
  kTimestampOverflow,       // clock reading does not fit the 48-bit timestamp field
  kClockRollbackExceeded,   // backward clock jump larger than the configured wait limit
};

// to_string returns a stable snake_case name for diagnostics.
[[nodiscard]] constexpr std::string_view to_string(ConfigError e) {
  switch (e) {
    case ConfigError::kWorkerIdOutOfRange:
      return "worker_id_out_of_range";
    case ConfigError::kEpochInFuture:
      return "epoch_in_future";
    case ConfigError::kInvalidDocument:
      return "invalid_document";
  }
  return "unknown";
}

[[nodiscard]] constexpr std::string_view to_string(GenerationError e) {
  switch (e) {
    case GenerationError::kEntropyUnavailable:
      return "entropy_unavailable";
    case GenerationError::kEntropyExhausted:
      return "entropy_exhausted";
    case GenerationError::kTimestampOverflow:
      return "timestamp_overflow";
    case GenerationError::kClockRollbackExceeded:
      return "clock_rollback_exceeded";
  }
  return "unknown";
}

// Result<T, E> follows C++ Core Guidelines E.27: systematic error handling without exceptions.
// This type encodes success (T) or failure (E) explicitly, preventing ignored errors.
// Usage: return Result<Value, ErrorType>::ok(val) or Result<Value, ErrorType>::err(error).
// The has_value() check makes error handling mandatory and visible at call sites.
template <typename T, typename E>
class Result {
 public:
  static Result ok(T value) { return Result(std::move(value)); }
  static Result err(E error) { return Result(std::move(error)); }

  [[nodiscard]] bool has_value() const { return std::holds_alternative<T>(data_); }
  [[nodiscard]] const T& value() const& { return std::get<T>(data_); }
  [[nodiscard]] T&& value() && { return std::get<T>(std::move(data_)); }
  [[nodiscard]] const E& error() const { return std::get<E>(data_); }

 private:
  explicit Result(T value) : data_(std::move(value)) {}
  explicit Result(E error) : data_(std::move(error)) {}

  std::variant<T, E> data_;
};

}  // namespace uidkit::core
