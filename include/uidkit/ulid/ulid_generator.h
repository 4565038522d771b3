#pragma once

#include "uidkit/core/clock.h"
#include "uidkit/core/result.h"
#include "uidkit/entropy/entropy_source.h"
#include "uidkit/ulid/monotonic_entropy.h"
#include "uidkit/ulid/ulid.h"

#include <memory>
#include <mutex>
#include <string>

namespace uidkit::ulid {

// UlidGenerator produces 26-character sortable identifiers.
//
// Identifiers from one instance never decrease: same-millisecond calls bump the
// entropy register instead of redrawing it. The application owns a single
// instance and passes it by reference to every call site; there is no global
// default generator.
//
// Thread-safety: one mutex serializes access to the register. Any number of
// threads may call generate() concurrently.
//
// The clock and entropy source are held by reference and must outlive the generator.
class UlidGenerator {
 public:
  UlidGenerator(core::IClock& clock, entropy::IEntropySource& source);
  ~UlidGenerator() = default;

  // Disable copy/move (mutex not copyable)
  UlidGenerator(const UlidGenerator&) = delete;
  UlidGenerator& operator=(const UlidGenerator&) = delete;
  UlidGenerator(UlidGenerator&&) = delete;
  UlidGenerator& operator=(UlidGenerator&&) = delete;

  // generate returns the next identifier in its canonical text form.
  // Errors: kEntropyUnavailable (secure source failed; callers should treat this
  // as fatal), kEntropyExhausted, kTimestampOverflow.
  [[nodiscard]] core::Result<std::string, core::GenerationError> generate();

  // generate_ulid is generate() without the text encoding.
  [[nodiscard]] core::Result<Ulid, core::GenerationError> generate_ulid();

 private:
  core::IClock& clock_;
  entropy::IEntropySource& source_;

  std::mutex mutex_;
  std::once_flag register_once_;
  std::unique_ptr<MonotonicEntropy> register_;  // created on first generate
};

}  // namespace uidkit::ulid
