#pragma once

#include "uidkit/core/result.h"
#include "uidkit/entropy/entropy_source.h"
#include "uidkit/ulid/ulid.h"

#include <cstdint>

namespace uidkit::ulid {

// MonotonicEntropy holds the (millisecond, entropy) register of a sortable-ID generator.
//
// Within one millisecond every call adds a random increment in [1, 2^32) to the
// stored 80-bit big-endian value, so identifiers of the same millisecond sort in
// call order. A new millisecond replaces the register with fresh random bytes.
//
// Not thread-safe: the owning generator serializes access.
class MonotonicEntropy {
 public:
  // Exclusive upper bound of the per-call increment.
  static constexpr std::uint64_t kIncrementBound = std::uint64_t{1} << 32u;

  MonotonicEntropy() = default;

  // next writes the entropy to use for an identifier stamped at ms.
  // Errors: kEntropyUnavailable if source fails, kEntropyExhausted if the
  // increment would carry past 80 bits. The register is unchanged on error.
  [[nodiscard]] core::Result<EntropyBytes, core::GenerationError> next(
      std::uint64_t ms, entropy::IEntropySource& source);

  // add_with_carry adds increment to value as an unsigned 80-bit big-endian integer.
  // Returns false, leaving value untouched, if the sum does not fit in 80 bits.
  [[nodiscard]] static bool add_with_carry(EntropyBytes& value, std::uint64_t increment);

  // Draws a uniform increment in [1, kIncrementBound) by rejection sampling.
  [[nodiscard]] static core::Result<std::uint64_t, core::GenerationError> random_increment(
      entropy::IEntropySource& source);

 private:
  std::uint64_t ms_{0};
  EntropyBytes entropy_{};
  bool initialized_{false};
};

}  // namespace uidkit::ulid
