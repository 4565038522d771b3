#include "uidkit/ulid/monotonic_entropy.h"

#include <array>

namespace uidkit::ulid {

using EntropyResult = core::Result<EntropyBytes, core::GenerationError>;
using IncrementResult = core::Result<std::uint64_t, core::GenerationError>;

EntropyResult MonotonicEntropy::next(std::uint64_t ms, entropy::IEntropySource& source) {
  if (initialized_ && ms == ms_) {
    const auto inc = random_increment(source);
    if (!inc.has_value()) {
      return EntropyResult::err(inc.error());
    }
    EntropyBytes bumped = entropy_;
    if (!add_with_carry(bumped, inc.value())) {
      return EntropyResult::err(core::GenerationError::kEntropyExhausted);
    }
    entropy_ = bumped;
    return EntropyResult::ok(entropy_);
  }

  EntropyBytes fresh{};
  if (!source.fill(fresh)) {
    return EntropyResult::err(core::GenerationError::kEntropyUnavailable);
  }
  ms_ = ms;
  entropy_ = fresh;
  initialized_ = true;
  return EntropyResult::ok(entropy_);
}

bool MonotonicEntropy::add_with_carry(EntropyBytes& value, std::uint64_t increment) {
  EntropyBytes sum = value;
  std::uint64_t carry = increment;
  for (std::size_t i = sum.size(); i-- > 0 && carry != 0;) {
    const std::uint64_t v = std::uint64_t{sum[i]} + (carry & 0xFFu);
    sum[i] = static_cast<std::uint8_t>(v);
    carry = (carry >> 8u) + (v >> 8u);
  }
  if (carry != 0) {
    return false;
  }
  value = sum;
  return true;
}

IncrementResult MonotonicEntropy::random_increment(entropy::IEntropySource& source) {
  std::array<std::uint8_t, 4> raw{};
  while (true) {
    if (!source.fill(raw)) {
      return IncrementResult::err(core::GenerationError::kEntropyUnavailable);
    }
    const std::uint64_t v = std::uint64_t{raw[0]} | (std::uint64_t{raw[1]} << 8u) |
                            (std::uint64_t{raw[2]} << 16u) | (std::uint64_t{raw[3]} << 24u);
    // Uniform over [0, kIncrementBound - 1); the single value outside is redrawn.
    if (v < kIncrementBound - 1) {
      return IncrementResult::ok(1 + v);
    }
  }
}

}  // namespace uidkit::ulid
