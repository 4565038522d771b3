#include "uidkit/ulid/ulid_generator.h"

namespace uidkit::ulid {

using UlidResult = core::Result<Ulid, core::GenerationError>;
using TextResult = core::Result<std::string, core::GenerationError>;

UlidGenerator::UlidGenerator(core::IClock& clock, entropy::IEntropySource& source)
    : clock_(clock), source_(source) {}

TextResult UlidGenerator::generate() {
  auto id = generate_ulid();
  if (!id.has_value()) {
    return TextResult::err(id.error());
  }
  return TextResult::ok(encode_ulid(id.value()));
}

UlidResult UlidGenerator::generate_ulid() {
  std::call_once(register_once_, [this] { register_ = std::make_unique<MonotonicEntropy>(); });

  std::lock_guard<std::mutex> lock(mutex_);

  const std::int64_t now = clock_.now_unix_millis();
  if (now < 0 || static_cast<std::uint64_t>(now) > kMaxTimestampMs) {
    return UlidResult::err(core::GenerationError::kTimestampOverflow);
  }
  const auto ms = static_cast<std::uint64_t>(now);

  auto entropy = register_->next(ms, source_);
  if (!entropy.has_value()) {
    return UlidResult::err(entropy.error());
  }
  return make_ulid(ms, entropy.value());
}

}  // namespace uidkit::ulid
