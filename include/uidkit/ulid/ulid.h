#pragma once

#include "uidkit/core/result.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace uidkit::ulid {

// Layout of a sortable identifier:
//   bytes 0..5   48-bit millisecond timestamp, big-endian
//   bytes 6..15  80-bit entropy, big-endian
inline constexpr std::size_t kTimestampBits = 48;
inline constexpr std::size_t kEntropyBits = 80;
inline constexpr std::size_t kTimestampBytes = kTimestampBits / 8;
inline constexpr std::size_t kEntropyBytes = kEntropyBits / 8;
inline constexpr std::size_t kUlidBytes = kTimestampBytes + kEntropyBytes;

// Length of the text form: 128 bits in 5-bit characters, left-padded with two zero bits.
inline constexpr std::size_t kEncodedSize = 26;

// Crockford base-32 alphabet (no I, L, O, U). Ascending ASCII order, so string
// comparison of encoded identifiers matches comparison of the raw bytes.
inline constexpr std::string_view kEncoding = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

// Largest timestamp the 48-bit field can hold (year 10889).
inline constexpr std::uint64_t kMaxTimestampMs = (std::uint64_t{1} << kTimestampBits) - 1;

using EntropyBytes = std::array<std::uint8_t, kEntropyBytes>;

// Ulid is a 128-bit sortable identifier held as raw big-endian bytes.
// Ordering of Ulid values matches ordering of their encoded strings.
struct Ulid {
  std::array<std::uint8_t, kUlidBytes> bytes{};  // NOLINT(readability-identifier-naming)

  [[nodiscard]] std::uint64_t timestamp_ms() const;
  [[nodiscard]] EntropyBytes entropy() const;

  auto operator<=>(const Ulid&) const = default;
};

// make_ulid packs a timestamp and entropy into a Ulid.
// Fails with kTimestampOverflow if timestamp_ms exceeds kMaxTimestampMs.
[[nodiscard]] core::Result<Ulid, core::GenerationError> make_ulid(std::uint64_t timestamp_ms,
                                                                 const EntropyBytes& entropy);

// encode_ulid renders the canonical 26-character upper-case form.
[[nodiscard]] std::string encode_ulid(const Ulid& id);

// decode_ulid parses the 26-character form. Lower-case letters are accepted.
// Returns nullopt for wrong length, characters outside the alphabet, or a
// leading character above '7' (value would not fit in 128 bits).
[[nodiscard]] std::optional<Ulid> decode_ulid(std::string_view text);

}  // namespace uidkit::ulid
