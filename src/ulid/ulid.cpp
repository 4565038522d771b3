#include "uidkit/ulid/ulid.h"

namespace uidkit::ulid {

namespace {

constexpr std::uint8_t kInvalid = 0xFF;

// Reverse lookup for kEncoding; upper- and lower-case letters map to the same value.
constexpr std::array<std::uint8_t, 256> make_decoding_table() {
  std::array<std::uint8_t, 256> table{};
  for (auto& entry : table) {
    entry = kInvalid;
  }
  for (std::size_t i = 0; i < kEncoding.size(); ++i) {
    const char ch = kEncoding[i];
    table[static_cast<unsigned char>(ch)] = static_cast<std::uint8_t>(i);
    if (ch >= 'A' && ch <= 'Z') {
      constexpr char kCaseOffset = 'a' - 'A';
      table[static_cast<unsigned char>(ch + kCaseOffset)] = static_cast<std::uint8_t>(i);
    }
  }
  return table;
}

constexpr auto kDecoding = make_decoding_table();

}  // namespace

std::uint64_t Ulid::timestamp_ms() const {
  std::uint64_t ms = 0;
  for (std::size_t i = 0; i < kTimestampBytes; ++i) {
    ms = (ms << 8u) | bytes[i];
  }
  return ms;
}

EntropyBytes Ulid::entropy() const {
  EntropyBytes out{};
  for (std::size_t i = 0; i < kEntropyBytes; ++i) {
    out[i] = bytes[kTimestampBytes + i];
  }
  return out;
}

core::Result<Ulid, core::GenerationError> make_ulid(std::uint64_t timestamp_ms,
                                                   const EntropyBytes& entropy) {
  if (timestamp_ms > kMaxTimestampMs) {
    return core::Result<Ulid, core::GenerationError>::err(
        core::GenerationError::kTimestampOverflow);
  }

  Ulid id;
  for (std::size_t i = 0; i < kTimestampBytes; ++i) {
    const auto shift = static_cast<unsigned>((kTimestampBytes - 1 - i) * 8);
    id.bytes[i] = static_cast<std::uint8_t>(timestamp_ms >> shift);
  }
  for (std::size_t i = 0; i < kEntropyBytes; ++i) {
    id.bytes[kTimestampBytes + i] = entropy[i];
  }
  return core::Result<Ulid, core::GenerationError>::ok(id);
}

std::string encode_ulid(const Ulid& id) {
  const auto& b = id.bytes;
  const auto enc = [](unsigned v) { return kEncoding[v & 31u]; };

  std::string out(kEncodedSize, '0');

  // Timestamp: 6 bytes -> 10 characters. Byte 5 is split across characters 8 and 9.
  out[0] = enc((b[0] & 224u) >> 5u);
  out[1] = enc(b[0] & 31u);
  out[2] = enc((b[1] & 248u) >> 3u);
  out[3] = enc(((b[1] & 7u) << 2u) | ((b[2] & 192u) >> 6u));
  out[4] = enc((b[2] & 62u) >> 1u);
  out[5] = enc(((b[2] & 1u) << 4u) | ((b[3] & 240u) >> 4u));
  out[6] = enc(((b[3] & 15u) << 1u) | ((b[4] & 128u) >> 7u));
  out[7] = enc((b[4] & 124u) >> 2u);
  out[8] = enc(((b[4] & 3u) << 3u) | ((b[5] & 224u) >> 5u));
  out[9] = enc(b[5] & 31u);

  // Entropy: 10 bytes -> 16 characters, two 5-byte groups of 8 characters.
  for (std::size_t g = 0; g < 2; ++g) {
    const std::uint8_t* p = &b[kTimestampBytes + g * 5];
    char* o = &out[10 + g * 8];
    o[0] = enc((p[0] & 248u) >> 3u);
    o[1] = enc(((p[0] & 7u) << 2u) | ((p[1] & 192u) >> 6u));
    o[2] = enc((p[1] & 62u) >> 1u);
    o[3] = enc(((p[1] & 1u) << 4u) | ((p[2] & 240u) >> 4u));
    o[4] = enc(((p[2] & 15u) << 1u) | ((p[3] & 128u) >> 7u));
    o[5] = enc((p[3] & 124u) >> 2u);
    o[6] = enc(((p[3] & 3u) << 3u) | ((p[4] & 224u) >> 5u));
    o[7] = enc(p[4] & 31u);
  }

  return out;
}

std::optional<Ulid> decode_ulid(std::string_view text) {
  if (text.size() != kEncodedSize) {
    return std::nullopt;
  }

  // 128-bit accumulator, most significant word first.
  std::uint64_t hi = 0;
  std::uint64_t lo = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    const std::uint8_t v = kDecoding[static_cast<unsigned char>(text[i])];
    if (v == kInvalid) {
      return std::nullopt;
    }
    // The leading character carries only the top 3 bits.
    if (i == 0 && v > 7u) {
      return std::nullopt;
    }
    hi = (hi << 5u) | (lo >> 59u);
    lo = (lo << 5u) | v;
  }

  Ulid id;
  for (std::size_t i = 0; i < 8; ++i) {
    const auto shift = static_cast<unsigned>((7 - i) * 8);
    id.bytes[i] = static_cast<std::uint8_t>(hi >> shift);
    id.bytes[8 + i] = static_cast<std::uint8_t>(lo >> shift);
  }
  return id;
}

}  // namespace uidkit::ulid
