#pragma once

#include "uuid7util/id/uuid.h"

#include <cstdint>

namespace uuid7util::id {

// UUID v7 byte layout (RFC 9562 section 5.7):
//
//   0                   1                   2                   3
//   0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
//  +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//  |                           unix_ts_ms                          |
//  +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//  |          unix_ts_ms           |  ver  |        rand_a         |
//  +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//  |var|                        rand_b                             |
//  +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//  |                            rand_b                             |
//  +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+

constexpr std::uint8_t kVersion7 = 7;
constexpr std::uint8_t kRfcVariant = 0b10;

constexpr std::uint64_t kTimestampMask = (std::uint64_t{1} << 48) - 1;
constexpr std::uint16_t kRandAMask = 0x0FFF;
constexpr std::uint8_t kVersionMask = 0x0F;
constexpr std::uint8_t kVariantMask = 0b11;
constexpr std::uint64_t kRandBMask = (std::uint64_t{1} << 62) - 1;

// Uuid7Fields is the named-field view of a version-7 identifier.
// Each member holds only its field's bits; pack() masks anything wider.
struct Uuid7Fields {
  std::uint64_t unix_ts_ms{0};       // NOLINT(readability-identifier-naming) 48 bits
  std::uint8_t version{kVersion7};   // NOLINT(readability-identifier-naming) 4 bits
  std::uint16_t rand_a{0};           // NOLINT(readability-identifier-naming) 12 bits
  std::uint8_t variant{kRfcVariant};  // NOLINT(readability-identifier-naming) 2 bits
  std::uint64_t rand_b{0};           // NOLINT(readability-identifier-naming) 62 bits

  bool operator==(const Uuid7Fields&) const = default;
};

// unpack splits any 16-byte value into the v7 fields. It never fails and does
// not check the version; callers that require v7 compare fields.version.
[[nodiscard]] Uuid7Fields unpack(const Uuid& uuid);

// pack writes every field, masked to its width, into a new identifier.
[[nodiscard]] Uuid pack(const Uuid7Fields& fields);

// read_timestamp_ms reads bytes 0-5 as a 48-bit big-endian integer.
[[nodiscard]] std::uint64_t read_timestamp_ms(const Uuid& uuid);

}  // namespace uuid7util::id
