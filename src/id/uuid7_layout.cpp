#include "uuid7util/id/uuid7_layout.h"

namespace uuid7util::id {

namespace {

// Big-endian load of bytes[first, first + count).
std::uint64_t load_be(const Uuid::Bytes& bytes, const std::size_t first, const std::size_t count) {
  std::uint64_t value = 0;
  for (std::size_t i = first; i < first + count; ++i) {
    value = (value << 8) | bytes[i];
  }
  return value;
}

// Big-endian store of the low count bytes of value into bytes[first, first + count).
void store_be(Uuid::Bytes& bytes, const std::size_t first, const std::size_t count,
              std::uint64_t value) {
  for (std::size_t i = first + count; i > first; --i) {
    bytes[i - 1] = static_cast<std::uint8_t>(value & 0xFF);
    value >>= 8;
  }
}

}  // namespace

std::uint64_t read_timestamp_ms(const Uuid& uuid) {
  return load_be(uuid.bytes(), 0, 6);
}

Uuid7Fields unpack(const Uuid& uuid) {
  const auto& bytes = uuid.bytes();
  const std::uint64_t high = load_be(bytes, 0, 8);
  const std::uint64_t low = load_be(bytes, 8, 8);

  Uuid7Fields fields;
  fields.unix_ts_ms = high >> 16;
  fields.version = static_cast<std::uint8_t>((high >> 12) & kVersionMask);
  fields.rand_a = static_cast<std::uint16_t>(high & kRandAMask);
  fields.variant = static_cast<std::uint8_t>(low >> 62);
  fields.rand_b = low & kRandBMask;
  return fields;
}

Uuid pack(const Uuid7Fields& fields) {
  const std::uint64_t high = ((fields.unix_ts_ms & kTimestampMask) << 16) |
                             (static_cast<std::uint64_t>(fields.version & kVersionMask) << 12) |
                             static_cast<std::uint64_t>(fields.rand_a & kRandAMask);
  const std::uint64_t low =
      (static_cast<std::uint64_t>(fields.variant & kVariantMask) << 62) | (fields.rand_b & kRandBMask);

  Uuid::Bytes bytes{};
  store_be(bytes, 0, 8, high);
  store_be(bytes, 8, 8, low);
  return Uuid{bytes};
}

}  // namespace uuid7util::id
