#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <string>

namespace uuid7util::id {

// Uuid is a 128-bit identifier stored as 16 bytes in network (big-endian) order.
// It is a regular value type: cheap to copy, totally ordered by byte sequence,
// which for version-7 identifiers is also creation-time order.
class Uuid {
 public:
  static constexpr std::size_t kSize = 16;
  using Bytes = std::array<std::uint8_t, kSize>;

  constexpr Uuid() = default;
  constexpr explicit Uuid(const Bytes& bytes) : bytes_(bytes) {}

  [[nodiscard]] constexpr const Bytes& bytes() const { return bytes_; }

  // Version nibble: high 4 bits of byte 6.
  [[nodiscard]] constexpr std::uint8_t version() const {
    return static_cast<std::uint8_t>(bytes_[6] >> 4);
  }

  // Variant: top 2 bits of byte 8 (0b10 for RFC 9562 layout).
  [[nodiscard]] constexpr std::uint8_t variant() const {
    return static_cast<std::uint8_t>(bytes_[8] >> 6);
  }

  [[nodiscard]] constexpr bool is_nil() const { return *this == Uuid{}; }

  // Canonical lowercase 8-4-4-4-12 form.
  [[nodiscard]] std::string to_string() const;

  constexpr auto operator<=>(const Uuid&) const = default;

 private:
  Bytes bytes_{};
};

}  // namespace uuid7util::id
