#pragma once

#include "uuid7util/core/result.h"
#include "uuid7util/id/uuid.h"

#include <cstddef>
#include <string>
#include <string_view>

namespace uuid7util::id {

enum class UuidParseErrorKind {
  kInvalidLength,     // NOLINT(readability-identifier-naming)
  kInvalidPrefix,     // NOLINT(readability-identifier-naming)
  kInvalidSeparator,  // NOLINT(readability-identifier-naming)
  kInvalidHexDigit,   // NOLINT(readability-identifier-naming)
};

// UuidParseError describes why text was rejected.
// position is the offset into the original input (for kInvalidLength, the input length).
struct UuidParseError {
  UuidParseErrorKind kind{UuidParseErrorKind::kInvalidLength};  // NOLINT(readability-identifier-naming)
  std::size_t position{0};                                      // NOLINT(readability-identifier-naming)

  bool operator==(const UuidParseError&) const = default;
};

// parse_uuid converts textual identifier forms to a Uuid.
//
// Accepted (hex digits are case-insensitive):
//   xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx           (36 chars)
//   {xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx}         (38 chars)
//   urn:uuid:xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx  (45 chars)
//   xxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxx               (32 chars)
//
// Any version and variant is accepted; callers check those separately.
[[nodiscard]] core::Result<Uuid, UuidParseError> parse_uuid(std::string_view text);

// describe renders a parse error for diagnostics, e.g.
// "invalid hex digit at position 3".
[[nodiscard]] std::string describe(const UuidParseError& error);

}  // namespace uuid7util::id
