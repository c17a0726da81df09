#include "uuid7util/id/uuid_text.h"

#include <array>

namespace uuid7util::id {

namespace {

constexpr std::size_t kHyphenatedLength = 36;
constexpr std::size_t kBracedLength = 38;
constexpr std::size_t kUrnLength = 45;
constexpr std::size_t kBareHexLength = 32;
constexpr std::string_view kUrnPrefix = "urn:uuid:";

// Offsets of the four hyphens inside the 36-character form.
constexpr std::array<std::size_t, 4> kHyphenOffsets = {8, 13, 18, 23};

int hex_value(const char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

char ascii_lower(const char ch) {
  if (ch >= 'A' && ch <= 'Z') {
    constexpr char kCaseOffset = 'a' - 'A';
    return static_cast<char>(ch + kCaseOffset);
  }
  return ch;
}

bool is_hyphen_offset(const std::size_t offset) {
  for (const auto h : kHyphenOffsets) {
    if (h == offset) {
      return true;
    }
  }
  return false;
}

core::Result<Uuid, UuidParseError> fail(const UuidParseErrorKind kind, const std::size_t position) {
  return core::Result<Uuid, UuidParseError>::err(UuidParseError{kind, position});
}

// Decodes 32 hex digits from body, skipping hyphens when hyphenated is set.
// base is the offset of body within the original input, for error positions.
core::Result<Uuid, UuidParseError> decode_hex(const std::string_view body, const bool hyphenated,
                                              const std::size_t base) {
  if (hyphenated) {
    for (const auto h : kHyphenOffsets) {
      if (body[h] != '-') {
        return fail(UuidParseErrorKind::kInvalidSeparator, base + h);
      }
    }
  }

  Uuid::Bytes bytes{};
  std::size_t offset = 0;
  for (auto& byte : bytes) {
    if (hyphenated && is_hyphen_offset(offset)) {
      ++offset;
    }
    const int high = hex_value(body[offset]);
    if (high < 0) {
      return fail(UuidParseErrorKind::kInvalidHexDigit, base + offset);
    }
    const int low = hex_value(body[offset + 1]);
    if (low < 0) {
      return fail(UuidParseErrorKind::kInvalidHexDigit, base + offset + 1);
    }
    byte = static_cast<std::uint8_t>((high << 4) | low);
    offset += 2;
  }

  return core::Result<Uuid, UuidParseError>::ok(Uuid{bytes});
}

}  // namespace

core::Result<Uuid, UuidParseError> parse_uuid(const std::string_view text) {
  switch (text.size()) {
    case kHyphenatedLength:
      return decode_hex(text, true, 0);

    case kBracedLength:
      if (text.front() != '{') {
        return fail(UuidParseErrorKind::kInvalidPrefix, 0);
      }
      if (text.back() != '}') {
        return fail(UuidParseErrorKind::kInvalidSeparator, kBracedLength - 1);
      }
      return decode_hex(text.substr(1, kHyphenatedLength), true, 1);

    case kUrnLength:
      for (std::size_t i = 0; i < kUrnPrefix.size(); ++i) {
        if (ascii_lower(text[i]) != kUrnPrefix[i]) {
          return fail(UuidParseErrorKind::kInvalidPrefix, i);
        }
      }
      return decode_hex(text.substr(kUrnPrefix.size()), true, kUrnPrefix.size());

    case kBareHexLength:
      return decode_hex(text, false, 0);

    default:
      return fail(UuidParseErrorKind::kInvalidLength, text.size());
  }
}

std::string describe(const UuidParseError& error) {
  const std::string at = std::to_string(error.position);
  switch (error.kind) {
    case UuidParseErrorKind::kInvalidLength:
      return "invalid length " + at + " (expected 32, 36, 38 or 45 characters)";
    case UuidParseErrorKind::kInvalidPrefix:
      return "invalid prefix at position " + at;
    case UuidParseErrorKind::kInvalidSeparator:
      return "invalid separator at position " + at;
    case UuidParseErrorKind::kInvalidHexDigit:
      return "invalid hex digit at position " + at;
  }
  return "unknown parse error";
}

}  // namespace uuid7util::id
