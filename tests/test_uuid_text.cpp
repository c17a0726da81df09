#include "uuid7util/id/uuid_text.h"

#include <catch2/catch_test_macros.hpp>

using namespace uuid7util::id;

namespace {

const Uuid::Bytes kExpected = {0x01, 0x8b, 0xcf, 0xe5, 0x68, 0x00, 0x7a, 0xbc,
                               0x8d, 0xef, 0x01, 0x23, 0x45, 0x67, 0x89, 0xab};

}  // namespace

// ── parse_uuid: accepted formats ───────────────────────────────────────────

TEST_CASE("parse_uuid: canonical hyphenated form", "[uuid][text]") {
  const auto result = parse_uuid("018bcfe5-6800-7abc-8def-0123456789ab");
  REQUIRE(result.has_value());
  CHECK(result.value().bytes() == kExpected);
}

TEST_CASE("parse_uuid: hex digits are case-insensitive", "[uuid][text]") {
  const auto result = parse_uuid("018BCFE5-6800-7ABC-8DEF-0123456789AB");
  REQUIRE(result.has_value());
  CHECK(result.value().bytes() == kExpected);
}

TEST_CASE("parse_uuid: braced, urn and bare hex forms", "[uuid][text]") {
  SECTION("braced") {
    const auto result = parse_uuid("{018bcfe5-6800-7abc-8def-0123456789ab}");
    REQUIRE(result.has_value());
    CHECK(result.value().bytes() == kExpected);
  }

  SECTION("urn prefix, any case") {
    const auto result = parse_uuid("URN:uuid:018bcfe5-6800-7abc-8def-0123456789ab");
    REQUIRE(result.has_value());
    CHECK(result.value().bytes() == kExpected);
  }

  SECTION("32 bare hex digits") {
    const auto result = parse_uuid("018bcfe568007abc8def0123456789ab");
    REQUIRE(result.has_value());
    CHECK(result.value().bytes() == kExpected);
  }
}

TEST_CASE("Uuid::to_string emits canonical lowercase text", "[uuid][text]") {
  const Uuid uuid{kExpected};
  CHECK(uuid.to_string() == "018bcfe5-6800-7abc-8def-0123456789ab");
  CHECK(parse_uuid(uuid.to_string()).value() == uuid);
  CHECK(Uuid{}.to_string() == "00000000-0000-0000-0000-000000000000");
}

// ── parse_uuid: rejected formats ───────────────────────────────────────────

TEST_CASE("parse_uuid: wrong length", "[uuid][text]") {
  const auto result = parse_uuid("not-a-uuid");
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().kind == UuidParseErrorKind::kInvalidLength);
  CHECK(result.error().position == 10);

  CHECK_FALSE(parse_uuid("").has_value());
  CHECK_FALSE(parse_uuid("018bcfe5-6800-7abc-8def-0123456789a").has_value());
  CHECK_FALSE(parse_uuid("018bcfe5-6800-7abc-8def-0123456789abc").has_value());
}

TEST_CASE("parse_uuid: misplaced hyphen", "[uuid][text]") {
  const auto result = parse_uuid("018bcfe56-800-7abc-8def-0123456789ab");
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().kind == UuidParseErrorKind::kInvalidSeparator);
  CHECK(result.error().position == 8);
}

TEST_CASE("parse_uuid: invalid hex digit reports its position", "[uuid][text]") {
  const auto result = parse_uuid("018bcfe5-6800-7abc-8def-0123456789ag");
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().kind == UuidParseErrorKind::kInvalidHexDigit);
  CHECK(result.error().position == 35);

  const auto braced = parse_uuid("{0x8bcfe5-6800-7abc-8def-0123456789ab}");
  REQUIRE_FALSE(braced.has_value());
  CHECK(braced.error().kind == UuidParseErrorKind::kInvalidHexDigit);
  CHECK(braced.error().position == 2);
}

TEST_CASE("parse_uuid: bad braces and urn prefix", "[uuid][text]") {
  CHECK(parse_uuid("(018bcfe5-6800-7abc-8def-0123456789ab)").error().kind ==
        UuidParseErrorKind::kInvalidPrefix);
  CHECK(parse_uuid("{018bcfe5-6800-7abc-8def-0123456789ab)").error().kind ==
        UuidParseErrorKind::kInvalidSeparator);
  CHECK(parse_uuid("urn:uuix:018bcfe5-6800-7abc-8def-0123456789ab").error().kind ==
        UuidParseErrorKind::kInvalidPrefix);
}

TEST_CASE("describe: parse errors render kind and position", "[uuid][text]") {
  CHECK(describe(UuidParseError{UuidParseErrorKind::kInvalidHexDigit, 3}) ==
        "invalid hex digit at position 3");
  CHECK(describe(UuidParseError{UuidParseErrorKind::kInvalidLength, 10}) ==
        "invalid length 10 (expected 32, 36, 38 or 45 characters)");
}
