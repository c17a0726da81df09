#include "uuid7util/core/clock.h"
#include "uuid7util/id/timestamp_codec.h"
#include "uuid7util/id/uuid7_layout.h"

#include "entropy_test_support.h"

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace uuid7util;

namespace {

// v7, unix_ts_ms = 1'700'000'000'000
constexpr const char* kV7Text = "018bcfe5-6800-7abc-8def-0123456789ab";
// v4
constexpr const char* kV4Text = "550e8400-e29b-41d4-a716-446655440000";

}  // namespace

TEST_CASE("restamp keeps the timestamp and replaces everything else", "[codec][restamp]") {
  const auto restamped = id::new_uuid7_from_string(kV7Text);
  REQUIRE(restamped.has_value());

  const auto extracted = id::extract_timestamp(restamped.value());
  REQUIRE(extracted.has_value());
  CHECK(extracted.value().time_since_epoch().count() == 1'700'000'000'000LL);

  CHECK(restamped.value().to_string() != kV7Text);
  CHECK(restamped.value().version() == 7);
  CHECK(restamped.value().variant() == 0b10);
  // Sub-millisecond bits are not carried over from the input.
  CHECK(id::unpack(restamped.value()).rand_a == 0);
}

TEST_CASE("restamp accepts every supported text form", "[codec][restamp]") {
  id::DeterministicEntropySource entropy{11};
  core::FixedClock clock{core::Timestamp{}};
  const id::TimestampCodec codec{entropy, clock};

  for (const std::string text :
       {std::string{kV7Text}, std::string{"018BCFE5-6800-7ABC-8DEF-0123456789AB"},
        "{" + std::string{kV7Text} + "}", "urn:uuid:" + std::string{kV7Text},
        std::string{"018bcfe568007abc8def0123456789ab"}}) {
    const auto restamped = codec.restamp_from_string(text);
    REQUIRE(restamped.has_value());
    CHECK(id::read_timestamp_ms(restamped.value()) == 1'700'000'000'000ULL);
  }
}

TEST_CASE("restamp rejects malformed text", "[codec][restamp][errors]") {
  const auto result = id::new_uuid7_from_string("not-a-uuid");
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().code == id::CodecError::kMalformedInput);
  CHECK(result.error().outermost_stage() == id::CodecStage::kParsingInput);
  CHECK(result.error().detail == "invalid length 10 (expected 32, 36, 38 or 45 characters)");
}

TEST_CASE("restamp rejects version-4 text", "[codec][restamp][errors]") {
  const auto result = id::new_uuid7_from_string(kV4Text);
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().code == id::CodecError::kInvalidVersion);
  CHECK(result.error().outermost_stage() == id::CodecStage::kExtractingTimestamp);
  CHECK(result.error().crossed(id::CodecStage::kCheckingVersion));
  CHECK_FALSE(result.error().crossed(id::CodecStage::kParsingInput));
}

TEST_CASE("restamp reports entropy failure at the construction stage", "[codec][restamp][errors]") {
  testing::FailingEntropySource entropy{"entropy pool unavailable"};
  core::FixedClock clock{core::Timestamp{}};
  const id::TimestampCodec codec{entropy, clock};

  const auto result = codec.restamp_from_string(kV7Text);
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().code == id::CodecError::kEntropySourceFailure);
  CHECK(result.error().outermost_stage() == id::CodecStage::kConstructingFromTimestamp);
  CHECK(id::describe(result.error()) ==
        "constructing identifier from timestamp: drawing random bytes: entropy source failure: "
        "entropy pool unavailable");
}

TEST_CASE("restamp never draws entropy for rejected input", "[codec][restamp][errors]") {
  testing::FailingEntropySource entropy{"unused"};
  core::FixedClock clock{core::Timestamp{}};
  const id::TimestampCodec codec{entropy, clock};

  CHECK_FALSE(codec.restamp_from_string("not-a-uuid").has_value());
  CHECK_FALSE(codec.restamp_from_string(kV4Text).has_value());
  CHECK(entropy.calls() == 0);
}
